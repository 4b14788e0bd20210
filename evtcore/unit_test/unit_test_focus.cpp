// Copyright (C) 2020-2021 Sami Väisänen
// Copyright (C) 2020-2021 Ensisoft http://www.ensisoft.com
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#include "config.h"

#include "base/test_minimal.h"
#include "base/test_help.h"
#include "evtcore/focus.h"

using evt::Id;
using evt::FocusSource;
using evt::NavFocusState;
using evt::InputFocusState;

void unit_test_nav_staging()
{
    TEST_CASE(test::Type::Feature)

    const auto a = Id::FromPath({0});
    const auto b = Id::FromPath({1});

    NavFocusState nav;
    TEST_REQUIRE(!nav.HasPending());
    TEST_REQUIRE(!nav.GetFocus().has_value());
    // clearing an empty focus is a no-op
    TEST_REQUIRE(!nav.StageSet(std::nullopt, FocusSource::Synthetic));

    TEST_REQUIRE(nav.StageSet(a, FocusSource::Key));
    // the same staged change again is a no-op
    TEST_REQUIRE(!nav.StageSet(a, FocusSource::Key));
    TEST_REQUIRE(nav.HasPending());

    auto pending = nav.TakePending();
    TEST_REQUIRE(!nav.HasPending());
    const auto* set = std::get_if<NavFocusState::SetTo>(&pending);
    TEST_REQUIRE(set);
    TEST_REQUIRE(set->target == a);
    TEST_REQUIRE(set->source == FocusSource::Key);

    TEST_REQUIRE(!nav.Commit(a).has_value());
    TEST_REQUIRE(nav.HasFocus(a));
    TEST_REQUIRE(!nav.StageSet(a, FocusSource::Key));

    nav.StageAdvance(std::nullopt, evt::NavAdvance::Forward, false, FocusSource::Key);
    pending = nav.TakePending();
    TEST_REQUIRE(std::holds_alternative<NavFocusState::Advance>(pending));

    TEST_REQUIRE(nav.Commit(b).value() == a);
    TEST_REQUIRE(nav.HasFocus(b));
    TEST_REQUIRE(!nav.HasFocus(a));
}

void unit_test_nav_clear()
{
    TEST_CASE(test::Type::Feature)

    const auto parent = Id::FromPath({0});
    const auto child  = Id::FromPath({0, 1});
    const auto other  = Id::FromPath({1});

    NavFocusState nav;
    nav.Commit(child);
    TEST_REQUIRE(!nav.ClearOn(other).has_value());
    TEST_REQUIRE(nav.HasFocus(child));
    TEST_REQUIRE(nav.ClearOn(parent).value() == child);
    TEST_REQUIRE(!nav.GetFocus().has_value());

    // staged changes to the cleared subtree are dropped
    TEST_REQUIRE(nav.StageSet(child, FocusSource::Pointer));
    nav.ClearOn(parent);
    TEST_REQUIRE(!nav.HasPending());

    TEST_REQUIRE(nav.StageSet(other, FocusSource::Pointer));
    nav.ClearOn(parent);
    TEST_REQUIRE(nav.HasPending());
}

void unit_test_nav_fallback()
{
    TEST_CASE(test::Type::Feature)

    NavFocusState nav;
    TEST_REQUIRE(nav.RegisterFallback(Id::FromPath({3})));
    // first registrant wins
    TEST_REQUIRE(!nav.RegisterFallback(Id::FromPath({4})));
    TEST_REQUIRE(nav.GetFallback().value() == Id::FromPath({3}));
    nav.ResetFallback();
    TEST_REQUIRE(!nav.GetFallback().has_value());
    TEST_REQUIRE(nav.RegisterFallback(Id::FromPath({4})));
}

void unit_test_input_focus()
{
    TEST_CASE(test::Type::Feature)

    const auto a = Id::FromPath({0});
    const auto b = Id::FromPath({1});

    InputFocusState input;
    TEST_REQUIRE(!input.HasPendingChanges());

    TEST_REQUIRE(input.RequestSel(a, FocusSource::Pointer));
    TEST_REQUIRE(!input.RequestSel(a, FocusSource::Pointer));
    TEST_REQUIRE(input.HasSelFocus(a));
    TEST_REQUIRE(!input.HasKeyFocus(a));

    input.RequestKey(evt::ImePurpose::Normal);
    TEST_REQUIRE(input.HasKeyFocus(a));
    // ime is pending until the platform enables it
    TEST_REQUIRE(!input.GetImeFocus().has_value());

    auto pending = input.TakePending();
    TEST_REQUIRE(!pending.lost.has_value());
    TEST_REQUIRE(std::holds_alternative<InputFocusState::StagedTo>(pending.sel));
    TEST_REQUIRE(pending.new_key);
    TEST_REQUIRE(pending.new_ime == evt::ImePurpose::Normal);
    TEST_REQUIRE(!input.HasPendingChanges());

    input.SetImeEnabled(true, evt::ImePurpose::Normal);
    TEST_REQUIRE(input.GetImeFocus() == a);
    TEST_REQUIRE(input.GetImePurpose() == evt::ImePurpose::Normal);

    // moving the focus records the loss of everything
    TEST_REQUIRE(input.RequestSel(b, FocusSource::Key));
    TEST_REQUIRE(input.HasSelFocus(b));
    TEST_REQUIRE(!input.HasKeyFocus());
    pending = input.TakePending();
    TEST_REQUIRE(pending.lost.has_value());
    TEST_REQUIRE(pending.lost->id == a);
    TEST_REQUIRE(pending.lost->sel);
    TEST_REQUIRE(pending.lost->key);
    TEST_REQUIRE(pending.lost->ime);
    TEST_REQUIRE(!pending.new_key);

    // clearing a never committed focus owes nothing
    InputFocusState other;
    other.RequestSel(a, FocusSource::Synthetic);
    TEST_REQUIRE(other.ClearOn(a));
    pending = other.TakePending();
    TEST_REQUIRE(!pending.lost.has_value());
    TEST_REQUIRE(std::holds_alternative<InputFocusState::Idle>(pending.sel));
}

void unit_test_input_focus_clear()
{
    TEST_CASE(test::Type::Feature)

    const auto parent = Id::FromPath({0});
    const auto child  = Id::FromPath({0, 4});

    InputFocusState input;
    input.RequestSel(child, FocusSource::Pointer);
    input.RequestKey(std::nullopt);
    input.TakePending();

    TEST_REQUIRE(!input.ClearOn(parent));
    TEST_REQUIRE(!input.ClearUnder(Id::FromPath({1})));
    TEST_REQUIRE(input.ClearUnder(parent));
    TEST_REQUIRE(!input.GetSelFocus().has_value());
    TEST_REQUIRE(!input.GetKeyFocus().has_value());

    const auto pending = input.TakePending();
    TEST_REQUIRE(pending.lost.has_value());
    TEST_REQUIRE(pending.lost->id == child);
    TEST_REQUIRE(pending.lost->key);
    TEST_REQUIRE(!pending.lost->ime);

    // ime cancel keeps key focus
    input.RequestSel(child, FocusSource::Pointer);
    input.RequestKey(evt::ImePurpose::Password);
    input.TakePending();
    input.SetImeEnabled(true, evt::ImePurpose::Password);
    TEST_REQUIRE(!input.CancelIme(parent));
    TEST_REQUIRE(input.CancelIme(child));
    TEST_REQUIRE(input.HasKeyFocus(child));
    TEST_REQUIRE(!input.GetImeFocus().has_value());
    const auto cancel = input.TakePending();
    TEST_REQUIRE(cancel.lost.has_value());
    TEST_REQUIRE(cancel.lost->ime);
    TEST_REQUIRE(!cancel.lost->sel);
}

void unit_test_accel_layers()
{
    TEST_CASE(test::Type::Feature)

    const auto root  = Id::Root();
    const auto menu  = Id::FromPath({0});
    const auto file  = Id::FromPath({0, 0});
    const auto edit  = Id::FromPath({0, 1});
    const auto popup = Id::FromPath({2});
    const auto item  = Id::FromPath({2, 0, 1});

    evt::AccelLayers layers;
    TEST_REQUIRE(!layers.AddKeys(file, {evt::Key::Character("f")}));

    layers.NewLayer(root, false);
    layers.NewLayer(popup, true);
    TEST_REQUIRE(layers.GetNumLayers() == 2);
    TEST_REQUIRE(layers.HasLayer(popup));

    TEST_REQUIRE(layers.AddKeys(file, {evt::Key::Character("f")}));
    TEST_REQUIRE(layers.AddKeys(edit, {evt::Key::Character("e"), evt::Key::Character("f")}));
    TEST_REQUIRE(layers.AddKeys(item, {evt::Key::Character("x")}));

    // the first binding wins
    TEST_REQUIRE(layers.Lookup(root, evt::Key::Character("f"), true) == file);
    TEST_REQUIRE(layers.Lookup(menu, evt::Key::Character("e"), true) == edit);
    // root layer requires alt
    TEST_REQUIRE(!layers.Lookup(root, evt::Key::Character("f"), false).has_value());
    // the popup layer is separate and doesn't require alt
    TEST_REQUIRE(layers.Lookup(popup, evt::Key::Character("x"), false) == item);
    TEST_REQUIRE(!layers.Lookup(popup, evt::Key::Character("f"), true).has_value());
    TEST_REQUIRE(!layers.Lookup(root, evt::Key::Character("x"), true).has_value());

    layers.EnableAltBypass(file, true);
    TEST_REQUIRE(layers.Lookup(root, evt::Key::Character("f"), false) == file);

    layers.Clear();
    TEST_REQUIRE(layers.GetNumLayers() == 0);
    TEST_REQUIRE(!layers.Lookup(root, evt::Key::Character("f"), true).has_value());
}

EXPORT_TEST_MAIN(
int test_main(int argc, char* argv[])
{
    test::TestLogger logger("unit_test_focus.log");

    unit_test_nav_staging();
    unit_test_nav_clear();
    unit_test_nav_fallback();
    unit_test_input_focus();
    unit_test_input_focus_clear();
    unit_test_accel_layers();
    return 0;
}
) // TEST_MAIN
