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
#include "evtcore/popup.h"

using evt::Id;

namespace {
evt::PopupState MakePopup(evt::WindowId window, const Id& id, const Id& parent)
{
    evt::PopupState popup;
    popup.window = window;
    popup.desc.id = id;
    popup.desc.parent = parent;
    return popup;
}
} // namespace

void unit_test_popup_stack()
{
    TEST_CASE(test::Type::Feature)

    const auto s1 = Id::FromPath({1});
    const auto s2 = Id::FromPath({1, 0, 2});

    evt::PopupStack popups;
    TEST_REQUIRE(popups.IsEmpty());
    TEST_REQUIRE(popups.GetTop() == nullptr);
    TEST_REQUIRE(popups.GetTopSized() == nullptr);

    popups.Push(MakePopup(10, s1, Id::FromPath({0})));
    popups.Push(MakePopup(11, s2, Id::FromPath({1, 0})));
    TEST_REQUIRE(popups.GetSize() == 2);
    TEST_REQUIRE(popups.GetTop()->window == 11);
    TEST_REQUIRE(popups.GetTopSized() == nullptr);

    TEST_REQUIRE(popups.ConfirmSized(11));
    TEST_REQUIRE(!popups.ConfirmSized(12));
    TEST_REQUIRE(popups.GetTopSized()->window == 11);

    TEST_REQUIRE(popups.FindIndex(10).value() == 0);
    TEST_REQUIRE(popups.FindIndex(11).value() == 1);
    TEST_REQUIRE(!popups.FindIndex(12).has_value());

    // the topmost popup covering the id
    TEST_REQUIRE(popups.FindCovering(Id::FromPath({1, 0, 2, 7})).value() == 1);
    TEST_REQUIRE(popups.FindCovering(Id::FromPath({1, 3})).value() == 0);
    TEST_REQUIRE(!popups.FindCovering(Id::FromPath({0})).has_value());

    TEST_REQUIRE(popups.IsParentOfAny(Id::FromPath({0})));
    TEST_REQUIRE(popups.IsParentOfAny(Id::FromPath({1, 0})));
    TEST_REQUIRE(!popups.IsParentOfAny(s1));

    const auto removed = popups.Remove(1);
    TEST_REQUIRE(removed.window == 11);
    TEST_REQUIRE(removed.is_sized);
    TEST_REQUIRE(popups.GetSize() == 1);
    TEST_REQUIRE(popups[0].window == 10);
}

void unit_test_popup_reposition()
{
    TEST_CASE(test::Type::Feature)

    evt::PopupStack popups;
    popups.Push(MakePopup(10, Id::FromPath({1}), Id::FromPath({0})));

    evt::PopupDescriptor desc;
    desc.id = Id::FromPath({1});
    desc.parent = Id::FromPath({0});
    desc.rect = evt::Rect { evt::Coord(5, 5), evt::Offset(10, 10) };
    desc.direction = evt::Direction::Right;
    TEST_REQUIRE(popups.Reposition(10, desc));
    TEST_REQUIRE(popups[0].desc.direction == evt::Direction::Right);
    TEST_REQUIRE(popups[0].desc.rect == desc.rect);

    // no such popup
    TEST_REQUIRE(!popups.Reposition(11, desc));

    // the id can't change
    desc.id = Id::FromPath({2});
    desc.direction = evt::Direction::Up;
    TEST_REQUIRE(!popups.Reposition(10, desc));
    TEST_REQUIRE(popups[0].desc.id == Id::FromPath({1}));
    TEST_REQUIRE(popups[0].desc.direction == evt::Direction::Right);
}

EXPORT_TEST_MAIN(
int test_main(int argc, char* argv[])
{
    test::TestLogger logger("unit_test_popup.log");

    unit_test_popup_stack();
    unit_test_popup_reposition();
    return 0;
}
) // TEST_MAIN
