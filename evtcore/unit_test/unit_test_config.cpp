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

#include "warnpush.h"
#  include <nlohmann/json.hpp>
#include "warnpop.h"

#include <cstdio>

#include "base/test_minimal.h"
#include "base/test_help.h"
#include "evtcore/event_config.h"

using evt::Command;
using evt::EventConfig;
using evt::Key;
using evt::Modifier;
using evt::Modifiers;
using evt::MousePan;
using evt::NamedKey;
using evt::Shortcuts;
using evt::WindowConfig;

void unit_test_event_config_json()
{
    TEST_CASE(test::Type::Feature)

    EventConfig config;
    config.menu_delay_ms = 100;
    config.scroll_dist_em = 3.0;
    config.mouse_pan = MousePan::WithAlt;
    config.touch_nav_focus = false;

    nlohmann::json json;
    config.IntoJson(json);
    TEST_REQUIRE(json["menu_delay_ms"] == 100);
    TEST_REQUIRE(json["mouse_pan"] == "WithAlt");

    EventConfig other;
    TEST_REQUIRE(other.FromJson(json));
    TEST_REQUIRE(other.menu_delay_ms == 100);
    TEST_REQUIRE(other.scroll_dist_em == 3.0);
    TEST_REQUIRE(other.mouse_pan == MousePan::WithAlt);
    TEST_REQUIRE(other.touch_nav_focus == false);

    // missing fields keep their values
    {
        EventConfig partial;
        partial.kinetic_timeout_ms = 77;
        const auto& json = nlohmann::json::parse(R"({"menu_delay_ms": 40, "scroll_dist_em": 2})");
        TEST_REQUIRE(partial.FromJson(json));
        TEST_REQUIRE(partial.menu_delay_ms == 40);
        TEST_REQUIRE(partial.scroll_dist_em == 2.0);
        TEST_REQUIRE(partial.kinetic_timeout_ms == 77);
        TEST_REQUIRE(partial.mouse_text_pan == MousePan::WithCtrl);
    }

    // rejected values don't change the field but the other fields are still read
    {
        EventConfig bad;
        const auto& json = nlohmann::json::parse(R"({"mouse_pan": "Sometimes", "menu_delay_ms": 10, "mouse_nav_focus": "yes"})");
        TEST_REQUIRE(!bad.FromJson(json));
        TEST_REQUIRE(bad.mouse_pan == MousePan::Always);
        TEST_REQUIRE(bad.mouse_nav_focus == true);
        TEST_REQUIRE(bad.menu_delay_ms == 10);
    }

    {
        EventConfig bad;
        TEST_REQUIRE(!bad.FromJson(nlohmann::json::array()));
    }
}

void unit_test_mouse_pan()
{
    TEST_CASE(test::Type::Feature)

    const Modifiers none;
    const Modifiers alt(Modifier::Alt);
    const Modifiers ctrl(Modifier::Ctrl);

    TEST_REQUIRE(!evt::IsMousePanEnabled(MousePan::Never, none));
    TEST_REQUIRE(!evt::IsMousePanEnabled(MousePan::Never, alt | Modifier::Ctrl));
    TEST_REQUIRE(!evt::IsMousePanEnabled(MousePan::WithAlt, none));
    TEST_REQUIRE(evt::IsMousePanEnabled(MousePan::WithAlt, alt));
    TEST_REQUIRE(!evt::IsMousePanEnabled(MousePan::WithAlt, ctrl));
    TEST_REQUIRE(evt::IsMousePanEnabled(MousePan::WithCtrl, ctrl));
    TEST_REQUIRE(!evt::IsMousePanEnabled(MousePan::WithCtrl, alt));
    TEST_REQUIRE(evt::IsMousePanEnabled(MousePan::Always, none));

    WindowConfig window;
    TEST_REQUIRE(window.IsMousePanEnabled(none));
    TEST_REQUIRE(!window.IsMouseTextPanEnabled(none));
    TEST_REQUIRE(window.IsMouseTextPanEnabled(ctrl));
}

void unit_test_shortcuts()
{
    TEST_CASE(test::Type::Feature)

    const Modifiers none;
    const Modifiers shift(Modifier::Shift);
    const Modifiers ctrl(Modifier::Ctrl);
    const Modifiers alt(Modifier::Alt);

    Shortcuts shortcuts;
    TEST_REQUIRE(shortcuts.GetNumBindings() == 0);
    // unbound keys without modifiers still map through the key
    TEST_REQUIRE(shortcuts.TryMatch(none, NamedKey::Enter) == Command::Enter);
    TEST_REQUIRE(!shortcuts.TryMatch(ctrl, Key::Character("c")).has_value());

    shortcuts.LoadDefaults();
    TEST_REQUIRE(shortcuts.GetNumBindings() > 0);
    TEST_REQUIRE(shortcuts.TryMatch(ctrl, Key::Character("c")) == Command::Copy);
    TEST_REQUIRE(shortcuts.TryMatch(ctrl, Key::Character("v")) == Command::Paste);
    TEST_REQUIRE(shortcuts.TryMatch(ctrl, Key::Character("z")) == Command::Undo);
    TEST_REQUIRE(shortcuts.TryMatch(ctrl | Modifier::Shift, Key::Character("z")) == Command::Redo);
    TEST_REQUIRE(shortcuts.TryMatch(alt, NamedKey::F4) == Command::Close);
    TEST_REQUIRE(shortcuts.TryMatch(none, NamedKey::F1) == Command::Help);
    TEST_REQUIRE(shortcuts.TryMatch(shift, NamedKey::F3) == Command::FindPrevious);
    // shift alone doesn't prevent the key mapping
    TEST_REQUIRE(shortcuts.TryMatch(shift, NamedKey::Tab) == Command::Tab);
    TEST_REQUIRE(shortcuts.TryMatch(none, NamedKey::Escape) == Command::Escape);
    // no binding and not a plain key
    TEST_REQUIRE(!shortcuts.TryMatch(ctrl, Key::Character("j")).has_value());
    TEST_REQUIRE(!shortcuts.TryMatch(none, Key::Character("j")).has_value());
    TEST_REQUIRE(!shortcuts.TryMatch(alt, NamedKey::Enter).has_value());

    shortcuts.Insert(ctrl, Key::Character("j"), Command::Debug);
    TEST_REQUIRE(shortcuts.TryMatch(ctrl, Key::Character("j")) == Command::Debug);
    // replaces the previous binding
    shortcuts.Insert(ctrl, Key::Character("c"), Command::Cut);
    TEST_REQUIRE(shortcuts.TryMatch(ctrl, Key::Character("c")) == Command::Cut);

    TEST_REQUIRE(shortcuts.Remove(ctrl, Key::Character("j")));
    TEST_REQUIRE(!shortcuts.Remove(ctrl, Key::Character("j")));
    TEST_REQUIRE(!shortcuts.TryMatch(ctrl, Key::Character("j")).has_value());

    shortcuts.Clear();
    TEST_REQUIRE(shortcuts.GetNumBindings() == 0);
}

void unit_test_shortcuts_json()
{
    TEST_CASE(test::Type::Feature)

    const Modifiers ctrl(Modifier::Ctrl);

    // overrides
    {
        Shortcuts shortcuts;
        shortcuts.LoadDefaults();
        const auto count = shortcuts.GetNumBindings();

        const auto& json = nlohmann::json::parse(R"({"shortcuts": [
            {"modifiers": {"Ctrl": true}, "key": "c", "command": "Cut"},
            {"modifiers": {"Ctrl": true, "Alt": true}, "named": "Delete", "command": "Exit"},
            {"key": "m", "command": "Menu"}
        ]})");
        TEST_REQUIRE(shortcuts.FromJson(json));
        TEST_REQUIRE(shortcuts.GetNumBindings() == count + 2);
        TEST_REQUIRE(shortcuts.TryMatch(ctrl, Key::Character("c")) == Command::Cut);
        TEST_REQUIRE(shortcuts.TryMatch(ctrl | Modifier::Alt, NamedKey::Delete) == Command::Exit);
        TEST_REQUIRE(shortcuts.TryMatch(Modifiers(), Key::Character("m")) == Command::Menu);
        // untouched default
        TEST_REQUIRE(shortcuts.TryMatch(ctrl, Key::Character("v")) == Command::Paste);
    }

    // no shortcuts is fine
    {
        Shortcuts shortcuts;
        TEST_REQUIRE(shortcuts.FromJson(nlohmann::json::object()));
        TEST_REQUIRE(shortcuts.GetNumBindings() == 0);
    }

    // invalid entries are rejected, valid ones still get added
    {
        Shortcuts shortcuts;
        const auto& json = nlohmann::json::parse(R"({"shortcuts": [
            {"modifiers": {"Ctrl": true}, "key": "c", "command": "Blah"},
            {"modifiers": {"Ctrl": true}, "command": "Copy"},
            {"modifiers": {"Ctrl": "on"}, "key": "c", "command": "Copy"},
            {"modifiers": {"Ctrl": true}, "key": "x", "command": "Cut"}
        ]})");
        TEST_REQUIRE(!shortcuts.FromJson(json));
        TEST_REQUIRE(shortcuts.GetNumBindings() == 1);
        TEST_REQUIRE(shortcuts.TryMatch(ctrl, Key::Character("x")) == Command::Cut);
    }

    {
        Shortcuts shortcuts;
        TEST_REQUIRE(!shortcuts.FromJson(nlohmann::json::parse(R"({"shortcuts": "nope"})")));
    }

    // written bindings read back
    {
        Shortcuts shortcuts;
        shortcuts.Insert(ctrl, Key::Character("q"), Command::Exit);
        shortcuts.Insert(Modifiers(Modifier::Alt), NamedKey::F4, Command::Close);
        nlohmann::json json;
        shortcuts.IntoJson(json);
        TEST_REQUIRE(json["shortcuts"].size() == 2);

        Shortcuts other;
        TEST_REQUIRE(other.FromJson(json));
        TEST_REQUIRE(other.GetNumBindings() == 2);
        TEST_REQUIRE(other.TryMatch(ctrl, Key::Character("q")) == Command::Exit);
        TEST_REQUIRE(other.TryMatch(Modifiers(Modifier::Alt), NamedKey::F4) == Command::Close);
    }
}

void unit_test_window_config()
{
    TEST_CASE(test::Type::Feature)

    WindowConfig config;
    TEST_REQUIRE(config.IsNavFocusEnabled());
    TEST_REQUIRE(config.IsMouseNavFocusEnabled());
    TEST_REQUIRE(config.IsTouchNavFocusEnabled());
    TEST_REQUIRE(config.GetShortcuts().TryMatch(Modifiers(Modifier::Ctrl), Key::Character("c")) == Command::Copy);

    // 4.5 em at 16 pixels per em
    TEST_REQUIRE(config.ScrollDistance(evt::DVec2(0.0, 1.0)) == evt::Offset(0, 72));
    TEST_REQUIRE(config.ScrollDistance(evt::DVec2(-2.0, 0.5)) == evt::Offset(-144, 36));
    config.SetDpem(10.0);
    TEST_REQUIRE(config.ScrollDistance(evt::DVec2(1.0, 0.0)) == evt::Offset(45, 0));

    TEST_REQUIRE(config.PanDistanceThreshold() == 5.0);
    config.SetScaleFactor(2.0);
    TEST_REQUIRE(config.PanDistanceThreshold() == 10.0);

    TEST_REQUIRE(config.GetMenuDelay() == std::chrono::milliseconds(250));
    TEST_REQUIRE(config.GetDoubleClickTimeout() == std::chrono::milliseconds(1000));

    config.GetEventConfig().mouse_nav_focus = false;
    TEST_REQUIRE(!config.IsMouseNavFocusEnabled());
    TEST_REQUIRE(config.IsTouchNavFocusEnabled());
    config.EnableNavFocus(false);
    TEST_REQUIRE(!config.IsTouchNavFocusEnabled());

    EventConfig events;
    events.menu_delay_ms = 10;
    WindowConfig other(events);
    TEST_REQUIRE(other.GetMenuDelay() == std::chrono::milliseconds(10));
    TEST_REQUIRE(other.GetShortcuts().GetNumBindings() > 0);
}

void unit_test_window_config_file()
{
    TEST_CASE(test::Type::Feature)

    const std::string file = "unit_test_config.json";

    {
        WindowConfig config;
        config.GetEventConfig().menu_delay_ms = 123;
        config.GetEventConfig().mouse_text_pan = MousePan::Never;
        config.GetShortcuts().Insert(Modifiers(Modifier::Ctrl), Key::Character("j"), Command::Debug);
        TEST_REQUIRE(config.SaveFile(file));
    }

    {
        WindowConfig config;
        TEST_REQUIRE(config.LoadFile(file));
        TEST_REQUIRE(config.GetEventConfig().menu_delay_ms == 123);
        TEST_REQUIRE(config.GetEventConfig().mouse_text_pan == MousePan::Never);
        TEST_REQUIRE(config.GetShortcuts().TryMatch(Modifiers(Modifier::Ctrl), Key::Character("j")) == Command::Debug);
        TEST_REQUIRE(config.GetShortcuts().TryMatch(Modifiers(Modifier::Ctrl), Key::Character("c")) == Command::Copy);
    }
    std::remove(file.c_str());

    {
        WindowConfig config;
        TEST_REQUIRE(!config.LoadFile("this-file-does-not-exist.json"));
        TEST_REQUIRE(config.GetEventConfig().menu_delay_ms == 250);
    }
}

EXPORT_TEST_MAIN(
int test_main(int argc, char* argv[])
{
    test::TestLogger logger("unit_test_config.log");

    unit_test_event_config_json();
    unit_test_mouse_pan();
    unit_test_shortcuts();
    unit_test_shortcuts_json();
    unit_test_window_config();
    unit_test_window_config_file();
    return 0;
}
) // TEST_MAIN
