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

#pragma once

#include "config.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "evtcore/types.h"

namespace evt
{
    // Platform window events consumed by the event core. The platform
    // layer translates its native events into these.
    namespace input {
        // The window gained or lost the keyboard focus.
        struct Focused {
            bool focused = false;
        };
        struct ModifiersChanged {
            Modifiers modifiers;
        };
        struct KeyboardInput {
            KeyEvent event;
            bool is_synthetic = false;
        };
        struct ImePreedit {
            std::string text;
            std::optional<std::pair<std::size_t, std::size_t>> cursor;
        };
        struct ImeCommit {
            std::string text;
        };
        // The IME was disabled by the platform.
        struct ImeDisabled {};
        // Cursor position in window (physical pixel) coordinates.
        struct CursorMoved {
            DVec2 position = {0.0, 0.0};
        };
        struct CursorEntered {};
        struct CursorLeft {};
        struct MouseWheel {
            ScrollDelta delta;
        };
        struct MouseInput {
            ElementState state = ElementState::Pressed;
            MouseButton button = MouseButton::Left;
        };
        struct Touch {
            TouchPhase phase = TouchPhase::Started;
            std::uint64_t id = 0;
            DVec2 location = {0.0, 0.0};
        };
    } // namespace input

    using InputEvent = std::variant<
        input::Focused,
        input::ModifiersChanged,
        input::KeyboardInput,
        input::ImePreedit,
        input::ImeCommit,
        input::ImeDisabled,
        input::CursorMoved,
        input::CursorEntered,
        input::CursorLeft,
        input::MouseWheel,
        input::MouseInput,
        input::Touch>;

    // An action requested by an accessibility client (screen reader etc).
    // The actions are translated into the same events and messages the
    // native input produces.
    struct AccessAction {
        enum class Type {
            Click,
            Focus,
            Blur,
            Increment,
            Decrement,
            ScrollUp,
            ScrollDown,
            ScrollLeft,
            ScrollRight,
            ScrollIntoView,
            ScrollToPoint,
            SetScrollOffset,
            SetValue,
            ShowContextMenu
        };
        using Data = std::variant<std::monostate, std::string, double, Coord>;

        Type type = Type::Click;
        // Action payload. ScrollToPoint and SetScrollOffset take a
        // Coord, SetValue takes a string or a number.
        Data data;
    };

} // namespace
