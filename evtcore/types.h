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

#include "warnpush.h"
#  include <glm/vec2.hpp>
#include "warnpop.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <optional>
#include <functional>

#include "base/bitflag.h"

namespace evt
{
    using Coord  = glm::ivec2;
    using Offset = glm::ivec2;
    using DVec2  = glm::dvec2;

    using Clock    = std::chrono::steady_clock;
    using Instant  = Clock::time_point;
    using Duration = Clock::duration;

    // Platform identifier of a window or a popup window.
    using WindowId = std::uint32_t;

    // Axis aligned rectangle in window coordinates.
    struct Rect {
        Coord pos  = {0, 0};
        Offset size = {0, 0};

        bool Contains(const Coord& coord) const noexcept
        {
            return coord.x >= pos.x && coord.x < pos.x + size.x &&
                   coord.y >= pos.y && coord.y < pos.y + size.y;
        }
        bool IsEmpty() const noexcept
        { return size.x <= 0 || size.y <= 0; }
    };
    inline bool operator==(const Rect& lhs, const Rect& rhs) noexcept
    { return lhs.pos == rhs.pos && lhs.size == rhs.size; }
    inline bool operator!=(const Rect& lhs, const Rect& rhs) noexcept
    { return !(lhs == rhs); }

    // Post-dispatch actions required from the window. The values
    // are bit indices for the ActionFlags set.
    enum class Action : unsigned {
        // The whole window must be redrawn.
        Redraw = 0,
        // Some widget region moved, the hover target must be re-probed.
        RegionMoved = 4,
        // Some scroll offset changed.
        Scrolled = 6,
        // Widget rects must be re-assigned without resizing.
        SetRect = 8,
        // Size requirements changed, a full resize is needed.
        Resize = 9,
        // Theme configuration was changed.
        ThemeUpdate = 10,
        // Event configuration was changed.
        EventConfig = 11,
        // The active theme was switched.
        ThemeSwitch = 12,
        // The widget tree must be reconfigured.
        Reconfigure = 16,
        // Widgets must be updated with new input data.
        Update = 17,
        // The window must be closed.
        Close = 30
    };
    using ActionFlags = base::bitflag<Action>;

    enum class MouseButton {
        Left, Right, Middle, Back, Forward, Other
    };

    enum class Modifier {
        Shift, Ctrl, Alt, Super
    };
    using Modifiers = base::bitflag<Modifier>;

    enum class CursorIcon {
        Default, ContextMenu, Help, Pointer, Progress, Wait,
        Cell, Crosshair, Text, VerticalText, Alias, Copy, Move,
        NoDrop, NotAllowed, Grab, Grabbing,
        EResize, NResize, NeResize, NwResize, SResize, SeResize, SwResize, WResize,
        EwResize, NsResize, NeswResize, NwseResize, ColResize, RowResize,
        AllScroll, ZoomIn, ZoomOut
    };

    // Origin of a focus change.
    enum class FocusSource {
        // Focus changed as a result of a mouse click or touch.
        Pointer,
        // Focus changed as a result of keyboard navigation.
        Key,
        // Focus changed programmatically.
        Synthetic
    };

    // How a widget grabs the press it received.
    enum class GrabMode {
        // Deliver only the terminating PressEnd.
        Click,
        // Deliver PressMove for motion and PressEnd.
        Drag,
        // Deliver Pan events with translation only.
        PanOnly,
        // Deliver Pan events with translation and rotation.
        PanRotate,
        // Deliver Pan events with translation and scaling.
        PanScale,
        // Deliver Pan events with translation, rotation and scaling.
        PanFull
    };
    inline bool IsPan(GrabMode mode) noexcept
    { return mode != GrabMode::Click && mode != GrabMode::Drag; }

    enum class ImePurpose {
        Normal, Password, Terminal
    };

    enum class ElementState {
        Pressed, Released
    };

    enum class TouchPhase {
        Started, Moved, Ended, Cancelled
    };

    // Named logical keys. Keys producing text are represented
    // as characters instead (see Key).
    enum class NamedKey {
        Alt, AltGraph, CapsLock, Control, Fn, NumLock, ScrollLock, Shift, Super,
        Enter, Tab, Space,
        ArrowDown, ArrowLeft, ArrowRight, ArrowUp, End, Home, PageDown, PageUp,
        Backspace, Clear, Copy, Cut, Delete, Insert, Paste, Redo, Undo, Again,
        ContextMenu, Escape, Execute, Find, Help, Pause, Select, PrintScreen,
        New, Open, Print, Save, SpellCheck, Close,
        BrowserBack, BrowserForward, BrowserRefresh, GoBack, Exit,
        F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12
    };

    // A logical key, either a named key or a character string.
    class Key
    {
    public:
        Key() = default;
        Key(NamedKey named) : mNamed(named)
        {}
        explicit Key(std::string character) : mCharacter(std::move(character))
        {}

        static Key Character(std::string character)
        { return Key(std::move(character)); }

        bool IsNamed() const noexcept
        { return mNamed.has_value(); }
        bool IsCharacter() const noexcept
        { return !mCharacter.empty(); }
        bool IsValid() const noexcept
        { return IsNamed() || IsCharacter(); }

        std::optional<NamedKey> GetNamed() const noexcept
        { return mNamed; }
        const std::string& GetCharacter() const noexcept
        { return mCharacter; }

        std::size_t GetHash() const noexcept;
        std::string ToString() const;

        bool operator==(const Key& other) const noexcept
        { return mNamed == other.mNamed && mCharacter == other.mCharacter; }
        bool operator!=(const Key& other) const noexcept
        { return !(*this == other); }
    private:
        std::optional<NamedKey> mNamed;
        std::string mCharacter;
    };

    // Platform scan code of a key. Used to track key depress state
    // which must survive changes of the logical key mapping.
    using PhysicalKey = std::uint32_t;

    struct KeyEvent {
        PhysicalKey physical_key = 0;
        // Logical key with modifiers applied.
        Key logical_key;
        // Logical key as if no modifiers were pressed.
        Key key_without_modifiers;
        // Text produced by the key press, if any.
        std::optional<std::string> text;
        ElementState state = ElementState::Pressed;
        bool repeat = false;
    };

    struct ScrollDelta {
        enum class Type {
            // Scroll by a number of lines or rows (and columns).
            Lines,
            // Scroll by a pixel offset.
            Pixels
        };
        Type type = Type::Lines;
        DVec2 delta = {0.0, 0.0};

        static ScrollDelta MakeLines(double x, double y)
        { return ScrollDelta { Type::Lines, {x, y} }; }
        static ScrollDelta MakePixels(double x, double y)
        { return ScrollDelta { Type::Pixels, {x, y} }; }
    };

    // Scroll side channel set by a widget while handling an event
    // and observed by its ancestors.
    struct Scroll {
        enum class Type {
            // No scroll action.
            None,
            // The widget scrolled its own content.
            Scrolled,
            // The ancestor should scroll by the given offset.
            Offset,
            // The ancestor should scroll the rect into view.
            Rect
        };
        Type type = Type::None;
        Offset offset = {0, 0};
        evt::Rect rect;

        bool IsSet() const noexcept
        { return type != Type::None; }

        static Scroll MakeScrolled()
        { Scroll s; s.type = Type::Scrolled; return s; }
        static Scroll MakeOffset(const Offset& offset)
        { Scroll s; s.type = Type::Offset; s.offset = offset; return s; }
        static Scroll MakeRect(const evt::Rect& rect)
        { Scroll s; s.type = Type::Rect; s.rect = rect; return s; }
    };
    bool operator==(const Scroll& lhs, const Scroll& rhs) noexcept;
    inline bool operator!=(const Scroll& lhs, const Scroll& rhs) noexcept
    { return !(lhs == rhs); }

    // A handle used to tell timers of a single widget apart.
    class TimerHandle
    {
    public:
        TimerHandle() = default;
        // When a timer is requested multiple times with the same handle
        // before it fires the requests are merged choosing the earliest
        // time if earliest is true and the latest time otherwise.
        TimerHandle(std::uint32_t code, bool earliest) noexcept
          : mCode(code)
          , mEarliest(earliest)
        {}
        std::uint32_t GetCode() const noexcept
        { return mCode; }
        bool IsEarliest() const noexcept
        { return mEarliest; }

        bool operator==(const TimerHandle& other) const noexcept
        { return mCode == other.mCode && mEarliest == other.mEarliest; }
        bool operator!=(const TimerHandle& other) const noexcept
        { return !(*this == other); }
        bool operator<(const TimerHandle& other) const noexcept
        {
            if (mCode != other.mCode)
                return mCode < other.mCode;
            return mEarliest < other.mEarliest;
        }
    private:
        std::uint32_t mCode = 0;
        bool mEarliest = true;
    };

    enum class Direction {
        Up, Down, Left, Right
    };

} // namespace

namespace std {
template<> struct hash<evt::Key> {
    std::size_t operator()(const evt::Key& key) const noexcept
    { return key.GetHash(); }
};
} // namespace std
