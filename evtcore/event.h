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
#include <string>
#include <optional>
#include <variant>
#include <utility>

#include "evtcore/types.h"
#include "evtcore/id.h"

namespace evt
{
    // Commands are mostly produced from keyboard input through the
    // shortcut bindings (see Shortcuts) but widgets may also send them
    // directly, for example a menu sending Activate to an entry.
    enum class Command {
        Escape, Activate, Enter, Space, Tab,
        ViewUp, ViewDown,
        Left, Right, Up, Down,
        WordLeft, WordRight,
        Home, End, DocHome, DocEnd,
        PageUp, PageDown,
        Snapshot, ScrollLock, Pause, Insert,
        Delete, DelBack, DelWord, DelWordBack,
        Deselect, SelectAll,
        Find, FindReplace, FindNext, FindPrevious,
        Bold, Italic, Underline, Link,
        Cut, Copy, Paste, Undo, Redo,
        New, Open, Save, Print,
        NavNext, NavPrevious, NavParent, NavDown,
        TabNew, TabNext, TabPrevious,
        Help, Rename, Refresh, Debug, SpellCheck, ContextMenu, Menu, Fullscreen,
        Close, Exit
    };

    // Map a key pressed without modifiers to a command, if any.
    std::optional<Command> CommandFromKey(const Key& key);

    // Activate, Enter and Space all activate the target.
    bool IsActivate(Command cmd) noexcept;

    // A small set of commands may be sent to the widget with selection
    // focus even when it has no key or navigation focus.
    bool SuitableForSelFocus(Command cmd) noexcept;

    std::optional<Direction> AsDirection(Command cmd) noexcept;

    // Identify the source of a press, mouse button or touch point.
    class PressSource
    {
    public:
        enum class Type {
            Mouse, Touch
        };
        PressSource() = default;

        static PressSource Mouse(MouseButton button, unsigned repetitions)
        {
            PressSource ret;
            ret.mType   = Type::Mouse;
            ret.mButton = button;
            ret.mRepetitions = repetitions;
            return ret;
        }
        static PressSource Touch(std::uint64_t touch_id)
        {
            PressSource ret;
            ret.mType  = Type::Touch;
            ret.mTouch = touch_id;
            return ret;
        }

        inline Type GetType() const noexcept
        { return mType; }
        inline bool IsMouse() const noexcept
        { return mType == Type::Mouse; }
        inline bool IsTouch() const noexcept
        { return mType == Type::Touch; }
        inline MouseButton GetButton() const noexcept
        { return mButton; }
        inline std::uint64_t GetTouchId() const noexcept
        { return mTouch; }

        // Left mouse button or any touch.
        bool IsPrimary() const noexcept
        { return IsTouch() || mButton == MouseButton::Left; }
        bool IsSecondary() const noexcept
        { return IsMouse() && mButton == MouseButton::Right; }
        bool IsTertiary() const noexcept
        { return IsMouse() && mButton == MouseButton::Middle; }

        // Number of repeated clicks, 1 for a single click, 2 for a
        // double click and so on. Touch is always 1.
        unsigned GetRepetitions() const noexcept
        { return IsMouse() ? mRepetitions : 1; }

        bool operator==(const PressSource& other) const noexcept
        {
            if (mType != other.mType)
                return false;
            if (mType == Type::Mouse)
                return mButton == other.mButton && mRepetitions == other.mRepetitions;
            return mTouch == other.mTouch;
        }
        bool operator!=(const PressSource& other) const noexcept
        { return !(*this == other); }
    private:
        Type mType = Type::Mouse;
        MouseButton mButton = MouseButton::Left;
        unsigned mRepetitions = 1;
        std::uint64_t mTouch = 0;
    };

    // Details of a press (or cursor motion).
    struct Press {
        PressSource source;
        // The widget under the pointer, if any.
        std::optional<Id> id;
        // The coordinate in the receiving widget's coordinate space.
        Coord coord = {0, 0};
    };

    struct CommandEvent {
        Command cmd = Command::Activate;
        // The physical key that generated the command. A command with
        // a key may be bubbled to ancestors, others are sent to a
        // specific target only.
        std::optional<PhysicalKey> code;
    };
    struct KeyInputEvent {
        KeyEvent key;
        // Synthetic key events are generated by the platform (for
        // example for keys held when the window gains focus).
        bool is_synthetic = false;
    };
    struct ImePreeditEvent {
        std::string text;
        std::optional<std::pair<std::size_t, std::size_t>> cursor;
    };
    struct ImeCommitEvent {
        std::string text;
    };
    struct ScrollEvent {
        ScrollDelta delta;
    };
    // Pan is an affine transform: a point p is mapped to alpha*p + delta
    // where alpha is a complex multiplier (rotation and scale).
    struct PanEvent {
        DVec2 alpha = {1.0, 0.0};
        DVec2 delta = {0.0, 0.0};
    };
    struct CursorMoveEvent {
        Press press;
    };
    struct PressStartEvent {
        Press press;
    };
    struct PressMoveEvent {
        Press press;
        Offset delta = {0, 0};
    };
    struct PressEndEvent {
        Press press;
        bool success = false;
    };
    struct TimerEvent {
        TimerHandle handle;
    };
    struct PopupClosedEvent {
        WindowId window = 0;
    };
    struct NavFocusEvent {
        FocusSource source = FocusSource::Synthetic;
    };
    struct LostNavFocusEvent {};
    struct SelFocusEvent {
        FocusSource source = FocusSource::Synthetic;
    };
    struct LostSelFocusEvent {};
    struct KeyFocusEvent {};
    struct LostKeyFocusEvent {};
    struct ImeFocusEvent {};
    struct LostImeFocusEvent {};
    struct MouseHoverEvent {
        bool hover = false;
    };

    using Event = std::variant<
        CommandEvent,
        KeyInputEvent,
        ImePreeditEvent,
        ImeCommitEvent,
        ScrollEvent,
        PanEvent,
        CursorMoveEvent,
        PressStartEvent,
        PressMoveEvent,
        PressEndEvent,
        TimerEvent,
        PopupClosedEvent,
        NavFocusEvent,
        LostNavFocusEvent,
        SelFocusEvent,
        LostSelFocusEvent,
        KeyFocusEvent,
        LostKeyFocusEvent,
        ImeFocusEvent,
        LostImeFocusEvent,
        MouseHoverEvent>;

    // The result of handling an event.
    enum class IsUsed {
        Unused, Used
    };

    // Whether the event is delivered to a disabled widget. Notifications
    // that terminate some earlier state (press end, focus lost) are
    // always delivered, everything else is redirected to the nearest
    // enabled ancestor instead.
    bool PassWhenDisabled(const Event& event) noexcept;

    // Whether an ancestor of the target may handle the event when the
    // target leaves it unused.
    bool IsReusable(const Event& event) noexcept;

    // Translate the coordinates carried by the event by the given offset.
    void TranslateEvent(Event& event, const Offset& offset) noexcept;

    const char* GetEventName(const Event& event) noexcept;

    std::string ToString(const Event& event);

} // namespace
