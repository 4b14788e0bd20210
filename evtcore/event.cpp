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

#include <sstream>

#include "base/format.h"
#include "evtcore/event.h"

namespace evt
{

std::optional<Command> CommandFromKey(const Key& key)
{
    if (!key.IsNamed())
        return std::nullopt;

    switch (key.GetNamed().value())
    {
        case NamedKey::ScrollLock:     return Command::ScrollLock;
        case NamedKey::Enter:          return Command::Enter;
        case NamedKey::Tab:            return Command::Tab;
        case NamedKey::Space:          return Command::Space;
        case NamedKey::ArrowDown:      return Command::Down;
        case NamedKey::ArrowLeft:      return Command::Left;
        case NamedKey::ArrowRight:     return Command::Right;
        case NamedKey::ArrowUp:        return Command::Up;
        case NamedKey::End:            return Command::End;
        case NamedKey::Home:           return Command::Home;
        case NamedKey::PageDown:       return Command::PageDown;
        case NamedKey::PageUp:         return Command::PageUp;
        case NamedKey::Backspace:      return Command::DelBack;
        case NamedKey::Clear:          return Command::Deselect;
        case NamedKey::Copy:           return Command::Copy;
        case NamedKey::Cut:            return Command::Cut;
        case NamedKey::Delete:         return Command::Delete;
        case NamedKey::Insert:         return Command::Insert;
        case NamedKey::Paste:          return Command::Paste;
        case NamedKey::Redo:           return Command::Redo;
        case NamedKey::Again:          return Command::Redo;
        case NamedKey::Undo:           return Command::Undo;
        case NamedKey::ContextMenu:    return Command::ContextMenu;
        case NamedKey::Escape:         return Command::Escape;
        case NamedKey::Execute:        return Command::Activate;
        case NamedKey::Find:           return Command::Find;
        case NamedKey::Help:           return Command::Help;
        case NamedKey::Pause:          return Command::Pause;
        case NamedKey::Select:         return Command::SelectAll;
        case NamedKey::PrintScreen:    return Command::Snapshot;
        case NamedKey::New:            return Command::New;
        case NamedKey::Open:           return Command::Open;
        case NamedKey::Print:          return Command::Print;
        case NamedKey::Save:           return Command::Save;
        case NamedKey::SpellCheck:     return Command::SpellCheck;
        case NamedKey::BrowserBack:    return Command::NavPrevious;
        case NamedKey::GoBack:         return Command::NavPrevious;
        case NamedKey::BrowserForward: return Command::NavNext;
        case NamedKey::BrowserRefresh: return Command::Refresh;
        case NamedKey::Exit:           return Command::Exit;
        default: break;
    }
    return std::nullopt;
}

bool IsActivate(Command cmd) noexcept
{
    return cmd == Command::Activate || cmd == Command::Enter || cmd == Command::Space;
}

bool SuitableForSelFocus(Command cmd) noexcept
{
    return cmd == Command::Escape || cmd == Command::Cut ||
           cmd == Command::Copy || cmd == Command::Deselect;
}

std::optional<Direction> AsDirection(Command cmd) noexcept
{
    if (cmd == Command::Left)
        return Direction::Left;
    else if (cmd == Command::Right)
        return Direction::Right;
    else if (cmd == Command::Up)
        return Direction::Up;
    else if (cmd == Command::Down)
        return Direction::Down;
    return std::nullopt;
}

bool PassWhenDisabled(const Event& event) noexcept
{
    if (const auto* hover = std::get_if<MouseHoverEvent>(&event))
        return !hover->hover;

    return std::holds_alternative<PanEvent>(event) ||
           std::holds_alternative<PressMoveEvent>(event) ||
           std::holds_alternative<PressEndEvent>(event) ||
           std::holds_alternative<TimerEvent>(event) ||
           std::holds_alternative<PopupClosedEvent>(event) ||
           std::holds_alternative<LostNavFocusEvent>(event) ||
           std::holds_alternative<LostSelFocusEvent>(event) ||
           std::holds_alternative<LostKeyFocusEvent>(event) ||
           std::holds_alternative<LostImeFocusEvent>(event);
}

bool IsReusable(const Event& event) noexcept
{
    // commands sent to the navigation focus carry the key code,
    // others are addressed to a specific target.
    if (const auto* command = std::get_if<CommandEvent>(&event))
        return command->code.has_value();

    return std::holds_alternative<ScrollEvent>(event) ||
           std::holds_alternative<PanEvent>(event) ||
           std::holds_alternative<CursorMoveEvent>(event) ||
           std::holds_alternative<PressStartEvent>(event);
}

void TranslateEvent(Event& event, const Offset& offset) noexcept
{
    if (auto* e = std::get_if<CursorMoveEvent>(&event))
        e->press.coord += offset;
    else if (auto* e = std::get_if<PressStartEvent>(&event))
        e->press.coord += offset;
    else if (auto* e = std::get_if<PressMoveEvent>(&event))
        e->press.coord += offset;
    else if (auto* e = std::get_if<PressEndEvent>(&event))
        e->press.coord += offset;
}

const char* GetEventName(const Event& event) noexcept
{
    static const char* names[] = {
        "Command", "Key", "ImePreedit", "ImeCommit", "Scroll", "Pan",
        "CursorMove", "PressStart", "PressMove", "PressEnd", "Timer",
        "PopupClosed", "NavFocus", "LostNavFocus", "SelFocus", "LostSelFocus",
        "KeyFocus", "LostKeyFocus", "ImeFocus", "LostImeFocus", "MouseHover"
    };
    static_assert(sizeof(names) / sizeof(names[0]) == std::variant_size_v<Event>);
    return names[event.index()];
}

std::string ToString(const Event& event)
{
    std::stringstream ss;
    ss << GetEventName(event);
    if (const auto* e = std::get_if<CommandEvent>(&event))
        ss << "(" << base::ToString(e->cmd) << ")";
    else if (const auto* e = std::get_if<KeyInputEvent>(&event))
        ss << "(" << e->key.logical_key.ToString() << ")";
    else if (const auto* e = std::get_if<PressStartEvent>(&event))
        ss << "(" << base::ToString(e->press.coord) << ")";
    else if (const auto* e = std::get_if<PressEndEvent>(&event))
        ss << "(success=" << (e->success ? "true" : "false") << ")";
    else if (const auto* e = std::get_if<TimerEvent>(&event))
        ss << "(" << e->handle.GetCode() << ")";
    else if (const auto* e = std::get_if<MouseHoverEvent>(&event))
        ss << "(" << (e->hover ? "true" : "false") << ")";
    return ss.str();
}

} // namespace
