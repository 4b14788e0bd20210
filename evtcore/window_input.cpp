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

#include <algorithm>
#include <cmath>

#include "base/logging.h"
#include "evtcore/window.h"
#include "evtcore/event_cx.h"
#include "evtcore/node.h"
#include "evtcore/runner.h"

namespace {
using namespace evt;

inline Coord ToCoord(const DVec2& position)
{
    return Coord(static_cast<int>(std::round(position.x)),
                 static_cast<int>(std::round(position.y)));
}

} // namespace

namespace evt
{

void Window::HandleInput(const InputEvent& event)
{
    EventCx cx(mState, mRunner, mRoot, mAppData);

    if (const auto* focused = std::get_if<input::Focused>(&event))
        OnFocused(cx, *focused);
    else if (const auto* modifiers = std::get_if<input::ModifiersChanged>(&event))
        OnModifiers(cx, *modifiers);
    else if (const auto* key = std::get_if<input::KeyboardInput>(&event))
        OnKeyboardInput(cx, *key);
    else if (const auto* preedit = std::get_if<input::ImePreedit>(&event))
    {
        if (const auto id = mState.GetImeFocus())
            cx.SendEvent(id.value(), ImePreeditEvent { preedit->text, preedit->cursor });
    }
    else if (const auto* commit = std::get_if<input::ImeCommit>(&event))
    {
        if (const auto id = mState.GetImeFocus())
            cx.SendEvent(id.value(), ImeCommitEvent { commit->text });
    }
    else if (std::holds_alternative<input::ImeDisabled>(event))
        OnImeDisabled(cx);
    else if (const auto* moved = std::get_if<input::CursorMoved>(&event))
        OnCursorMoved(cx, *moved);
    else if (std::holds_alternative<input::CursorEntered>(event))
        mState.mCursorInWindow = true;
    else if (std::holds_alternative<input::CursorLeft>(event))
        OnCursorLeft(cx);
    else if (const auto* wheel = std::get_if<input::MouseWheel>(&event))
        OnMouseWheel(cx, *wheel);
    else if (const auto* mouse = std::get_if<input::MouseInput>(&event))
        OnMouseInput(cx, *mouse);
    else if (const auto* touch = std::get_if<input::Touch>(&event))
        OnTouch(cx, *touch);
}

void Window::OnFocused(EventCx& cx, const input::Focused& focused)
{
    mState.mWindowHasFocus = focused.focused;
    if (focused.focused)
    {
        mState.Redraw();
        return;
    }
    // overlays are only valid while the window has focus.
    cx.CloseNonAncestorsOf(std::nullopt);
    mState.mModifiers.clear();
    mState.mKeyDepress.clear();
    mState.Redraw();
}

void Window::OnModifiers(EventCx& cx, const input::ModifiersChanged& modifiers)
{
    const bool alt_changed = mState.mModifiers.test(Modifier::Alt) !=
                             modifiers.modifiers.test(Modifier::Alt);
    mState.mModifiers = modifiers.modifiers;
    // accelerator key labels are drawn while alt is held.
    if (alt_changed)
        mState.Redraw();
}

void Window::OnKeyboardInput(EventCx& cx, const input::KeyboardInput& input)
{
    const auto& event = input.event;
    if (event.state == ElementState::Released)
    {
        if (mState.mKeyDepress.erase(event.physical_key))
            mState.Redraw();
        if (const auto id = mState.GetKeyFocus())
            cx.SendEvent(id.value(), KeyInputEvent { event, input.is_synthetic });
        return;
    }

    if (const auto id = mState.GetKeyFocus())
    {
        if (cx.SendEvent(id.value(), KeyInputEvent { event, input.is_synthetic }) == IsUsed::Used)
            return;
    }
    StartKeyEvent(cx, event);
}

void Window::StartKeyEvent(EventCx& cx, const KeyEvent& event)
{
    const auto modifiers = mState.mModifiers;
    const Key& key = event.key_without_modifiers.IsValid() ? event.key_without_modifiers
                                                           : event.logical_key;
    const auto cmd = mState.GetConfig().GetShortcuts().TryMatch(modifiers, key);
    if (cmd.has_value() && RouteCommand(cx, cmd.value(), event.physical_key))
        return;

    // accelerator keys, popups first from the top.
    const bool alt = modifiers.test(Modifier::Alt);
    const auto& popups = mState.mPopups;
    std::optional<Id> target;
    for (std::size_t i=popups.GetSize(); i>0 && !target.has_value(); --i)
        target = mState.mAccelLayers.Lookup(popups[i-1].desc.id, key, alt);
    if (!target.has_value())
        target = mState.mAccelLayers.Lookup(Id::Root(), key, alt);

    if (target.has_value() && !mState.IsDisabled(target.value()))
    {
        DEBUG("Accelerator key activation. [id=%1, key=%2]", target, key.ToString());
        cx.CloseNonAncestorsOf(target);
        mState.SetNavFocus(target.value(), FocusSource::Key);
        cx.SendEvent(target.value(), CommandEvent { Command::Activate, event.physical_key });
        return;
    }

    if (cmd == Command::Tab)
    {
        mState.NextNavFocus(std::nullopt, modifiers.test(Modifier::Shift), FocusSource::Key);
    }
    else if (cmd == Command::Escape)
    {
        if (const auto* popup = popups.GetTop())
        {
            const WindowId window = popup->window;
            cx.ClosePopup(window);
        }
    }
}

bool Window::RouteCommand(EventCx& cx, Command cmd, PhysicalKey code)
{
    std::vector<Id> tried;
    auto send = [&cx, &tried, cmd, code](const Id& id) {
        if (std::find(tried.begin(), tried.end(), id) != tried.end())
            return false;
        tried.push_back(id);
        return cx.SendEvent(id, CommandEvent { cmd, code }) == IsUsed::Used;
    };

    const auto sel = mState.GetSelFocus();
    if (sel.has_value() && (mState.mInputFocus.HasKeyFocus() || SuitableForSelFocus(cmd)))
    {
        if (send(sel.value()))
            return true;
    }
    const auto nav = mState.GetNavFocus();
    if (nav.has_value() && !mState.mModifiers.test(Modifier::Alt))
    {
        if (send(nav.value()))
            return true;
    }
    if (const auto* popup = mState.mPopups.GetTopSized())
    {
        const Id id = popup->desc.id;
        if (send(id))
            return true;
    }
    const auto fallback = mState.GetNavFallback();
    if (send(fallback.value_or(mRoot.GetId())))
        return true;

    if (cmd == Command::Exit)
    {
        mState.Exit();
        return true;
    }
    else if (cmd == Command::Close)
    {
        mState.CloseWindow();
        return true;
    }
    return false;
}

void Window::OnCursorMoved(EventCx& cx, const input::CursorMoved& moved)
{
    const Coord coord = ToCoord(moved.position);
    const Offset delta = coord - mState.mLastCoord;
    mState.mLastCoord = coord;
    mState.mCursorInWindow = true;
    if (delta != Offset(0, 0))
        mState.mLastClickButton.reset();

    const auto hover = Probe(coord);
    SetHover(cx, hover);

    if (auto* grab = mState.mPress.GetMouseGrab())
    {
        grab->coord = coord;
        if (IsPan(grab->mode))
        {
            mState.mPress.UpdatePanCoord(grab->pan, coord);
        }
        else if (grab->mode == GrabMode::Drag)
        {
            const Id owner = grab->start_id;
            const Press press { PressSource::Mouse(grab->button, grab->repetitions), hover, coord };
            cx.SendEvent(owner, PressMoveEvent { press, delta });
        }
        // a click grab's depress target follows the hover at flush.
        return;
    }
    if (hover.has_value())
    {
        const Press press { PressSource::Mouse(MouseButton::Other, 0), hover, coord };
        cx.SendEvent(hover.value(), CursorMoveEvent { press });
    }
}

void Window::OnCursorLeft(EventCx& cx)
{
    mState.mCursorInWindow = false;
    if (!mState.mPress.HasMouseGrab())
        SetHover(cx, std::nullopt);
}

void Window::OnMouseWheel(EventCx& cx, const input::MouseWheel& wheel)
{
    const auto hover = mState.mHover;
    if (!hover.has_value())
        return;
    cx.SendEvent(hover.value(), ScrollEvent { wheel.delta });
}

void Window::OnMouseInput(EventCx& cx, const input::MouseInput& input)
{
    const Coord coord = mState.mLastCoord;
    const auto hover  = mState.mHover;
    auto& press = mState.mPress;

    if (input.state == ElementState::Released)
    {
        const auto* grab = press.GetMouseGrab();
        if (grab == nullptr || grab->button != input.button)
            return;
        const auto ended = press.EndMouseGrab(true, hover, coord);
        if (ended.has_value() && ended->event.has_value())
            cx.SendEvent(ended->owner, ended->event.value());
        mState.Redraw();
        return;
    }

    const auto now = mState.Now();
    if (mState.mLastClickButton == input.button && now < mState.mLastClickTimeout)
        ++mState.mLastClickRepetitions;
    else mState.mLastClickRepetitions = 1;
    mState.mLastClickButton  = input.button;
    mState.mLastClickTimeout = now + mState.GetConfig().GetDoubleClickTimeout();
    const unsigned repetitions = mState.mLastClickRepetitions;

    if (const auto* grab = press.GetMouseGrab())
    {
        // other buttons are ignored while panning.
        if (IsPan(grab->mode))
            return;
        // one mouse grab at a time, the old grab is cancelled.
        const auto ended = press.EndMouseGrab(false, hover, coord);
        if (ended.has_value() && ended->event.has_value())
            cx.SendEvent(ended->owner, ended->event.value());
        mState.Redraw();
    }

    cx.CloseNonAncestorsOf(hover);
    if (!hover.has_value())
        return;

    if (mState.GetConfig().IsMouseNavFocusEnabled())
        mState.RequestNavFocus(hover.value(), FocusSource::Pointer);

    const Press start { PressSource::Mouse(input.button, repetitions), hover, coord };
    cx.SendEvent(hover.value(), PressStartEvent { start });
}

void Window::OnTouch(EventCx& cx, const input::Touch& touch)
{
    const Coord coord = ToCoord(touch.location);
    mState.mLastTouchCoord = coord;
    auto& press = mState.mPress;

    if (touch.phase == TouchPhase::Started)
    {
        const auto over = Probe(coord);
        cx.CloseNonAncestorsOf(over);
        if (!over.has_value())
            return;
        if (mState.GetConfig().IsTouchNavFocusEnabled())
            mState.RequestNavFocus(over.value(), FocusSource::Pointer);

        const Press start { PressSource::Touch(touch.id), over, coord };
        cx.SendEvent(over.value(), PressStartEvent { start });
        return;
    }

    const auto index = press.GetTouchIndex(touch.id);
    if (!index.has_value())
        return;

    auto& grab = press.GetTouchGrab(index.value());
    grab.over = Probe(coord);

    if (touch.phase == TouchPhase::Moved)
    {
        const Offset delta = coord - grab.coord;
        grab.coord = coord;
        if (IsPan(grab.mode))
        {
            press.UpdatePanCoord(grab.pan, coord);
        }
        else if (grab.mode == GrabMode::Drag)
        {
            const Id owner = grab.start_id;
            const Press move { PressSource::Touch(touch.id), grab.over, coord };
            cx.SendEvent(owner, PressMoveEvent { move, delta });
        }
        return;
    }

    const bool success = touch.phase == TouchPhase::Ended;
    const auto ended = press.EndTouchGrab(index.value(), success, coord);
    if (ended.event.has_value())
        cx.SendEvent(ended.owner, ended.event.value());
    mState.Redraw();
}

void Window::OnImeDisabled(EventCx& cx)
{
    const auto id = mState.GetImeFocus();
    if (!id.has_value())
        return;
    mState.mInputFocus.ImeDisabled();
    cx.SendEvent(id.value(), LostImeFocusEvent {});
}

void Window::SetHover(EventCx& cx, const std::optional<Id>& hover)
{
    if (mState.mHover == hover)
        return;

    const auto old = mState.mHover;
    mState.mHover = hover;
    mState.mHoverIcon = CursorIcon::Default;
    if (old.has_value())
        cx.SendEvent(old.value(), MouseHoverEvent { false });
    if (hover.has_value())
        cx.SendEvent(hover.value(), MouseHoverEvent { true });
    mState.Redraw();
}

} // namespace
