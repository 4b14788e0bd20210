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

#include "base/assert.h"
#include "base/logging.h"
#include "evtcore/event_cx.h"
#include "evtcore/node.h"

namespace evt
{

void EventCx::SendErased(const Id& id, Erased msg)
{
    // delivering now would be observed out of order by the caller
    // when the caller still has messages or a scroll in flight.
    if (!mState.mMessages.HasAny() && !mScroll.IsSet())
        SendOrReplay(id, std::move(msg));
    else mState.mSendQueue.emplace_back(id, std::move(msg));
}

void EventCx::SendCommand(const Id& id, Command cmd)
{
    mState.mSendQueue.emplace_back(id, Erased(cmd));
}

IsUsed EventCx::SendEvent(const Id& id, Event event)
{
    // events that don't pass to disabled widgets are redirected to
    // the outermost disabled ancestor where they are left unused.
    Id target = id;
    bool disabled = false;
    if (!PassWhenDisabled(event))
    {
        for (const auto& d : mState.mDisabled)
        {
            if (!d.IsAncestorOf(id))
                continue;
            if (!disabled || d.GetPathLength() < target.GetPathLength())
            {
                target = d;
                disabled = true;
            }
        }
    }

#if defined(EVT_LOG_COMMAND_ROUTING)
    if (const auto* cmd = std::get_if<CommandEvent>(&event))
        DEBUG("Send command. [id=%1, cmd=%2, disabled=%3]", target, cmd->cmd, disabled);
#endif

    const auto base = mState.mMessages.SetBase();
    const auto old_scroll = mScroll;
    const auto old_last_child = mLastChild;
    const auto old_disabled = mTargetIsDisabled;
    mScroll = Scroll();
    mLastChild.reset();
    mTargetIsDisabled = disabled;

    IsUsed used = IsUsed::Unused;
    if (mRoot.GetId().IsAncestorOf(target))
        used = SendRecurse(mRoot, target, event);
    else VERBOSE("Event target is not in the tree. [id=%1, event=%2]", target, GetEventName(event));

    HandleUnhandled();
    mState.mMessages.RestoreBase(base);
    mScroll = old_scroll;
    mLastChild = old_last_child;
    mTargetIsDisabled = old_disabled;
    return used;
}

void EventCx::PushAsyncErased(const Id& id, std::unique_ptr<PendingMessage> pending)
{
    mState.mFutures.emplace_back(id, std::move(pending));
}

bool EventCx::GrabPress(const Press& press, const Id& owner, GrabMode mode, std::optional<CursorIcon> icon)
{
    const auto& source = press.source;
    if (source.IsMouse())
    {
        if (!mState.mPress.StartMouseGrab(owner, source.GetButton(), source.GetRepetitions(),
                                          mState.mLastCoord, mode, icon))
        {
            ERROR("Mouse grab rejected. Existing grab was not released. [id=%1, button=%2]", owner, source.GetButton());
            return false;
        }
    }
    else
    {
        if (!mState.mPress.StartTouchGrab(source.GetTouchId(), owner, mState.mLastTouchCoord, mode))
            return false;
    }
    mState.Redraw();
    return true;
}

bool EventCx::GrabPressUnique(const Press& press, const Id& owner, std::optional<CursorIcon> icon)
{
    mState.mPress.DropGrabsOf(owner);
    return GrabPress(press, owner, GrabMode::Drag, icon);
}

bool EventCx::SetGrabDepress(const PressSource& source, const std::optional<Id>& target)
{
    if (!mState.mPress.SetGrabDepress(source, target))
        return false;
    mState.Redraw();
    return true;
}

void EventCx::UpdateGrabCursor(const Id& id, CursorIcon icon)
{
    auto* grab = mState.mPress.GetMouseGrab();
    if (grab == nullptr || grab->start_id != id)
        return;
    grab->icon = icon;
}

WindowId EventCx::AddPopup(const PopupDescriptor& desc, bool set_focus)
{
    const auto window = mRunner.AddPopup(desc);

    PopupState popup;
    popup.window = window;
    popup.desc   = desc;
    if (set_focus)
    {
        popup.old_nav_focus = mState.GetNavFocus();
        mState.ClearNavFocus();
    }
    mState.mPopups.Push(std::move(popup));
    mState.Redraw();
    return window;
}

bool EventCx::RepositionPopup(WindowId window, const PopupDescriptor& desc)
{
    if (!mState.mPopups.Reposition(window, desc))
        return false;
    mRunner.RepositionPopup(window, desc);
    return true;
}

void EventCx::ClosePopup(WindowId window, bool restore_focus)
{
    const auto index = mState.mPopups.FindIndex(window);
    if (!index.has_value())
    {
        VERBOSE("No such popup to close. [window=%1]", window);
        return;
    }
    ClosePopupAt(index.value(), restore_focus);
}

void EventCx::CloseNonAncestorsOf(const std::optional<Id>& id, bool restore_focus)
{
    auto& popups = mState.mPopups;
    while (!popups.IsEmpty())
    {
        const auto index = popups.GetSize() - 1;
        if (id.has_value() && popups[index].desc.id.IsAncestorOf(id.value()))
            break;
        ClosePopupAt(index, restore_focus);
    }
}

WindowId EventCx::AddWindow(const WindowDescriptor& desc)
{
    return mRunner.AddWindow(desc);
}

void EventCx::CloseWindow(WindowId window)
{
    if (window == mState.GetWindowId())
    {
        mState.CloseWindow();
        return;
    }
    if (const auto index = mState.mPopups.FindIndex(window))
    {
        ClosePopupAt(index.value(), true);
        return;
    }
    mRunner.CloseWindow(window);
}

void EventCx::Exit()
{
    mState.Exit();
}

std::optional<std::string> EventCx::GetClipboard()
{
    auto ret = mRunner.GetClipboard();
    if (!ret.has_value())
        WARN("Failed to read clipboard.");
    return ret;
}

void EventCx::SetClipboard(const std::string& content)
{
    if (!mRunner.SetClipboard(content))
        WARN("Failed to write clipboard.");
}

std::optional<std::string> EventCx::GetPrimary()
{
    auto ret = mRunner.GetPrimary();
    if (!ret.has_value())
        WARN("Failed to read primary selection.");
    return ret;
}

void EventCx::SetPrimary(const std::string& content)
{
    if (!mRunner.SetPrimary(content))
        WARN("Failed to write primary selection.");
}

IsUsed EventCx::SendRecurse(Node& node, const Id& id, const Event& event)
{
    IsUsed used = IsUsed::Unused;
    if (node.GetId() == id)
    {
        if (mTargetIsDisabled)
            return IsUsed::Unused;
        mLastChild.reset();
        used = node.HandleEvent(*this, event);
    }
    else
    {
        const auto index = node.FindChildIndex(id);
        Node* child = index.has_value() ? node.GetChild(index.value()) : nullptr;
        if (child == nullptr)
        {
            VERBOSE("Event target not found. [id=%1, event=%2]", id, GetEventName(event));
            return IsUsed::Unused;
        }
        Event translated = event;
        TranslateEvent(translated, node.GetTranslation());
        used = SendRecurse(*child, id, translated);
        mLastChild = index;

        if (mScroll.IsSet())
        {
            const Scroll scroll = mScroll;
            node.HandleScroll(*this, scroll);
        }
        if (used == IsUsed::Unused && IsReusable(event))
            used = node.HandleEvent(*this, event);
    }
    if (mState.mMessages.HasAny())
        node.HandleMessages(*this);
    return used;
}

bool EventCx::ReplayRecurse(Node& node, const Id& id)
{
    if (node.GetId() == id)
    {
        mLastChild.reset();
    }
    else
    {
        const auto index = node.FindChildIndex(id);
        Node* child = index.has_value() ? node.GetChild(index.value()) : nullptr;
        if (child == nullptr)
            return false;
        if (!ReplayRecurse(*child, id))
            return false;
        mLastChild = index;
    }
    if (mState.mMessages.HasAny())
        node.HandleMessages(*this);
    return true;
}

void EventCx::ScrollRecurse(Node& node, const Id& id, const Scroll& scroll)
{
    if (node.GetId() == id)
    {
        mLastChild.reset();
        mScroll = scroll;
        return;
    }
    const auto index = node.FindChildIndex(id);
    Node* child = index.has_value() ? node.GetChild(index.value()) : nullptr;
    if (child == nullptr)
    {
        VERBOSE("Scroll target not found. [id=%1]", id);
        return;
    }
    ScrollRecurse(*child, id, scroll);
    mLastChild = index;

    if (mScroll.IsSet())
    {
        const Scroll current = mScroll;
        node.HandleScroll(*this, current);
    }
    if (mState.mMessages.HasAny())
        node.HandleMessages(*this);
}

void EventCx::SendOrReplay(const Id& id, Erased msg)
{
    if (const auto* cmd = msg.Get<Command>())
    {
        const Command command = *cmd;
        if (SendEvent(id, CommandEvent { command, std::nullopt }) == IsUsed::Unused)
        {
            if (command == Command::Exit)
                mRunner.Exit();
            else if (command == Command::Close)
                mState.CloseWindow();
        }
        return;
    }
    if (const auto* delta = msg.Get<ScrollDelta>())
    {
        SendEvent(id, ScrollEvent { *delta });
        return;
    }
    Replay(id, std::move(msg));
}

void EventCx::Replay(const Id& id, Erased msg)
{
    const auto base = mState.mMessages.SetBase();
    const auto old_scroll = mScroll;
    const auto old_last_child = mLastChild;
    mScroll = Scroll();
    mLastChild.reset();

    mState.mMessages.PushErased(std::move(msg));
    const bool found = mRoot.GetId().IsAncestorOf(id) && ReplayRecurse(mRoot, id);
    if (!found)
    {
        VERBOSE("Dropping message for a stale target. [id=%1]", id);
        mState.mMessages.PopErased();
    }
    HandleUnhandled();
    mState.mMessages.RestoreBase(base);
    mScroll = old_scroll;
    mLastChild = old_last_child;
}

void EventCx::ScrollTo(const Id& id, const Scroll& scroll)
{
    const auto base = mState.mMessages.SetBase();
    const auto old_scroll = mScroll;
    const auto old_last_child = mLastChild;
    mScroll = Scroll();
    mLastChild.reset();

    if (mRoot.GetId().IsAncestorOf(id))
        ScrollRecurse(mRoot, id, scroll);

    HandleUnhandled();
    mState.mMessages.RestoreBase(base);
    mScroll = old_scroll;
    mLastChild = old_last_child;
}

void EventCx::HandleUnhandled()
{
    if (mState.mMessages.HasAny() && mAppData)
        mState.mAction |= mAppData->HandleMessages(mState.mMessages);
    mState.mMessages.DropUnhandled();
}

void EventCx::ClosePopupAt(std::size_t index, bool restore_focus)
{
    auto& popups = mState.mPopups;
    ASSERT(index < popups.GetSize());

    // popups above are descendants and close first.
    while (popups.GetSize() > index)
    {
        PopupState popup = popups.Remove(popups.GetSize() - 1);
        DEBUG("Close popup. [window=%1, id=%2]", popup.window, popup.desc.id);
        mRunner.CloseWindow(popup.window);

        if (popup.is_sized)
            mState.mPopupRemoved.emplace_back(popup.desc.parent, popup.window);

        if (auto lost = mState.mNavFocus.ClearOn(popup.desc.id))
            mState.QueueEvent(lost.value(), LostNavFocusEvent {});
        mState.mInputFocus.ClearUnder(popup.desc.id);
        for (auto& ended : mState.mPress.CancelGrabsOn(popup.desc.id, mState.mHover, mState.mLastCoord))
        {
            if (ended.event.has_value())
                mState.QueueEvent(ended.owner, std::move(ended.event.value()));
        }
        if (restore_focus && popup.old_nav_focus.has_value())
            mState.SetNavFocus(popup.old_nav_focus.value(), FocusSource::Synthetic);
    }
    mState.Redraw();
}

void EventCx::SubmitTask(std::unique_ptr<base::ThreadTask> task)
{
    if (auto* pool = mRunner.GetThreadPool())
    {
        mState.mTasks.push_back(pool->SubmitTask(std::move(task)));
        return;
    }
    std::shared_ptr<base::ThreadTask> shared(std::move(task));
    shared->Execute();
    mState.mTasks.push_back(base::TaskHandle(std::move(shared), base::ThreadPool::MainThreadID));
}

} // namespace
