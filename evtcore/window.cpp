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
#include "evtcore/window.h"
#include "evtcore/event_cx.h"
#include "evtcore/node.h"
#include "evtcore/runner.h"

namespace {
using namespace evt;

// Collect the navigable widgets in pre-order which is the same
// as the Id order.
void CollectNavigable(const Node& node, const EventState& state, std::vector<Id>* ids)
{
    if (state.IsDisabled(node.GetId()))
        return;
    if (node.IsNavigable())
        ids->push_back(node.GetId());
    for (std::size_t i=0; i<node.GetNumChildren(); ++i)
    {
        if (const auto* child = node.GetChild(i))
            CollectNavigable(*child, state, ids);
    }
}

} // namespace

namespace evt
{

Window::Window(std::shared_ptr<const WindowConfig> config, WindowId window,
               Runner& runner, Node& root, AppData* data)
  : mState(std::move(config), window)
  , mRunner(runner)
  , mRoot(root)
  , mAppData(data)
{}

void Window::FullConfigure()
{
    DEBUG("Configure window. [window=%1]", GetWindowId());

    mState.mNavFocus.ResetFallback();
    mState.mAccelLayers.Clear();
    mState.mDisabled.clear();
    mState.NewAccelLayer(Id::Root(), false);

    ConfigCx config(mState);
    config.Configure(mRoot, Id::Root());

    EventCx cx(mState, mRunner, mRoot, mAppData);
    Revalidate(cx);
    mState.mAction.set(Action::Resize);
}

void Window::HandleAccessAction(const Id& id, const AccessAction& action)
{
    if (!Exists(id) || mState.IsDisabled(id))
    {
        VERBOSE("Ignoring access action on unavailable widget. [id=%1, action=%2]", id, action.type);
        return;
    }

    EventCx cx(mState, mRunner, mRoot, mAppData);
    const auto* point = std::get_if<Coord>(&action.data);
    const auto* text  = std::get_if<std::string>(&action.data);
    const auto* value = std::get_if<double>(&action.data);

    using Type = AccessAction::Type;
    switch (action.type)
    {
        case Type::Click:
            cx.SendEvent(id, CommandEvent { Command::Activate, std::nullopt });
            break;
        case Type::Focus:
            mState.SetNavFocus(id, FocusSource::Synthetic);
            break;
        case Type::Blur:
            if (mState.HasNavFocus(id))
                mState.ClearNavFocus();
            break;
        case Type::Increment:
            cx.Replay(id, Erased(msg::IncrementStep {}));
            break;
        case Type::Decrement:
            cx.Replay(id, Erased(msg::DecrementStep {}));
            break;
        case Type::ScrollUp:
            cx.SendEvent(id, ScrollEvent { ScrollDelta::MakeLines(0.0, 1.0) });
            break;
        case Type::ScrollDown:
            cx.SendEvent(id, ScrollEvent { ScrollDelta::MakeLines(0.0, -1.0) });
            break;
        case Type::ScrollLeft:
            cx.SendEvent(id, ScrollEvent { ScrollDelta::MakeLines(1.0, 0.0) });
            break;
        case Type::ScrollRight:
            cx.SendEvent(id, ScrollEvent { ScrollDelta::MakeLines(-1.0, 0.0) });
            break;
        case Type::ScrollIntoView:
            if (const auto* node = FindNode(mRoot, id))
                cx.ScrollTo(id, Scroll::MakeRect(node->GetRect()));
            break;
        case Type::ScrollToPoint:
            if (point)
                cx.ScrollTo(id, Scroll::MakeRect(Rect { *point, Offset(0, 0) }));
            else VERBOSE("Ignoring access action with mismatched data. [id=%1, action=%2]", id, action.type);
            break;
        case Type::SetScrollOffset:
            if (point)
                cx.Replay(id, Erased(msg::SetScrollOffset { *point }));
            else VERBOSE("Ignoring access action with mismatched data. [id=%1, action=%2]", id, action.type);
            break;
        case Type::SetValue:
            if (text)
                cx.Replay(id, Erased(msg::SetValueText { *text }));
            else if (value)
                cx.Replay(id, Erased(msg::SetValueF64 { *value }));
            else VERBOSE("Ignoring access action with mismatched data. [id=%1, action=%2]", id, action.type);
            break;
        case Type::ShowContextMenu:
            cx.SendEvent(id, CommandEvent { Command::ContextMenu, std::nullopt });
            break;
    }
}

void Window::FrameUpdate()
{
    EventCx cx(mState, mRunner, mRoot, mAppData);
    for (const auto& pan : mState.mPress.FlushPans())
        cx.SendEvent(pan.first, pan.second);
    for (const auto& timer : mState.mTimers.TakeFrameTimers())
        cx.SendEvent(timer.id, TimerEvent { timer.handle });
}

void Window::UpdateTimers()
{
    EventCx cx(mState, mRunner, mRoot, mAppData);
    const auto now = mState.Now();
    for (const auto& timer : mState.mTimers.TakeExpired(now))
        cx.SendEvent(timer.id, TimerEvent { timer.handle });
}

void Window::ConfirmPopupSized(WindowId window)
{
    if (!mState.mPopups.ConfirmSized(window))
    {
        VERBOSE("No such popup to confirm. [window=%1]", window);
        return;
    }
    mState.Redraw();
}

void Window::Suspended()
{
    EventCx cx(mState, mRunner, mRoot, mAppData);
    cx.CloseNonAncestorsOf(std::nullopt);
    if (mAppData)
        mAppData->Suspended();
}

ActionFlags Window::FlushPending()
{
    EventCx cx(mState, mRunner, mRoot, mAppData);

    // popups that were closed after they were sized.
    auto removed = std::move(mState.mPopupRemoved);
    mState.mPopupRemoved.clear();
    for (const auto& popup : removed)
        cx.SendEvent(popup.first, PopupClosedEvent { popup.second });

    // events owed from cancelled grabs and cleared focus.
    auto events = std::move(mState.mPendingEvents);
    mState.mPendingEvents.clear();
    for (auto& pending : events)
        cx.SendEvent(pending.first, std::move(pending.second));

    if (mState.mPress.FlushClickMove(mState.mHover))
        mState.Redraw();

    if (mState.mPendingUpdate.has_value())
    {
        const Id id = mState.mPendingUpdate.value();
        const bool reconfigure = mState.mPendingReconfigure;
        mState.mPendingUpdate.reset();
        mState.mPendingReconfigure = false;
        if (auto* node = FindNode(mRoot, id))
        {
            ConfigCx config(mState);
            if (reconfigure)
            {
                config.Configure(*node, id);
                Revalidate(cx);
                mState.mAction.set(Action::Resize);
            }
            else config.Update(*node);
            mState.Redraw();
        }
        else VERBOSE("Update target not found. [id=%1]", id);
    }
    if (mState.mAction.take(Action::Reconfigure))
        FullConfigure();

    FlushNavFocus(cx);
    FlushInputFocus(cx);

    if (mState.mPendingExit)
    {
        mState.mPendingExit = false;
        mRunner.Exit();
    }
    if (mState.mPendingClose)
    {
        mState.mPendingClose = false;
        mState.mAction.set(Action::Close);
    }
    while (!mState.mSendQueue.empty())
    {
        auto send = std::move(mState.mSendQueue.front());
        mState.mSendQueue.pop_front();
        cx.SendOrReplay(send.first, std::move(send.second));
    }

    FlushAsync(cx);
    FlushRegionMoved(cx);
    FlushCursorIcon();

    return mState.TakeAction();
}

std::optional<Id> Window::Probe(const Coord& coord) const
{
    const auto& popups = mState.mPopups;
    for (std::size_t i=popups.GetSize(); i>0; --i)
    {
        const auto& desc = popups[i-1].desc;
        const Node* node = FindNode(mRoot, desc.id);
        const auto rect = FindNodeRect(mRoot, desc.id);
        if (node == nullptr || !rect.has_value())
            continue;
        if (!rect->Contains(coord))
            continue;
        // map the window coordinate into the popup's parent space.
        const Coord local = coord - rect->pos + node->GetRect().pos;
        return node->Probe(local);
    }
    if (!mRoot.GetId().IsValid())
        return std::nullopt;
    return mRoot.Probe(coord);
}

void Window::FlushNavFocus(EventCx& cx)
{
    if (!mState.mNavFocus.HasPending())
        return;

    const auto pending = mState.mNavFocus.TakePending();
    std::optional<Id> target;
    FocusSource source = FocusSource::Synthetic;
    if (const auto* set = std::get_if<NavFocusState::SetTo>(&pending))
    {
        target = set->target;
        source = set->source;
        if (target.has_value() && (!Exists(target.value()) || mState.IsDisabled(target.value())))
        {
            VERBOSE("Nav focus target is not available. [id=%1]", target);
            return;
        }
    }
    else if (const auto* advance = std::get_if<NavFocusState::Advance>(&pending))
    {
        target = FindNavTarget(*advance);
        source = advance->source;
        if (!target.has_value())
            return;
    }
    if (target == mState.GetNavFocus())
        return;

    const auto old = mState.mNavFocus.Commit(target);
    mState.Redraw();
    if (old.has_value())
        cx.SendEvent(old.value(), LostNavFocusEvent {});
    if (target.has_value())
    {
        mState.ClearIncompatibleSelFocus(target.value());
        cx.CloseNonAncestorsOf(target, false);
        cx.SendEvent(target.value(), NavFocusEvent { source });
    }
}

void Window::FlushInputFocus(EventCx& cx)
{
    auto& focus = mState.mInputFocus;
    if (!focus.HasPendingChanges())
        return;

    const auto pending = focus.TakePending();
    if (pending.lost.has_value())
    {
        const auto& lost = pending.lost.value();
        if (lost.ime)
        {
            mRunner.SetImeAllowed(std::nullopt);
            cx.SendEvent(lost.id, LostImeFocusEvent {});
        }
        if (lost.key)
            cx.SendEvent(lost.id, LostKeyFocusEvent {});
        if (lost.sel)
            cx.SendEvent(lost.id, LostSelFocusEvent {});
    }
    if (const auto* staged = std::get_if<InputFocusState::StagedTo>(&pending.sel))
        cx.SendEvent(staged->target, SelFocusEvent { staged->source });

    const auto key = focus.GetKeyFocus();
    if (!key.has_value())
        return;
    if (pending.new_key)
        cx.SendEvent(key.value(), KeyFocusEvent {});
    if (pending.new_ime.has_value())
    {
        const auto purpose = pending.new_ime;
        const bool enabled = mRunner.SetImeAllowed(purpose);
        focus.SetImeEnabled(enabled, purpose);
        if (enabled)
            cx.SendEvent(key.value(), ImeFocusEvent {});
        else WARN("Failed to enable IME. [id=%1, purpose=%2]", key, purpose);
    }
}

void Window::FlushAsync(EventCx& cx)
{
    auto& futures = mState.mFutures;
    for (std::size_t i=0; i<futures.size();)
    {
        std::optional<Erased> value;
        if (!futures[i].second->Poll(&value))
        {
            ++i;
            continue;
        }
        const Id id = futures[i].first;
        futures.erase(futures.begin() + i);
        if (value.has_value())
            cx.SendOrReplay(id, std::move(value.value()));
    }

    auto& tasks = mState.mTasks;
    for (auto it = tasks.begin(); it != tasks.end();)
    {
        if (!it->IsComplete())
        {
            ++it;
            continue;
        }
        const auto* task = it->GetTask();
        if (task->Failed())
            ERROR("Async task failed. [task='%1', error='%2']", task->GetTaskName(), task->GetErrorString());
        it = tasks.erase(it);
    }

    for (auto& message : mState.mCompletions->TakeAll())
        cx.SendOrReplay(message.first, std::move(message.second));
}

void Window::FlushRegionMoved(EventCx& cx)
{
    // partial invalidation isn't supported, a moved region is a redraw.
    if (!mState.mAction.take(Action::RegionMoved))
        return;

    if (mState.mCursorInWindow)
        SetHover(cx, Probe(mState.mLastCoord));
    for (std::size_t i=0; i<mState.mPress.GetNumTouches(); ++i)
    {
        auto& grab = mState.mPress.GetTouchGrab(i);
        grab.over = Probe(grab.coord);
    }
    mState.Redraw();
}

void Window::FlushCursorIcon()
{
    CursorIcon icon = mState.mHoverIcon;
    if (const auto* grab = mState.mPress.GetMouseGrab())
    {
        if (!grab->icon.has_value())
            return;
        icon = grab->icon.value();
    }
    if (icon == mState.mOldHoverIcon)
        return;
    mState.mOldHoverIcon = icon;
    mRunner.SetCursorIcon(icon);
}

std::optional<Id> Window::FindNavTarget(const NavFocusState::Advance& advance) const
{
    if (advance.advance == NavAdvance::None)
    {
        // the target itself or its closest navigable ancestor.
        std::optional<Id> current = advance.target;
        while (current.has_value())
        {
            const Node* node = FindNode(mRoot, current.value());
            if (node && node->IsNavigable() && !mState.IsDisabled(current.value()))
                return current;
            current = current->GetParent();
        }
        return std::nullopt;
    }

    Id scope = Id::Root();
    if (const auto* popup = mState.mPopups.GetTopSized())
        scope = popup->desc.id;

    std::vector<Id> ids;
    if (const Node* node = FindNode(mRoot, scope))
        CollectNavigable(*node, mState, &ids);
    if (ids.empty())
    {
        const auto& fallback = mState.GetNavFallback();
        if (fallback.has_value() && !mState.IsDisabled(fallback.value()))
            return fallback;
        return std::nullopt;
    }

    const auto& start = advance.target;
    if (advance.advance == NavAdvance::Forward)
    {
        if (start.has_value())
        {
            for (const auto& id : ids)
            {
                if (advance.inclusive ? id >= start.value() : id > start.value())
                    return id;
            }
        }
        return ids.front();
    }
    if (start.has_value())
    {
        for (auto it = ids.rbegin(); it != ids.rend(); ++it)
        {
            if (advance.inclusive ? *it <= start.value() : *it < start.value())
                return *it;
        }
    }
    return ids.back();
}

void Window::Revalidate(EventCx& cx)
{
    if (mState.GetNavFocus().has_value())
    {
        const Id focus = mState.GetNavFocus().value();
        if (!Exists(focus))
            mState.mNavFocus.ClearOn(focus);
    }
    if (mState.GetSelFocus().has_value())
    {
        const Id focus = mState.GetSelFocus().value();
        if (!Exists(focus))
            mState.mInputFocus.ClearOn(focus);
    }

    std::vector<Id> stale_grabs;
    if (const auto* grab = mState.mPress.GetMouseGrab())
    {
        if (!Exists(grab->start_id))
            stale_grabs.push_back(grab->start_id);
    }
    for (std::size_t i=0; i<mState.mPress.GetNumTouches(); ++i)
    {
        const auto& grab = mState.mPress.GetTouchGrab(i);
        if (!Exists(grab.start_id))
            stale_grabs.push_back(grab.start_id);
    }
    for (const auto& id : stale_grabs)
        mState.mPress.DropGrabsOf(id);

    if (mState.mHover.has_value() && !Exists(mState.mHover.value()))
        mState.mHover.reset();

    for (auto it = mState.mKeyDepress.begin(); it != mState.mKeyDepress.end();)
    {
        if (!Exists(it->second))
            it = mState.mKeyDepress.erase(it);
        else ++it;
    }

    for (std::size_t i=0; i<mState.mPopups.GetSize(); ++i)
    {
        if (!Exists(mState.mPopups[i].desc.id))
        {
            cx.ClosePopupAt(i, false);
            break;
        }
    }

    // the widgets under the cursor may have changed.
    if (mState.mCursorInWindow)
        SetHover(cx, Probe(mState.mLastCoord));
}

bool Window::Exists(const Id& id) const
{
    return FindNode(mRoot, id) != nullptr;
}

} // namespace
