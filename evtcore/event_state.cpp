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

#include "base/assert.h"
#include "base/logging.h"
#include "evtcore/event_state.h"

namespace evt
{

EventState::EventState(std::shared_ptr<const WindowConfig> config, WindowId window)
  : mConfig(std::move(config))
  , mWindowId(window)
  , mClock([]() { return Clock::now(); })
  , mCompletions(std::make_shared<CompletionQueue>())
{
    ASSERT(mConfig);
}

void EventState::SetClock(ClockFunc clock)
{
    mClock = std::move(clock);
}

Instant EventState::Now() const
{
    return mClock();
}

bool EventState::IsDisabled(const Id& id) const noexcept
{
    for (const auto& disabled : mDisabled)
    {
        if (disabled.IsAncestorOf(id))
            return true;
    }
    return false;
}

bool EventState::IsDepressed(const Id& id) const noexcept
{
    for (const auto& pair : mKeyDepress)
    {
        if (pair.second == id)
            return true;
    }
    if (mPress.IsDepressed(id))
        return true;
    return mPopups.IsParentOfAny(id);
}

void EventState::SetDisabled(const Id& id, bool disabled)
{
    auto it = std::find(mDisabled.begin(), mDisabled.end(), id);
    if (!disabled)
    {
        if (it == mDisabled.end())
            return;
        mDisabled.erase(it);
        DEBUG("Widget enabled. [id=%1]", id);
        Redraw();
        return;
    }
    if (it != mDisabled.end())
        return;

    mDisabled.push_back(id);
    DEBUG("Widget disabled. [id=%1]", id);

    if (auto lost = mNavFocus.ClearOn(id))
        QueueEvent(lost.value(), LostNavFocusEvent {});

    mInputFocus.ClearUnder(id);

    for (auto& ended : mPress.CancelGrabsOn(id, mHover, mLastCoord))
    {
        if (ended.event.has_value())
            QueueEvent(ended.owner, std::move(ended.event.value()));
    }
    for (auto depress = mKeyDepress.begin(); depress != mKeyDepress.end();)
    {
        if (id.IsAncestorOf(depress->second))
            depress = mKeyDepress.erase(depress);
        else ++depress;
    }
    Redraw();
}

void EventState::SetNavFocus(const Id& id, FocusSource source)
{
    if (!mConfig->IsNavFocusEnabled())
        return;
    if (!mNavFocus.StageSet(id, source))
        return;

    Redraw();
    ClearIncompatibleSelFocus(id);
    DEBUG("Nav focus staged. [id=%1, source=%2]", id, source);
}

void EventState::ClearNavFocus()
{
    if (mNavFocus.StageSet(std::nullopt, FocusSource::Synthetic))
        Redraw();
}

void EventState::NextNavFocus(const std::optional<Id>& target, bool reverse, FocusSource source)
{
    if (!mConfig->IsNavFocusEnabled())
        return;
    // an explicit start widget is itself a candidate.
    if (target.has_value() && target == mNavFocus.GetFocus())
        return;
    const auto advance = reverse ? NavAdvance::Reverse : NavAdvance::Forward;
    mNavFocus.StageAdvance(target.has_value() ? target : mNavFocus.GetFocus(), advance, target.has_value(), source);
    Redraw();
}

void EventState::RequestNavFocus(const Id& target, FocusSource source)
{
    if (!mConfig->IsNavFocusEnabled())
        return;
    mNavFocus.StageAdvance(target, NavAdvance::None, true, source);
    Redraw();
}

bool EventState::RequestSelFocus(const Id& target, FocusSource source)
{
    SetNavFocus(target, source);
    if (!mInputFocus.RequestSel(target, source))
        return false;
    Redraw();
    return true;
}

bool EventState::RequestKeyFocus(const Id& target, std::optional<ImePurpose> ime, FocusSource source)
{
    RequestSelFocus(target, source);
    mInputFocus.RequestKey(ime);
    return true;
}

void EventState::CancelImeFocus(const Id& target)
{
    if (mInputFocus.CancelIme(target))
        DEBUG("IME focus cancelled. [id=%1]", target);
}

void EventState::RequestTimer(const Id& id, TimerHandle handle, std::chrono::milliseconds delay)
{
    mTimers.Request(id, handle, Now() + delay);
}

void EventState::RequestFrameTimer(const Id& id, TimerHandle handle)
{
    mTimers.RequestFrame(id, handle);
}

void EventState::RequestUpdate(const Id& id)
{
    if (mPendingUpdate.has_value())
        mPendingUpdate = mPendingUpdate->CommonAncestor(id);
    else mPendingUpdate = id;
}

void EventState::RequestReconfigure(const Id& id)
{
    RequestUpdate(id);
    mPendingReconfigure = true;
}

void EventState::RegisterNavFallback(const Id& id)
{
    mNavFocus.RegisterFallback(id);
}

void EventState::NewAccelLayer(const Id& id, bool alt_bypass)
{
    mAccelLayers.NewLayer(id, alt_bypass);
}

void EventState::EnableAltBypass(const Id& id, bool alt_bypass)
{
    mAccelLayers.EnableAltBypass(id, alt_bypass);
}

void EventState::AddAccelKeys(const Id& id, const std::vector<Key>& keys)
{
    mAccelLayers.AddKeys(id, keys);
}

void EventState::DepressWithKey(const Id& id, PhysicalKey code)
{
    auto it = mKeyDepress.find(code);
    if (it != mKeyDepress.end() && it->second == id)
        return;
    mKeyDepress[code] = id;
    Redraw();
}

void EventState::RequestAction(const Id& id, ActionFlags action)
{
    if (action.take(Action::Update))
        RequestUpdate(id);
    if (action.take(Action::Reconfigure))
        RequestReconfigure(id);
    mAction |= action;
}

std::optional<Instant> EventState::GetNextResume() const
{
    return mTimers.GetNextResume();
}

bool EventState::NeedFrameUpdate() const noexcept
{
    return mTimers.HasFrameTimers() || mPress.GetNumPans() != 0;
}

bool EventState::HasPendingAsync() const
{
    return !mFutures.empty() || !mTasks.empty() || !mCompletions->IsEmpty();
}

void EventState::QueueEvent(const Id& id, Event event)
{
    mPendingEvents.emplace_back(id, std::move(event));
}

void EventState::ClearIncompatibleSelFocus(const Id& target)
{
    const auto& sel = mInputFocus.GetSelFocus();
    if (!sel.has_value())
        return;
    const Id focus = sel.value();
    if (focus.IsAncestorOf(target) || target.IsAncestorOf(focus))
        return;
    mInputFocus.ClearOn(focus);
}

} // namespace
