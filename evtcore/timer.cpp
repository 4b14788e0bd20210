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

#include "base/logging.h"
#include "evtcore/timer.h"

namespace evt
{

void TimerQueue::Request(const Id& id, TimerHandle handle, Instant when)
{
    auto it = std::find_if(mTimers.begin(), mTimers.end(), [&id, &handle](const auto& entry) {
        return entry.id == id && entry.handle == handle;
    });
    if (it != mTimers.end())
    {
        const bool earliest = handle.IsEarliest();
        if (earliest && it->time <= when)
            return;
        if (!earliest && it->time >= when)
            return;
        it->time = when;
    }
    else
    {
        VERBOSE("Request timer. [id=%1, handle=%2]", id, handle.GetCode());
        mTimers.push_back({when, id, handle, mSequence++});
    }
    Sort();
}

void TimerQueue::RequestFrame(const Id& id, TimerHandle handle)
{
    if (!handle.IsEarliest())
        ERROR("Frame timer handle is not flagged earliest. [id=%1, handle=%2]", id, handle.GetCode());
    mFrameTimers.insert(std::make_pair(id, handle));
}

std::optional<Instant> TimerQueue::GetNextResume() const
{
    if (mTimers.empty())
        return std::nullopt;
    return mTimers.back().time;
}

std::optional<Instant> TimerQueue::FindTimer(const Id& id, TimerHandle handle) const
{
    for (const auto& entry : mTimers)
    {
        if (entry.id == id && entry.handle == handle)
            return entry.time;
    }
    return std::nullopt;
}

std::vector<TimerQueue::Timer> TimerQueue::TakeExpired(Instant now)
{
    std::vector<Timer> ret;
    while (!mTimers.empty())
    {
        if (mTimers.back().time > now)
            break;
        auto& entry = mTimers.back();
        ret.push_back({std::move(entry.id), entry.handle});
        mTimers.pop_back();
    }
    return ret;
}

std::vector<TimerQueue::Timer> TimerQueue::TakeFrameTimers()
{
    std::vector<Timer> ret;
    for (const auto& pair : mFrameTimers)
        ret.push_back({pair.first, pair.second});
    mFrameTimers.clear();
    return ret;
}

void TimerQueue::Clear()
{
    mTimers.clear();
    mFrameTimers.clear();
}

void TimerQueue::Sort()
{
    std::sort(mTimers.begin(), mTimers.end(), [](const Entry& lhs, const Entry& rhs) {
        if (lhs.time != rhs.time)
            return lhs.time > rhs.time;
        return lhs.seq > rhs.seq;
    });
}

} // namespace
