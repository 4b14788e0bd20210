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
#include <set>
#include <utility>
#include <vector>

#include "evtcore/types.h"
#include "evtcore/id.h"

namespace evt
{
    // TimerQueue keeps the scheduled timer updates of a window and the
    // set of frame aligned updates. Requests with the same Id and handle
    // are merged so that at most one entry exists for each pair.
    class TimerQueue
    {
    public:
        struct Timer {
            Id id;
            TimerHandle handle;
        };

        // Request a timer update for the widget at the given time. If
        // an update with the same id and handle already exists the
        // requests are merged choosing the earlier time when the handle
        // is flagged earliest and the later time otherwise.
        void Request(const Id& id, TimerHandle handle, Instant when);

        // Request an update on the next rendered frame.
        void RequestFrame(const Id& id, TimerHandle handle);

        // Get the time when the next timer expires if any.
        std::optional<Instant> GetNextResume() const;

        // Look up the scheduled time of a timer.
        std::optional<Instant> FindTimer(const Id& id, TimerHandle handle) const;

        // Take all timers that have expired by now, in expiry order.
        // Timers expiring at the same time are returned in the order
        // in which they were first requested.
        std::vector<Timer> TakeExpired(Instant now);

        // Take the frame timers.
        std::vector<Timer> TakeFrameTimers();

        inline bool HasFrameTimers() const noexcept
        { return !mFrameTimers.empty(); }
        inline std::size_t GetNumTimers() const noexcept
        { return mTimers.size(); }
        inline bool IsEmpty() const noexcept
        { return mTimers.empty() && mFrameTimers.empty(); }

        void Clear();
    private:
        void Sort();
    private:
        struct Entry {
            Instant time;
            Id id;
            TimerHandle handle;
            std::uint64_t seq = 0;
        };
        // Sorted in reverse order so that the next
        // timer to expire is at the back.
        std::vector<Entry> mTimers;
        std::set<std::pair<Id, TimerHandle>> mFrameTimers;
        std::uint64_t mSequence = 0;
    };

} // namespace
