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

#include <chrono>

#include "base/test_minimal.h"
#include "base/test_help.h"
#include "evtcore/timer.h"

using namespace std::chrono_literals;
using evt::Id;
using evt::TimerHandle;

void unit_test_timer_merge()
{
    TEST_CASE(test::Type::Feature)

    const auto now = evt::Clock::now();
    const auto w = Id::FromPath({0, 1});

    // earliest handle keeps the earlier time
    {
        evt::TimerQueue timers;
        const TimerHandle h(1, true);
        timers.Request(w, h, now + 100ms);
        timers.Request(w, h, now + 10ms + 50ms);
        TEST_REQUIRE(timers.GetNumTimers() == 1);
        TEST_REQUIRE(timers.FindTimer(w, h).value() == now + 60ms);

        timers.Request(w, h, now + 200ms);
        TEST_REQUIRE(timers.GetNumTimers() == 1);
        TEST_REQUIRE(timers.FindTimer(w, h).value() == now + 60ms);
    }
    // latest handle keeps the later time
    {
        evt::TimerQueue timers;
        const TimerHandle h(1, false);
        timers.Request(w, h, now + 100ms);
        timers.Request(w, h, now + 60ms);
        TEST_REQUIRE(timers.GetNumTimers() == 1);
        TEST_REQUIRE(timers.FindTimer(w, h).value() == now + 100ms);
        timers.Request(w, h, now + 150ms);
        TEST_REQUIRE(timers.FindTimer(w, h).value() == now + 150ms);
    }
    // different handles and ids are separate timers
    {
        evt::TimerQueue timers;
        timers.Request(w, TimerHandle(1, true), now + 10ms);
        timers.Request(w, TimerHandle(2, true), now + 10ms);
        timers.Request(Id::FromPath({0}), TimerHandle(1, true), now + 10ms);
        TEST_REQUIRE(timers.GetNumTimers() == 3);
        TEST_REQUIRE(!timers.FindTimer(w, TimerHandle(3, true)).has_value());
    }
}

void unit_test_timer_expiry()
{
    TEST_CASE(test::Type::Feature)

    const auto now = evt::Clock::now();
    const auto a = Id::FromPath({0});
    const auto b = Id::FromPath({1});
    const auto c = Id::FromPath({2});

    evt::TimerQueue timers;
    TEST_REQUIRE(!timers.GetNextResume().has_value());
    TEST_REQUIRE(timers.IsEmpty());

    timers.Request(a, TimerHandle(1, true), now + 30ms);
    timers.Request(b, TimerHandle(1, true), now + 10ms);
    timers.Request(c, TimerHandle(1, true), now + 10ms);
    TEST_REQUIRE(timers.GetNextResume().value() == now + 10ms);

    TEST_REQUIRE(timers.TakeExpired(now).empty());

    // same expiry time keeps the request order
    auto expired = timers.TakeExpired(now + 20ms);
    TEST_REQUIRE(expired.size() == 2);
    TEST_REQUIRE(expired[0].id == b);
    TEST_REQUIRE(expired[1].id == c);
    TEST_REQUIRE(timers.GetNextResume().value() == now + 30ms);

    expired = timers.TakeExpired(now + 30ms);
    TEST_REQUIRE(expired.size() == 1);
    TEST_REQUIRE(expired[0].id == a);
    TEST_REQUIRE(expired[0].handle == TimerHandle(1, true));
    TEST_REQUIRE(timers.IsEmpty());

    // zero delay fires on the next drain
    timers.Request(a, TimerHandle(5, true), now);
    TEST_REQUIRE(timers.GetNumTimers() == 1);
    TEST_REQUIRE(timers.TakeExpired(now).size() == 1);
}

void unit_test_timer_frame()
{
    TEST_CASE(test::Type::Feature)

    evt::TimerQueue timers;
    timers.RequestFrame(Id::FromPath({1}), TimerHandle(1, true));
    timers.RequestFrame(Id::FromPath({1}), TimerHandle(1, true));
    timers.RequestFrame(Id::FromPath({0}), TimerHandle(1, true));
    TEST_REQUIRE(timers.HasFrameTimers());
    TEST_REQUIRE(!timers.GetNextResume().has_value());

    const auto frame = timers.TakeFrameTimers();
    TEST_REQUIRE(frame.size() == 2);
    TEST_REQUIRE(frame[0].id == Id::FromPath({0}));
    TEST_REQUIRE(frame[1].id == Id::FromPath({1}));
    TEST_REQUIRE(!timers.HasFrameTimers());
    TEST_REQUIRE(timers.IsEmpty());

    // a latest-flagged handle is logged but still kept
    timers.RequestFrame(Id::FromPath({2}), TimerHandle(7, false));
    TEST_REQUIRE(timers.HasFrameTimers());
    const auto late = timers.TakeFrameTimers();
    TEST_REQUIRE(late.size() == 1);
    TEST_REQUIRE(late[0].id == Id::FromPath({2}));
    TEST_REQUIRE(late[0].handle == TimerHandle(7, false));
}

EXPORT_TEST_MAIN(
int test_main(int argc, char* argv[])
{
    test::TestLogger logger("unit_test_timer.log");

    unit_test_timer_merge();
    unit_test_timer_expiry();
    unit_test_timer_frame();
    return 0;
}
) // TEST_MAIN
