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
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "base/test_minimal.h"
#include "base/test_help.h"
#include "base/threadpool.h"
#include "evtcore/event_cx.h"
#include "evtcore/window.h"
#include "evtcore/unit_test/test_node.h"

using namespace evt;
using Tree = test::TestTree;

namespace {
void RecordInts(test::TestNode* node, std::vector<int>* received)
{
    node->on_messages = [received](EventCx& cx) {
        while (auto value = cx.TryPop<int>())
            received->push_back(value.value());
    };
}
} // namespace

void unit_test_future_message()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    test::TestRunner runner;
    test::TestAppData app;
    Window window(std::make_shared<WindowConfig>(), 1, runner, *tree.root, &app);
    window.FullConfigure();

    std::vector<int> received;
    RecordInts(tree.c, &received);

    std::promise<int> promise;
    EventCx cx(window.GetState(), runner, *tree.root, &app);
    cx.PushAsync(tree.c->id, promise.get_future());
    TEST_REQUIRE(window.GetState().HasPendingAsync());

    window.FlushPending();
    TEST_REQUIRE(received.empty());
    TEST_REQUIRE(window.GetState().HasPendingAsync());

    promise.set_value(123);
    window.FlushPending();
    TEST_REQUIRE(received == std::vector<int>{123});
    TEST_REQUIRE(!window.GetState().HasPendingAsync());

    // a message type nobody on the path takes ends up with the app
    std::promise<std::string> text;
    cx.PushAsync(tree.c->id, text.get_future());
    text.set_value("async text");
    window.FlushPending();
    TEST_REQUIRE(app.strings == std::vector<std::string>{"async text"});

    // failed future is dropped
    std::promise<int> broken;
    cx.PushAsync(tree.c->id, broken.get_future());
    broken.set_exception(std::make_exception_ptr(std::runtime_error("no value")));
    window.FlushPending();
    TEST_REQUIRE(received.size() == 1);
    TEST_REQUIRE(!window.GetState().HasPendingAsync());

    // so is one that throws something else than std::exception
    std::promise<int> odd;
    cx.PushAsync(tree.c->id, odd.get_future());
    odd.set_exception(std::make_exception_ptr(7));
    window.FlushPending();
    TEST_REQUIRE(received.size() == 1);
    TEST_REQUIRE(!window.GetState().HasPendingAsync());

    // the target went away before the value was ready
    std::promise<int> stale;
    cx.PushAsync(Id::FromPath({0, 7}), stale.get_future());
    stale.set_value(5);
    window.FlushPending();
    TEST_REQUIRE(received.size() == 1);
    TEST_REQUIRE(!window.GetState().HasPendingAsync());
}

void unit_test_spawn_inline()
{
    TEST_CASE(test::Type::Feature)

    Tree tree;
    test::TestRunner runner;
    test::TestAppData app;
    Window window(std::make_shared<WindowConfig>(), 1, runner, *tree.root, &app);
    window.FullConfigure();

    std::vector<int> received;
    RecordInts(tree.e, &received);

    // without a thread pool the function runs right away but the
    // result is only delivered when the window flushes.
    bool ran = false;
    EventCx cx(window.GetState(), runner, *tree.root, &app);
    cx.PushSpawn<int>(tree.e->id, [&ran]() {
        ran = true;
        return 42;
    });
    TEST_REQUIRE(ran);
    TEST_REQUIRE(received.empty());
    TEST_REQUIRE(runner.waker->wake_count == 1);
    TEST_REQUIRE(window.GetState().HasPendingAsync());

    window.FlushPending();
    TEST_REQUIRE(received == std::vector<int>{42});
    TEST_REQUIRE(!window.GetState().HasPendingAsync());

    // task that throws produces no message
    cx.PushSpawn<int>(tree.e->id, []() -> int {
        throw std::runtime_error("spawn failed");
    });
    TEST_REQUIRE(runner.waker->wake_count == 1);
    window.FlushPending();
    TEST_REQUIRE(received.size() == 1);
    TEST_REQUIRE(!window.GetState().HasPendingAsync());
}

void unit_test_spawn_thread_pool()
{
    TEST_CASE(test::Type::Feature)

    base::ThreadPool pool;
    pool.AddRealThread(base::ThreadPool::Worker0ThreadID);
    pool.AddRealThread(base::ThreadPool::Worker1ThreadID);

    Tree tree;
    test::TestRunner runner;
    runner.pool = &pool;
    test::TestAppData app;
    Window window(std::make_shared<WindowConfig>(), 1, runner, *tree.root, &app);
    window.FullConfigure();

    std::vector<int> received;
    RecordInts(tree.b, &received);

    const auto main_thread = std::this_thread::get_id();
    std::vector<std::thread::id> threads(3);

    EventCx cx(window.GetState(), runner, *tree.root, &app);
    for (int i=0; i<3; ++i)
    {
        cx.PushSpawn<int>(tree.b->id, [i, &threads]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            threads[i] = std::this_thread::get_id();
            return i + 1;
        });
    }

    const auto start = std::chrono::steady_clock::now();
    while (window.GetState().HasPendingAsync())
    {
        window.FlushPending();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        if (std::chrono::steady_clock::now() - start > std::chrono::seconds(10))
            break;
    }
    TEST_REQUIRE(!window.GetState().HasPendingAsync());
    TEST_REQUIRE(received.size() == 3);
    TEST_REQUIRE(runner.waker->wake_count == 3);
    for (auto id : threads)
        TEST_REQUIRE(id != main_thread);

    // the delivery order depends on the workers, the values don't.
    std::sort(received.begin(), received.end());
    TEST_REQUIRE(received == std::vector<int>({1, 2, 3}));

    pool.WaitAll();
    pool.Shutdown();
}

EXPORT_TEST_MAIN(
int test_main(int argc, char* argv[])
{
    test::TestLogger logger("unit_test_async.log");

    unit_test_future_message();
    unit_test_spawn_inline();
    unit_test_spawn_thread_pool();
    return 0;
}
) // TEST_MAIN
