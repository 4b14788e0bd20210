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

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "base/test_minimal.h"
#include "base/test_help.h"
#include "base/threadpool.h"
#include "base/logging.h"

namespace {
class CountTask : public base::ThreadTask
{
public:
    explicit CountTask(std::atomic_int& counter, unsigned wait_ms = 1) noexcept
      : mCounter(counter)
      , mWait(wait_ms)
    {}
    std::thread::id GetThread() const
    { return mThread; }
protected:
    void DoTask() override
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(mWait));
        mThread = std::this_thread::get_id();
        mCounter++;
    }
private:
    std::atomic_int& mCounter;
    const unsigned mWait = 0;
    std::thread::id mThread;
};

class FailTask : public base::ThreadTask
{
protected:
    void DoTask() override
    {
        throw std::runtime_error("task failed");
    }
};

} // namespace

void unit_test_pool()
{
    TEST_CASE(test::Type::Feature)

    std::atomic_int counter {0};

    base::ThreadPool threads;
    threads.AddRealThread(base::ThreadPool::Worker0ThreadID);
    threads.AddRealThread(base::ThreadPool::Worker1ThreadID);
    threads.AddRealThread(base::ThreadPool::Worker2ThreadID);
    threads.AddMainThread();
    TEST_REQUIRE(threads.HasThread(base::ThreadPool::MainThreadID));
    TEST_REQUIRE(threads.HasThread(base::ThreadPool::Worker2ThreadID));
    TEST_REQUIRE(!threads.HasThread(base::ThreadPool::Worker3ThreadID));

    const size_t ThreadIds[] = {
        base::ThreadPool::MainThreadID,
        base::ThreadPool::AnyWorkerThreadID
    };

    for (int i=0; i<200; ++i)
    {
        const auto threadId = ThreadIds[i % 2];

        auto handle = threads.SubmitTask(std::make_unique<CountTask>(counter), threadId);
        handle.Wait(base::TaskHandle::WaitStrategy::Sleep);
        TEST_REQUIRE(handle.IsComplete());
        TEST_REQUIRE(handle.GetTask());
        TEST_REQUIRE(!handle.GetTask()->Failed());

        threads.ExecuteMainThread();
    }
    threads.WaitAll();
    TEST_REQUIRE(!threads.HasPendingTasks());
    TEST_REQUIRE(counter == 200);

    threads.Shutdown();
}

void unit_test_pool_threads()
{
    TEST_CASE(test::Type::Feature)

    std::atomic_int counter {0};

    base::ThreadPool threads;
    threads.AddRealThread(base::ThreadPool::Worker0ThreadID);
    threads.AddMainThread();

    // main thread tasks run only when the main thread says so.
    auto main = threads.SubmitTask(std::make_unique<CountTask>(counter, 0), base::ThreadPool::MainThreadID);
    TEST_REQUIRE(!main.IsComplete());
    TEST_REQUIRE(main.GetTask() == nullptr);
    TEST_REQUIRE(threads.HasPendingTasks());
    threads.ExecuteMainThread();
    TEST_REQUIRE(main.IsComplete());
    TEST_REQUIRE(static_cast<const CountTask*>(main.GetTask())->GetThread() == std::this_thread::get_id());
    TEST_REQUIRE(!threads.HasPendingTasks());

    std::vector<base::TaskHandle> handles;
    for (int i=0; i<10; ++i)
        handles.push_back(threads.SubmitTask(std::make_unique<CountTask>(counter, 2)));
    threads.WaitAll();
    TEST_REQUIRE(counter == 11);

    const auto worker = static_cast<const CountTask*>(handles[0].GetTask())->GetThread();
    TEST_REQUIRE(worker != std::this_thread::get_id());
    for (const auto& handle : handles)
    {
        TEST_REQUIRE(handle.IsComplete());
        TEST_REQUIRE(static_cast<const CountTask*>(handle.GetTask())->GetThread() == worker);
    }

    threads.Shutdown();
    TEST_REQUIRE(!threads.HasThread(base::ThreadPool::Worker0ThreadID));
}

void unit_test_pool_task_error()
{
    TEST_CASE(test::Type::Feature)

    base::ThreadPool threads;
    threads.AddRealThread(base::ThreadPool::Worker0ThreadID);

    auto task = std::make_unique<FailTask>();
    task->SetTaskName("fail");
    task->SetTaskDescription("always throws");

    auto handle = threads.SubmitTask(std::move(task));
    handle.Wait(base::TaskHandle::WaitStrategy::BusyLoop);
    TEST_REQUIRE(handle.IsComplete());
    TEST_REQUIRE(handle.GetTaskName() == "fail");

    const auto* failed = handle.GetTask();
    TEST_REQUIRE(failed->Failed());
    TEST_REQUIRE(failed->HasException());
    TEST_REQUIRE(failed->GetErrorString() == "task failed");
    TEST_REQUIRE(failed->GetTaskDescription() == "always throws");
    TEST_EXCEPTION(failed->RethrowException());

    threads.Shutdown();
}

EXPORT_TEST_MAIN(
int test_main(int argc, char* argv[])
{
    test::TestLogger logger("unit_test_thread_pool.log");

    unit_test_pool();
    unit_test_pool_threads();
    unit_test_pool_task_error();
    return 0;
}
) // TEST_MAIN
