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

#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "base/logging.h"
#include "base/threadpool.h"
#include "evtcore/id.h"
#include "evtcore/message.h"
#include "evtcore/runner.h"

namespace evt
{
    // CompletionQueue receives the results of asynchronous tasks from
    // the worker threads. The queue is drained on the UI thread during
    // the flush.
    class CompletionQueue
    {
    public:
        void Post(const Id& id, Erased message)
        {
            std::lock_guard<decltype(mMutex)> lock(mMutex);
            mMessages.emplace_back(id, std::move(message));
        }
        std::vector<std::pair<Id, Erased>> TakeAll()
        {
            std::lock_guard<decltype(mMutex)> lock(mMutex);
            std::vector<std::pair<Id, Erased>> ret;
            ret.swap(mMessages);
            return ret;
        }
        bool IsEmpty() const
        {
            std::lock_guard<decltype(mMutex)> lock(mMutex);
            return mMessages.empty();
        }
    private:
        mutable std::mutex mMutex;
        std::vector<std::pair<Id, Erased>> mMessages;
    };

    // A message that becomes available at some later point in time.
    // Polled (never waited on) during the flush.
    class PendingMessage
    {
    public:
        virtual ~PendingMessage() = default;
        // Poll the pending message. Returns true once the message is
        // complete. A completed message may still be without a value
        // if the computation failed.
        virtual bool Poll(std::optional<Erased>* out) = 0;
    };

    template<typename T>
    class FutureMessage : public PendingMessage
    {
    public:
        explicit FutureMessage(std::future<T> future)
          : mFuture(std::move(future))
        {}
        virtual bool Poll(std::optional<Erased>* out) override
        {
            if (!mFuture.valid())
                return true;
            if (mFuture.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
                return false;
            try
            {
                out->emplace(mFuture.get());
            }
            catch (const std::exception& e)
            {
                ERROR("Async message future failed. [error='%1']", e.what());
            }
            catch (...)
            {
                ERROR("Async message future failed with a non-standard exception.");
            }
            return true;
        }
    private:
        std::future<T> mFuture;
    };

    // A thread pool task computing a message. The result is posted
    // to the completion queue and the event loop is woken up.
    template<typename T>
    class MessageTask : public base::ThreadTask
    {
    public:
        MessageTask(std::function<T ()> func, const Id& id,
                    std::shared_ptr<CompletionQueue> queue,
                    std::shared_ptr<Waker> waker)
          : mFunc(std::move(func))
          , mId(id)
          , mQueue(std::move(queue))
          , mWaker(std::move(waker))
        {}
    protected:
        virtual void DoTask() override
        {
            T result = mFunc();
            mQueue->Post(mId, Erased(std::move(result)));
            if (mWaker)
                mWaker->Wake();
        }
    private:
        std::function<T ()> mFunc;
        const Id mId;
        std::shared_ptr<CompletionQueue> mQueue;
        std::shared_ptr<Waker> mWaker;
    };

} // namespace
