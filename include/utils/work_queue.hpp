#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace playcache::utils {
//---------------------------------------------------------------------------
/// A serialized task queue. Tasks run strictly in posting order, either on
/// the thread that calls drain / runFor, or on a dedicated worker thread
/// after start. Posting is thread-safe; executing tasks concurrently from
/// both modes is not allowed.
class WorkQueue {
    public:
    /// The task type
    using Task = std::function<void()>;

    private:
    /// The queued tasks
    std::deque<Task> _tasks;
    /// The mutex protecting the tasks
    mutable std::mutex _mutex;
    /// The condition variable signalling new tasks
    std::condition_variable _cv;
    /// The worker thread
    std::thread _thread;
    /// Stop flag of the worker
    bool _stop;

    public:
    /// The constructor
    WorkQueue();
    /// The destructor, stops the worker
    ~WorkQueue();
    /// No copies
    WorkQueue(const WorkQueue&) = delete;
    /// No copies
    WorkQueue& operator=(const WorkQueue&) = delete;

    /// Post a task
    void post(Task task);
    /// Run queued tasks until the queue is empty, including tasks posted meanwhile
    uint64_t drain();
    /// Wait up to timeout for work, then drain
    uint64_t runFor(std::chrono::milliseconds timeout);
    /// Start the dedicated worker thread
    void start();
    /// Stop the worker after the already queued tasks ran
    void stop();
    /// Is the queue empty
    [[nodiscard]] bool empty() const;
    /// Is a worker thread running
    [[nodiscard]] bool running() const { return _thread.joinable(); }

    private:
    /// The worker loop
    void run();
};
//---------------------------------------------------------------------------
} // namespace playcache::utils
