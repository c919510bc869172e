#include "utils/work_queue.hpp"
#include <utility>
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
using namespace std;
//---------------------------------------------------------------------------
WorkQueue::WorkQueue() : _tasks(), _mutex(), _cv(), _thread(), _stop(false)
// The constructor
{
}
//---------------------------------------------------------------------------
WorkQueue::~WorkQueue()
// The destructor
{
    stop();
}
//---------------------------------------------------------------------------
void WorkQueue::post(Task task)
// Post a task
{
    {
        unique_lock lock(_mutex);
        _tasks.push_back(move(task));
    }
    _cv.notify_one();
}
//---------------------------------------------------------------------------
uint64_t WorkQueue::drain()
// Run the queued tasks on the calling thread
{
    uint64_t executed = 0;
    while (true) {
        Task task;
        {
            unique_lock lock(_mutex);
            if (_tasks.empty())
                break;
            task = move(_tasks.front());
            _tasks.pop_front();
        }
        task();
        executed++;
    }
    return executed;
}
//---------------------------------------------------------------------------
uint64_t WorkQueue::runFor(chrono::milliseconds timeout)
// Wait for work and drain it
{
    {
        unique_lock lock(_mutex);
        _cv.wait_for(lock, timeout, [this] { return !_tasks.empty(); });
    }
    return drain();
}
//---------------------------------------------------------------------------
void WorkQueue::start()
// Start the worker
{
    if (_thread.joinable())
        return;
    {
        unique_lock lock(_mutex);
        _stop = false;
    }
    _thread = thread(&WorkQueue::run, this);
}
//---------------------------------------------------------------------------
void WorkQueue::stop()
// Stop the worker
{
    if (!_thread.joinable())
        return;
    {
        unique_lock lock(_mutex);
        _stop = true;
    }
    _cv.notify_all();
    if (_thread.get_id() == this_thread::get_id()) {
        // Stopped from one of its own tasks, the loop exits after the current task
        _thread.detach();
    } else {
        _thread.join();
    }
}
//---------------------------------------------------------------------------
bool WorkQueue::empty() const
// Is the queue empty
{
    unique_lock lock(_mutex);
    return _tasks.empty();
}
//---------------------------------------------------------------------------
void WorkQueue::run()
// The worker loop
{
    while (true) {
        Task task;
        {
            unique_lock lock(_mutex);
            _cv.wait(lock, [this] { return _stop || !_tasks.empty(); });
            if (_tasks.empty())
                return;
            task = move(_tasks.front());
            _tasks.pop_front();
        }
        task();
    }
}
//---------------------------------------------------------------------------
} // namespace playcache::utils
