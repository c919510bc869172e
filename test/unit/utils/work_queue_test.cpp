#include "utils/work_queue.hpp"
#include <catch2/catch.hpp>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace playcache::utils::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TEST_CASE("work_queue_drain") {
    WorkQueue queue;
    vector<int> order;
    queue.post([&order]() { order.push_back(1); });
    queue.post([&order, &queue]() {
        order.push_back(2);
        // Posted while draining, runs in the same drain
        queue.post([&order]() { order.push_back(3); });
    });
    REQUIRE(!queue.empty());
    REQUIRE(queue.drain() == 3);
    REQUIRE(order == vector<int>{1, 2, 3});
    REQUIRE(queue.empty());
    REQUIRE(queue.drain() == 0);
}
//---------------------------------------------------------------------------
TEST_CASE("work_queue_cross_thread") {
    WorkQueue queue;
    atomic<uint64_t> counter = 0;
    thread producer([&queue, &counter]() {
        for (auto i = 0; i < 100; i++)
            queue.post([&counter]() { counter++; });
    });
    producer.join();
    REQUIRE(queue.runFor(chrono::milliseconds(10)) == 100);
    REQUIRE(counter.load() == 100);
}
//---------------------------------------------------------------------------
TEST_CASE("work_queue_worker") {
    atomic<uint64_t> counter = 0;
    {
        WorkQueue queue;
        queue.start();
        REQUIRE(queue.running());
        for (auto i = 0; i < 50; i++)
            queue.post([&counter]() { counter++; });
        // Stopping runs the queued tasks first
        queue.stop();
        REQUIRE(!queue.running());
    }
    REQUIRE(counter.load() == 50);
}
//---------------------------------------------------------------------------
} // namespace playcache::utils::test
