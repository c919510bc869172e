#include "stream/pending_request_set.hpp"
#include <catch2/catch.hpp>
#include <vector>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace playcache::stream::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TEST_CASE("pending_request_set") {
    PendingRequestSet set;
    REQUIRE(set.empty());

    auto first = set.insert(0, 100, RangeCallbacks(), true);
    auto second = set.insert(100, 50, RangeCallbacks(), false);
    REQUIRE(first != 0);
    REQUIRE(second != first);
    REQUIRE(set.size() == 2);
    REQUIRE(set.contains(first));

    auto request = set.find(second);
    REQUIRE(request);
    REQUIRE(request->requestedOffset == 100);
    REQUIRE(request->currentOffset == 100);
    REQUIRE(request->end() == 150);
    REQUIRE(request->remaining() == 50);
    REQUIRE(!request->wantsMetadata);

    REQUIRE(set.remove(first));
    REQUIRE(!set.remove(first));
    REQUIRE(!set.contains(first));
    REQUIRE(!set.find(first));
    REQUIRE(set.size() == 1);

    set.clear();
    REQUIRE(set.empty());
    REQUIRE(!set.remove(12345));
}
//---------------------------------------------------------------------------
TEST_CASE("pending_request_set_sweep") {
    PendingRequestSet set;
    auto small = set.insert(0, 10, RangeCallbacks(), true);
    auto large = set.insert(0, 1000, RangeCallbacks(), true);

    auto step = [](RangeRequest& request) {
        // 100 bytes are available
        auto available = min<uint64_t>(100, request.end());
        if (available > request.currentOffset)
            request.currentOffset = available;
        if (request.satisfied())
            request.finished = true;
    };
    REQUIRE(set.sweep(step) == 1);
    REQUIRE(!set.contains(small));
    REQUIRE(set.contains(large));
    REQUIRE(set.find(large)->currentOffset == 100);

    // Nothing new, nothing changes
    REQUIRE(set.sweep(step) == 0);
    REQUIRE(set.size() == 1);
    REQUIRE(set.find(large)->currentOffset == 100);
}
//---------------------------------------------------------------------------
TEST_CASE("pending_request_set_reentrant") {
    PendingRequestSet set;
    vector<RequestHandle> visited;
    auto first = set.insert(0, 10, RangeCallbacks(), true);
    auto second = set.insert(10, 10, RangeCallbacks(), true);
    RequestHandle added = 0;

    set.sweep([&](RangeRequest& request) {
        visited.push_back(request.handle);
        if (request.handle == first) {
            // Cancelled while the sweep runs, it is skipped
            REQUIRE(set.remove(second));
            REQUIRE(!set.contains(second));
            // Registered while the sweep runs, it waits for the next sweep
            added = set.insert(20, 10, RangeCallbacks(), true);
            request.finished = true;
        }
    });
    REQUIRE(visited == vector<RequestHandle>{first});
    REQUIRE(set.size() == 1);
    REQUIRE(set.contains(added));

    visited.clear();
    set.sweep([&](RangeRequest& request) {
        visited.push_back(request.handle);
        // A nested sweep sees the same request
        set.sweep([](RangeRequest& inner) { inner.finished = true; });
        REQUIRE(!request.pending());
    });
    REQUIRE(visited == vector<RequestHandle>{added});
    REQUIRE(set.empty());
}
//---------------------------------------------------------------------------
} // namespace playcache::stream::test
