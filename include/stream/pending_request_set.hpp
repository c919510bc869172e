#pragma once
#include "stream/range_request.hpp"
#include <cstdint>
#include <map>
#include <vector>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace playcache::stream {
//---------------------------------------------------------------------------
/// The unresolved range requests of an engine. Consumer callbacks run inside
/// a sweep and may register or cancel requests; removals are deferred until
/// the outermost sweep ends, so a request is never destroyed while one of its
/// callbacks runs.
class PendingRequestSet {
    /// The requests
    std::map<RequestHandle, RangeRequest> _requests;
    /// The next handle
    RequestHandle _nextHandle;
    /// The nesting depth of running sweeps
    uint32_t _sweepDepth;

    public:
    /// The constructor
    PendingRequestSet();

    /// Register a request
    RequestHandle insert(uint64_t offset, uint64_t length, RangeCallbacks callbacks, bool wantsMetadata);
    /// Cancel a request, false if it is not pending
    bool remove(RequestHandle handle);
    /// Drop all pending requests unresolved
    void clear();
    /// Get a pending request, nullptr if not pending
    [[nodiscard]] RangeRequest* find(RequestHandle handle);
    /// Is the request pending
    [[nodiscard]] bool contains(RequestHandle handle) const;
    /// The number of pending requests
    [[nodiscard]] uint64_t size() const;
    /// Are there no pending requests
    [[nodiscard]] bool empty() const { return !size(); }

    /// Visit every pending request
    template <typename F>
    void forEach(F&& func) {
        for (auto& entry : _requests)
            if (entry.second.pending())
                func(entry.second);
    }

    /// Run step on every request pending at the start, returns the number of finished requests
    template <typename Step>
    uint64_t sweep(Step&& step) {
        std::vector<RequestHandle> handles;
        handles.reserve(_requests.size());
        for (auto& entry : _requests)
            if (entry.second.pending())
                handles.push_back(entry.first);

        SweepGuard guard(*this);
        uint64_t finished = 0;
        for (auto handle : handles) {
            auto it = _requests.find(handle);
            if (it == _requests.end() || !it->second.pending())
                continue;
            step(it->second);
            if (it->second.finished)
                finished++;
        }
        return finished;
    }

    private:
    /// Tracks the sweep nesting and purges resolved requests at the end
    struct SweepGuard {
        /// The set
        PendingRequestSet& set;
        /// The constructor
        explicit SweepGuard(PendingRequestSet& set) : set(set) { set._sweepDepth++; }
        /// The destructor
        ~SweepGuard() {
            if (!--set._sweepDepth)
                set.purge();
        }
    };

    /// Erase the resolved requests
    void purge();
};
//---------------------------------------------------------------------------
} // namespace playcache::stream
