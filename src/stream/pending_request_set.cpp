#include "stream/pending_request_set.hpp"
#include <utility>
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
using namespace std;
//---------------------------------------------------------------------------
PendingRequestSet::PendingRequestSet() : _requests(), _nextHandle(1), _sweepDepth(0)
// The constructor
{
}
//---------------------------------------------------------------------------
RequestHandle PendingRequestSet::insert(uint64_t offset, uint64_t length, RangeCallbacks callbacks, bool wantsMetadata)
// Register a request
{
    auto handle = _nextHandle++;
    RangeRequest request;
    request.handle = handle;
    request.requestedOffset = offset;
    request.requestedLength = length;
    request.currentOffset = offset;
    request.wantsMetadata = wantsMetadata;
    request.callbacks = move(callbacks);
    _requests.emplace(handle, move(request));
    return handle;
}
//---------------------------------------------------------------------------
bool PendingRequestSet::remove(RequestHandle handle)
// Cancel a request
{
    auto it = _requests.find(handle);
    if (it == _requests.end() || !it->second.pending())
        return false;
    if (_sweepDepth)
        it->second.cancelled = true;
    else
        _requests.erase(it);
    return true;
}
//---------------------------------------------------------------------------
void PendingRequestSet::clear()
// Drop all pending requests
{
    if (_sweepDepth) {
        for (auto& entry : _requests)
            if (entry.second.pending())
                entry.second.cancelled = true;
    } else {
        _requests.clear();
    }
}
//---------------------------------------------------------------------------
RangeRequest* PendingRequestSet::find(RequestHandle handle)
// Get a pending request
{
    auto it = _requests.find(handle);
    if (it == _requests.end() || !it->second.pending())
        return nullptr;
    return &it->second;
}
//---------------------------------------------------------------------------
bool PendingRequestSet::contains(RequestHandle handle) const
// Is the request pending
{
    auto it = _requests.find(handle);
    return it != _requests.end() && it->second.pending();
}
//---------------------------------------------------------------------------
uint64_t PendingRequestSet::size() const
// The number of pending requests
{
    uint64_t count = 0;
    for (auto& entry : _requests)
        if (entry.second.pending())
            count++;
    return count;
}
//---------------------------------------------------------------------------
void PendingRequestSet::purge()
// Erase the resolved requests
{
    erase_if(_requests, [](const auto& entry) { return !entry.second.pending(); });
}
//---------------------------------------------------------------------------
} // namespace playcache::stream
