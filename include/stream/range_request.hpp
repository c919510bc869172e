#pragma once
#include "stream/resource.hpp"
#include <cstdint>
#include <functional>
#include <span>
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
/// The handle of a registered request, 0 is never handed out
using RequestHandle = uint64_t;
//---------------------------------------------------------------------------
/// The consumer side of a range request
struct RangeCallbacks {
    /// The content metadata, delivered once if wanted
    std::function<void(const ContentMetadata& metadata)> onMetadata;
    /// The next bytes, in order and without gaps; the view is only valid during the call
    std::function<void(std::span<const uint8_t> data)> onData;
    /// All requested bytes were delivered
    std::function<void()> onFinished;
};
//---------------------------------------------------------------------------
/// A pending byte range request
struct RangeRequest {
    /// The handle
    RequestHandle handle = 0;
    /// The first requested byte
    uint64_t requestedOffset = 0;
    /// The requested length
    uint64_t requestedLength = 0;
    /// The next byte to deliver
    uint64_t currentOffset = 0;
    /// Does the consumer want the metadata
    bool wantsMetadata = false;
    /// Was the metadata delivered
    bool metadataDelivered = false;
    /// Was the request cancelled
    bool cancelled = false;
    /// Was the request finished
    bool finished = false;
    /// The consumer
    RangeCallbacks callbacks;

    /// The end of the range
    [[nodiscard]] uint64_t end() const { return requestedOffset + requestedLength; }
    /// The bytes still to deliver
    [[nodiscard]] uint64_t remaining() const { return end() - currentOffset; }
    /// Were all bytes delivered
    [[nodiscard]] bool satisfied() const { return currentOffset == end(); }
    /// Is the request still waiting
    [[nodiscard]] bool pending() const { return !cancelled && !finished; }
};
//---------------------------------------------------------------------------
} // namespace playcache::stream
