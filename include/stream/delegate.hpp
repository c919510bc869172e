#pragma once
#include "stream/error.hpp"
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
/// The notifications of an engine, every callback is optional and runs on
/// the owner context. Expected sizes are -1 while unknown.
struct Delegate {
    /// Bytes received so far, once per received chunk
    std::function<void(int64_t bytesDownloaded, int64_t bytesExpected)> onProgress;
    /// Memory mode: the complete resource arrived
    std::function<void(std::span<const uint8_t> payload)> onDownloadFinished;
    /// Disk mode: the disk cache holds the complete resource
    std::function<void(int64_t bytesCached)> onCachingFinished;
    /// Enough data for playback is available
    std::function<void()> onReadyToPlay;
    /// The player ran out of data
    std::function<void()> onPlaybackStalled;
    /// The download failed, reported at most once
    std::function<void(const Error& error)> onDownloadFailed;
    /// Disk mode: bytes durably cached so far
    std::function<void(int64_t bytesCached, int64_t bytesExpected)> onCachingProgress;
    /// Disk mode: a range [startByte, endByte) is read back from the cache
    std::function<void(uint64_t startByte, uint64_t endByte)> onStreamingDataRequest;
};
//---------------------------------------------------------------------------
} // namespace playcache::stream
