#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace playcache {
//---------------------------------------------------------------------------
namespace utils {
template <typename T>
class DataVector;
}
//---------------------------------------------------------------------------
namespace stream {
//---------------------------------------------------------------------------
/// The storage collaborator of the disk mode. The callbacks may be invoked
/// from any thread; the engine marshals them onto its owner context.
class DiskCache {
    public:
    /// Chunk durably stored
    using CachedCallback = std::function<void()>;
    /// Chunk could not be stored
    using FailedCallback = std::function<void(const std::string& reason)>;

    /// The destructor
    virtual ~DiskCache() = default;
    /// Store a chunk, it ends at bytesDownloadedSoFar; bytesExpected is -1 while unknown
    virtual void cache(std::shared_ptr<const utils::DataVector<uint8_t>> chunk, uint64_t bytesDownloadedSoFar, int64_t bytesExpected, CachedCallback onCached, FailedCallback onFailed) = 0;
    /// Read [startByte, endByte), nullptr if the range is not available
    [[nodiscard]] virtual std::unique_ptr<utils::DataVector<uint8_t>> read(uint64_t startByte, uint64_t endByte) = 0;
};
//---------------------------------------------------------------------------
} // namespace stream
} // namespace playcache
