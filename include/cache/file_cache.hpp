#pragma once
#include "stream/disk_cache.hpp"
#include "utils/work_queue.hpp"
#include <atomic>
#include <cstdint>
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
namespace playcache::cache {
//---------------------------------------------------------------------------
/// A disk cache backed by a single file. Chunks are written in order on a
/// dedicated writer thread; reads are served from the written prefix.
class FileCache : public stream::DiskCache {
    /// The path
    std::string _path;
    /// The file descriptor
    int32_t _fd;
    /// The bytes written so far
    std::atomic<uint64_t> _written;
    /// The writer
    utils::WorkQueue _writer;

    public:
    /// The constructor, throws runtime_error if the file cannot be opened
    explicit FileCache(std::string path, bool truncate = true);
    /// The destructor, finishes the queued writes
    ~FileCache() override;
    /// No copies
    FileCache(const FileCache&) = delete;
    /// No copies
    FileCache& operator=(const FileCache&) = delete;

    /// Store a chunk, it ends at bytesDownloadedSoFar
    void cache(std::shared_ptr<const utils::DataVector<uint8_t>> chunk, uint64_t bytesDownloadedSoFar, int64_t bytesExpected, CachedCallback onCached, FailedCallback onFailed) override;
    /// Read [startByte, endByte), nullptr if not yet written
    [[nodiscard]] std::unique_ptr<utils::DataVector<uint8_t>> read(uint64_t startByte, uint64_t endByte) override;

    /// Get the path
    [[nodiscard]] const std::string& getPath() const { return _path; }
    /// The bytes written so far
    [[nodiscard]] uint64_t getWrittenBytes() const { return _written.load(); }

    /// The cache file of a location inside directory
    [[nodiscard]] static std::string pathFor(const std::string& directory, const std::string& location);
};
//---------------------------------------------------------------------------
} // namespace playcache::cache
