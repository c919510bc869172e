#pragma once
#include "stream/disk_cache.hpp"
#include "utils/data_vector.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <utility>
#include <variant>
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
/// The memory buffering, the whole resource accumulates in memory
class MemoryStore {
    /// The received bytes
    utils::DataVector<uint8_t> _buffer;
    /// The pre-supplied payload, replaces the buffer
    std::shared_ptr<const utils::DataVector<uint8_t>> _payload;

    public:
    /// The constructor
    MemoryStore();
    /// The constructor serving a payload
    explicit MemoryStore(std::shared_ptr<const utils::DataVector<uint8_t>> payload);

    /// Append received bytes
    void append(const uint8_t* data, uint64_t length);
    /// Reserve space for the expected length
    void reserve(uint64_t length);
    /// Read [start, start + length), throws OutOfRangeError past the available bytes
    [[nodiscard]] std::span<const uint8_t> read(uint64_t start, uint64_t length) const;
    /// The contiguous bytes received
    [[nodiscard]] uint64_t bytesAvailable() const;
    /// All available bytes
    [[nodiscard]] std::span<const uint8_t> payload() const;
};
//---------------------------------------------------------------------------
/// The disk buffering, chunks are handed to the disk cache and read back in bounded windows
class DiskStore {
    /// The disk cache
    DiskCache& _cache;
    /// The read window
    uint64_t _maxBufferSize;
    /// The bytes received
    uint64_t _bytesDownloaded;
    /// The bytes durably cached
    uint64_t _bytesCached;
    /// The expected total, -1 while unknown
    int64_t _bytesExpected;

    public:
    /// The constructor
    DiskStore(DiskCache& cache, uint64_t maxBufferSize);

    /// Hand a received chunk to the disk cache
    void append(std::shared_ptr<const utils::DataVector<uint8_t>> chunk, DiskCache::CachedCallback onCached, DiskCache::FailedCallback onFailed);
    /// A chunk of length bytes was cached, false if more than downloaded
    [[nodiscard]] bool recordCached(uint64_t length);
    /// Read [start, start + length) back, at most maxBufferSize; nullptr if the cache has no data
    [[nodiscard]] std::unique_ptr<utils::DataVector<uint8_t>> read(uint64_t start, uint64_t length) const;
    /// Set the expected total
    void setBytesExpected(int64_t bytesExpected) { _bytesExpected = bytesExpected; }

    /// The contiguous bytes received
    [[nodiscard]] uint64_t bytesAvailable() const { return _bytesDownloaded; }
    /// The bytes durably cached
    [[nodiscard]] uint64_t bytesCachedSoFar() const { return _bytesCached; }
    /// The expected total, -1 while unknown
    [[nodiscard]] int64_t bytesExpected() const { return _bytesExpected; }
    /// The read window
    [[nodiscard]] uint64_t maxBufferSize() const { return _maxBufferSize; }
    /// Does the cache hold the whole resource
    [[nodiscard]] bool cachingComplete() const;
};
//---------------------------------------------------------------------------
/// The buffering strategy of an engine, selected at construction
class ByteStore {
    /// The store
    std::variant<MemoryStore, DiskStore> _store;

    public:
    /// The constructor for memory mode
    explicit ByteStore(MemoryStore store) : _store(std::move(store)) {}
    /// The constructor for disk mode
    explicit ByteStore(DiskStore store) : _store(std::move(store)) {}

    /// Is it the disk mode
    [[nodiscard]] bool isDisk() const { return std::holds_alternative<DiskStore>(_store); }
    /// Get the memory store, throws bad_variant_access in disk mode
    [[nodiscard]] MemoryStore& memory() { return std::get<MemoryStore>(_store); }
    /// Get the memory store
    [[nodiscard]] const MemoryStore& memory() const { return std::get<MemoryStore>(_store); }
    /// Get the disk store, throws bad_variant_access in memory mode
    [[nodiscard]] DiskStore& disk() { return std::get<DiskStore>(_store); }
    /// Get the disk store
    [[nodiscard]] const DiskStore& disk() const { return std::get<DiskStore>(_store); }

    /// The contiguous bytes received
    [[nodiscard]] uint64_t bytesAvailable() const;
    /// The bytes a request can be served from
    [[nodiscard]] uint64_t bytesReadable() const;
};
//---------------------------------------------------------------------------
} // namespace playcache::stream
