#include "stream/byte_store.hpp"
#include "stream/error.hpp"
#include <stdexcept>
#include <string>
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
MemoryStore::MemoryStore() : _buffer(), _payload()
// The constructor
{
}
//---------------------------------------------------------------------------
MemoryStore::MemoryStore(shared_ptr<const utils::DataVector<uint8_t>> payload) : _buffer(), _payload(move(payload))
// The constructor serving a payload
{
}
//---------------------------------------------------------------------------
void MemoryStore::append(const uint8_t* data, uint64_t length)
// Append received bytes
{
    if (_payload)
        throw logic_error("MemoryStore: a payload is immutable");
    _buffer.append(data, length);
}
//---------------------------------------------------------------------------
void MemoryStore::reserve(uint64_t length)
// Reserve space
{
    if (!_payload)
        _buffer.reserve(length);
}
//---------------------------------------------------------------------------
span<const uint8_t> MemoryStore::read(uint64_t start, uint64_t length) const
// Read a range
{
    auto available = bytesAvailable();
    if (start > available || length > available - start)
        throw OutOfRangeError("MemoryStore: read [" + to_string(start) + ", " + to_string(start + length) + ") past " + to_string(available) + " available bytes");
    if (!length)
        return {};
    return payload().subspan(start, length);
}
//---------------------------------------------------------------------------
uint64_t MemoryStore::bytesAvailable() const
// The contiguous bytes received
{
    return _payload ? _payload->size() : _buffer.size();
}
//---------------------------------------------------------------------------
span<const uint8_t> MemoryStore::payload() const
// All available bytes
{
    if (_payload)
        return span<const uint8_t>(_payload->cdata(), _payload->size());
    return span<const uint8_t>(_buffer.cdata(), _buffer.size());
}
//---------------------------------------------------------------------------
DiskStore::DiskStore(DiskCache& cache, uint64_t maxBufferSize) : _cache(cache), _maxBufferSize(maxBufferSize), _bytesDownloaded(0), _bytesCached(0), _bytesExpected(-1)
// The constructor
{
    if (!_maxBufferSize)
        throw invalid_argument("DiskStore: maxBufferSize needs to be positive");
}
//---------------------------------------------------------------------------
void DiskStore::append(shared_ptr<const utils::DataVector<uint8_t>> chunk, DiskCache::CachedCallback onCached, DiskCache::FailedCallback onFailed)
// Hand a received chunk to the disk cache
{
    _bytesDownloaded += chunk->size();
    _cache.cache(move(chunk), _bytesDownloaded, _bytesExpected, move(onCached), move(onFailed));
}
//---------------------------------------------------------------------------
bool DiskStore::recordCached(uint64_t length)
// A chunk was cached
{
    if (length > _bytesDownloaded - _bytesCached)
        return false;
    _bytesCached += length;
    return true;
}
//---------------------------------------------------------------------------
unique_ptr<utils::DataVector<uint8_t>> DiskStore::read(uint64_t start, uint64_t length) const
// Read a range back
{
    if (start > _bytesCached || length > _bytesCached - start)
        throw OutOfRangeError("DiskStore: read [" + to_string(start) + ", " + to_string(start + length) + ") past " + to_string(_bytesCached) + " cached bytes");
    if (length > _maxBufferSize)
        length = _maxBufferSize;
    auto data = _cache.read(start, start + length);
    // A short read counts as no data
    if (!data || data->size() != length)
        return nullptr;
    return data;
}
//---------------------------------------------------------------------------
bool DiskStore::cachingComplete() const
// Does the cache hold the whole resource
{
    return _bytesExpected >= 0 && _bytesCached == _bytesDownloaded && _bytesDownloaded == static_cast<uint64_t>(_bytesExpected);
}
//---------------------------------------------------------------------------
uint64_t ByteStore::bytesAvailable() const
// The contiguous bytes received
{
    return isDisk() ? disk().bytesAvailable() : memory().bytesAvailable();
}
//---------------------------------------------------------------------------
uint64_t ByteStore::bytesReadable() const
// The bytes a request can be served from
{
    return isDisk() ? disk().bytesCachedSoFar() : memory().bytesAvailable();
}
//---------------------------------------------------------------------------
} // namespace playcache::stream
