#include "stream/fulfillment_engine.hpp"
#include "network/transfer_error.hpp"
#include "network/transport.hpp"
#include "stream/disk_cache.hpp"
#include "utils/data_vector.hpp"
#include "utils/work_queue.hpp"
#include <algorithm>
#include <iostream>
#include <limits>
#include <new>
#include <stdexcept>
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
FulfillmentEngine::FulfillmentEngine(Resource resource, Config config, utils::WorkQueue& queue, network::Transport* transport, DiskCache* diskCache) : _resource(move(resource)), _config(config), _queue(queue), _transport(transport), _delegate(), _store(makeStore(_resource, _config, diskCache)), _pending(), _lifecycle(_delegate), _metadata(), _session(), _alive(make_shared<bool>(true)), _sessionsStarted(0), _transferComplete(false), _finishedNotified(false), _failed(false)
// The constructor
{
    if (!_resource.isPayload() && !_transport)
        throw invalid_argument("Engine creation error! - a remote resource needs a transport");
    _metadata = _resource.declaredMetadata();
    if (_resource.isPayload())
        _transferComplete = true;
}
//---------------------------------------------------------------------------
FulfillmentEngine::~FulfillmentEngine()
// The destructor
{
    dispose();
}
//---------------------------------------------------------------------------
ByteStore FulfillmentEngine::makeStore(const Resource& resource, const Config& config, DiskCache* diskCache)
// Create the store for the mode
{
    if (resource.isPayload()) {
        if (diskCache)
            throw invalid_argument("Engine creation error! - a payload is served from memory");
        return ByteStore(MemoryStore(resource.getPayload()));
    }
    if (diskCache)
        return ByteStore(DiskStore(*diskCache, config.maxBufferSize));
    return ByteStore(MemoryStore());
}
//---------------------------------------------------------------------------
bool FulfillmentEngine::isComplete() const
// Is the whole resource available for reading
{
    if (_store.isDisk())
        return _transferComplete && _store.disk().cachingComplete();
    return _transferComplete;
}
//---------------------------------------------------------------------------
optional<uint64_t> FulfillmentEngine::knownLength() const
// The total length once known
{
    if (_metadata && _metadata->contentLength >= 0)
        return static_cast<uint64_t>(_metadata->contentLength);
    if (_transferComplete)
        return _store.bytesAvailable();
    return nullopt;
}
//---------------------------------------------------------------------------
RequestHandle FulfillmentEngine::requestRange(uint64_t offset, uint64_t length, RangeCallbacks callbacks, bool wantsMetadata)
// Register a range request
{
    if (_lifecycle.isDisposed())
        return 0;
    // Open ended requests must not wrap around
    length = min(length, numeric_limits<uint64_t>::max() - offset);
    if (auto total = knownLength())
        length = offset >= *total ? 0 : min(length, *total - offset);
    auto handle = _pending.insert(offset, length, move(callbacks), wantsMetadata);
    ensureSession();
    sweep();
    // After a failure no further bytes arrive, the unserved rest is dropped
    if (_failed && _pending.remove(handle))
        return 0;
    return handle;
}
//---------------------------------------------------------------------------
void FulfillmentEngine::cancelRequest(RequestHandle handle)
// Cancel a request
{
    _pending.remove(handle);
}
//---------------------------------------------------------------------------
void FulfillmentEngine::startEagerTransfer()
// Start the transfer without a pending request
{
    if (_lifecycle.isDisposed())
        return;
    ensureSession();
}
//---------------------------------------------------------------------------
void FulfillmentEngine::reportReadyToPlay()
// The player reports that playback can start
{
    _lifecycle.markPlayable();
}
//---------------------------------------------------------------------------
void FulfillmentEngine::reportPlaybackStalled()
// The player ran out of data
{
    _lifecycle.reportStalled();
}
//---------------------------------------------------------------------------
void FulfillmentEngine::dispose()
// Stop the transfer and drop all requests
{
    auto incomplete = _store.isDisk() && _session && !_failed && !isComplete();
    if (!_lifecycle.dispose())
        return;
    if (_session)
        _session->cancel();
    _pending.clear();
    // Disk cache acknowledgements still in flight are dropped
    _alive.reset();
    if (incomplete) {
        auto& disk = _store.disk();
        fail(ErrorKind::DisposedWhileIncomplete, "Disposed after caching " + to_string(disk.bytesCachedSoFar()) + " of " + (disk.bytesExpected() < 0 ? string("unknown") : to_string(disk.bytesExpected())) + " bytes");
    }
}
//---------------------------------------------------------------------------
void FulfillmentEngine::ensureSession()
// Start the session unless one exists
{
    if (_session || _resource.isPayload() || _failed)
        return;
    _session = make_unique<TransferSession>(*this, _queue, *_transport, _resource.getLocation());
    _sessionsStarted++;
    try {
        _session->start();
    } catch (const exception& e) {
        fail(ErrorKind::TransportFailure, e.what());
    }
}
//---------------------------------------------------------------------------
void FulfillmentEngine::sweep()
// Serve all pending requests
{
    // Nothing is delivered before the metadata
    if (!_metadata)
        return;
    _pending.sweep([this](RangeRequest& request) { respond(request); });
}
//---------------------------------------------------------------------------
void FulfillmentEngine::respond(RangeRequest& request)
// Serve a single request
{
    if (request.wantsMetadata && !request.metadataDelivered) {
        request.metadataDelivered = true;
        if (request.callbacks.onMetadata)
            request.callbacks.onMetadata(*_metadata);
        // The consumer may have cancelled
        if (!request.pending())
            return;
    }

    if (!request.satisfied()) {
        auto readable = _store.bytesReadable();
        if (readable <= request.currentOffset)
            return;
        auto start = request.currentOffset;
        auto toRespond = min(readable - start, request.remaining());

        if (_store.isDisk()) {
            auto& disk = _store.disk();
            toRespond = min(toRespond, disk.maxBufferSize());
            if (_delegate.onStreamingDataRequest)
                _delegate.onStreamingDataRequest(start, start + toRespond);
            auto data = disk.read(start, toRespond);
            // Retried on the next sweep
            if (!data || data->empty())
                return;
            toRespond = data->size();
            request.currentOffset += toRespond;
            if (request.callbacks.onData)
                request.callbacks.onData(span<const uint8_t>(data->cdata(), data->size()));
        } else {
            auto data = _store.memory().read(start, toRespond);
            request.currentOffset += toRespond;
            if (request.callbacks.onData)
                request.callbacks.onData(data);
        }
        _lifecycle.noteDelivery(_store.bytesReadable(), _config.prebufferSize, isComplete());

        if (!request.pending())
            return;
    }

    if (request.satisfied()) {
        request.finished = true;
        if (request.callbacks.onFinished)
            request.callbacks.onFinished();
    }
}
//---------------------------------------------------------------------------
void FulfillmentEngine::clampRequests(uint64_t total)
// Shrink the requests to the total length
{
    _pending.forEach([total](RangeRequest& request) {
        if (request.requestedOffset >= total) {
            request.requestedLength = 0;
            request.currentOffset = request.requestedOffset;
        } else if (request.end() > total) {
            request.requestedLength = total - request.requestedOffset;
        }
    });
}
//---------------------------------------------------------------------------
void FulfillmentEngine::fail(ErrorKind kind, const string& message)
// Report a failure once
{
    if (_failed)
        return;
    _failed = true;
    cerr << "Resource " << (_resource.isPayload() ? string("<payload>") : _resource.getLocation()) << " failed: " << Error::getErrorKind(kind) << " - " << message << endl;
    _pending.clear();
    if (_delegate.onDownloadFailed)
        _delegate.onDownloadFailed(Error{kind, message});
}
//---------------------------------------------------------------------------
template <typename F>
bool FulfillmentEngine::growMemory(F&& func)
// Grow the memory store, an allocation failure ends the transfer
{
    try {
        func();
        return true;
    } catch (const bad_alloc&) {
        if (_session)
            _session->abort();
        fail(ErrorKind::TransportFailure, "Out of memory after " + to_string(_store.bytesAvailable()) + " bytes");
        return false;
    }
}
//---------------------------------------------------------------------------
void FulfillmentEngine::notifyFinished()
// Send the completion notification once
{
    if (_finishedNotified || _failed || !isComplete())
        return;
    _finishedNotified = true;
    // Resources smaller than the prebuffer become playable here
    _lifecycle.noteDelivery(_store.bytesReadable(), _config.prebufferSize, true);
    if (_store.isDisk()) {
        if (_delegate.onCachingFinished)
            _delegate.onCachingFinished(static_cast<int64_t>(_store.disk().bytesCachedSoFar()));
    } else {
        if (_delegate.onDownloadFinished)
            _delegate.onDownloadFinished(_store.memory().payload());
    }
}
//---------------------------------------------------------------------------
void FulfillmentEngine::onResponseMetadata(const network::ResponseInfo& info)
// The response head arrived
{
    if (_failed || _lifecycle.isDisposed() || _metadata)
        return;
    ContentMetadata metadata;
    metadata.contentType = info.contentType.empty() ? _resource.getMimeType() : info.contentType;
    metadata.contentLength = info.contentLength;
    metadata.supportsRangeAccess = true;
    _metadata = move(metadata);

    if (info.contentLength >= 0) {
        auto total = static_cast<uint64_t>(info.contentLength);
        clampRequests(total);
        if (_store.isDisk()) {
            _store.disk().setBytesExpected(info.contentLength);
        } else if (!growMemory([this, total]() { _store.memory().reserve(min(total, _config.maxReserveSize)); })) {
            return;
        }
    }
    sweep();
}
//---------------------------------------------------------------------------
void FulfillmentEngine::onBytesReceived(shared_ptr<const utils::DataVector<uint8_t>> chunk)
// The next chunk arrived
{
    if (_failed || _lifecycle.isDisposed() || !chunk || chunk->empty())
        return;
    auto length = chunk->size();
    if (_store.isDisk()) {
        auto queue = &_queue;
        weak_ptr<bool> token = _alive;
        auto onCached = [this, queue, token, length]() {
            queue->post([this, token, length]() {
                if (!token.expired())
                    onChunkCached(length);
            });
        };
        auto onFailed = [this, queue, token](const string& reason) {
            queue->post([this, token, reason]() {
                if (!token.expired())
                    onChunkCacheFailed(reason);
            });
        };
        _store.disk().append(move(chunk), move(onCached), move(onFailed));
    } else if (!growMemory([this, &chunk, length]() { _store.memory().append(chunk->cdata(), length); })) {
        return;
    }

    if (_delegate.onProgress)
        _delegate.onProgress(static_cast<int64_t>(_store.bytesAvailable()), _metadata ? _metadata->contentLength : -1);
    sweep();
}
//---------------------------------------------------------------------------
void FulfillmentEngine::onTransferComplete()
// The transfer delivered all bytes
{
    if (_failed || _lifecycle.isDisposed())
        return;
    _transferComplete = true;
    auto total = _store.bytesAvailable();
    if (_store.isDisk() && _store.disk().bytesExpected() < 0)
        _store.disk().setBytesExpected(static_cast<int64_t>(total));
    // Nothing beyond the received bytes will ever arrive
    clampRequests(total);
    sweep();
    notifyFinished();
}
//---------------------------------------------------------------------------
void FulfillmentEngine::onTransferFailed(const network::TransferError& error)
// The transfer failed
{
    if (_lifecycle.isDisposed())
        return;
    fail(ErrorKind::TransportFailure, error.describe());
}
//---------------------------------------------------------------------------
void FulfillmentEngine::onChunkCached(uint64_t length)
// The disk cache stored a chunk
{
    if (_failed || _lifecycle.isDisposed())
        return;
    auto& disk = _store.disk();
    if (!disk.recordCached(length)) {
        if (_session)
            _session->abort();
        fail(ErrorKind::CacheWriteFailure, "Cache acknowledged " + to_string(length) + " bytes beyond the " + to_string(disk.bytesAvailable()) + " downloaded");
        return;
    }
    if (_delegate.onCachingProgress)
        _delegate.onCachingProgress(static_cast<int64_t>(disk.bytesCachedSoFar()), disk.bytesExpected());
    sweep();
    notifyFinished();
}
//---------------------------------------------------------------------------
void FulfillmentEngine::onChunkCacheFailed(const string& reason)
// The disk cache rejected a chunk
{
    if (_failed || _lifecycle.isDisposed())
        return;
    if (_session)
        _session->abort();
    fail(ErrorKind::CacheWriteFailure, reason);
}
//---------------------------------------------------------------------------
} // namespace playcache::stream
