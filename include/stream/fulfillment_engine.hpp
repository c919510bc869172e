#pragma once
#include "stream/byte_store.hpp"
#include "stream/config.hpp"
#include "stream/delegate.hpp"
#include "stream/lifecycle_controller.hpp"
#include "stream/pending_request_set.hpp"
#include "stream/resource.hpp"
#include "stream/transfer_session.hpp"
#include <cstdint>
#include <memory>
#include <optional>
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
namespace playcache {
//---------------------------------------------------------------------------
namespace network {
class Transport;
struct ResponseInfo;
struct TransferError;
}
namespace utils {
class WorkQueue;
}
//---------------------------------------------------------------------------
namespace stream {
//---------------------------------------------------------------------------
class DiskCache;
//---------------------------------------------------------------------------
/// Serves byte range requests of a player from one progressive transfer of
/// the resource. The bytes are kept in memory, or handed to a disk cache
/// and read back in windows of at most maxBufferSize.
///
/// All public calls and all callbacks happen on the owner thread, the one
/// that runs the work queue. The queue must outlive the engine and its disk
/// cache. Callbacks must not destroy the engine.
class FulfillmentEngine {
    public:
    /// The storage mode
    enum class Mode : uint8_t {
        Memory,
        Disk
    };

    private:
    /// The resource
    Resource _resource;
    /// The config
    Config _config;
    /// The owner queue
    utils::WorkQueue& _queue;
    /// The transport, nullptr for payloads
    network::Transport* _transport;
    /// The delegate
    Delegate _delegate;
    /// The bytes
    ByteStore _store;
    /// The registered requests
    PendingRequestSet _pending;
    /// The lifecycle
    LifecycleController _lifecycle;
    /// The metadata, known after the response head
    std::optional<ContentMetadata> _metadata;
    /// The session
    std::unique_ptr<TransferSession> _session;
    /// The liveness of the engine for disk cache callbacks
    std::shared_ptr<bool> _alive;
    /// The number of started sessions
    uint64_t _sessionsStarted;
    /// Did the transfer deliver all bytes
    bool _transferComplete;
    /// Was the completion notification sent
    bool _finishedNotified;
    /// Was a failure reported
    bool _failed;

    friend TransferSession;

    public:
    /// The constructor, throws invalid_argument on a remote resource without transport or a payload with a disk cache
    FulfillmentEngine(Resource resource, Config config, utils::WorkQueue& queue, network::Transport* transport = nullptr, DiskCache* diskCache = nullptr);
    /// The destructor, disposes
    ~FulfillmentEngine();
    /// No copies
    FulfillmentEngine(const FulfillmentEngine&) = delete;
    /// No copies
    FulfillmentEngine& operator=(const FulfillmentEngine&) = delete;

    /// Set the delegate
    void setDelegate(Delegate delegate) { _delegate = std::move(delegate); }
    /// Register a range request and start the transfer if needed. Returns 0 once
    /// disposed, or after a failure when the range cannot be served completely.
    RequestHandle requestRange(uint64_t offset, uint64_t length, RangeCallbacks callbacks, bool wantsMetadata = true);
    /// Cancel a request, no callbacks follow
    void cancelRequest(RequestHandle handle);
    /// Start the transfer without a pending request
    void startEagerTransfer();
    /// Start the transfer without a pending request
    void download() { startEagerTransfer(); }
    /// The player reports that playback can start
    void reportReadyToPlay();
    /// The player ran out of data
    void reportPlaybackStalled();
    /// Stop the transfer and drop all requests, idempotent
    void dispose();

    /// Get the storage mode
    [[nodiscard]] Mode getMode() const { return _store.isDisk() ? Mode::Disk : Mode::Memory; }
    /// The contiguous bytes received
    [[nodiscard]] uint64_t getBytesAvailable() const { return _store.bytesAvailable(); }
    /// The bytes durably cached, the available bytes in memory mode
    [[nodiscard]] uint64_t getBytesCached() const { return _store.bytesReadable(); }
    /// Get the metadata
    [[nodiscard]] const std::optional<ContentMetadata>& getMetadata() const { return _metadata; }
    /// Get the session, nullptr before the transfer started
    [[nodiscard]] const TransferSession* getSession() const { return _session.get(); }
    /// The number of started sessions
    [[nodiscard]] uint64_t getSessionsStarted() const { return _sessionsStarted; }
    /// The number of pending requests
    [[nodiscard]] uint64_t getPendingRequests() const { return _pending.size(); }
    /// Get the lifecycle
    [[nodiscard]] const LifecycleController& getLifecycle() const { return _lifecycle; }
    /// Get the resource
    [[nodiscard]] const Resource& getResource() const { return _resource; }
    /// Is the whole resource available for reading
    [[nodiscard]] bool isComplete() const;
    /// Was a failure reported
    [[nodiscard]] bool hasFailed() const { return _failed; }

    /// Get the mode name
    static constexpr auto getModeName(const Mode& mode) noexcept {
        switch (mode) {
            case Mode::Memory: return "Memory";
            case Mode::Disk: return "Disk";
            default: return "UNKNOWN";
        }
    }

    private:
    /// Create the store for the mode
    static ByteStore makeStore(const Resource& resource, const Config& config, DiskCache* diskCache);
    /// The total length once known
    [[nodiscard]] std::optional<uint64_t> knownLength() const;
    /// Start the session unless one exists
    void ensureSession();
    /// Serve all pending requests from the available bytes
    void sweep();
    /// Serve a single request
    void respond(RangeRequest& request);
    /// Shrink the requests to the total length
    void clampRequests(uint64_t total);
    /// Report a failure once and drop the requests
    void fail(ErrorKind kind, const std::string& message);
    /// Grow the memory store, false after an allocation failure
    template <typename F>
    bool growMemory(F&& func);
    /// Send the completion notification once
    void notifyFinished();

    /// The response head arrived
    void onResponseMetadata(const network::ResponseInfo& info);
    /// The next chunk arrived
    void onBytesReceived(std::shared_ptr<const utils::DataVector<uint8_t>> chunk);
    /// The transfer delivered all bytes
    void onTransferComplete();
    /// The transfer failed
    void onTransferFailed(const network::TransferError& error);
    /// The disk cache stored a chunk
    void onChunkCached(uint64_t length);
    /// The disk cache rejected a chunk
    void onChunkCacheFailed(const std::string& reason);
};
//---------------------------------------------------------------------------
} // namespace stream
} // namespace playcache
