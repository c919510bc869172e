#pragma once
#include "network/transport.hpp"
#include <cstdint>
#include <memory>
#include <optional>
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
class WorkQueue;
}
//---------------------------------------------------------------------------
namespace stream {
//---------------------------------------------------------------------------
class FulfillmentEngine;
//---------------------------------------------------------------------------
/// The single transfer of a resource. The transport events arrive on a
/// transport thread and are marshalled onto the owner queue; events that
/// arrive after the session is gone are dropped.
class TransferSession : public network::TransferListener {
    public:
    /// The state
    enum class State : uint8_t {
        Idle,
        Active,
        Completed,
        Failed,
        Cancelled
    };

    private:
    /// The engine
    FulfillmentEngine& _engine;
    /// The owner queue
    utils::WorkQueue& _queue;
    /// The transport
    network::Transport& _transport;
    /// The location
    std::string _location;
    /// The transfer
    std::unique_ptr<network::Transfer> _transfer;
    /// The liveness of the session
    std::shared_ptr<bool> _alive;
    /// The liveness token handed to marshalled events
    std::weak_ptr<bool> _token;
    /// The state
    State _state;
    /// The response head
    std::optional<network::ResponseInfo> _response;
    /// The error of a failed transfer
    std::optional<network::TransferError> _error;

    public:
    /// The constructor
    TransferSession(FulfillmentEngine& engine, utils::WorkQueue& queue, network::Transport& transport, std::string location);
    /// The destructor, cancels and waits for the transfer
    ~TransferSession() override;
    /// No copies
    TransferSession(const TransferSession&) = delete;
    /// No copies
    TransferSession& operator=(const TransferSession&) = delete;

    /// Open the transfer of the whole resource
    void start();
    /// Cancel an active transfer, no-op once terminated
    void cancel();
    /// Abort an active transfer as failed
    void abort();

    /// Get the state
    [[nodiscard]] State getState() const { return _state; }
    /// Is the session terminated
    [[nodiscard]] bool terminated() const { return _state != State::Idle && _state != State::Active; }
    /// Get the response head
    [[nodiscard]] const std::optional<network::ResponseInfo>& getResponse() const { return _response; }
    /// Get the transport error
    [[nodiscard]] const std::optional<network::TransferError>& getError() const { return _error; }

    /// Get the state name
    static constexpr auto getStateName(const State& state) noexcept {
        switch (state) {
            case State::Idle: return "Idle";
            case State::Active: return "Active";
            case State::Completed: return "Completed";
            case State::Failed: return "Failed";
            case State::Cancelled: return "Cancelled";
            default: return "UNKNOWN";
        }
    }

    /// The response head arrived
    void onResponse(const network::ResponseInfo& info) override;
    /// The next body chunk arrived
    void onData(std::unique_ptr<utils::DataVector<uint8_t>> chunk) override;
    /// The body is complete
    void onComplete() override;
    /// The transfer failed
    void onFailure(const network::TransferError& error) override;

    private:
    /// Post an event onto the owner queue
    template <typename F>
    void marshal(F&& func);
};
//---------------------------------------------------------------------------
} // namespace stream
} // namespace playcache
