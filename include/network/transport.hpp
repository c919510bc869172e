#pragma once
#include "network/transfer_error.hpp"
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
namespace playcache {
//---------------------------------------------------------------------------
namespace utils {
template <typename T>
class DataVector;
}
//---------------------------------------------------------------------------
namespace network {
//---------------------------------------------------------------------------
/// The response head of a transfer
struct ResponseInfo {
    /// The http status
    uint16_t status = 0;
    /// The media type without parameters, empty if unknown
    std::string contentType;
    /// The body length, -1 if unknown
    int64_t contentLength = -1;
    /// Did the server announce byte range support
    bool acceptsRanges = false;
    /// The final location after redirects
    std::string location;
};
//---------------------------------------------------------------------------
/// Receives the events of one transfer. The calls arrive on a transport
/// thread, strictly in order: onResponse, onData*, then onComplete or
/// onFailure. No call arrives after Transfer::cancel returned.
class TransferListener {
    public:
    /// The destructor
    virtual ~TransferListener() = default;
    /// The response head arrived
    virtual void onResponse(const ResponseInfo& info) = 0;
    /// The next body chunk arrived
    virtual void onData(std::unique_ptr<utils::DataVector<uint8_t>> chunk) = 0;
    /// The body is complete
    virtual void onComplete() = 0;
    /// The transfer failed
    virtual void onFailure(const TransferError& error) = 0;
};
//---------------------------------------------------------------------------
/// A running transfer, destroying it cancels and waits for the transfer
class Transfer {
    public:
    /// The destructor
    virtual ~Transfer() = default;
    /// Cancel the transfer, idempotent
    virtual void cancel() = 0;
};
//---------------------------------------------------------------------------
/// Opens full resource transfers
class Transport {
    public:
    /// The destructor
    virtual ~Transport() = default;
    /// Start the transfer of the whole resource at location, the listener must outlive the transfer
    [[nodiscard]] virtual std::unique_ptr<Transfer> open(const std::string& location, TransferListener& listener) = 0;
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace playcache
