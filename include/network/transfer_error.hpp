#pragma once
#include <cstdint>
#include <string>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2021
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace playcache::network {
//---------------------------------------------------------------------------
/// The failure codes
enum class MessageFailureCode : uint16_t {
    /// Socket creation or connect error
    Socket = 1,
    /// Connection closed without a response
    Empty = 1 << 1,
    /// Timeout passed
    Timeout = 1 << 2,
    /// Send syscall error
    Send = 1 << 3,
    /// Recv syscall error
    Recv = 1 << 4,
    /// HTTP header or status error
    HTTP = 1 << 5,
    /// TLS error
    TLS = 1 << 6,
    /// Too many or invalid redirects
    Redirect = 1 << 7,
    /// Invalid location or failed name resolution
    Resolve = 1 << 8
};
//---------------------------------------------------------------------------
/// The error of a failed transfer
struct TransferError {
    /// The failure code bit set
    uint16_t failureCode = 0;
    /// The http status, 0 if no response was received
    uint16_t status = 0;
    /// The system error, 0 if none
    int32_t systemError = 0;
    /// A human readable description
    std::string message;

    /// Add a failure code
    void set(MessageFailureCode code) { failureCode |= static_cast<uint16_t>(code); }
    /// Check a failure code
    [[nodiscard]] bool has(MessageFailureCode code) const { return failureCode & static_cast<uint16_t>(code); }
    /// Describe the error including codes and status
    [[nodiscard]] std::string describe() const;

    /// Get the name of a failure code
    static constexpr auto getFailureCode(const MessageFailureCode& code) noexcept {
        switch (code) {
            case MessageFailureCode::Socket: return "Socket";
            case MessageFailureCode::Empty: return "Empty";
            case MessageFailureCode::Timeout: return "Timeout";
            case MessageFailureCode::Send: return "Send";
            case MessageFailureCode::Recv: return "Recv";
            case MessageFailureCode::HTTP: return "HTTP";
            case MessageFailureCode::TLS: return "TLS";
            case MessageFailureCode::Redirect: return "Redirect";
            case MessageFailureCode::Resolve: return "Resolve";
            default: return "UNKNOWN";
        }
    }
};
//---------------------------------------------------------------------------
} // namespace playcache::network
