#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
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
/// The error kinds reported to the delegate
enum class ErrorKind : uint8_t {
    /// The transport failed or returned an error status
    TransportFailure,
    /// The disk cache rejected a chunk
    CacheWriteFailure,
    /// A read outside of the received bytes
    OutOfRangeRequest,
    /// Disposed before the disk cache held the whole resource
    DisposedWhileIncomplete
};
//---------------------------------------------------------------------------
/// A reported failure
struct Error {
    /// The kind
    ErrorKind kind;
    /// The description
    std::string message;

    /// Get the name of the kind
    static constexpr auto getErrorKind(const ErrorKind& kind) noexcept {
        switch (kind) {
            case ErrorKind::TransportFailure: return "TransportFailure";
            case ErrorKind::CacheWriteFailure: return "CacheWriteFailure";
            case ErrorKind::OutOfRangeRequest: return "OutOfRangeRequest";
            case ErrorKind::DisposedWhileIncomplete: return "DisposedWhileIncomplete";
            default: return "UNKNOWN";
        }
    }
};
//---------------------------------------------------------------------------
/// Thrown on reads outside of the available bytes
class OutOfRangeError : public std::out_of_range {
    public:
    using std::out_of_range::out_of_range;
};
//---------------------------------------------------------------------------
} // namespace playcache::stream
