#pragma once
#include <cstdint>
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
/// This is the interface for byte streams over a connected TCP socket,
/// either plain or tls encrypted. Results follow the io_uring convention:
/// the transferred bytes, or -errno on failure.
//---------------------------------------------------------------------------
class Socket {
    public:
    /// The destructor
    virtual ~Socket() noexcept = default;
    /// Send data, returns the sent bytes or -errno
    virtual int64_t send(const uint8_t* data, int64_t length) = 0;
    /// Receive data, returns the received bytes, 0 on orderly shutdown, or -errno
    virtual int64_t recv(uint8_t* data, int64_t length) = 0;
};
//---------------------------------------------------------------------------
} // namespace playcache::network
