#pragma once
#include "network/socket.hpp"
#include <chrono>
#include <cstdint>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// CedarDB (Dominik Durner), 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace playcache::network {
//---------------------------------------------------------------------------
/// A non-blocking TCP socket driven by poll. Every wait also watches a
/// cancellation eventfd, so a transfer can be interrupted from any thread.
class PollSocket : public Socket {
    private:
    /// The socket, owned
    int32_t _fd;
    /// The cancellation eventfd, not owned
    int32_t _cancelFd;
    /// The timeout of a single wait
    std::chrono::milliseconds _timeout;

    public:
    /// The constructor, takes ownership of fd
    PollSocket(int32_t fd, int32_t cancelFd, std::chrono::milliseconds timeout);
    /// The destructor, closes the socket
    ~PollSocket() noexcept override;
    /// No copies
    PollSocket(const PollSocket&) = delete;
    /// No copies
    PollSocket& operator=(const PollSocket&) = delete;

    /// Send data
    int64_t send(const uint8_t* data, int64_t length) override;
    /// Receive data
    int64_t recv(uint8_t* data, int64_t length) override;
    /// Wait until the events are ready, returns 0 or -errno (-ETIMEDOUT, -ECANCELED)
    [[nodiscard]] int32_t wait(short events);
    /// Get the file descriptor
    [[nodiscard]] int32_t fd() const { return _fd; }
};
//---------------------------------------------------------------------------
} // namespace playcache::network
