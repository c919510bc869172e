#pragma once
#include <chrono>
#include <cstdint>
#include <string>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace playcache::network {
//---------------------------------------------------------------------------
/// Settings of the http transport and its tcp sockets
struct TransportSettings {
    /// Default timeout for connecting and for a single receive
    static constexpr std::chrono::milliseconds defaultTimeout = std::chrono::seconds(30);
    /// Default receive chunk size
    static constexpr uint32_t defaultChunkSize = 64u * 1024;
    /// Default redirect limit
    static constexpr uint8_t defaultMaxRedirects = 5;

    /// The connect and receive timeout
    std::chrono::milliseconds timeout = defaultTimeout;
    /// The size of one receive call, upper bound of a delivered chunk
    uint32_t chunkSize = defaultChunkSize;
    /// SO_KEEPALIVE
    int keepAlive = 1;
    /// TCP_NODELAY
    int noDelay = 1;
    /// SO_RCVBUF, 0 keeps the kernel default
    int recvBuffer = 0;
    /// Number of redirects that are followed
    uint8_t maxRedirects = defaultMaxRedirects;
    /// Verify the peer certificate on https
    bool verifyPeer = true;
    /// The user agent
    std::string userAgent = "PlayCache/1.0";

    /// The default settings
    static TransportSettings defaults() { return TransportSettings(); }
};
//---------------------------------------------------------------------------
} // namespace playcache::network
