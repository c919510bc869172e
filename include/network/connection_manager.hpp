#pragma once
#include "network/config.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <netdb.h>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace playcache::network {
//---------------------------------------------------------------------------
class PollSocket;
//---------------------------------------------------------------------------
// This class acts as the connection enabler of a transfer.
// It resolves host names and opens tuned, non-blocking tcp sockets.
class ConnectionManager {
    public:
    /// The owned address list
    using AddressList = std::unique_ptr<addrinfo, decltype(&freeaddrinfo)>;

    private:
    /// The settings
    const TransportSettings& _settings;
    /// The cancellation eventfd
    int32_t _cancelFd;

    public:
    /// The constructor
    ConnectionManager(const TransportSettings& settings, int32_t cancelFd);

    /// Resolve the host name, throws runtime_error on failure
    [[nodiscard]] static AddressList resolve(const std::string& hostname, uint32_t port);
    /// Connect to the first reachable address, throws runtime_error on failure
    [[nodiscard]] std::unique_ptr<PollSocket> connect(const addrinfo* addresses);

    private:
    /// Apply the tcp settings
    void applySettings(int32_t fd) const;
};
//---------------------------------------------------------------------------
} // namespace playcache::network
