#pragma once
#include "network/socket.hpp"
#include <cstdint>
#include <string>
#include <openssl/types.h>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2023
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace playcache::network {
//---------------------------------------------------------------------------
class TLSContext;
class PollSocket;
//---------------------------------------------------------------------------
/// The TLS Interface
//---------------------------------------------------------------------------
/* playcache |   OpenSSL
 *     |     |
 *      -------> SSL_read / SSL_write / SSL_connect
 *           |     /\    ||
 *           |     ||    \/
 *           |    socket fd (non blocking)
 *           |     /\    ||
 *      -------< PollSocket::wait on WANT_READ / WANT_WRITE
 */
//---------------------------------------------------------------------------
class TLSConnection : public Socket {
    private:
    /// The SSL context
    TLSContext& _context;
    /// The underlying socket
    PollSocket& _socket;
    /// The SSL connection
    SSL* _ssl;
    /// The server name, used for SNI and verification
    std::string _hostname;
    /// The session cache key
    std::string _peer;
    /// The last OpenSSL error text
    std::string _error;

    public:
    /// The constructor
    TLSConnection(TLSContext& context, PollSocket& socket, std::string hostname, uint32_t port);
    /// The destructor
    ~TLSConnection() noexcept override;
    /// No copies
    TLSConnection(const TLSConnection&) = delete;
    /// No copies
    TLSConnection& operator=(const TLSConnection&) = delete;

    /// Initialize SSL
    [[nodiscard]] bool init();
    /// SSL/TLS connect, returns 0 or -errno (-EPROTO for tls errors)
    [[nodiscard]] int64_t connect();
    /// SSL/TLS shutdown, best effort
    void shutdown();
    /// Send a TLS encrypted message
    int64_t send(const uint8_t* data, int64_t length) override;
    /// Recv a TLS encrypted message
    int64_t recv(uint8_t* data, int64_t length) override;
    /// The last tls error
    [[nodiscard]] const std::string& getError() const { return _error; }

    private:
    /// Helper function that handles the SSL_op calls
    template <typename F>
    int64_t operationHelper(F&& func);
};
//---------------------------------------------------------------------------
} // namespace playcache::network
