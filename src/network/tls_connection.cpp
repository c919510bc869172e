#include "network/tls_connection.hpp"
#include "network/poll_socket.hpp"
#include "network/tls_context.hpp"
#include <cerrno>
#include <climits>
#include <utility>
#include <poll.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509_vfy.h>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2023
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace playcache {
namespace network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TLSConnection::TLSConnection(TLSContext& context, PollSocket& socket, string hostname, uint32_t port) : _context(context), _socket(socket), _ssl(nullptr), _hostname(move(hostname)), _peer(), _error()
// The constructor
{
    _peer = _hostname + ":" + to_string(port);
}
//---------------------------------------------------------------------------
TLSConnection::~TLSConnection() noexcept
// The destructor
{
    if (_ssl)
        SSL_free(_ssl);
}
//---------------------------------------------------------------------------
bool TLSConnection::init()
// Initialize SSL
{
    if (!_context._ctx) {
        _error = "no ssl context";
        return false;
    }
    _ssl = SSL_new(_context._ctx);
    if (!_ssl) {
        _error = "SSL_new failed";
        return false;
    }
    SSL_set_connect_state(_ssl);
    if (SSL_set_fd(_ssl, _socket.fd()) != 1) {
        _error = "SSL_set_fd failed";
        return false;
    }
    // SNI and host name verification
    if (SSL_set_tlsext_host_name(_ssl, _hostname.c_str()) != 1 || SSL_set1_host(_ssl, _hostname.c_str()) != 1) {
        _error = "invalid tls host name";
        return false;
    }
    _context.reuseSession(_peer, _ssl);
    return true;
}
//---------------------------------------------------------------------------
template <typename F>
int64_t TLSConnection::operationHelper(F&& func)
// Helper function that handles the SSL_op calls
{
    while (true) {
        ERR_clear_error();
        errno = 0;
        auto status = func();
        auto error = SSL_get_error(_ssl, status);
        switch (error) {
            case SSL_ERROR_NONE:
                return status;
            case SSL_ERROR_ZERO_RETURN:
                return 0;
            case SSL_ERROR_WANT_READ: {
                if (auto waitStatus = _socket.wait(POLLIN); waitStatus < 0)
                    return waitStatus;
                break;
            }
            case SSL_ERROR_WANT_WRITE: {
                if (auto waitStatus = _socket.wait(POLLOUT); waitStatus < 0)
                    return waitStatus;
                break;
            }
            case SSL_ERROR_SYSCALL: {
                if (errno)
                    return -errno;
                // Closed without a tls shutdown
                return 0;
            }
            default: {
                char buffer[256];
                ERR_error_string_n(ERR_peek_last_error(), buffer, sizeof(buffer));
                _error = buffer;
                if (auto verify = SSL_get_verify_result(_ssl); verify != X509_V_OK)
                    _error += string(" (") + X509_verify_cert_error_string(verify) + ")";
                return -EPROTO;
            }
        }
    }
}
//---------------------------------------------------------------------------
int64_t TLSConnection::connect()
// SSL/TLS connect
{
    auto ssl = _ssl;
    auto sslConnect = [ssl]() {
        return SSL_connect(ssl);
    };
    auto status = operationHelper(sslConnect);
    if (status == 0)
        return -ECONNRESET;
    return status < 0 ? status : 0;
}
//---------------------------------------------------------------------------
int64_t TLSConnection::recv(uint8_t* data, int64_t length)
// Recv a TLS encrypted message
{
    auto ssl = _ssl;
    auto sslRead = [ssl, data, length = static_cast<int>(length > INT_MAX ? INT_MAX : length)]() {
        return SSL_read(ssl, data, length);
    };
    return operationHelper(sslRead);
}
//---------------------------------------------------------------------------
int64_t TLSConnection::send(const uint8_t* data, int64_t length)
// Send a TLS encrypted message
{
    auto ssl = _ssl;
    auto sslWrite = [ssl, data, length = static_cast<int>(length > INT_MAX ? INT_MAX : length)]() {
        return SSL_write(ssl, data, length);
    };
    return operationHelper(sslWrite);
}
//---------------------------------------------------------------------------
void TLSConnection::shutdown()
// SSL/TLS shutdown
{
    if (!_ssl)
        return;
    ERR_clear_error();
    // Only send our close_notify, the connection is closed afterwards anyway
    if (SSL_shutdown(_ssl) >= 0)
        _context.cacheSession(_peer, _ssl);
    else
        _context.dropSession(_peer);
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace playcache
