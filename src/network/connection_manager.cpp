#include "network/connection_manager.hpp"
#include "network/poll_socket.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
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
using namespace std;
//---------------------------------------------------------------------------
ConnectionManager::ConnectionManager(const TransportSettings& settings, int32_t cancelFd) : _settings(settings), _cancelFd(cancelFd)
// The constructor
{
}
//---------------------------------------------------------------------------
ConnectionManager::AddressList ConnectionManager::resolve(const string& hostname, uint32_t port)
// Resolve the host name
{
    struct addrinfo hints = {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* temp = nullptr;
    auto portStr = to_string(port);
    if (auto status = getaddrinfo(hostname.c_str(), portStr.c_str(), &hints, &temp); status != 0)
        throw runtime_error("hostname getaddrinfo error: " + string(gai_strerror(status)));
    return AddressList(temp, &freeaddrinfo);
}
//---------------------------------------------------------------------------
void ConnectionManager::applySettings(int32_t fd) const
// Apply the tcp settings
{
    // Keep Alive
    if (_settings.keepAlive > 0) {
        if (setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &_settings.keepAlive, sizeof(_settings.keepAlive)))
            throw runtime_error("Socket creation error! - keep alive error");
    }

    // No Delay
    if (_settings.noDelay > 0) {
        if (setsockopt(fd, SOL_TCP, TCP_NODELAY, &_settings.noDelay, sizeof(_settings.noDelay)))
            throw runtime_error("Socket creation error! - nodelay error");
    }

    // Recv buffer
    if (_settings.recvBuffer > 0) {
        if (setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &_settings.recvBuffer, sizeof(_settings.recvBuffer)))
            throw runtime_error("Socket creation error! - recvbuf error");
    }
}
//---------------------------------------------------------------------------
unique_ptr<PollSocket> ConnectionManager::connect(const addrinfo* addresses)
// Creates a new socket connection
{
    string lastError = "no address";
    for (auto address = addresses; address; address = address->ai_next) {
        // Build socket, always non blocking
        auto fd = ::socket(address->ai_family, address->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, address->ai_protocol);
        if (fd == -1)
            throw runtime_error("Socket creation error! " + string(strerror(errno)));
        auto socket = make_unique<PollSocket>(fd, _cancelFd, _settings.timeout);
        applySettings(fd);

        // Connect to remote
        auto connectRes = ::connect(fd, address->ai_addr, address->ai_addrlen);
        if (connectRes < 0 && errno != EINPROGRESS) {
            lastError = strerror(errno);
            continue;
        }

        if (connectRes < 0) {
            // connection check
            auto status = socket->wait(POLLOUT);
            if (status == -ECANCELED)
                throw runtime_error("Socket creation error! Connect cancelled");
            if (status < 0) {
                lastError = strerror(-status);
                continue;
            }
            int socketError = 0;
            socklen_t socketErrorLen = sizeof(socketError);
            if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &socketError, &socketErrorLen))
                throw runtime_error("Socket creation error! Could not retrieve socket options!");
            if (socketError) {
                lastError = strerror(socketError);
                continue;
            }
        }
        return socket;
    }
    throw runtime_error("Socket creation error! " + lastError);
}
//---------------------------------------------------------------------------
} // namespace playcache::network
