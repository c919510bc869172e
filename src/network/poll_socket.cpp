#include "network/poll_socket.hpp"
#include <cerrno>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
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
using namespace std;
//---------------------------------------------------------------------------
PollSocket::PollSocket(int32_t fd, int32_t cancelFd, chrono::milliseconds timeout) : _fd(fd), _cancelFd(cancelFd), _timeout(timeout)
// The constructor
{
}
//---------------------------------------------------------------------------
PollSocket::~PollSocket() noexcept
// The destructor
{
    if (_fd >= 0)
        ::close(_fd);
}
//---------------------------------------------------------------------------
int32_t PollSocket::wait(short events)
// Wait for the socket or the cancellation
{
    pollfd pollfds[2] = {{.fd = _fd, .events = events, .revents = 0}, {.fd = _cancelFd, .events = POLLIN, .revents = 0}};
    auto deadline = chrono::steady_clock::now() + _timeout;
    while (true) {
        auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now());
        if (remaining.count() <= 0)
            return -ETIMEDOUT;
        auto readyFds = ::poll(pollfds, _cancelFd >= 0 ? 2 : 1, static_cast<int>(remaining.count()));
        if (readyFds < 0) {
            if (errno == EINTR)
                continue;
            return -errno;
        }
        if (!readyFds)
            return -ETIMEDOUT;
        if (_cancelFd >= 0 && (pollfds[1].revents & POLLIN))
            return -ECANCELED;
        if (pollfds[0].revents & events)
            return 0;
        if (pollfds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) {
            // Simulate io uring by returning -error
            int err = 0;
            socklen_t len = sizeof(err);
            if (::getsockopt(_fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err)
                return -err;
            // A hangup without error lets the following call observe the shutdown
            return (pollfds[0].revents & POLLNVAL) ? -EBADF : 0;
        }
    }
}
//---------------------------------------------------------------------------
int64_t PollSocket::send(const uint8_t* data, int64_t length)
// Send data
{
    while (true) {
        auto result = ::send(_fd, data, static_cast<size_t>(length), MSG_DONTWAIT | MSG_NOSIGNAL);
        if (result >= 0)
            return result;
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
            return -errno;
        if (auto status = wait(POLLOUT); status < 0)
            return status;
    }
}
//---------------------------------------------------------------------------
int64_t PollSocket::recv(uint8_t* data, int64_t length)
// Receive data
{
    while (true) {
        auto result = ::recv(_fd, data, static_cast<size_t>(length), MSG_DONTWAIT);
        if (result >= 0)
            return result;
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
            return -errno;
        if (auto status = wait(POLLIN); status < 0)
            return status;
    }
}
//---------------------------------------------------------------------------
} // namespace playcache::network
