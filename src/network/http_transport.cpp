#include "network/http_transport.hpp"
#include "network/connection_manager.hpp"
#include "network/http_helper.hpp"
#include "network/http_request.hpp"
#include "network/location.hpp"
#include "network/poll_socket.hpp"
#include "network/tls_connection.hpp"
#include "network/tls_context.hpp"
#include "utils/data_vector.hpp"
#include "utils/utils.hpp"
#include <atomic>
#include <cerrno>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <sys/eventfd.h>
#include <unistd.h>
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
using namespace std;
//---------------------------------------------------------------------------
/// A single http(s) transfer running on its own worker thread
class HttpTransfer : public Transfer {
    public:
    /// The outcome of one request
    enum class Outcome : uint8_t {
        Finished,
        Redirect,
        Failed,
        Cancelled
    };

    private:
    /// The requested url
    string _url;
    /// The settings
    const TransportSettings _settings;
    /// The listener
    TransferListener& _listener;
    /// The cancellation eventfd
    int32_t _cancelFd;
    /// The cancellation flag
    atomic<bool> _cancelled;
    /// Serializes listener calls against cancel
    mutex _callbackMutex;
    /// The error of a failed transfer
    TransferError _error;
    /// The tls context, created on the first https request
    unique_ptr<TLSContext> _tlsContext;
    /// The worker
    thread _thread;

    public:
    /// The constructor
    HttpTransfer(string url, const TransportSettings& settings, TransferListener& listener);
    /// The destructor, cancels and joins
    ~HttpTransfer() override;

    /// Start the worker
    void start();
    /// Cancel the transfer
    void cancel() override;

    private:
    /// The worker body
    void run();
    /// Execute one request
    Outcome fetch(const Location& location, Location& redirect);
    /// Record a failure, a negative result carries -errno
    Outcome fail(MessageFailureCode code, const string& message, int64_t result = 0);
    /// Call the listener unless cancelled
    template <typename F>
    void report(F&& func);
};
//---------------------------------------------------------------------------
HttpTransfer::HttpTransfer(string url, const TransportSettings& settings, TransferListener& listener) : _url(move(url)), _settings(settings), _listener(listener), _cancelFd(-1), _cancelled(false), _callbackMutex(), _error(), _tlsContext(), _thread()
// The constructor
{
    _cancelFd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (_cancelFd < 0)
        throw runtime_error("Transfer creation error! - eventfd error");
}
//---------------------------------------------------------------------------
HttpTransfer::~HttpTransfer()
// The destructor
{
    cancel();
    if (_thread.joinable()) {
        if (_thread.get_id() == this_thread::get_id())
            _thread.detach();
        else
            _thread.join();
    }
    ::close(_cancelFd);
}
//---------------------------------------------------------------------------
void HttpTransfer::start()
// Start the worker
{
    _thread = thread(&HttpTransfer::run, this);
}
//---------------------------------------------------------------------------
void HttpTransfer::cancel()
// Cancel the transfer
{
    if (_thread.get_id() == this_thread::get_id()) {
        // Called from a listener callback, the mutex is already held
        _cancelled = true;
    } else {
        unique_lock lock(_callbackMutex);
        _cancelled = true;
    }
    uint64_t one = 1;
    if (::write(_cancelFd, &one, sizeof(one)) != static_cast<ssize_t>(sizeof(one)) && errno != EAGAIN)
        cerr << "Transfer cancel error! - eventfd write error" << endl;
}
//---------------------------------------------------------------------------
template <typename F>
void HttpTransfer::report(F&& func)
// Call the listener unless cancelled
{
    unique_lock lock(_callbackMutex);
    if (!_cancelled)
        func();
}
//---------------------------------------------------------------------------
HttpTransfer::Outcome HttpTransfer::fail(MessageFailureCode code, const string& message, int64_t result)
// Record a failure
{
    if (_cancelled || result == -ECANCELED)
        return Outcome::Cancelled;
    _error.set(result == -ETIMEDOUT ? MessageFailureCode::Timeout : code);
    if (result < 0)
        _error.systemError = static_cast<int32_t>(-result);
    _error.message = message;
    return Outcome::Failed;
}
//---------------------------------------------------------------------------
void HttpTransfer::run()
// The worker body
{
    Location location;
    auto outcome = Outcome::Failed;
    try {
        location = Location::parse(_url);
        for (uint8_t redirects = 0;; redirects++) {
            Location target;
            outcome = fetch(location, target);
            if (outcome != Outcome::Redirect)
                break;
            if (redirects >= _settings.maxRedirects) {
                outcome = fail(MessageFailureCode::Redirect, "Too many redirects");
                break;
            }
            location = move(target);
        }
    } catch (const runtime_error& e) {
        outcome = fail(MessageFailureCode::Resolve, e.what());
    }

    switch (outcome) {
        case Outcome::Finished:
            report([this]() { _listener.onComplete(); });
            break;
        case Outcome::Failed:
            cerr << "Transfer of " << _url << " failed: " << _error.describe() << endl;
            report([this]() { _listener.onFailure(_error); });
            break;
        default:
            break;
    }
}
//---------------------------------------------------------------------------
HttpTransfer::Outcome HttpTransfer::fetch(const Location& location, Location& redirect)
// Execute one request
{
    if (_cancelled)
        return Outcome::Cancelled;

    // Connect
    ConnectionManager connectionManager(_settings, _cancelFd);
    ConnectionManager::AddressList addresses(nullptr, &freeaddrinfo);
    try {
        addresses = ConnectionManager::resolve(location.host, location.port);
    } catch (const runtime_error& e) {
        return fail(MessageFailureCode::Resolve, e.what());
    }
    unique_ptr<PollSocket> socket;
    try {
        socket = connectionManager.connect(addresses.get());
    } catch (const runtime_error& e) {
        return fail(MessageFailureCode::Socket, e.what());
    }

    Socket* stream = socket.get();
    unique_ptr<TLSConnection> tls;
    if (location.tls()) {
        if (!_tlsContext)
            _tlsContext = make_unique<TLSContext>(_settings.verifyPeer);
        tls = make_unique<TLSConnection>(*_tlsContext, *socket, location.host, location.port);
        if (!tls->init())
            return fail(MessageFailureCode::TLS, tls->getError());
        if (auto status = tls->connect(); status < 0)
            return fail(MessageFailureCode::TLS, tls->getError().empty() ? "Handshake failed" : tls->getError(), status);
        stream = tls.get();
    }

    // Send the request
    auto request = HttpRequest::serialize(HttpRequest::buildGet(location, _settings));
    for (uint64_t offset = 0; offset < request->size();) {
        auto status = stream->send(request->cdata() + offset, static_cast<int64_t>(request->size() - offset));
        if (status <= 0)
            return fail(MessageFailureCode::Send, "Sending the request failed", status < 0 ? status : -EPIPE);
        offset += static_cast<uint64_t>(status);
    }

    // Receive the response
    HttpHelper helper;
    auto buffer = make_unique<uint8_t[]>(_settings.chunkSize);
    auto headerReported = false;
    while (!helper.finished()) {
        if (_cancelled)
            return Outcome::Cancelled;
        auto status = stream->recv(buffer.get(), _settings.chunkSize);
        if (status < 0)
            return fail(MessageFailureCode::Recv, "Receiving the response failed", status);
        if (status == 0) {
            if (!helper.hasHeader())
                return fail(MessageFailureCode::Empty, "Connection closed before the response header");
            if (!helper.finishOnClose())
                return fail(MessageFailureCode::Recv, "Connection closed before the body was complete");
            break;
        }

        auto chunk = make_unique<utils::DataVector<uint8_t>>();
        try {
            helper.consume(buffer.get(), static_cast<uint64_t>(status), [&chunk](const uint8_t* data, uint64_t length) {
                chunk->append(data, length);
            });
        } catch (const runtime_error& e) {
            return fail(MessageFailureCode::HTTP, e.what());
        }

        if (helper.hasHeader() && !headerReported) {
            headerReported = true;
            auto& info = *helper.getInfo();
            auto& response = info.response;
            if (HttpResponse::checkRedirect(response.status)) {
                auto target = response.findHeader("Location");
                if (!target)
                    return fail(MessageFailureCode::Redirect, "Redirect without Location header");
                try {
                    redirect = location.resolve(*target);
                } catch (const runtime_error& e) {
                    return fail(MessageFailureCode::Redirect, e.what());
                }
                return Outcome::Redirect;
            }
            if (!HttpResponse::checkSuccess(response.status)) {
                _error.status = response.status;
                return fail(MessageFailureCode::HTTP, HttpResponse::getResponseCode(response.code));
            }

            ResponseInfo responseInfo;
            responseInfo.status = response.status;
            responseInfo.contentType = response.mimeType();
            if (info.encoding == HttpHelper::Encoding::ContentLength)
                responseInfo.contentLength = static_cast<int64_t>(info.length);
            else if (info.encoding == HttpHelper::Encoding::NoContent)
                responseInfo.contentLength = 0;
            auto acceptRanges = response.findHeader("Accept-Ranges");
            responseInfo.acceptsRanges = acceptRanges && utils::equalsIgnoreCase(*acceptRanges, "bytes");
            responseInfo.location = location.toString();
            report([this, &responseInfo]() { _listener.onResponse(responseInfo); });
        }

        if (!chunk->empty())
            report([this, &chunk]() { _listener.onData(move(chunk)); });
    }

    if (tls)
        tls->shutdown();
    return Outcome::Finished;
}
//---------------------------------------------------------------------------
HttpTransport::HttpTransport(TransportSettings settings) : _settings(move(settings))
// The constructor
{
    TLSContext::initOpenSSL();
}
//---------------------------------------------------------------------------
unique_ptr<Transfer> HttpTransport::open(const string& location, TransferListener& listener)
// Start the transfer of the whole resource
{
    auto transfer = make_unique<HttpTransfer>(location, _settings, listener);
    transfer->start();
    return transfer;
}
//---------------------------------------------------------------------------
} // namespace playcache::network
