#include "network/http_transport.hpp"
#include "network/transfer_error.hpp"
#include "network/transport.hpp"
#include "utils/data_vector.hpp"
#include <catch2/catch.hpp>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace playcache::network::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
/// A loopback http server answering one scripted response per connection
class LoopbackServer {
    /// The listening socket
    int _fd;
    /// The bound port
    uint16_t _port;
    /// The responses, one per accepted connection
    vector<string> _responses;
    /// Keep the last connection open until the client closes it
    bool _holdLast;
    /// The received request heads
    vector<string> _requests;
    /// Protects the requests
    mutex _mutex;
    /// The server thread
    thread _thread;

    public:
    /// The constructor
    explicit LoopbackServer(vector<string> responses, bool holdLast = false) : _fd(-1), _port(0), _responses(move(responses)), _holdLast(holdLast), _requests(), _mutex(), _thread()
    {
        _fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (_fd < 0)
            throw runtime_error("LoopbackServer: socket error");
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (::bind(_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) || ::listen(_fd, 4) || ::getsockname(_fd, reinterpret_cast<sockaddr*>(&addr), &len)) {
            ::close(_fd);
            throw runtime_error("LoopbackServer: bind error");
        }
        _port = ntohs(addr.sin_port);
        _thread = thread(&LoopbackServer::run, this);
    }
    /// The destructor
    ~LoopbackServer()
    {
        ::shutdown(_fd, SHUT_RDWR);
        _thread.join();
        ::close(_fd);
    }

    /// The url of path on this server
    [[nodiscard]] string url(const string& path) const { return "http://127.0.0.1:" + to_string(_port) + path; }
    /// The received request heads
    [[nodiscard]] vector<string> requests()
    {
        unique_lock lock(_mutex);
        return _requests;
    }

    private:
    /// Serve the scripted connections
    void run()
    {
        for (uint64_t i = 0; i < _responses.size(); i++) {
            pollfd pfd{.fd = _fd, .events = POLLIN, .revents = 0};
            if (::poll(&pfd, 1, 10000) <= 0)
                return;
            auto client = ::accept4(_fd, nullptr, nullptr, SOCK_CLOEXEC);
            if (client < 0)
                return;
            string request;
            char buffer[1024];
            while (request.find("\r\n\r\n") == string::npos) {
                auto received = ::recv(client, buffer, sizeof(buffer), 0);
                if (received <= 0)
                    break;
                request.append(buffer, static_cast<size_t>(received));
            }
            {
                unique_lock lock(_mutex);
                _requests.push_back(request);
            }
            auto& response = _responses[i];
            for (size_t offset = 0; offset < response.size();) {
                auto sent = ::send(client, response.data() + offset, response.size() - offset, MSG_NOSIGNAL);
                if (sent <= 0)
                    break;
                offset += static_cast<size_t>(sent);
            }
            if (_holdLast && i + 1 == _responses.size()) {
                // Wait for the client to close
                pollfd cfd{.fd = client, .events = POLLIN, .revents = 0};
                while (::poll(&cfd, 1, 10000) > 0 && ::recv(client, buffer, sizeof(buffer), 0) > 0) {
                }
            }
            ::close(client);
        }
    }
};
//---------------------------------------------------------------------------
/// Records the events of one transfer across threads
class TransferRecorder : public TransferListener {
    /// Protects the state
    mutex _mutex;
    /// Signals new events
    condition_variable _cv;

    public:
    /// The response heads
    vector<ResponseInfo> responses;
    /// The body
    string body;
    /// Completed
    bool completed = false;
    /// The failure
    optional<TransferError> error;

    /// The response head arrived
    void onResponse(const ResponseInfo& info) override
    {
        unique_lock lock(_mutex);
        responses.push_back(info);
    }
    /// The next body chunk arrived
    void onData(unique_ptr<utils::DataVector<uint8_t>> chunk) override
    {
        unique_lock lock(_mutex);
        body.append(reinterpret_cast<const char*>(chunk->cdata()), chunk->size());
        _cv.notify_all();
    }
    /// The body is complete
    void onComplete() override
    {
        unique_lock lock(_mutex);
        completed = true;
        _cv.notify_all();
    }
    /// The transfer failed
    void onFailure(const TransferError& transferError) override
    {
        unique_lock lock(_mutex);
        error = transferError;
        _cv.notify_all();
    }

    /// Wait for completion or failure
    bool waitDone()
    {
        unique_lock lock(_mutex);
        return _cv.wait_for(lock, chrono::seconds(10), [this]() { return completed || error.has_value(); });
    }
    /// Wait for length body bytes
    bool waitBody(size_t length)
    {
        unique_lock lock(_mutex);
        return _cv.wait_for(lock, chrono::seconds(10), [this, length]() { return body.size() >= length; });
    }
};
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
TEST_CASE("http_transport_content_length") {
    LoopbackServer server(vector<string>{"HTTP/1.1 200 OK\r\nContent-Type: Video/MP4; codecs=avc1\r\nContent-Length: 11\r\nAccept-Ranges: bytes\r\n\r\nhello world"});
    HttpTransport transport;
    TransferRecorder recorder;
    auto transfer = transport.open(server.url("/clip.mp4"), recorder);
    REQUIRE(recorder.waitDone());
    transfer.reset();

    REQUIRE(recorder.completed);
    REQUIRE(!recorder.error);
    REQUIRE(recorder.responses.size() == 1);
    REQUIRE(recorder.responses[0].status == 200);
    REQUIRE(recorder.responses[0].contentType == "video/mp4");
    REQUIRE(recorder.responses[0].contentLength == 11);
    REQUIRE(recorder.responses[0].acceptsRanges);
    REQUIRE(recorder.body == "hello world");

    auto requests = server.requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].starts_with("GET /clip.mp4 HTTP/1.1\r\n"));
    REQUIRE(requests[0].find("Accept-Encoding: identity\r\n") != string::npos);
}
//---------------------------------------------------------------------------
TEST_CASE("http_transport_chunked") {
    LoopbackServer server(vector<string>{"HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n"});
    HttpTransport transport;
    TransferRecorder recorder;
    auto transfer = transport.open(server.url("/live"), recorder);
    REQUIRE(recorder.waitDone());
    transfer.reset();

    REQUIRE(recorder.completed);
    REQUIRE(recorder.responses.size() == 1);
    REQUIRE(recorder.responses[0].contentLength == -1);
    REQUIRE(!recorder.responses[0].acceptsRanges);
    REQUIRE(recorder.body == "hello world");
}
//---------------------------------------------------------------------------
TEST_CASE("http_transport_connection_close") {
    LoopbackServer server(vector<string>{"HTTP/1.0 200 OK\r\nContent-Type: audio/mpeg\r\n\r\nstreamed until close"});
    HttpTransport transport;
    TransferRecorder recorder;
    auto transfer = transport.open(server.url("/radio"), recorder);
    REQUIRE(recorder.waitDone());
    transfer.reset();

    REQUIRE(recorder.completed);
    REQUIRE(recorder.responses.size() == 1);
    REQUIRE(recorder.responses[0].contentLength == -1);
    REQUIRE(recorder.responses[0].contentType == "audio/mpeg");
    REQUIRE(recorder.body == "streamed until close");
}
//---------------------------------------------------------------------------
TEST_CASE("http_transport_redirect") {
    LoopbackServer server(vector<string>{"HTTP/1.1 302 Found\r\nLocation: /moved.mp4\r\nContent-Length: 0\r\n\r\n", "HTTP/1.1 200 OK\r\nContent-Length: 4\r\n\r\nmp4!"});
    HttpTransport transport;
    TransferRecorder recorder;
    auto transfer = transport.open(server.url("/clip.mp4"), recorder);
    REQUIRE(recorder.waitDone());
    transfer.reset();

    REQUIRE(recorder.completed);
    REQUIRE(recorder.responses.size() == 1);
    REQUIRE(recorder.responses[0].location == server.url("/moved.mp4"));
    REQUIRE(recorder.body == "mp4!");
    auto requests = server.requests();
    REQUIRE(requests.size() == 2);
    REQUIRE(requests[1].starts_with("GET /moved.mp4 HTTP/1.1\r\n"));
}
//---------------------------------------------------------------------------
TEST_CASE("http_transport_redirect_limit") {
    string redirect = "HTTP/1.1 301 Moved Permanently\r\nLocation: /again\r\nContent-Length: 0\r\n\r\n";
    LoopbackServer server(vector<string>{redirect, redirect});
    auto settings = TransportSettings::defaults();
    settings.maxRedirects = 1;
    HttpTransport transport(settings);
    TransferRecorder recorder;
    auto transfer = transport.open(server.url("/loop"), recorder);
    REQUIRE(recorder.waitDone());
    transfer.reset();

    REQUIRE(!recorder.completed);
    REQUIRE(recorder.error);
    REQUIRE(recorder.error->has(MessageFailureCode::Redirect));
    REQUIRE(recorder.responses.empty());
    REQUIRE(server.requests().size() == 2);
}
//---------------------------------------------------------------------------
TEST_CASE("http_transport_not_found") {
    LoopbackServer server(vector<string>{"HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n"});
    HttpTransport transport;
    TransferRecorder recorder;
    auto transfer = transport.open(server.url("/missing.mp4"), recorder);
    REQUIRE(recorder.waitDone());
    transfer.reset();

    REQUIRE(!recorder.completed);
    REQUIRE(recorder.error);
    REQUIRE(recorder.error->has(MessageFailureCode::HTTP));
    REQUIRE(recorder.error->status == 404);
    REQUIRE(recorder.responses.empty());
    REQUIRE(recorder.body.empty());
}
//---------------------------------------------------------------------------
TEST_CASE("http_transport_cancel") {
    LoopbackServer server(vector<string>{"HTTP/1.1 200 OK\r\nContent-Length: 1000\r\n\r\n" + string(100, 'x')}, true);
    HttpTransport transport;
    TransferRecorder recorder;
    auto transfer = transport.open(server.url("/clip.mp4"), recorder);
    REQUIRE(recorder.waitBody(100));

    // No event follows the cancellation
    transfer->cancel();
    transfer->cancel();
    transfer.reset();
    REQUIRE(!recorder.completed);
    REQUIRE(!recorder.error);
    REQUIRE(recorder.body.size() == 100);
    REQUIRE(recorder.responses.size() == 1);
}
//---------------------------------------------------------------------------
TEST_CASE("http_transport_timeout") {
    LoopbackServer server(vector<string>{"HTTP/1.1 200 OK\r\nContent-Length: 1000\r\n\r\n" + string(10, 'x')}, true);
    auto settings = TransportSettings::defaults();
    settings.timeout = chrono::milliseconds(200);
    HttpTransport transport(settings);
    TransferRecorder recorder;
    auto transfer = transport.open(server.url("/stall"), recorder);
    REQUIRE(recorder.waitDone());
    transfer.reset();

    REQUIRE(!recorder.completed);
    REQUIRE(recorder.error);
    REQUIRE(recorder.error->has(MessageFailureCode::Timeout));
    REQUIRE(recorder.body.size() == 10);
}
//---------------------------------------------------------------------------
TEST_CASE("http_transport_refused") {
    // Bind a port and release it again
    string url;
    {
        LoopbackServer server(vector<string>{});
        url = server.url("/gone");
    }
    HttpTransport transport;
    TransferRecorder recorder;
    auto transfer = transport.open(url, recorder);
    REQUIRE(recorder.waitDone());
    transfer.reset();

    REQUIRE(recorder.error);
    REQUIRE(recorder.error->has(MessageFailureCode::Socket));
    REQUIRE(recorder.responses.empty());
}
//---------------------------------------------------------------------------
} // namespace playcache::network::test
