#include "network/http_helper.hpp"
#include <catch2/catch.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
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
/// Feed the response in pieces of step bytes, returns the body
string feed(HttpHelper& helper, string_view response, uint64_t step) {
    string body;
    auto callback = [&body](const uint8_t* data, uint64_t length) { body.append(reinterpret_cast<const char*>(data), length); };
    for (uint64_t pos = 0; pos < response.size(); pos += step) {
        auto piece = response.substr(pos, step);
        helper.consume(reinterpret_cast<const uint8_t*>(piece.data()), piece.size(), callback);
    }
    return body;
}
}
//---------------------------------------------------------------------------
TEST_CASE("http_helper_content_length") {
    string_view response = "HTTP/1.1 200 OK\r\nContent-Length: 11\r\nContent-Type: video/mp4\r\n\r\nhello world";
    for (uint64_t step : {1ull, 3ull, 7ull, 1000ull}) {
        HttpHelper helper;
        auto body = feed(helper, response, step);
        REQUIRE(helper.hasHeader());
        REQUIRE(helper.finished());
        REQUIRE(body == "hello world");
        REQUIRE(helper.getInfo()->encoding == HttpHelper::Encoding::ContentLength);
        REQUIRE(helper.getInfo()->length == 11);
        REQUIRE(helper.getBodyBytes() == 11);
    }
}
//---------------------------------------------------------------------------
TEST_CASE("http_helper_chunked") {
    string_view response = "HTTP/1.1 200 OK\r\nTransfer-Encoding: Chunked\r\n\r\n5;ext=1\r\nhello\r\n6\r\n world\r\n0\r\nX-Trailer: 1\r\n\r\n";
    for (uint64_t step : {1ull, 2ull, 5ull, 1000ull}) {
        HttpHelper helper;
        auto body = feed(helper, response, step);
        REQUIRE(helper.finished());
        REQUIRE(body == "hello world");
        REQUIRE(helper.getInfo()->encoding == HttpHelper::Encoding::ChunkedEncoding);
        REQUIRE(helper.getInfo()->length == 11);
    }

    HttpHelper broken;
    string_view invalid = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n";
    REQUIRE_THROWS_AS(feed(broken, invalid, invalid.size()), runtime_error);
}
//---------------------------------------------------------------------------
TEST_CASE("http_helper_connection_close") {
    HttpHelper helper;
    auto body = feed(helper, "HTTP/1.0 200 OK\r\n\r\nuntil the end", 4);
    REQUIRE(helper.hasHeader());
    REQUIRE(!helper.finished());
    REQUIRE(helper.getInfo()->encoding == HttpHelper::Encoding::ConnectionClose);
    REQUIRE(helper.finishOnClose());
    REQUIRE(helper.finished());
    REQUIRE(body == "until the end");
    REQUIRE(helper.getInfo()->length == body.size());

    // A truncated length delimited body stays incomplete
    HttpHelper truncated;
    feed(truncated, "HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\nshort", 100);
    REQUIRE(!truncated.finishOnClose());
}
//---------------------------------------------------------------------------
TEST_CASE("http_helper_no_content") {
    HttpHelper helper;
    auto body = feed(helper, "HTTP/1.1 204 No Content\r\n\r\n", 100);
    REQUIRE(helper.finished());
    REQUIRE(body.empty());
    REQUIRE(helper.getInfo()->encoding == HttpHelper::Encoding::NoContent);

    auto info = HttpHelper::detect("HTTP/1.1 301 Moved Permanently\r\nLocation: https://b/\r\nContent-Length: 0\r\n\r\n");
    REQUIRE(info.response.status == 301);
    REQUIRE(info.encoding == HttpHelper::Encoding::ContentLength);
    REQUIRE(info.length == 0);
    REQUIRE_THROWS_AS(HttpHelper::detect("HTTP/1.1 200 OK\r\nContent-Length: -1\r\n\r\n"), runtime_error);
}
//---------------------------------------------------------------------------
} // namespace playcache::network::test
