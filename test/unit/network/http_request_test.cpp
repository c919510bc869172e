#include "network/config.hpp"
#include "network/http_request.hpp"
#include "network/location.hpp"
#include "utils/data_vector.hpp"
#include <catch2/catch.hpp>
#include <string_view>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace playcache {
namespace network {
namespace test {
//---------------------------------------------------------------------------
TEST_CASE("http_request") {
    network::HttpRequest request;

    request.method = network::HttpRequest::Method::GET;
    request.path = "/media/clip.mp4?token=1";
    request.type = network::HttpRequest::Type::HTTP_1_1;
    request.headers.emplace("Host", "example.com");
    request.headers.emplace("Accept", "*/*");

    auto serialize = network::HttpRequest::serialize(request);
    auto serializeView = std::string_view(reinterpret_cast<char*>(serialize->data()), serialize->size());
    REQUIRE(serializeView.starts_with("GET /media/clip.mp4?token=1 HTTP/1.1\r\n"));
    REQUIRE(serializeView.ends_with("\r\n\r\n"));

    REQUIRE(serializeView == "GET /media/clip.mp4?token=1 HTTP/1.1\r\nAccept: */*\r\nHost: example.com\r\n\r\n");

    request.type = network::HttpRequest::Type::HTTP_1_0;
    serialize = network::HttpRequest::serialize(request);
    serializeView = std::string_view(reinterpret_cast<char*>(serialize->data()), serialize->size());
    REQUIRE(serializeView.starts_with("GET /media/clip.mp4?token=1 HTTP/1.0\r\n"));
}
//---------------------------------------------------------------------------
TEST_CASE("http_request_get") {
    auto location = Location::parse("https://cdn.example.com:8443/video/a.mp4");
    auto settings = TransportSettings::defaults();
    auto request = HttpRequest::buildGet(location, settings);

    REQUIRE(request.method == HttpRequest::Method::GET);
    REQUIRE(request.path == "/video/a.mp4");
    REQUIRE(request.headers.at("Host") == "cdn.example.com:8443");
    REQUIRE(request.headers.at("User-Agent") == settings.userAgent);
    REQUIRE(request.headers.at("Accept-Encoding") == "identity");
    REQUIRE(request.headers.at("Cache-Control") == "no-cache");
    REQUIRE(request.headers.at("Connection") == "close");
    REQUIRE(!request.headers.contains("Range"));
}
//---------------------------------------------------------------------------
} // namespace test
} // namespace network
} // namespace playcache
