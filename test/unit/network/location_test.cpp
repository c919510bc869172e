#include "network/location.hpp"
#include <catch2/catch.hpp>
#include <stdexcept>
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
TEST_CASE("location_parse") {
    auto location = Location::parse("https://user:pw@Media.Example.com/videos/clip.mp4?sig=abc#t=10");
    REQUIRE(location.scheme == Location::Scheme::HTTPS);
    REQUIRE(location.tls());
    REQUIRE(location.host == "Media.Example.com");
    REQUIRE(location.port == 443);
    REQUIRE(location.path == "/videos/clip.mp4?sig=abc");
    REQUIRE(location.hostHeader() == "Media.Example.com");

    auto plain = Location::parse("http://127.0.0.1:8080");
    REQUIRE(plain.scheme == Location::Scheme::HTTP);
    REQUIRE(plain.port == 8080);
    REQUIRE(plain.path == "/");
    REQUIRE(plain.toString() == "http://127.0.0.1:8080/");

    auto ipv6 = Location::parse("http://[::1]:81?x=1");
    REQUIRE(ipv6.host == "::1");
    REQUIRE(ipv6.port == 81);
    REQUIRE(ipv6.path == "/?x=1");
    REQUIRE(ipv6.hostHeader() == "[::1]:81");
}
//---------------------------------------------------------------------------
TEST_CASE("location_invalid") {
    REQUIRE_THROWS_AS(Location::parse("ftp://example.com/a"), std::runtime_error);
    REQUIRE_THROWS_AS(Location::parse("http:///path"), std::runtime_error);
    REQUIRE_THROWS_AS(Location::parse("http://example.com:0/"), std::runtime_error);
    REQUIRE_THROWS_AS(Location::parse("http://example.com:70000/"), std::runtime_error);
    REQUIRE_THROWS_AS(Location::parse("http://[::1/"), std::runtime_error);
}
//---------------------------------------------------------------------------
TEST_CASE("location_resolve") {
    auto base = Location::parse("https://a.example.com/media/v1/clip.mp4?x=1");
    REQUIRE(base.resolve("http://b.example.com/other").toString() == "http://b.example.com/other");
    REQUIRE(base.resolve("//c.example.com/x").toString() == "https://c.example.com/x");
    REQUIRE(base.resolve("/root.mp4").toString() == "https://a.example.com/root.mp4");
    REQUIRE(base.resolve("next.mp4").toString() == "https://a.example.com/media/v1/next.mp4");
    REQUIRE(base.resolve("?y=2").toString() == "https://a.example.com/media/v1/clip.mp4?y=2");
    REQUIRE_THROWS_AS(base.resolve(" "), std::runtime_error);
}
//---------------------------------------------------------------------------
} // namespace playcache::network::test
