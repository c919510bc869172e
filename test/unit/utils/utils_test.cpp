#include "utils/utils.hpp"
#include <catch2/catch.hpp>
#include <string>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace playcache::utils::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TEST_CASE("utils_sha256") {
    string plain = "abc";
    auto hash = utils::sha256Encode(reinterpret_cast<const uint8_t*>(plain.data()), plain.length());
    REQUIRE(hash == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    auto empty = utils::sha256Encode(nullptr, 0);
    REQUIRE(empty == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}
//---------------------------------------------------------------------------
TEST_CASE("utils_hex") {
    uint8_t data[] = {0x00, 0xff, 0x1a};
    REQUIRE(utils::hexEncode(data, sizeof(data)) == "00ff1a");
    REQUIRE(utils::hexEncode(data, sizeof(data), true) == "00FF1A");
    REQUIRE(utils::hexEncode(data, 0).empty());
}
//---------------------------------------------------------------------------
TEST_CASE("utils_strings") {
    REQUIRE(utils::equalsIgnoreCase("Content-Length", "content-length"));
    REQUIRE(!utils::equalsIgnoreCase("Content-Length", "Content-Type"));
    REQUIRE(!utils::equalsIgnoreCase("abc", "abcd"));
    REQUIRE(utils::toLower("Video/MP4") == "video/mp4");
    REQUIRE(utils::trim(" \t value \r\n") == "value");
    REQUIRE(utils::trim("   ").empty());
}
//---------------------------------------------------------------------------
} // namespace playcache::utils::test
