#include "utils/data_vector.hpp"
#include <catch2/catch.hpp>
#include <stdexcept>
#include <string_view>
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
TEST_CASE("data_vector") {
    DataVector<uint64_t> dv;
    dv.reserve(1);
    *dv.data() = 42;
    REQUIRE(dv.size() == 0);
    dv.resize(1);
    REQUIRE(*dv.cdata() == 42);
    REQUIRE(dv.capacity() == 1);
    dv.resize(2);
    *(dv.data() + 1) = 43;
    REQUIRE(dv.size() == 2);
    REQUIRE(dv.capacity() == 2);
    REQUIRE(*dv.cdata() == 42);
    REQUIRE(*(dv.cdata() + 1) == 43);
    auto dv2 = dv;
    REQUIRE(dv2.size() == 2);
    REQUIRE(dv2.capacity() == 2);
    auto dv3 = std::move(dv2);
    REQUIRE(dv3.size() == 2);
    REQUIRE(dv2.empty());
}
//---------------------------------------------------------------------------
TEST_CASE("data_vector_append") {
    std::string_view text = "progressive";
    DataVector<uint8_t> dv;
    dv.append(reinterpret_cast<const uint8_t*>(text.data()), 4);
    dv.append(reinterpret_cast<const uint8_t*>(text.data()) + 4, text.size() - 4);
    REQUIRE(dv.size() == text.size());
    REQUIRE(dv.capacity() >= dv.size());
    REQUIRE(std::string_view(reinterpret_cast<const char*>(dv.cdata()), dv.size()) == text);

    auto view = dv.view(4, 3);
    REQUIRE(std::string_view(reinterpret_cast<const char*>(view.data()), view.size()) == "res");
    REQUIRE(dv.view(dv.size(), 0).empty());
    REQUIRE_THROWS_AS(dv.view(8, 4), std::out_of_range);

    auto buffer = dv.transferBuffer();
    REQUIRE(buffer);
    REQUIRE(dv.empty());
    REQUIRE(dv.capacity() == 0);
}
//---------------------------------------------------------------------------
} // namespace playcache::utils::test
