#include "network/transfer_error.hpp"
#include <catch2/catch.hpp>
#include <cerrno>
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
TEST_CASE("transfer_error") {
    TransferError error;
    REQUIRE(error.describe() == "Unknown");

    error.set(MessageFailureCode::HTTP);
    error.status = 404;
    error.message = "404 Not Found";
    REQUIRE(error.has(MessageFailureCode::HTTP));
    REQUIRE(!error.has(MessageFailureCode::Timeout));
    REQUIRE(error.describe() == "HTTP (HTTP 404): 404 Not Found");

    TransferError timeout;
    timeout.set(MessageFailureCode::Recv);
    timeout.set(MessageFailureCode::Timeout);
    timeout.systemError = ETIMEDOUT;
    auto description = timeout.describe();
    REQUIRE(description.starts_with("Timeout|Recv ("));
}
//---------------------------------------------------------------------------
} // namespace playcache::network::test
