#include "stream/lifecycle_controller.hpp"
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
namespace playcache::stream::test {
//---------------------------------------------------------------------------
TEST_CASE("lifecycle_controller") {
    auto ready = 0;
    auto stalled = 0;
    Delegate delegate;
    delegate.onReadyToPlay = [&ready]() { ready++; };
    delegate.onPlaybackStalled = [&stalled]() { stalled++; };
    LifecycleController lifecycle(delegate);
    REQUIRE(lifecycle.getState() == LifecycleController::State::Created);

    // Below the prebuffer
    lifecycle.noteDelivery(100, 300, false);
    REQUIRE(ready == 0);
    lifecycle.noteDelivery(300, 300, false);
    REQUIRE(ready == 1);
    REQUIRE(lifecycle.getState() == LifecycleController::State::Playable);
    lifecycle.noteDelivery(600, 300, false);
    lifecycle.markPlayable();
    REQUIRE(ready == 1);

    lifecycle.reportStalled();
    lifecycle.reportStalled();
    REQUIRE(stalled == 1);
    REQUIRE(lifecycle.isStalled());
    lifecycle.noteDelivery(700, 300, false);
    REQUIRE(!lifecycle.isStalled());
    lifecycle.reportStalled();
    REQUIRE(stalled == 2);

    REQUIRE(lifecycle.dispose());
    REQUIRE(!lifecycle.dispose());
    REQUIRE(lifecycle.isDisposed());
    lifecycle.reportStalled();
    REQUIRE(stalled == 2);
}
//---------------------------------------------------------------------------
TEST_CASE("lifecycle_controller_complete") {
    auto ready = 0;
    Delegate delegate;
    delegate.onReadyToPlay = [&ready]() { ready++; };
    LifecycleController lifecycle(delegate);
    // A resource smaller than the prebuffer is ready once complete
    lifecycle.noteDelivery(10, 300, true);
    REQUIRE(ready == 1);

    LifecycleController disposed(delegate);
    REQUIRE(disposed.dispose());
    disposed.noteDelivery(1000, 300, true);
    disposed.markPlayable();
    REQUIRE(ready == 1);
    REQUIRE(LifecycleController::getStateName(disposed.getState()) == std::string("Disposed"));
}
//---------------------------------------------------------------------------
} // namespace playcache::stream::test
