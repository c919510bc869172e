#pragma once
#include "stream/delegate.hpp"
#include <cstdint>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace playcache::stream {
//---------------------------------------------------------------------------
/// The playback lifecycle of a resource: Created -> Playable, Disposed is
/// terminal. Stalled is orthogonal and left on the next delivery.
class LifecycleController {
    public:
    /// The state
    enum class State : uint8_t {
        Created,
        Playable,
        Disposed
    };

    private:
    /// The delegate
    const Delegate& _delegate;
    /// The state
    State _state;
    /// Is the playback stalled
    bool _stalled;

    public:
    /// The constructor
    explicit LifecycleController(const Delegate& delegate);

    /// Data was delivered, fires onReadyToPlay once the prebuffer or the whole resource is there
    void noteDelivery(uint64_t bytesAvailable, uint64_t prebufferSize, bool complete);
    /// Enter Playable, fires onReadyToPlay once
    void markPlayable();
    /// The player ran out of data, fires onPlaybackStalled when entering the stall
    void reportStalled();
    /// Enter Disposed, false if already disposed
    bool dispose();

    /// Get the state
    [[nodiscard]] State getState() const { return _state; }
    /// Is the playback stalled
    [[nodiscard]] bool isStalled() const { return _stalled; }
    /// Is it disposed
    [[nodiscard]] bool isDisposed() const { return _state == State::Disposed; }

    /// Get the state name
    static constexpr auto getStateName(const State& state) noexcept {
        switch (state) {
            case State::Created: return "Created";
            case State::Playable: return "Playable";
            case State::Disposed: return "Disposed";
            default: return "UNKNOWN";
        }
    }
};
//---------------------------------------------------------------------------
} // namespace playcache::stream
