#include "stream/lifecycle_controller.hpp"
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
using namespace std;
//---------------------------------------------------------------------------
LifecycleController::LifecycleController(const Delegate& delegate) : _delegate(delegate), _state(State::Created), _stalled(false)
// The constructor
{
}
//---------------------------------------------------------------------------
void LifecycleController::noteDelivery(uint64_t bytesAvailable, uint64_t prebufferSize, bool complete)
// Data was delivered
{
    if (_state == State::Disposed)
        return;
    _stalled = false;
    if (_state == State::Created && (bytesAvailable >= prebufferSize || complete))
        markPlayable();
}
//---------------------------------------------------------------------------
void LifecycleController::markPlayable()
// Enter Playable
{
    if (_state != State::Created)
        return;
    _state = State::Playable;
    if (_delegate.onReadyToPlay)
        _delegate.onReadyToPlay();
}
//---------------------------------------------------------------------------
void LifecycleController::reportStalled()
// The player ran out of data
{
    if (_state == State::Disposed || _stalled)
        return;
    _stalled = true;
    if (_delegate.onPlaybackStalled)
        _delegate.onPlaybackStalled();
}
//---------------------------------------------------------------------------
bool LifecycleController::dispose()
// Enter Disposed
{
    if (_state == State::Disposed)
        return false;
    _state = State::Disposed;
    _stalled = false;
    return true;
}
//---------------------------------------------------------------------------
} // namespace playcache::stream
