#include "stream/transfer_session.hpp"
#include "stream/fulfillment_engine.hpp"
#include "utils/data_vector.hpp"
#include "utils/work_queue.hpp"
#include <utility>
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
TransferSession::TransferSession(FulfillmentEngine& engine, utils::WorkQueue& queue, network::Transport& transport, string location) : _engine(engine), _queue(queue), _transport(transport), _location(move(location)), _transfer(), _alive(make_shared<bool>(true)), _token(_alive), _state(State::Idle), _response(), _error()
// The constructor
{
}
//---------------------------------------------------------------------------
TransferSession::~TransferSession()
// The destructor
{
    cancel();
    // Joins the transport thread before the token dies
    _transfer.reset();
}
//---------------------------------------------------------------------------
void TransferSession::start()
// Open the transfer
{
    if (_state != State::Idle)
        return;
    _state = State::Active;
    try {
        _transfer = _transport.open(_location, *this);
    } catch (const exception&) {
        _state = State::Failed;
        throw;
    }
}
//---------------------------------------------------------------------------
void TransferSession::cancel()
// Cancel an active transfer
{
    if (_state != State::Active)
        return;
    _state = State::Cancelled;
    if (_transfer)
        _transfer->cancel();
}
//---------------------------------------------------------------------------
void TransferSession::abort()
// Abort an active transfer as failed
{
    if (_state != State::Active)
        return;
    _state = State::Failed;
    if (_transfer)
        _transfer->cancel();
}
//---------------------------------------------------------------------------
template <typename F>
void TransferSession::marshal(F&& func)
// Post an event onto the owner queue
{
    _queue.post([token = _token, func = forward<F>(func)]() {
        if (!token.expired())
            func();
    });
}
//---------------------------------------------------------------------------
void TransferSession::onResponse(const network::ResponseInfo& info)
// The response head arrived
{
    marshal([this, info]() {
        if (_state != State::Active)
            return;
        _response = info;
        _engine.onResponseMetadata(info);
    });
}
//---------------------------------------------------------------------------
void TransferSession::onData(unique_ptr<utils::DataVector<uint8_t>> chunk)
// The next body chunk arrived
{
    shared_ptr<const utils::DataVector<uint8_t>> shared(move(chunk));
    marshal([this, shared]() {
        if (_state != State::Active)
            return;
        _engine.onBytesReceived(shared);
    });
}
//---------------------------------------------------------------------------
void TransferSession::onComplete()
// The body is complete
{
    marshal([this]() {
        if (_state != State::Active)
            return;
        _state = State::Completed;
        _engine.onTransferComplete();
    });
}
//---------------------------------------------------------------------------
void TransferSession::onFailure(const network::TransferError& error)
// The transfer failed
{
    marshal([this, error]() {
        if (_state != State::Active)
            return;
        _state = State::Failed;
        _error = error;
        _engine.onTransferFailed(error);
    });
}
//---------------------------------------------------------------------------
} // namespace playcache::stream
