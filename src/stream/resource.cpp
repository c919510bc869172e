#include "stream/resource.hpp"
#include "utils/data_vector.hpp"
#include <stdexcept>
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
Resource::Resource(string location, string mimeType, string fileExtension, shared_ptr<const utils::DataVector<uint8_t>> payload) : _location(move(location)), _mimeType(move(mimeType)), _fileExtension(move(fileExtension)), _payload(move(payload))
// The constructor
{
}
//---------------------------------------------------------------------------
Resource Resource::fromLocation(string location, string mimeType)
// A remote resource
{
    if (location.empty())
        throw invalid_argument("Resource: empty location");
    return Resource(move(location), move(mimeType), "", nullptr);
}
//---------------------------------------------------------------------------
Resource Resource::fromPayload(utils::DataVector<uint8_t> payload, string mimeType, string fileExtension)
// An in-memory payload
{
    return Resource("", move(mimeType), move(fileExtension), make_shared<const utils::DataVector<uint8_t>>(move(payload)));
}
//---------------------------------------------------------------------------
optional<ContentMetadata> Resource::declaredMetadata() const
// The metadata known without any transfer
{
    if (!_payload)
        return nullopt;
    return ContentMetadata{.contentType = _mimeType, .contentLength = static_cast<int64_t>(_payload->size()), .supportsRangeAccess = true};
}
//---------------------------------------------------------------------------
} // namespace playcache::stream
