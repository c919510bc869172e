#include "network/transfer_error.hpp"
#include <cstring>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2021
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace playcache::network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
string TransferError::describe() const
// Describe the error
{
    string description;
    for (uint16_t bit = 1; bit && bit <= static_cast<uint16_t>(MessageFailureCode::Resolve); bit = static_cast<uint16_t>(bit << 1)) {
        if (failureCode & bit) {
            if (!description.empty())
                description += "|";
            description += getFailureCode(static_cast<MessageFailureCode>(bit));
        }
    }
    if (description.empty())
        description = "Unknown";
    if (status)
        description += " (HTTP " + to_string(status) + ")";
    if (systemError)
        description += " (" + string(strerror(systemError)) + ")";
    if (!message.empty())
        description += ": " + message;
    return description;
}
//---------------------------------------------------------------------------
} // namespace playcache::network
