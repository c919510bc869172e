#pragma once
#include <cstdint>
#include <string>
#include <string_view>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace playcache::utils {
//---------------------------------------------------------------------------
/// Encode everything from binary representation to hex
std::string hexEncode(const uint8_t* input, uint64_t length, bool upper = false);
/// Build sha256 of the data encoded as hex
std::string sha256Encode(const uint8_t* data, uint64_t length);
/// Compare two strings ignoring ASCII case
bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs);
/// Lower case ASCII copy
std::string toLower(std::string_view input);
/// Remove leading and trailing whitespaces
std::string_view trim(std::string_view input);
//---------------------------------------------------------------------------
} // namespace playcache::utils
