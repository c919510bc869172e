#pragma once
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
/// Config of the buffering of one resource
struct Config {
    /// Default read window of the disk mode
    static constexpr uint64_t defaultMaxBufferSize = 1ull << 20;
    /// Default bytes needed before the resource counts as playable
    static constexpr uint64_t defaultPrebufferSize = 256ull << 10;
    /// Default upper bound of the memory reserved up front for a known length
    static constexpr uint64_t defaultMaxReserveSize = 64ull << 20;

    /// Upper bound of a single delivery in disk mode
    uint64_t maxBufferSize = defaultMaxBufferSize;
    /// Bytes needed before the resource counts as playable
    uint64_t prebufferSize = defaultPrebufferSize;
    /// Memory reserved up front in memory mode, larger resources grow on arrival
    uint64_t maxReserveSize = defaultMaxReserveSize;

    /// The default config
    static constexpr Config defaults() { return Config(); }
};
//---------------------------------------------------------------------------
} // namespace playcache::stream
