#pragma once
#include "network/config.hpp"
#include "network/transport.hpp"
#include <memory>
#include <string>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace playcache::network {
//---------------------------------------------------------------------------
/// The http(s) transport. Every transfer runs a sequential GET of the full
/// resource on its own worker thread, following redirects.
class HttpTransport : public Transport {
    /// The settings
    TransportSettings _settings;

    public:
    /// The constructor
    explicit HttpTransport(TransportSettings settings = TransportSettings::defaults());

    /// Start the transfer of the whole resource
    [[nodiscard]] std::unique_ptr<Transfer> open(const std::string& location, TransferListener& listener) override;
    /// Get the settings
    [[nodiscard]] const TransportSettings& getSettings() const { return _settings; }
};
//---------------------------------------------------------------------------
} // namespace playcache::network
