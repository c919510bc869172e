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
namespace playcache::network {
//---------------------------------------------------------------------------
/// A parsed http or https location
struct Location {
    /// The scheme
    enum class Scheme : uint8_t {
        HTTP,
        HTTPS
    };

    /// The scheme
    Scheme scheme = Scheme::HTTP;
    /// The host name or ip address, without brackets for ipv6
    std::string host;
    /// The port
    uint32_t port = 80;
    /// The path including the query, always starts with a slash
    std::string path = "/";

    /// Get the scheme prefix
    static constexpr auto getScheme(const Scheme& scheme) noexcept {
        switch (scheme) {
            case Scheme::HTTP: return "http";
            case Scheme::HTTPS: return "https";
            default: return "UNKNOWN";
        }
    }
    /// Get the default port of a scheme
    static constexpr uint32_t getDefaultPort(const Scheme& scheme) noexcept {
        return scheme == Scheme::HTTPS ? 443 : 80;
    }

    /// Is it a tls location
    [[nodiscard]] bool tls() const { return scheme == Scheme::HTTPS; }
    /// The value of the Host header
    [[nodiscard]] std::string hostHeader() const;
    /// The full url
    [[nodiscard]] std::string toString() const;
    /// Resolve a redirect target relative to this location
    [[nodiscard]] Location resolve(std::string_view reference) const;

    /// Parse an absolute http(s) url, throws runtime_error on invalid input
    [[nodiscard]] static Location parse(std::string_view url);
};
//---------------------------------------------------------------------------
} // namespace playcache::network
