#pragma once
#include <string>
#include <unordered_map>
#include <openssl/ssl.h>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2023
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace playcache::network {
//---------------------------------------------------------------------------
class TLSConnection;
//---------------------------------------------------------------------------
// Although the tls context can be used safe in multi-threading enviornments,
// we allow only one context per transfer thread to avoid locking.
// This simplifies also the caching of sessions across redirects.
class TLSContext {
    /// The ssl context
    SSL_CTX* _ctx;
    /// The session cache by host and port
    std::unordered_map<std::string, SSL_SESSION*> _sessionCache;

    public:
    /// The constructor
    explicit TLSContext(bool verifyPeer = true);
    /// The destructor
    ~TLSContext();
    /// No copies
    TLSContext(const TLSContext&) = delete;
    /// No copies
    TLSContext& operator=(const TLSContext&) = delete;

    /// Is the context usable
    [[nodiscard]] bool valid() const { return _ctx; }
    /// Caches the SSL session
    bool cacheSession(const std::string& peer, SSL* ssl);
    /// Drops the SSL session
    bool dropSession(const std::string& peer);
    /// Reuses a SSL session
    bool reuseSession(const std::string& peer, SSL* ssl);

    /// Init the OpenSSL algos and errors
    static void initOpenSSL();

    friend TLSConnection;
};
//---------------------------------------------------------------------------
} // namespace playcache::network
