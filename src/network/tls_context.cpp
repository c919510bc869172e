#include "network/tls_context.hpp"
#include <openssl/crypto.h>
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
using namespace std;
//---------------------------------------------------------------------------
TLSContext::TLSContext(bool verifyPeer) : _sessionCache()
// Construct the TLS Context
{
    // Set to TLS
    auto method = TLS_client_method();

    // Set up the context
    _ctx = SSL_CTX_new(method);
    if (!_ctx)
        return;

    SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION);

    // Trust the system store
    if (verifyPeer) {
        SSL_CTX_set_default_verify_paths(_ctx);
        SSL_CTX_set_verify(_ctx, SSL_VERIFY_PEER, nullptr);
    } else {
        SSL_CTX_set_verify(_ctx, SSL_VERIFY_NONE, nullptr);
    }

#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // Many media servers close without close_notify, the http framing detects truncation
    SSL_CTX_set_options(_ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif

    // Enable session cache
    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_CLIENT);
}
//---------------------------------------------------------------------------
TLSContext::~TLSContext()
// The desturctor
{
    // Remove all sessions
    for (auto& session : _sessionCache)
        SSL_SESSION_free(session.second);

    // Destroy context
    if (_ctx)
        SSL_CTX_free(_ctx);
}
//---------------------------------------------------------------------------
void TLSContext::initOpenSSL()
// Inits the openssl algos
{
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
}
//---------------------------------------------------------------------------
bool TLSContext::cacheSession(const string& peer, SSL* ssl)
// Caches the SSL session
{
    // Is the session already cached?
    if (SSL_session_reused(ssl))
        return false;

    auto session = SSL_get1_session(ssl);
    if (!session)
        return false;
    if (auto it = _sessionCache.find(peer); it != _sessionCache.end()) {
        SSL_SESSION_free(it->second);
        it->second = session;
    } else {
        _sessionCache.emplace(peer, session);
    }
    return true;
}
//---------------------------------------------------------------------------
bool TLSContext::dropSession(const string& peer)
// Drop the SSL session from cache
{
    if (auto it = _sessionCache.find(peer); it != _sessionCache.end()) {
        SSL_SESSION_free(it->second);
        _sessionCache.erase(it);
        return true;
    }
    return false;
}
//---------------------------------------------------------------------------
bool TLSContext::reuseSession(const string& peer, SSL* ssl)
// Reuses the SSL session
{
    if (auto it = _sessionCache.find(peer); it != _sessionCache.end()) {
        SSL_set_session(ssl, it->second);
        return true;
    }
    return false;
}
//---------------------------------------------------------------------------
} // namespace playcache::network
