#include "network/tls_context.hpp"
#include "utils/errors.hpp"
#include <csignal>
#include <functional>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
//---------------------------------------------------------------------------
// RangeBlob - Seekable HTTP Object Streams
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace rangeblob::network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TLSContext::TLSContext(bool verifyPeer) : _verifyPeer(verifyPeer), _sessionCache()
// Construct the TLS Context
{
    initOpenSSL();

    // Set to TLS
    auto method = TLS_client_method();

    // Set up the context
    _ctx = SSL_CTX_new(method);
    if (!_ctx)
        throw utils::IOError("TLS context creation error! " + lastError());

    // Enable session cache
    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_CLIENT);

    // Servers closing after the body without close_notify are not an error
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    SSL_CTX_set_options(_ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif

    if (_verifyPeer) {
        if (SSL_CTX_set_default_verify_paths(_ctx) != 1) {
            SSL_CTX_free(_ctx);
            throw utils::IOError("TLS context creation error! - verify paths " + lastError());
        }
        SSL_CTX_set_verify(_ctx, SSL_VERIFY_PEER, nullptr);
    } else {
        SSL_CTX_set_verify(_ctx, SSL_VERIFY_NONE, nullptr);
    }
}
//---------------------------------------------------------------------------
TLSContext::~TLSContext()
// The desturctor
{
    // Remove all sessions
    for (uint64_t i = 0ull; i < (1ull << cachePower); i++) {
        if (_sessionCache[i].first && _sessionCache[i].second) {
            SSL_SESSION_free(_sessionCache[i].second);
        }
    }

    // Destroy context
    if (_ctx)
        SSL_CTX_free(_ctx);
}
//---------------------------------------------------------------------------
void TLSContext::initOpenSSL()
// Inits the openssl algos
{
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
    // OpenSSL writes with write(2), a peer reset must not kill the process
    signal(SIGPIPE, SIG_IGN);
}
//---------------------------------------------------------------------------
string TLSContext::lastError()
// Drain the OpenSSL error queue
{
    string result;
    char buffer[256];
    while (auto error = ERR_get_error()) {
        ERR_error_string_n(error, buffer, sizeof(buffer));
        if (!result.empty())
            result += "; ";
        result += buffer;
    }
    return result.empty() ? "unknown TLS error" : result;
}
//---------------------------------------------------------------------------
uint64_t TLSContext::sessionKey(const string& hostAndPort)
// Hash of the host, 0 marks empty slots
{
    auto key = static_cast<uint64_t>(hash<string>{}(hostAndPort));
    return key ? key : 1;
}
//---------------------------------------------------------------------------
bool TLSContext::cacheSession(const string& hostAndPort, SSL* ssl)
// Caches the SSL session
{
    // Is the session already cached?
    if (SSL_session_reused(ssl))
        return false;

    auto session = SSL_get1_session(ssl);
    if (!session)
        return false;

    auto key = sessionKey(hostAndPort);
    auto& slot = _sessionCache[key & cacheMask];
    if (slot.first && slot.second)
        SSL_SESSION_free(slot.second);
    slot = pair<uint64_t, SSL_SESSION*>(key, session);
    return true;
}
//---------------------------------------------------------------------------
bool TLSContext::dropSession(const string& hostAndPort)
// Drop the SSL session from cache
{
    auto key = sessionKey(hostAndPort);
    auto& slot = _sessionCache[key & cacheMask];
    if (slot.first == key) {
        SSL_SESSION_free(slot.second);
        slot = pair<uint64_t, SSL_SESSION*>(0, nullptr);
        return true;
    }
    return false;
}
//---------------------------------------------------------------------------
bool TLSContext::reuseSession(const string& hostAndPort, SSL* ssl)
// Reuses the SSL session
{
    auto key = sessionKey(hostAndPort);
    auto& slot = _sessionCache[key & cacheMask];
    if (slot.first == key && slot.second)
        return SSL_set_session(ssl, slot.second) == 1;
    return false;
}
//---------------------------------------------------------------------------
} // namespace rangeblob::network
