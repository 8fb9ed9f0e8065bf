#pragma once
#include <array>
#include <cstdint>
#include <string>
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
class TLSConnection;
//---------------------------------------------------------------------------
// Although the tls context can be used safe in multi-threading enviornments,
// a context belongs to one transport to avoid locking.
// A seek reconnects to the same host, so the sessions are cached per host
// and resumed on the next handshake.
class TLSContext {
    /// The ssl context
    SSL_CTX* _ctx;
    /// Verify the peer
    bool _verifyPeer;
    /// The cache size as power of 2
    static constexpr uint8_t cachePower = 6;
    /// The cache mask
    static constexpr uint64_t cacheMask = (~0ull) >> (64 - cachePower);
    /// The session cache, keyed by the hash of host and port
    std::array<std::pair<uint64_t, SSL_SESSION*>, 1ull << cachePower> _sessionCache;

    public:
    /// The constructor
    explicit TLSContext(bool verifyPeer = true);
    /// The destructor
    ~TLSContext();
    /// No copies
    TLSContext(const TLSContext&) = delete;
    TLSContext& operator=(const TLSContext&) = delete;

    /// Caches the SSL session
    bool cacheSession(const std::string& hostAndPort, SSL* ssl);
    /// Drops the SSL session
    bool dropSession(const std::string& hostAndPort);
    /// Reuses a SSL session
    bool reuseSession(const std::string& hostAndPort, SSL* ssl);
    /// Verify the peer?
    [[nodiscard]] bool verifyPeer() const { return _verifyPeer; }

    /// Init the OpenSSL algos and errors
    static void initOpenSSL();
    /// The last OpenSSL error as string
    [[nodiscard]] static std::string lastError();

    friend TLSConnection;

    private:
    /// The hash of the session key, never 0
    [[nodiscard]] static uint64_t sessionKey(const std::string& hostAndPort);
};
//---------------------------------------------------------------------------
} // namespace rangeblob::network
