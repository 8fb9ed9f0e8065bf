#pragma once
#include <cstdint>
#include <string>
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
/// The tcp settings
struct TCPSettings {
    /// flag for noDelay
    int noDelay = 1;
    /// flag for keepAlive
    int keepAlive = 1;
    /// time for tcp keepIdle
    int keepIdle = 10;
    /// time for tcp keepIntvl
    int keepIntvl = 5;
    /// probe count
    int keepCnt = 3;
    /// recv buffer for tcp
    int recvBuffer = 0;
    /// The send and recv timeout in usec, 0 keeps the kernel defaults
    int timeout = 0;
};
//---------------------------------------------------------------------------
/// Config of the transport and the connection establishment
struct Config {
    /// Default number of connection attempts
    static constexpr unsigned defaultConnectAttempts = 5;
    /// Default number of followed redirects
    static constexpr unsigned defaultMaxRedirects = 20;
    /// Default receive chunk size
    static constexpr uint64_t defaultChunkSize = 64u << 10;

    /// The total number of attempts to establish a ranged connection
    unsigned connectAttempts = defaultConnectAttempts;
    /// Follow 3xx responses with a Location header
    bool followRedirects = true;
    /// The maximum redirects per request
    unsigned maxRedirects = defaultMaxRedirects;
    /// Verify the TLS peer certificate and hostname
    bool verifyPeer = true;
    /// Log failed attempts and redirects to stderr
    bool logRetries = true;
    /// The receive chunk size
    uint64_t chunkSize = defaultChunkSize;
    /// The user agent
    std::string userAgent = "RangeBlob";
    /// The socket settings
    TCPSettings tcpSettings = {};
};
//---------------------------------------------------------------------------
} // namespace rangeblob::network
