#pragma once
#include "network/socket.hpp"
#include <memory>
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
class TLSContext;
class TCPSocket;
//---------------------------------------------------------------------------
/// The TLS Interface
//---------------------------------------------------------------------------
/* rangeblob |   OpenSSL
 *   |       |
 *    ---------> SSL_read / SSL_write / SSL_connect
 *           |        ||
 *           |     socket fd (blocking)
 *           |        ||
 *    ---------<  TCPSocket
*/
//---------------------------------------------------------------------------
class TLSConnection : public Socket {
    /// The SSL context
    TLSContext& _context;
    /// The underlying tcp socket
    std::unique_ptr<TCPSocket> _socket;
    /// The SSL connection
    SSL* _ssl;
    /// The host and port used for the session cache
    std::string _hostAndPort;
    /// Handshake finished
    bool _connected;

    public:
    /// The constructor
    TLSConnection(TLSContext& context, std::unique_ptr<TCPSocket> socket);
    /// The destructor
    ~TLSConnection() noexcept override;
    /// No copies
    TLSConnection(const TLSConnection&) = delete;
    TLSConnection& operator=(const TLSConnection&) = delete;

    /// SSL/TLS handshake with SNI and optional hostname verification, throws IOError
    void connect(const std::string& hostname, uint32_t port);
    /// Get the SSL/TLS context
    [[nodiscard]] inline TLSContext& getContext() const { return _context; }

    /// Send a TLS encrypted message
    void send(const uint8_t* data, uint64_t length) override;
    /// Recv a TLS encrypted message
    [[nodiscard]] uint64_t recv(uint8_t* data, uint64_t length) override;
    /// SSL/TLS shutdown and close of the socket
    void close() noexcept override;
    /// The file descriptor
    [[nodiscard]] int32_t fd() const noexcept override;
};
//---------------------------------------------------------------------------
} // namespace rangeblob::network
