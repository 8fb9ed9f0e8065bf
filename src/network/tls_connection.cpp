#include "network/tls_connection.hpp"
#include "network/tcp_socket.hpp"
#include "network/tls_context.hpp"
#include "utils/errors.hpp"
#include <cerrno>
#include <climits>
#include <cstring>
#include <memory>
#include <utility>
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
namespace rangeblob {
namespace network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TLSConnection::TLSConnection(TLSContext& context, unique_ptr<TCPSocket> socket) : _context(context), _socket(move(socket)), _ssl(nullptr), _connected(false)
// The consturctor
{
}
//---------------------------------------------------------------------------
TLSConnection::~TLSConnection() noexcept
// The desturctor
{
    close();
}
//---------------------------------------------------------------------------
void TLSConnection::connect(const string& hostname, uint32_t port)
// SSL/TLS handshake
{
    ERR_clear_error();
    _hostAndPort = hostname + ":" + to_string(port);
    _ssl = SSL_new(_context._ctx);
    if (!_ssl)
        throw utils::IOError("TLS error! " + TLSContext::lastError());
    SSL_set_connect_state(_ssl);
    if (SSL_set_fd(_ssl, _socket->fd()) != 1)
        throw utils::IOError("TLS error! " + TLSContext::lastError());
    if (SSL_set_tlsext_host_name(_ssl, hostname.c_str()) != 1)
        throw utils::IOError("TLS error! - server name " + TLSContext::lastError());
    if (_context.verifyPeer() && SSL_set1_host(_ssl, hostname.c_str()) != 1)
        throw utils::IOError("TLS error! - host verification " + TLSContext::lastError());
    _context.reuseSession(_hostAndPort, _ssl);

    errno = 0;
    auto status = SSL_connect(_ssl);
    if (status != 1) {
        auto error = SSL_get_error(_ssl, status);
        string message = "TLS handshake error with " + _hostAndPort + "! ";
        if (error == SSL_ERROR_SYSCALL && errno)
            message += strerror(errno);
        else
            message += TLSContext::lastError();
        if (auto verify = SSL_get_verify_result(_ssl); verify != X509_V_OK)
            message += string(" (") + X509_verify_cert_error_string(verify) + ")";
        _context.dropSession(_hostAndPort);
        throw utils::IOError(message);
    }
    _connected = true;
}
//---------------------------------------------------------------------------
void TLSConnection::send(const uint8_t* data, uint64_t length)
// Send a TLS encrypted message
{
    uint64_t sent = 0;
    while (sent < length) {
        auto chunk = static_cast<int>(length - sent > INT_MAX ? INT_MAX : length - sent);
        errno = 0;
        auto status = SSL_write(_ssl, data + sent, chunk);
        if (status <= 0) {
            auto error = SSL_get_error(_ssl, status);
            if (error == SSL_ERROR_WANT_WRITE || error == SSL_ERROR_WANT_READ)
                continue;
            throw utils::IOError("TLS send error! " + (error == SSL_ERROR_SYSCALL && errno ? string(strerror(errno)) : TLSContext::lastError()));
        }
        sent += static_cast<uint64_t>(status);
    }
}
//---------------------------------------------------------------------------
uint64_t TLSConnection::recv(uint8_t* data, uint64_t length)
// Recv a TLS encrypted message
{
    auto chunk = static_cast<int>(length > INT_MAX ? INT_MAX : length);
    while (true) {
        errno = 0;
        auto status = SSL_read(_ssl, data, chunk);
        if (status > 0)
            return static_cast<uint64_t>(status);
        auto error = SSL_get_error(_ssl, status);
        switch (error) {
            case SSL_ERROR_ZERO_RETURN:
                return 0;
            case SSL_ERROR_WANT_READ: // fallthrough
            case SSL_ERROR_WANT_WRITE:
                continue;
            case SSL_ERROR_SYSCALL:
                // Peer closed the tcp connection without close_notify
                if (!errno)
                    return 0;
                if (errno == EAGAIN || errno == EWOULDBLOCK)
                    throw utils::IOError("TLS recv error! Timeout reached");
                throw utils::IOError("TLS recv error! " + string(strerror(errno)));
            default:
                throw utils::IOError("TLS recv error! " + TLSContext::lastError());
        }
    }
}
//---------------------------------------------------------------------------
void TLSConnection::close() noexcept
// SSL/TLS shutdown
{
    if (_ssl) {
        if (_connected) {
            // One-way shutdown, the peer's close_notify is not awaited
            SSL_shutdown(_ssl);
            _context.cacheSession(_hostAndPort, _ssl);
        }
        SSL_free(_ssl);
        _ssl = nullptr;
        _connected = false;
        ERR_clear_error();
    }
    if (_socket)
        _socket->close();
}
//---------------------------------------------------------------------------
int32_t TLSConnection::fd() const noexcept
// The file descriptor
{
    return _socket ? _socket->fd() : -1;
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace rangeblob
