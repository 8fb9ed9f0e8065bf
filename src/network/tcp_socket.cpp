#include "network/tcp_socket.hpp"
#include "network/resolver.hpp"
#include "utils/errors.hpp"
#include <cerrno>
#include <cstring>
#include <string>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>
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
TCPSocket::~TCPSocket() noexcept
// The destructor
{
    close();
}
//---------------------------------------------------------------------------
unique_ptr<TCPSocket> TCPSocket::connect(Resolver& resolver, const string& hostname, uint32_t port, const TCPSettings& tcpSettings)
// Creates a new socket connection
{
    auto addr = resolver.resolve(hostname, port);
    string lastError = "no address";
    for (auto it = addr; it; it = it->ai_next) {
        auto fd = ::socket(it->ai_family, it->ai_socktype, it->ai_protocol);
        if (fd == -1) {
            lastError = "Socket creation error! " + string(strerror(errno));
            continue;
        }
        // Owned from here on, failed candidates get closed by the destructor
        auto socket = make_unique<TCPSocket>(fd);
        socket->configure(tcpSettings);

        int connectRes;
        do {
            connectRes = ::connect(fd, it->ai_addr, it->ai_addrlen);
        } while (connectRes < 0 && errno == EINTR);
        if (connectRes == 0)
            return socket;
        lastError = "Socket connect error! " + string(strerror(errno));
    }
    // The cached address may be stale
    resolver.invalidate(hostname, port);
    throw utils::IOError(lastError + " (" + hostname + ":" + to_string(port) + ")");
}
//---------------------------------------------------------------------------
void TCPSocket::configure(const TCPSettings& tcpSettings)
// Apply the socket options
{
    // Keep Alive
    if (tcpSettings.keepAlive > 0) {
        if (setsockopt(_fd, SOL_SOCKET, SO_KEEPALIVE, &tcpSettings.keepAlive, sizeof(tcpSettings.keepAlive)))
            throw utils::IOError("Socket creation error! - keep alive error");
        if (tcpSettings.keepIdle > 0 && setsockopt(_fd, SOL_TCP, TCP_KEEPIDLE, &tcpSettings.keepIdle, sizeof(tcpSettings.keepIdle)))
            throw utils::IOError("Socket creation error! - keep idle error");
        if (tcpSettings.keepIntvl > 0 && setsockopt(_fd, SOL_TCP, TCP_KEEPINTVL, &tcpSettings.keepIntvl, sizeof(tcpSettings.keepIntvl)))
            throw utils::IOError("Socket creation error! - keep intvl error");
        if (tcpSettings.keepCnt > 0 && setsockopt(_fd, SOL_TCP, TCP_KEEPCNT, &tcpSettings.keepCnt, sizeof(tcpSettings.keepCnt)))
            throw utils::IOError("Socket creation error! - keep cnt error");
    }

    // No Delay
    if (tcpSettings.noDelay > 0) {
        if (setsockopt(_fd, SOL_TCP, TCP_NODELAY, &tcpSettings.noDelay, sizeof(tcpSettings.noDelay)))
            throw utils::IOError("Socket creation error! - nodelay error");
    }

    // Recv buffer
    if (tcpSettings.recvBuffer > 0) {
        if (setsockopt(_fd, SOL_SOCKET, SO_RCVBUF, &tcpSettings.recvBuffer, sizeof(tcpSettings.recvBuffer)))
            throw utils::IOError("Socket creation error! - recvbuf error");
    }

    // Set timeout
    if (tcpSettings.timeout > 0) {
        struct timeval tv;
        tv.tv_sec = tcpSettings.timeout / (1000 * 1000);
        tv.tv_usec = tcpSettings.timeout % (1000 * 1000);
        if (setsockopt(_fd, SOL_SOCKET, SO_RCVTIMEO, reinterpret_cast<const char*>(&tv), sizeof tv))
            throw utils::IOError("Socket creation error - recv timeout error!");
        if (setsockopt(_fd, SOL_SOCKET, SO_SNDTIMEO, reinterpret_cast<const char*>(&tv), sizeof tv))
            throw utils::IOError("Socket creation error - send timeout error!");
    }
}
//---------------------------------------------------------------------------
void TCPSocket::send(const uint8_t* data, uint64_t length)
// Send the whole buffer
{
    uint64_t sent = 0;
    while (sent < length) {
        auto res = ::send(_fd, data + sent, length - sent, MSG_NOSIGNAL);
        if (res < 0) {
            if (errno == EINTR)
                continue;
            throw utils::IOError("Send error! " + string(strerror(errno)));
        }
        sent += static_cast<uint64_t>(res);
    }
}
//---------------------------------------------------------------------------
uint64_t TCPSocket::recv(uint8_t* data, uint64_t length)
// Receive up to length bytes
{
    while (true) {
        auto res = ::recv(_fd, data, length, 0);
        if (res >= 0)
            return static_cast<uint64_t>(res);
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            throw utils::IOError("Recv error! Timeout reached");
        throw utils::IOError("Recv error! " + string(strerror(errno)));
    }
}
//---------------------------------------------------------------------------
void TCPSocket::close() noexcept
// Close the socket
{
    if (_fd >= 0) {
        ::close(_fd);
        _fd = -1;
    }
}
//---------------------------------------------------------------------------
} // namespace rangeblob::network
