#pragma once
#include "network/config.hpp"
#include "network/socket.hpp"
#include <memory>
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
class Resolver;
//---------------------------------------------------------------------------
/// A blocking TCP connection that owns its file descriptor
class TCPSocket : public Socket {
    /// The file descriptor
    int32_t _fd;

    public:
    /// The constructor, takes ownership of fd
    explicit TCPSocket(int32_t fd) : _fd(fd) {}
    /// The destructor
    ~TCPSocket() noexcept override;
    /// No copies
    TCPSocket(const TCPSocket&) = delete;
    TCPSocket& operator=(const TCPSocket&) = delete;

    /// Connects to the first reachable address of the host, throws IOError
    [[nodiscard]] static std::unique_ptr<TCPSocket> connect(Resolver& resolver, const std::string& hostname, uint32_t port, const TCPSettings& tcpSettings);

    /// Send the whole buffer
    void send(const uint8_t* data, uint64_t length) override;
    /// Receive up to length bytes
    [[nodiscard]] uint64_t recv(uint8_t* data, uint64_t length) override;
    /// Close the socket
    void close() noexcept override;
    /// The file descriptor
    [[nodiscard]] int32_t fd() const noexcept override { return _fd; }

    private:
    /// Apply the tcp settings
    void configure(const TCPSettings& tcpSettings);
};
//---------------------------------------------------------------------------
} // namespace rangeblob::network
