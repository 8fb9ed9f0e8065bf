#pragma once
#include <cstdint>
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
/// This is the interface for classes that hold an established, blocking
/// byte channel to a server.
//---------------------------------------------------------------------------
class Socket {
    public:
    /// The destructor
    virtual ~Socket() noexcept = default;
    /// Send the whole buffer, throws IOError
    virtual void send(const uint8_t* data, uint64_t length) = 0;
    /// Receive up to length bytes, blocks until at least one byte arrived; 0 on orderly shutdown
    [[nodiscard]] virtual uint64_t recv(uint8_t* data, uint64_t length) = 0;
    /// Close the channel, safe to call more than once
    virtual void close() noexcept = 0;
    /// The file descriptor, -1 when closed
    [[nodiscard]] virtual int32_t fd() const noexcept = 0;
};
//---------------------------------------------------------------------------
} // namespace rangeblob::network
