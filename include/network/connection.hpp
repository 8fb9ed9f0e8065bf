#pragma once
#include "network/http_request.hpp"
#include "network/http_response.hpp"
#include <cstdint>
#include <memory>
//---------------------------------------------------------------------------
// RangeBlob - Seekable HTTP Object Streams
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace rangeblob {
//---------------------------------------------------------------------------
namespace cloud {
class RemoteObjectRef;
} // namespace cloud
//---------------------------------------------------------------------------
namespace network {
//---------------------------------------------------------------------------
/// An exchanged request whose response header has been received.
/// The body is yielded strictly forward.
class Connection {
    public:
    /// The destructor releases the underlying channel
    virtual ~Connection() noexcept = default;
    /// Get the response header
    [[nodiscard]] virtual const HttpResponse& getResponse() const = 0;
    /// Read up to length body bytes; 0 once the body is exhausted, throws IOError
    [[nodiscard]] virtual uint64_t read(uint8_t* buffer, uint64_t length) = 0;
    /// Release the underlying channel, safe to call more than once
    virtual void close() noexcept = 0;
};
//---------------------------------------------------------------------------
/// Sends requests for remote objects
class Transport {
    public:
    /// The destructor
    virtual ~Transport() noexcept = default;
    /// Send the request to the object and receive the response header, throws IOError
    [[nodiscard]] virtual std::unique_ptr<Connection> execute(const cloud::RemoteObjectRef& ref, const HttpRequest& request) = 0;
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace rangeblob
