#pragma once
#include "network/config.hpp"
#include "network/connection.hpp"
#include <cstdint>
#include <memory>
#include <optional>
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
namespace stream {
//---------------------------------------------------------------------------
/// A connection whose first body byte is the requested offset
class RangeConnection : public network::Connection {
    /// The positioned connection, null if the offset is past the end
    std::unique_ptr<network::Connection> _connection;
    /// The response, kept for empty connections
    network::HttpResponse _response;
    /// The start offset
    uint64_t _offset;
    /// The total object length, if the server reported it
    std::optional<uint64_t> _objectLength;

    public:
    /// The constructor
    RangeConnection(std::unique_ptr<network::Connection> connection, network::HttpResponse response, uint64_t offset, std::optional<uint64_t> objectLength);
    /// The destructor
    ~RangeConnection() noexcept override;

    /// Get the response header
    [[nodiscard]] const network::HttpResponse& getResponse() const override { return _response; }
    /// Read up to length bytes, 0 at the end of the object
    [[nodiscard]] uint64_t read(uint8_t* buffer, uint64_t length) override;
    /// Release the channel
    void close() noexcept override;

    /// Is the connection empty
    [[nodiscard]] bool empty() const { return !_connection; }
    /// Get the start offset
    [[nodiscard]] uint64_t getOffset() const { return _offset; }
    /// Get the total object length
    [[nodiscard]] std::optional<uint64_t> getObjectLength() const { return _objectLength; }
};
//---------------------------------------------------------------------------
/// Opens ranged GET connections with a bounded number of sequential attempts
class RetryingConnector {
    /// The transport
    network::Transport& _transport;
    /// The config
    network::Config _config;

    public:
    /// The constructor
    RetryingConnector(network::Transport& transport, network::Config config);

    /// Open a connection positioned at startOffset, rethrows the last IOError once all attempts failed
    [[nodiscard]] std::unique_ptr<RangeConnection> open(const cloud::RemoteObjectRef& ref, uint64_t startOffset);
    /// Get the transport
    [[nodiscard]] network::Transport& getTransport() const { return _transport; }
    /// Get the config
    [[nodiscard]] const network::Config& getConfig() const { return _config; }

    private:
    /// One attempt
    [[nodiscard]] std::unique_ptr<RangeConnection> attempt(const cloud::RemoteObjectRef& ref, uint64_t startOffset);
    /// Skip the prefix of a full body
    void discard(network::Connection& connection, uint64_t count, const cloud::RemoteObjectRef& ref) const;
};
//---------------------------------------------------------------------------
} // namespace stream
} // namespace rangeblob
