#pragma once
#include "cloud/remote_object.hpp"
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
namespace rangeblob::stream {
//---------------------------------------------------------------------------
class RangeConnection;
class RetryingConnector;
//---------------------------------------------------------------------------
/// A seekable read-only byte stream over one remote object.
/// Every seek to a new offset replaces the connection by a ranged GET at that offset.
/// The stream is not thread-safe and the connector must outlive it.
class RangeStream {
    public:
    /// The state
    enum class State : uint8_t {
        Closed,
        Open,
        Error
    };

    private:
    /// The object
    cloud::RemoteObjectRef _ref;
    /// The connector
    RetryingConnector& _connector;
    /// The active connection, exclusively owned
    std::unique_ptr<RangeConnection> _connection;
    /// The offset of the next byte
    uint64_t _currentOffset;
    /// The total object length if known
    std::optional<uint64_t> _length;
    /// The state
    State _state;

    public:
    /// The constructor
    RangeStream(cloud::RemoteObjectRef ref, RetryingConnector& connector);
    /// The destructor
    ~RangeStream() noexcept;
    /// Not copyable
    RangeStream(const RangeStream&) = delete;
    RangeStream& operator=(const RangeStream&) = delete;

    /// Connect at offset 0, the stream stays closed on failure
    void open();
    /// Read up to length bytes, 0 at the end of the object
    [[nodiscard]] uint64_t read(uint8_t* buffer, uint64_t length);
    /// Read exactly one byte, throws IOError at the end of the object
    [[nodiscard]] uint8_t read();
    /// Reposition the stream, a failed reconnect moves the stream into Error
    void seek(uint64_t target);
    /// Get the offset of the next byte
    [[nodiscard]] uint64_t position() const;
    /// Alternative replicas are not supported
    [[nodiscard]] bool seekToNewSource(uint64_t target) const noexcept;
    /// Release the connection, idempotent
    void close() noexcept;
    /// Read and drop up to count bytes
    uint64_t skip(uint64_t count);

    /// The total object length reported by the server
    [[nodiscard]] std::optional<uint64_t> getLength() const;
    /// Get the state
    [[nodiscard]] State getState() const noexcept { return _state; }
    /// Get the object
    [[nodiscard]] const cloud::RemoteObjectRef& getRef() const noexcept { return _ref; }

    private:
    /// Ensure the stream is open
    void checkOpen(const char* operation) const;
    /// Replace the connection with one at the current offset
    void reconnect();
};
//---------------------------------------------------------------------------
} // namespace rangeblob::stream
