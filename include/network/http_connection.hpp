#pragma once
#include "network/connection.hpp"
#include "network/http_helper.hpp"
#include "utils/data_vector.hpp"
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
class Socket;
//---------------------------------------------------------------------------
/// A response whose body is decoded from the socket on demand
class HttpConnection : public Connection {
    /// The chunked decoding progress
    enum class ChunkState : uint8_t {
        Size,
        Data,
        DataEnd,
        Trailer
    };
    /// The maximum length of a chunk size or trailer line
    static constexpr uint64_t maxLineLength = 16u << 10;

    /// The socket
    std::unique_ptr<Socket> _socket;
    /// The framing and the response
    HttpHelper::Info _info;
    /// Received but not yet consumed bytes
    utils::DataVector<uint8_t> _buffer;
    /// The receive chunk size
    uint64_t _chunkSize;
    /// Remaining bytes of the body (ContentLength) or of the current chunk
    uint64_t _remaining;
    /// The chunk state
    ChunkState _chunkState;
    /// The body is exhausted
    bool _finished;

    public:
    /// The constructor, the buffer holds the bytes received after the header
    HttpConnection(std::unique_ptr<Socket> socket, HttpHelper::Info info, utils::DataVector<uint8_t> buffer, uint64_t chunkSize);
    /// The destructor
    ~HttpConnection() noexcept override;

    /// Get the response header
    [[nodiscard]] const HttpResponse& getResponse() const override { return _info.response; }
    /// Get the framing
    [[nodiscard]] HttpHelper::Encoding getEncoding() const { return _info.encoding; }
    /// Read up to length body bytes
    [[nodiscard]] uint64_t read(uint8_t* buffer, uint64_t length) override;
    /// Close the socket
    void close() noexcept override;

    private:
    /// Read raw bytes, first from the buffer then from the socket
    [[nodiscard]] uint64_t readRaw(uint8_t* buffer, uint64_t length);
    /// Read one CRLF terminated line
    [[nodiscard]] std::string readLine();
    /// Receive more bytes into the buffer, throws on end of stream
    void fill();
    /// Decode the chunked encoding
    [[nodiscard]] uint64_t readChunked(uint8_t* buffer, uint64_t length);
};
//---------------------------------------------------------------------------
} // namespace rangeblob::network
