#include "network/http_connection.hpp"
#include "network/socket.hpp"
#include "utils/errors.hpp"
#include <algorithm>
#include <cstring>
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
using namespace std;
//---------------------------------------------------------------------------
HttpConnection::HttpConnection(unique_ptr<Socket> socket, HttpHelper::Info info, utils::DataVector<uint8_t> buffer, uint64_t chunkSize)
    : _socket(move(socket)), _info(move(info)), _buffer(move(buffer)), _chunkSize(chunkSize ? chunkSize : 4096), _remaining(_info.length), _chunkState(ChunkState::Size), _finished(false)
// The constructor
{
    if (_info.encoding == HttpHelper::Encoding::NoContent || (_info.encoding == HttpHelper::Encoding::ContentLength && !_info.length))
        _finished = true;
}
//---------------------------------------------------------------------------
HttpConnection::~HttpConnection() noexcept
// The destructor
{
    close();
}
//---------------------------------------------------------------------------
void HttpConnection::close() noexcept
// Close the socket
{
    if (_socket) {
        _socket->close();
        _socket.reset();
    }
    _buffer.clear();
}
//---------------------------------------------------------------------------
uint64_t HttpConnection::readRaw(uint8_t* buffer, uint64_t length)
// Read from the buffer or the socket
{
    if (!_buffer.empty()) {
        auto count = min(length, _buffer.size());
        memcpy(buffer, _buffer.cdata(), count);
        _buffer.consume(count);
        return count;
    }
    if (!_socket)
        throw utils::IOError("Read on a closed connection!");
    return _socket->recv(buffer, length);
}
//---------------------------------------------------------------------------
void HttpConnection::fill()
// Receive more data into the buffer
{
    if (!_socket)
        throw utils::IOError("Read on a closed connection!");
    auto oldSize = _buffer.size();
    _buffer.resize(oldSize + _chunkSize);
    uint64_t received;
    try {
        received = _socket->recv(_buffer.data() + oldSize, _chunkSize);
    } catch (...) {
        _buffer.resize(oldSize);
        throw;
    }
    _buffer.resize(oldSize + received);
    if (!received)
        throw utils::IOError("Connection closed inside the chunked body!");
}
//---------------------------------------------------------------------------
string HttpConnection::readLine()
// Read a CRLF terminated line
{
    while (true) {
        auto view = _buffer.view();
        if (auto pos = view.find("\r\n"); pos != string_view::npos) {
            string line(view.substr(0, pos));
            _buffer.consume(pos + 2);
            return line;
        }
        if (view.size() > maxLineLength)
            throw utils::ProtocolError("Invalid chunked encoding: Line too long!");
        fill();
    }
}
//---------------------------------------------------------------------------
uint64_t HttpConnection::readChunked(uint8_t* buffer, uint64_t length)
// Decode the chunked encoding
{
    while (true) {
        switch (_chunkState) {
            case ChunkState::Size: {
                _remaining = HttpHelper::chunkSize(readLine());
                _chunkState = _remaining ? ChunkState::Data : ChunkState::Trailer;
                break;
            }
            case ChunkState::Data: {
                auto count = readRaw(buffer, min(length, _remaining));
                if (!count)
                    throw utils::IOError("Connection closed inside a chunk, " + to_string(_remaining) + " bytes missing!");
                _remaining -= count;
                if (!_remaining)
                    _chunkState = ChunkState::DataEnd;
                return count;
            }
            case ChunkState::DataEnd: {
                if (!readLine().empty())
                    throw utils::ProtocolError("Invalid chunked encoding: Missing CRLF after chunk!");
                _chunkState = ChunkState::Size;
                break;
            }
            case ChunkState::Trailer: {
                // Trailer fields are ignored
                if (readLine().empty()) {
                    _finished = true;
                    return 0;
                }
                break;
            }
        }
    }
}
//---------------------------------------------------------------------------
uint64_t HttpConnection::read(uint8_t* buffer, uint64_t length)
// Read body bytes
{
    if (_finished || !length)
        return 0;

    switch (_info.encoding) {
        case HttpHelper::Encoding::ContentLength: {
            auto count = readRaw(buffer, min(length, _remaining));
            if (!count)
                throw utils::IOError("Connection closed with " + to_string(_remaining) + " of " + to_string(_info.length) + " body bytes missing!");
            _remaining -= count;
            if (!_remaining)
                _finished = true;
            return count;
        }
        case HttpHelper::Encoding::ChunkedEncoding:
            return readChunked(buffer, length);
        case HttpHelper::Encoding::UntilClose: {
            auto count = readRaw(buffer, length);
            if (!count)
                _finished = true;
            return count;
        }
        default:
            _finished = true;
            return 0;
    }
}
//---------------------------------------------------------------------------
} // namespace rangeblob::network
