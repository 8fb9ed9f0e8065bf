#include "stream/range_stream.hpp"
#include "stream/retrying_connector.hpp"
#include "utils/errors.hpp"
#include <algorithm>
#include <iostream>
#include <string>
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
using namespace std;
//---------------------------------------------------------------------------
RangeStream::RangeStream(cloud::RemoteObjectRef ref, RetryingConnector& connector) : _ref(move(ref)), _connector(connector), _connection(), _currentOffset(0), _state(State::Closed)
// The constructor
{
}
//---------------------------------------------------------------------------
RangeStream::~RangeStream() noexcept
// The destructor
{
    close();
}
//---------------------------------------------------------------------------
void RangeStream::checkOpen(const char* operation) const
// Throw unless open
{
    switch (_state) {
        case State::Open: return;
        case State::Closed: throw utils::IllegalStateError(string(operation) + ": stream not initialized for " + _ref.str());
        case State::Error: throw utils::IllegalStateError(string(operation) + ": stream failed for " + _ref.str());
    }
}
//---------------------------------------------------------------------------
void RangeStream::open()
// Connect at offset 0
{
    if (_state != State::Closed)
        throw utils::IllegalStateError("open: stream already opened for " + _ref.str());
    auto connection = _connector.open(_ref, 0);
    _length = connection->getObjectLength();
    _connection = move(connection);
    _currentOffset = 0;
    _state = State::Open;
}
//---------------------------------------------------------------------------
void RangeStream::reconnect()
// Release the old connection before acquiring the new one
{
    if (_connection) {
        _connection->close();
        _connection.reset();
    }
    try {
        _connection = _connector.open(_ref, _currentOffset);
    } catch (...) {
        _state = State::Error;
        throw;
    }
    if (auto length = _connection->getObjectLength())
        _length = length;
}
//---------------------------------------------------------------------------
uint64_t RangeStream::read(uint8_t* buffer, uint64_t length)
// Read from the active connection
{
    checkOpen("read");
    if (!length)
        return 0;
    if (_length) {
        if (_currentOffset >= *_length)
            return 0;
        length = min(length, *_length - _currentOffset);
    }

    // Below the known length, an empty read means the body ended early
    auto checkTruncated = [&](uint64_t received) {
        if (!received && _length)
            throw utils::IOError("Body of " + _ref.str() + " ended at offset " + to_string(_currentOffset) + " of " + to_string(*_length));
    };

    uint64_t count;
    try {
        count = _connection->read(buffer, length);
        checkTruncated(count);
    } catch (const utils::IOError& e) {
        // The connection broke mid body, resume once at the current offset
        if (_connector.getConfig().logRetries)
            cerr << "Read of " << _ref.str() << " at offset " << _currentOffset << " failed: " << e.what() << ", reconnecting" << endl;
        reconnect();
        try {
            count = _connection->read(buffer, length);
            checkTruncated(count);
        } catch (...) {
            _state = State::Error;
            throw;
        }
    }
    _currentOffset += count;
    return count;
}
//---------------------------------------------------------------------------
uint8_t RangeStream::read()
// Read a single byte
{
    uint8_t byte;
    if (!read(&byte, 1))
        throw utils::IOError("Unexpected end of " + _ref.str() + " at offset " + to_string(_currentOffset));
    return byte;
}
//---------------------------------------------------------------------------
void RangeStream::seek(uint64_t target)
// Reconnect at the target
{
    checkOpen("seek");
    if (target == _currentOffset)
        return;
    _currentOffset = target;
    reconnect();
}
//---------------------------------------------------------------------------
uint64_t RangeStream::position() const
// The current offset
{
    checkOpen("position");
    return _currentOffset;
}
//---------------------------------------------------------------------------
bool RangeStream::seekToNewSource(uint64_t /*target*/) const noexcept
// There is only one source
{
    return false;
}
//---------------------------------------------------------------------------
void RangeStream::close() noexcept
// Release the connection
{
    if (_connection) {
        _connection->close();
        _connection.reset();
    }
    _state = State::Closed;
}
//---------------------------------------------------------------------------
uint64_t RangeStream::skip(uint64_t count)
// Read and drop
{
    checkOpen("skip");
    uint8_t scratch[4096];
    uint64_t skipped = 0;
    while (skipped < count) {
        auto received = read(scratch, min<uint64_t>(count - skipped, sizeof(scratch)));
        if (!received)
            break;
        skipped += received;
    }
    return skipped;
}
//---------------------------------------------------------------------------
optional<uint64_t> RangeStream::getLength() const
// The reported length
{
    checkOpen("getLength");
    return _length;
}
//---------------------------------------------------------------------------
} // namespace rangeblob::stream
