#include "stream/retrying_connector.hpp"
#include "cloud/remote_object.hpp"
#include "stream/status_policy.hpp"
#include "utils/errors.hpp"
#include <algorithm>
#include <iostream>
#include <string>
#include <vector>
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
RangeConnection::RangeConnection(unique_ptr<network::Connection> connection, network::HttpResponse response, uint64_t offset, optional<uint64_t> objectLength)
    : _connection(move(connection)), _response(move(response)), _offset(offset), _objectLength(objectLength)
// The constructor
{
}
//---------------------------------------------------------------------------
RangeConnection::~RangeConnection() noexcept
// The destructor
{
    close();
}
//---------------------------------------------------------------------------
uint64_t RangeConnection::read(uint8_t* buffer, uint64_t length)
// Read from the positioned connection
{
    if (!_connection)
        return 0;
    return _connection->read(buffer, length);
}
//---------------------------------------------------------------------------
void RangeConnection::close() noexcept
// Release the channel
{
    if (_connection) {
        _connection->close();
        _connection.reset();
    }
}
//---------------------------------------------------------------------------
RetryingConnector::RetryingConnector(network::Transport& transport, network::Config config) : _transport(transport), _config(move(config))
// The constructor
{
    if (!_config.connectAttempts)
        _config.connectAttempts = 1;
}
//---------------------------------------------------------------------------
void RetryingConnector::discard(network::Connection& connection, uint64_t count, const cloud::RemoteObjectRef& ref) const
// Read and drop the first count body bytes
{
    vector<uint8_t> scratch(min<uint64_t>(count, _config.chunkSize ? _config.chunkSize : 4096));
    auto left = count;
    while (left) {
        auto received = connection.read(scratch.data(), min<uint64_t>(left, scratch.size()));
        if (!received)
            throw utils::IOError("Body of " + ref.str() + " ended " + to_string(left) + " bytes before offset " + to_string(count));
        left -= received;
    }
}
//---------------------------------------------------------------------------
unique_ptr<RangeConnection> RetryingConnector::attempt(const cloud::RemoteObjectRef& ref, uint64_t startOffset)
// One ranged GET
{
    auto request = network::HttpRequest::rangeRequest(ref.getPath(), startOffset);
    auto connection = _transport.execute(ref, request);
    auto response = connection->getResponse();

    auto outcome = StatusPolicy::checkRange(response, startOffset, ref.str());
    auto objectLength = StatusPolicy::objectLength(response, startOffset, outcome);
    switch (outcome) {
        case StatusPolicy::RangeOutcome::Positioned:
            return make_unique<RangeConnection>(move(connection), move(response), startOffset, objectLength);
        case StatusPolicy::RangeOutcome::Unsatisfiable:
            connection->close();
            return make_unique<RangeConnection>(nullptr, move(response), startOffset, objectLength);
        case StatusPolicy::RangeOutcome::FullBody:
            if (objectLength && *objectLength <= startOffset) {
                connection->close();
                return make_unique<RangeConnection>(nullptr, move(response), startOffset, objectLength);
            }
            if (_config.logRetries)
                cerr << "Range ignored by " << ref.str() << ", discarding " << startOffset << " bytes" << endl;
            discard(*connection, startOffset, ref);
            return make_unique<RangeConnection>(move(connection), move(response), startOffset, objectLength);
    }
    throw utils::ProtocolError("Unhandled range outcome for " + ref.str());
}
//---------------------------------------------------------------------------
unique_ptr<RangeConnection> RetryingConnector::open(const cloud::RemoteObjectRef& ref, uint64_t startOffset)
// Sequential attempts without backoff
{
    for (auto attemptNr = 1u;; attemptNr++) {
        try {
            return attempt(ref, startOffset);
        } catch (const utils::IOError& e) {
            if (_config.logRetries)
                cerr << "Connection attempt " << attemptNr << "/" << _config.connectAttempts << " to " << ref.str() << " at offset " << startOffset << " failed: " << e.what() << endl;
            if (attemptNr >= _config.connectAttempts)
                throw;
        }
    }
}
//---------------------------------------------------------------------------
} // namespace rangeblob::stream
