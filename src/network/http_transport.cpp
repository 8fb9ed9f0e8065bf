#include "network/http_transport.hpp"
#include "cloud/remote_object.hpp"
#include "network/http_connection.hpp"
#include "network/http_helper.hpp"
#include "network/tcp_socket.hpp"
#include "network/tls_connection.hpp"
#include "network/tls_context.hpp"
#include "utils/data_vector.hpp"
#include "utils/errors.hpp"
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
namespace rangeblob::network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
HttpTransport::HttpTransport(Config config) : _config(move(config)), _resolver()
// The constructor
{
    if (!_config.chunkSize)
        _config.chunkSize = 4096;
}
//---------------------------------------------------------------------------
HttpTransport::~HttpTransport() noexcept = default;
//---------------------------------------------------------------------------
unique_ptr<Socket> HttpTransport::connect(const cloud::RemoteObjectRef& ref)
// Open the channel
{
    auto socket = TCPSocket::connect(_resolver, ref.getHost(), ref.getPort(), _config.tcpSettings);
    if (!ref.isTLS())
        return socket;

    if (!_context)
        _context = make_unique<TLSContext>(_config.verifyPeer);
    auto tls = make_unique<TLSConnection>(*_context, move(socket));
    tls->connect(ref.getHost(), ref.getPort());
    return tls;
}
//---------------------------------------------------------------------------
unique_ptr<HttpConnection> HttpTransport::exchange(const cloud::RemoteObjectRef& ref, const HttpRequest& request)
// Send the request and receive the header
{
    auto socket = connect(ref);

    auto message = request;
    message.path = ref.getPath();
    message.headers.insert_or_assign("Host", ref.hostHeader());
    message.headers.emplace("User-Agent", _config.userAgent);
    message.headers.insert_or_assign("Connection", "close");
    message.headers.insert_or_assign("Accept-Encoding", "identity");
    auto serialized = HttpRequest::serialize(message);
    socket->send(serialized->cdata(), serialized->size());

    utils::DataVector<uint8_t> buffer;
    while (true) {
        // Receive until the header is complete
        uint32_t headerLength;
        while (!(headerLength = HttpHelper::headerLength(buffer.view()))) {
            if (buffer.size() > maxHeaderLength)
                throw utils::ProtocolError("Invalid HttpResponse: Header too large from " + ref.str());
            auto oldSize = buffer.size();
            buffer.resize(oldSize + _config.chunkSize);
            auto received = socket->recv(buffer.data() + oldSize, _config.chunkSize);
            buffer.resize(oldSize + received);
            if (!received)
                throw utils::IOError("Connection closed before the response header from " + ref.str());
        }

        auto info = HttpHelper::detect(buffer.view(), message.method);
        buffer.consume(headerLength);
        // Interim responses precede the final one
        if (info.response.status >= 100 && info.response.status < 200)
            continue;
        return make_unique<HttpConnection>(move(socket), move(info), move(buffer), _config.chunkSize);
    }
}
//---------------------------------------------------------------------------
unique_ptr<Connection> HttpTransport::execute(const cloud::RemoteObjectRef& ref, const HttpRequest& request)
// Send the request and follow redirects
{
    auto current = ref;
    for (auto redirects = 0u;; redirects++) {
        auto connection = exchange(current, request);
        auto& response = connection->getResponse();
        if (!_config.followRedirects || !HttpResponse::checkRedirect(response.code))
            return connection;
        auto location = response.getHeader("Location");
        if (!location)
            return connection;
        if (redirects >= _config.maxRedirects)
            throw utils::IOError("Too many redirects for " + ref.str());

        auto target = current.resolve(*location);
        // A redirect never changes the protocol, the 3xx is the answer
        if (target.getScheme() != current.getScheme()) {
            if (_config.logRetries)
                cerr << "Redirect " << response.describe() << " from " << current.str() << " to " << target.str() << " changes the protocol, not followed" << endl;
            return connection;
        }
        if (_config.logRetries)
            cerr << "Redirect " << response.describe() << " from " << current.str() << " to " << target.str() << endl;
        connection->close();
        current = move(target);
    }
}
//---------------------------------------------------------------------------
} // namespace rangeblob::network
