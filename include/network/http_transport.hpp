#pragma once
#include "network/config.hpp"
#include "network/connection.hpp"
#include "network/resolver.hpp"
#include <memory>
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
class HttpConnection;
class Socket;
class TLSContext;
//---------------------------------------------------------------------------
/// The blocking HTTP/1.1 client. Every request uses a fresh connection that is
/// closed by the server after the response (Connection: close).
class HttpTransport : public Transport {
    /// The maximum size of a response header
    static constexpr uint64_t maxHeaderLength = 1u << 20;

    /// The config
    Config _config;
    /// The resolver
    Resolver _resolver;
    /// The tls context, created with the first https request
    std::unique_ptr<TLSContext> _context;

    public:
    /// The constructor
    explicit HttpTransport(Config config = {});
    /// The destructor
    ~HttpTransport() noexcept override;

    /// Send the request and follow redirects
    [[nodiscard]] std::unique_ptr<Connection> execute(const cloud::RemoteObjectRef& ref, const HttpRequest& request) override;
    /// Get the config
    [[nodiscard]] const Config& getConfig() const { return _config; }

    private:
    /// Open the tcp or tls channel
    [[nodiscard]] std::unique_ptr<Socket> connect(const cloud::RemoteObjectRef& ref);
    /// Exchange one request without following redirects
    [[nodiscard]] std::unique_ptr<HttpConnection> exchange(const cloud::RemoteObjectRef& ref, const HttpRequest& request);
};
//---------------------------------------------------------------------------
} // namespace rangeblob::network
