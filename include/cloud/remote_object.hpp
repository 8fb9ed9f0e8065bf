#pragma once
#include <cstdint>
#include <string>
#include <string_view>
//---------------------------------------------------------------------------
// RangeBlob - Seekable HTTP Object Streams
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace rangeblob::cloud {
//---------------------------------------------------------------------------
/// Identifies a single immutable object served over http or https
class RemoteObjectRef {
    public:
    /// The supported schemes
    enum class Scheme : uint8_t {
        HTTPS = 0,
        HTTP = 1
    };
    /// The remote prefixes count
    static constexpr unsigned remoteFileCount = 2;
    /// The remote prefixes, indexed by Scheme
    static constexpr std::string_view remoteFile[] = {"https://", "http://"};

    private:
    /// The scheme
    Scheme _scheme;
    /// The host name
    std::string _host;
    /// The port
    uint32_t _port;
    /// The path including an optional query, starts with '/'
    std::string _path;

    public:
    /// The constructor
    RemoteObjectRef(Scheme scheme, std::string host, uint32_t port, std::string path);

    /// Is it a remote file?
    [[nodiscard]] static bool isRemoteFile(std::string_view url) noexcept;
    /// Parse an absolute http or https url, throws ProtocolError
    [[nodiscard]] static RemoteObjectRef parse(std::string_view url);
    /// Get the default port of a scheme
    [[nodiscard]] static constexpr uint32_t defaultPort(Scheme scheme) { return scheme == Scheme::HTTPS ? 443 : 80; }
    /// Get the scheme name without separator
    [[nodiscard]] static constexpr std::string_view schemeName(Scheme scheme) { return scheme == Scheme::HTTPS ? "https" : "http"; }

    /// Resolve the target of a redirect Location against this object
    [[nodiscard]] RemoteObjectRef resolve(std::string_view location) const;
    /// The canonical url
    [[nodiscard]] std::string str() const;
    /// The authority, host with a non default port
    [[nodiscard]] std::string authority() const;
    /// The Host header value
    [[nodiscard]] std::string hostHeader() const { return authority(); }

    /// Get the scheme
    [[nodiscard]] Scheme getScheme() const { return _scheme; }
    /// Is it tls
    [[nodiscard]] bool isTLS() const { return _scheme == Scheme::HTTPS; }
    /// Get the host
    [[nodiscard]] const std::string& getHost() const { return _host; }
    /// Get the port
    [[nodiscard]] uint32_t getPort() const { return _port; }
    /// Get the path
    [[nodiscard]] const std::string& getPath() const { return _path; }

    /// Equality
    bool operator==(const RemoteObjectRef& other) const = default;
};
//---------------------------------------------------------------------------
} // namespace rangeblob::cloud
