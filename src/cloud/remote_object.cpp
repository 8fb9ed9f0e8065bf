#include "cloud/remote_object.hpp"
#include "utils/errors.hpp"
#include "utils/utils.hpp"
#include <string>
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
using namespace std;
//---------------------------------------------------------------------------
RemoteObjectRef::RemoteObjectRef(Scheme scheme, string host, uint32_t port, string path) : _scheme(scheme), _host(move(host)), _port(port), _path(move(path))
// The constructor
{
    if (_host.empty())
        throw utils::ProtocolError("Invalid url: Missing host!");
    if (_path.empty() || _path.front() != '/')
        _path = "/" + _path;
}
//---------------------------------------------------------------------------
bool RemoteObjectRef::isRemoteFile(string_view url) noexcept
// Is it a remote file?
{
    for (auto i = 0u; i < remoteFileCount; i++)
        if (url.size() >= remoteFile[i].size() && utils::iequals(url.substr(0, remoteFile[i].size()), remoteFile[i]))
            return true;
    return false;
}
//---------------------------------------------------------------------------
RemoteObjectRef RemoteObjectRef::parse(string_view url)
// Parse scheme://host[:port][/path][?query][#fragment]
{
    for (auto i = 0u; i < remoteFileCount; i++) {
        if (url.size() < remoteFile[i].size() || !utils::iequals(url.substr(0, remoteFile[i].size()), remoteFile[i]))
            continue;
        auto scheme = static_cast<Scheme>(i);
        auto sub = url.substr(remoteFile[i].size());

        // The fragment is never sent
        if (auto fragment = sub.find('#'); fragment != string_view::npos)
            sub = sub.substr(0, fragment);

        auto pathPos = sub.find_first_of("/?");
        auto addressPort = sub.substr(0, pathPos);
        string_view path = pathPos == string_view::npos ? string_view() : sub.substr(pathPos);

        // Strip credentials, they are not supported
        if (auto at = addressPort.rfind('@'); at != string_view::npos)
            addressPort = addressPort.substr(at + 1);

        string host;
        auto port = defaultPort(scheme);
        string_view portString;
        if (addressPort.starts_with('[')) {
            // IPv6 literal
            auto close = addressPort.find(']');
            if (close == string_view::npos)
                throw utils::ProtocolError("Invalid url: Unterminated IPv6 address in " + string(url));
            host = addressPort.substr(1, close - 1);
            auto rest = addressPort.substr(close + 1);
            if (rest.starts_with(':'))
                portString = rest.substr(1);
            else if (!rest.empty())
                throw utils::ProtocolError("Invalid url: Garbage after IPv6 address in " + string(url));
        } else if (auto colonPos = addressPort.find(':'); colonPos != string_view::npos) {
            host = addressPort.substr(0, colonPos);
            portString = addressPort.substr(colonPos + 1);
        } else {
            host = addressPort;
        }
        if (!portString.empty()) {
            auto parsed = utils::parseUnsigned(portString);
            if (!parsed || *parsed == 0 || *parsed > 65535)
                throw utils::ProtocolError("Invalid url: Invalid port in " + string(url));
            port = static_cast<uint32_t>(*parsed);
        }
        if (host.empty())
            throw utils::ProtocolError("Invalid url: Missing host in " + string(url));

        string encodedPath;
        if (path.starts_with('?'))
            encodedPath = "/";
        auto queryPos = path.find('?');
        encodedPath += utils::encodeUrlPath(path.substr(0, queryPos));
        if (queryPos != string_view::npos)
            encodedPath += path.substr(queryPos);
        return RemoteObjectRef(scheme, move(host), port, move(encodedPath));
    }
    throw utils::ProtocolError("Invalid url: Only http and https are supported, got " + string(url));
}
//---------------------------------------------------------------------------
RemoteObjectRef RemoteObjectRef::resolve(string_view location) const
// Resolve a redirect target
{
    location = utils::trim(location);
    if (location.empty())
        throw utils::ProtocolError("Invalid redirect: Empty Location!");
    if (isRemoteFile(location))
        return parse(location);
    if (location.starts_with("//"))
        return parse(string(schemeName(_scheme)) + ":" + string(location));

    auto queryPos = location.find('?');
    auto path = utils::encodeUrlPath(location.substr(0, queryPos));
    if (queryPos != string_view::npos)
        path += location.substr(queryPos);
    if (location.starts_with('/'))
        return RemoteObjectRef(_scheme, _host, _port, move(path));

    // Relative to the directory of the current path
    auto current = string_view(_path).substr(0, _path.find('?'));
    auto directory = current.substr(0, current.rfind('/') + 1);
    return RemoteObjectRef(_scheme, _host, _port, string(directory) + path);
}
//---------------------------------------------------------------------------
string RemoteObjectRef::authority() const
// The authority
{
    auto host = _host.find(':') != string::npos ? "[" + _host + "]" : _host;
    if (_port != defaultPort(_scheme))
        host += ":" + to_string(_port);
    return host;
}
//---------------------------------------------------------------------------
string RemoteObjectRef::str() const
// The canonical url
{
    return string(remoteFile[static_cast<unsigned>(_scheme)]) + authority() + _path;
}
//---------------------------------------------------------------------------
} // namespace rangeblob::cloud
