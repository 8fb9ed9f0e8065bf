#include "network/resolver.hpp"
#include "utils/errors.hpp"
#include <cstring>
#include <string>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <sys/types.h>
//---------------------------------------------------------------------------
// RangeBlob - Seekable HTTP Object Streams
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace rangeblob {
namespace network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
Resolver::Resolver(unsigned entries) : _entries(entries ? entries : 1), _addrCtr(0)
// Constructor
{
}
//---------------------------------------------------------------------------
const addrinfo* Resolver::resolve(const string& hostname, uint32_t port)
// Resolve the request
{
    auto hostString = hostname + ":" + to_string(port);
    for (auto& entry : _entries) {
        if (entry.addr && entry.addrAndPort == hostString && entry.cacheCtr > 0) {
            entry.cacheCtr--;
            return entry.addr.get();
        }
    }

    struct addrinfo hints;
    memset(&hints, 0, sizeof hints);
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* temp;
    auto portString = to_string(port);
    if (auto res = getaddrinfo(hostname.c_str(), portString.c_str(), &hints, &temp); res != 0)
        throw utils::IOError("hostname getaddrinfo error for " + hostString + ": " + gai_strerror(res));

    auto& entry = _entries[_addrCtr++ % _entries.size()];
    entry.addr.reset(temp);
    entry.addrAndPort = move(hostString);
    entry.cacheCtr = reuseCount;
    return entry.addr.get();
}
//---------------------------------------------------------------------------
void Resolver::invalidate(const string& hostname, uint32_t port)
// Drop the cached address
{
    auto hostString = hostname + ":" + to_string(port);
    for (auto& entry : _entries) {
        if (entry.addrAndPort == hostString) {
            entry.addr.reset();
            entry.cacheCtr = 0;
        }
    }
}
//---------------------------------------------------------------------------
}; // namespace network
//---------------------------------------------------------------------------
}; // namespace rangeblob
