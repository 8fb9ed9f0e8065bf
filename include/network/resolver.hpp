#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <netdb.h>
//---------------------------------------------------------------------------
// RangeBlob - Seekable HTTP Object Streams
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace rangeblob {
//---------------------------------------------------------------------------
namespace network {
//---------------------------------------------------------------------------
/// The addr resolver and cacher, which is not thread safe.
/// Seeks reconnect to the same host repeatedly, thus every entry is reused
/// for a fixed number of lookups before it gets resolved again.
class Resolver {
    protected:
    /// A cached resolution
    struct Entry {
        /// The host and port
        std::string addrAndPort;
        /// The remaining uses
        int cacheCtr = 0;
        /// The addr info
        std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> addr{nullptr, &freeaddrinfo};
    };
    /// The cache buckets
    std::vector<Entry> _entries;
    /// The ctr for replacing buckets
    unsigned _addrCtr;

    public:
    /// The number of uses before resolving again
    static constexpr int reuseCount = 12;

    /// The constructor
    explicit Resolver(unsigned entries = 8);
    /// The address resolving, the result stays valid until the next call
    [[nodiscard]] virtual const addrinfo* resolve(const std::string& hostname, uint32_t port);
    /// Forget the resolution of a host, e.g., after a failed connect
    void invalidate(const std::string& hostname, uint32_t port);
    /// The destructor
    virtual ~Resolver() noexcept = default;
};
//---------------------------------------------------------------------------
}; // namespace network
//---------------------------------------------------------------------------
}; // namespace rangeblob
