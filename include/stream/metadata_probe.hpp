#pragma once
#include <chrono>
#include <cstdint>
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
namespace cloud {
class RemoteObjectRef;
} // namespace cloud
namespace network {
class Transport;
} // namespace network
//---------------------------------------------------------------------------
namespace stream {
//---------------------------------------------------------------------------
/// The metadata of a remote object, fetched fresh on every probe
struct ObjectMetadata {
    /// The length in bytes
    uint64_t length = 0;
    /// The last modification time
    std::chrono::system_clock::time_point lastModified;
    /// Does the object exist
    bool exists = false;
};
//---------------------------------------------------------------------------
/// Retrieves object metadata with HEAD requests
class MetadataProbe {
    /// The transport
    network::Transport& _transport;

    public:
    /// The constructor
    explicit MetadataProbe(network::Transport& transport) : _transport(transport) {}

    /// Stat the object, throws NotFoundError for non-200 and ProtocolError for objects below 12 bytes
    [[nodiscard]] ObjectMetadata stat(const cloud::RemoteObjectRef& ref);
    /// Check whether the object answers 200
    [[nodiscard]] bool exists(const cloud::RemoteObjectRef& ref);
};
//---------------------------------------------------------------------------
} // namespace stream
} // namespace rangeblob
