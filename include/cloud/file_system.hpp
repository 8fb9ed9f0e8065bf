#pragma once
#include "cloud/remote_object.hpp"
#include "network/config.hpp"
#include "stream/metadata_probe.hpp"
#include "stream/range_stream.hpp"
#include "stream/retrying_connector.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
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
class Transport;
} // namespace network
//---------------------------------------------------------------------------
namespace cloud {
//---------------------------------------------------------------------------
/// The status of a remote file
struct FileStatus {
    /// The default block size
    static constexpr uint64_t defaultBlockSize = 4ull << 20;

    /// The url
    std::string path;
    /// The length
    uint64_t length = 0;
    /// Remote objects are never directories
    bool isDirectory = false;
    /// The replication
    uint16_t replication = 1;
    /// The block size
    uint64_t blockSize = defaultBlockSize;
    /// The modification time
    std::chrono::system_clock::time_point modificationTime;
};
//---------------------------------------------------------------------------
/// A read-only filesystem over http and https objects
class FileSystem {
    /// The transport
    std::unique_ptr<network::Transport> _transport;
    /// The connector
    stream::RetryingConnector _connector;
    /// The probe
    stream::MetadataProbe _probe;
    /// The scheme
    RemoteObjectRef::Scheme _scheme;
    /// The authority
    std::string _authority;

    public:
    /// The constructor with the http transport
    explicit FileSystem(std::string_view uri, network::Config config = {});
    /// The constructor with a custom transport
    FileSystem(std::string_view uri, std::unique_ptr<network::Transport> transport, network::Config config = {});
    /// The destructor
    ~FileSystem() noexcept;

    /// Bind the filesystem to the scheme and authority of uri
    void initialize(std::string_view uri);
    /// The filesystem uri, scheme://authority
    [[nodiscard]] std::string getUri() const;
    /// The full url of a path
    [[nodiscard]] RemoteObjectRef makeUrl(std::string_view path) const;

    /// Open a stream, already positioned at 0
    [[nodiscard]] std::unique_ptr<stream::RangeStream> open(std::string_view path);
    /// Does the object exist
    [[nodiscard]] bool exists(std::string_view path);
    /// Stat the object
    [[nodiscard]] FileStatus getFileStatus(std::string_view path);
    /// The status of the single object
    [[nodiscard]] std::vector<FileStatus> listStatus(std::string_view path);
    /// The status of the single object, patterns are not expanded
    [[nodiscard]] std::vector<FileStatus> globStatus(std::string_view path);

    /// The working directory
    [[nodiscard]] std::string getWorkingDirectory() const;
    /// The working directory is fixed
    void setWorkingDirectory(std::string_view path);

    /// Unsupported
    [[noreturn]] void create(std::string_view path);
    /// Unsupported
    [[noreturn]] void rename(std::string_view source, std::string_view target);
    /// Unsupported
    [[noreturn]] void remove(std::string_view path, bool recursive = false);
    /// Unsupported
    [[noreturn]] void mkdirs(std::string_view path);
    /// Unsupported
    [[noreturn]] void append(std::string_view path);

    /// Get the connector
    [[nodiscard]] stream::RetryingConnector& getConnector() { return _connector; }
};
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace rangeblob
