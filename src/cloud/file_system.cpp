#include "cloud/file_system.hpp"
#include "network/http_transport.hpp"
#include "stream/status_policy.hpp"
#include "utils/errors.hpp"
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
FileSystem::FileSystem(string_view uri, network::Config config) : FileSystem(uri, make_unique<network::HttpTransport>(config), config)
// The constructor
{
}
//---------------------------------------------------------------------------
FileSystem::FileSystem(string_view uri, unique_ptr<network::Transport> transport, network::Config config)
    : _transport(move(transport)), _connector(*_transport, move(config)), _probe(*_transport), _scheme(RemoteObjectRef::Scheme::HTTPS)
// The constructor
{
    initialize(uri);
}
//---------------------------------------------------------------------------
FileSystem::~FileSystem() noexcept = default;
//---------------------------------------------------------------------------
void FileSystem::initialize(string_view uri)
// Record scheme and authority
{
    auto ref = RemoteObjectRef::parse(uri);
    _scheme = ref.getScheme();
    _authority = ref.authority();
}
//---------------------------------------------------------------------------
string FileSystem::getUri() const
// scheme://authority
{
    return string(RemoteObjectRef::remoteFile[static_cast<unsigned>(_scheme)]) + _authority;
}
//---------------------------------------------------------------------------
RemoteObjectRef FileSystem::makeUrl(string_view path) const
// Qualify the path
{
    if (RemoteObjectRef::isRemoteFile(path))
        return RemoteObjectRef::parse(path);
    string url = getUri();
    if (!path.starts_with('/'))
        url += '/';
    url += path;
    return RemoteObjectRef::parse(url);
}
//---------------------------------------------------------------------------
unique_ptr<stream::RangeStream> FileSystem::open(string_view path)
// Create and open the stream
{
    auto stream = make_unique<stream::RangeStream>(makeUrl(path), _connector);
    stream->open();
    return stream;
}
//---------------------------------------------------------------------------
bool FileSystem::exists(string_view path)
// HEAD the object
{
    return _probe.exists(makeUrl(path));
}
//---------------------------------------------------------------------------
FileStatus FileSystem::getFileStatus(string_view path)
// Stat the object
{
    auto ref = makeUrl(path);
    auto metadata = _probe.stat(ref);
    FileStatus status;
    status.path = ref.str();
    status.length = metadata.length;
    status.modificationTime = metadata.lastModified;
    return status;
}
//---------------------------------------------------------------------------
vector<FileStatus> FileSystem::listStatus(string_view path)
// A file lists itself
{
    return {getFileStatus(path)};
}
//---------------------------------------------------------------------------
vector<FileStatus> FileSystem::globStatus(string_view path)
// No pattern expansion
{
    return {getFileStatus(path)};
}
//---------------------------------------------------------------------------
string FileSystem::getWorkingDirectory() const
// The root
{
    return getUri() + "/";
}
//---------------------------------------------------------------------------
void FileSystem::setWorkingDirectory(string_view /*path*/)
// Fixed
{
}
//---------------------------------------------------------------------------
void FileSystem::create(string_view /*path*/)
{
    stream::StatusPolicy::unsupported("create");
}
//---------------------------------------------------------------------------
void FileSystem::rename(string_view /*source*/, string_view /*target*/)
{
    stream::StatusPolicy::unsupported("rename");
}
//---------------------------------------------------------------------------
void FileSystem::remove(string_view /*path*/, bool /*recursive*/)
{
    stream::StatusPolicy::unsupported("delete");
}
//---------------------------------------------------------------------------
void FileSystem::mkdirs(string_view /*path*/)
{
    stream::StatusPolicy::unsupported("mkdirs");
}
//---------------------------------------------------------------------------
void FileSystem::append(string_view /*path*/)
{
    stream::StatusPolicy::unsupported("append");
}
//---------------------------------------------------------------------------
} // namespace rangeblob::cloud
