#include "stream/metadata_probe.hpp"
#include "cloud/remote_object.hpp"
#include "network/connection.hpp"
#include "stream/status_policy.hpp"
#include "utils/utils.hpp"
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
ObjectMetadata MetadataProbe::stat(const cloud::RemoteObjectRef& ref)
// HEAD the object
{
    auto connection = _transport.execute(ref, network::HttpRequest::headRequest(ref.getPath()));
    auto response = connection->getResponse();
    connection->close();

    StatusPolicy::checkMetadata(response, ref.getPath());

    ObjectMetadata metadata;
    metadata.exists = true;
    metadata.length = StatusPolicy::checkObjectLength(response.getContentLength(), ref.getPath());
    metadata.lastModified = chrono::system_clock::now();
    if (auto header = response.getHeader("Last-Modified"))
        if (auto time = utils::parseHttpDate(*header))
            metadata.lastModified = *time;
    return metadata;
}
//---------------------------------------------------------------------------
bool MetadataProbe::exists(const cloud::RemoteObjectRef& ref)
// HEAD the object, only the status matters
{
    auto connection = _transport.execute(ref, network::HttpRequest::headRequest(ref.getPath()));
    auto ok = connection->getResponse().code == network::HttpResponse::Code::OK_200;
    connection->close();
    return ok;
}
//---------------------------------------------------------------------------
} // namespace rangeblob::stream
