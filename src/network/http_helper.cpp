#include "network/http_helper.hpp"
#include "utils/errors.hpp"
#include "utils/utils.hpp"
#include <charconv>
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
namespace rangeblob {
namespace network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
uint32_t HttpHelper::headerLength(string_view data)
// Find the end of the header
{
    auto end = data.find(headerEnd);
    if (end == string_view::npos)
        return 0;
    return static_cast<uint32_t>(end + headerEnd.size());
}
//---------------------------------------------------------------------------
HttpHelper::Info HttpHelper::detect(string_view header, HttpRequest::Method method)
// Detect the protocol
{
    static constexpr string_view transferEncoding = "Transfer-Encoding";
    static constexpr string_view chunkedEncoding = "chunked";

    Info info;
    info.headerLength = headerLength(header);
    if (!info.headerLength)
        throw utils::ProtocolError("Invalid HttpResponse: Incomplete header!");
    info.response = HttpResponse::deserialize(header.substr(0, info.headerLength));

    if (method == HttpRequest::Method::HEAD || HttpResponse::withoutContent(info.response.status)) {
        info.encoding = Encoding::NoContent;
        return info;
    }

    if (auto encoding = info.response.getHeader(transferEncoding)) {
        // chunked has to be the final coding
        auto last = encoding->rfind(',');
        auto coding = utils::trim(last == string_view::npos ? *encoding : encoding->substr(last + 1));
        if (utils::iequals(coding, chunkedEncoding)) {
            info.encoding = Encoding::ChunkedEncoding;
            return info;
        }
        info.encoding = Encoding::UntilClose;
        return info;
    }

    if (info.response.getHeader("Content-Length")) {
        auto length = info.response.getContentLength();
        if (!length)
            throw utils::ProtocolError("Invalid HttpResponse: Invalid Content-Length!");
        info.encoding = Encoding::ContentLength;
        info.length = *length;
        return info;
    }

    info.encoding = Encoding::UntilClose;
    return info;
}
//---------------------------------------------------------------------------
uint64_t HttpHelper::chunkSize(string_view line)
// Parse the hex chunk size
{
    auto extension = line.find(';');
    auto size = utils::trim(line.substr(0, extension));
    uint64_t value = 0;
    auto [ptr, ec] = from_chars(size.data(), size.data() + size.size(), value, 16);
    if (size.empty() || ec != errc() || ptr != size.data() + size.size())
        throw utils::ProtocolError("Invalid chunked encoding: Invalid chunk size!");
    return value;
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace rangeblob
