#include "network/http_response.hpp"
#include "utils/errors.hpp"
#include <algorithm>
#include <cctype>
#include <map>
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
using namespace std;
//---------------------------------------------------------------------------
bool HttpResponse::HeaderLess::operator()(string_view a, string_view b) const noexcept
// Case insensitive less
{
    return lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](char l, char r) {
        return tolower(static_cast<unsigned char>(l)) < tolower(static_cast<unsigned char>(r));
    });
}
//---------------------------------------------------------------------------
optional<string_view> HttpResponse::getHeader(string_view key) const
// Get a header value
{
    auto it = headers.find(key);
    if (it == headers.end())
        return nullopt;
    return string_view(it->second);
}
//---------------------------------------------------------------------------
optional<uint64_t> HttpResponse::getContentLength() const
// Get the content length
{
    auto value = getHeader("Content-Length");
    if (!value)
        return nullopt;
    return utils::parseUnsigned(*value);
}
//---------------------------------------------------------------------------
optional<uint64_t> HttpResponse::getContentRangeTotal() const
// Content-Range: bytes 100-199/1000
{
    auto value = getHeader("Content-Range");
    if (!value)
        return nullopt;
    auto slash = value->find('/');
    if (slash == string_view::npos)
        return nullopt;
    return utils::parseUnsigned(utils::trim(value->substr(slash + 1)));
}
//---------------------------------------------------------------------------
optional<uint64_t> HttpResponse::getContentRangeStart() const
// Content-Range: bytes 100-199/1000
{
    static constexpr string_view unit = "bytes";
    auto value = getHeader("Content-Range");
    if (!value || !value->starts_with(unit))
        return nullopt;
    auto range = utils::trim(value->substr(unit.size()));
    auto dash = range.find('-');
    if (dash == string_view::npos)
        return nullopt;
    return utils::parseUnsigned(range.substr(0, dash));
}
//---------------------------------------------------------------------------
string HttpResponse::describe() const
// Describe the status line
{
    auto result = to_string(status);
    if (!reason.empty())
        result += " " + reason;
    return result;
}
//---------------------------------------------------------------------------
HttpResponse HttpResponse::deserialize(string_view data)
// Deserialize the http header
{
    static constexpr string_view strHttp1_0 = "HTTP/1.0";
    static constexpr string_view strHttp1_1 = "HTTP/1.1";
    static constexpr string_view strNewline = "\r\n";
    static constexpr string_view strHeaderSeperator = ":";

    HttpResponse response;

    string_view line;
    auto firstLine = true;
    while (true) {
        auto pos = data.find(strNewline);
        if (pos == data.npos)
            throw utils::ProtocolError("Invalid HttpResponse: Incomplete header!");

        line = data.substr(0, pos);
        data = data.substr(pos + strNewline.size());
        if (line.empty()) {
            if (!firstLine)
                break;
            else
                throw utils::ProtocolError("Invalid HttpResponse: Missing first line!");
        }
        if (firstLine) {
            firstLine = false;
            // the http type
            if (line.starts_with(strHttp1_0)) {
                response.type = Type::HTTP_1_0;
            } else if (line.starts_with(strHttp1_1)) {
                response.type = Type::HTTP_1_1;
            } else {
                throw utils::ProtocolError("Invalid HttpResponse: Needs to be a HTTP type 1.0 or 1.1!");
            }

            // the status code and the optional reason
            string_view httpType = getResponseType(response.type);
            line = utils::trim(line.substr(httpType.size()));
            auto space = line.find(' ');
            auto status = utils::parseUnsigned(line.substr(0, space));
            if (!status || *status < 100 || *status > 999)
                throw utils::ProtocolError("Invalid HttpResponse: Invalid status code!");
            response.status = static_cast<uint16_t>(*status);
            response.code = getCode(response.status);
            if (space != line.npos)
                response.reason = utils::trim(line.substr(space + 1));
        } else {
            // headers
            auto keyPos = line.find(strHeaderSeperator);
            if (keyPos == line.npos)
                throw utils::ProtocolError("Invalid HttpResponse: Headers need key and value!");
            auto key = utils::trim(line.substr(0, keyPos));
            auto value = utils::trim(line.substr(keyPos + strHeaderSeperator.size()));
            response.headers.emplace(key, value);
        }
    }

    return response;
}
//---------------------------------------------------------------------------
} // namespace rangeblob::network
