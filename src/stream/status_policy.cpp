#include "stream/status_policy.hpp"
#include "network/http_response.hpp"
#include "utils/errors.hpp"
#include <limits>
#include <string>
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
using network::HttpResponse;
//---------------------------------------------------------------------------
void StatusPolicy::checkMetadata(const HttpResponse& response, string_view object)
// Only 200 counts as existing
{
    if (response.code != HttpResponse::Code::OK_200)
        throw utils::NotFoundError("could not find file: " + string(object) + " (" + response.describe() + ")");
}
//---------------------------------------------------------------------------
uint64_t StatusPolicy::checkObjectLength(optional<uint64_t> length, string_view object)
// Reject empty and truncated objects
{
    if (!length || *length < minimumObjectLength)
        throw utils::ProtocolError("block compressed file cannot be empty: " + string(object) + " has " + (length ? to_string(*length) + " bytes" : string("no length")));
    return *length;
}
//---------------------------------------------------------------------------
StatusPolicy::RangeOutcome StatusPolicy::checkRange(const HttpResponse& response, uint64_t offset, string_view object)
// Classify a ranged GET
{
    switch (response.code) {
        case HttpResponse::Code::PARTIAL_CONTENT_206: {
            auto start = response.getContentRangeStart();
            if (start && *start != offset)
                throw utils::ProtocolError("Range mismatch for " + string(object) + ": requested " + to_string(offset) + ", got " + to_string(*start));
            return RangeOutcome::Positioned;
        }
        case HttpResponse::Code::OK_200:
            return offset ? RangeOutcome::FullBody : RangeOutcome::Positioned;
        case HttpResponse::Code::RANGE_NOT_SATISFIABLE_416:
            return RangeOutcome::Unsatisfiable;
        case HttpResponse::Code::NOT_FOUND_404: // fallthrough
        case HttpResponse::Code::GONE_410:
            throw utils::NotFoundError("could not find file: " + string(object) + " (" + response.describe() + ")");
        default:
            throw utils::IOError("Unexpected status " + response.describe() + " for " + string(object) + " at offset " + to_string(offset));
    }
}
//---------------------------------------------------------------------------
optional<uint64_t> StatusPolicy::objectLength(const HttpResponse& response, uint64_t offset, RangeOutcome outcome)
// Total length from Content-Range or Content-Length
{
    if (auto total = response.getContentRangeTotal())
        return total;
    if (outcome == RangeOutcome::Unsatisfiable)
        return nullopt;
    auto length = response.getContentLength();
    if (!length)
        return nullopt;
    if (outcome != RangeOutcome::Positioned)
        return *length;
    if (*length > numeric_limits<uint64_t>::max() - offset)
        throw utils::ProtocolError("Invalid Content-Length " + to_string(*length) + " at offset " + to_string(offset) + " in " + response.describe());
    return *length + offset;
}
//---------------------------------------------------------------------------
void StatusPolicy::unsupported(string_view operation)
// Reject a mutation
{
    throw utils::UnsupportedOperationError(string(operation) + string(notSupported));
}
//---------------------------------------------------------------------------
} // namespace rangeblob::stream
