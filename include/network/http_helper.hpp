#pragma once
#include "network/http_request.hpp"
#include "network/http_response.hpp"
#include <cstdint>
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
/// Implements an helper to resolve the framing of http responses
class HttpHelper {
    public:
    /// The encoding
    enum class Encoding : uint8_t {
        Unknown,
        NoContent,
        ContentLength,
        ChunkedEncoding,
        UntilClose
    };

    struct Info {
        /// The response header
        HttpResponse response;
        /// The body length for ContentLength
        uint64_t length = 0;
        /// The header length
        uint32_t headerLength = 0;
        /// The encoding
        Encoding encoding = Encoding::Unknown;
    };

    /// The end of the header
    static constexpr std::string_view headerEnd = "\r\n\r\n";

    /// Find the length of the header including the terminating empty line, 0 if incomplete
    [[nodiscard]] static uint32_t headerLength(std::string_view data);
    /// Parse the header and detect the body framing for the given request method
    [[nodiscard]] static Info detect(std::string_view header, HttpRequest::Method method);
    /// Parse a chunk size line without the trailing CRLF, ignores extensions
    [[nodiscard]] static uint64_t chunkSize(std::string_view line);
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace rangeblob
