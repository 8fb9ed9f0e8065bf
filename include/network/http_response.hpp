#pragma once
#include "utils/utils.hpp"
#include <cstdint>
#include <map>
#include <optional>
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
namespace rangeblob::network {
//---------------------------------------------------------------------------
/// Implements an helper to deserialize http responses
struct HttpResponse {
    /// Important status codes
    enum class Code : uint8_t {
        OK_200,
        NO_CONTENT_204,
        PARTIAL_CONTENT_206,
        MOVED_PERMANENTLY_301,
        FOUND_302,
        SEE_OTHER_303,
        NOT_MODIFIED_304,
        TEMPORARY_REDIRECT_307,
        PERMANENT_REDIRECT_308,
        BAD_REQUEST_400,
        UNAUTHORIZED_401,
        FORBIDDEN_403,
        NOT_FOUND_404,
        GONE_410,
        RANGE_NOT_SATISFIABLE_416,
        TOO_MANY_REQUESTS_429,
        INTERNAL_SERVER_ERROR_500,
        BAD_GATEWAY_502,
        SERVICE_UNAVAILABLE_503,
        GATEWAY_TIMEOUT_504,
        UNKNOWN = 255
    };
    enum class Type : uint8_t {
        HTTP_1_0,
        HTTP_1_1
    };
    /// Case insensitive ordering of header names
    struct HeaderLess {
        bool operator()(std::string_view a, std::string_view b) const noexcept;
        using is_transparent = void;
    };
    /// The headers - without trailing and leading whitespaces
    std::map<std::string, std::string, HeaderLess> headers;
    /// The code
    Code code = Code::UNKNOWN;
    /// The numeric status
    uint16_t status = 0;
    /// The reason phrase
    std::string reason;
    /// The type
    Type type = Type::HTTP_1_1;

    /// Get the numeric status of a code
    static constexpr uint16_t getStatus(const Code& code) noexcept {
        switch (code) {
            case Code::OK_200: return 200;
            case Code::NO_CONTENT_204: return 204;
            case Code::PARTIAL_CONTENT_206: return 206;
            case Code::MOVED_PERMANENTLY_301: return 301;
            case Code::FOUND_302: return 302;
            case Code::SEE_OTHER_303: return 303;
            case Code::NOT_MODIFIED_304: return 304;
            case Code::TEMPORARY_REDIRECT_307: return 307;
            case Code::PERMANENT_REDIRECT_308: return 308;
            case Code::BAD_REQUEST_400: return 400;
            case Code::UNAUTHORIZED_401: return 401;
            case Code::FORBIDDEN_403: return 403;
            case Code::NOT_FOUND_404: return 404;
            case Code::GONE_410: return 410;
            case Code::RANGE_NOT_SATISFIABLE_416: return 416;
            case Code::TOO_MANY_REQUESTS_429: return 429;
            case Code::INTERNAL_SERVER_ERROR_500: return 500;
            case Code::BAD_GATEWAY_502: return 502;
            case Code::SERVICE_UNAVAILABLE_503: return 503;
            case Code::GATEWAY_TIMEOUT_504: return 504;
            default: return 0;
        }
    }
    /// Get the code of a numeric status
    static constexpr Code getCode(uint16_t status) noexcept {
        for (auto code = static_cast<uint8_t>(Code::OK_200); code <= static_cast<uint8_t>(Code::GATEWAY_TIMEOUT_504); code++)
            if (getStatus(static_cast<Code>(code)) == status)
                return static_cast<Code>(code);
        return Code::UNKNOWN;
    }
    /// Get the response type
    static constexpr auto getResponseType(const Type& type) noexcept {
        switch (type) {
            case Type::HTTP_1_0: return "HTTP/1.0";
            case Type::HTTP_1_1: return "HTTP/1.1";
            default: return "UNKNOWN";
        }
    }
    /// Check for successful operation 2xx operations
    static constexpr auto checkSuccess(const Code& code) {
        return (code == Code::OK_200 || code == Code::NO_CONTENT_204 || code == Code::PARTIAL_CONTENT_206);
    }
    /// Check for a redirect that carries a Location
    static constexpr auto checkRedirect(const Code& code) {
        return (code == Code::MOVED_PERMANENTLY_301 || code == Code::FOUND_302 || code == Code::SEE_OTHER_303 || code == Code::TEMPORARY_REDIRECT_307 || code == Code::PERMANENT_REDIRECT_308);
    }
    /// Check if the result has no content
    static constexpr auto withoutContent(uint16_t status) {
        return (status >= 100 && status < 200) || status == 204 || status == 304;
    }

    /// Get a header value
    [[nodiscard]] std::optional<std::string_view> getHeader(std::string_view key) const;
    /// Get the declared Content-Length
    [[nodiscard]] std::optional<uint64_t> getContentLength() const;
    /// Get the total object size from Content-Range, bytes a-b/total
    [[nodiscard]] std::optional<uint64_t> getContentRangeTotal() const;
    /// Get the first byte position from Content-Range
    [[nodiscard]] std::optional<uint64_t> getContentRangeStart() const;
    /// Describe the status line for errors
    [[nodiscard]] std::string describe() const;
    /// Deserialize the response
    [[nodiscard]] static HttpResponse deserialize(std::string_view data);
};
//---------------------------------------------------------------------------
} // namespace rangeblob::network
