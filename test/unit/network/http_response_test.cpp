#include "network/http_response.hpp"
#include "utils/errors.hpp"
#include <catch2/catch.hpp>
//---------------------------------------------------------------------------
// RangeBlob - Seekable HTTP Object Streams
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace rangeblob::network::test {
//---------------------------------------------------------------------------
TEST_CASE("http_response") {
    auto response = HttpResponse::deserialize("HTTP/1.1 206 Partial Content\r\n"
                                              "content-range: bytes 100-199/1000\r\n"
                                              "Content-Length:  100 \r\n"
                                              "\r\n");
    REQUIRE(response.code == HttpResponse::Code::PARTIAL_CONTENT_206);
    REQUIRE(response.status == 206);
    REQUIRE(response.reason == "Partial Content");
    REQUIRE(response.type == HttpResponse::Type::HTTP_1_1);
    REQUIRE(response.getContentLength() == 100u);
    REQUIRE(response.getContentRangeStart() == 100u);
    REQUIRE(response.getContentRangeTotal() == 1000u);
    REQUIRE(response.getHeader("CONTENT-RANGE"));
    REQUIRE(!response.getHeader("Location"));
    REQUIRE(response.describe() == "206 Partial Content");
}
//---------------------------------------------------------------------------
TEST_CASE("http_response_codes") {
    REQUIRE(HttpResponse::getCode(416) == HttpResponse::Code::RANGE_NOT_SATISFIABLE_416);
    REQUIRE(HttpResponse::getCode(418) == HttpResponse::Code::UNKNOWN);
    REQUIRE(HttpResponse::getStatus(HttpResponse::Code::GONE_410) == 410);
    REQUIRE(HttpResponse::checkSuccess(HttpResponse::Code::PARTIAL_CONTENT_206));
    REQUIRE(!HttpResponse::checkSuccess(HttpResponse::Code::NOT_FOUND_404));
    REQUIRE(HttpResponse::checkRedirect(HttpResponse::Code::PERMANENT_REDIRECT_308));
    REQUIRE(!HttpResponse::checkRedirect(HttpResponse::Code::NOT_MODIFIED_304));

    auto unknown = HttpResponse::deserialize("HTTP/1.0 418 I'm a teapot\r\n\r\n");
    REQUIRE(unknown.code == HttpResponse::Code::UNKNOWN);
    REQUIRE(unknown.status == 418);
    REQUIRE(unknown.type == HttpResponse::Type::HTTP_1_0);

    auto unsatisfiable = HttpResponse::deserialize("HTTP/1.1 416 Range Not Satisfiable\r\nContent-Range: bytes */1000\r\n\r\n");
    REQUIRE(unsatisfiable.getContentRangeTotal() == 1000u);
    REQUIRE(!unsatisfiable.getContentRangeStart());
}
//---------------------------------------------------------------------------
TEST_CASE("http_response_invalid") {
    REQUIRE_THROWS_AS(HttpResponse::deserialize("HTTP/1.1 200 OK\r\n"), utils::ProtocolError);
    REQUIRE_THROWS_AS(HttpResponse::deserialize("SPDY/3 200 OK\r\n\r\n"), utils::ProtocolError);
    REQUIRE_THROWS_AS(HttpResponse::deserialize("HTTP/1.1 abc OK\r\n\r\n"), utils::ProtocolError);
}
//---------------------------------------------------------------------------
} // namespace rangeblob::network::test
