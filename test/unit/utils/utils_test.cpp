#include "utils/utils.hpp"
#include <catch2/catch.hpp>
#include <chrono>
//---------------------------------------------------------------------------
// RangeBlob - Seekable HTTP Object Streams
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace rangeblob::utils::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TEST_CASE("utils_encoding") {
    REQUIRE(encodeUrlParameters("a b/c") == "a%20b%2Fc");
    REQUIRE(encodeUrlParameters("safe-_.~") == "safe-_.~");
    REQUIRE(encodeUrlPath("/dir/file name.4mc") == "/dir/file%20name.4mc");
    REQUIRE(encodeUrlPath("/already%20encoded") == "/already%20encoded");
    const uint8_t bytes[] = {0x00, 0xab, 0xff};
    REQUIRE(hexEncode(bytes, 3) == "00abff");
    REQUIRE(hexEncode(bytes, 3, true) == "00ABFF");
}
//---------------------------------------------------------------------------
TEST_CASE("utils_strings") {
    REQUIRE(iequals("Content-Length", "content-length"));
    REQUIRE(!iequals("Content-Length", "Content-Range"));
    REQUIRE(trim("  value \t") == "value");
    REQUIRE(trim("   ").empty());
    REQUIRE(parseUnsigned("1234") == 1234u);
    REQUIRE(!parseUnsigned(""));
    REQUIRE(!parseUnsigned("12a"));
    REQUIRE(!parseUnsigned("-1"));
}
//---------------------------------------------------------------------------
TEST_CASE("utils_http_date") {
    constexpr time_t expected = 784111777;
    SECTION("rfc 1123") {
        auto time = parseHttpDate("Sun, 06 Nov 1994 08:49:37 GMT");
        REQUIRE(time);
        REQUIRE(chrono::system_clock::to_time_t(*time) == expected);
    }
    SECTION("rfc 850") {
        auto time = parseHttpDate("Sunday, 06-Nov-94 08:49:37 GMT");
        REQUIRE(time);
        REQUIRE(chrono::system_clock::to_time_t(*time) == expected);
    }
    SECTION("asctime") {
        auto time = parseHttpDate("Sun Nov  6 08:49:37 1994");
        REQUIRE(time);
        REQUIRE(chrono::system_clock::to_time_t(*time) == expected);
    }
    SECTION("invalid") {
        REQUIRE(!parseHttpDate("yesterday"));
        REQUIRE(!parseHttpDate(""));
    }
    SECTION("format") {
        REQUIRE(formatHttpDate(chrono::system_clock::from_time_t(expected)) == "Sun, 06 Nov 1994 08:49:37 GMT");
    }
}
//---------------------------------------------------------------------------
} // namespace rangeblob::utils::test
