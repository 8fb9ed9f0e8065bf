#include "stream/metadata_probe.hpp"
#include "cloud/remote_object.hpp"
#include "test/unit/test_transport.hpp"
#include "utils/errors.hpp"
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
namespace rangeblob::stream::test {
//---------------------------------------------------------------------------
using namespace std;
using rangeblob::test::FakeTransport;
//---------------------------------------------------------------------------
TEST_CASE("metadata_probe") {
    FakeTransport transport(rangeblob::test::makeContent(4096));
    MetadataProbe probe(transport);
    auto ref = cloud::RemoteObjectRef::parse("https://example.org/logs/part-0.4mc");

    SECTION("existing object") {
        transport.lastModified = "Sun, 06 Nov 1994 08:49:37 GMT";
        auto metadata = probe.stat(ref);
        REQUIRE(metadata.exists);
        REQUIRE(metadata.length == 4096);
        REQUIRE(chrono::system_clock::to_time_t(metadata.lastModified) == 784111777);
        REQUIRE(transport.heads == 1);
        REQUIRE(transport.opens == 0);
    }
    SECTION("missing Last-Modified defaults to now") {
        auto before = chrono::system_clock::now();
        auto metadata = probe.stat(ref);
        REQUIRE(metadata.lastModified >= before);
        REQUIRE(metadata.lastModified <= chrono::system_clock::now());
    }
    SECTION("unparsable Last-Modified defaults to now") {
        transport.lastModified = "yesterday";
        auto before = chrono::system_clock::now();
        REQUIRE(probe.stat(ref).lastModified >= before);
    }
    SECTION("absent object names the path") {
        transport.found = false;
        REQUIRE_THROWS_AS(probe.stat(ref), utils::NotFoundError);
        REQUIRE_THROWS_WITH(probe.stat(ref), Catch::Contains("/logs/part-0.4mc"));
    }
    SECTION("eleven bytes are too small") {
        transport.content = rangeblob::test::makeContent(11);
        REQUIRE_THROWS_AS(probe.stat(ref), utils::ProtocolError);
    }
    SECTION("twelve bytes are enough") {
        transport.content = rangeblob::test::makeContent(12);
        REQUIRE(probe.stat(ref).length == 12);
    }
    SECTION("missing length is invalid") {
        transport.omitLength = true;
        REQUIRE_THROWS_AS(probe.stat(ref), utils::ProtocolError);
    }
    SECTION("no caching") {
        (void) probe.stat(ref);
        (void) probe.stat(ref);
        REQUIRE(transport.heads == 2);
    }
    SECTION("transport failures are not retried") {
        transport.failures = 1;
        REQUIRE_THROWS_AS(probe.stat(ref), utils::IOError);
        REQUIRE(transport.attempts == 1);
    }
    SECTION("exists") {
        REQUIRE(probe.exists(ref));
        transport.content = "tiny";
        REQUIRE(probe.exists(ref));
        transport.found = false;
        REQUIRE(!probe.exists(ref));
    }
}
//---------------------------------------------------------------------------
} // namespace rangeblob::stream::test
