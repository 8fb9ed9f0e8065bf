#pragma once
#include <cstdint>
#include <optional>
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
//---------------------------------------------------------------------------
namespace network {
struct HttpResponse;
} // namespace network
//---------------------------------------------------------------------------
namespace stream {
//---------------------------------------------------------------------------
/// Maps response statuses onto the error types of the library
class StatusPolicy {
    public:
    /// How a ranged GET response relates to the requested offset
    enum class RangeOutcome : uint8_t {
        /// The first body byte is the requested offset
        Positioned,
        /// The server ignored the range, the body starts at 0
        FullBody,
        /// The offset is at or past the end of the object
        Unsatisfiable
    };

    /// Objects smaller than this cannot hold a valid block compressed file
    static constexpr uint64_t minimumObjectLength = 12;
    /// The message suffix of rejected mutations
    static constexpr std::string_view notSupported = " not supported on read-only filesystem";

    /// A metadata probe must answer 200, throws NotFoundError naming the object
    static void checkMetadata(const network::HttpResponse& response, std::string_view object);
    /// Validate the declared length, throws ProtocolError
    static uint64_t checkObjectLength(std::optional<uint64_t> length, std::string_view object);
    /// Classify the response of a ranged GET, throws NotFoundError, ProtocolError, or IOError
    [[nodiscard]] static RangeOutcome checkRange(const network::HttpResponse& response, uint64_t offset, std::string_view object);
    /// The total object length reported by a ranged GET response
    [[nodiscard]] static std::optional<uint64_t> objectLength(const network::HttpResponse& response, uint64_t offset, RangeOutcome outcome);
    /// Reject a mutation
    [[noreturn]] static void unsupported(std::string_view operation);
};
//---------------------------------------------------------------------------
} // namespace stream
} // namespace rangeblob
