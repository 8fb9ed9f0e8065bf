#pragma once
#include <cassert>
#include <chrono>
#include <cstdint>
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
namespace rangeblob::utils {
//---------------------------------------------------------------------------
#ifndef NDEBUG
#define verify(expression) assert(expression)
#else
#define verify(expression) ((void) (expression))
#endif
//---------------------------------------------------------------------------
/// Encode url special characters in %HEX
std::string encodeUrlParameters(const std::string& encode);
/// Encode a path for the request line, keeps '/' and already escaped sequences
std::string encodeUrlPath(std::string_view path);
/// Encode everything from binary representation to hex
std::string hexEncode(const uint8_t* input, uint64_t length, bool upper = false);
/// Case insensitive comparison of ascii strings
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;
/// Strip leading and trailing whitespaces
[[nodiscard]] std::string_view trim(std::string_view s) noexcept;
/// Parse an unsigned decimal number, the whole string must be consumed
[[nodiscard]] std::optional<uint64_t> parseUnsigned(std::string_view s) noexcept;
/// Parse an HTTP-date (RFC 1123, RFC 850, or asctime)
[[nodiscard]] std::optional<std::chrono::system_clock::time_point> parseHttpDate(std::string_view date);
/// Format a time point as RFC 1123 HTTP-date
[[nodiscard]] std::string formatHttpDate(std::chrono::system_clock::time_point time);
//---------------------------------------------------------------------------
} // namespace rangeblob::utils
