#include "utils/utils.hpp"
#include <cctype>
#include <charconv>
#include <cstring>
#include <ctime>
#include <string>
//---------------------------------------------------------------------------
// RangeBlob - Seekable HTTP Object Streams
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace rangeblob {
namespace utils {
//---------------------------------------------------------------------------
string hexEncode(const uint8_t* input, uint64_t length, bool upper)
// Encodes a string as a hex string
{
    const char hex[] = "0123456789abcdef";
    string output;
    output.reserve(length << 1);
    for (auto i = 0u; i < length; i++) {
        output.push_back(upper ? static_cast<char>(toupper(hex[input[i] >> 4])) : hex[input[i] >> 4]);
        output.push_back(upper ? static_cast<char>(toupper(hex[input[i] & 15])) : hex[input[i] & 15]);
    }
    return output;
}
//---------------------------------------------------------------------------
string encodeUrlParameters(const string& encode)
// Encodes a string for url
{
    string result;
    for (auto c : encode) {
        if (isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~')
            result += c;
        else {
            result += "%";
            result += hexEncode(reinterpret_cast<uint8_t*>(&c), 1, true);
        }
    }
    return result;
}
//---------------------------------------------------------------------------
string encodeUrlPath(string_view path)
// Encodes a path, keeps the segment separators and escapes
{
    static constexpr string_view allowed = "-_.~/%!$&'()*+,;=:@";
    string result;
    result.reserve(path.size());
    for (auto c : path) {
        if (isalnum(static_cast<unsigned char>(c)) || allowed.find(c) != string_view::npos)
            result += c;
        else {
            result += "%";
            result += hexEncode(reinterpret_cast<uint8_t*>(&c), 1, true);
        }
    }
    return result;
}
//---------------------------------------------------------------------------
bool iequals(string_view a, string_view b) noexcept
// Case insensitive compare
{
    if (a.size() != b.size())
        return false;
    for (auto i = 0u; i < a.size(); i++)
        if (tolower(static_cast<unsigned char>(a[i])) != tolower(static_cast<unsigned char>(b[i])))
            return false;
    return true;
}
//---------------------------------------------------------------------------
string_view trim(string_view s) noexcept
// Strip whitespaces
{
    static constexpr string_view whitespaces = " \t\r\n";
    auto start = s.find_first_not_of(whitespaces);
    if (start == string_view::npos)
        return {};
    auto end = s.find_last_not_of(whitespaces);
    return s.substr(start, end - start + 1);
}
//---------------------------------------------------------------------------
optional<uint64_t> parseUnsigned(string_view s) noexcept
// Parse a decimal number
{
    if (s.empty())
        return nullopt;
    uint64_t value = 0;
    auto [ptr, ec] = from_chars(s.data(), s.data() + s.size(), value);
    if (ec != errc() || ptr != s.data() + s.size())
        return nullopt;
    return value;
}
//---------------------------------------------------------------------------
optional<chrono::system_clock::time_point> parseHttpDate(string_view date)
// Parse the three date formats of RFC 7231
{
    static constexpr const char* formats[] = {
        "%a, %d %b %Y %H:%M:%S GMT", // RFC 1123
        "%A, %d-%b-%y %H:%M:%S GMT", // RFC 850
        "%a %b %d %H:%M:%S %Y" // asctime
    };

    string input(trim(date));
    for (auto format : formats) {
        tm time;
        memset(&time, 0, sizeof(time));
        auto end = strptime(input.c_str(), format, &time);
        if (!end || *end != '\0')
            continue;
        auto seconds = timegm(&time);
        if (seconds == static_cast<time_t>(-1))
            continue;
        return chrono::system_clock::from_time_t(seconds);
    }
    return nullopt;
}
//---------------------------------------------------------------------------
string formatHttpDate(chrono::system_clock::time_point time)
// Format as RFC 1123
{
    auto seconds = chrono::system_clock::to_time_t(time);
    tm gmt;
    gmtime_r(&seconds, &gmt);
    char buffer[64];
    auto length = strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S GMT", &gmt);
    return string(buffer, length);
}
//---------------------------------------------------------------------------
} // namespace utils
} // namespace rangeblob
