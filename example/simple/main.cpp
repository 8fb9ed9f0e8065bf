#include "cloud/file_system.hpp"
#include "utils/errors.hpp"
#include "utils/utils.hpp"
#include <algorithm>
#include <iostream>
#include <limits>
#include <string>
#include <vector>
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
static uint64_t parseArgument(const char* name, const char* value)
// Parse a numeric argument
{
    auto result = rangeblob::utils::parseUnsigned(value);
    if (!result)
        throw rangeblob::utils::Error(string("Invalid ") + name + ": " + value);
    return *result;
}
//---------------------------------------------------------------------------
int main(int argc, char** argv) {
    if (argc < 2 || argc > 4) {
        cerr << "usage: " << argv[0] << " <url> [offset] [length]" << endl;
        return 1;
    }

    try {
        string url = argv[1];
        auto offset = argc > 2 ? parseArgument("offset", argv[2]) : 0;
        auto length = argc > 3 ? parseArgument("length", argv[3]) : numeric_limits<uint64_t>::max();

        // The filesystem is bound to the scheme and authority of the url
        rangeblob::cloud::FileSystem fs(url);

        // Stat the object first, absent and empty objects fail here
        auto status = fs.getFileStatus(url);
        cerr << status.path << ": " << status.length << " bytes, modified " << rangeblob::utils::formatHttpDate(status.modificationTime) << endl;

        auto stream = fs.open(url);
        stream->seek(offset);

        vector<uint8_t> buffer(fs.getConnector().getConfig().chunkSize);
        while (length) {
            auto count = stream->read(buffer.data(), min<uint64_t>(length, buffer.size()));
            if (!count)
                break;
            cout.write(reinterpret_cast<const char*>(buffer.data()), static_cast<streamsize>(count));
            length -= count;
        }
        cout.flush();
        stream->close();
    } catch (const exception& e) {
        cerr << e.what() << endl;
        return 1;
    }
    return 0;
}
//---------------------------------------------------------------------------
