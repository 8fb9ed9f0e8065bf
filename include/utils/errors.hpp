#pragma once
#include <stdexcept>
#include <string>
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
/// The base of all errors raised by the library
class Error : public std::runtime_error {
    public:
    /// The constructor
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};
//---------------------------------------------------------------------------
/// The remote object does not answer successfully
class NotFoundError : public Error {
    public:
    /// The constructor
    explicit NotFoundError(const std::string& message) : Error(message) {}
};
//---------------------------------------------------------------------------
/// The remote object is reachable but invalid, or the peer violated HTTP
class ProtocolError : public Error {
    public:
    /// The constructor
    explicit ProtocolError(const std::string& message) : Error(message) {}
};
//---------------------------------------------------------------------------
/// A transient failure while establishing or using a connection
class IOError : public Error {
    public:
    /// The constructor
    explicit IOError(const std::string& message) : Error(message) {}
};
//---------------------------------------------------------------------------
/// A mutation was requested on read-only remote objects
class UnsupportedOperationError : public Error {
    public:
    /// The constructor
    explicit UnsupportedOperationError(const std::string& message) : Error(message) {}
};
//---------------------------------------------------------------------------
/// An operation was invoked on a stream that is not open
class IllegalStateError : public Error {
    public:
    /// The constructor
    explicit IllegalStateError(const std::string& message) : Error(message) {}
};
//---------------------------------------------------------------------------
} // namespace rangeblob::utils
