#pragma once
#include <cassert>
#include <cstdint>
#include <cstring>
#include <memory>
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
/// Minimal version of a vector for raw data with cheap removal of a consumed prefix
template <typename T>
class DataVector {
    private:
    /// Current capacity
    uint64_t _capacity;
    /// Current size, including the consumed prefix
    uint64_t _size;
    /// Start of the unconsumed data
    uint64_t _begin;
    /// The data
    std::unique_ptr<T[]> _data;

    public:
    /// Constructor
    constexpr DataVector() : _capacity(0), _size(0), _begin(0) {}

    /// Constructor with size
    explicit DataVector(uint64_t cap) : _capacity(0), _size(0), _begin(0) {
        resize(cap);
    }

    /// Constructor from other pointers
    DataVector(const T* start, const T* end) : _capacity(0), _size(0), _begin(0) {
        assert(end - start >= 0);
        append(start, static_cast<uint64_t>(end - start));
    }

    /// Get the data
    [[nodiscard]] T* data() {
        return _data.get() + _begin;
    }

    /// Get the data
    [[nodiscard]] const T* cdata() const {
        return _data.get() + _begin;
    }

    /// Get the number of unconsumed elements
    [[nodiscard]] constexpr uint64_t size() const {
        return _size - _begin;
    }

    /// Get the capacity
    [[nodiscard]] constexpr uint64_t capacity() const {
        return _capacity;
    }

    /// Is it empty
    [[nodiscard]] constexpr bool empty() const {
        return _size == _begin;
    }

    /// Clear the data
    constexpr void clear() {
        _size = 0;
        _begin = 0;
    }

    /// View the unconsumed bytes as chars
    [[nodiscard]] std::string_view view() const {
        static_assert(sizeof(T) == 1);
        return std::string_view(reinterpret_cast<const char*>(cdata()), size());
    }

    /// Increase the capacity, compacts a consumed prefix
    void reserve(uint64_t cap) {
        if (_capacity < cap) {
            auto swap = std::unique_ptr<T[]>(new T[cap]());
            if (_data && size())
                std::memcpy(swap.get(), cdata(), size() * sizeof(T));
            _size = size();
            _begin = 0;
            _data.swap(swap);
            _capacity = cap;
        }
    }

    /// Change the number of unconsumed elements
    void resize(uint64_t size) {
        if (_begin + size > _capacity) {
            if (_begin && size <= _capacity) {
                std::memmove(_data.get(), cdata(), this->size() * sizeof(T));
                _begin = 0;
            } else {
                reserve(size);
            }
        }
        _size = _begin + size;
    }

    /// Append elements to the end
    void append(const T* ptr, uint64_t count) {
        auto oldSize = size();
        if (_begin + oldSize + count > _capacity && oldSize + count > _capacity)
            reserve((oldSize + count) > (_capacity << 1) ? oldSize + count : _capacity << 1);
        resize(oldSize + count);
        if (count)
            std::memcpy(data() + oldSize, ptr, count * sizeof(T));
    }

    /// Drop elements from the front
    void consume(uint64_t count) {
        assert(count <= size());
        _begin += count;
        if (_begin == _size)
            clear();
    }
};
//---------------------------------------------------------------------------
} // namespace rangeblob::utils
