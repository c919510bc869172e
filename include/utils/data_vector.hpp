#pragma once
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
#include <stdexcept>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2021
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace playcache::utils {
//---------------------------------------------------------------------------
/// Minimal growable buffer that only stores raw, trivially copyable data
template <typename T>
class DataVector {
    private:
    /// Current capacity
    uint64_t _capacity;
    /// Current size
    uint64_t _size;
    /// The data
    std::unique_ptr<T[]> _data;

    public:
    /// Constructor
    DataVector() : _capacity(0), _size(0), _data() {}

    /// Constructor with size
    explicit DataVector(uint64_t size) : _capacity(0), _size(0), _data() {
        resize(size);
    }

    /// Constructor from other pointers
    DataVector(const T* start, const T* end) : _capacity(0), _size(0), _data() {
        if (end < start)
            throw std::invalid_argument("DataVector: end before start");
        append(start, static_cast<uint64_t>(end - start));
    }

    /// Copy constructor
    DataVector(const DataVector& rhs) : _capacity(0), _size(0), _data() {
        append(rhs.cdata(), rhs.size());
    }

    /// Move constructor
    DataVector(DataVector&& rhs) noexcept : _capacity(rhs._capacity), _size(rhs._size), _data(std::move(rhs._data)) {
        rhs._capacity = 0;
        rhs._size = 0;
    }

    /// Copy assignment
    DataVector& operator=(const DataVector& rhs) {
        if (this != &rhs) {
            clear();
            append(rhs.cdata(), rhs.size());
        }
        return *this;
    }

    /// Move assignment
    DataVector& operator=(DataVector&& rhs) noexcept {
        _capacity = rhs._capacity;
        _size = rhs._size;
        _data = std::move(rhs._data);
        rhs._capacity = 0;
        rhs._size = 0;
        return *this;
    }

    /// Get the data
    [[nodiscard]] constexpr T* data() {
        return _data.get();
    }

    /// Get the data
    [[nodiscard]] constexpr const T* cdata() const {
        return _data.get();
    }

    /// Get the size
    [[nodiscard]] constexpr uint64_t size() const {
        return _size;
    }

    /// Get the capacity
    [[nodiscard]] constexpr uint64_t capacity() const {
        return _capacity;
    }

    /// Is the vector empty
    [[nodiscard]] constexpr bool empty() const {
        return !_size;
    }

    /// Clear the size
    constexpr void clear() {
        _size = 0;
    }

    /// Increase the capacity
    void reserve(uint64_t cap) {
        if (_capacity < cap) {
            auto swap = std::unique_ptr<T[]>(new T[cap]());
            if (_data && _size)
                std::memcpy(swap.get(), _data.get(), _size * sizeof(T));
            _data.swap(swap);
            _capacity = cap;
        }
    }

    /// Change the number of elements
    void resize(uint64_t size) {
        if (size > _capacity)
            reserve(size);
        _size = size;
    }

    /// Append elements at the end, grows by at least half of the capacity
    void append(const T* ptr, uint64_t count) {
        if (!count)
            return;
        if (_size + count > _capacity) {
            auto grown = _capacity + (_capacity >> 1);
            reserve(grown > _size + count ? grown : _size + count);
        }
        std::memcpy(_data.get() + _size, ptr, count * sizeof(T));
        _size += count;
    }

    /// View a subrange, throws if the range is not inside the vector
    [[nodiscard]] std::span<const T> view(uint64_t offset, uint64_t count) const {
        if (offset > _size || count > _size - offset)
            throw std::out_of_range("DataVector: view out of range");
        return std::span<const T>(_data.get() + offset, count);
    }

    /// Transfer the ownership of the data
    [[nodiscard]] std::unique_ptr<T[]> transferBuffer() {
        _capacity = 0;
        _size = 0;
        return std::move(_data);
    }
};
//---------------------------------------------------------------------------
} // namespace playcache::utils
