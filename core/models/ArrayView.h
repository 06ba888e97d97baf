// Copyright 2025 eventsift Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <cstddef>
#include <iterator>
#include <vector>

namespace eventsift {

// Borrowed, read-only window over contiguous elements. The view never owns its elements,
// the backing storage must outlive it.
template <class T>
class ArrayView {
private:
    const T* mElements;
    size_t mSize;

public:
    constexpr ArrayView() : mElements(nullptr), mSize(0) {}
    constexpr ArrayView(const T* ptr, size_t size) : mElements(ptr), mSize(size) {}
    ArrayView(const std::vector<T>& vec) : mElements(vec.data()), mSize(vec.size()) {}

    constexpr size_t size() const { return mSize; }
    constexpr bool empty() const { return mSize == 0; }
    constexpr const T& operator[](size_t i) const { return mElements[i]; }
    const T& front() const { return mElements[0]; }
    const T& back() const { return mElements[mSize - 1]; }

    std::vector<T> ToVector() const { return std::vector<T>(mElements, mElements + mSize); }

    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        explicit iterator(const T* ptr) : mPtr(ptr) {}
        iterator& operator++() {
            ++mPtr;
            return *this;
        }
        iterator operator++(int) {
            iterator tmp = *this;
            ++mPtr;
            return tmp;
        }
        bool operator==(const iterator& other) const { return mPtr == other.mPtr; }
        bool operator!=(const iterator& other) const { return mPtr != other.mPtr; }
        const T& operator*() const { return *mPtr; }

    private:
        const T* mPtr;
    };
    iterator begin() const { return iterator(mElements); }
    iterator end() const { return iterator(mElements + mSize); }
};

} // namespace eventsift
