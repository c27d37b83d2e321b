// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <tiersale/contract/big_endian.hpp>
#include <tiersale/contract/storage_variable.hpp>
#include <tiersale/core/address.hpp>
#include <tiersale/core/bytes.hpp>
#include <tiersale/core/config.hpp>
#include <tiersale/core/int.hpp>
#include <tiersale/state/state.hpp>

#include <intx/intx.hpp>

#include <cstdint>

TIERSALE_NAMESPACE_BEGIN

// Append-only array in contract storage. The slot at `key` holds the length,
// elements follow at key + 1 onwards.
template <typename T>
    requires std::is_trivially_copyable_v<T>
class StorageArray
{
    static constexpr size_t SLOTS_PER_ELEMENT = StorageVariable<T>::N;

    State &state_;
    Address address_;
    StorageVariable<u64_be> length_;
    uint256_t start_;

public:
    StorageArray(State &state, Address const &address, bytes32_t const &key)
        : state_{state}
        , address_{address}
        , length_{state, address, key}
        , start_{intx::be::load<uint256_t>(key) + 1}
    {
    }

    uint64_t length() const
    {
        return length_.load().native();
    }

    bool empty() const
    {
        return length() == 0;
    }

    StorageVariable<T> get(uint64_t const index) const
    {
        return StorageVariable<T>{
            state_, address_, start_ + uint256_t{index} * SLOTS_PER_ELEMENT};
    }

    void push(T const &value)
    {
        auto const len = length();
        get(len).store(value);
        length_.store(len + 1);
    }

    // Popping an empty array leaves it untouched and returns a zeroed T.
    T pop()
    {
        auto const len = length();
        if (len == 0) {
            return T{};
        }
        auto const value = get(len - 1).clear();
        length_.store(len - 1);
        return value;
    }
};

TIERSALE_NAMESPACE_END
