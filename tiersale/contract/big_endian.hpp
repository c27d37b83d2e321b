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

#include <tiersale/core/config.hpp>
#include <tiersale/core/int.hpp>

#include <intx/intx.hpp>

#include <cstdint>
#include <cstring>
#include <type_traits>

TIERSALE_NAMESPACE_BEGIN

// Fixed width big endian integer as it is laid out in a storage slot or an
// ABI word. Trivially copyable with alignment 1 so that structs of these pack
// into slots without padding.
template <typename T>
    requires(std::is_unsigned_v<T> || std::is_same_v<T, uint256_t>)
struct BigEndian
{
    unsigned char bytes[sizeof(T)];

    BigEndian() = default;

    BigEndian(T const &x) noexcept
    {
        intx::be::unsafe::store(bytes, x);
    }

    T native() const noexcept
    {
        return intx::be::unsafe::load<T>(bytes);
    }

    bool is_zero() const noexcept
    {
        for (auto const b : bytes) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    BigEndian &operator=(T const &x) noexcept
    {
        intx::be::unsafe::store(bytes, x);
        return *this;
    }

    bool operator==(BigEndian const &other) const noexcept
    {
        return std::memcmp(bytes, other.bytes, sizeof(T)) == 0;
    }

    static BigEndian from_bytes(unsigned char const (&raw)[sizeof(T)]) noexcept
    {
        BigEndian result;
        std::memcpy(result.bytes, raw, sizeof(T));
        return result;
    }
};

using u8_be = BigEndian<uint8_t>;
using u64_be = BigEndian<uint64_t>;
using u256_be = BigEndian<uint256_t>;

static_assert(sizeof(u8_be) == 1 && alignof(u8_be) == 1);
static_assert(sizeof(u64_be) == 8 && alignof(u64_be) == 1);
static_assert(sizeof(u256_be) == 32 && alignof(u256_be) == 1);

template <typename T>
struct is_big_endian_wrapper : std::false_type
{
};

template <typename U>
struct is_big_endian_wrapper<BigEndian<U>> : std::true_type
{
};

template <typename T>
concept BigEndianType = is_big_endian_wrapper<T>::value;

TIERSALE_NAMESPACE_END
