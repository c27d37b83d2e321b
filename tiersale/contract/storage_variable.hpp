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

#include <tiersale/core/address.hpp>
#include <tiersale/core/bytes.hpp>
#include <tiersale/core/config.hpp>
#include <tiersale/core/int.hpp>
#include <tiersale/state/state.hpp>

#include <intx/intx.hpp>

#include <array>
#include <bit>
#include <cstring>
#include <optional>
#include <type_traits>

TIERSALE_NAMESPACE_BEGIN

// A typed value spanning N consecutive storage slots starting at `key`. The
// value is copied bytewise into the slots, so a zeroed value and an absent
// value look the same to load_checked().
template <typename T>
    requires std::is_trivially_copyable_v<T>
class StorageVariable
{
public:
    static constexpr size_t N =
        (sizeof(T) + sizeof(bytes32_t) - 1) / sizeof(bytes32_t);

private:
    using Slots = std::array<bytes32_t, N>;

    State &state_;
    Address address_;
    uint256_t offset_;

    bytes32_t slot_key(size_t const i) const noexcept
    {
        return intx::be::store<bytes32_t>(offset_ + i);
    }

    Slots read() const
    {
        Slots slots{};
        for (size_t i = 0; i < N; ++i) {
            slots[i] = state_.get_storage(address_, slot_key(i));
        }
        return slots;
    }

    void write(Slots const &slots)
    {
        for (size_t i = 0; i < N; ++i) {
            state_.set_storage(address_, slot_key(i), slots[i]);
        }
    }

    static T decode(Slots const &slots) noexcept
    {
        std::array<unsigned char, sizeof(T)> raw;
        std::memcpy(raw.data(), slots.data(), sizeof(T));
        return std::bit_cast<T>(raw);
    }

    static Slots encode(T const &value) noexcept
    {
        Slots slots{};
        std::memcpy(slots.data(), &value, sizeof(T));
        return slots;
    }

public:
    StorageVariable(State &state, Address const &address, bytes32_t const &key)
        : state_{state}
        , address_{address}
        , offset_{intx::be::load<uint256_t>(key)}
    {
    }

    StorageVariable(
        State &state, Address const &address, uint256_t const &offset)
        : state_{state}
        , address_{address}
        , offset_{offset}
    {
    }

    T load() const
    {
        return decode(read());
    }

    std::optional<T> load_checked() const
    {
        auto const slots = read();
        for (auto const &slot : slots) {
            if (slot != bytes32_t{}) {
                return decode(slots);
            }
        }
        return std::nullopt;
    }

    void store(T const &value)
    {
        write(encode(value));
    }

    T clear()
    {
        auto const slots = read();
        write(Slots{});
        return decode(slots);
    }
};

TIERSALE_NAMESPACE_END
