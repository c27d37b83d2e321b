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

#include <tiersale/core/assert.h>
#include <tiersale/core/config.hpp>
#include <tiersale/core/int.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

TIERSALE_NAMESPACE_BEGIN

inline constexpr size_t NUM_TIERS = 3;

// Ordered so that a later phase compares greater. The underlying value is
// what is kept in storage, so a never written slot reads as Tier::One.
enum class Tier : uint8_t
{
    One = 0,
    Two = 1,
    Three = 2,
    Closed = 3,
};

// Cumulative upper thresholds of tiers one to three.
using TierSchedule = std::array<uint256_t, NUM_TIERS>;

constexpr bool is_open(Tier const tier) noexcept
{
    return tier != Tier::Closed;
}

constexpr size_t tier_index(Tier const tier) noexcept
{
    TIERSALE_ASSERT(is_open(tier));
    return std::to_underlying(tier);
}

constexpr Tier next_tier(Tier const tier) noexcept
{
    switch (tier) {
    case Tier::One:
        return Tier::Two;
    case Tier::Two:
        return Tier::Three;
    case Tier::Three:
    case Tier::Closed:
        return Tier::Closed;
    }
    std::unreachable();
}

// External numbering used by the ABI and in events: 1, 2, 3 and 0 once the
// sale is closed.
constexpr uint8_t tier_number(Tier const tier) noexcept
{
    return tier == Tier::Closed
               ? uint8_t{0}
               : static_cast<uint8_t>(std::to_underlying(tier) + 1);
}

constexpr std::optional<Tier> tier_from_number(uint8_t const number) noexcept
{
    if (number < 1 || number > NUM_TIERS) {
        return std::nullopt;
    }
    return static_cast<Tier>(number - 1);
}

TIERSALE_NAMESPACE_END
