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
#include <tiersale/core/byte_string.hpp>
#include <tiersale/core/config.hpp>
#include <tiersale/core/int.hpp>
#include <tiersale/sale/tier.hpp>

#include <array>

TIERSALE_NAMESPACE_BEGIN

struct ParticipantRecord
{
    uint256_t total{0};
    std::array<uint256_t, NUM_TIERS> per_tier{};

    bool operator==(ParticipantRecord const &) const = default;

    uint256_t bucket_sum() const noexcept;
};

// One slot per word: total, then the tier buckets in order.
struct StoredParticipant
{
    u256_be total;
    u256_be per_tier[NUM_TIERS];
};

static_assert(sizeof(StoredParticipant) == 128);
static_assert(alignof(StoredParticipant) == 1);

StoredParticipant to_stored(ParticipantRecord const &) noexcept;
ParticipantRecord from_stored(StoredParticipant const &) noexcept;

// (uint256 total, uint256 tier1, uint256 tier2, uint256 tier3)
byte_string abi_encode(ParticipantRecord const &);

TIERSALE_NAMESPACE_END
