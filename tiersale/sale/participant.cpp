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

#include <tiersale/contract/abi_encode.hpp>
#include <tiersale/contract/big_endian.hpp>
#include <tiersale/core/byte_string.hpp>
#include <tiersale/core/int.hpp>
#include <tiersale/sale/participant.hpp>
#include <tiersale/sale/tier.hpp>

TIERSALE_NAMESPACE_BEGIN

uint256_t ParticipantRecord::bucket_sum() const noexcept
{
    uint256_t sum{0};
    for (auto const &bucket : per_tier) {
        sum += bucket;
    }
    return sum;
}

StoredParticipant to_stored(ParticipantRecord const &record) noexcept
{
    StoredParticipant stored{};
    stored.total = record.total;
    for (size_t i = 0; i < NUM_TIERS; ++i) {
        stored.per_tier[i] = record.per_tier[i];
    }
    return stored;
}

ParticipantRecord from_stored(StoredParticipant const &stored) noexcept
{
    ParticipantRecord record{};
    record.total = stored.total.native();
    for (size_t i = 0; i < NUM_TIERS; ++i) {
        record.per_tier[i] = stored.per_tier[i].native();
    }
    return record;
}

byte_string abi_encode(ParticipantRecord const &record)
{
    AbiEncoder encoder;
    encoder.add_uint(record.total);
    for (auto const &bucket : record.per_tier) {
        encoder.add_uint(bucket);
    }
    return encoder.encode_final();
}

TIERSALE_NAMESPACE_END
