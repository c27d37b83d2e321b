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
#include <tiersale/contract/storage_array.hpp>
#include <tiersale/contract/storage_variable.hpp>
#include <tiersale/core/address.hpp>
#include <tiersale/core/bytes.hpp>
#include <tiersale/core/config.hpp>
#include <tiersale/core/int.hpp>
#include <tiersale/core/result.hpp>
#include <tiersale/sale/participant.hpp>
#include <tiersale/sale/tier.hpp>

#include <array>
#include <bit>
#include <cstdint>
#include <utility>
#include <vector>

TIERSALE_NAMESPACE_BEGIN

class State;

// Contribution accounting across three cumulative capacity tiers. Amounts
// that overflow the active tier roll into the next one. Once the last tier
// is full the ledger is closed and rejects everything until reset.
class TierLedger
{
    State &state_;
    Address const &ca_;

public:
    struct StoredSchedule
    {
        u256_be limits[NUM_TIERS];
    };

    static_assert(sizeof(StoredSchedule) == 96);
    static_assert(alignof(StoredSchedule) == 1);

    class Variables
    {
        State &state_;
        Address const &ca_;

        static constexpr auto AddressTier{
            0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};
        static constexpr auto AddressTotalCollected{
            0x0000000000000000000000000000000000000000000000000000000000000002_bytes32};
        static constexpr auto AddressIndividualCap{
            0x0000000000000000000000000000000000000000000000000000000000000003_bytes32};
        // spans three slots
        static constexpr auto AddressSchedule{
            0x0000000000000000000000000000000000000000000000000000000000000004_bytes32};

        static constexpr auto AddressParticipantIndex{
            0x0100000000000000000000000000000000000000000000000000000000000000_bytes32};

        enum : uint8_t
        {
            PrefixParticipant = 0x02,
        };

    public:
        explicit Variables(State &state, Address const &ca)
            : state_{state}
            , ca_{ca}
        {
        }

        StorageVariable<u8_be> tier{state_, ca_, AddressTier};
        StorageVariable<u256_be> total_collected{
            state_, ca_, AddressTotalCollected};
        StorageVariable<u256_be> individual_cap{
            state_, ca_, AddressIndividualCap};
        StorageVariable<StoredSchedule> schedule{state_, ca_, AddressSchedule};
        StorageArray<Address> participant_index{
            state_, ca_, AddressParticipantIndex};

        // mapping (address => ParticipantRecord) participants
        auto participant(Address const &address) const noexcept
        {
            struct
            {
                uint8_t mask;
                Address address;
                uint8_t slots[11];
            } key{
                .mask = PrefixParticipant,
                .address = address,
                .slots = {}};

            return StorageVariable<StoredParticipant>(
                state_, ca_, std::bit_cast<bytes32_t>(key));
        }
    } vars;

    struct Transition
    {
        Tier from;
        Tier to;

        bool operator==(Transition const &) const = default;
    };

    struct AcceptOutcome
    {
        std::array<uint256_t, NUM_TIERS> booked{};
        // Part of the amount past the last tier's limit. Not attributed to
        // any bucket but still forwarded with the rest of the deposit.
        uint256_t unbooked{0};
        ParticipantRecord participant{};
        Tier tier{Tier::One};
        bool closed{false};
        std::vector<Transition> transitions{};
    };

    struct ParticipantEntry
    {
        Address address;
        ParticipantRecord record;
    };

    TierLedger(State &, Address const &);

    // Writes the schedule and cap of a fresh ledger. Limits must be non-zero
    // and strictly increasing, the cap non-zero.
    Result<void> initialize(TierSchedule const &, uint256_t const &cap);

    Result<AcceptOutcome>
    accept(Address const &participant, uint256_t const &amount);

    // Clears every participant record and restarts at tier one. The schedule
    // and individual cap are kept. Returns the number of records cleared.
    uint64_t reset();

    Result<void> update_tier_limit(Tier, uint256_t const &new_limit);
    Result<void> update_individual_cap(uint256_t const &);

    /////////////
    // Getters //
    /////////////
    Tier current_tier() const;
    uint256_t total_collected() const;
    uint256_t individual_cap() const;
    uint256_t tier_limit(Tier) const;
    TierSchedule schedule() const;
    ParticipantRecord participant(Address const &) const;
    uint64_t participant_count() const;
    Address participant_at(uint64_t index) const;

    // One based page of the participant index in insertion order.
    Result<std::vector<ParticipantEntry>>
    participants_page(uint64_t page, uint64_t page_size) const;

private:
    Tier advance_tier(Tier from, uint256_t const &total);
    void store_schedule(TierSchedule const &);

    ////////////
    // Events //
    ////////////
    void emit_contribution_recorded_event(
        Address const &participant, Tier, uint256_t const &amount);
    void emit_tier_advanced_event(Tier from, Tier to, uint256_t const &total);
    void emit_tier_limit_updated_event(
        Tier, uint256_t const &old_limit, uint256_t const &new_limit);
    void emit_ledger_reset_event(uint64_t cleared);
};

TIERSALE_NAMESPACE_END
