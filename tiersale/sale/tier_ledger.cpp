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
#include <tiersale/contract/abi_signatures.hpp>
#include <tiersale/contract/big_endian.hpp>
#include <tiersale/contract/events.hpp>
#include <tiersale/core/address.hpp>
#include <tiersale/core/assert.h>
#include <tiersale/core/fmt/address_fmt.hpp>
#include <tiersale/core/fmt/int_fmt.hpp>
#include <tiersale/core/int.hpp>
#include <tiersale/core/likely.h>
#include <tiersale/core/result.hpp>
#include <tiersale/sale/participant.hpp>
#include <tiersale/sale/sale_error.hpp>
#include <tiersale/sale/tier.hpp>
#include <tiersale/sale/tier_fmt.hpp>
#include <tiersale/sale/tier_ledger.hpp>
#include <tiersale/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <intx/intx.hpp>
#include <quill/Quill.h>

#include <algorithm>
#include <cstdint>
#include <utility>
#include <vector>

TIERSALE_ANONYMOUS_NAMESPACE_BEGIN

bool is_strictly_increasing(TierSchedule const &limits) noexcept
{
    for (size_t i = 1; i < limits.size(); ++i) {
        if (limits[i - 1] >= limits[i]) {
            return false;
        }
    }
    return true;
}

TIERSALE_ANONYMOUS_NAMESPACE_END

TIERSALE_NAMESPACE_BEGIN

TierLedger::TierLedger(State &state, Address const &ca)
    : state_{state}
    , ca_{ca}
    , vars{state, ca}
{
}

Result<void>
TierLedger::initialize(TierSchedule const &limits, uint256_t const &cap)
{
    if (TIERSALE_UNLIKELY(limits[0] == 0 || !is_strictly_increasing(limits))) {
        return SaleError::InvalidParameter;
    }
    if (TIERSALE_UNLIKELY(cap == 0)) {
        return SaleError::InvalidParameter;
    }
    store_schedule(limits);
    vars.individual_cap.store(cap);
    return outcome::success();
}

/////////////
// Getters //
/////////////

Tier TierLedger::current_tier() const
{
    auto const raw = vars.tier.load().native();
    TIERSALE_ASSERT(raw <= std::to_underlying(Tier::Closed));
    return static_cast<Tier>(raw);
}

uint256_t TierLedger::total_collected() const
{
    return vars.total_collected.load().native();
}

uint256_t TierLedger::individual_cap() const
{
    return vars.individual_cap.load().native();
}

uint256_t TierLedger::tier_limit(Tier const tier) const
{
    return vars.schedule.load().limits[tier_index(tier)].native();
}

TierSchedule TierLedger::schedule() const
{
    auto const stored = vars.schedule.load();
    TierSchedule limits{};
    for (size_t i = 0; i < NUM_TIERS; ++i) {
        limits[i] = stored.limits[i].native();
    }
    return limits;
}

ParticipantRecord TierLedger::participant(Address const &address) const
{
    return from_stored(vars.participant(address).load());
}

uint64_t TierLedger::participant_count() const
{
    return vars.participant_index.length();
}

Address TierLedger::participant_at(uint64_t const index) const
{
    TIERSALE_ASSERT(index < participant_count());
    return vars.participant_index.get(index).load();
}

Result<std::vector<TierLedger::ParticipantEntry>>
TierLedger::participants_page(
    uint64_t const page, uint64_t const page_size) const
{
    if (TIERSALE_UNLIKELY(page == 0 || page_size == 0)) {
        return SaleError::InvalidInput;
    }
    auto const count = participant_count();
    auto const start = uint256_t{page - 1} * uint256_t{page_size};
    if (TIERSALE_UNLIKELY(start >= uint256_t{count})) {
        return SaleError::PaginationOutOfRange;
    }

    auto const first = static_cast<uint64_t>(start);
    auto const last = first + std::min(page_size, count - first);
    std::vector<ParticipantEntry> entries;
    entries.reserve(last - first);
    for (uint64_t i = first; i < last; ++i) {
        auto const address = participant_at(i);
        entries.push_back({.address = address, .record = participant(address)});
    }
    return entries;
}

/////////////
// Updates //
/////////////

Result<TierLedger::AcceptOutcome>
TierLedger::accept(Address const &address, uint256_t const &amount)
{
    if (TIERSALE_UNLIKELY(amount == 0)) {
        return SaleError::InvalidAmount;
    }
    auto tier = current_tier();
    if (TIERSALE_UNLIKELY(tier == Tier::Closed)) {
        return SaleError::SaleClosed;
    }

    auto slot = vars.participant(address);
    auto const stored = slot.load_checked();
    bool const is_new = !stored.has_value();
    auto record = is_new ? ParticipantRecord{} : from_stored(*stored);

    // The cap only binds while tiers one and two are open.
    if (tier != Tier::Three) {
        auto const [after, overflow] = intx::addc(record.total, amount);
        if (TIERSALE_UNLIKELY(overflow || after > individual_cap())) {
            return SaleError::IndividualCapExceeded;
        }
    }

    auto const limits = schedule();
    auto total = total_collected();
    uint256_t remaining = amount;
    AcceptOutcome accepted{};

    auto const book = [&](uint256_t const &booked) {
        if (booked == 0) {
            return;
        }
        auto const i = tier_index(tier);
        record.per_tier[i] += booked;
        record.total += booked;
        total += booked;
        remaining -= booked;
        accepted.booked[i] += booked;
        emit_contribution_recorded_event(address, tier, booked);
    };

    auto const advance = [&] {
        auto const from = tier;
        tier = advance_tier(from, total);
        accepted.transitions.push_back({.from = from, .to = tier});
    };

    while (remaining > 0 && is_open(tier)) {
        auto const limit = limits[tier_index(tier)];
        TIERSALE_ASSERT(total < limit);
        auto const headroom = limit - total;

        if (tier == Tier::Three) {
            if (remaining >= headroom) {
                book(headroom);
                accepted.unbooked = remaining;
                remaining = 0;
                advance();
            }
            else {
                book(remaining);
            }
        }
        else if (remaining <= headroom) {
            book(remaining);
            if (total == limit) {
                advance();
            }
        }
        else {
            book(headroom);
            advance();
        }
    }

    TIERSALE_ASSERT(record.total == record.bucket_sum());
    TIERSALE_ASSERT(total <= limits[NUM_TIERS - 1]);
    TIERSALE_ASSERT((tier == Tier::Closed) == (total == limits[NUM_TIERS - 1]));

    if (TIERSALE_UNLIKELY(accepted.unbooked > 0)) {
        LOG_WARNING(
            "Accepted {} from {} past the final tier limit, {} left "
            "unattributed",
            amount,
            address,
            accepted.unbooked);
    }

    vars.tier.store(std::to_underlying(tier));
    vars.total_collected.store(total);
    slot.store(to_stored(record));
    if (is_new) {
        vars.participant_index.push(address);
    }

    accepted.participant = record;
    accepted.tier = tier;
    accepted.closed = tier == Tier::Closed;
    return accepted;
}

Tier TierLedger::advance_tier(Tier const from, uint256_t const &total)
{
    auto const to = next_tier(from);
    emit_tier_advanced_event(from, to, total);
    if (to == Tier::Closed) {
        LOG_INFO("Sale closed with {} collected", total);
    }
    else {
        LOG_INFO("Advanced from {} to {} at {} collected", from, to, total);
    }
    return to;
}

uint64_t TierLedger::reset()
{
    uint64_t cleared = 0;
    while (!vars.participant_index.empty()) {
        auto const address = vars.participant_index.pop();
        vars.participant(address).clear();
        ++cleared;
    }
    vars.total_collected.clear();
    vars.tier.clear();

    emit_ledger_reset_event(cleared);
    LOG_INFO("Ledger reset, {} participant records cleared", cleared);
    return cleared;
}

Result<void>
TierLedger::update_tier_limit(Tier const tier, uint256_t const &new_limit)
{
    auto const current = current_tier();
    if (TIERSALE_UNLIKELY(
            !is_open(tier) || current > tier || new_limit == 0)) {
        return SaleError::InvalidTierLimitUpdate;
    }

    auto limits = schedule();
    auto const total = total_collected();
    switch (tier) {
    case Tier::One:
        if (TIERSALE_UNLIKELY(new_limit < total)) {
            return SaleError::InvalidTierLimitUpdate;
        }
        break;
    case Tier::Two:
        // Bounded by what is attributable to tier two alone.
        if (TIERSALE_UNLIKELY(
                total > limits[0] && new_limit < total - limits[0])) {
            return SaleError::InvalidTierLimitUpdate;
        }
        break;
    case Tier::Three:
        if (TIERSALE_UNLIKELY(new_limit < total)) {
            return SaleError::InvalidTierLimitUpdate;
        }
        break;
    case Tier::Closed:
        std::unreachable();
    }

    auto const old_limit = limits[tier_index(tier)];
    limits[tier_index(tier)] = new_limit;
    if (TIERSALE_UNLIKELY(!is_strictly_increasing(limits))) {
        return SaleError::InvalidTierLimitUpdate;
    }

    store_schedule(limits);
    emit_tier_limit_updated_event(tier, old_limit, new_limit);

    // A limit lowered onto the collected total fills the active tier.
    auto active = current;
    while (is_open(active) && total >= limits[tier_index(active)]) {
        active = advance_tier(active, total);
    }
    if (active != current) {
        vars.tier.store(std::to_underlying(active));
    }
    return outcome::success();
}

Result<void> TierLedger::update_individual_cap(uint256_t const &cap)
{
    if (TIERSALE_UNLIKELY(cap == 0)) {
        return SaleError::InvalidParameter;
    }
    vars.individual_cap.store(cap);
    return outcome::success();
}

void TierLedger::store_schedule(TierSchedule const &limits)
{
    StoredSchedule stored{};
    for (size_t i = 0; i < NUM_TIERS; ++i) {
        stored.limits[i] = limits[i];
    }
    vars.schedule.store(stored);
}

////////////
// Events //
////////////

void TierLedger::emit_contribution_recorded_event(
    Address const &participant, Tier const tier, uint256_t const &amount)
{
    static constexpr auto signature = abi_encode_event_signature(
        "ContributionRecorded(address,uint8,uint256)");
    static_assert(
        signature ==
        0xfd9bbca8ec59a3f276bf951aa7cf3ef2f5ca61c0151bd4cd4a7288ed9a1ef8f1_bytes32);

    auto const event = EventBuilder(ca_, signature)
                           .add_topic(abi_encode_address(participant))
                           .add_topic(abi_encode_int(u8_be{tier_number(tier)}))
                           .add_data(abi_encode_uint(amount))
                           .build();
    state_.store_log(event);
}

void TierLedger::emit_tier_advanced_event(
    Tier const from, Tier const to, uint256_t const &total)
{
    static constexpr auto signature =
        abi_encode_event_signature("TierAdvanced(uint8,uint8,uint256)");
    static_assert(
        signature ==
        0xf0ddac522ec186d8c0d4d7e43ff3bc87abb5c1cfc362e02fc5b3fa6e50090b94_bytes32);

    auto const event = EventBuilder(ca_, signature)
                           .add_topic(abi_encode_int(u8_be{tier_number(from)}))
                           .add_topic(abi_encode_int(u8_be{tier_number(to)}))
                           .add_data(abi_encode_uint(total))
                           .build();
    state_.store_log(event);
}

void TierLedger::emit_tier_limit_updated_event(
    Tier const tier, uint256_t const &old_limit, uint256_t const &new_limit)
{
    static constexpr auto signature =
        abi_encode_event_signature("TierLimitUpdated(uint8,uint256,uint256)");
    static_assert(
        signature ==
        0x690421d855a202c5340c708e2f31ba68b651d3443235fa053a5733ced3a926aa_bytes32);

    auto const event = EventBuilder(ca_, signature)
                           .add_topic(abi_encode_int(u8_be{tier_number(tier)}))
                           .add_data(abi_encode_uint(old_limit))
                           .add_data(abi_encode_uint(new_limit))
                           .build();
    state_.store_log(event);
}

void TierLedger::emit_ledger_reset_event(uint64_t const cleared)
{
    static constexpr auto signature =
        abi_encode_event_signature("LedgerReset(uint256)");
    static_assert(
        signature ==
        0x7c2e2993b80a0ad2cbf6ea6603abcd6bf282c0d00c32749212c326475af5b773_bytes32);

    auto const event = EventBuilder(ca_, signature)
                           .add_data(abi_encode_uint(cleared))
                           .build();
    state_.store_log(event);
}

TIERSALE_NAMESPACE_END
