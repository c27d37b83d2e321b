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
#include <tiersale/core/address.hpp>
#include <tiersale/core/bytes.hpp>
#include <tiersale/core/fmt/int_fmt.hpp> // NOLINT
#include <tiersale/core/int.hpp>
#include <tiersale/sale/participant.hpp>
#include <tiersale/sale/sale_error.hpp>
#include <tiersale/sale/tier.hpp>
#include <tiersale/sale/tier_ledger.hpp>
#include <tiersale/state/log.hpp>
#include <tiersale/state/state.hpp>
#include <tiersale/test/test_util.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <algorithm>
#include <cstdint>
#include <vector>

using namespace tiersale;
using namespace tiersale::test;

namespace
{
    constexpr Address CA{0x1100};
    constexpr Address ALICE{0xa11ce};
    constexpr Address BOB{0xb0b};

    TierSchedule const SCHEDULE{30, 100, 150};
    uint256_t const CAP{200};

    using Transition = TierLedger::Transition;

    Address filler(uint64_t const i)
    {
        return Address{0x10000 + i};
    }

    // The part of a ledger's history a fresh contribution is expected to
    // reproduce after a reset.
    struct Trace
    {
        std::array<uint256_t, NUM_TIERS> booked;
        uint256_t unbooked;
        std::vector<Transition> transitions;
        std::vector<Log> logs;
    };

    Trace trace_of(
        TierLedger::AcceptOutcome const &outcome, std::vector<Log> const &logs,
        size_t const first_log)
    {
        return Trace{
            .booked = outcome.booked,
            .unbooked = outcome.unbooked,
            .transitions = outcome.transitions,
            .logs = {logs.begin() + static_cast<long>(first_log), logs.end()}};
    }
}

struct Ledger : public ::testing::Test
{
    State state;
    TierLedger ledger{state, CA};

    void SetUp() override
    {
        ASSERT_FALSE(ledger.initialize(SCHEDULE, CAP).has_error());
    }

    // Brings the ledger to `target` collected with contributions of at most
    // 50 from fresh participants.
    void fill_to(uint256_t const &target)
    {
        uint64_t i = ledger.participant_count();
        while (ledger.total_collected() < target) {
            auto const amount =
                std::min(uint256_t{50}, target - ledger.total_collected());
            ASSERT_FALSE(ledger.accept(filler(i++), amount).has_error());
        }
        ASSERT_EQ(ledger.total_collected(), target);
    }

    uint256_t sum_of_records() const
    {
        uint256_t sum{0};
        for (uint64_t i = 0; i < ledger.participant_count(); ++i) {
            auto const record = ledger.participant(ledger.participant_at(i));
            EXPECT_EQ(record.total, record.bucket_sum());
            sum += record.total;
        }
        return sum;
    }
};

TEST_F(Ledger, starts_in_tier_one)
{
    EXPECT_EQ(ledger.current_tier(), Tier::One);
    EXPECT_EQ(ledger.total_collected(), 0);
    EXPECT_EQ(ledger.schedule(), SCHEDULE);
    EXPECT_EQ(ledger.individual_cap(), CAP);
    EXPECT_EQ(ledger.participant_count(), 0);
    EXPECT_EQ(ledger.participant(ALICE), ParticipantRecord{});
}

TEST_F(Ledger, initialize_rejects_bad_schedule)
{
    State other;
    TierLedger fresh{other, CA};
    EXPECT_TRUE(has_error(
        fresh.initialize({30, 30, 150}, CAP), SaleError::InvalidParameter));
    EXPECT_TRUE(has_error(
        fresh.initialize({0, 100, 150}, CAP), SaleError::InvalidParameter));
    EXPECT_TRUE(has_error(
        fresh.initialize({30, 100, 90}, CAP), SaleError::InvalidParameter));
    EXPECT_TRUE(has_error(
        fresh.initialize(SCHEDULE, 0), SaleError::InvalidParameter));
    EXPECT_EQ(other.storage_size(CA), 0);
}

TEST_F(Ledger, within_tier)
{
    auto const res = ledger.accept(ALICE, 10);
    ASSERT_FALSE(res.has_error());
    auto const &outcome = res.value();

    EXPECT_EQ(outcome.booked[0], 10);
    EXPECT_EQ(outcome.booked[1], 0);
    EXPECT_EQ(outcome.unbooked, 0);
    EXPECT_EQ(outcome.tier, Tier::One);
    EXPECT_FALSE(outcome.closed);
    EXPECT_TRUE(outcome.transitions.empty());
    EXPECT_EQ(outcome.participant.total, 10);
    EXPECT_EQ(ledger.participant(ALICE), outcome.participant);
    EXPECT_EQ(ledger.total_collected(), 10);
}

TEST_F(Ledger, exact_headroom_advances_in_same_call)
{
    fill_to(20);
    auto const res = ledger.accept(ALICE, 10);
    ASSERT_FALSE(res.has_error());

    EXPECT_EQ(res.value().booked[0], 10);
    EXPECT_EQ(res.value().booked[1], 0);
    EXPECT_EQ(res.value().tier, Tier::Two);
    ASSERT_EQ(res.value().transitions.size(), 1);
    EXPECT_EQ(
        res.value().transitions[0], (Transition{Tier::One, Tier::Two}));
    EXPECT_EQ(ledger.current_tier(), Tier::Two);
    EXPECT_EQ(ledger.total_collected(), 30);
}

TEST_F(Ledger, straddles_tier_one_boundary)
{
    fill_to(29);
    auto const res = ledger.accept(ALICE, 5);
    ASSERT_FALSE(res.has_error());

    EXPECT_EQ(res.value().booked[0], 1);
    EXPECT_EQ(res.value().booked[1], 4);
    EXPECT_EQ(res.value().tier, Tier::Two);
    EXPECT_EQ(ledger.total_collected(), 34);

    auto const record = ledger.participant(ALICE);
    EXPECT_EQ(record.total, 5);
    EXPECT_EQ(record.per_tier[0], 1);
    EXPECT_EQ(record.per_tier[1], 4);
    EXPECT_EQ(record.per_tier[2], 0);
}

TEST_F(Ledger, spans_several_tiers)
{
    auto const res = ledger.accept(ALICE, 120);
    ASSERT_FALSE(res.has_error());

    EXPECT_EQ(res.value().booked[0], 30);
    EXPECT_EQ(res.value().booked[1], 70);
    EXPECT_EQ(res.value().booked[2], 20);
    EXPECT_EQ(res.value().tier, Tier::Three);
    EXPECT_EQ(
        res.value().transitions,
        (std::vector<Transition>{
            {Tier::One, Tier::Two}, {Tier::Two, Tier::Three}}));
    EXPECT_EQ(ledger.total_collected(), 120);
}

TEST_F(Ledger, exhausts_final_tier)
{
    fill_to(149);
    EXPECT_EQ(ledger.current_tier(), Tier::Three);

    auto const res = ledger.accept(ALICE, 1);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().booked[2], 1);
    EXPECT_EQ(res.value().unbooked, 0);
    EXPECT_TRUE(res.value().closed);
    EXPECT_EQ(ledger.current_tier(), Tier::Closed);
    EXPECT_EQ(ledger.total_collected(), 150);

    EXPECT_TRUE(has_error(ledger.accept(BOB, 1), SaleError::SaleClosed));
    EXPECT_TRUE(has_error(ledger.accept(ALICE, 5), SaleError::SaleClosed));
}

TEST_F(Ledger, overflow_past_final_tier_is_not_booked)
{
    fill_to(149);

    auto const res = ledger.accept(ALICE, 3);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().booked[2], 1);
    EXPECT_EQ(res.value().unbooked, 2);
    EXPECT_TRUE(res.value().closed);

    EXPECT_EQ(ledger.total_collected(), 150);
    EXPECT_EQ(ledger.participant(ALICE).total, 1);
    EXPECT_EQ(sum_of_records(), 150);
}

TEST_F(Ledger, zero_amount)
{
    EXPECT_TRUE(has_error(ledger.accept(ALICE, 0), SaleError::InvalidAmount));
    EXPECT_EQ(ledger.participant_count(), 0);
}

TEST_F(Ledger, individual_cap_binds_in_first_two_tiers)
{
    ASSERT_FALSE(ledger.update_individual_cap(50).has_error());
    ASSERT_FALSE(ledger.accept(ALICE, 40).has_error());

    auto const logs_before = state.logs().size();
    EXPECT_TRUE(has_error(
        ledger.accept(ALICE, 11), SaleError::IndividualCapExceeded));
    EXPECT_EQ(state.logs().size(), logs_before);
    EXPECT_EQ(ledger.participant(ALICE).total, 40);
    EXPECT_EQ(ledger.total_collected(), 40);

    EXPECT_FALSE(ledger.accept(ALICE, 10).has_error());
    EXPECT_EQ(ledger.participant(ALICE).total, 50);
}

TEST_F(Ledger, individual_cap_does_not_bind_in_tier_three)
{
    ASSERT_FALSE(ledger.update_individual_cap(50).has_error());
    fill_to(100);
    ASSERT_EQ(ledger.current_tier(), Tier::Three);

    auto const res = ledger.accept(ALICE, 49);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(ledger.participant(ALICE).total, 49);

    EXPECT_FALSE(ledger.accept(ALICE, 1).has_error());
    EXPECT_EQ(ledger.participant(ALICE).total, 50);
}

TEST_F(Ledger, cap_update_must_be_positive)
{
    EXPECT_TRUE(has_error(
        ledger.update_individual_cap(0), SaleError::InvalidParameter));
    EXPECT_EQ(ledger.individual_cap(), CAP);
}

TEST_F(Ledger, participant_indexed_once)
{
    ASSERT_FALSE(ledger.accept(ALICE, 1).has_error());
    ASSERT_FALSE(ledger.accept(BOB, 1).has_error());
    ASSERT_FALSE(ledger.accept(ALICE, 1).has_error());

    ASSERT_EQ(ledger.participant_count(), 2);
    EXPECT_EQ(ledger.participant_at(0), ALICE);
    EXPECT_EQ(ledger.participant_at(1), BOB);
}

TEST_F(Ledger, totals_are_consistent)
{
    // deterministic pseudo random sequence of contributions
    uint64_t seed = 12345;
    uint256_t accepted{0};
    while (ledger.current_tier() != Tier::Closed) {
        seed = seed * 6364136223846793005ULL + 1442695040888963407ULL;
        auto const who = filler((seed >> 33) % 7);
        uint256_t const amount{(seed >> 40) % 9 + 1};

        auto const res = ledger.accept(who, amount);
        if (res.has_error()) {
            EXPECT_TRUE(has_error(res, SaleError::IndividualCapExceeded));
            continue;
        }
        accepted += amount;
        EXPECT_EQ(ledger.total_collected(), std::min(accepted, SCHEDULE[2]));
        EXPECT_EQ(ledger.total_collected(), sum_of_records());
    }
    EXPECT_EQ(ledger.total_collected(), SCHEDULE[2]);
}

TEST_F(Ledger, pagination)
{
    for (uint64_t i = 0; i < 15; ++i) {
        ASSERT_FALSE(ledger.accept(filler(i), 1).has_error());
    }

    auto const first = ledger.participants_page(1, 10);
    ASSERT_FALSE(first.has_error());
    EXPECT_EQ(first.value().size(), 10);
    EXPECT_EQ(first.value().front().address, filler(0));

    auto const second = ledger.participants_page(2, 10);
    ASSERT_FALSE(second.has_error());
    ASSERT_EQ(second.value().size(), 5);
    for (uint64_t i = 0; i < 5; ++i) {
        EXPECT_EQ(second.value()[i].address, filler(10 + i));
        EXPECT_EQ(second.value()[i].record.total, 1);
    }

    EXPECT_TRUE(has_error(
        ledger.participants_page(3, 10), SaleError::PaginationOutOfRange));
    EXPECT_TRUE(has_error(
        ledger.participants_page(0, 10), SaleError::InvalidInput));
    EXPECT_TRUE(
        has_error(ledger.participants_page(1, 0), SaleError::InvalidInput));
}

TEST_F(Ledger, empty_index_has_no_pages)
{
    EXPECT_TRUE(has_error(
        ledger.participants_page(1, 10), SaleError::PaginationOutOfRange));
}

TEST_F(Ledger, reset_reproduces_first_trace)
{
    State untouched;
    TierLedger reference{untouched, CA};
    ASSERT_FALSE(reference.initialize(SCHEDULE, CAP).has_error());
    auto const expected_res = reference.accept(ALICE, 120);
    ASSERT_FALSE(expected_res.has_error());
    auto const expected = trace_of(expected_res.value(), untouched.logs(), 0);

    fill_to(149);
    ASSERT_FALSE(ledger.accept(BOB, 3).has_error());
    ASSERT_EQ(ledger.current_tier(), Tier::Closed);

    auto const count = ledger.participant_count();
    EXPECT_EQ(ledger.reset(), count);
    EXPECT_EQ(ledger.current_tier(), Tier::One);
    EXPECT_EQ(ledger.total_collected(), 0);
    EXPECT_EQ(ledger.participant_count(), 0);
    EXPECT_EQ(ledger.participant(BOB), ParticipantRecord{});
    EXPECT_EQ(ledger.schedule(), SCHEDULE);

    auto const first_log = state.logs().size();
    auto const res = ledger.accept(ALICE, 120);
    ASSERT_FALSE(res.has_error());
    auto const actual = trace_of(res.value(), state.logs(), first_log);

    EXPECT_EQ(actual.booked, expected.booked);
    EXPECT_EQ(actual.unbooked, expected.unbooked);
    EXPECT_EQ(actual.transitions, expected.transitions);
    EXPECT_EQ(actual.logs, expected.logs);
    EXPECT_EQ(ledger.participant(ALICE), reference.participant(ALICE));
}

TEST_F(Ledger, reset_leaves_only_settings_in_storage)
{
    auto const settings_slots = state.storage_size(CA);
    fill_to(120);
    EXPECT_GT(state.storage_size(CA), settings_slots);

    ledger.reset();
    EXPECT_EQ(state.storage_size(CA), settings_slots);
}

TEST_F(Ledger, update_tier_one_limit)
{
    fill_to(20);
    EXPECT_TRUE(has_error(
        ledger.update_tier_limit(Tier::One, 19),
        SaleError::InvalidTierLimitUpdate));

    ASSERT_FALSE(ledger.update_tier_limit(Tier::One, 25).has_error());
    EXPECT_EQ(ledger.tier_limit(Tier::One), 25);
    EXPECT_EQ(ledger.current_tier(), Tier::One);

    fill_to(40);
    EXPECT_EQ(ledger.current_tier(), Tier::Two);
    EXPECT_TRUE(has_error(
        ledger.update_tier_limit(Tier::One, 60),
        SaleError::InvalidTierLimitUpdate));
}

TEST_F(Ledger, update_onto_collected_total_advances)
{
    fill_to(20);
    auto const first_log = state.logs().size();
    ASSERT_FALSE(ledger.update_tier_limit(Tier::One, 20).has_error());
    EXPECT_EQ(ledger.current_tier(), Tier::Two);
    // TierLimitUpdated then TierAdvanced
    ASSERT_EQ(state.logs().size(), first_log + 2);
    EXPECT_EQ(
        state.logs()[first_log + 1].topics[0],
        abi_encode_event_signature("TierAdvanced(uint8,uint8,uint256)"));
}

TEST_F(Ledger, update_rejects_invalid_values)
{
    EXPECT_TRUE(has_error(
        ledger.update_tier_limit(Tier::Two, 0),
        SaleError::InvalidTierLimitUpdate));
    EXPECT_TRUE(has_error(
        ledger.update_tier_limit(Tier::Closed, 200),
        SaleError::InvalidTierLimitUpdate));
    // schedule must stay strictly increasing
    EXPECT_TRUE(has_error(
        ledger.update_tier_limit(Tier::One, 100),
        SaleError::InvalidTierLimitUpdate));
    EXPECT_TRUE(has_error(
        ledger.update_tier_limit(Tier::Two, 150),
        SaleError::InvalidTierLimitUpdate));
    EXPECT_TRUE(has_error(
        ledger.update_tier_limit(Tier::Three, 100),
        SaleError::InvalidTierLimitUpdate));
    EXPECT_EQ(ledger.schedule(), SCHEDULE);
}

TEST_F(Ledger, update_tier_two_is_bounded_by_its_own_share)
{
    fill_to(50);
    ASSERT_EQ(ledger.current_tier(), Tier::Two);

    // 20 of the 50 collected are attributable to tier two
    EXPECT_TRUE(has_error(
        ledger.update_tier_limit(Tier::Two, 19),
        SaleError::InvalidTierLimitUpdate));

    ASSERT_FALSE(ledger.update_tier_limit(Tier::Two, 60).has_error());
    EXPECT_EQ(ledger.current_tier(), Tier::Two);

    // Passes the share bound but lies below the collected total, which
    // fills tier two.
    ASSERT_FALSE(ledger.update_tier_limit(Tier::Two, 45).has_error());
    EXPECT_EQ(ledger.current_tier(), Tier::Three);
    EXPECT_EQ(ledger.tier_limit(Tier::Two), 45);

    EXPECT_TRUE(has_error(
        ledger.update_tier_limit(Tier::Two, 70),
        SaleError::InvalidTierLimitUpdate));
}

TEST_F(Ledger, update_tier_three)
{
    fill_to(120);
    EXPECT_TRUE(has_error(
        ledger.update_tier_limit(Tier::Three, 119),
        SaleError::InvalidTierLimitUpdate));

    ASSERT_FALSE(ledger.update_tier_limit(Tier::Three, 200).has_error());
    EXPECT_EQ(ledger.tier_limit(Tier::Three), 200);
    fill_to(199);
    EXPECT_EQ(ledger.current_tier(), Tier::Three);

    ASSERT_FALSE(ledger.update_tier_limit(Tier::Three, 199).has_error());
    EXPECT_EQ(ledger.current_tier(), Tier::Closed);
    EXPECT_TRUE(has_error(
        ledger.update_tier_limit(Tier::Three, 300),
        SaleError::InvalidTierLimitUpdate));
}

TEST_F(Ledger, events)
{
    fill_to(29);
    auto const first_log = state.logs().size();
    ASSERT_FALSE(ledger.accept(ALICE, 5).has_error());

    auto const &logs = state.logs();
    ASSERT_EQ(logs.size(), first_log + 3);

    auto const recorded = abi_encode_event_signature(
        "ContributionRecorded(address,uint8,uint256)");
    auto const advanced =
        abi_encode_event_signature("TierAdvanced(uint8,uint8,uint256)");

    auto const &tier_one = logs[first_log];
    EXPECT_EQ(tier_one.address, CA);
    ASSERT_EQ(tier_one.topics.size(), 3);
    EXPECT_EQ(tier_one.topics[0], recorded);
    EXPECT_EQ(tier_one.topics[1], abi_encode_address(ALICE));
    EXPECT_EQ(tier_one.topics[2], bytes32_t{1});
    EXPECT_EQ(tier_one.data, to_byte_string(abi_encode_uint(1)));

    auto const &advance = logs[first_log + 1];
    ASSERT_EQ(advance.topics.size(), 3);
    EXPECT_EQ(advance.topics[0], advanced);
    EXPECT_EQ(advance.topics[1], bytes32_t{1});
    EXPECT_EQ(advance.topics[2], bytes32_t{2});
    EXPECT_EQ(advance.data, to_byte_string(abi_encode_uint(30)));

    auto const &tier_two = logs[first_log + 2];
    EXPECT_EQ(tier_two.topics[0], recorded);
    EXPECT_EQ(tier_two.topics[2], bytes32_t{2});
    EXPECT_EQ(tier_two.data, to_byte_string(abi_encode_uint(4)));
}
