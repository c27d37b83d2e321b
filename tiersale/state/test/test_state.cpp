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

#include <tiersale/core/address.hpp>
#include <tiersale/core/bytes.hpp>
#include <tiersale/core/int.hpp>
#include <tiersale/state/log.hpp>
#include <tiersale/state/state.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace tiersale;

namespace
{
    constexpr Address ADDR_A{0xa};
    constexpr Address ADDR_B{0xb};

    constexpr bytes32_t KEY1{1};
    constexpr bytes32_t KEY2{2};
    constexpr bytes32_t VALUE1{0x1111};
    constexpr bytes32_t VALUE2{0x2222};

    uint256_t balance_of(State const &state, Address const &address)
    {
        return intx::be::load<uint256_t>(state.get_balance(address));
    }

    Log make_log(uint64_t const n)
    {
        return Log{.address = ADDR_A, .topics = {bytes32_t{n}}, .data = {}};
    }
}

TEST(State, absent_slots_read_zero)
{
    State state;
    EXPECT_EQ(state.get_storage(ADDR_A, KEY1), bytes32_t{});
    EXPECT_EQ(state.get_balance(ADDR_A), bytes32_t{});
    EXPECT_EQ(state.storage_size(ADDR_A), 0);
}

TEST(State, zero_write_erases_slot)
{
    State state;
    state.set_storage(ADDR_A, KEY1, VALUE1);
    state.set_storage(ADDR_A, KEY2, VALUE2);
    EXPECT_EQ(state.storage_size(ADDR_A), 2);

    state.set_storage(ADDR_A, KEY1, bytes32_t{});
    EXPECT_EQ(state.storage_size(ADDR_A), 1);
    EXPECT_EQ(state.get_storage(ADDR_A, KEY1), bytes32_t{});
    EXPECT_EQ(state.get_storage(ADDR_A, KEY2), VALUE2);
}

TEST(State, reject_restores_storage_balance_and_logs)
{
    State state;
    state.set_storage(ADDR_A, KEY1, VALUE1);
    state.add_to_balance(ADDR_A, 100);
    state.store_log(make_log(1));

    state.push();
    state.set_storage(ADDR_A, KEY1, VALUE2);
    state.set_storage(ADDR_A, KEY2, VALUE2);
    state.subtract_from_balance(ADDR_A, 40);
    state.add_to_balance(ADDR_B, 40);
    state.store_log(make_log(2));
    EXPECT_EQ(state.depth(), 1);
    state.pop_reject();

    EXPECT_EQ(state.depth(), 0);
    EXPECT_EQ(state.get_storage(ADDR_A, KEY1), VALUE1);
    EXPECT_EQ(state.get_storage(ADDR_A, KEY2), bytes32_t{});
    EXPECT_EQ(state.storage_size(ADDR_A), 1);
    EXPECT_EQ(balance_of(state, ADDR_A), 100);
    EXPECT_EQ(balance_of(state, ADDR_B), 0);
    ASSERT_EQ(state.logs().size(), 1);
    EXPECT_EQ(state.logs()[0], make_log(1));
}

TEST(State, accept_keeps_writes)
{
    State state;
    state.push();
    state.set_storage(ADDR_A, KEY1, VALUE1);
    state.add_to_balance(ADDR_A, 7);
    state.store_log(make_log(1));
    state.pop_accept();

    EXPECT_EQ(state.get_storage(ADDR_A, KEY1), VALUE1);
    EXPECT_EQ(balance_of(state, ADDR_A), 7);
    EXPECT_EQ(state.logs().size(), 1);
}

TEST(State, accepted_inner_is_undone_by_outer_reject)
{
    State state;
    state.set_storage(ADDR_A, KEY1, VALUE1);

    state.push();
    state.set_storage(ADDR_A, KEY1, VALUE2);
    state.push();
    state.set_storage(ADDR_A, KEY2, VALUE1);
    state.add_to_balance(ADDR_B, 5);
    state.store_log(make_log(1));
    state.pop_accept();
    EXPECT_EQ(state.get_storage(ADDR_A, KEY2), VALUE1);
    state.pop_reject();

    EXPECT_EQ(state.get_storage(ADDR_A, KEY1), VALUE1);
    EXPECT_EQ(state.get_storage(ADDR_A, KEY2), bytes32_t{});
    EXPECT_EQ(balance_of(state, ADDR_B), 0);
    EXPECT_TRUE(state.logs().empty());
}

TEST(State, rejected_inner_leaves_outer_writes)
{
    State state;
    state.push();
    state.set_storage(ADDR_A, KEY1, VALUE1);
    state.push();
    state.set_storage(ADDR_A, KEY1, VALUE2);
    state.pop_reject();
    EXPECT_EQ(state.get_storage(ADDR_A, KEY1), VALUE1);
    state.pop_accept();

    EXPECT_EQ(state.get_storage(ADDR_A, KEY1), VALUE1);
}
