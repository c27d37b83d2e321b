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
#include <tiersale/state/log.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <mutex>
#include <variant>
#include <vector>

TIERSALE_NAMESPACE_BEGIN

// Account keyed storage, balances and logs with nested checkpoints. Every
// write made after push() is undone by the matching pop_reject(), and folded
// into the enclosing checkpoint by pop_accept().
class State
{
    template <class Key, class T>
    using Map = ankerl::unordered_dense::segmented_map<Key, T>;

    struct AccountState
    {
        uint256_t balance{0};
        Map<bytes32_t, bytes32_t> storage{};
    };

    struct StorageUndo
    {
        Address address;
        bytes32_t key;
        bytes32_t value;
    };

    struct BalanceUndo
    {
        Address address;
        uint256_t balance;
    };

    using Undo = std::variant<StorageUndo, BalanceUndo>;

    struct Checkpoint
    {
        std::vector<Undo> journal{};
        size_t num_logs{0};
    };

    Map<Address, AccountState> accounts_{};
    std::vector<Log> logs_{};
    std::vector<Checkpoint> checkpoints_{};
    mutable std::recursive_mutex mutex_{};

    void record(Undo);

public:
    State() = default;
    State(State const &) = delete;
    State &operator=(State const &) = delete;

    ////////////
    // Reads  //
    ////////////
    bytes32_t get_storage(Address const &, bytes32_t const &key) const;
    bytes32_t get_balance(Address const &) const;
    size_t storage_size(Address const &) const;

    std::vector<Log> const &logs() const noexcept
    {
        return logs_;
    }

    ////////////
    // Writes //
    ////////////
    void set_storage(
        Address const &, bytes32_t const &key, bytes32_t const &value);
    void add_to_balance(Address const &, uint256_t const &);
    void subtract_from_balance(Address const &, uint256_t const &);
    void store_log(Log const &);

    /////////////////
    // Checkpoints //
    /////////////////
    void push();
    void pop_accept();
    void pop_reject();

    size_t depth() const noexcept
    {
        return checkpoints_.size();
    }

    // Held by every contract call made against this state. Recursive so that
    // a call made from inside another one on the same thread proceeds.
    std::recursive_mutex &mutex() const noexcept
    {
        return mutex_;
    }
};

TIERSALE_NAMESPACE_END
