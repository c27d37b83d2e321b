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
#include <tiersale/core/assert.h>
#include <tiersale/core/bytes.hpp>
#include <tiersale/core/int.hpp>
#include <tiersale/core/likely.h>
#include <tiersale/state/log.hpp>
#include <tiersale/state/state.hpp>

#include <intx/intx.hpp>

#include <iterator>
#include <utility>
#include <variant>

TIERSALE_NAMESPACE_BEGIN

void State::record(Undo undo)
{
    if (TIERSALE_LIKELY(!checkpoints_.empty())) {
        checkpoints_.back().journal.emplace_back(std::move(undo));
    }
}

bytes32_t
State::get_storage(Address const &address, bytes32_t const &key) const
{
    auto const account = accounts_.find(address);
    if (account == accounts_.end()) {
        return {};
    }
    auto const it = account->second.storage.find(key);
    if (it == account->second.storage.end()) {
        return {};
    }
    return it->second;
}

bytes32_t State::get_balance(Address const &address) const
{
    auto const account = accounts_.find(address);
    if (account == accounts_.end()) {
        return {};
    }
    return intx::be::store<bytes32_t>(account->second.balance);
}

size_t State::storage_size(Address const &address) const
{
    auto const account = accounts_.find(address);
    if (account == accounts_.end()) {
        return 0;
    }
    return account->second.storage.size();
}

void State::set_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    auto &storage = accounts_[address].storage;
    auto const it = storage.find(key);
    bytes32_t const original = it == storage.end() ? bytes32_t{} : it->second;
    if (original == value) {
        return;
    }
    record(StorageUndo{.address = address, .key = key, .value = original});
    if (value == bytes32_t{}) {
        storage.erase(it);
    }
    else if (it == storage.end()) {
        storage.emplace(key, value);
    }
    else {
        it->second = value;
    }
}

void State::add_to_balance(Address const &address, uint256_t const &delta)
{
    auto &account = accounts_[address];
    auto const sum = intx::addc(account.balance, delta);
    TIERSALE_ASSERT(!sum.carry);
    record(BalanceUndo{.address = address, .balance = account.balance});
    account.balance = sum.value;
}

void State::subtract_from_balance(
    Address const &address, uint256_t const &delta)
{
    auto &account = accounts_[address];
    TIERSALE_ASSERT(account.balance >= delta);
    record(BalanceUndo{.address = address, .balance = account.balance});
    account.balance -= delta;
}

void State::store_log(Log const &log)
{
    logs_.push_back(log);
}

void State::push()
{
    checkpoints_.push_back(Checkpoint{.journal = {}, .num_logs = logs_.size()});
}

void State::pop_accept()
{
    TIERSALE_ASSERT(!checkpoints_.empty());
    auto journal = std::move(checkpoints_.back().journal);
    checkpoints_.pop_back();
    if (!checkpoints_.empty()) {
        auto &parent = checkpoints_.back().journal;
        parent.insert(
            parent.end(),
            std::make_move_iterator(journal.begin()),
            std::make_move_iterator(journal.end()));
    }
}

void State::pop_reject()
{
    TIERSALE_ASSERT(!checkpoints_.empty());
    auto &checkpoint = checkpoints_.back();
    for (auto it = checkpoint.journal.rbegin(); it != checkpoint.journal.rend();
         ++it) {
        if (auto const *const undo = std::get_if<StorageUndo>(&*it)) {
            auto &storage = accounts_[undo->address].storage;
            if (undo->value == bytes32_t{}) {
                storage.erase(undo->key);
            }
            else {
                storage[undo->key] = undo->value;
            }
        }
        else {
            auto const &balance = std::get<BalanceUndo>(*it);
            accounts_[balance.address].balance = balance.balance;
        }
    }
    logs_.resize(checkpoint.num_logs);
    checkpoints_.pop_back();
}

TIERSALE_NAMESPACE_END
