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
#include <tiersale/contract/storage_variable.hpp>
#include <tiersale/core/address.hpp>
#include <tiersale/core/bytes.hpp>
#include <tiersale/core/config.hpp>
#include <tiersale/core/likely.h>
#include <tiersale/core/result.hpp>
#include <tiersale/sale/sale_error.hpp>

#include <boost/outcome/success_failure.hpp>

#include <cstdint>
#include <limits>
#include <optional>

TIERSALE_NAMESPACE_BEGIN

class State;

// A storage backed value that changes in two steps: a proposal records the
// new value together with the time it may take effect, and a later apply
// activates it. At most one proposal is pending; a new one replaces it.
template <typename T>
class TimelockedParameter
{
public:
    struct Slots
    {
        BigEndian<T> active;
        BigEndian<T> pending;
        u64_be effective_at;
    };

    static_assert(alignof(Slots) == 1);

    struct Pending
    {
        T value;
        uint64_t effective_at;
    };

    struct Applied
    {
        T old_value;
        T new_value;
    };

private:
    StorageVariable<Slots> slots_;
    T ceiling_;

public:
    TimelockedParameter(
        State &state, Address const &ca, bytes32_t const &key,
        T const &ceiling)
        : slots_{state, ca, key}
        , ceiling_{ceiling}
    {
    }

    T active() const
    {
        return slots_.load().active.native();
    }

    // A zero pending value means idle.
    std::optional<Pending> pending() const
    {
        auto const slots = slots_.load();
        if (slots.pending.is_zero()) {
            return std::nullopt;
        }
        return Pending{
            .value = slots.pending.native(),
            .effective_at = slots.effective_at.native()};
    }

    // Sets the active value directly and drops any proposal.
    void initialize(T const &value)
    {
        Slots slots{};
        slots.active = value;
        slots_.store(slots);
    }

    Result<Pending>
    propose(T const &value, uint64_t const delay, uint64_t const now)
    {
        auto slots = slots_.load();
        if (TIERSALE_UNLIKELY(
                value == 0 || value == slots.active.native() ||
                value > ceiling_)) {
            return SaleError::InvalidParameter;
        }
        uint64_t const effective_at =
            delay > std::numeric_limits<uint64_t>::max() - now
                ? std::numeric_limits<uint64_t>::max()
                : now + delay;

        slots.pending = value;
        slots.effective_at = effective_at;
        slots_.store(slots);
        return Pending{.value = value, .effective_at = effective_at};
    }

    Result<Applied> apply(uint64_t const now)
    {
        auto slots = slots_.load();
        if (TIERSALE_UNLIKELY(slots.pending.is_zero())) {
            return SaleError::NoMutationPending;
        }
        if (TIERSALE_UNLIKELY(now < slots.effective_at.native())) {
            return SaleError::TimelockNotElapsed;
        }

        Applied const applied{
            .old_value = slots.active.native(),
            .new_value = slots.pending.native()};
        slots.active = applied.new_value;
        slots.pending = T{0};
        slots.effective_at = uint64_t{0};
        slots_.store(slots);
        return applied;
    }

    Result<Pending> cancel()
    {
        auto slots = slots_.load();
        if (TIERSALE_UNLIKELY(slots.pending.is_zero())) {
            return SaleError::NoMutationPending;
        }

        Pending const cancelled{
            .value = slots.pending.native(),
            .effective_at = slots.effective_at.native()};
        slots.pending = T{0};
        slots.effective_at = uint64_t{0};
        slots_.store(slots);
        return cancelled;
    }
};

TIERSALE_NAMESPACE_END
