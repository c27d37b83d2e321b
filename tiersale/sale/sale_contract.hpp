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
#include <tiersale/core/byte_string.hpp>
#include <tiersale/core/bytes.hpp>
#include <tiersale/core/config.hpp>
#include <tiersale/core/int.hpp>
#include <tiersale/core/result.hpp>
#include <tiersale/sale/sale_config.hpp>
#include <tiersale/sale/tier_ledger.hpp>
#include <tiersale/sale/timelocked_parameter.hpp>

#include <evmc/evmc.h>

#include <cstdint>

TIERSALE_NAMESPACE_BEGIN

class Custodian;
class State;

class SaleContract
{
    State &state_;
    Address const &ca_;
    uint64_t timestamp_;
    Custodian *custodian_;

public:
    // Forwards deposits to the custodian address held in storage.
    SaleContract(State &, Address const &ca, uint64_t timestamp);
    SaleContract(
        State &, Address const &ca, uint64_t timestamp, Custodian &);

    class Variables
    {
        State &state_;
        Address const &ca_;

        // Ledger variables live at 0x01 to 0x06 and under prefixes 0x01 and
        // 0x02. Settings start at 0x10.
        static constexpr auto AddressOwner{
            0x0000000000000000000000000000000000000000000000000000000000000010_bytes32};
        static constexpr auto AddressCustodian{
            0x0000000000000000000000000000000000000000000000000000000000000011_bytes32};
        static constexpr auto AddressPaused{
            0x0000000000000000000000000000000000000000000000000000000000000012_bytes32};
        static constexpr auto AddressLocked{
            0x0000000000000000000000000000000000000000000000000000000000000013_bytes32};
        static constexpr auto AddressMaxPageSize{
            0x0000000000000000000000000000000000000000000000000000000000000014_bytes32};
        static constexpr auto AddressIncrementCeiling{
            0x0000000000000000000000000000000000000000000000000000000000000015_bytes32};
        static constexpr auto AddressIncrementDelay{
            0x0000000000000000000000000000000000000000000000000000000000000016_bytes32};
        // spans three slots
        static constexpr auto AddressIncrement{
            0x0000000000000000000000000000000000000000000000000000000000000020_bytes32};

    public:
        explicit Variables(State &state, Address const &ca)
            : state_{state}
            , ca_{ca}
        {
        }

        StorageVariable<Address> owner{state_, ca_, AddressOwner};
        StorageVariable<Address> custodian{state_, ca_, AddressCustodian};
        StorageVariable<bool> paused{state_, ca_, AddressPaused};
        StorageVariable<bool> locked{state_, ca_, AddressLocked};
        StorageVariable<u64_be> max_page_size{state_, ca_, AddressMaxPageSize};
        StorageVariable<u256_be> increment_ceiling{
            state_, ca_, AddressIncrementCeiling};
        StorageVariable<u64_be> increment_delay{
            state_, ca_, AddressIncrementDelay};

        TimelockedParameter<uint256_t> increment() const
        {
            return TimelockedParameter<uint256_t>{
                state_,
                ca_,
                AddressIncrement,
                increment_ceiling.load().native()};
        }
    } vars;

    // Direct access to vars and ledger is not serialized. Hold
    // State::mutex() while reading them if other threads make calls.
    TierLedger ledger;

    // Storage of a sale is initialized once, before its first call.
    Result<void> initialize(SaleConfig const &);
    bool is_initialized() const;

    // Runs one call inside a state checkpoint. The checkpoint is rejected
    // when the call fails, so no write of a failed call survives.
    Result<byte_string> call(
        byte_string_view input, evmc_address const &sender,
        evmc_bytes32 const &msg_value);

private:
    Result<void> require_owner(Address const &sender) const;

    /////////////
    // Events  //
    /////////////

    // event IncrementChangeProposed(uint256 newValue, uint256 effectiveAt)
    void emit_increment_change_proposed_event(
        uint256_t const &value, uint64_t effective_at);

    // event IncrementChangeApplied(uint256 oldValue, uint256 newValue)
    void emit_increment_change_applied_event(
        uint256_t const &old_value, uint256_t const &new_value);

    // event IncrementChangeCancelled(uint256 value)
    void emit_increment_change_cancelled_event(uint256_t const &value);

    // event IndividualCapUpdated(uint256 oldCap, uint256 newCap)
    void emit_individual_cap_updated_event(
        uint256_t const &old_cap, uint256_t const &new_cap);

    // event MaxPageSizeUpdated(uint256 oldSize, uint256 newSize)
    void emit_max_page_size_updated_event(uint64_t old_size, uint64_t new_size);

    // event Paused(address indexed by)
    void emit_paused_event(Address const &);

    // event Unpaused(address indexed by)
    void emit_unpaused_event(Address const &);

    // event FundsForwarded(address indexed custodian, uint256 amount)
    void emit_funds_forwarded_event(
        Address const &custodian, uint256_t const &amount);

public:
    using PrecompileFunc = Result<byte_string> (SaleContract::*)(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);

    /////////////////
    // Precompiles //
    /////////////////
    static PrecompileFunc precompile_dispatch(byte_string_view &);

    Result<byte_string> precompile_deposit(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
    Result<byte_string> precompile_get_current_tier(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
    Result<byte_string> precompile_get_total_collected(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
    Result<byte_string> precompile_get_tier_limits(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
    Result<byte_string> precompile_get_individual_cap(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
    Result<byte_string> precompile_get_participant(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
    Result<byte_string> precompile_get_participant_count(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
    Result<byte_string> precompile_get_participants(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
    Result<byte_string> precompile_get_increment(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
    Result<byte_string> precompile_get_pending_increment(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
    Result<byte_string> precompile_is_paused(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
    Result<byte_string> precompile_owner(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
    Result<byte_string> precompile_reset_ledger(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
    Result<byte_string> precompile_update_tier_limit(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
    Result<byte_string> precompile_update_individual_cap(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
    Result<byte_string> precompile_update_max_page_size(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
    Result<byte_string> precompile_propose_increment(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
    Result<byte_string> precompile_apply_increment(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
    Result<byte_string> precompile_cancel_increment(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
    Result<byte_string> precompile_pause(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
    Result<byte_string> precompile_unpause(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
    Result<byte_string> precompile_fallback(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
};

TIERSALE_NAMESPACE_END
