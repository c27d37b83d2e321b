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

#include <tiersale/contract/abi_decode.hpp>
#include <tiersale/contract/abi_encode.hpp>
#include <tiersale/contract/abi_signatures.hpp>
#include <tiersale/contract/big_endian.hpp>
#include <tiersale/contract/events.hpp>
#include <tiersale/contract/storage_variable.hpp>
#include <tiersale/core/address.hpp>
#include <tiersale/core/assert.h>
#include <tiersale/core/byte_string.hpp>
#include <tiersale/core/fmt/address_fmt.hpp>
#include <tiersale/core/fmt/int_fmt.hpp>
#include <tiersale/core/int.hpp>
#include <tiersale/core/likely.h>
#include <tiersale/core/result.hpp>
#include <tiersale/sale/custodian.hpp>
#include <tiersale/sale/participant.hpp>
#include <tiersale/sale/sale_config.hpp>
#include <tiersale/sale/sale_contract.hpp>
#include <tiersale/sale/sale_error.hpp>
#include <tiersale/sale/tier.hpp>
#include <tiersale/sale/tier_ledger.hpp>
#include <tiersale/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>
#include <evmc/evmc.h>
#include <intx/intx.hpp>
#include <quill/Quill.h>

#include <cstdint>
#include <limits>
#include <mutex>
#include <utility>
#include <vector>

TIERSALE_ANONYMOUS_NAMESPACE_BEGIN

////////////////////////
// Function Selectors //
////////////////////////

struct PrecompileSelector
{
    static constexpr uint32_t DEPOSIT = abi_encode_selector("deposit()");
    static constexpr uint32_t GET_CURRENT_TIER =
        abi_encode_selector("getCurrentTier()");
    static constexpr uint32_t GET_TOTAL_COLLECTED =
        abi_encode_selector("getTotalCollected()");
    static constexpr uint32_t GET_TIER_LIMITS =
        abi_encode_selector("getTierLimits()");
    static constexpr uint32_t GET_INDIVIDUAL_CAP =
        abi_encode_selector("getIndividualCap()");
    static constexpr uint32_t GET_PARTICIPANT =
        abi_encode_selector("getParticipant(address)");
    static constexpr uint32_t GET_PARTICIPANT_COUNT =
        abi_encode_selector("getParticipantCount()");
    static constexpr uint32_t GET_PARTICIPANTS =
        abi_encode_selector("getParticipants(uint256,uint256)");
    static constexpr uint32_t GET_INCREMENT =
        abi_encode_selector("getIncrement()");
    static constexpr uint32_t GET_PENDING_INCREMENT =
        abi_encode_selector("getPendingIncrement()");
    static constexpr uint32_t IS_PAUSED = abi_encode_selector("isPaused()");
    static constexpr uint32_t OWNER = abi_encode_selector("owner()");
    static constexpr uint32_t RESET_LEDGER =
        abi_encode_selector("resetLedger()");
    static constexpr uint32_t UPDATE_TIER_LIMIT =
        abi_encode_selector("updateTierLimit(uint8,uint256)");
    static constexpr uint32_t UPDATE_INDIVIDUAL_CAP =
        abi_encode_selector("updateIndividualCap(uint256)");
    static constexpr uint32_t UPDATE_MAX_PAGE_SIZE =
        abi_encode_selector("updateMaxPageSize(uint256)");
    static constexpr uint32_t PROPOSE_INCREMENT =
        abi_encode_selector("proposeIncrement(uint256)");
    static constexpr uint32_t APPLY_INCREMENT =
        abi_encode_selector("applyIncrement()");
    static constexpr uint32_t CANCEL_INCREMENT =
        abi_encode_selector("cancelIncrement()");
    static constexpr uint32_t PAUSE = abi_encode_selector("pause()");
    static constexpr uint32_t UNPAUSE = abi_encode_selector("unpause()");
};

static_assert(PrecompileSelector::DEPOSIT == 0xd0e30db0);
static_assert(PrecompileSelector::GET_CURRENT_TIER == 0x7412c223);
static_assert(PrecompileSelector::GET_TOTAL_COLLECTED == 0xfbe5d87e);
static_assert(PrecompileSelector::GET_TIER_LIMITS == 0xcc2999a4);
static_assert(PrecompileSelector::GET_INDIVIDUAL_CAP == 0xd606fa76);
static_assert(PrecompileSelector::GET_PARTICIPANT == 0x7143059f);
static_assert(PrecompileSelector::GET_PARTICIPANT_COUNT == 0xad605729);
static_assert(PrecompileSelector::GET_PARTICIPANTS == 0xded0ed16);
static_assert(PrecompileSelector::GET_INCREMENT == 0x6ac4691f);
static_assert(PrecompileSelector::GET_PENDING_INCREMENT == 0x665baa6a);
static_assert(PrecompileSelector::IS_PAUSED == 0xb187bd26);
static_assert(PrecompileSelector::OWNER == 0x8da5cb5b);
static_assert(PrecompileSelector::RESET_LEDGER == 0x5d3a8154);
static_assert(PrecompileSelector::UPDATE_TIER_LIMIT == 0xe76d18ff);
static_assert(PrecompileSelector::UPDATE_INDIVIDUAL_CAP == 0x14fd24f0);
static_assert(PrecompileSelector::UPDATE_MAX_PAGE_SIZE == 0x20312807);
static_assert(PrecompileSelector::PROPOSE_INCREMENT == 0xf0e61f4b);
static_assert(PrecompileSelector::APPLY_INCREMENT == 0xab4f45cb);
static_assert(PrecompileSelector::CANCEL_INCREMENT == 0x5ec52c29);
static_assert(PrecompileSelector::PAUSE == 0x8456cb59);
static_assert(PrecompileSelector::UNPAUSE == 0x3f4ba83a);

Result<void> function_not_payable(u256_be const &value)
{
    if (TIERSALE_UNLIKELY(!value.is_zero())) {
        return SaleError::ValueNonZero;
    }

    return outcome::success();
}

Result<void> no_more_input(byte_string_view const input)
{
    if (TIERSALE_UNLIKELY(!input.empty())) {
        return SaleError::InvalidInput;
    }

    return outcome::success();
}

// Any malformed argument is reported as invalid input.
template <typename T>
Result<T> decode_arg(byte_string_view &input)
{
    auto result = abi_decode_fixed<T>(input);
    if (TIERSALE_UNLIKELY(result.has_error())) {
        return SaleError::InvalidInput;
    }
    return std::move(result).assume_value();
}

// Holds the in storage lock flag for the duration of a deposit.
class ReentrancyGuard
{
    StorageVariable<bool> &flag_;

public:
    explicit ReentrancyGuard(StorageVariable<bool> &flag)
        : flag_{flag}
    {
        flag_.store(true);
    }

    ReentrancyGuard(ReentrancyGuard const &) = delete;
    ReentrancyGuard &operator=(ReentrancyGuard const &) = delete;

    ~ReentrancyGuard()
    {
        flag_.clear();
    }
};

TIERSALE_ANONYMOUS_NAMESPACE_END

TIERSALE_NAMESPACE_BEGIN

SaleContract::SaleContract(
    State &state, Address const &ca, uint64_t const timestamp)
    : state_{state}
    , ca_{ca}
    , timestamp_{timestamp}
    , custodian_{nullptr}
    , vars{state, ca}
    , ledger{state, ca}
{
}

SaleContract::SaleContract(
    State &state, Address const &ca, uint64_t const timestamp,
    Custodian &custodian)
    : state_{state}
    , ca_{ca}
    , timestamp_{timestamp}
    , custodian_{&custodian}
    , vars{state, ca}
    , ledger{state, ca}
{
}

bool SaleContract::is_initialized() const
{
    return vars.owner.load_checked().has_value();
}

Result<void> SaleContract::initialize(SaleConfig const &config)
{
    std::unique_lock const lock{state_.mutex()};

    if (TIERSALE_UNLIKELY(is_initialized())) {
        return SaleError::AlreadyInitialized;
    }
    if (TIERSALE_UNLIKELY(
            config.owner == Address{} || config.custodian == Address{})) {
        return SaleError::InvalidParameter;
    }
    if (TIERSALE_UNLIKELY(
            config.max_page_size == 0 || config.increment == 0 ||
            config.increment > config.increment_ceiling)) {
        return SaleError::InvalidParameter;
    }
    BOOST_OUTCOME_TRY(
        ledger.initialize(config.tier_limits, config.individual_cap));

    vars.owner.store(config.owner);
    vars.custodian.store(config.custodian);
    vars.max_page_size.store(config.max_page_size);
    vars.increment_ceiling.store(config.increment_ceiling);
    vars.increment_delay.store(config.increment_delay);
    vars.increment().initialize(config.increment);

    LOG_INFO(
        "Initialized sale {} owned by {}, forwarding to {}",
        ca_,
        config.owner,
        config.custodian);
    return outcome::success();
}

Result<byte_string> SaleContract::call(
    byte_string_view input, evmc_address const &sender,
    evmc_bytes32 const &msg_value)
{
    // Calls are serialized per State, so sales sharing one State never
    // interleave. A call made from inside another one on the same thread
    // reaches the reentrancy check instead of deadlocking.
    std::unique_lock const lock{state_.mutex()};

    if (TIERSALE_UNLIKELY(!is_initialized())) {
        return SaleError::NotInitialized;
    }

    auto const func = precompile_dispatch(input);

    state_.push();
    auto result = (this->*func)(input, sender, msg_value);
    if (result.has_error()) {
        state_.pop_reject();
    }
    else {
        state_.pop_accept();
    }
    return result;
}

Result<void> SaleContract::require_owner(Address const &sender) const
{
    if (TIERSALE_UNLIKELY(sender != vars.owner.load())) {
        return SaleError::Unauthorized;
    }

    return outcome::success();
}

SaleContract::PrecompileFunc
SaleContract::precompile_dispatch(byte_string_view &input)
{
    if (TIERSALE_UNLIKELY(input.size() < 4)) {
        return &SaleContract::precompile_fallback;
    }

    auto const signature =
        intx::be::unsafe::load<uint32_t>(input.substr(0, 4).data());

    PrecompileFunc func = nullptr;
    switch (signature) {
    case PrecompileSelector::DEPOSIT:
        func = &SaleContract::precompile_deposit;
        break;
    case PrecompileSelector::GET_CURRENT_TIER:
        func = &SaleContract::precompile_get_current_tier;
        break;
    case PrecompileSelector::GET_TOTAL_COLLECTED:
        func = &SaleContract::precompile_get_total_collected;
        break;
    case PrecompileSelector::GET_TIER_LIMITS:
        func = &SaleContract::precompile_get_tier_limits;
        break;
    case PrecompileSelector::GET_INDIVIDUAL_CAP:
        func = &SaleContract::precompile_get_individual_cap;
        break;
    case PrecompileSelector::GET_PARTICIPANT:
        func = &SaleContract::precompile_get_participant;
        break;
    case PrecompileSelector::GET_PARTICIPANT_COUNT:
        func = &SaleContract::precompile_get_participant_count;
        break;
    case PrecompileSelector::GET_PARTICIPANTS:
        func = &SaleContract::precompile_get_participants;
        break;
    case PrecompileSelector::GET_INCREMENT:
        func = &SaleContract::precompile_get_increment;
        break;
    case PrecompileSelector::GET_PENDING_INCREMENT:
        func = &SaleContract::precompile_get_pending_increment;
        break;
    case PrecompileSelector::IS_PAUSED:
        func = &SaleContract::precompile_is_paused;
        break;
    case PrecompileSelector::OWNER:
        func = &SaleContract::precompile_owner;
        break;
    case PrecompileSelector::RESET_LEDGER:
        func = &SaleContract::precompile_reset_ledger;
        break;
    case PrecompileSelector::UPDATE_TIER_LIMIT:
        func = &SaleContract::precompile_update_tier_limit;
        break;
    case PrecompileSelector::UPDATE_INDIVIDUAL_CAP:
        func = &SaleContract::precompile_update_individual_cap;
        break;
    case PrecompileSelector::UPDATE_MAX_PAGE_SIZE:
        func = &SaleContract::precompile_update_max_page_size;
        break;
    case PrecompileSelector::PROPOSE_INCREMENT:
        func = &SaleContract::precompile_propose_increment;
        break;
    case PrecompileSelector::APPLY_INCREMENT:
        func = &SaleContract::precompile_apply_increment;
        break;
    case PrecompileSelector::CANCEL_INCREMENT:
        func = &SaleContract::precompile_cancel_increment;
        break;
    case PrecompileSelector::PAUSE:
        func = &SaleContract::precompile_pause;
        break;
    case PrecompileSelector::UNPAUSE:
        func = &SaleContract::precompile_unpause;
        break;
    default:
        return &SaleContract::precompile_fallback;
    }

    input.remove_prefix(4);
    return func;
}

/////////////
// Deposit //
/////////////

Result<byte_string> SaleContract::precompile_deposit(
    byte_string_view const input, evmc_address const &msg_sender,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(no_more_input(input));

    if (TIERSALE_UNLIKELY(vars.locked.load())) {
        return SaleError::ReentrantCall;
    }
    if (TIERSALE_UNLIKELY(vars.paused.load())) {
        return SaleError::SalePaused;
    }
    ReentrancyGuard const guard{vars.locked};

    Address const sender{msg_sender};
    auto const amount = intx::be::load<uint256_t>(msg_value);
    auto const increment = vars.increment().active();
    if (TIERSALE_UNLIKELY(amount == 0 || amount % increment != 0)) {
        return SaleError::InvalidAmount;
    }

    BOOST_OUTCOME_TRY(auto const accepted, ledger.accept(sender, amount));

    // The full deposit goes to the custodian, including any part past the
    // final tier limit.
    auto const held = intx::be::load<uint256_t>(state_.get_balance(ca_));
    if (TIERSALE_UNLIKELY(intx::addc(held, amount).carry)) {
        LOG_ERROR(
            "Cannot take {} from {}: sale holds {}", amount, sender, held);
        return SaleError::TransferFailed;
    }
    state_.add_to_balance(ca_, amount);
    StateCustodian fallback{state_, vars.custodian.load()};
    Custodian &custodian = custodian_ ? *custodian_ : fallback;
    BOOST_OUTCOME_TRY(custodian.forward(ca_, amount));
    emit_funds_forwarded_event(custodian.destination(), amount);

    uint256_t booked{0};
    for (auto const &amount_in_tier : accepted.booked) {
        booked += amount_in_tier;
    }
    return AbiEncoder{}
        .add_uint(booked)
        .add_uint(accepted.unbooked)
        .add_int(u8_be{tier_number(accepted.tier)})
        .encode_final();
}

///////////
// Reads //
///////////

Result<byte_string> SaleContract::precompile_get_current_tier(
    byte_string_view const input, evmc_address const &,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(
        function_not_payable(u256_be::from_bytes(msg_value.bytes)));
    BOOST_OUTCOME_TRY(no_more_input(input));

    return to_byte_string(
        abi_encode_int(u8_be{tier_number(ledger.current_tier())}));
}

Result<byte_string> SaleContract::precompile_get_total_collected(
    byte_string_view const input, evmc_address const &,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(
        function_not_payable(u256_be::from_bytes(msg_value.bytes)));
    BOOST_OUTCOME_TRY(no_more_input(input));

    return to_byte_string(abi_encode_uint(ledger.total_collected()));
}

Result<byte_string> SaleContract::precompile_get_tier_limits(
    byte_string_view const input, evmc_address const &,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(
        function_not_payable(u256_be::from_bytes(msg_value.bytes)));
    BOOST_OUTCOME_TRY(no_more_input(input));

    AbiEncoder encoder;
    for (auto const &limit : ledger.schedule()) {
        encoder.add_uint(limit);
    }
    return encoder.encode_final();
}

Result<byte_string> SaleContract::precompile_get_individual_cap(
    byte_string_view const input, evmc_address const &,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(
        function_not_payable(u256_be::from_bytes(msg_value.bytes)));
    BOOST_OUTCOME_TRY(no_more_input(input));

    return to_byte_string(abi_encode_uint(ledger.individual_cap()));
}

Result<byte_string> SaleContract::precompile_get_participant(
    byte_string_view input, evmc_address const &,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(
        function_not_payable(u256_be::from_bytes(msg_value.bytes)));
    BOOST_OUTCOME_TRY(auto const address, decode_arg<Address>(input));
    BOOST_OUTCOME_TRY(no_more_input(input));

    return abi_encode(ledger.participant(address));
}

Result<byte_string> SaleContract::precompile_get_participant_count(
    byte_string_view const input, evmc_address const &,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(
        function_not_payable(u256_be::from_bytes(msg_value.bytes)));
    BOOST_OUTCOME_TRY(no_more_input(input));

    return to_byte_string(abi_encode_uint(ledger.participant_count()));
}

Result<byte_string> SaleContract::precompile_get_participants(
    byte_string_view input, evmc_address const &,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(
        function_not_payable(u256_be::from_bytes(msg_value.bytes)));
    BOOST_OUTCOME_TRY(auto const page, decode_arg<u256_be>(input));
    BOOST_OUTCOME_TRY(auto const page_size, decode_arg<u256_be>(input));
    BOOST_OUTCOME_TRY(no_more_input(input));

    auto const max_page_size = vars.max_page_size.load().native();
    if (TIERSALE_UNLIKELY(
            page.is_zero() || page_size.is_zero() ||
            page_size.native() > uint256_t{max_page_size})) {
        return SaleError::InvalidInput;
    }
    // Any page this far out starts past the end of the index.
    if (TIERSALE_UNLIKELY(
            page.native() > uint256_t{std::numeric_limits<uint64_t>::max()})) {
        return SaleError::PaginationOutOfRange;
    }

    BOOST_OUTCOME_TRY(
        auto const entries,
        ledger.participants_page(
            static_cast<uint64_t>(page.native()),
            static_cast<uint64_t>(page_size.native())));

    std::vector<byte_string> elements;
    elements.reserve(entries.size());
    for (auto const &[address, record] : entries) {
        auto element = to_byte_string(abi_encode_address(address));
        element += abi_encode(record);
        elements.push_back(std::move(element));
    }
    return AbiEncoder{}.add_static_tuple_array(elements).encode_final();
}

Result<byte_string> SaleContract::precompile_get_increment(
    byte_string_view const input, evmc_address const &,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(
        function_not_payable(u256_be::from_bytes(msg_value.bytes)));
    BOOST_OUTCOME_TRY(no_more_input(input));

    return to_byte_string(abi_encode_uint(vars.increment().active()));
}

Result<byte_string> SaleContract::precompile_get_pending_increment(
    byte_string_view const input, evmc_address const &,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(
        function_not_payable(u256_be::from_bytes(msg_value.bytes)));
    BOOST_OUTCOME_TRY(no_more_input(input));

    auto const pending = vars.increment().pending();
    return AbiEncoder{}
        .add_uint(pending ? pending->value : uint256_t{0})
        .add_uint(pending ? pending->effective_at : 0)
        .encode_final();
}

Result<byte_string> SaleContract::precompile_is_paused(
    byte_string_view const input, evmc_address const &,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(
        function_not_payable(u256_be::from_bytes(msg_value.bytes)));
    BOOST_OUTCOME_TRY(no_more_input(input));

    return to_byte_string(abi_encode_bool(vars.paused.load()));
}

Result<byte_string> SaleContract::precompile_owner(
    byte_string_view const input, evmc_address const &,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(
        function_not_payable(u256_be::from_bytes(msg_value.bytes)));
    BOOST_OUTCOME_TRY(no_more_input(input));

    return to_byte_string(abi_encode_address(vars.owner.load()));
}

////////////////
// Privileged //
////////////////

Result<byte_string> SaleContract::precompile_reset_ledger(
    byte_string_view const input, evmc_address const &msg_sender,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(
        function_not_payable(u256_be::from_bytes(msg_value.bytes)));
    BOOST_OUTCOME_TRY(require_owner(msg_sender));
    BOOST_OUTCOME_TRY(no_more_input(input));

    auto const cleared = ledger.reset();
    return to_byte_string(abi_encode_uint(cleared));
}

Result<byte_string> SaleContract::precompile_update_tier_limit(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(
        function_not_payable(u256_be::from_bytes(msg_value.bytes)));
    BOOST_OUTCOME_TRY(require_owner(msg_sender));
    BOOST_OUTCOME_TRY(auto const number, decode_arg<u8_be>(input));
    BOOST_OUTCOME_TRY(auto const new_limit, decode_arg<u256_be>(input));
    BOOST_OUTCOME_TRY(no_more_input(input));

    auto const tier = tier_from_number(number.native());
    if (TIERSALE_UNLIKELY(!tier.has_value())) {
        return SaleError::InvalidTierLimitUpdate;
    }
    BOOST_OUTCOME_TRY(ledger.update_tier_limit(*tier, new_limit.native()));
    return to_byte_string(abi_encode_bool(true));
}

Result<byte_string> SaleContract::precompile_update_individual_cap(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(
        function_not_payable(u256_be::from_bytes(msg_value.bytes)));
    BOOST_OUTCOME_TRY(require_owner(msg_sender));
    BOOST_OUTCOME_TRY(auto const cap, decode_arg<u256_be>(input));
    BOOST_OUTCOME_TRY(no_more_input(input));

    auto const old_cap = ledger.individual_cap();
    BOOST_OUTCOME_TRY(ledger.update_individual_cap(cap.native()));
    emit_individual_cap_updated_event(old_cap, cap.native());
    return to_byte_string(abi_encode_bool(true));
}

Result<byte_string> SaleContract::precompile_update_max_page_size(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(
        function_not_payable(u256_be::from_bytes(msg_value.bytes)));
    BOOST_OUTCOME_TRY(require_owner(msg_sender));
    BOOST_OUTCOME_TRY(auto const size, decode_arg<u256_be>(input));
    BOOST_OUTCOME_TRY(no_more_input(input));

    if (TIERSALE_UNLIKELY(
            size.is_zero() ||
            size.native() > uint256_t{std::numeric_limits<uint64_t>::max()})) {
        return SaleError::InvalidParameter;
    }
    auto const old_size = vars.max_page_size.load().native();
    auto const new_size = static_cast<uint64_t>(size.native());
    vars.max_page_size.store(new_size);
    emit_max_page_size_updated_event(old_size, new_size);
    return to_byte_string(abi_encode_bool(true));
}

Result<byte_string> SaleContract::precompile_propose_increment(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(
        function_not_payable(u256_be::from_bytes(msg_value.bytes)));
    BOOST_OUTCOME_TRY(require_owner(msg_sender));
    BOOST_OUTCOME_TRY(auto const value, decode_arg<u256_be>(input));
    BOOST_OUTCOME_TRY(no_more_input(input));

    auto increment = vars.increment();
    BOOST_OUTCOME_TRY(
        auto const pending,
        increment.propose(
            value.native(),
            vars.increment_delay.load().native(),
            timestamp_));
    emit_increment_change_proposed_event(pending.value, pending.effective_at);
    return AbiEncoder{}
        .add_uint(pending.value)
        .add_uint(pending.effective_at)
        .encode_final();
}

Result<byte_string> SaleContract::precompile_apply_increment(
    byte_string_view const input, evmc_address const &msg_sender,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(
        function_not_payable(u256_be::from_bytes(msg_value.bytes)));
    BOOST_OUTCOME_TRY(require_owner(msg_sender));
    BOOST_OUTCOME_TRY(no_more_input(input));

    auto increment = vars.increment();
    BOOST_OUTCOME_TRY(auto const applied, increment.apply(timestamp_));
    emit_increment_change_applied_event(applied.old_value, applied.new_value);
    LOG_INFO(
        "Increment changed from {} to {}",
        applied.old_value,
        applied.new_value);
    return to_byte_string(abi_encode_uint(applied.new_value));
}

Result<byte_string> SaleContract::precompile_cancel_increment(
    byte_string_view const input, evmc_address const &msg_sender,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(
        function_not_payable(u256_be::from_bytes(msg_value.bytes)));
    BOOST_OUTCOME_TRY(require_owner(msg_sender));
    BOOST_OUTCOME_TRY(no_more_input(input));

    auto increment = vars.increment();
    BOOST_OUTCOME_TRY(auto const cancelled, increment.cancel());
    emit_increment_change_cancelled_event(cancelled.value);
    return to_byte_string(abi_encode_uint(cancelled.value));
}

Result<byte_string> SaleContract::precompile_pause(
    byte_string_view const input, evmc_address const &msg_sender,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(
        function_not_payable(u256_be::from_bytes(msg_value.bytes)));
    BOOST_OUTCOME_TRY(require_owner(msg_sender));
    BOOST_OUTCOME_TRY(no_more_input(input));

    if (!vars.paused.load()) {
        vars.paused.store(true);
        emit_paused_event(Address{msg_sender});
        LOG_INFO("Deposits paused by {}", Address{msg_sender});
    }
    return to_byte_string(abi_encode_bool(true));
}

Result<byte_string> SaleContract::precompile_unpause(
    byte_string_view const input, evmc_address const &msg_sender,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(
        function_not_payable(u256_be::from_bytes(msg_value.bytes)));
    BOOST_OUTCOME_TRY(require_owner(msg_sender));
    BOOST_OUTCOME_TRY(no_more_input(input));

    if (vars.paused.load()) {
        vars.paused.clear();
        emit_unpaused_event(Address{msg_sender});
        LOG_INFO("Deposits resumed by {}", Address{msg_sender});
    }
    return to_byte_string(abi_encode_bool(true));
}

Result<byte_string> SaleContract::precompile_fallback(
    byte_string_view, evmc_address const &, evmc_bytes32 const &msg_value)
{
    if (!u256_be::from_bytes(msg_value.bytes).is_zero()) {
        return SaleError::UnsolicitedTransfer;
    }
    return SaleError::MethodNotSupported;
}

////////////
// Events //
////////////

void SaleContract::emit_increment_change_proposed_event(
    uint256_t const &value, uint64_t const effective_at)
{
    static constexpr auto signature =
        abi_encode_event_signature("IncrementChangeProposed(uint256,uint256)");
    static_assert(
        signature ==
        0x85b0f291db21d19c5c6a196e15613550423704639700dde65d7ecaf0508f40b0_bytes32);

    auto const event = EventBuilder(ca_, signature)
                           .add_data(abi_encode_uint(value))
                           .add_data(abi_encode_uint(effective_at))
                           .build();
    state_.store_log(event);
}

void SaleContract::emit_increment_change_applied_event(
    uint256_t const &old_value, uint256_t const &new_value)
{
    static constexpr auto signature =
        abi_encode_event_signature("IncrementChangeApplied(uint256,uint256)");
    static_assert(
        signature ==
        0xfdd37235608e108cd3f23145ec6feefc5296ef6cf3e4e0b291e65fc362ee436c_bytes32);

    auto const event = EventBuilder(ca_, signature)
                           .add_data(abi_encode_uint(old_value))
                           .add_data(abi_encode_uint(new_value))
                           .build();
    state_.store_log(event);
}

void SaleContract::emit_increment_change_cancelled_event(
    uint256_t const &value)
{
    static constexpr auto signature =
        abi_encode_event_signature("IncrementChangeCancelled(uint256)");
    static_assert(
        signature ==
        0x66bec937c0502330984bbd94ca8118a8e822a261f513cd4bc2ad1f4e44b6caad_bytes32);

    auto const event = EventBuilder(ca_, signature)
                           .add_data(abi_encode_uint(value))
                           .build();
    state_.store_log(event);
}

void SaleContract::emit_individual_cap_updated_event(
    uint256_t const &old_cap, uint256_t const &new_cap)
{
    static constexpr auto signature =
        abi_encode_event_signature("IndividualCapUpdated(uint256,uint256)");
    static_assert(
        signature ==
        0x06756421d0cad502cb33bcc0127c8fb9ed3aff5a8d78a536c683b499e8a8dfc9_bytes32);

    auto const event = EventBuilder(ca_, signature)
                           .add_data(abi_encode_uint(old_cap))
                           .add_data(abi_encode_uint(new_cap))
                           .build();
    state_.store_log(event);
}

void SaleContract::emit_max_page_size_updated_event(
    uint64_t const old_size, uint64_t const new_size)
{
    static constexpr auto signature =
        abi_encode_event_signature("MaxPageSizeUpdated(uint256,uint256)");
    static_assert(
        signature ==
        0x26762aecc68f6770f96da150df513dd63485fb9f5a32fa7a23a4731cc6c2eb26_bytes32);

    auto const event = EventBuilder(ca_, signature)
                           .add_data(abi_encode_uint(old_size))
                           .add_data(abi_encode_uint(new_size))
                           .build();
    state_.store_log(event);
}

void SaleContract::emit_paused_event(Address const &by)
{
    static constexpr auto signature =
        abi_encode_event_signature("Paused(address)");
    static_assert(
        signature ==
        0x62e78cea01bee320cd4e420270b5ea74000d11b0c9f74754ebdbfc544b05a258_bytes32);

    auto const event = EventBuilder(ca_, signature)
                           .add_topic(abi_encode_address(by))
                           .build();
    state_.store_log(event);
}

void SaleContract::emit_unpaused_event(Address const &by)
{
    static constexpr auto signature =
        abi_encode_event_signature("Unpaused(address)");
    static_assert(
        signature ==
        0x5db9ee0a495bf2e6ff9c91a7834c1ba4fdd244a5e8aa4e537bd38aeae4b073aa_bytes32);

    auto const event = EventBuilder(ca_, signature)
                           .add_topic(abi_encode_address(by))
                           .build();
    state_.store_log(event);
}

void SaleContract::emit_funds_forwarded_event(
    Address const &custodian, uint256_t const &amount)
{
    static constexpr auto signature =
        abi_encode_event_signature("FundsForwarded(address,uint256)");
    static_assert(
        signature ==
        0x1ddb9940799fcccc2468d1a828bfa2aa7919823d13f2be973a25b396178531c2_bytes32);

    auto const event = EventBuilder(ca_, signature)
                           .add_topic(abi_encode_address(custodian))
                           .add_data(abi_encode_uint(amount))
                           .build();
    state_.store_log(event);
}

TIERSALE_NAMESPACE_END
