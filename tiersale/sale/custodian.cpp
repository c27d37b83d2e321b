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
#include <tiersale/core/fmt/address_fmt.hpp>
#include <tiersale/core/fmt/int_fmt.hpp>
#include <tiersale/core/int.hpp>
#include <tiersale/core/likely.h>
#include <tiersale/core/result.hpp>
#include <tiersale/sale/custodian.hpp>
#include <tiersale/sale/sale_error.hpp>
#include <tiersale/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <intx/intx.hpp>
#include <quill/Quill.h>

TIERSALE_NAMESPACE_BEGIN

StateCustodian::StateCustodian(State &state, Address const &destination)
    : state_{state}
    , destination_{destination}
{
}

Result<void>
StateCustodian::forward(Address const &from, uint256_t const &amount)
{
    if (TIERSALE_UNLIKELY(destination_ == Address{})) {
        LOG_ERROR("Cannot forward {} from {}: no custodian", amount, from);
        return SaleError::TransferFailed;
    }
    auto const balance = intx::be::load<uint256_t>(state_.get_balance(from));
    if (TIERSALE_UNLIKELY(balance < amount)) {
        LOG_ERROR(
            "Cannot forward {} from {}: balance is {}", amount, from, balance);
        return SaleError::TransferFailed;
    }
    auto const held =
        intx::be::load<uint256_t>(state_.get_balance(destination_));
    if (TIERSALE_UNLIKELY(intx::addc(held, amount).carry)) {
        LOG_ERROR(
            "Cannot forward {} from {}: {} already holds {}",
            amount,
            from,
            destination_,
            held);
        return SaleError::TransferFailed;
    }
    state_.subtract_from_balance(from, amount);
    state_.add_to_balance(destination_, amount);
    return outcome::success();
}

TIERSALE_NAMESPACE_END
