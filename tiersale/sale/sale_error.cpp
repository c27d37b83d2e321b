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

#include <tiersale/sale/sale_error.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<tiersale::SaleError>::mapping> const &
quick_status_code_from_enum<tiersale::SaleError>::value_mappings()
{
    using tiersale::SaleError;

    static std::initializer_list<mapping> const v = {
        {SaleError::Success, "success", {errc::success}},
        {SaleError::InternalError, "internal error", {}},
        {SaleError::MethodNotSupported, "method not supported", {}},
        {SaleError::InvalidInput, "invalid input", {}},
        {SaleError::ValueNonZero, "value is non-zero", {}},
        {SaleError::UnsolicitedTransfer, "unsolicited value transfer", {}},
        {SaleError::Unauthorized, "caller is not the owner", {}},
        {SaleError::AlreadyInitialized, "sale already initialized", {}},
        {SaleError::NotInitialized, "sale not initialized", {}},
        {SaleError::SalePaused, "deposits are paused", {}},
        {SaleError::ReentrantCall, "reentrant call", {}},
        {SaleError::InvalidAmount, "invalid amount", {}},
        {SaleError::IndividualCapExceeded, "individual cap exceeded", {}},
        {SaleError::SaleClosed, "sale closed", {}},
        {SaleError::InvalidTierLimitUpdate, "invalid tier limit update", {}},
        {SaleError::InvalidParameter, "invalid parameter", {}},
        {SaleError::NoMutationPending, "no mutation pending", {}},
        {SaleError::TimelockNotElapsed, "timelock not elapsed", {}},
        {SaleError::PaginationOutOfRange, "page out of range", {}},
        {SaleError::TransferFailed, "transfer to custodian failed", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
