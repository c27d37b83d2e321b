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
#include <tiersale/core/address.hpp>
#include <tiersale/core/byte_string.hpp>
#include <tiersale/core/config.hpp>
#include <tiersale/core/result.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <cstring>
#include <initializer_list>

TIERSALE_NAMESPACE_BEGIN

enum class AbiDecodeError
{
    Success = 0,
    InputTooShort,
    DirtyPadding,
};

TIERSALE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<tiersale::AbiDecodeError>
    : quick_status_code_from_enum_defaults<tiersale::AbiDecodeError>
{
    static constexpr auto const domain_name = "Abi Decode Error";
    static constexpr auto const domain_uuid =
        "5c0d1e7a-34b8-4f0e-9a61-2b7d3c8e90f4";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END

TIERSALE_NAMESPACE_BEGIN

namespace detail
{
    inline bool is_zero_padding(byte_string_view const padding) noexcept
    {
        for (auto const b : padding) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }
}

// Consumes one 32 byte word from the front of `input` and decodes it as T.
// Words narrower than 32 bytes must be left padded with zeroes.
template <typename T>
    requires BigEndianType<T> || std::is_same_v<T, Address> ||
             std::is_same_v<T, bool>
Result<T> abi_decode_fixed(byte_string_view &input)
{
    constexpr size_t WORD = 32;
    if (input.size() < WORD) {
        return AbiDecodeError::InputTooShort;
    }
    auto const word = input.substr(0, WORD);

    T value{};
    if constexpr (std::is_same_v<T, bool>) {
        if (!detail::is_zero_padding(word.substr(0, WORD - 1)) ||
            word[WORD - 1] > 1) {
            return AbiDecodeError::DirtyPadding;
        }
        value = word[WORD - 1] == 1;
    }
    else {
        constexpr size_t width = sizeof(T);
        if (!detail::is_zero_padding(word.substr(0, WORD - width))) {
            return AbiDecodeError::DirtyPadding;
        }
        std::memcpy(&value, word.data() + (WORD - width), width);
    }
    input.remove_prefix(WORD);
    return value;
}

TIERSALE_NAMESPACE_END
