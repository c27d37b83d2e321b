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
#include <tiersale/core/bytes.hpp>
#include <tiersale/core/config.hpp>
#include <tiersale/core/int.hpp>

#include <intx/intx.hpp>

#include <cstring>
#include <span>
#include <utility>
#include <vector>

TIERSALE_NAMESPACE_BEGIN

// Solidity ABI encoding of contract return values and event data.
//
// https://docs.soliditylang.org/en/latest/abi-spec.html

inline bytes32_t abi_encode_address(Address const &address)
{
    bytes32_t output{};
    std::memcpy(&output.bytes[12], address.bytes, sizeof(Address));
    return output;
}

template <BigEndianType I>
bytes32_t abi_encode_int(I const &i)
{
    static_assert(sizeof(I) <= sizeof(bytes32_t));

    constexpr size_t offset = sizeof(bytes32_t) - sizeof(I);
    bytes32_t output{};
    std::memcpy(&output.bytes[offset], i.bytes, sizeof(I));
    return output;
}

inline bytes32_t abi_encode_uint(uint256_t const &value)
{
    return intx::be::store<bytes32_t>(value);
}

inline bytes32_t abi_encode_bool(bool const value)
{
    bytes32_t output{};
    output.bytes[31] = value ? 1 : 0;
    return output;
}

inline void append_word(byte_string &out, bytes32_t const &word)
{
    out.append(word.bytes, sizeof(word.bytes));
}

inline byte_string to_byte_string(bytes32_t const &word)
{
    return byte_string{word.bytes, sizeof(word.bytes)};
}

// Encodes a tuple. Static members are written to the head in place. Dynamic
// members put an offset in the head and their payload in the tail.
class AbiEncoder
{
    byte_string head_;
    byte_string tail_;
    std::vector<std::pair<size_t, size_t>> unresolved_offsets_;

    void add_dynamic(byte_string const &payload)
    {
        unresolved_offsets_.emplace_back(head_.size(), tail_.size());
        append_word(head_, bytes32_t{});
        tail_ += payload;
    }

public:
    AbiEncoder &add_address(Address const &address)
    {
        append_word(head_, abi_encode_address(address));
        return *this;
    }

    template <BigEndianType I>
    AbiEncoder &add_int(I const &i)
    {
        append_word(head_, abi_encode_int(i));
        return *this;
    }

    AbiEncoder &add_uint(uint256_t const &value)
    {
        append_word(head_, abi_encode_uint(value));
        return *this;
    }

    AbiEncoder &add_bool(bool const value)
    {
        append_word(head_, abi_encode_bool(value));
        return *this;
    }

    // T[] where T is a static tuple; each element is its own head encoding.
    AbiEncoder &add_static_tuple_array(std::span<byte_string const> elements)
    {
        byte_string payload;
        append_word(payload, abi_encode_uint(elements.size()));
        for (auto const &element : elements) {
            payload += element;
        }
        add_dynamic(payload);
        return *this;
    }

    byte_string encode_final()
    {
        for (auto const &[head_offset, tail_offset] : unresolved_offsets_) {
            auto const word = abi_encode_uint(head_.size() + tail_offset);
            std::memcpy(&head_[head_offset], word.bytes, sizeof(word.bytes));
        }
        unresolved_offsets_.clear();
        return std::move(head_) + std::move(tail_);
    }
};

TIERSALE_NAMESPACE_END
