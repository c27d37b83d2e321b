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

#include <tiersale/core/bytes.hpp>
#include <tiersale/core/config.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

TIERSALE_NAMESPACE_BEGIN

namespace detail
{
    // Compile time keccak256 for short signature strings. Runtime hashing
    // goes through keccak256() in core.
    inline constexpr std::array<uint64_t, 24> KECCAK_ROUND_CONSTANTS{
        0x0000000000000001, 0x0000000000008082, 0x800000000000808A,
        0x8000000080008000, 0x000000000000808B, 0x0000000080000001,
        0x8000000080008081, 0x8000000000008009, 0x000000000000008A,
        0x0000000000000088, 0x0000000080008009, 0x000000008000000A,
        0x000000008000808B, 0x800000000000008B, 0x8000000000008089,
        0x8000000000008003, 0x8000000000008002, 0x8000000000000080,
        0x000000000000800A, 0x800000008000000A, 0x8000000080008081,
        0x8000000000008080, 0x0000000080000001, 0x8000000080008008};

    // Indexed by x + 5 * y
    inline constexpr std::array<unsigned, 25> KECCAK_ROTATIONS{
        0,  1,  62, 28, 27, 36, 44, 6,  55, 20, 3,  10, 43,
        25, 39, 41, 45, 15, 21, 8,  18, 2,  61, 56, 14};

    constexpr uint64_t rotl64(uint64_t const x, unsigned const n) noexcept
    {
        return n == 0 ? x : (x << n) | (x >> (64 - n));
    }

    constexpr void keccak_f1600(std::array<uint64_t, 25> &a) noexcept
    {
        for (auto const rc : KECCAK_ROUND_CONSTANTS) {
            std::array<uint64_t, 5> c{};
            for (size_t x = 0; x < 5; ++x) {
                c[x] = a[x] ^ a[x + 5] ^ a[x + 10] ^ a[x + 15] ^ a[x + 20];
            }
            for (size_t x = 0; x < 5; ++x) {
                uint64_t const d = c[(x + 4) % 5] ^ rotl64(c[(x + 1) % 5], 1);
                for (size_t y = 0; y < 5; ++y) {
                    a[x + 5 * y] ^= d;
                }
            }

            std::array<uint64_t, 25> b{};
            for (size_t x = 0; x < 5; ++x) {
                for (size_t y = 0; y < 5; ++y) {
                    b[y + 5 * ((2 * x + 3 * y) % 5)] =
                        rotl64(a[x + 5 * y], KECCAK_ROTATIONS[x + 5 * y]);
                }
            }

            for (size_t x = 0; x < 5; ++x) {
                for (size_t y = 0; y < 5; ++y) {
                    a[x + 5 * y] = b[x + 5 * y] ^ (~b[(x + 1) % 5 + 5 * y] &
                                                   b[(x + 2) % 5 + 5 * y]);
                }
            }
            a[0] ^= rc;
        }
    }

    constexpr bytes32_t keccak256(std::string_view const input) noexcept
    {
        constexpr size_t RATE = 136;

        std::array<uint64_t, 25> state{};
        size_t const padded = (input.size() / RATE + 1) * RATE;
        for (size_t block = 0; block < padded; block += RATE) {
            for (size_t i = 0; i < RATE; ++i) {
                size_t const pos = block + i;
                uint64_t byte = 0;
                if (pos < input.size()) {
                    byte = static_cast<unsigned char>(input[pos]);
                }
                else if (pos == input.size()) {
                    byte = 0x01;
                }
                if (pos == padded - 1) {
                    byte |= 0x80;
                }
                state[i / 8] ^= byte << (8 * (i % 8));
            }
            keccak_f1600(state);
        }

        bytes32_t out{};
        for (size_t i = 0; i < sizeof(out.bytes); ++i) {
            out.bytes[i] =
                static_cast<uint8_t>(state[i / 8] >> (8 * (i % 8)));
        }
        return out;
    }
}

// First four bytes of keccak256 of the canonical function signature, as a
// big endian integer.
constexpr uint32_t abi_encode_selector(std::string_view const signature)
{
    auto const hash = detail::keccak256(signature);
    return (uint32_t{hash.bytes[0]} << 24) | (uint32_t{hash.bytes[1]} << 16) |
           (uint32_t{hash.bytes[2]} << 8) | uint32_t{hash.bytes[3]};
}

// keccak256 of the canonical event signature; topic 0 of the event's log.
constexpr bytes32_t abi_encode_event_signature(std::string_view const signature)
{
    return detail::keccak256(signature);
}

TIERSALE_NAMESPACE_END
