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
#include <tiersale/core/config.hpp>
#include <tiersale/core/int.hpp>

#include <cstdint>

TIERSALE_NAMESPACE_BEGIN

inline constexpr Address SALE_CONTRACT_ADDRESS{0x1100};

inline constexpr uint64_t DEFAULT_INCREMENT_DELAY = 24 * 60 * 60;
inline constexpr uint64_t DEFAULT_MAX_PAGE_SIZE = 100;
inline constexpr uint256_t DEFAULT_INCREMENT{1};
inline constexpr uint256_t DEFAULT_INCREMENT_CEILING{1'000'000'000'000'000'000};

TIERSALE_NAMESPACE_END
