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
#include <tiersale/core/result.hpp>
#include <tiersale/sale/constants.hpp>
#include <tiersale/sale/tier.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <filesystem>

TIERSALE_NAMESPACE_BEGIN

class State;

// Deployment parameters of a sale.
struct SaleConfig
{
    Address owner{};
    Address custodian{};
    Address contract{SALE_CONTRACT_ADDRESS};
    TierSchedule tier_limits{};
    uint256_t individual_cap{0};
    uint256_t increment{DEFAULT_INCREMENT};
    uint256_t increment_ceiling{DEFAULT_INCREMENT_CEILING};
    uint64_t increment_delay{DEFAULT_INCREMENT_DELAY};
    uint64_t max_page_size{DEFAULT_MAX_PAGE_SIZE};
};

// Hex string, with or without 0x, of exactly 20 bytes.
Result<Address> address_from_json(nlohmann::json const &);

// Decimal or 0x prefixed hex string, or a non-negative json integer.
Result<uint256_t> amount_from_json(nlohmann::json const &);

Result<SaleConfig> parse_sale_config(nlohmann::json const &);
Result<SaleConfig> read_sale_config(std::filesystem::path const &);

// Writes the configuration into the storage of a contract that has never
// been initialized.
Result<void> initialize_sale(State &, SaleConfig const &);

TIERSALE_NAMESPACE_END
