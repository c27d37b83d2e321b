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
#include <tiersale/core/int.hpp>
#include <tiersale/core/likely.h>
#include <tiersale/core/result.hpp>
#include <tiersale/sale/config_error.hpp>
#include <tiersale/sale/sale_config.hpp>
#include <tiersale/sale/sale_contract.hpp>
#include <tiersale/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>
#include <evmc/hex.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>
#include <quill/Quill.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <string>

TIERSALE_ANONYMOUS_NAMESPACE_BEGIN

Result<nlohmann::json const *>
required_field(nlohmann::json const &json, char const *const name)
{
    if (TIERSALE_UNLIKELY(!json.is_object() || !json.contains(name))) {
        LOG_ERROR("Sale config is missing {}", name);
        return ConfigError::MissingField;
    }
    return &json.at(name);
}

Result<uint64_t> number_from_json(nlohmann::json const &json)
{
    if (json.is_number_unsigned()) {
        return json.get<uint64_t>();
    }
    if (json.is_string()) {
        try {
            size_t pos = 0;
            auto const str = json.get<std::string>();
            // stoull alone would skip leading blanks and a sign
            if (str.empty() || str[0] < '0' || str[0] > '9') {
                return ConfigError::InvalidNumber;
            }
            auto const value = std::stoull(str, &pos, 0);
            if (pos == str.size()) {
                return static_cast<uint64_t>(value);
            }
        }
        catch (std::logic_error const &) {
        }
    }
    return ConfigError::InvalidNumber;
}

TIERSALE_ANONYMOUS_NAMESPACE_END

TIERSALE_NAMESPACE_BEGIN

Result<Address> address_from_json(nlohmann::json const &json)
{
    if (TIERSALE_UNLIKELY(!json.is_string())) {
        return ConfigError::InvalidAddress;
    }
    auto const bytes = evmc::from_hex(json.get<std::string>());
    if (TIERSALE_UNLIKELY(
            !bytes.has_value() || bytes->size() != sizeof(Address))) {
        return ConfigError::InvalidAddress;
    }
    Address address{};
    std::copy_n(bytes->begin(), bytes->size(), address.bytes);
    return address;
}

Result<uint256_t> amount_from_json(nlohmann::json const &json)
{
    if (json.is_number_unsigned()) {
        return uint256_t{json.get<uint64_t>()};
    }
    if (TIERSALE_UNLIKELY(!json.is_string())) {
        return ConfigError::InvalidAmount;
    }
    try {
        return intx::from_string<uint256_t>(json.get<std::string>());
    }
    catch (std::invalid_argument const &) {
        return ConfigError::InvalidAmount;
    }
    catch (std::out_of_range const &) {
        return ConfigError::InvalidAmount;
    }
}

Result<SaleConfig> parse_sale_config(nlohmann::json const &json)
{
    SaleConfig config{};

    BOOST_OUTCOME_TRY(auto const *const owner, required_field(json, "owner"));
    BOOST_OUTCOME_TRY(config.owner, address_from_json(*owner));

    BOOST_OUTCOME_TRY(
        auto const *const custodian, required_field(json, "custodian"));
    BOOST_OUTCOME_TRY(config.custodian, address_from_json(*custodian));

    if (json.contains("contract")) {
        BOOST_OUTCOME_TRY(config.contract, address_from_json(json["contract"]));
    }

    BOOST_OUTCOME_TRY(
        auto const *const limits, required_field(json, "tierLimits"));
    if (TIERSALE_UNLIKELY(
            !limits->is_array() || limits->size() != NUM_TIERS)) {
        LOG_ERROR("tierLimits must list exactly {} limits", NUM_TIERS);
        return ConfigError::InvalidAmount;
    }
    for (size_t i = 0; i < NUM_TIERS; ++i) {
        BOOST_OUTCOME_TRY(
            config.tier_limits[i], amount_from_json((*limits)[i]));
    }

    BOOST_OUTCOME_TRY(
        auto const *const cap, required_field(json, "individualCap"));
    BOOST_OUTCOME_TRY(config.individual_cap, amount_from_json(*cap));

    if (json.contains("increment")) {
        BOOST_OUTCOME_TRY(
            config.increment, amount_from_json(json["increment"]));
    }
    if (json.contains("incrementCeiling")) {
        BOOST_OUTCOME_TRY(
            config.increment_ceiling,
            amount_from_json(json["incrementCeiling"]));
    }
    if (json.contains("incrementDelay")) {
        BOOST_OUTCOME_TRY(
            config.increment_delay, number_from_json(json["incrementDelay"]));
    }
    if (json.contains("maxPageSize")) {
        BOOST_OUTCOME_TRY(
            config.max_page_size, number_from_json(json["maxPageSize"]));
    }

    return config;
}

Result<SaleConfig> read_sale_config(std::filesystem::path const &path)
{
    std::ifstream in{path};
    if (TIERSALE_UNLIKELY(!in)) {
        LOG_ERROR("Cannot open sale config {}", path.string());
        return ConfigError::FileNotFound;
    }

    auto const json = nlohmann::json::parse(in, nullptr, false);
    if (TIERSALE_UNLIKELY(json.is_discarded())) {
        LOG_ERROR("Sale config {} is not valid json", path.string());
        return ConfigError::ParseError;
    }
    return parse_sale_config(json);
}

Result<void> initialize_sale(State &state, SaleConfig const &config)
{
    SaleContract contract{state, config.contract, 0};
    std::unique_lock const lock{state.mutex()};

    state.push();
    auto const result = contract.initialize(config);
    if (result.has_error()) {
        state.pop_reject();
    }
    else {
        state.pop_accept();
    }
    return result;
}

TIERSALE_NAMESPACE_END
