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
#include <tiersale/sale/config_error.hpp>
#include <tiersale/sale/constants.hpp>
#include <tiersale/sale/sale_config.hpp>
#include <tiersale/sale/sale_contract.hpp>
#include <tiersale/state/state.hpp>
#include <tiersale/test/test_util.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using namespace tiersale;
using namespace tiersale::test;

namespace
{
    constexpr Address OWNER{0x0e};
    constexpr Address CUSTODIAN{0xc0};

    nlohmann::json minimal_config()
    {
        return nlohmann::json::parse(R"({
            "owner": "0x000000000000000000000000000000000000000e",
            "custodian": "00000000000000000000000000000000000000c0",
            "tierLimits": ["1000000000000000000", 200, "0x1000"],
            "individualCap": "500"
        })");
    }
}

TEST(SaleConfig, defaults)
{
    auto const res = parse_sale_config(minimal_config());
    ASSERT_FALSE(res.has_error());
    auto const &config = res.value();

    EXPECT_EQ(config.owner, OWNER);
    EXPECT_EQ(config.custodian, CUSTODIAN);
    EXPECT_EQ(config.contract, SALE_CONTRACT_ADDRESS);
    EXPECT_EQ(config.tier_limits[0], uint256_t{1'000'000'000'000'000'000});
    EXPECT_EQ(config.tier_limits[1], 200);
    EXPECT_EQ(config.tier_limits[2], 0x1000);
    EXPECT_EQ(config.individual_cap, 500);
    EXPECT_EQ(config.increment, DEFAULT_INCREMENT);
    EXPECT_EQ(config.increment_ceiling, DEFAULT_INCREMENT_CEILING);
    EXPECT_EQ(config.increment_delay, DEFAULT_INCREMENT_DELAY);
    EXPECT_EQ(config.max_page_size, DEFAULT_MAX_PAGE_SIZE);
}

TEST(SaleConfig, optional_fields)
{
    auto json = minimal_config();
    json["contract"] = "0x0000000000000000000000000000000000002200";
    json["increment"] = "10";
    json["incrementCeiling"] = 1000;
    json["incrementDelay"] = "0xe10";
    json["maxPageSize"] = 25;

    auto const res = parse_sale_config(json);
    ASSERT_FALSE(res.has_error());
    auto const &config = res.value();

    EXPECT_EQ(config.contract, Address{0x2200});
    EXPECT_EQ(config.increment, 10);
    EXPECT_EQ(config.increment_ceiling, 1000);
    EXPECT_EQ(config.increment_delay, 3600);
    EXPECT_EQ(config.max_page_size, 25);
}

TEST(SaleConfig, missing_fields)
{
    for (auto const *const field :
         {"owner", "custodian", "tierLimits", "individualCap"}) {
        auto json = minimal_config();
        json.erase(field);
        EXPECT_TRUE(
            has_error(parse_sale_config(json), ConfigError::MissingField))
            << field;
    }
    EXPECT_TRUE(has_error(
        parse_sale_config(nlohmann::json::array()), ConfigError::MissingField));
}

TEST(SaleConfig, invalid_values)
{
    auto rejects = [](char const *const field, nlohmann::json const &value) {
        auto json = minimal_config();
        json[field] = value;
        return parse_sale_config(json);
    };

    EXPECT_TRUE(
        has_error(rejects("owner", "0x0e"), ConfigError::InvalidAddress));
    EXPECT_TRUE(
        has_error(rejects("custodian", 12), ConfigError::InvalidAddress));
    EXPECT_TRUE(has_error(
        rejects("tierLimits", nlohmann::json::array({1, 2})),
        ConfigError::InvalidAmount));
    EXPECT_TRUE(has_error(
        rejects("individualCap", "lots"), ConfigError::InvalidAmount));
    EXPECT_TRUE(
        has_error(rejects("individualCap", -5), ConfigError::InvalidAmount));
    // 2^256
    EXPECT_TRUE(has_error(
        rejects("individualCap", "0x1" + std::string(64, '0')),
        ConfigError::InvalidAmount));
    EXPECT_TRUE(
        has_error(rejects("incrementDelay", "-1"), ConfigError::InvalidNumber));
    EXPECT_TRUE(
        has_error(rejects("maxPageSize", "ten"), ConfigError::InvalidNumber));
    EXPECT_TRUE(
        has_error(rejects("incrementDelay", " 5"), ConfigError::InvalidNumber));
    EXPECT_TRUE(
        has_error(rejects("incrementDelay", "+5"), ConfigError::InvalidNumber));
    EXPECT_TRUE(
        has_error(rejects("maxPageSize", ""), ConfigError::InvalidNumber));
}

TEST(SaleConfig, read_from_file)
{
    auto const path = std::filesystem::temp_directory_path() /
                      "tiersale_test_sale_config.json";
    {
        std::ofstream out{path};
        out << minimal_config().dump(4);
    }
    auto const res = read_sale_config(path);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().individual_cap, 500);

    {
        std::ofstream out{path};
        out << "{ \"owner\": ";
    }
    EXPECT_TRUE(has_error(read_sale_config(path), ConfigError::ParseError));

    std::filesystem::remove(path);
    EXPECT_TRUE(has_error(read_sale_config(path), ConfigError::FileNotFound));
}

TEST(SaleConfig, initializes_storage)
{
    auto const res = parse_sale_config(minimal_config());
    ASSERT_FALSE(res.has_error());

    State state;
    ASSERT_FALSE(initialize_sale(state, res.value()).has_error());
    EXPECT_EQ(state.depth(), 0);

    SaleContract const contract{state, res.value().contract, 0};
    EXPECT_TRUE(contract.is_initialized());
    EXPECT_EQ(contract.vars.owner.load(), OWNER);
    EXPECT_EQ(contract.vars.custodian.load(), CUSTODIAN);
    EXPECT_EQ(contract.ledger.individual_cap(), 500);
    EXPECT_EQ(contract.ledger.tier_limit(Tier::Three), 0x1000);
    EXPECT_EQ(contract.vars.increment().active(), DEFAULT_INCREMENT);
}
