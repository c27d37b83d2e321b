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

#include <tiersale/contract/abi_encode.hpp>
#include <tiersale/contract/abi_signatures.hpp>
#include <tiersale/core/address.hpp>
#include <tiersale/core/byte_string.hpp>
#include <tiersale/core/bytes.hpp>
#include <tiersale/core/int.hpp>
#include <tiersale/replay/call_script.hpp>
#include <tiersale/sale/config_error.hpp>
#include <tiersale/test/test_util.hpp>

#include <evmc/hex.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

using namespace tiersale;
using namespace tiersale::test;

TEST(CallScript, encode_without_arguments)
{
    auto const res = encode_call("deposit()", nlohmann::json{});
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(evmc::hex(res.value()), "d0e30db0");

    auto const empty = encode_call("deposit()", nlohmann::json::array());
    ASSERT_FALSE(empty.has_error());
    EXPECT_EQ(empty.value(), res.value());
}

TEST(CallScript, encode_static_arguments)
{
    auto const res = encode_call(
        "updateTierLimit(uint8,uint256)", nlohmann::json::array({2, "120"}));
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(
        evmc::hex(res.value()),
        "e76d18ff"
        "0000000000000000000000000000000000000000000000000000000000000002"
        "0000000000000000000000000000000000000000000000000000000000000078");

    auto const address = encode_call(
        "getParticipant(address)",
        nlohmann::json::array({"0x00000000000000000000000000000000000a11ce"}));
    ASSERT_FALSE(address.has_error());
    byte_string expected{0x71, 0x43, 0x05, 0x9f};
    append_word(expected, abi_encode_address(Address{0xa11ce}));
    EXPECT_EQ(address.value(), expected);

    auto const flag = encode_call("f(bool)", nlohmann::json::array({true}));
    ASSERT_FALSE(flag.has_error());
    EXPECT_EQ(flag.value().size(), 36);
    EXPECT_EQ(flag.value().back(), 1);
}

TEST(CallScript, selector_matches_compile_time_hash)
{
    auto const res = encode_call(
        "getParticipants(uint256,uint256)", nlohmann::json::array({1, 10}));
    ASSERT_FALSE(res.has_error());
    auto const selector =
        abi_encode_selector("getParticipants(uint256,uint256)");
    EXPECT_EQ(res.value()[0], static_cast<unsigned char>(selector >> 24));
    EXPECT_EQ(res.value()[1], static_cast<unsigned char>(selector >> 16));
    EXPECT_EQ(res.value()[2], static_cast<unsigned char>(selector >> 8));
    EXPECT_EQ(res.value()[3], static_cast<unsigned char>(selector));
}

TEST(CallScript, encode_errors)
{
    EXPECT_TRUE(has_error(
        encode_call("deposit", nlohmann::json{}),
        ConfigError::InvalidSignature));
    EXPECT_TRUE(has_error(
        encode_call("(uint256)", nlohmann::json::array({1})),
        ConfigError::InvalidSignature));
    EXPECT_TRUE(has_error(
        encode_call("f(uint256,)", nlohmann::json::array({1, 2})),
        ConfigError::InvalidSignature));
    EXPECT_TRUE(has_error(
        encode_call("f(string)", nlohmann::json::array({"x"})),
        ConfigError::InvalidSignature));

    EXPECT_TRUE(has_error(
        encode_call("f(uint256)", nlohmann::json{}),
        ConfigError::ArgumentMismatch));
    EXPECT_TRUE(has_error(
        encode_call("f()", nlohmann::json::array({1})),
        ConfigError::ArgumentMismatch));
    EXPECT_TRUE(has_error(
        encode_call("f(uint256)", nlohmann::json::object({{"a", 1}})),
        ConfigError::ArgumentMismatch));
    EXPECT_TRUE(has_error(
        encode_call("f(bool)", nlohmann::json::array({1})),
        ConfigError::ArgumentMismatch));
    EXPECT_TRUE(has_error(
        encode_call("f(address)", nlohmann::json::array({"0x01"})),
        ConfigError::InvalidAddress));
}

TEST(CallScript, timestamps_carry_over)
{
    auto const script = nlohmann::json::parse(R"([
        {"from": "0x000000000000000000000000000000000000000e",
         "call": "proposeIncrement(uint256)", "args": ["5"],
         "timestamp": 1000},
        {"from": "0x00000000000000000000000000000000000a11ce",
         "call": "deposit()", "value": "0x10"},
        {"from": "0x000000000000000000000000000000000000000e",
         "call": "applyIncrement()", "timestamp": 87400}
    ])");

    auto const res = parse_call_script(script);
    ASSERT_FALSE(res.has_error());
    auto const &calls = res.value();
    ASSERT_EQ(calls.size(), 3);

    EXPECT_EQ(calls[0].from, Address{0x0e});
    EXPECT_EQ(calls[0].signature, "proposeIncrement(uint256)");
    EXPECT_EQ(calls[0].input.size(), 36);
    EXPECT_EQ(calls[0].value, 0);
    EXPECT_EQ(calls[0].timestamp, 1000);

    EXPECT_EQ(calls[1].from, Address{0xa11ce});
    EXPECT_EQ(calls[1].value, 16);
    EXPECT_EQ(calls[1].timestamp, 1000);

    EXPECT_EQ(calls[2].timestamp, 87400);
}

TEST(CallScript, malformed_scripts)
{
    EXPECT_TRUE(has_error(
        parse_call_script(nlohmann::json::object()), ConfigError::ParseError));
    EXPECT_TRUE(has_error(
        parse_call_script(nlohmann::json::parse(R"([{"call": "deposit()"}])")),
        ConfigError::MissingField));
    EXPECT_TRUE(has_error(
        parse_call_script(nlohmann::json::parse(
            R"([{"from": "0x000000000000000000000000000000000000000e",
                 "call": "deposit()", "timestamp": -1}])")),
        ConfigError::InvalidNumber));
}

TEST(CallScript, read_from_file)
{
    auto const path =
        std::filesystem::temp_directory_path() / "tiersale_test_calls.json";
    {
        std::ofstream out{path};
        out << R"([{"from": "0x000000000000000000000000000000000000000e",
                    "call": "pause()"}])";
    }
    auto const res = read_call_script(path);
    ASSERT_FALSE(res.has_error());
    ASSERT_EQ(res.value().size(), 1);
    EXPECT_EQ(evmc::hex(res.value()[0].input), "8456cb59");

    std::filesystem::remove(path);
    EXPECT_TRUE(has_error(read_call_script(path), ConfigError::FileNotFound));
}
