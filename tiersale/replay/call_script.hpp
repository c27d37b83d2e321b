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
#include <tiersale/core/byte_string.hpp>
#include <tiersale/core/config.hpp>
#include <tiersale/core/int.hpp>
#include <tiersale/core/result.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

TIERSALE_NAMESPACE_BEGIN

// One call of a replay script:
//
//   {"from": "0x..", "call": "deposit()", "value": "5", "timestamp": 10}
//   {"from": "0x..", "call": "updateTierLimit(uint8,uint256)",
//    "args": [2, "120"]}
//
// value and timestamp are optional. A missing timestamp repeats the one of
// the previous call.
struct ScriptedCall
{
    Address from{};
    std::string signature{};
    byte_string input{};
    uint256_t value{0};
    uint64_t timestamp{0};
};

// Selector followed by one abi word per argument. Supports the static types
// address, bool and uintN.
Result<byte_string>
encode_call(std::string_view signature, nlohmann::json const &args);

Result<std::vector<ScriptedCall>> parse_call_script(nlohmann::json const &);
Result<std::vector<ScriptedCall>>
read_call_script(std::filesystem::path const &);

TIERSALE_NAMESPACE_END
