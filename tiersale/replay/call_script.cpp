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
#include <tiersale/core/address.hpp>
#include <tiersale/core/byte_string.hpp>
#include <tiersale/core/int.hpp>
#include <tiersale/core/keccak.hpp>
#include <tiersale/core/likely.h>
#include <tiersale/core/result.hpp>
#include <tiersale/replay/call_script.hpp>
#include <tiersale/sale/config_error.hpp>
#include <tiersale/sale/sale_config.hpp>

#include <boost/outcome/try.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>
#include <quill/Quill.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

TIERSALE_ANONYMOUS_NAMESPACE_BEGIN

// Parameter types of a canonical signature such as "f(address,uint256)".
Result<std::vector<std::string_view>>
parameter_types(std::string_view const signature)
{
    auto const open = signature.find('(');
    if (TIERSALE_UNLIKELY(
            open == 0 || open == std::string_view::npos ||
            !signature.ends_with(')'))) {
        return ConfigError::InvalidSignature;
    }

    std::vector<std::string_view> types;
    auto params = signature.substr(open + 1, signature.size() - open - 2);
    while (!params.empty()) {
        auto const comma = params.find(',');
        auto const type = params.substr(0, comma);
        if (TIERSALE_UNLIKELY(type.empty())) {
            return ConfigError::InvalidSignature;
        }
        types.push_back(type);
        if (comma == std::string_view::npos) {
            break;
        }
        params.remove_prefix(comma + 1);
        if (TIERSALE_UNLIKELY(params.empty())) {
            return ConfigError::InvalidSignature;
        }
    }
    return types;
}

Result<bytes32_t>
encode_argument(std::string_view const type, nlohmann::json const &arg)
{
    if (type == "address") {
        BOOST_OUTCOME_TRY(auto const address, address_from_json(arg));
        return abi_encode_address(address);
    }
    if (type == "bool") {
        if (TIERSALE_UNLIKELY(!arg.is_boolean())) {
            return ConfigError::ArgumentMismatch;
        }
        return abi_encode_bool(arg.get<bool>());
    }
    if (type.starts_with("uint")) {
        BOOST_OUTCOME_TRY(auto const value, amount_from_json(arg));
        return abi_encode_uint(value);
    }
    return ConfigError::InvalidSignature;
}

TIERSALE_ANONYMOUS_NAMESPACE_END

TIERSALE_NAMESPACE_BEGIN

Result<byte_string>
encode_call(std::string_view const signature, nlohmann::json const &args)
{
    BOOST_OUTCOME_TRY(auto const types, parameter_types(signature));

    auto const num_args = args.is_null() ? size_t{0} : args.size();
    if (TIERSALE_UNLIKELY(
            (!args.is_null() && !args.is_array()) ||
            num_args != types.size())) {
        return ConfigError::ArgumentMismatch;
    }

    auto const hash = keccak256(to_byte_string_view(signature));
    byte_string input{hash.bytes, 4};
    for (size_t i = 0; i < types.size(); ++i) {
        BOOST_OUTCOME_TRY(
            auto const word, encode_argument(types[i], args.at(i)));
        append_word(input, word);
    }
    return input;
}

Result<std::vector<ScriptedCall>>
parse_call_script(nlohmann::json const &json)
{
    if (TIERSALE_UNLIKELY(!json.is_array())) {
        return ConfigError::ParseError;
    }

    std::vector<ScriptedCall> calls;
    calls.reserve(json.size());
    uint64_t timestamp = 0;
    for (auto const &entry : json) {
        if (TIERSALE_UNLIKELY(
                !entry.is_object() || !entry.contains("from") ||
                !entry.contains("call") || !entry["call"].is_string())) {
            return ConfigError::MissingField;
        }

        ScriptedCall call{};
        BOOST_OUTCOME_TRY(call.from, address_from_json(entry["from"]));
        call.signature = entry["call"].get<std::string>();
        BOOST_OUTCOME_TRY(
            call.input,
            encode_call(
                call.signature,
                entry.contains("args") ? entry["args"] : nlohmann::json{}));
        if (entry.contains("value")) {
            BOOST_OUTCOME_TRY(call.value, amount_from_json(entry["value"]));
        }
        if (entry.contains("timestamp")) {
            if (TIERSALE_UNLIKELY(!entry["timestamp"].is_number_unsigned())) {
                return ConfigError::InvalidNumber;
            }
            timestamp = entry["timestamp"].get<uint64_t>();
        }
        call.timestamp = timestamp;
        calls.push_back(std::move(call));
    }
    return calls;
}

Result<std::vector<ScriptedCall>>
read_call_script(std::filesystem::path const &path)
{
    std::ifstream in{path};
    if (TIERSALE_UNLIKELY(!in)) {
        LOG_ERROR("Cannot open call script {}", path.string());
        return ConfigError::FileNotFound;
    }

    auto const json = nlohmann::json::parse(in, nullptr, false);
    if (TIERSALE_UNLIKELY(json.is_discarded())) {
        LOG_ERROR("Call script {} is not valid json", path.string());
        return ConfigError::ParseError;
    }
    return parse_call_script(json);
}

TIERSALE_NAMESPACE_END
