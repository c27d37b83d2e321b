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
#include <tiersale/core/fmt/address_fmt.hpp>
#include <tiersale/core/fmt/int_fmt.hpp>
#include <tiersale/core/int.hpp>
#include <tiersale/core/log_level_map.hpp>
#include <tiersale/replay/call_script.hpp>
#include <tiersale/sale/sale_config.hpp>
#include <tiersale/sale/sale_contract.hpp>
#include <tiersale/sale/tier.hpp>
#include <tiersale/sale/tier_fmt.hpp>
#include <tiersale/state/state.hpp>

#include <CLI/CLI.hpp>
#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <intx/intx.hpp>
#include <quill/Quill.h>
#include <quill/bundled/fmt/core.h>
#include <quill/bundled/fmt/format.h>

#include <cstdint>
#include <filesystem>
#include <mutex>

using namespace tiersale;

int main(int argc, char *argv[])
{
    std::filesystem::path config_path;
    std::filesystem::path script_path;
    auto log_level = quill::LogLevel::Info;
    bool list_participants = false;

    CLI::App cli{"tiersale_replay"};
    cli.add_option("--config", config_path, "Sale configuration json")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--calls", script_path, "Json list of calls to replay")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));
    cli.add_flag(
        "--participants",
        list_participants,
        "Print every participant record after the replay");

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    auto const config = read_sale_config(config_path);
    if (config.has_error()) {
        LOG_ERROR(
            "Failed to load {}: {}",
            config_path.string(),
            config.error().message().c_str());
        quill::flush();
        return 1;
    }
    auto const calls = read_call_script(script_path);
    if (calls.has_error()) {
        LOG_ERROR(
            "Failed to load {}: {}",
            script_path.string(),
            calls.error().message().c_str());
        quill::flush();
        return 1;
    }

    State state;
    if (auto const res = initialize_sale(state, config.value());
        res.has_error()) {
        LOG_ERROR(
            "Failed to initialize sale: {}", res.error().message().c_str());
        quill::flush();
        return 1;
    }

    auto const &ca = config.value().contract;
    size_t failures = 0;
    for (auto const &call : calls.value()) {
        SaleContract contract{state, ca, call.timestamp};
        auto const value = intx::be::store<evmc::bytes32>(call.value);
        auto const res = contract.call(call.input, call.from, value);
        if (res.has_error()) {
            ++failures;
            fmt::println(
                "[{}] {} from {} value {}: {}",
                call.timestamp,
                call.signature,
                call.from,
                call.value,
                res.error().message().c_str());
        }
        else {
            fmt::println(
                "[{}] {} from {} value {}: 0x{}",
                call.timestamp,
                call.signature,
                call.from,
                call.value,
                evmc::hex({res.value().data(), res.value().size()}));
        }
    }
    quill::flush();

    std::unique_lock const lock{state.mutex()};
    SaleContract const contract{state, ca, 0};
    auto const &ledger = contract.ledger;
    auto const limits = ledger.schedule();
    fmt::println("");
    fmt::println(
        "calls:           {} ({} failed)", calls.value().size(), failures);
    fmt::println("tier:            {}", ledger.current_tier());
    fmt::println("total collected: {}", ledger.total_collected());
    fmt::println(
        "tier limits:     {} {} {}", limits[0], limits[1], limits[2]);
    fmt::println("participants:    {}", ledger.participant_count());
    auto const &custodian = config.value().custodian;
    fmt::println(
        "custodian:       {} holds {}",
        custodian,
        intx::be::load<uint256_t>(state.get_balance(custodian)));
    fmt::println("events:          {}", state.logs().size());

    if (list_participants) {
        for (uint64_t i = 0; i < ledger.participant_count(); ++i) {
            auto const address = ledger.participant_at(i);
            auto const record = ledger.participant(address);
            fmt::println(
                "  {} total {} [{} {} {}]",
                address,
                record.total,
                record.per_tier[0],
                record.per_tier[1],
                record.per_tier[2]);
        }
    }
    return 0;
}
