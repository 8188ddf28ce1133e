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

#include <tally/core/basic_formatter.hpp>
#include <tally/core/byte_string.hpp>
#include <tally/core/config.hpp>
#include <tally/core/int.hpp>
#include <tally/execution/core/address.hpp>
#include <tally/execution/core/fmt/address_fmt.hpp>
#include <tally/execution/core/fmt/bytes_fmt.hpp>
#include <tally/execution/core/log_level_map.hpp>
#include <tally/execution/core/receipt.hpp>
#include <tally/execution/genesis/genesis.hpp>
#include <tally/execution/host/host.hpp>
#include <tally/execution/state/state.hpp>
#include <tally/execution/token/token_contract.hpp>
#include <tally/execution/trace/call_tracer.hpp>

#include <CLI/CLI.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <intx/intx.hpp>

#include <nlohmann/json.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

TALLY_ANONYMOUS_NAMESPACE_BEGIN

std::string_view status_to_string(evmc_status_code const status)
{
    switch (status) {
    case EVMC_SUCCESS:
        return "success";
    case EVMC_REVERT:
        return "revert";
    case EVMC_OUT_OF_GAS:
        return "out of gas";
    case EVMC_CALL_DEPTH_EXCEEDED:
        return "call depth exceeded";
    default:
        return "failure";
    }
}

void remember(std::vector<Address> &accounts, Address const &address)
{
    if (address != Address{} &&
        std::ranges::find(accounts, address) == accounts.end()) {
        accounts.push_back(address);
    }
}

nlohmann::json to_json(Receipt::Log const &log)
{
    nlohmann::json res{};
    res["address"] = fmt::format("{}", log.address);
    res["topics"] = nlohmann::json::array();
    for (auto const &topic : log.topics) {
        res["topics"].push_back(fmt::format("{}", topic));
    }
    res["data"] = "0x" + evmc::hex(log.data);
    return res;
}

nlohmann::json run_call(
    Host &host, Address const &token, ScenarioCall const &call,
    CallTracer *const tracer)
{
    auto const input = encode_call(call);
    if (tracer != nullptr) {
        tracer->reset();
    }

    auto const result = host.call(make_message(call, token, input));
    byte_string const output =
        result.output_size == 0
            ? byte_string{}
            : byte_string{result.output_data, result.output_size};

    nlohmann::json res{};
    res["method"] = call.method;
    res["from"] = fmt::format("{}", call.sender);
    res["status"] = status_to_string(result.status_code);
    res["gasUsed"] = call.gas - result.gas_left;
    res["output"] = "0x" + evmc::hex(output);

    if (result.status_code == EVMC_SUCCESS) {
        LOG_INFO("{} from {}: success", call.method, call.sender);
    }
    else {
        // a reverting token call returns its error message
        std::string const reason{output.begin(), output.end()};
        if (result.status_code == EVMC_REVERT) {
            res["error"] = reason;
        }
        LOG_INFO(
            "{} from {}: {} {}",
            call.method,
            call.sender,
            status_to_string(result.status_code),
            reason);
    }

    if (tracer != nullptr) {
        res["trace"] = tracer->to_json();
    }
    return res;
}

nlohmann::json report_state(
    Host &host, Genesis const &genesis, std::vector<Address> const &accounts,
    std::vector<std::pair<Address, Address>> const &allowances)
{
    token::TokenContract contract{host, genesis.token};

    nlohmann::json res{};
    res["token"] = fmt::format("{}", genesis.token);
    res["totalSupply"] = intx::to_string(contract.total_supply());

    res["balances"] = nlohmann::json::object();
    for (auto const &account : accounts) {
        res["balances"][fmt::format("{}", account)] =
            intx::to_string(contract.balance_of(account));
    }

    res["allowances"] = nlohmann::json::array();
    for (auto const &[owner, spender] : allowances) {
        nlohmann::json allowance{};
        allowance["owner"] = fmt::format("{}", owner);
        allowance["spender"] = fmt::format("{}", spender);
        allowance["amount"] =
            intx::to_string(contract.allowance(owner, spender));
        res["allowances"].push_back(allowance);
    }

    res["logs"] = nlohmann::json::array();
    for (auto const &log : host.state().logs()) {
        res["logs"].push_back(to_json(log));
    }
    return res;
}

TALLY_ANONYMOUS_NAMESPACE_END

using namespace tally;
namespace fs = std::filesystem;

int main(int const argc, char const *argv[])
{
    CLI::App cli{"tally"};
    cli.option_defaults()->always_capture_default();

    fs::path genesis_path;
    fs::path scenario_path;
    fs::path dump_state;
    bool trace_calls = false;
    auto log_level = quill::LogLevel::Info;

    cli.add_option("--genesis", genesis_path, "genesis file")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--scenario", scenario_path, "calls to execute")
        ->check(CLI::ExistingFile);
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));
    cli.add_flag("--trace_calls", trace_calls, "enable call tracing");
    cli.add_option(
        "--dump_state",
        dump_state,
        "file to write the report to instead of stdout");

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    // stdout carries the report
    auto stderr_handler = quill::stderr_handler();
    stderr_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stderr_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    try {
        State state;
        Host host{state};
        CallTracer tracer;
        if (trace_calls) {
            host.set_call_tracer(tracer);
        }

        auto const genesis = read_genesis(genesis_path, host);
        std::vector<ScenarioCall> calls;
        if (!scenario_path.empty()) {
            calls = read_scenario(scenario_path);
        }

        std::vector<Address> accounts = genesis.accounts;
        nlohmann::json results = nlohmann::json::array();
        for (auto const &call : calls) {
            remember(accounts, call.sender);
            remember(accounts, call.owner);
            remember(accounts, call.to);
            results.push_back(run_call(
                host, genesis.token, call, trace_calls ? &tracer : nullptr));
        }

        auto report = report_state(
            host, genesis, accounts, allowance_pairs(genesis, calls));
        report["calls"] = std::move(results);

        if (dump_state.empty()) {
            quill::flush();
            std::cout << report.dump(2) << std::endl;
        }
        else {
            std::ofstream ofile(dump_state);
            if (!ofile) {
                throw std::runtime_error(fmt::format(
                    "cannot open {} for writing", dump_state.string()));
            }
            ofile << report.dump(2) << std::endl;
            LOG_INFO("report written to {}", dump_state.string());
        }
    }
    catch (std::exception const &e) {
        LOG_ERROR("{}", e.what());
        quill::flush();
        return EXIT_FAILURE;
    }

    quill::flush();
    return EXIT_SUCCESS;
}
