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

#include <tally/execution/genesis/genesis.hpp>

#include <tally/core/basic_formatter.hpp>
#include <tally/core/byte_string.hpp>
#include <tally/core/int.hpp>
#include <tally/core/result.hpp>
#include <tally/execution/core/address.hpp>
#include <tally/execution/core/contract/abi_encode.hpp>
#include <tally/execution/core/contract/abi_signatures.hpp>
#include <tally/execution/core/contract/big_endian.hpp>
#include <tally/execution/core/fmt/address_fmt.hpp>
#include <tally/execution/core/fmt/int_fmt.hpp>
#include <tally/execution/host/host.hpp>
#include <tally/execution/token/constants.hpp>
#include <tally/execution/token/ledger.hpp>
#include <tally/execution/token/receiver_contract.hpp>
#include <tally/execution/token/token_precompile.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <intx/intx.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

TALLY_ANONYMOUS_NAMESPACE_BEGIN

byte_string_view native_code()
{
    return {NATIVE_CODE, sizeof(NATIVE_CODE)};
}

void remember(std::vector<Address> &accounts, Address const &address)
{
    if (std::ranges::find(accounts, address) == accounts.end()) {
        accounts.push_back(address);
    }
}

std::vector<uint32_t> read_interfaces(nlohmann::json const &contract)
{
    if (contract.value("erc165", false)) {
        return token::ReceiverContract::erc165_interfaces();
    }
    std::vector<uint32_t> interfaces;
    if (contract.contains("interfaces")) {
        for (auto const &id : contract["interfaces"]) {
            auto const bytes = parse_bytes(id.get<std::string>());
            if (bytes.size() != sizeof(uint32_t)) {
                throw std::invalid_argument(
                    "interface identifiers are four bytes");
            }
            interfaces.push_back(intx::be::unsafe::load<uint32_t>(bytes.data()));
        }
    }
    return interfaces;
}

void deploy_contract(
    Host &host, Address const &address, nlohmann::json const &contract)
{
    if (contract.contains("behavior")) {
        auto const name = contract["behavior"].get<std::string>();
        auto const behavior = token::parse_receiver_behavior(name);
        if (!behavior.has_value()) {
            throw std::invalid_argument(
                fmt::format("unknown receiver behavior '{}'", name));
        }
        host.deploy(
            address,
            native_code(),
            std::make_unique<token::ReceiverContract>(
                behavior.value(), read_interfaces(contract)));
        return;
    }
    // code with nothing bound to it
    auto const code = parse_bytes(contract.at("code").get<std::string>());
    if (code.empty()) {
        throw std::invalid_argument("contract code must not be empty");
    }
    host.deploy(address, code, nullptr);
}

template <typename T>
void check(Result<T> const &res, std::string_view const what)
{
    if (res.has_error()) {
        throw std::runtime_error(fmt::format(
            "{}: {}", what, std::string_view{res.error().message().c_str()}));
    }
}

uint32_t selector(ScenarioCall const &call)
{
    bool const with_data = call.data.has_value();
    auto const &m = call.method;
    if (m == "totalSupply") {
        return abi_encode_selector("totalSupply()");
    }
    if (m == "balanceOf") {
        return abi_encode_selector("balanceOf(address)");
    }
    if (m == "allowance") {
        return abi_encode_selector("allowance(address,address)");
    }
    if (m == "transfer") {
        return abi_encode_selector("transfer(address,uint256)");
    }
    if (m == "transferFrom") {
        return abi_encode_selector("transferFrom(address,address,uint256)");
    }
    if (m == "approve") {
        return abi_encode_selector("approve(address,uint256)");
    }
    if (m == "transferAndCall") {
        return with_data
                   ? abi_encode_selector(
                         "transferAndCall(address,uint256,bytes)")
                   : abi_encode_selector("transferAndCall(address,uint256)");
    }
    if (m == "transferFromAndCall") {
        return with_data
                   ? abi_encode_selector(
                         "transferFromAndCall(address,address,uint256,bytes)")
                   : abi_encode_selector(
                         "transferFromAndCall(address,address,uint256)");
    }
    if (m == "approveAndCall") {
        return with_data
                   ? abi_encode_selector(
                         "approveAndCall(address,uint256,bytes)")
                   : abi_encode_selector("approveAndCall(address,uint256)");
    }
    if (m == "supportsInterface") {
        return abi_encode_selector("supportsInterface(bytes4)");
    }
    throw std::invalid_argument(fmt::format("unknown method '{}'", m));
}

TALLY_ANONYMOUS_NAMESPACE_END

TALLY_NAMESPACE_BEGIN

Address parse_address(std::string_view const s)
{
    auto const address = evmc::from_hex<Address>(s);
    if (!address.has_value()) {
        throw std::invalid_argument(fmt::format("invalid address '{}'", s));
    }
    return address.value();
}

uint256_t parse_amount(std::string const &s)
{
    // decimal or 0x prefixed hex; throws on anything else
    return intx::from_string<uint256_t>(s);
}

byte_string parse_bytes(std::string_view const s)
{
    auto bytes = evmc::from_hex(s);
    if (!bytes.has_value()) {
        throw std::invalid_argument(fmt::format("invalid hex '{}'", s));
    }
    return std::move(bytes).value();
}

Genesis load_genesis(nlohmann::json const &genesis_json, Host &host)
{
    Genesis genesis;
    genesis.token = genesis_json.contains("token")
                        ? parse_address(genesis_json["token"].get<std::string>())
                        : token::DEFAULT_TOKEN_ADDRESS;
    host.deploy(
        genesis.token,
        native_code(),
        std::make_unique<token::TokenPrecompile>());

    token::Ledger ledger{host.state(), genesis.token};

    if (genesis_json.contains("alloc")) {
        for (auto const &account_info : genesis_json["alloc"].items()) {
            auto const address = parse_address(account_info.key());
            auto const balance = parse_amount(
                account_info.value()["balance"].get<std::string>());
            check(ledger.mint(address, balance), "mint");
            remember(genesis.accounts, address);
        }
    }

    if (genesis_json.contains("allowances")) {
        for (auto const &allowance : genesis_json["allowances"]) {
            auto const owner =
                parse_address(allowance["owner"].get<std::string>());
            auto const spender =
                parse_address(allowance["spender"].get<std::string>());
            auto const amount =
                parse_amount(allowance["amount"].get<std::string>());
            ledger.set_allowance(owner, spender, amount);
            ledger.record_event(
                token::EventKind::Approval, owner, spender, amount);
            genesis.allowances.emplace_back(owner, spender);
            remember(genesis.accounts, owner);
            remember(genesis.accounts, spender);
        }
    }

    if (genesis_json.contains("contracts")) {
        for (auto const &contract : genesis_json["contracts"].items()) {
            auto const address = parse_address(contract.key());
            if (address == genesis.token) {
                throw std::invalid_argument(
                    fmt::format("contract at token address {}", address));
            }
            deploy_contract(host, address, contract.value());
            remember(genesis.accounts, address);
        }
    }

    LOG_INFO(
        "genesis: token at {}, {} accounts, total supply {}",
        genesis.token,
        genesis.accounts.size(),
        ledger.total_supply());
    return genesis;
}

Genesis read_genesis(std::filesystem::path const &genesis_file, Host &host)
{
    std::ifstream ifile(genesis_file.c_str());
    if (!ifile) {
        throw std::runtime_error(
            fmt::format("cannot open genesis file {}", genesis_file.string()));
    }
    auto const genesis_json = nlohmann::json::parse(ifile);
    return load_genesis(genesis_json, host);
}

std::vector<ScenarioCall> load_scenario(nlohmann::json const &scenario_json)
{
    std::vector<ScenarioCall> calls;
    for (auto const &entry : scenario_json) {
        ScenarioCall call{
            .method = entry.at("method").get<std::string>(),
            .sender = parse_address(entry.at("from").get<std::string>()),
            .gas = entry.value("gas", token::DEFAULT_CALLBACK_GAS)};
        if (entry.contains("owner")) {
            call.owner = parse_address(entry["owner"].get<std::string>());
        }
        if (entry.contains("to")) {
            call.to = parse_address(entry["to"].get<std::string>());
        }
        if (entry.contains("amount")) {
            call.amount = parse_amount(entry["amount"].get<std::string>());
        }
        if (entry.contains("data")) {
            call.data = parse_bytes(entry["data"].get<std::string>());
        }
        if (entry.contains("interface")) {
            auto const id = parse_bytes(entry["interface"].get<std::string>());
            if (id.size() != sizeof(uint32_t)) {
                throw std::invalid_argument(
                    "interface identifiers are four bytes");
            }
            call.interface_id = intx::be::unsafe::load<uint32_t>(id.data());
        }
        if (entry.contains("value")) {
            call.value = parse_amount(entry["value"].get<std::string>());
        }
        calls.push_back(std::move(call));
    }
    return calls;
}

std::vector<ScenarioCall>
read_scenario(std::filesystem::path const &scenario_file)
{
    std::ifstream ifile(scenario_file.c_str());
    if (!ifile) {
        throw std::runtime_error(fmt::format(
            "cannot open scenario file {}", scenario_file.string()));
    }
    auto const scenario_json = nlohmann::json::parse(ifile);
    return load_scenario(scenario_json);
}

byte_string encode_call(ScenarioCall const &call)
{
    uint32_t const sig = selector(call);
    auto const &m = call.method;

    AbiEncoder encoder;
    if (m == "balanceOf") {
        encoder.add_address(call.to);
    }
    else if (m == "allowance") {
        encoder.add_address(call.owner);
        encoder.add_address(call.to);
    }
    else if (m == "supportsInterface") {
        encoder.add_bytes4(call.interface_id);
    }
    else if (m != "totalSupply") {
        if (m == "transferFrom" || m == "transferFromAndCall") {
            encoder.add_address(call.owner);
        }
        encoder.add_address(call.to);
        encoder.add_uint(u256_be{call.amount});
        if (call.data.has_value() && m.ends_with("AndCall")) {
            encoder.add_bytes(call.data.value());
        }
    }
    return abi_encode_call(sig, encoder.encode_final());
}

evmc_message make_message(
    ScenarioCall const &call, Address const &token, byte_string const &input)
{
    return evmc_message{
        .kind = EVMC_CALL,
        .flags = 0,
        .depth = 0,
        .gas = call.gas,
        .recipient = token,
        .sender = call.sender,
        .input_data = input.data(),
        .input_size = input.size(),
        .value = intx::be::store<evmc_uint256be>(call.value),
        .create2_salt = {},
        .code_address = token,
    };
}

std::vector<std::pair<Address, Address>> allowance_pairs(
    Genesis const &genesis, std::vector<ScenarioCall> const &calls)
{
    std::vector<std::pair<Address, Address>> pairs = genesis.allowances;
    auto const add = [&pairs](Address const &owner, Address const &spender) {
        if (owner == Address{} || spender == Address{}) {
            return;
        }
        std::pair const pair{owner, spender};
        if (std::ranges::find(pairs, pair) == pairs.end()) {
            pairs.push_back(pair);
        }
    };
    for (auto const &call : calls) {
        if (call.method == "approve" || call.method == "approveAndCall") {
            add(call.sender, call.to);
        }
        else if (
            call.method == "transferFrom" ||
            call.method == "transferFromAndCall") {
            add(call.owner, call.sender);
        }
    }
    return pairs;
}

TALLY_NAMESPACE_END
