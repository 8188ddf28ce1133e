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

#include <tally/core/byte_string.hpp>
#include <tally/core/config.hpp>
#include <tally/core/int.hpp>
#include <tally/execution/core/address.hpp>

#include <evmc/evmc.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

TALLY_NAMESPACE_BEGIN

class Host;

// Code installed at accounts whose behavior is implemented natively.
inline constexpr uint8_t NATIVE_CODE[] = {0xfe};

struct Genesis
{
    Address token{};
    // every account named in the genesis file, without duplicates
    std::vector<Address> accounts{};
    std::vector<std::pair<Address, Address>> allowances{};
};

Address parse_address(std::string_view);

uint256_t parse_amount(std::string const &);

byte_string parse_bytes(std::string_view);

/// Deploys the token and the receiver contracts and applies the initial
/// balances and allowances. Throws on malformed input.
Genesis load_genesis(nlohmann::json const &, Host &);

Genesis read_genesis(std::filesystem::path const &, Host &);

struct ScenarioCall
{
    std::string method{};
    Address sender{};
    Address owner{}; // transferFrom variants and allowance
    Address to{}; // recipient, spender or queried account
    uint256_t amount{};
    std::optional<byte_string> data{}; // selects the overload with bytes
    uint32_t interface_id{};
    uint256_t value{};
    int64_t gas{};
};

std::vector<ScenarioCall> load_scenario(nlohmann::json const &);

std::vector<ScenarioCall> read_scenario(std::filesystem::path const &);

/// ABI encodes the call; throws std::invalid_argument for an unknown method.
byte_string encode_call(ScenarioCall const &);

evmc_message make_message(
    ScenarioCall const &, Address const &token, byte_string const &input);

/// Allowance pairs named by the genesis file followed by the (owner, spender)
/// pairs the calls may have touched, without duplicates.
std::vector<std::pair<Address, Address>>
allowance_pairs(Genesis const &, std::vector<ScenarioCall> const &);

TALLY_NAMESPACE_END
