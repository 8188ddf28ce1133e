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
#include <tally/execution/core/address.hpp>

#include <evmc/evmc.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>

TALLY_NAMESPACE_BEGIN

enum class CallType
{
    CALL = 0,
    STATICCALL,
};

struct CallFrame
{
    CallType type{};
    Address from{};
    Address to{};
    uint64_t gas{};
    uint64_t gas_used{};
    byte_string input{};
    byte_string output{};
    evmc_status_code status{};
    uint64_t depth{};

    friend bool operator==(CallFrame const &, CallFrame const &) = default;
};

nlohmann::json to_json(CallFrame const &);

TALLY_NAMESPACE_END
