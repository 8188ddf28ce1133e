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

#include <tally/core/assert.h>
#include <tally/core/basic_formatter.hpp>
#include <tally/core/config.hpp>
#include <tally/execution/core/fmt/address_fmt.hpp>
#include <tally/execution/trace/call_frame.hpp>

#include <evmc/evmc.hpp>
#include <nlohmann/json.hpp>

#include <string_view>

TALLY_NAMESPACE_BEGIN

constexpr std::string_view call_kind_to_string(CallType const &type)
{
    switch (type) {
    case CallType::CALL:
        return "CALL";
    case CallType::STATICCALL:
        return "STATICCALL";
    default:
        TALLY_ASSERT(false);
    }
}

nlohmann::json to_json(CallFrame const &f)
{
    nlohmann::json res{};
    res["type"] = call_kind_to_string(f.type);
    res["from"] = fmt::format("{}", f.from);
    res["to"] = fmt::format("{}", f.to);
    res["gas"] = fmt::format("0x{:x}", f.gas);
    res["gasUsed"] = fmt::format("0x{:x}", f.gas_used);
    res["input"] = "0x" + evmc::hex(f.input);
    res["output"] = "0x" + evmc::hex(f.output);

    // no error field on success
    if (f.status == EVMC_REVERT) {
        res["error"] = "REVERT";
    }
    else if (f.status == EVMC_OUT_OF_GAS) {
        res["error"] = "OUT_OF_GAS";
    }
    else if (f.status != EVMC_SUCCESS) {
        res["error"] = "ERROR";
    }

    res["depth"] = f.depth; // needed for recursion
    res["calls"] = nlohmann::json::array();

    return res;
}

TALLY_NAMESPACE_END
