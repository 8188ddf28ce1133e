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

#include <tally/execution/token/token_precompile.hpp>

#include <tally/core/byte_string.hpp>
#include <tally/core/likely.h>
#include <tally/execution/host/host.hpp>
#include <tally/execution/token/token_contract.hpp>

#include <evmc/evmc.hpp>

#include <cstdint>
#include <span>
#include <utility>

TALLY_TOKEN_NAMESPACE_BEGIN

evmc::Result TokenPrecompile::execute(Host &host, evmc_message const &msg)
{
    byte_string_view input{msg.input_data, msg.input_size};
    auto const [method, cost] = TokenContract::precompile_dispatch(input);
    if (TALLY_UNLIKELY(std::cmp_less(msg.gas, cost))) {
        return evmc::Result{evmc_status_code::EVMC_OUT_OF_GAS};
    }

    TokenContract contract(
        host, msg.recipient, msg.depth, msg.gas - static_cast<int64_t>(cost));
    auto const res = (contract.*method)(input, msg.sender, msg.value);
    if (TALLY_LIKELY(res.has_value())) {
        return evmc::Result(
            EVMC_SUCCESS,
            contract.gas_left(),
            0 /* gas refund */,
            res.value().data(),
            res.value().size());
    }
    auto const message = res.error().message();
    return evmc::Result(
        EVMC_REVERT,
        contract.gas_left(),
        0 /* gas refund */,
        reinterpret_cast<uint8_t const *>(message.data()),
        message.size());
}

std::span<uint32_t const> TokenPrecompile::declared_interfaces() const
{
    return TokenContract::declared_interfaces();
}

TALLY_TOKEN_NAMESPACE_END
