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

#include <tally/execution/token/dispatcher.hpp>

#include <tally/core/assert.h>
#include <tally/core/byte_string.hpp>
#include <tally/core/likely.h>
#include <tally/execution/core/fmt/address_fmt.hpp>
#include <tally/execution/host/host.hpp>
#include <tally/execution/token/capability.hpp>
#include <tally/execution/token/notification.hpp>

#include <evmc/evmc.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <string_view>

TALLY_TOKEN_NAMESPACE_BEGIN

std::string_view to_string(DispatchOutcome::Kind const kind)
{
    switch (kind) {
    case DispatchOutcome::Kind::Returned:
        return "returned";
    case DispatchOutcome::Kind::HandlerMissing:
        return "handler missing";
    case DispatchOutcome::Kind::HandlerFailed:
        return "handler failed";
    }
    TALLY_ABORT("unknown dispatch outcome");
}

DispatchOutcome dispatch(
    Host &host, Address const &token, int32_t const depth, int64_t const gas,
    NotificationRequest const &request, HandlerSupport const support)
{
    TALLY_ASSERT(support != HandlerSupport::NoCode);

    if (TALLY_UNLIKELY(
            support == HandlerSupport::Undeclared ||
            host.resolve(request.target) == nullptr)) {
        return DispatchOutcome{
            .kind = DispatchOutcome::Kind::HandlerMissing,
            .output = {},
            .status = EVMC_FAILURE,
            .gas_left = gas};
    }

    byte_string const input = encode_notification(request);
    evmc_message const msg{
        .kind = EVMC_CALL,
        .flags = 0,
        .depth = depth + 1,
        .gas = gas,
        .recipient = request.target,
        .sender = token,
        .input_data = input.data(),
        .input_size = input.size(),
        .value = {},
        .create2_salt = {},
        .code_address = request.target,
        .code = nullptr,
        .code_size = 0,
    };

    LOG_DEBUG(
        "dispatching {} notification to {} ({})",
        to_string(request.kind),
        request.target,
        to_string(support));

    auto const result = host.call(msg);
    auto const output = result.output_size == 0
                            ? byte_string{}
                            : byte_string{result.output_data, result.output_size};
    if (result.status_code != EVMC_SUCCESS) {
        return DispatchOutcome{
            .kind = DispatchOutcome::Kind::HandlerFailed,
            .output = output,
            .status = result.status_code,
            .gas_left = result.gas_left};
    }
    return DispatchOutcome{
        .kind = DispatchOutcome::Kind::Returned,
        .output = output,
        .status = result.status_code,
        .gas_left = result.gas_left};
}

TALLY_TOKEN_NAMESPACE_END
