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
#include <tally/execution/core/address.hpp>
#include <tally/execution/token/capability.hpp>
#include <tally/execution/token/config.hpp>
#include <tally/execution/token/notification.hpp>

#include <evmc/evmc.h>

#include <cstdint>
#include <string_view>

TALLY_NAMESPACE_BEGIN

class Host;

TALLY_NAMESPACE_END

TALLY_TOKEN_NAMESPACE_BEGIN

struct DispatchOutcome
{
    enum class Kind
    {
        Returned, // the handler completed; `output` is untouched
        HandlerMissing, // nothing to invoke
        HandlerFailed, // the handler aborted
    };

    Kind kind;
    byte_string output{};
    evmc_status_code status{EVMC_SUCCESS};
    int64_t gas_left{0};
};

std::string_view to_string(DispatchOutcome::Kind);

/// Sends `request` to its target as a nested call from `token`, at call
/// depth `depth` and with `gas` to spend.
DispatchOutcome dispatch(
    Host &, Address const &token, int32_t depth, int64_t gas,
    NotificationRequest const &, HandlerSupport);

TALLY_TOKEN_NAMESPACE_END
