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

#include <tally/execution/token/validator.hpp>

#include <tally/core/byte_string.hpp>
#include <tally/execution/core/contract/abi_decode.hpp>
#include <tally/execution/token/dispatcher.hpp>
#include <tally/execution/token/notification.hpp>

#include <cstdint>

TALLY_TOKEN_NAMESPACE_BEGIN

bool is_sentinel(byte_string_view output, uint32_t const expected)
{
    // anything past the first word is ignored
    auto const value = abi_decode_bytes4(output);
    return value.has_value() && value.value() == expected;
}

Acceptance
validate(NotificationKind const kind, DispatchOutcome const &outcome)
{
    if (outcome.kind != DispatchOutcome::Kind::Returned) {
        return Acceptance::Reject;
    }
    return is_sentinel(outcome.output, sentinel(kind)) ? Acceptance::Accept
                                                       : Acceptance::Reject;
}

TALLY_TOKEN_NAMESPACE_END
