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
#include <tally/execution/token/config.hpp>
#include <tally/execution/token/dispatcher.hpp>
#include <tally/execution/token/notification.hpp>

TALLY_TOKEN_NAMESPACE_BEGIN

enum class Acceptance
{
    Accept,
    Reject,
};

// true iff `output` is an ABI bytes4 word holding exactly `expected`
bool is_sentinel(byte_string_view output, uint32_t expected);

Acceptance validate(NotificationKind, DispatchOutcome const &);

TALLY_TOKEN_NAMESPACE_END
