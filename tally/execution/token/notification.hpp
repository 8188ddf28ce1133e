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
#include <tally/core/int.hpp>
#include <tally/execution/core/address.hpp>
#include <tally/execution/token/config.hpp>

#include <cstdint>
#include <string_view>

TALLY_TOKEN_NAMESPACE_BEGIN

enum class NotificationKind
{
    Transfer,
    Approval,
};

/// Everything a counterparty handler is told about the operation that
/// triggered it. Built right before dispatch and never stored.
struct NotificationRequest
{
    NotificationKind kind;
    Address initiator; // operator
    Address counterparty; // from / owner
    Address target; // recipient / spender
    uint256_t amount;
    byte_string payload;
};

uint32_t sentinel(NotificationKind);

uint32_t handler_interface(NotificationKind);

std::string_view to_string(NotificationKind);

// onTransferReceived(operator, from, amount, payload) or
// onApprovalReceived(owner, amount, payload)
byte_string encode_notification(NotificationRequest const &);

TALLY_TOKEN_NAMESPACE_END
