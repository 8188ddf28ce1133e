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

#include <tally/execution/token/notification.hpp>

#include <tally/core/assert.h>
#include <tally/core/byte_string.hpp>
#include <tally/execution/core/contract/abi_encode.hpp>
#include <tally/execution/core/contract/big_endian.hpp>
#include <tally/execution/token/constants.hpp>

#include <cstdint>
#include <string_view>

TALLY_TOKEN_NAMESPACE_BEGIN

uint32_t sentinel(NotificationKind const kind)
{
    switch (kind) {
    case NotificationKind::Transfer:
        return TRANSFER_RECEIVED_SENTINEL;
    case NotificationKind::Approval:
        return APPROVAL_RECEIVED_SENTINEL;
    }
    TALLY_ABORT("unknown notification kind");
}

uint32_t handler_interface(NotificationKind const kind)
{
    switch (kind) {
    case NotificationKind::Transfer:
        return RECEIVER_INTERFACE_ID;
    case NotificationKind::Approval:
        return SPENDER_INTERFACE_ID;
    }
    TALLY_ABORT("unknown notification kind");
}

std::string_view to_string(NotificationKind const kind)
{
    switch (kind) {
    case NotificationKind::Transfer:
        return "transfer";
    case NotificationKind::Approval:
        return "approval";
    }
    TALLY_ABORT("unknown notification kind");
}

byte_string encode_notification(NotificationRequest const &request)
{
    AbiEncoder encoder;
    if (request.kind == NotificationKind::Transfer) {
        encoder.add_address(request.initiator);
    }
    encoder.add_address(request.counterparty);
    encoder.add_uint(u256_be{request.amount});
    encoder.add_bytes(request.payload);
    // the handler selector doubles as the sentinel
    return abi_encode_call(sentinel(request.kind), encoder.encode_final());
}

TALLY_TOKEN_NAMESPACE_END
