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

#include <tally/execution/token/receiver_contract.hpp>

#include <tally/core/assert.h>
#include <tally/core/byte_string.hpp>
#include <tally/core/bytes.hpp>
#include <tally/core/likely.h>
#include <tally/core/result.hpp>
#include <tally/execution/core/address.hpp>
#include <tally/execution/core/contract/abi_decode.hpp>
#include <tally/execution/core/contract/abi_encode.hpp>
#include <tally/execution/core/contract/abi_signatures.hpp>
#include <tally/execution/core/contract/big_endian.hpp>
#include <tally/execution/host/host.hpp>
#include <tally/execution/token/capability.hpp>
#include <tally/execution/token/constants.hpp>
#include <tally/execution/token/notification.hpp>

#include <boost/outcome/try.hpp>

#include <intx/intx.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

TALLY_TOKEN_ANONYMOUS_NAMESPACE_BEGIN

constexpr auto GARBAGE_WORD{
    0xdeadbeefdeadbeefdeadbeefdeadbeefdeadbeefdeadbeefdeadbeefdeadbeef_bytes32};

Result<ReceivedNotification> decode_notification(
    NotificationKind const kind, Address const &token, byte_string_view input)
{
    byte_string_view const args = input;
    Address initiator{};
    if (kind == NotificationKind::Transfer) {
        BOOST_OUTCOME_TRY(auto const op, abi_decode_fixed<Address>(input));
        initiator = op;
    }
    BOOST_OUTCOME_TRY(
        auto const counterparty, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(auto const amount, abi_decode_fixed<u256_be>(input));
    BOOST_OUTCOME_TRY(auto payload, abi_decode_bytes(args, input));
    return ReceivedNotification{
        .kind = kind,
        .token = token,
        .initiator = initiator,
        .counterparty = counterparty,
        .amount = amount.native(),
        .payload = std::move(payload)};
}

evmc::Result return_word(bytes32_t const &word, int64_t const gas_left)
{
    return evmc::Result(
        EVMC_SUCCESS, gas_left, 0, word.bytes, sizeof(word.bytes));
}

TALLY_TOKEN_ANONYMOUS_NAMESPACE_END

TALLY_TOKEN_NAMESPACE_BEGIN

std::optional<ReceiverBehavior>
parse_receiver_behavior(std::string_view const name)
{
    for (auto const behavior :
         {ReceiverBehavior::Accept,
          ReceiverBehavior::WrongSentinel,
          ReceiverBehavior::Zero,
          ReceiverBehavior::Empty,
          ReceiverBehavior::Garbage,
          ReceiverBehavior::Revert,
          ReceiverBehavior::OutOfGas}) {
        if (to_string(behavior) == name) {
            return behavior;
        }
    }
    return std::nullopt;
}

std::string_view to_string(ReceiverBehavior const behavior)
{
    switch (behavior) {
    case ReceiverBehavior::Accept:
        return "accept";
    case ReceiverBehavior::WrongSentinel:
        return "wrong_sentinel";
    case ReceiverBehavior::Zero:
        return "zero";
    case ReceiverBehavior::Empty:
        return "empty";
    case ReceiverBehavior::Garbage:
        return "garbage";
    case ReceiverBehavior::Revert:
        return "revert";
    case ReceiverBehavior::OutOfGas:
        return "out_of_gas";
    }
    TALLY_ABORT("unknown receiver behavior");
}

ReceiverContract::ReceiverContract(
    ReceiverBehavior const behavior, std::vector<uint32_t> interfaces)
    : behavior_{behavior}
    , interfaces_{std::move(interfaces)}
{
}

std::vector<uint32_t> ReceiverContract::erc165_interfaces()
{
    return {ERC165_INTERFACE_ID, RECEIVER_INTERFACE_ID, SPENDER_INTERFACE_ID};
}

void ReceiverContract::set_behavior(ReceiverBehavior const behavior)
{
    behavior_ = behavior;
}

std::optional<ReceivedNotification> const &ReceiverContract::last() const
{
    return last_;
}

size_t ReceiverContract::received() const
{
    return received_;
}

std::span<uint32_t const> ReceiverContract::declared_interfaces() const
{
    return interfaces_;
}

evmc::Result ReceiverContract::execute(Host &, evmc_message const &msg)
{
    byte_string_view input{msg.input_data, msg.input_size};
    if (TALLY_UNLIKELY(input.size() < 4)) {
        return evmc::Result{EVMC_REVERT, msg.gas};
    }
    auto const selector =
        intx::be::unsafe::load<uint32_t>(input.substr(0, 4).data());
    input.remove_prefix(4);

    if (selector == ERC165_INTERFACE_ID) {
        auto const id = abi_decode_bytes4(input);
        if (TALLY_UNLIKELY(id.has_error())) {
            return evmc::Result{EVMC_REVERT, msg.gas};
        }
        bool const supported =
            InterfaceDeclaration{interfaces_}.supports_interface(id.value());
        return return_word(abi_encode_bool(supported), msg.gas);
    }

    NotificationKind kind;
    if (selector == TRANSFER_RECEIVED_SENTINEL) {
        kind = NotificationKind::Transfer;
    }
    else if (selector == APPROVAL_RECEIVED_SENTINEL) {
        kind = NotificationKind::Approval;
    }
    else {
        return evmc::Result{EVMC_REVERT, msg.gas};
    }

    auto notification = decode_notification(kind, msg.sender, input);
    if (TALLY_UNLIKELY(notification.has_error())) {
        return evmc::Result{EVMC_REVERT, msg.gas};
    }
    last_ = std::move(notification).value();
    ++received_;

    switch (behavior_) {
    case ReceiverBehavior::Accept:
        return return_word(abi_encode_bytes4(sentinel(kind)), msg.gas);
    case ReceiverBehavior::WrongSentinel: {
        auto const other = kind == NotificationKind::Transfer
                               ? NotificationKind::Approval
                               : NotificationKind::Transfer;
        return return_word(abi_encode_bytes4(sentinel(other)), msg.gas);
    }
    case ReceiverBehavior::Zero:
        return return_word(bytes32_t{}, msg.gas);
    case ReceiverBehavior::Empty:
        return evmc::Result{EVMC_SUCCESS, msg.gas};
    case ReceiverBehavior::Garbage:
        return return_word(GARBAGE_WORD, msg.gas);
    case ReceiverBehavior::Revert:
        return evmc::Result{EVMC_REVERT, msg.gas};
    case ReceiverBehavior::OutOfGas:
        return evmc::Result{EVMC_OUT_OF_GAS};
    }
    TALLY_ABORT("unknown receiver behavior");
}

TALLY_TOKEN_NAMESPACE_END
