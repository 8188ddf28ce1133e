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

#include <tally/execution/token/token_contract.hpp>

#include <tally/core/byte_string.hpp>
#include <tally/core/int.hpp>
#include <tally/core/likely.h>
#include <tally/execution/core/address.hpp>
#include <tally/execution/core/contract/abi_decode.hpp>
#include <tally/execution/core/contract/abi_encode.hpp>
#include <tally/execution/core/contract/abi_signatures.hpp>
#include <tally/execution/core/contract/big_endian.hpp>
#include <tally/execution/core/fmt/address_fmt.hpp>
#include <tally/execution/core/fmt/int_fmt.hpp>
#include <tally/execution/host/host.hpp>
#include <tally/execution/state/state.hpp>
#include <tally/execution/token/capability.hpp>
#include <tally/execution/token/constants.hpp>
#include <tally/execution/token/dispatcher.hpp>
#include <tally/execution/token/ledger.hpp>
#include <tally/execution/token/notification.hpp>
#include <tally/execution/token/token_error.hpp>
#include <tally/execution/token/validator.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <intx/intx.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <span>
#include <utility>

TALLY_TOKEN_ANONYMOUS_NAMESPACE_BEGIN

////////////////////////
// Function Selectors //
////////////////////////

struct PrecompileSelector
{
    static constexpr uint32_t TOTAL_SUPPLY =
        abi_encode_selector("totalSupply()");
    static constexpr uint32_t BALANCE_OF =
        abi_encode_selector("balanceOf(address)");
    static constexpr uint32_t ALLOWANCE =
        abi_encode_selector("allowance(address,address)");
    static constexpr uint32_t TRANSFER =
        abi_encode_selector("transfer(address,uint256)");
    static constexpr uint32_t TRANSFER_FROM =
        abi_encode_selector("transferFrom(address,address,uint256)");
    static constexpr uint32_t APPROVE =
        abi_encode_selector("approve(address,uint256)");
    static constexpr uint32_t TRANSFER_AND_CALL =
        abi_encode_selector("transferAndCall(address,uint256)");
    static constexpr uint32_t TRANSFER_AND_CALL_WITH_DATA =
        abi_encode_selector("transferAndCall(address,uint256,bytes)");
    static constexpr uint32_t TRANSFER_FROM_AND_CALL =
        abi_encode_selector("transferFromAndCall(address,address,uint256)");
    static constexpr uint32_t TRANSFER_FROM_AND_CALL_WITH_DATA =
        abi_encode_selector(
            "transferFromAndCall(address,address,uint256,bytes)");
    static constexpr uint32_t APPROVE_AND_CALL =
        abi_encode_selector("approveAndCall(address,uint256)");
    static constexpr uint32_t APPROVE_AND_CALL_WITH_DATA =
        abi_encode_selector("approveAndCall(address,uint256,bytes)");
    static constexpr uint32_t SUPPORTS_INTERFACE =
        abi_encode_selector("supportsInterface(bytes4)");
};

static_assert(PrecompileSelector::TOTAL_SUPPLY == 0x18160ddd);
static_assert(PrecompileSelector::BALANCE_OF == 0x70a08231);
static_assert(PrecompileSelector::ALLOWANCE == 0xdd62ed3e);
static_assert(PrecompileSelector::TRANSFER == 0xa9059cbb);
static_assert(PrecompileSelector::TRANSFER_FROM == 0x23b872dd);
static_assert(PrecompileSelector::APPROVE == 0x095ea7b3);
static_assert(PrecompileSelector::TRANSFER_AND_CALL == 0x1296ee62);
static_assert(PrecompileSelector::TRANSFER_AND_CALL_WITH_DATA == 0x4000aea0);
static_assert(PrecompileSelector::TRANSFER_FROM_AND_CALL == 0xd8fbe994);
static_assert(
    PrecompileSelector::TRANSFER_FROM_AND_CALL_WITH_DATA == 0xc1d34b89);
static_assert(PrecompileSelector::APPROVE_AND_CALL == 0x3177029f);
static_assert(PrecompileSelector::APPROVE_AND_CALL_WITH_DATA == 0xcae9ca51);
static_assert(PrecompileSelector::SUPPORTS_INTERFACE == 0x01ffc9a7);

///////////////
// Gas Costs //
///////////////

// Each method is charged for the storage it touches and the events it
// emits, counted as
//
// operations = [
//   number_of_warm_sloads,
//   number_of_cold_sloads,
//   number_of_warm_sstores,
//   number_of_cold_sstores,
//   number_of_events,
//   ]
//
// The notify variants cost the same as their plain counterparts; the gas
// left after the fixed cost is what the callback runs on.

constexpr uint64_t WARM_SLOAD = 100;
constexpr uint64_t COLD_SLOAD = 8100;
constexpr uint64_t WARM_SSTORE = 2900;
constexpr uint64_t COLD_SSTORE = 2900 + 8000;
constexpr uint64_t EVENT_COSTS = 4275;

struct OpCount
{
    uint64_t warm_sloads;
    uint64_t cold_sloads;
    uint64_t warm_sstores;
    uint64_t cold_sstores;
    uint64_t events;
};

constexpr uint64_t compute_costs(OpCount const &ops)
{
    return WARM_SLOAD * ops.warm_sloads + COLD_SLOAD * ops.cold_sloads +
           WARM_SSTORE * ops.warm_sstores + COLD_SSTORE * ops.cold_sstores +
           EVENT_COSTS * ops.events;
}

constexpr uint64_t READ_OP_COST = compute_costs(OpCount{
    .warm_sloads = 0,
    .cold_sloads = 1,
    .warm_sstores = 0,
    .cold_sstores = 0,
    .events = 0,
});

constexpr uint64_t TRANSFER_OP_COST = compute_costs(OpCount{
    .warm_sloads = 0,
    .cold_sloads = 2,
    .warm_sstores = 1,
    .cold_sstores = 1,
    .events = 1,
});

constexpr uint64_t TRANSFER_FROM_OP_COST = compute_costs(OpCount{
    .warm_sloads = 0,
    .cold_sloads = 3,
    .warm_sstores = 2,
    .cold_sstores = 1,
    .events = 1,
});

constexpr uint64_t APPROVE_OP_COST = compute_costs(OpCount{
    .warm_sloads = 0,
    .cold_sloads = 0,
    .warm_sstores = 0,
    .cold_sstores = 1,
    .events = 1,
});

constexpr uint64_t SUPPORTS_INTERFACE_OP_COST = compute_costs(OpCount{
    .warm_sloads = 1,
    .cold_sloads = 0,
    .warm_sstores = 0,
    .cold_sstores = 0,
    .events = 0,
});

constexpr uint64_t FALLBACK_COST = 40000;

static_assert(READ_OP_COST == 8100);
static_assert(TRANSFER_OP_COST == 34275);
static_assert(TRANSFER_FROM_OP_COST == 45275);
static_assert(APPROVE_OP_COST == 15175);
static_assert(SUPPORTS_INTERFACE_OP_COST == 100);

constexpr std::array<uint32_t, 3> INTERFACES{
    ERC165_INTERFACE_ID, ERC20_INTERFACE_ID, ERC1363_INTERFACE_ID};

Result<void> function_not_payable(evmc_uint256be const &value)
{
    bool const all_zero = std::all_of(
        value.bytes,
        value.bytes + sizeof(evmc_uint256be),
        [](uint8_t const byte) { return byte == 0; });

    if (TALLY_UNLIKELY(!all_zero)) {
        return TokenError::ValueNonZero;
    }
    return outcome::success();
}

TALLY_TOKEN_ANONYMOUS_NAMESPACE_END

TALLY_TOKEN_NAMESPACE_BEGIN

TokenContract::TokenContract(
    Host &host, Address const &address, int32_t const depth,
    int64_t const gas)
    : host_{host}
    , address_{address}
    , depth_{depth}
    , gas_{gas}
    , ledger_{host.state(), address}
{
}

Address const &TokenContract::address() const
{
    return address_;
}

int64_t TokenContract::gas_left() const
{
    return gas_;
}

Ledger &TokenContract::ledger()
{
    return ledger_;
}

uint256_t TokenContract::total_supply()
{
    return ledger_.total_supply();
}

uint256_t TokenContract::balance_of(Address const &account)
{
    return ledger_.balance_of(account);
}

uint256_t
TokenContract::allowance(Address const &owner, Address const &spender)
{
    return ledger_.get_allowance(owner, spender);
}

std::span<uint32_t const> TokenContract::declared_interfaces()
{
    return INTERFACES;
}

bool TokenContract::supports_interface(uint32_t const id)
{
    return InterfaceDeclaration{INTERFACES}.supports_interface(id);
}

template <typename F>
Result<void> TokenContract::with_checkpoint(F &&f)
{
    auto &state = host_.state();
    state.push();
    auto res = std::forward<F>(f)();
    if (TALLY_LIKELY(res.has_value())) {
        state.pop_accept();
    }
    else {
        state.pop_reject();
    }
    return res;
}

Result<void> TokenContract::move_tokens(
    Address const &from, Address const &to, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(ledger_.debit(from, amount));
    BOOST_OUTCOME_TRY(ledger_.credit(to, amount));
    ledger_.record_event(EventKind::Transfer, from, to, amount);
    return outcome::success();
}

Result<void> TokenContract::check_transfer(
    Address const &from, Address const &to, uint256_t const &amount)
{
    if (TALLY_UNLIKELY(to == Address{})) {
        return TokenError::InvalidTarget;
    }
    if (TALLY_UNLIKELY(from == Address{})) {
        return TokenError::InvalidSender;
    }
    if (TALLY_UNLIKELY(ledger_.balance_of(from) < amount)) {
        return TokenError::InsufficientBalance;
    }
    return outcome::success();
}

Result<void> TokenContract::check_transfer_from(
    Address const &caller, Address const &from, Address const &to,
    uint256_t const &amount)
{
    if (TALLY_UNLIKELY(to == Address{})) {
        return TokenError::InvalidTarget;
    }
    if (TALLY_UNLIKELY(caller == Address{} || from == Address{})) {
        return TokenError::InvalidSender;
    }
    if (TALLY_UNLIKELY(ledger_.get_allowance(from, caller) < amount)) {
        return TokenError::InsufficientAllowance;
    }
    if (TALLY_UNLIKELY(ledger_.balance_of(from) < amount)) {
        return TokenError::InsufficientBalance;
    }
    return outcome::success();
}

Result<void> TokenContract::notify(NotificationRequest const &request)
{
    auto const support = probe_handler(host_, request.target, request.kind);
    if (support == HandlerSupport::NoCode) {
        LOG_DEBUG(
            "{} has no code, skipping {} notification",
            request.target,
            to_string(request.kind));
        return outcome::success();
    }

    auto const dispatched =
        dispatch(host_, address_, depth_, gas_, request, support);
    gas_ = dispatched.gas_left;

    if (validate(request.kind, dispatched) == Acceptance::Reject) {
        LOG_INFO(
            "{} rejected {} notification of {} from {}: {}",
            request.target,
            to_string(request.kind),
            request.amount,
            request.counterparty,
            to_string(dispatched.kind));
        return TokenError::CallbackRejected;
    }

    LOG_DEBUG(
        "{} accepted {} notification of {}",
        request.target,
        to_string(request.kind),
        request.amount);
    return outcome::success();
}

Result<void> TokenContract::transfer(
    Address const &caller, Address const &to, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(check_transfer(caller, to, amount));
    return with_checkpoint(
        [&]() -> Result<void> { return move_tokens(caller, to, amount); });
}

Result<void> TokenContract::transfer_from(
    Address const &caller, Address const &from, Address const &to,
    uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(check_transfer_from(caller, from, to, amount));
    return with_checkpoint([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(ledger_.spend_allowance(from, caller, amount));
        return move_tokens(from, to, amount);
    });
}

Result<void> TokenContract::approve(
    Address const &caller, Address const &spender, uint256_t const &amount)
{
    if (TALLY_UNLIKELY(spender == Address{})) {
        return TokenError::InvalidTarget;
    }
    if (TALLY_UNLIKELY(caller == Address{})) {
        return TokenError::InvalidSender;
    }
    return with_checkpoint([&]() -> Result<void> {
        ledger_.set_allowance(caller, spender, amount);
        ledger_.record_event(EventKind::Approval, caller, spender, amount);
        return outcome::success();
    });
}

Result<void> TokenContract::transfer_and_call(
    Address const &caller, Address const &to, uint256_t const &amount,
    byte_string_view const data)
{
    BOOST_OUTCOME_TRY(check_transfer(caller, to, amount));
    return with_checkpoint([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(move_tokens(caller, to, amount));
        return notify(NotificationRequest{
            .kind = NotificationKind::Transfer,
            .initiator = caller,
            .counterparty = caller,
            .target = to,
            .amount = amount,
            .payload = byte_string{data}});
    });
}

Result<void> TokenContract::transfer_from_and_call(
    Address const &caller, Address const &from, Address const &to,
    uint256_t const &amount, byte_string_view const data)
{
    BOOST_OUTCOME_TRY(check_transfer_from(caller, from, to, amount));
    return with_checkpoint([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(ledger_.spend_allowance(from, caller, amount));
        BOOST_OUTCOME_TRY(move_tokens(from, to, amount));
        return notify(NotificationRequest{
            .kind = NotificationKind::Transfer,
            .initiator = caller,
            .counterparty = from,
            .target = to,
            .amount = amount,
            .payload = byte_string{data}});
    });
}

Result<void> TokenContract::approve_and_call(
    Address const &caller, Address const &spender, uint256_t const &amount,
    byte_string_view const data)
{
    if (TALLY_UNLIKELY(spender == Address{})) {
        return TokenError::InvalidTarget;
    }
    if (TALLY_UNLIKELY(caller == Address{})) {
        return TokenError::InvalidSender;
    }
    return with_checkpoint([&]() -> Result<void> {
        ledger_.set_allowance(caller, spender, amount);
        ledger_.record_event(EventKind::Approval, caller, spender, amount);
        return notify(NotificationRequest{
            .kind = NotificationKind::Approval,
            .initiator = caller,
            .counterparty = caller,
            .target = spender,
            .amount = amount,
            .payload = byte_string{data}});
    });
}

std::pair<TokenContract::PrecompileFunc, uint64_t>
TokenContract::precompile_dispatch(byte_string_view &input)
{
    if (TALLY_UNLIKELY(input.size() < 4)) {
        return {&TokenContract::precompile_fallback, FALLBACK_COST};
    }

    auto const signature =
        intx::be::unsafe::load<uint32_t>(input.substr(0, 4).data());
    input.remove_prefix(4);

    switch (signature) {
    case PrecompileSelector::TOTAL_SUPPLY:
        return {&TokenContract::precompile_total_supply, READ_OP_COST};
    case PrecompileSelector::BALANCE_OF:
        return {&TokenContract::precompile_balance_of, READ_OP_COST};
    case PrecompileSelector::ALLOWANCE:
        return {&TokenContract::precompile_allowance, READ_OP_COST};
    case PrecompileSelector::TRANSFER:
        return {&TokenContract::precompile_transfer, TRANSFER_OP_COST};
    case PrecompileSelector::TRANSFER_FROM:
        return {
            &TokenContract::precompile_transfer_from, TRANSFER_FROM_OP_COST};
    case PrecompileSelector::APPROVE:
        return {&TokenContract::precompile_approve, APPROVE_OP_COST};
    case PrecompileSelector::TRANSFER_AND_CALL:
        return {
            &TokenContract::precompile_transfer_and_call, TRANSFER_OP_COST};
    case PrecompileSelector::TRANSFER_AND_CALL_WITH_DATA:
        return {
            &TokenContract::precompile_transfer_and_call_with_data,
            TRANSFER_OP_COST};
    case PrecompileSelector::TRANSFER_FROM_AND_CALL:
        return {
            &TokenContract::precompile_transfer_from_and_call,
            TRANSFER_FROM_OP_COST};
    case PrecompileSelector::TRANSFER_FROM_AND_CALL_WITH_DATA:
        return {
            &TokenContract::precompile_transfer_from_and_call_with_data,
            TRANSFER_FROM_OP_COST};
    case PrecompileSelector::APPROVE_AND_CALL:
        return {&TokenContract::precompile_approve_and_call, APPROVE_OP_COST};
    case PrecompileSelector::APPROVE_AND_CALL_WITH_DATA:
        return {
            &TokenContract::precompile_approve_and_call_with_data,
            APPROVE_OP_COST};
    case PrecompileSelector::SUPPORTS_INTERFACE:
        return {
            &TokenContract::precompile_supports_interface,
            SUPPORTS_INTERFACE_OP_COST};
    default:
        return {&TokenContract::precompile_fallback, FALLBACK_COST};
    }
}

Result<byte_string> TokenContract::precompile_total_supply(
    byte_string_view const input, evmc_address const &,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    if (TALLY_UNLIKELY(!input.empty())) {
        return TokenError::InvalidInput;
    }
    return byte_string{abi_encode_uint(u256_be{total_supply()})};
}

Result<byte_string> TokenContract::precompile_balance_of(
    byte_string_view input, evmc_address const &,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    BOOST_OUTCOME_TRY(auto const account, abi_decode_fixed<Address>(input));
    if (TALLY_UNLIKELY(!input.empty())) {
        return TokenError::InvalidInput;
    }
    return byte_string{abi_encode_uint(u256_be{balance_of(account)})};
}

Result<byte_string> TokenContract::precompile_allowance(
    byte_string_view input, evmc_address const &,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    BOOST_OUTCOME_TRY(auto const owner, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(auto const spender, abi_decode_fixed<Address>(input));
    if (TALLY_UNLIKELY(!input.empty())) {
        return TokenError::InvalidInput;
    }
    return byte_string{abi_encode_uint(u256_be{allowance(owner, spender)})};
}

Result<byte_string> TokenContract::precompile_transfer(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    BOOST_OUTCOME_TRY(auto const to, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(auto const amount, abi_decode_fixed<u256_be>(input));
    if (TALLY_UNLIKELY(!input.empty())) {
        return TokenError::InvalidInput;
    }
    BOOST_OUTCOME_TRY(transfer(msg_sender, to, amount.native()));
    return byte_string{abi_encode_bool(true)};
}

Result<byte_string> TokenContract::precompile_transfer_from(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    BOOST_OUTCOME_TRY(auto const from, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(auto const to, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(auto const amount, abi_decode_fixed<u256_be>(input));
    if (TALLY_UNLIKELY(!input.empty())) {
        return TokenError::InvalidInput;
    }
    BOOST_OUTCOME_TRY(transfer_from(msg_sender, from, to, amount.native()));
    return byte_string{abi_encode_bool(true)};
}

Result<byte_string> TokenContract::precompile_approve(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    BOOST_OUTCOME_TRY(auto const spender, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(auto const amount, abi_decode_fixed<u256_be>(input));
    if (TALLY_UNLIKELY(!input.empty())) {
        return TokenError::InvalidInput;
    }
    BOOST_OUTCOME_TRY(approve(msg_sender, spender, amount.native()));
    return byte_string{abi_encode_bool(true)};
}

Result<byte_string> TokenContract::precompile_transfer_and_call(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    BOOST_OUTCOME_TRY(auto const to, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(auto const amount, abi_decode_fixed<u256_be>(input));
    if (TALLY_UNLIKELY(!input.empty())) {
        return TokenError::InvalidInput;
    }
    BOOST_OUTCOME_TRY(transfer_and_call(msg_sender, to, amount.native()));
    return byte_string{abi_encode_bool(true)};
}

Result<byte_string> TokenContract::precompile_transfer_and_call_with_data(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    byte_string_view const args = input;
    BOOST_OUTCOME_TRY(auto const to, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(auto const amount, abi_decode_fixed<u256_be>(input));
    BOOST_OUTCOME_TRY(auto const data, abi_decode_bytes(args, input));
    BOOST_OUTCOME_TRY(
        transfer_and_call(msg_sender, to, amount.native(), data));
    return byte_string{abi_encode_bool(true)};
}

Result<byte_string> TokenContract::precompile_transfer_from_and_call(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    BOOST_OUTCOME_TRY(auto const from, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(auto const to, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(auto const amount, abi_decode_fixed<u256_be>(input));
    if (TALLY_UNLIKELY(!input.empty())) {
        return TokenError::InvalidInput;
    }
    BOOST_OUTCOME_TRY(
        transfer_from_and_call(msg_sender, from, to, amount.native()));
    return byte_string{abi_encode_bool(true)};
}

Result<byte_string>
TokenContract::precompile_transfer_from_and_call_with_data(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    byte_string_view const args = input;
    BOOST_OUTCOME_TRY(auto const from, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(auto const to, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(auto const amount, abi_decode_fixed<u256_be>(input));
    BOOST_OUTCOME_TRY(auto const data, abi_decode_bytes(args, input));
    BOOST_OUTCOME_TRY(
        transfer_from_and_call(msg_sender, from, to, amount.native(), data));
    return byte_string{abi_encode_bool(true)};
}

Result<byte_string> TokenContract::precompile_approve_and_call(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    BOOST_OUTCOME_TRY(auto const spender, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(auto const amount, abi_decode_fixed<u256_be>(input));
    if (TALLY_UNLIKELY(!input.empty())) {
        return TokenError::InvalidInput;
    }
    BOOST_OUTCOME_TRY(approve_and_call(msg_sender, spender, amount.native()));
    return byte_string{abi_encode_bool(true)};
}

Result<byte_string> TokenContract::precompile_approve_and_call_with_data(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    byte_string_view const args = input;
    BOOST_OUTCOME_TRY(auto const spender, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(auto const amount, abi_decode_fixed<u256_be>(input));
    BOOST_OUTCOME_TRY(auto const data, abi_decode_bytes(args, input));
    BOOST_OUTCOME_TRY(
        approve_and_call(msg_sender, spender, amount.native(), data));
    return byte_string{abi_encode_bool(true)};
}

Result<byte_string> TokenContract::precompile_supports_interface(
    byte_string_view input, evmc_address const &,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    BOOST_OUTCOME_TRY(auto const id, abi_decode_bytes4(input));
    if (TALLY_UNLIKELY(!input.empty())) {
        return TokenError::InvalidInput;
    }
    return byte_string{abi_encode_bool(supports_interface(id))};
}

Result<byte_string> TokenContract::precompile_fallback(
    byte_string_view, evmc_address const &, evmc_uint256be const &)
{
    return TokenError::MethodNotSupported;
}

TALLY_TOKEN_NAMESPACE_END
