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
#include <tally/core/config.hpp>
#include <tally/core/int.hpp>
#include <tally/core/result.hpp>
#include <tally/execution/core/address.hpp>
#include <tally/execution/token/config.hpp>
#include <tally/execution/token/constants.hpp>
#include <tally/execution/token/ledger.hpp>
#include <tally/execution/token/notification.hpp>
#include <tally/execution/token/token_error.hpp>

#include <evmc/evmc.h>

#include <cstdint>
#include <span>
#include <utility>

TALLY_NAMESPACE_BEGIN

class Host;

TALLY_NAMESPACE_END

TALLY_TOKEN_NAMESPACE_BEGIN

/// The token ledger and its notify-variant operations.
///
/// Every mutating operation checks its preconditions, opens a state
/// checkpoint, applies its mutation, and for the notify variants then
/// dispatches to the counterparty and validates its answer. The checkpoint
/// is accepted only if everything succeeded; otherwise it is rejected and
/// the ledger, including its log, is exactly as before the call.
class TokenContract
{
    Host &host_;
    Address const address_;
    int32_t const depth_;
    int64_t gas_;
    Ledger ledger_;

    template <typename F>
    Result<void> with_checkpoint(F &&);

    Result<void> move_tokens(
        Address const &from, Address const &to, uint256_t const &amount);

    Result<void> check_transfer(
        Address const &from, Address const &to, uint256_t const &amount);

    Result<void> check_transfer_from(
        Address const &caller, Address const &from, Address const &to,
        uint256_t const &amount);

    Result<void> notify(NotificationRequest const &);

public:
    /// `depth` and `gas` describe the message this contract is executing;
    /// callbacks are sent one level deeper with whatever gas is left.
    TokenContract(
        Host &, Address const &address, int32_t depth = 0,
        int64_t gas = DEFAULT_CALLBACK_GAS);

    Address const &address() const;

    int64_t gas_left() const;

    Ledger &ledger();

    ///////////////
    // Queries   //
    ///////////////

    uint256_t total_supply();

    uint256_t balance_of(Address const &);

    uint256_t allowance(Address const &owner, Address const &spender);

    static std::span<uint32_t const> declared_interfaces();

    static bool supports_interface(uint32_t id);

    ///////////////
    // ERC-20    //
    ///////////////

    Result<void> transfer(
        Address const &caller, Address const &to, uint256_t const &amount);

    Result<void> transfer_from(
        Address const &caller, Address const &from, Address const &to,
        uint256_t const &amount);

    Result<void> approve(
        Address const &caller, Address const &spender,
        uint256_t const &amount);

    ///////////////
    // ERC-1363  //
    ///////////////

    Result<void> transfer_and_call(
        Address const &caller, Address const &to, uint256_t const &amount,
        byte_string_view data = {});

    Result<void> transfer_from_and_call(
        Address const &caller, Address const &from, Address const &to,
        uint256_t const &amount, byte_string_view data = {});

    Result<void> approve_and_call(
        Address const &caller, Address const &spender,
        uint256_t const &amount, byte_string_view data = {});

    ////////////////////
    // ABI surface    //
    ////////////////////

    using PrecompileFunc = Result<byte_string> (TokenContract::*)(
        byte_string_view, evmc_address const &, evmc_uint256be const &);

    // Strips the selector from `input` and picks the method and its cost.
    static std::pair<PrecompileFunc, uint64_t>
    precompile_dispatch(byte_string_view &input);

    Result<byte_string> precompile_total_supply(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_balance_of(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_allowance(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_transfer(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_transfer_from(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_approve(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_transfer_and_call(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_transfer_and_call_with_data(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_transfer_from_and_call(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_transfer_from_and_call_with_data(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_approve_and_call(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_approve_and_call_with_data(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_supports_interface(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_fallback(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
};

TALLY_TOKEN_NAMESPACE_END
