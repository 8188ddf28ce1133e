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

#include <tally/execution/token/ledger.hpp>

#include <tally/core/byte_string.hpp>
#include <tally/core/bytes.hpp>
#include <tally/core/int.hpp>
#include <tally/core/keccak.hpp>
#include <tally/core/likely.h>
#include <tally/execution/core/address.hpp>
#include <tally/execution/core/contract/abi_encode.hpp>
#include <tally/execution/core/contract/big_endian.hpp>
#include <tally/execution/core/contract/checked_math.hpp>
#include <tally/execution/core/contract/events.hpp>
#include <tally/execution/core/fmt/receipt_fmt.hpp>
#include <tally/execution/state/state.hpp>
#include <tally/execution/token/constants.hpp>
#include <tally/execution/token/token_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <intx/intx.hpp>

#include <quill/Quill.h>

TALLY_TOKEN_NAMESPACE_BEGIN

StorageVariable<u256_be> Ledger::Variables::allowance(
    Address const &owner, Address const &spender) noexcept
{
    byte_string preimage;
    preimage += byte_string_view{owner.bytes, sizeof(owner.bytes)};
    preimage += byte_string_view{spender.bytes, sizeof(spender.bytes)};
    auto key = to_bytes(keccak256(preimage));
    key.bytes[0] = NSAllowance;
    return {state_, token_, key};
}

Ledger::Ledger(State &state, Address const &token)
    : state_{state}
    , token_{token}
    , vars{state, token}
{
}

Address const &Ledger::token() const
{
    return token_;
}

uint256_t Ledger::total_supply()
{
    return vars.total_supply.load().native();
}

uint256_t Ledger::balance_of(Address const &account)
{
    return vars.balance(account).load().native();
}

uint256_t
Ledger::get_allowance(Address const &owner, Address const &spender)
{
    return vars.allowance(owner, spender).load().native();
}

Result<void> Ledger::debit(Address const &account, uint256_t const &amount)
{
    auto balance = vars.balance(account);
    uint256_t const current = balance.load().native();
    if (TALLY_UNLIKELY(current < amount)) {
        return TokenError::InsufficientBalance;
    }
    BOOST_OUTCOME_TRY(auto const next, checked_sub(current, amount));
    balance.store(next);
    return outcome::success();
}

Result<void> Ledger::credit(Address const &account, uint256_t const &amount)
{
    auto balance = vars.balance(account);
    BOOST_OUTCOME_TRY(
        auto const next, checked_add(balance.load().native(), amount));
    balance.store(next);
    return outcome::success();
}

void Ledger::set_allowance(
    Address const &owner, Address const &spender, uint256_t const &amount)
{
    vars.allowance(owner, spender).store(amount);
}

Result<void> Ledger::spend_allowance(
    Address const &owner, Address const &spender, uint256_t const &amount)
{
    auto allowance = vars.allowance(owner, spender);
    uint256_t const current = allowance.load().native();
    if (TALLY_UNLIKELY(current < amount)) {
        return TokenError::InsufficientAllowance;
    }
    if (current != INFINITE_ALLOWANCE) {
        BOOST_OUTCOME_TRY(auto const next, checked_sub(current, amount));
        allowance.store(next);
    }
    return outcome::success();
}

void Ledger::record_event(
    EventKind const kind, Address const &first, Address const &second,
    uint256_t const &amount)
{
    auto const signature =
        kind == EventKind::Transfer ? TRANSFER_EVENT : APPROVAL_EVENT;
    auto const event = EventBuilder(token_, signature)
                           .add_topic(abi_encode_address(first))
                           .add_topic(abi_encode_address(second))
                           .add_data(abi_encode_uint(u256_be{amount}))
                           .build();
    LOG_DEBUG("{}", event);
    state_.store_log(event);
}

Result<void> Ledger::mint(Address const &account, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(
        auto const supply, checked_add(total_supply(), amount));
    BOOST_OUTCOME_TRY(credit(account, amount));
    vars.total_supply.store(supply);
    record_event(EventKind::Transfer, Address{}, account, amount);
    return outcome::success();
}

TALLY_TOKEN_NAMESPACE_END
