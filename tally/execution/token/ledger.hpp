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

#include <tally/core/bytes.hpp>
#include <tally/core/int.hpp>
#include <tally/core/result.hpp>
#include <tally/execution/core/address.hpp>
#include <tally/execution/core/contract/big_endian.hpp>
#include <tally/execution/core/contract/storage_variable.hpp>
#include <tally/execution/token/config.hpp>

#include <bit>
#include <cstdint>

TALLY_NAMESPACE_BEGIN

class State;

TALLY_NAMESPACE_END

TALLY_TOKEN_NAMESPACE_BEGIN

enum class EventKind
{
    Transfer,
    Approval,
};

/// Balances, allowances and total supply, kept in the storage of the token
/// account. Every primitive writes through State, so it is undone by the
/// enclosing checkpoint when that checkpoint is rejected.
class Ledger
{
    /////////////////////////
    // Token Storage Layout
    /////////////////////////
    class Variables
    {
        State &state_;
        Address const token_;

        static constexpr auto AddressTotalSupply{
            0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};

        enum Namespace : uint8_t
        {
            NSBalance = 0x01,
            NSAllowance = 0x02,
        };

    public:
        Variables(State &state, Address const &token)
            : state_{state}
            , token_{token}
        {
        }

        StorageVariable<u256_be> total_supply{
            state_, token_, AddressTotalSupply};

        // mapping (address => uint256) balance
        StorageVariable<u256_be> balance(Address const &account) noexcept
        {
            struct
            {
                uint8_t ns;
                Address address;
                uint8_t slots[11];
            } key{.ns = NSBalance, .address = account, .slots = {}};

            return {state_, token_, std::bit_cast<bytes32_t>(key)};
        }

        // mapping (address => mapping (address => uint256)) allowance
        //
        // Two addresses do not fit in a slot key, so the pair is hashed and
        // the namespace byte overwrites the top of the digest.
        StorageVariable<u256_be>
        allowance(Address const &owner, Address const &spender) noexcept;
    };

    State &state_;
    Address const token_;
    Variables vars;

public:
    Ledger(State &, Address const &token);

    Address const &token() const;

    uint256_t total_supply();

    uint256_t balance_of(Address const &);

    uint256_t get_allowance(Address const &owner, Address const &spender);

    // InsufficientBalance if `account` holds less than `amount`
    Result<void> debit(Address const &account, uint256_t const &amount);

    Result<void> credit(Address const &account, uint256_t const &amount);

    void set_allowance(
        Address const &owner, Address const &spender, uint256_t const &amount);

    // InsufficientAllowance if the allowance is below `amount`; an infinite
    // allowance is left as is
    Result<void> spend_allowance(
        Address const &owner, Address const &spender, uint256_t const &amount);

    void record_event(
        EventKind, Address const &, Address const &, uint256_t const &amount);

    // genesis allocation
    Result<void> mint(Address const &account, uint256_t const &amount);
};

TALLY_TOKEN_NAMESPACE_END
