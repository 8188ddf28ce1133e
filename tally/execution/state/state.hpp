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
#include <tally/core/bytes.hpp>
#include <tally/core/config.hpp>
#include <tally/execution/core/account.hpp>
#include <tally/execution/core/address.hpp>
#include <tally/execution/core/receipt.hpp>
#include <tally/execution/state/account_state.hpp>
#include <tally/execution/state/version_stack.hpp>

#include <ankerl/unordered_dense.h>

#include <optional>
#include <vector>

TALLY_NAMESPACE_BEGIN

/// In-memory world state with nested checkpoints. push() opens a frame;
/// pop_accept() folds it into its parent and pop_reject() discards every
/// account, storage and log change made since the matching push().
class State
{
    template <typename K, typename V>
    using Map = ankerl::unordered_dense::segmented_map<K, V>;

    Map<Address, VersionStack<AccountState>> current_{};

    VersionStack<std::vector<Receipt::Log>> logs_{{}};

    Map<bytes32_t, byte_string> code_{};

    unsigned version_{0};

    std::optional<Account> const &recent_account(Address const &);

    AccountState &current_account_state(Address const &);

public:
    State() = default;

    State(State &&) = delete;
    State(State const &) = delete;
    State &operator=(State &&) = delete;
    State &operator=(State const &) = delete;

    Map<Address, VersionStack<AccountState>> const &current() const;

    unsigned version() const;

    void push();

    void pop_accept();

    void pop_reject();

    ////////////////////////////////////////

    bool account_exists(Address const &);

    bytes32_t get_code_hash(Address const &);

    bytes32_t get_storage(Address const &, bytes32_t const &key);

    ////////////////////////////////////////

    void create_account(Address const &);

    void set_storage(
        Address const &, bytes32_t const &key, bytes32_t const &value);

    ////////////////////////////////////////

    byte_string_view get_code(Address const &);

    void set_code(Address const &, byte_string_view code);

    ////////////////////////////////////////

    std::vector<Receipt::Log> const &logs() const;

    void store_log(Receipt::Log const &);
};

TALLY_NAMESPACE_END
