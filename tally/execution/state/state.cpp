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

#include <tally/execution/state/state.hpp>

#include <tally/core/assert.h>
#include <tally/core/byte_string.hpp>
#include <tally/core/bytes.hpp>
#include <tally/core/config.hpp>
#include <tally/core/keccak.hpp>
#include <tally/core/likely.h>
#include <tally/execution/core/account.hpp>
#include <tally/execution/core/address.hpp>
#include <tally/execution/core/receipt.hpp>
#include <tally/execution/state/account_state.hpp>
#include <tally/execution/state/version_stack.hpp>

#include <ankerl/unordered_dense.h>

#include <optional>
#include <utility>
#include <vector>

TALLY_NAMESPACE_BEGIN

std::optional<Account> const &State::recent_account(Address const &address)
{
    static std::optional<Account> const none{};

    auto const it = current_.find(address);
    if (it == current_.end()) {
        return none;
    }
    return it->second.recent().account_;
}

AccountState &State::current_account_state(Address const &address)
{
    auto it = current_.find(address);
    if (TALLY_UNLIKELY(it == current_.end())) {
        it = current_
                 .try_emplace(address, AccountState{std::nullopt}, version_)
                 .first;
    }
    return it->second.current(version_);
}

State::Map<Address, VersionStack<AccountState>> const &State::current() const
{
    return current_;
}

unsigned State::version() const
{
    return version_;
}

void State::push()
{
    ++version_;
}

void State::pop_accept()
{
    TALLY_ASSERT(version_);

    for (auto &it : current_) {
        it.second.pop_accept(version_);
    }

    logs_.pop_accept(version_);

    --version_;
}

void State::pop_reject()
{
    TALLY_ASSERT(version_);

    std::vector<Address> removals;

    for (auto &it : current_) {
        if (it.second.pop_reject(version_)) {
            removals.push_back(it.first);
        }
    }

    logs_.pop_reject(version_);

    while (removals.size()) {
        current_.erase(removals.back());
        removals.pop_back();
    }

    --version_;
}

bool State::account_exists(Address const &address)
{
    return recent_account(address).has_value();
}

bytes32_t State::get_code_hash(Address const &address)
{
    auto const &account = recent_account(address);
    if (TALLY_LIKELY(account.has_value())) {
        return account.value().code_hash;
    }
    return NULL_HASH;
}

bytes32_t State::get_storage(Address const &address, bytes32_t const &key)
{
    auto const it = current_.find(address);
    if (it == current_.end()) {
        return {};
    }
    return it->second.recent().get_storage(key);
}

void State::create_account(Address const &address)
{
    auto &account = current_account_state(address).account_;
    if (!account.has_value()) {
        account = Account{};
    }
}

void State::set_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    auto &account_state = current_account_state(address);
    TALLY_ASSERT(account_state.account_.has_value());
    account_state.set_storage(key, value);
}

byte_string_view State::get_code(Address const &address)
{
    auto const code_hash = get_code_hash(address);
    auto const it = code_.find(code_hash);
    if (it == code_.end()) {
        return {};
    }
    return it->second;
}

void State::set_code(Address const &address, byte_string_view const code)
{
    auto &account = current_account_state(address).account_;
    if (!account.has_value()) {
        account = Account{};
    }
    if (code.empty()) {
        account->code_hash = NULL_HASH;
        return;
    }
    auto const code_hash = to_bytes(keccak256(code));
    code_.try_emplace(code_hash, code);
    account->code_hash = code_hash;
}

std::vector<Receipt::Log> const &State::logs() const
{
    return logs_.recent();
}

void State::store_log(Receipt::Log const &log)
{
    logs_.current(version_).push_back(log);
}

TALLY_NAMESPACE_END
