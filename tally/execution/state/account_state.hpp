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
#include <tally/core/config.hpp>
#include <tally/core/likely.h>
#include <tally/execution/core/account.hpp>

#include <ankerl/unordered_dense.h>

#include <optional>
#include <utility>

TALLY_NAMESPACE_BEGIN

class AccountState
{
public:
    template <class Key, class T>
    using Map = ankerl::unordered_dense::segmented_map<Key, T>;

    std::optional<Account> account_{};
    Map<bytes32_t, bytes32_t> storage_{};

    explicit AccountState(std::optional<Account> &&account)
        : account_{std::move(account)}
    {
    }

    explicit AccountState(std::optional<Account> const &account)
        : account_{account}
    {
    }

    AccountState(AccountState &&) = default;
    AccountState(AccountState const &) = default;
    AccountState &operator=(AccountState &&) = default;
    AccountState &operator=(AccountState const &) = default;

    bytes32_t get_storage(bytes32_t const &key) const
    {
        auto const it = storage_.find(key);
        if (TALLY_LIKELY(it != storage_.end())) {
            return it->second;
        }
        return {};
    }

    // zero slots are not kept
    void set_storage(bytes32_t const &key, bytes32_t const &value)
    {
        if (value == bytes32_t{}) {
            storage_.erase(key);
        }
        else {
            storage_[key] = value;
        }
    }
};

TALLY_NAMESPACE_END
