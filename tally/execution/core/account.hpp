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

#include <optional>

TALLY_NAMESPACE_BEGIN

struct Account
{
    bytes32_t code_hash{NULL_HASH};

    friend bool operator==(Account const &, Account const &) = default;
};

inline constexpr bool has_code(std::optional<Account> const &account)
{
    return account.has_value() && account->code_hash != NULL_HASH;
}

TALLY_NAMESPACE_END
