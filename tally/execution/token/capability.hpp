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

#include <tally/execution/core/address.hpp>
#include <tally/execution/token/config.hpp>
#include <tally/execution/token/notification.hpp>

#include <cstdint>
#include <span>
#include <string_view>

TALLY_NAMESPACE_BEGIN

class Host;

TALLY_NAMESPACE_END

TALLY_TOKEN_NAMESPACE_BEGIN

/// A contract's declared ERC-165 interface table.
class InterfaceDeclaration
{
    std::span<uint32_t const> ids_;

public:
    explicit constexpr InterfaceDeclaration(std::span<uint32_t const> const ids)
        : ids_{ids}
    {
    }

    bool supports_interface(uint32_t id) const;
};

enum class HandlerSupport
{
    NoCode, // nothing to notify
    Declared, // declares ERC-165 and the handler interface
    Undeclared, // declares ERC-165 but not the handler interface
    Unknown, // has code, declares nothing; dispatch is best effort
};

std::string_view to_string(HandlerSupport);

HandlerSupport
probe_handler(Host &, Address const &target, NotificationKind);

TALLY_TOKEN_NAMESPACE_END
