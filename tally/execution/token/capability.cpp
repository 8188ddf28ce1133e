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

#include <tally/execution/token/capability.hpp>

#include <tally/core/assert.h>
#include <tally/execution/host/contract.hpp>
#include <tally/execution/host/host.hpp>
#include <tally/execution/token/constants.hpp>
#include <tally/execution/token/notification.hpp>

#include <algorithm>
#include <cstdint>
#include <string_view>

TALLY_TOKEN_NAMESPACE_BEGIN

bool InterfaceDeclaration::supports_interface(uint32_t const id) const
{
    if (id == INVALID_INTERFACE_ID) {
        return false;
    }
    return std::ranges::find(ids_, id) != ids_.end();
}

std::string_view to_string(HandlerSupport const support)
{
    switch (support) {
    case HandlerSupport::NoCode:
        return "no code";
    case HandlerSupport::Declared:
        return "declared";
    case HandlerSupport::Undeclared:
        return "undeclared";
    case HandlerSupport::Unknown:
        return "unknown";
    }
    TALLY_ABORT("unknown handler support");
}

HandlerSupport probe_handler(
    Host &host, Address const &target, NotificationKind const kind)
{
    if (!host.has_code(target)) {
        return HandlerSupport::NoCode;
    }

    auto const *const contract = host.resolve(target);
    if (contract == nullptr) {
        return HandlerSupport::Unknown;
    }

    InterfaceDeclaration const declaration{contract->declared_interfaces()};
    if (!declaration.supports_interface(ERC165_INTERFACE_ID)) {
        return HandlerSupport::Unknown;
    }
    return declaration.supports_interface(handler_interface(kind))
               ? HandlerSupport::Declared
               : HandlerSupport::Undeclared;
}

TALLY_TOKEN_NAMESPACE_END
