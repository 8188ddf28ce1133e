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

#include <tally/core/config.hpp>

#include <evmc/evmc.hpp>

#include <cstdint>
#include <span>

TALLY_NAMESPACE_BEGIN

class Host;

/// Native implementation bound to an account that has code.
class Contract
{
public:
    virtual ~Contract() = default;

    /// Runs one message against this contract. The host has already
    /// opened a state frame for the call; returning anything other than
    /// EVMC_SUCCESS discards every change made under it.
    virtual evmc::Result execute(Host &, evmc_message const &) = 0;

    /// The ERC-165 interface identifiers this contract declares. An empty
    /// table means the contract declares nothing, not even ERC-165.
    virtual std::span<uint32_t const> declared_interfaces() const
    {
        return {};
    }
};

TALLY_NAMESPACE_END
