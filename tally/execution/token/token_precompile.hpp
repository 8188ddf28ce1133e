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

#include <tally/execution/host/contract.hpp>
#include <tally/execution/token/config.hpp>

#include <evmc/evmc.hpp>

#include <cstdint>
#include <span>

TALLY_NAMESPACE_BEGIN

class Host;

TALLY_NAMESPACE_END

TALLY_TOKEN_NAMESPACE_BEGIN

/// Binds the token's ABI surface to an account, so the ledger can be
/// called through the host like any other contract.
class TokenPrecompile final : public Contract
{
public:
    evmc::Result execute(Host &, evmc_message const &) override;

    std::span<uint32_t const> declared_interfaces() const override;
};

TALLY_TOKEN_NAMESPACE_END
