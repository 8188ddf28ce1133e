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
#include <tally/execution/core/address.hpp>

#include <evmc/evmc.h>

#include <vector>

TALLY_NAMESPACE_BEGIN

struct Receipt
{
    struct Log
    {
        byte_string data{};
        std::vector<bytes32_t> topics{};
        Address address{};

        friend bool operator==(Log const &, Log const &) = default;
    };

    evmc_status_code status{};
    byte_string output{};
    std::vector<Log> logs{};

    friend bool operator==(Receipt const &, Receipt const &) = default;
};

TALLY_NAMESPACE_END
