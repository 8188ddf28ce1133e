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
#include <tally/execution/core/receipt.hpp>

#include <utility>

TALLY_NAMESPACE_BEGIN

class EventBuilder
{
    Receipt::Log event_;

public:
    explicit EventBuilder(Address const &emitter, bytes32_t const &signature)
    {
        event_.address = emitter;
        event_.topics.push_back(signature);
    }

    // indexed parameter
    EventBuilder &&add_topic(bytes32_t const &topic) &&
    {
        event_.topics.push_back(topic);
        return std::move(*this);
    }

    // non-indexed parameter
    EventBuilder &&add_data(byte_string_view const data) &&
    {
        event_.data += data;
        return std::move(*this);
    }

    Receipt::Log &&build() &&
    {
        return std::move(event_);
    }
};

TALLY_NAMESPACE_END
