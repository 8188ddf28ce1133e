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

#include <tally/core/basic_formatter.hpp>
#include <tally/execution/core/fmt/address_fmt.hpp>
#include <tally/execution/core/fmt/bytes_fmt.hpp>
#include <tally/execution/core/receipt.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <span>

template <>
struct quill::copy_loggable<tally::Receipt::Log> : std::true_type
{
};

template <>
struct fmt::formatter<tally::Receipt::Log> : public tally::BasicFormatter
{
    template <typename FormatContext>
    auto format(tally::Receipt::Log const &l, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "Log{{"
            "Data=0x{:02x} "
            "Topics=[{}] "
            "Address={}"
            "}}",
            fmt::join(std::as_bytes(std::span(l.data)), ""),
            fmt::join(l.topics, ", "),
            l.address);
        return ctx.out();
    }
};
