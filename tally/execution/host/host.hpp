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
#include <tally/core/config.hpp>
#include <tally/execution/core/address.hpp>
#include <tally/execution/host/contract.hpp>
#include <tally/execution/trace/call_tracer.hpp>

#include <evmc/evmc.hpp>

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <memory>

TALLY_NAMESPACE_BEGIN

class State;

class Host
{
    template <typename K, typename V>
    using Map = ankerl::unordered_dense::segmented_map<K, V>;

    State &state_;
    NoopCallTracer noop_call_tracer_{};
    CallTracerBase *call_tracer_;
    Map<Address, std::unique_ptr<Contract>> contracts_{};

public:
    static constexpr int32_t MAX_CALL_DEPTH = 1024;

    explicit Host(State &);

    Host(Host const &) = delete;
    Host(Host &&) = delete;
    Host &operator=(Host const &) = delete;
    Host &operator=(Host &&) = delete;

    State &state();

    CallTracerBase &get_call_tracer();

    void set_call_tracer(CallTracerBase &);

    void reset_call_tracer();

    /// Installs `code` at `address` and binds `contract` to it. A null
    /// contract leaves the account with code that nothing executes.
    void deploy(
        Address const &, byte_string_view code, std::unique_ptr<Contract>);

    bool has_code(Address const &);

    /// The implementation bound to the account, or nullptr when the
    /// account has no code or its code is bound to nothing.
    Contract *resolve(Address const &);

    evmc::Result call(evmc_message const &) noexcept;
};

TALLY_NAMESPACE_END
