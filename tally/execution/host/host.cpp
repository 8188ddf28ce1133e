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

#include <tally/execution/host/host.hpp>

#include <tally/core/assert.h>
#include <tally/core/byte_string.hpp>
#include <tally/core/bytes.hpp>
#include <tally/core/config.hpp>
#include <tally/core/likely.h>
#include <tally/execution/core/address.hpp>
#include <tally/execution/host/contract.hpp>
#include <tally/execution/state/state.hpp>
#include <tally/execution/trace/call_tracer.hpp>

#include <evmc/evmc.hpp>

#include <memory>
#include <utility>

TALLY_NAMESPACE_BEGIN

namespace
{
    void post_call(State &state, evmc::Result &result)
    {
        if (result.status_code == EVMC_SUCCESS) {
            state.pop_accept();
        }
        else {
            if (result.status_code != EVMC_REVERT) {
                result.gas_left = 0;
            }
            state.pop_reject();
        }
    }
}

Host::Host(State &state)
    : state_{state}
    , call_tracer_{&noop_call_tracer_}
{
}

State &Host::state()
{
    return state_;
}

CallTracerBase &Host::get_call_tracer()
{
    return *call_tracer_;
}

void Host::set_call_tracer(CallTracerBase &call_tracer)
{
    call_tracer_ = &call_tracer;
}

void Host::reset_call_tracer()
{
    call_tracer_ = &noop_call_tracer_;
}

void Host::deploy(
    Address const &address, byte_string_view const code,
    std::unique_ptr<Contract> contract)
{
    TALLY_ASSERT(!code.empty());

    state_.set_code(address, code);
    if (contract) {
        contracts_.insert_or_assign(address, std::move(contract));
    }
    else {
        contracts_.erase(address);
    }
}

bool Host::has_code(Address const &address)
{
    return state_.get_code_hash(address) != NULL_HASH;
}

Contract *Host::resolve(Address const &address)
{
    if (!has_code(address)) {
        return nullptr;
    }
    auto const it = contracts_.find(address);
    if (it == contracts_.end()) {
        return nullptr;
    }
    return it->second.get();
}

evmc::Result Host::call(evmc_message const &msg) noexcept
{
    TALLY_ASSERT(msg.kind == EVMC_CALL);

    auto &call_tracer = get_call_tracer();
    call_tracer.on_enter(msg);

    if (TALLY_UNLIKELY(msg.depth > MAX_CALL_DEPTH)) {
        evmc::Result result{EVMC_CALL_DEPTH_EXCEEDED, msg.gas};
        call_tracer.on_exit(result);
        return result;
    }

    state_.push();

    evmc::Result result;
    if (!has_code(msg.recipient)) {
        result = evmc::Result{EVMC_SUCCESS, msg.gas};
    }
    else if (auto *const contract = resolve(msg.recipient);
             contract == nullptr) {
        result = evmc::Result{EVMC_FAILURE};
    }
    else {
        result = contract->execute(*this, msg);
        TALLY_ASSERT(result.gas_left >= 0 && result.gas_left <= msg.gas);
    }

    post_call(state_, result);
    call_tracer.on_exit(result);
    return result;
}

TALLY_NAMESPACE_END
