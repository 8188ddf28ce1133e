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

#include <tally/core/assert.h>
#include <tally/core/config.hpp>
#include <tally/execution/trace/call_frame.hpp>
#include <tally/execution/trace/call_tracer.hpp>

#include <evmc/evmc.hpp>
#include <nlohmann/json.hpp>

#include <span>

TALLY_NAMESPACE_BEGIN

namespace
{
    void to_json_helper(
        std::span<CallFrame const> const frames, nlohmann::json &json,
        size_t &pos)
    {
        if (pos >= frames.size()) {
            return;
        }
        json = to_json(frames[pos]);

        while (pos + 1 < frames.size()) {
            TALLY_ASSERT(json.contains("depth"));
            if (frames[pos + 1].depth > json["depth"]) {
                nlohmann::json j;
                pos++;
                to_json_helper(frames, j, pos);
                json["calls"].push_back(j);
            }
            else {
                return;
            }
        }
    }
}

void NoopCallTracer::on_enter(evmc_message const &) {}

void NoopCallTracer::on_exit(evmc::Result const &) {}

void NoopCallTracer::reset() {}

CallTracer::CallTracer()
{
    frames_.reserve(16);
}

void CallTracer::on_enter(evmc_message const &msg)
{
    frames_.emplace_back(CallFrame{
        .type = (msg.flags & EVMC_STATIC) ? CallType::STATICCALL
                                          : CallType::CALL,
        .from = msg.sender,
        .to = msg.recipient,
        .gas = static_cast<uint64_t>(msg.gas),
        .gas_used = 0,
        .input = msg.input_data == nullptr
                     ? byte_string{}
                     : byte_string{msg.input_data, msg.input_size},
        .output = {},
        .status = EVMC_FAILURE,
        .depth = static_cast<uint64_t>(msg.depth),
    });

    last_.push(frames_.size() - 1);
}

void CallTracer::on_exit(evmc::Result const &res)
{
    TALLY_ASSERT(!frames_.empty());
    TALLY_ASSERT(!last_.empty());

    auto &frame = frames_.at(last_.top());

    TALLY_ASSERT(frame.gas >= static_cast<uint64_t>(res.gas_left));
    frame.gas_used = frame.gas - static_cast<uint64_t>(res.gas_left);

    if (res.status_code == EVMC_SUCCESS || res.status_code == EVMC_REVERT) {
        frame.output = res.output_size == 0
                           ? byte_string{}
                           : byte_string{res.output_data, res.output_size};
    }
    frame.status = res.status_code;

    last_.pop();
}

void CallTracer::reset()
{
    frames_.clear();
    last_ = {};
}

std::vector<CallFrame> const &CallTracer::frames() const
{
    return frames_;
}

nlohmann::json CallTracer::to_json() const
{
    size_t pos = 0;
    nlohmann::json res = nlohmann::json::array();
    while (pos < frames_.size()) {
        nlohmann::json value{};
        to_json_helper(frames_, value, pos);
        res.push_back(value);
        ++pos;
    }
    return res;
}

TALLY_NAMESPACE_END
