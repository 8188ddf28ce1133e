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
#include <tally/execution/trace/call_frame.hpp>

#include <evmc/evmc.hpp>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <stack>
#include <vector>

TALLY_NAMESPACE_BEGIN

struct CallTracerBase
{
    virtual ~CallTracerBase() = default;

    virtual void on_enter(evmc_message const &) = 0;
    virtual void on_exit(evmc::Result const &) = 0;
    virtual void reset() = 0;
};

struct NoopCallTracer final : public CallTracerBase
{
    virtual void on_enter(evmc_message const &) override;
    virtual void on_exit(evmc::Result const &) override;
    virtual void reset() override;
};

/// Records every call made through the host as a flat list of frames in
/// call order; to_json() rebuilds the call tree from frame depths.
class CallTracer final : public CallTracerBase
{
    std::vector<CallFrame> frames_{};
    std::stack<size_t> last_{};

public:
    CallTracer();
    CallTracer(CallTracer const &) = delete;
    CallTracer(CallTracer &&) = delete;

    virtual void on_enter(evmc_message const &) override;
    virtual void on_exit(evmc::Result const &) override;
    virtual void reset() override;

    std::vector<CallFrame> const &frames() const;

    nlohmann::json to_json() const;
};

TALLY_NAMESPACE_END
