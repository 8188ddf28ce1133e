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

#include <tally/core/byte_string.hpp>
#include <tally/core/bytes.hpp>
#include <tally/execution/core/address.hpp>
#include <tally/execution/host/contract.hpp>
#include <tally/execution/host/host.hpp>
#include <tally/execution/state/state.hpp>
#include <tally/execution/trace/call_tracer.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

#include <memory>

using namespace tally;

namespace
{
    constexpr auto caller = 0x00000000000000000000000000000000000000aa_address;
    constexpr auto writer = 0x00000000000000000000000000000000000000bb_address;
    constexpr auto slot =
        0x0000000000000000000000000000000000000000000000000000000000000001_bytes32;
    constexpr auto value =
        0x0000000000000000000000000000000000000000000000000000000000000002_bytes32;

    // writes a slot, then either succeeds, reverts, or recurses into itself
    struct WriterContract final : public Contract
    {
        evmc_status_code status{EVMC_SUCCESS};
        bool recurse{false};

        evmc::Result execute(Host &host, evmc_message const &msg) override
        {
            host.state().set_storage(msg.recipient, slot, value);
            if (recurse) {
                evmc_message next = msg;
                next.depth = msg.depth + 1;
                next.sender = msg.recipient;
                auto result = host.call(next);
                return evmc::Result{
                    result.status_code, msg.gas, 0, result.output_data,
                    result.output_size};
            }
            return evmc::Result{status, msg.gas};
        }
    };

    evmc_message make_message(Address const &to, int64_t const gas = 1000)
    {
        return evmc_message{
            .kind = EVMC_CALL,
            .flags = 0,
            .depth = 0,
            .gas = gas,
            .recipient = to,
            .sender = caller,
        };
    }

    byte_string const code{0x01};
}

struct HostTest : public ::testing::Test
{
    State state;
    Host host{state};
    WriterContract *contract{nullptr};

    void SetUp() override
    {
        auto c = std::make_unique<WriterContract>();
        contract = c.get();
        host.deploy(writer, code, std::move(c));
    }
};

TEST_F(HostTest, resolve)
{
    EXPECT_TRUE(host.has_code(writer));
    EXPECT_EQ(host.resolve(writer), contract);
    EXPECT_FALSE(host.has_code(caller));
    EXPECT_EQ(host.resolve(caller), nullptr);

    constexpr auto unbound = 0x00000000000000000000000000000000000000cc_address;
    host.deploy(unbound, code, nullptr);
    EXPECT_TRUE(host.has_code(unbound));
    EXPECT_EQ(host.resolve(unbound), nullptr);
}

TEST_F(HostTest, call_without_code_succeeds)
{
    auto const result = host.call(make_message(caller));
    EXPECT_EQ(result.status_code, EVMC_SUCCESS);
    EXPECT_EQ(result.output_size, 0);
    EXPECT_EQ(result.gas_left, 1000);
    EXPECT_EQ(state.version(), 0);
}

TEST_F(HostTest, call_unbound_code_fails)
{
    constexpr auto unbound = 0x00000000000000000000000000000000000000cc_address;
    host.deploy(unbound, code, nullptr);
    auto const result = host.call(make_message(unbound));
    EXPECT_EQ(result.status_code, EVMC_FAILURE);
    EXPECT_EQ(result.gas_left, 0);
}

TEST_F(HostTest, success_commits)
{
    auto const result = host.call(make_message(writer));
    EXPECT_EQ(result.status_code, EVMC_SUCCESS);
    EXPECT_EQ(state.get_storage(writer, slot), value);
    EXPECT_EQ(state.version(), 0);
}

TEST_F(HostTest, revert_discards)
{
    contract->status = EVMC_REVERT;
    auto const result = host.call(make_message(writer));
    EXPECT_EQ(result.status_code, EVMC_REVERT);
    EXPECT_EQ(result.gas_left, 1000);
    EXPECT_EQ(state.get_storage(writer, slot), bytes32_t{});
}

TEST_F(HostTest, failure_consumes_gas)
{
    contract->status = EVMC_OUT_OF_GAS;
    auto const result = host.call(make_message(writer));
    EXPECT_EQ(result.status_code, EVMC_OUT_OF_GAS);
    EXPECT_EQ(result.gas_left, 0);
    EXPECT_EQ(state.get_storage(writer, slot), bytes32_t{});
}

TEST_F(HostTest, call_depth_exceeded)
{
    contract->recurse = true;
    CallTracer tracer;
    host.set_call_tracer(tracer);
    auto const result = host.call(make_message(writer));
    host.reset_call_tracer();

    EXPECT_EQ(result.status_code, EVMC_CALL_DEPTH_EXCEEDED);
    EXPECT_EQ(state.get_storage(writer, slot), bytes32_t{});
    EXPECT_EQ(state.version(), 0);
    ASSERT_EQ(tracer.frames().size(), Host::MAX_CALL_DEPTH + 2);
    EXPECT_EQ(tracer.frames().back().depth, Host::MAX_CALL_DEPTH + 1);
    EXPECT_EQ(tracer.frames().back().status, EVMC_CALL_DEPTH_EXCEEDED);
}

TEST_F(HostTest, tracer_records_nested_calls)
{
    CallTracer tracer;
    host.set_call_tracer(tracer);
    (void)host.call(make_message(caller));
    (void)host.call(make_message(writer));
    host.reset_call_tracer();

    ASSERT_EQ(tracer.frames().size(), 2);
    EXPECT_EQ(tracer.frames()[0].to, caller);
    EXPECT_EQ(tracer.frames()[1].to, writer);
    EXPECT_EQ(tracer.frames()[1].status, EVMC_SUCCESS);

    auto const json = tracer.to_json();
    ASSERT_EQ(json.size(), 2);
    EXPECT_EQ(json[1]["type"], "CALL");
    EXPECT_TRUE(json[1]["calls"].empty());
}
