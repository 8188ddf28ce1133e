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

#include <tally/core/bytes.hpp>
#include <tally/execution/core/address.hpp>
#include <tally/execution/core/contract/big_endian.hpp>
#include <tally/execution/core/contract/storage_variable.hpp>
#include <tally/execution/state/state.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace tally;
using namespace intx::literals;

struct Storage : public ::testing::Test
{
    static constexpr auto ADDRESS{
        0x36928500bc1dcd7af6a2b4008875cc336b927d57_address};
    State state;

    void SetUp() override
    {
        state.create_account(ADDRESS);
    }
};

TEST_F(Storage, variable)
{
    StorageVariable<u256_be> var(state, ADDRESS, bytes32_t{6000});
    ASSERT_FALSE(var.load_checked().has_value());
    var.store(5_u256);
    ASSERT_TRUE(var.load_checked().has_value());
    EXPECT_EQ(var.load().native(), 5_u256);
    var.store(2000_u256);
    EXPECT_EQ(var.load().native(), 2000_u256);
    var.clear();
    EXPECT_FALSE(var.load_checked().has_value());
}

TEST_F(Storage, struct)
{
    struct S
    {
        u32_be x;
        u32_be y;
        u256_be z;
    };

    StorageVariable<S> var(state, ADDRESS, bytes32_t{6000});
    static_assert(StorageVariable<S>::N == 2);

    ASSERT_FALSE(var.load_checked().has_value());
    var.store(S{.x = 4, .y = 5, .z = 6_u256});
    S const s = var.load();
    EXPECT_EQ(s.x.native(), 4);
    EXPECT_EQ(s.y.native(), 5);
    EXPECT_EQ(s.z.native(), 6_u256);
}

TEST_F(Storage, reverted_with_frame)
{
    StorageVariable<u256_be> var(state, ADDRESS, bytes32_t{1});
    var.store(10_u256);
    state.push();
    var.store(20_u256);
    EXPECT_EQ(var.load().native(), 20_u256);
    state.pop_reject();
    EXPECT_EQ(var.load().native(), 10_u256);
}
