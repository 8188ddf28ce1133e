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

#include <tally/core/int.hpp>
#include <tally/execution/core/contract/checked_math.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace tally;
using namespace intx::literals;

TEST(CheckedMath, add)
{
    auto const res = checked_add(5_u256, 7_u256);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), 12_u256);

    EXPECT_EQ(checked_add(UINT256_MAX, 0).value(), UINT256_MAX);

    auto const overflow = checked_add(UINT256_MAX, 1);
    ASSERT_TRUE(overflow.has_error());
    EXPECT_EQ(overflow.assume_error(), MathError::Overflow);
}

TEST(CheckedMath, sub)
{
    auto const res = checked_sub(7_u256, 7_u256);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), 0);

    auto const underflow = checked_sub(0, 1);
    ASSERT_TRUE(underflow.has_error());
    EXPECT_EQ(underflow.assume_error(), MathError::Underflow);
}
