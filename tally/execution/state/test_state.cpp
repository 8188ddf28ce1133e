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
#include <tally/core/keccak.hpp>
#include <tally/execution/core/address.hpp>
#include <tally/execution/core/receipt.hpp>
#include <tally/execution/state/state.hpp>
#include <tally/execution/state/version_stack.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

using namespace tally;

namespace
{
    constexpr auto a = 0x5353535353535353535353535353535353535353_address;
    constexpr auto b = 0xbebebebebebebebebebebebebebebebebebebebe_address;
    constexpr auto key1 =
        0x00000000000000000000000000000000000000000000000000000000cafebabe_bytes32;
    constexpr auto key2 =
        0x1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c_bytes32;
    constexpr auto value1 =
        0x0000000000000000000000000000000000000000000000000000000000000003_bytes32;
    constexpr auto value2 =
        0x0000000000000000000000000000000000000000000000000000000000000007_bytes32;

    Receipt::Log make_log(Address const &address)
    {
        return Receipt::Log{.data = {}, .topics = {key1}, .address = address};
    }
}

TEST(VersionStack, accept_folds_into_parent)
{
    VersionStack<int> s{1};
    s.current(1) = 2;
    s.current(2) = 3;
    EXPECT_EQ(s.size(), 3);
    s.pop_accept(2);
    EXPECT_EQ(s.size(), 2);
    EXPECT_EQ(s.recent(), 3);
    EXPECT_EQ(s.version(), 1);
    s.pop_accept(1);
    EXPECT_EQ(s.size(), 1);
    EXPECT_EQ(s.recent(), 3);
    EXPECT_EQ(s.version(), 0);
}

TEST(VersionStack, reject_restores_parent)
{
    VersionStack<int> s{1};
    s.current(1) = 2;
    EXPECT_FALSE(s.pop_reject(1));
    EXPECT_EQ(s.recent(), 1);
    EXPECT_EQ(s.version(), 0);
}

TEST(VersionStack, accept_skips_untouched_versions)
{
    VersionStack<int> s{1};
    s.current(3) = 5;
    s.pop_accept(3);
    EXPECT_EQ(s.size(), 2);
    EXPECT_EQ(s.version(), 2);
    EXPECT_FALSE(s.pop_reject(2));
    EXPECT_EQ(s.recent(), 1);
}

TEST(State, account_exists)
{
    State s;
    EXPECT_FALSE(s.account_exists(a));
    s.create_account(a);
    EXPECT_TRUE(s.account_exists(a));
    EXPECT_FALSE(s.account_exists(b));
}

TEST(State, code)
{
    State s;
    EXPECT_EQ(s.get_code_hash(a), NULL_HASH);
    EXPECT_TRUE(s.get_code(a).empty());

    byte_string const code{0x60, 0x00};
    s.set_code(a, code);
    EXPECT_TRUE(s.account_exists(a));
    EXPECT_EQ(s.get_code_hash(a), to_bytes(keccak256(code)));
    EXPECT_EQ(s.get_code(a), code);

    s.set_code(a, {});
    EXPECT_EQ(s.get_code_hash(a), NULL_HASH);
}

TEST(State, storage)
{
    State s;
    s.create_account(a);
    EXPECT_EQ(s.get_storage(a, key1), bytes32_t{});
    s.set_storage(a, key1, value1);
    EXPECT_EQ(s.get_storage(a, key1), value1);
    s.set_storage(a, key1, bytes32_t{});
    EXPECT_EQ(s.get_storage(a, key1), bytes32_t{});
    EXPECT_EQ(s.get_storage(b, key1), bytes32_t{});
}

TEST(State, pop_accept)
{
    State s;
    s.create_account(a);
    s.set_storage(a, key1, value1);

    s.push();
    s.set_storage(a, key1, value2);
    s.set_storage(a, key2, value1);
    s.store_log(make_log(a));
    s.pop_accept();

    EXPECT_EQ(s.version(), 0);
    EXPECT_EQ(s.get_storage(a, key1), value2);
    EXPECT_EQ(s.get_storage(a, key2), value1);
    ASSERT_EQ(s.logs().size(), 1);
    EXPECT_EQ(s.logs()[0].address, a);
}

TEST(State, pop_reject)
{
    State s;
    s.create_account(a);
    s.set_storage(a, key1, value1);
    s.store_log(make_log(a));

    s.push();
    s.set_storage(a, key1, value2);
    s.set_code(b, byte_string{0x00});
    s.store_log(make_log(b));
    s.pop_reject();

    EXPECT_EQ(s.get_storage(a, key1), value1);
    EXPECT_FALSE(s.account_exists(b));
    ASSERT_EQ(s.logs().size(), 1);
    EXPECT_EQ(s.logs()[0].address, a);
}

TEST(State, nested_frames)
{
    State s;
    s.create_account(a);

    s.push();
    s.set_storage(a, key1, value1);
    {
        s.push();
        s.set_storage(a, key1, value2);
        s.store_log(make_log(a));
        s.pop_reject();
    }
    EXPECT_EQ(s.get_storage(a, key1), value1);
    EXPECT_TRUE(s.logs().empty());
    {
        s.push();
        s.set_storage(a, key2, value2);
        s.pop_accept();
    }
    s.pop_reject();

    EXPECT_EQ(s.get_storage(a, key1), bytes32_t{});
    EXPECT_EQ(s.get_storage(a, key2), bytes32_t{});
    EXPECT_TRUE(s.account_exists(a));
}
