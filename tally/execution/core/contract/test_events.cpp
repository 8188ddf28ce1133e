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
#include <tally/execution/core/contract/abi_encode.hpp>
#include <tally/execution/core/contract/abi_signatures.hpp>
#include <tally/execution/core/contract/big_endian.hpp>
#include <tally/execution/core/contract/events.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace tally;
using namespace intx::literals;

TEST(Events, build_transfer_event)
{
    constexpr auto signature =
        abi_encode_event_signature("Transfer(address,address,uint256)");
    auto const emitter = Address{0x1000};
    auto const from = Address{0xdeadbeef};
    auto const to = Address{0xcafe};
    u256_be const amount = 1000000_u256;

    constexpr auto expected_topic1 =
        0x00000000000000000000000000000000000000000000000000000000deadbeef_bytes32;
    constexpr auto expected_topic2 =
        0x000000000000000000000000000000000000000000000000000000000000cafe_bytes32;
    byte_string const expected_data =
        evmc::from_hex(
            "0x00000000000000000000000000000000000000000000000000000000000f4240")
            .value();

    auto const event = EventBuilder(emitter, signature)
                           .add_topic(abi_encode_address(from))
                           .add_topic(abi_encode_address(to))
                           .add_data(abi_encode_uint(amount))
                           .build();
    EXPECT_EQ(event.address, emitter);
    ASSERT_EQ(event.topics.size(), 3);
    EXPECT_EQ(event.topics[0], signature);
    EXPECT_EQ(event.topics[1], expected_topic1);
    EXPECT_EQ(event.topics[2], expected_topic2);
    EXPECT_EQ(event.data, expected_data);
}
