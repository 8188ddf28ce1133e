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

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace tally;
using namespace intx::literals;

TEST(AbiEncode, address)
{
    constexpr auto expected =
        0x000000000000000000000000deadbeef00000000000000000000000000000001_bytes32;
    constexpr auto address = 0xdeadbeef00000000000000000000000000000001_address;
    EXPECT_EQ(abi_encode_address(address), expected);
}

TEST(AbiEncode, uint)
{
    constexpr auto expected =
        0x00000000000000000000000000000000000000000000000000000000000f4240_bytes32;
    EXPECT_EQ(abi_encode_uint(u256_be{1000000_u256}), expected);
    EXPECT_EQ(abi_encode_uint(u64_be{1000000}), expected);
    EXPECT_EQ(abi_encode_uint(u32_be{1000000}), expected);
}

TEST(AbiEncode, bool)
{
    EXPECT_EQ(
        abi_encode_bool(true),
        0x0000000000000000000000000000000000000000000000000000000000000001_bytes32);
    EXPECT_EQ(abi_encode_bool(false), bytes32_t{});
}

TEST(AbiEncode, bytes4_is_left_aligned)
{
    EXPECT_EQ(
        abi_encode_bytes4(0x88a7ca5c),
        0x88a7ca5c00000000000000000000000000000000000000000000000000000000_bytes32);
}

TEST(AbiEncode, bytes)
{
    byte_string const input = evmc::from_hex("0xdeadbeef").value();
    byte_string const expected =
        evmc::from_hex(
            "0x0000000000000000000000000000000000000000000000000000000000000004"
            "deadbeef00000000000000000000000000000000000000000000000000000000")
            .value();
    EXPECT_EQ(abi_encode_bytes(input), expected);
    EXPECT_EQ(abi_encode_bytes({}), byte_string(32, 0));
}

TEST(AbiEncode, encoder_dynamic_offsets)
{
    AbiEncoder encoder;
    encoder.add_address(0x00000000000000000000000000000000000000aa_address);
    encoder.add_bytes(evmc::from_hex("0x0102").value());
    encoder.add_uint(u256_be{5});
    encoder.add_bytes(evmc::from_hex("0x03").value());

    byte_string const expected =
        evmc::from_hex(
            "0x00000000000000000000000000000000000000000000000000000000000000aa"
            "0000000000000000000000000000000000000000000000000000000000000080"
            "0000000000000000000000000000000000000000000000000000000000000005"
            "00000000000000000000000000000000000000000000000000000000000000c0"
            "0000000000000000000000000000000000000000000000000000000000000002"
            "0102000000000000000000000000000000000000000000000000000000000000"
            "0000000000000000000000000000000000000000000000000000000000000001"
            "0300000000000000000000000000000000000000000000000000000000000000")
            .value();
    EXPECT_EQ(encoder.encode_final(), expected);
}

TEST(AbiEncode, call)
{
    constexpr uint32_t selector = abi_encode_selector("transfer(address,uint256)");
    static_assert(selector == 0xa9059cbb);

    AbiEncoder encoder;
    encoder.add_address(0x00000000000000000000000000000000000000bb_address);
    encoder.add_uint(u256_be{7});
    byte_string const call = abi_encode_call(selector, encoder.encode_final());
    ASSERT_EQ(call.size(), 4 + 64);
    EXPECT_EQ(call.substr(0, 4), evmc::from_hex("0xa9059cbb").value());
    EXPECT_EQ(call[4 + 31], 0xbb);
    EXPECT_EQ(call[4 + 63], 7);
}

TEST(AbiSignatures, selectors)
{
    static_assert(
        abi_encode_selector("onTransferReceived(address,address,uint256,bytes)") ==
        0x88a7ca5c);
    static_assert(
        abi_encode_selector("onApprovalReceived(address,uint256,bytes)") ==
        0x7b04a2d0);
    static_assert(abi_encode_selector("supportsInterface(bytes4)") == 0x01ffc9a7);
    static_assert(abi_encode_selector("approve(address,uint256)") == 0x095ea7b3);
    static_assert(
        abi_encode_event_signature("Transfer(address,address,uint256)") ==
        0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32);
}
