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
#include <tally/core/int.hpp>
#include <tally/execution/core/address.hpp>
#include <tally/execution/core/contract/abi_decode.hpp>
#include <tally/execution/core/contract/abi_decode_error.hpp>
#include <tally/execution/core/contract/abi_encode.hpp>
#include <tally/execution/core/contract/big_endian.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace tally;
using namespace intx::literals;

template <typename T>
class UintDecodeTest : public ::testing::Test
{
};

typedef ::testing::Types<u8_be, u32_be, u64_be, u256_be> UintTypes;
TYPED_TEST_SUITE(UintDecodeTest, UintTypes);

TYPED_TEST(UintDecodeTest, uint)
{
    TypeParam expected{255};
    bytes32_t const encoded = abi_encode_uint<TypeParam>(expected);
    byte_string_view input{encoded};
    auto const decoded_res = abi_decode_fixed<TypeParam>(input);
    EXPECT_TRUE(input.empty());
    ASSERT_TRUE(decoded_res.has_value());
    EXPECT_EQ(decoded_res.value().native(), expected.native());
}

TYPED_TEST(UintDecodeTest, input_too_short)
{
    TypeParam expected{255};
    bytes32_t const encoded = abi_encode_uint<TypeParam>(expected);
    byte_string_view input = byte_string_view{encoded}.substr(1);
    auto const decoded_res = abi_decode_fixed<TypeParam>(input);
    EXPECT_FALSE(input.empty());
    ASSERT_TRUE(decoded_res.has_error());
    EXPECT_EQ(decoded_res.assume_error(), AbiDecodeError::InputTooShort);
}

TEST(AbiDecode, address)
{
    constexpr auto expected = 0xdeadbeef00000000000000000000000000000001_address;
    bytes32_t const encoded = abi_encode_address(expected);
    byte_string_view input{encoded};
    auto const decoded_res = abi_decode_fixed<Address>(input);
    ASSERT_TRUE(decoded_res.has_value());
    EXPECT_EQ(decoded_res.value(), expected);
}

TEST(AbiDecode, bytes4)
{
    bytes32_t const encoded = abi_encode_bytes4(0x7b04a2d0);
    byte_string_view input{encoded};
    auto const decoded_res = abi_decode_bytes4(input);
    ASSERT_TRUE(decoded_res.has_value());
    EXPECT_EQ(decoded_res.value(), 0x7b04a2d0);
    EXPECT_TRUE(input.empty());
}

TEST(AbiDecode, bytes4_dirty_padding)
{
    bytes32_t encoded = abi_encode_bytes4(0x7b04a2d0);
    encoded.bytes[31] = 1;
    byte_string_view input{encoded};
    auto const decoded_res = abi_decode_bytes4(input);
    ASSERT_TRUE(decoded_res.has_error());
    EXPECT_EQ(decoded_res.assume_error(), AbiDecodeError::DirtyPadding);
}

TEST(AbiDecode, bytes)
{
    byte_string const payload = evmc::from_hex("0xcafe").value();
    AbiEncoder encoder;
    encoder.add_uint(u256_be{9});
    encoder.add_bytes(payload);
    byte_string const args = encoder.encode_final();

    byte_string_view head{args};
    auto const value = abi_decode_fixed<u256_be>(head);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value().native(), 9);
    auto const decoded = abi_decode_bytes(args, head);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), payload);
}

TEST(AbiDecode, bytes_invalid_offset)
{
    byte_string args{abi_encode_uint(u256_be{0x1000}).bytes, 32};
    byte_string_view head{args};
    auto const decoded = abi_decode_bytes(args, head);
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.assume_error(), AbiDecodeError::InvalidOffset);
}

TEST(AbiDecode, bytes_length_mismatch)
{
    AbiEncoder encoder;
    encoder.add_bytes(evmc::from_hex("0xcafe").value());
    byte_string args = encoder.encode_final();
    // claim more bytes than the tail holds
    args[32 + 31] = 0xff;
    byte_string_view head{args};
    auto const decoded = abi_decode_bytes(args, head);
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.assume_error(), AbiDecodeError::LengthMismatch);
}

TEST(AbiDecode, bytes_missing_length)
{
    byte_string args{abi_encode_uint(u256_be{0x20}).bytes, 32};
    byte_string_view head{args};
    auto const decoded = abi_decode_bytes(args, head);
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.assume_error(), AbiDecodeError::InputTooShort);
}
