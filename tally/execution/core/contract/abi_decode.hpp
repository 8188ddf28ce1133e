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

#include <tally/core/byte_string.hpp>
#include <tally/core/bytes.hpp>
#include <tally/core/config.hpp>
#include <tally/core/likely.h>
#include <tally/core/math.hpp>
#include <tally/core/result.hpp>
#include <tally/execution/core/address.hpp>
#include <tally/execution/core/contract/abi_decode_error.hpp>
#include <tally/execution/core/contract/big_endian.hpp>

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <cstring>
#include <type_traits>

#include <boost/outcome/try.hpp>

TALLY_NAMESPACE_BEGIN

// Decodes a static value that occupies the low order bytes of one word and
// advances `enc` past it.
template <typename T>
    requires(BigEndianType<T> || std::same_as<T, Address>)
Result<T> abi_decode_fixed(byte_string_view &enc)
{
    static_assert(sizeof(T) <= 32);
    if (TALLY_UNLIKELY(enc.size() < 32)) {
        return AbiDecodeError::InputTooShort;
    }

    constexpr size_t offset = 32 - sizeof(T);
    T output{};
    std::memcpy(&output, enc.data() + offset, sizeof(T));
    enc.remove_prefix(32);
    return output;
}

// bytes4 is left aligned; the remaining 28 bytes must be zero.
inline Result<uint32_t> abi_decode_bytes4(byte_string_view &enc)
{
    if (TALLY_UNLIKELY(enc.size() < 32)) {
        return AbiDecodeError::InputTooShort;
    }
    if (TALLY_UNLIKELY(!std::all_of(
            enc.begin() + 4, enc.begin() + 32, [](uint8_t const byte) {
                return byte == 0;
            }))) {
        return AbiDecodeError::DirtyPadding;
    }

    u32_be value;
    std::memcpy(&value, enc.data(), sizeof(value));
    enc.remove_prefix(32);
    return value.native();
}

// Decodes a dynamic `bytes` argument. `head` points at the offset word, which
// is relative to the start of the argument block `args`.
inline Result<byte_string>
abi_decode_bytes(byte_string_view const args, byte_string_view &head)
{
    BOOST_OUTCOME_TRY(auto const offset_be, abi_decode_fixed<u256_be>(head));
    auto const offset = offset_be.native();
    if (TALLY_UNLIKELY(offset > args.size())) {
        return AbiDecodeError::InvalidOffset;
    }

    byte_string_view tail = args.substr(static_cast<size_t>(offset));
    BOOST_OUTCOME_TRY(auto const length_be, abi_decode_fixed<u256_be>(tail));
    auto const length = length_be.native();
    if (TALLY_UNLIKELY(length > tail.size())) {
        return AbiDecodeError::LengthMismatch;
    }

    return byte_string{tail.substr(0, static_cast<size_t>(length))};
}

TALLY_NAMESPACE_END
