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
#include <tally/core/int.hpp>
#include <tally/core/math.hpp>
#include <tally/core/unaligned.hpp>
#include <tally/execution/core/address.hpp>
#include <tally/execution/core/contract/big_endian.hpp>

#include <cstdint>
#include <cstring>
#include <utility>
#include <vector>

TALLY_NAMESPACE_BEGIN

// The encoding follows the Solidity contract ABI: every static value fills one
// 32 byte word, dynamic values are referenced from the head by an offset and
// stored length prefixed in the tail.

constexpr bytes32_t abi_encode_address(Address const &address)
{
    bytes32_t output{};
    unaligned_store(&output.bytes[12], address);
    return output;
}

template <BigEndianType I>
constexpr bytes32_t abi_encode_uint(I const &i)
{
    static_assert(sizeof(I) <= sizeof(bytes32_t));

    constexpr size_t offset = sizeof(bytes32_t) - sizeof(I);
    bytes32_t output{};
    unaligned_store(&output.bytes[offset], i);
    return output;
}

constexpr bytes32_t abi_encode_bool(bool const b)
{
    u64_be as_int = b ? 1 : 0;
    return abi_encode_uint(as_int);
}

// bytesN values are left aligned
constexpr bytes32_t abi_encode_bytes4(uint32_t const value)
{
    u32_be const be{value};
    bytes32_t output{};
    unaligned_store(&output.bytes[0], be);
    return output;
}

inline byte_string abi_encode_bytes(byte_string_view const input)
{
    byte_string output;
    u256_be const size{input.size()};
    size_t const padding =
        round_up(input.size(), sizeof(bytes32_t)) - input.size();
    output += abi_encode_uint(size);
    output += input;
    output.append(padding, 0);
    return output;
}

class AbiEncoder
{
    byte_string head_;
    byte_string tail_;
    std::vector<std::pair<size_t, size_t>> unresolved_offsets_;

    void add_static(bytes32_t const &data)
    {
        head_ += byte_string_view{data.bytes, sizeof(bytes32_t)};
    }

    void add_dynamic(byte_string const &data)
    {
        unresolved_offsets_.emplace_back(head_.size(), tail_.size());
        head_.append(sizeof(bytes32_t), 0);
        tail_ += data;
    }

public:
    void add_address(Address const &address)
    {
        add_static(abi_encode_address(address));
    }

    template <BigEndianType I>
    void add_uint(I const &i)
    {
        add_static(abi_encode_uint(i));
    }

    void add_bool(bool const b)
    {
        add_static(abi_encode_bool(b));
    }

    void add_bytes4(uint32_t const value)
    {
        add_static(abi_encode_bytes4(value));
    }

    void add_bytes(byte_string_view const data)
    {
        add_dynamic(abi_encode_bytes(data));
    }

    byte_string encode_final()
    {
        for (auto const [unresolved, tail_cumsum] : unresolved_offsets_) {
            u256_be const offset =
                static_cast<uint256_t>(head_.size()) + tail_cumsum;
            bytes32_t const encoded = abi_encode_uint(offset);
            std::memcpy(&head_[unresolved], encoded.bytes, sizeof(bytes32_t));
        }

        return std::move(head_) + std::move(tail_);
    }
};

// Prefixes the encoded arguments with the big endian function selector.
inline byte_string
abi_encode_call(uint32_t const selector, byte_string_view const args)
{
    u32_be const be{selector};
    byte_string output{be.bytes, sizeof(be.bytes)};
    output += args;
    return output;
}

TALLY_NAMESPACE_END
