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

#include <tally/core/bytes.hpp>
#include <tally/core/int.hpp>
#include <tally/execution/core/address.hpp>
#include <tally/execution/core/contract/abi_signatures.hpp>
#include <tally/execution/token/config.hpp>

#include <cstdint>

TALLY_TOKEN_NAMESPACE_BEGIN

inline constexpr Address DEFAULT_TOKEN_ADDRESS{0x1000};

// Gas handed to callbacks when the coordinator is driven directly rather
// than through a message.
inline constexpr int64_t DEFAULT_CALLBACK_GAS{10'000'000};

// An allowance of this size is never decremented by a spend.
inline constexpr uint256_t INFINITE_ALLOWANCE{UINT256_MAX};

////////////////
// Sentinels  //
////////////////

inline constexpr uint32_t TRANSFER_RECEIVED_SENTINEL = abi_encode_selector(
    "onTransferReceived(address,address,uint256,bytes)");
inline constexpr uint32_t APPROVAL_RECEIVED_SENTINEL =
    abi_encode_selector("onApprovalReceived(address,uint256,bytes)");

static_assert(TRANSFER_RECEIVED_SENTINEL == 0x88a7ca5c);
static_assert(APPROVAL_RECEIVED_SENTINEL == 0x7b04a2d0);
static_assert(TRANSFER_RECEIVED_SENTINEL != APPROVAL_RECEIVED_SENTINEL);

///////////////////
// Interface ids //
///////////////////

inline constexpr uint32_t ERC165_INTERFACE_ID =
    abi_encode_selector("supportsInterface(bytes4)");

inline constexpr uint32_t ERC20_INTERFACE_ID =
    abi_encode_selector("totalSupply()") ^
    abi_encode_selector("balanceOf(address)") ^
    abi_encode_selector("transfer(address,uint256)") ^
    abi_encode_selector("allowance(address,address)") ^
    abi_encode_selector("approve(address,uint256)") ^
    abi_encode_selector("transferFrom(address,address,uint256)");

inline constexpr uint32_t ERC1363_INTERFACE_ID =
    abi_encode_selector("transferAndCall(address,uint256)") ^
    abi_encode_selector("transferAndCall(address,uint256,bytes)") ^
    abi_encode_selector("transferFromAndCall(address,address,uint256)") ^
    abi_encode_selector("transferFromAndCall(address,address,uint256,bytes)") ^
    abi_encode_selector("approveAndCall(address,uint256)") ^
    abi_encode_selector("approveAndCall(address,uint256,bytes)");

// a receiver or spender interface has a single function, so its id is the
// handler selector
inline constexpr uint32_t RECEIVER_INTERFACE_ID = TRANSFER_RECEIVED_SENTINEL;
inline constexpr uint32_t SPENDER_INTERFACE_ID = APPROVAL_RECEIVED_SENTINEL;

inline constexpr uint32_t INVALID_INTERFACE_ID = 0xffffffff;

static_assert(ERC165_INTERFACE_ID == 0x01ffc9a7);
static_assert(ERC20_INTERFACE_ID == 0x36372b07);
static_assert(ERC1363_INTERFACE_ID == 0xb0202a11);

////////////
// Events //
////////////

inline constexpr bytes32_t TRANSFER_EVENT =
    abi_encode_event_signature("Transfer(address,address,uint256)");
inline constexpr bytes32_t APPROVAL_EVENT =
    abi_encode_event_signature("Approval(address,address,uint256)");

static_assert(
    TRANSFER_EVENT ==
    0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32);
static_assert(
    APPROVAL_EVENT ==
    0x8c5be1e5ebec7d5bd14f71427d1e84f3dd0314c0f7b2291e5b200ac8c7c3b925_bytes32);

TALLY_TOKEN_NAMESPACE_END
