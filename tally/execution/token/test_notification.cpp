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
#include <tally/execution/core/contract/big_endian.hpp>
#include <tally/execution/host/host.hpp>
#include <tally/execution/state/state.hpp>
#include <tally/execution/token/capability.hpp>
#include <tally/execution/token/constants.hpp>
#include <tally/execution/token/dispatcher.hpp>
#include <tally/execution/token/notification.hpp>
#include <tally/execution/token/receiver_contract.hpp>
#include <tally/execution/token/validator.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

using namespace tally;
using namespace tally::token;

namespace
{
    constexpr auto token_address = 0x1000_address;
    constexpr auto alice = 0x0a11ce_address;
    constexpr auto bob = 0x0b0b_address;
    constexpr auto target = 0xcafe_address;

    byte_string const code{0x01};

    byte_string word(bytes32_t const &w)
    {
        return byte_string{w.bytes, sizeof(w.bytes)};
    }

    DispatchOutcome returned(byte_string output)
    {
        return DispatchOutcome{
            .kind = DispatchOutcome::Kind::Returned,
            .output = std::move(output),
            .status = EVMC_SUCCESS,
            .gas_left = 0};
    }
}

TEST(Notification, encode_transfer)
{
    NotificationRequest const request{
        .kind = NotificationKind::Transfer,
        .initiator = bob,
        .counterparty = alice,
        .target = target,
        .amount = 40,
        .payload = byte_string{0xab}};

    byte_string expected;
    expected += byte_string{0x88, 0xa7, 0xca, 0x5c};
    expected += word(abi_encode_address(bob));
    expected += word(abi_encode_address(alice));
    expected += word(abi_encode_uint(u256_be{40}));
    expected += word(abi_encode_uint(u256_be{128}));
    expected += abi_encode_bytes(byte_string{0xab});
    EXPECT_EQ(encode_notification(request), expected);
}

TEST(Notification, encode_approval)
{
    NotificationRequest const request{
        .kind = NotificationKind::Approval,
        .initiator = alice,
        .counterparty = alice,
        .target = target,
        .amount = 7,
        .payload = {}};

    byte_string expected;
    expected += byte_string{0x7b, 0x04, 0xa2, 0xd0};
    expected += word(abi_encode_address(alice));
    expected += word(abi_encode_uint(u256_be{7}));
    expected += word(abi_encode_uint(u256_be{96}));
    expected += word(bytes32_t{});
    EXPECT_EQ(encode_notification(request), expected);
}

TEST(Notification, sentinels_differ_by_kind)
{
    EXPECT_EQ(sentinel(NotificationKind::Transfer), 0x88a7ca5c);
    EXPECT_EQ(sentinel(NotificationKind::Approval), 0x7b04a2d0);
    EXPECT_EQ(
        handler_interface(NotificationKind::Transfer), RECEIVER_INTERFACE_ID);
    EXPECT_EQ(
        handler_interface(NotificationKind::Approval), SPENDER_INTERFACE_ID);
}

TEST(Validator, accepts_exact_sentinel)
{
    auto const output = word(abi_encode_bytes4(TRANSFER_RECEIVED_SENTINEL));
    EXPECT_EQ(
        validate(NotificationKind::Transfer, returned(output)),
        Acceptance::Accept);
    EXPECT_EQ(
        validate(NotificationKind::Approval, returned(output)),
        Acceptance::Reject);
}

TEST(Validator, ignores_trailing_words)
{
    auto output = word(abi_encode_bytes4(APPROVAL_RECEIVED_SENTINEL));
    output += word(abi_encode_bool(true));
    EXPECT_EQ(
        validate(NotificationKind::Approval, returned(output)),
        Acceptance::Accept);
}

TEST(Validator, rejects_malformed_output)
{
    auto const good = word(abi_encode_bytes4(TRANSFER_RECEIVED_SENTINEL));

    EXPECT_EQ(
        validate(NotificationKind::Transfer, returned({})),
        Acceptance::Reject);
    EXPECT_EQ(
        validate(NotificationKind::Transfer, returned(good.substr(0, 4))),
        Acceptance::Reject);
    EXPECT_EQ(
        validate(NotificationKind::Transfer, returned(word(bytes32_t{}))),
        Acceptance::Reject);

    auto dirty = good;
    dirty[31] = 0x01;
    EXPECT_EQ(
        validate(NotificationKind::Transfer, returned(dirty)),
        Acceptance::Reject);
}

TEST(Validator, rejects_failed_dispatch)
{
    auto const good = word(abi_encode_bytes4(TRANSFER_RECEIVED_SENTINEL));
    for (auto const kind :
         {DispatchOutcome::Kind::HandlerMissing,
          DispatchOutcome::Kind::HandlerFailed}) {
        DispatchOutcome const outcome{
            .kind = kind,
            .output = good,
            .status = EVMC_REVERT,
            .gas_left = 0};
        EXPECT_EQ(
            validate(NotificationKind::Transfer, outcome), Acceptance::Reject);
    }
}

TEST(Capability, interface_declaration)
{
    std::vector<uint32_t> const ids{ERC165_INTERFACE_ID, INVALID_INTERFACE_ID};
    InterfaceDeclaration const declaration{ids};
    EXPECT_TRUE(declaration.supports_interface(ERC165_INTERFACE_ID));
    EXPECT_FALSE(declaration.supports_interface(INVALID_INTERFACE_ID));
    EXPECT_FALSE(declaration.supports_interface(RECEIVER_INTERFACE_ID));
}

TEST(Capability, probe_handler)
{
    State state;
    Host host{state};

    EXPECT_EQ(
        probe_handler(host, target, NotificationKind::Transfer),
        HandlerSupport::NoCode);

    host.deploy(target, code, nullptr);
    EXPECT_EQ(
        probe_handler(host, target, NotificationKind::Transfer),
        HandlerSupport::Unknown);

    host.deploy(
        target,
        code,
        std::make_unique<ReceiverContract>(ReceiverBehavior::Accept));
    EXPECT_EQ(
        probe_handler(host, target, NotificationKind::Transfer),
        HandlerSupport::Unknown);

    host.deploy(
        target,
        code,
        std::make_unique<ReceiverContract>(
            ReceiverBehavior::Accept,
            std::vector<uint32_t>{ERC165_INTERFACE_ID, RECEIVER_INTERFACE_ID}));
    EXPECT_EQ(
        probe_handler(host, target, NotificationKind::Transfer),
        HandlerSupport::Declared);
    EXPECT_EQ(
        probe_handler(host, target, NotificationKind::Approval),
        HandlerSupport::Undeclared);

    // a handler interface without ERC-165 is not a declaration
    host.deploy(
        target,
        code,
        std::make_unique<ReceiverContract>(
            ReceiverBehavior::Accept,
            std::vector<uint32_t>{RECEIVER_INTERFACE_ID}));
    EXPECT_EQ(
        probe_handler(host, target, NotificationKind::Transfer),
        HandlerSupport::Unknown);
}

TEST(Dispatcher, dispatch)
{
    State state;
    Host host{state};
    auto receiver =
        std::make_unique<ReceiverContract>(ReceiverBehavior::Revert);
    auto *const r = receiver.get();
    host.deploy(target, code, std::move(receiver));

    NotificationRequest const request{
        .kind = NotificationKind::Approval,
        .initiator = alice,
        .counterparty = alice,
        .target = target,
        .amount = 1,
        .payload = {}};

    auto outcome =
        dispatch(host, token_address, 0, 5000, request, HandlerSupport::Unknown);
    EXPECT_EQ(outcome.kind, DispatchOutcome::Kind::HandlerFailed);
    EXPECT_EQ(outcome.status, EVMC_REVERT);
    EXPECT_EQ(outcome.gas_left, 5000);

    r->set_behavior(ReceiverBehavior::Empty);
    outcome =
        dispatch(host, token_address, 0, 5000, request, HandlerSupport::Unknown);
    EXPECT_EQ(outcome.kind, DispatchOutcome::Kind::Returned);
    EXPECT_TRUE(outcome.output.empty());

    outcome = dispatch(
        host, token_address, 0, 5000, request, HandlerSupport::Undeclared);
    EXPECT_EQ(outcome.kind, DispatchOutcome::Kind::HandlerMissing);
    EXPECT_EQ(r->received(), 2);
    EXPECT_EQ(r->last().value().token, token_address);
}
