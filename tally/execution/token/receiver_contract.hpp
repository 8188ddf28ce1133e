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
#include <tally/core/int.hpp>
#include <tally/execution/core/address.hpp>
#include <tally/execution/host/contract.hpp>
#include <tally/execution/token/config.hpp>
#include <tally/execution/token/notification.hpp>

#include <evmc/evmc.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

TALLY_NAMESPACE_BEGIN

class Host;

TALLY_NAMESPACE_END

TALLY_TOKEN_NAMESPACE_BEGIN

enum class ReceiverBehavior
{
    Accept, // the sentinel of the kind it was called with
    WrongSentinel, // the sentinel of the other kind
    Zero, // a zero word
    Empty, // no output
    Garbage, // an arbitrary word
    Revert,
    OutOfGas,
};

std::optional<ReceiverBehavior> parse_receiver_behavior(std::string_view);

std::string_view to_string(ReceiverBehavior);

struct ReceivedNotification
{
    NotificationKind kind;
    Address token;
    Address initiator; // zero for approvals
    Address counterparty;
    uint256_t amount;
    byte_string payload;
};

/// Counterparty implementing both notification handlers with a scripted
/// answer. Also answers supportsInterface(bytes4) from its declaration.
class ReceiverContract final : public Contract
{
    ReceiverBehavior behavior_;
    std::vector<uint32_t> interfaces_;
    std::optional<ReceivedNotification> last_{};
    size_t received_{0};

public:
    explicit ReceiverContract(
        ReceiverBehavior, std::vector<uint32_t> interfaces = {});

    // ERC-165 plus both handler interfaces
    static std::vector<uint32_t> erc165_interfaces();

    void set_behavior(ReceiverBehavior);

    std::optional<ReceivedNotification> const &last() const;

    size_t received() const;

    evmc::Result execute(Host &, evmc_message const &) override;

    std::span<uint32_t const> declared_interfaces() const override;
};

TALLY_TOKEN_NAMESPACE_END
