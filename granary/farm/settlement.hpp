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

#include <granary/core/int.hpp>
#include <granary/core/result.hpp>
#include <granary/core/task/task_queue.hpp>
#include <granary/farm/config.hpp>
#include <granary/farm/token_registry.hpp>
#include <granary/farm/util/farm_error.hpp>
#include <granary/farm/util/types.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

GRANARY_FARM_NAMESPACE_BEGIN

class Clock;
class SettlementEngine;
struct Farm;
struct Vault;

enum class SettlementKind
{
    Harvest,
    Unstake,
    Close,
    FeeWithdrawal,
};

enum class LegKind
{
    RewardCredit,
    StakeReturn,
    ItemReturn,
    BoostReturn,
    DepositReturn,
    FeeWithdrawal,
};

enum class LegState
{
    Pending,
    Succeeded,
    Failed,
};

// One remote call of a settlement.
struct Leg
{
    LegKind kind{LegKind::RewardCredit};
    size_t token{0}; // reward token or stake token index
    uint256_t amount{0}; // amount sent to the receiver
    uint256_t recovered{0}; // part of a reward credit drawn from recovered
    uint256_t fee{0}; // part of a stake return kept as fee
    std::optional<StakedItem> item;
    LegState state{LegState::Pending};
};

// Ledger quantities taken out of the farm before the remote calls that pay
// them out are issued.
struct Reservation
{
    uint256_t reward_units{0};
    std::vector<uint256_t> recovered; // per reward token
    std::vector<uint256_t> stake_amounts; // per stake token
    std::vector<StakedItem> items;
    std::optional<StakedItem> boost;
    uint256_t item_deposit{0};
    std::vector<uint256_t> fees; // per stake token
};

class Settlement
{
    friend class SettlementEngine;

    uint64_t id_;
    SettlementKind kind_;
    AccountId account_;
    Reservation reserved_;
    std::vector<Leg> legs_;

    // join counter, the settlement finalizes when it drops to zero
    size_t outstanding_{0};

    size_t reward_legs_{0};
    size_t reward_settled_{0};
    size_t reward_failed_{0};

    bool internal_error_{false};
    bool finalized_{false};
    FarmError error_{FarmError::Success};

public:
    Settlement(
        uint64_t id, SettlementKind, AccountId account, Reservation reserved);

    uint64_t id() const noexcept
    {
        return id_;
    }

    SettlementKind kind() const noexcept
    {
        return kind_;
    }

    AccountId const &account() const noexcept
    {
        return account_;
    }

    Reservation const &reserved() const noexcept
    {
        return reserved_;
    }

    std::vector<Leg> const &legs() const noexcept
    {
        return legs_;
    }

    size_t outstanding() const noexcept
    {
        return outstanding_;
    }

    bool finalized() const noexcept
    {
        return finalized_;
    }

    size_t failed_legs() const noexcept;

    // SettlementPending until every leg has reconciled and the finalization
    // step ran. Failed single leg settlements report RemoteCallFailure,
    // failed multi leg settlements PartialSettlementFailure.
    Result<void> outcome() const;
};

using SettlementTicket = std::shared_ptr<Settlement const>;

// Sole issuer of remote calls and sole writer of in flight state. Value is
// reserved out of the ledger before a call is issued; each leg reconciles on
// its own completion, restoring what it reserved if the call failed, and the
// settlement is finalized in a separate step once every leg reconciled.
class SettlementEngine
{
    Farm &farm_;
    task::TaskQueue &queue_;
    RegistryDirectory const &registries_;
    Clock const &clock_;
    uint64_t next_id_{0};

    void issue(std::shared_ptr<Settlement> const &, size_t leg);
    void fail_unroutable(Completion, size_t leg);
    void reconcile(
        std::shared_ptr<Settlement> const &, size_t leg,
        Result<void> const &res);
    Result<void> compensate(Settlement &, Leg const &);
    Result<void> compensate_rewards(Settlement &);
    void finalize(Settlement &);

public:
    SettlementEngine(
        Farm &, task::TaskQueue &, RegistryDirectory const &, Clock const &);

    SettlementEngine(SettlementEngine const &) = delete;
    SettlementEngine &operator=(SettlementEngine const &) = delete;

    // per reward token amount paid for `units` plus recovered balances
    Result<std::vector<uint256_t>> reward_amounts(
        uint256_t const &units, std::vector<uint256_t> const &recovered) const;

    // Zeroes accrued units and recovered balances of the vault. The vault
    // must have been accrued.
    Reservation reserve_rewards(Vault &);

    Result<SettlementTicket>
    dispatch(SettlementKind, AccountId const &, Reservation);

    // sends every collected fee to the treasury
    Result<SettlementTicket> withdraw_fees();
};

GRANARY_FARM_NAMESPACE_END
