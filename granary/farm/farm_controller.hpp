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
#include <granary/farm/farm_config.hpp>
#include <granary/farm/farm_state.hpp>
#include <granary/farm/settlement.hpp>
#include <granary/farm/token_registry.hpp>
#include <granary/farm/util/types.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <vector>

GRANARY_FARM_NAMESPACE_BEGIN

class Clock;
struct Vault;

enum class FarmPhase
{
    Setup,
    Active,
    Closed,
};

struct VaultStatus
{
    uint256_t weight{0};
    uint256_t accrued_units{0};
    std::vector<uint256_t> farmed_tokens; // accrued units per reward token
    std::vector<uint256_t> staked_amounts;
    StakedItems staked_items;
    std::optional<StakedItem> boost_item;
    uint256_t item_deposit{0};
    std::vector<uint256_t> recovered;
    uint64_t round_timestamp{0};
};

struct FarmParams
{
    FarmPhase phase{FarmPhase::Setup};
    bool is_active{false};
    uint64_t farming_start{0};
    uint64_t farming_end{0};
    uint256_t reward_per_round{0};
    uint256_t total_weight{0};
    uint256_t reward_per_weight_checkpoint{0};
    uint64_t last_checkpoint_round{0};
    std::vector<uint256_t> farm_deposits;
    std::vector<uint256_t> total_harvested;
    std::vector<uint256_t> total_staked;
    std::vector<uint256_t> fee_collected;
    std::map<CollectionId, uint64_t> total_items;
    std::map<CollectionId, uint64_t> total_boosts;
    uint256_t total_item_deposit{0};
    size_t accounts_registered{0};
};

struct SetupDeposits
{
    std::vector<uint256_t> expected; // per reward token
    std::vector<uint256_t> received;
};

// What an operation took out of the ledger and the settlement paying it out.
// The settlement is null when nothing had to leave the ledger.
struct SettlementReceipt
{
    Reservation reserved;
    SettlementTicket settlement;
};

// Entry point of one farm. Every operation accrues before it reads or changes
// stake, and every payout runs through the settlement engine.
class FarmController
{
    Farm farm_;
    task::TaskQueue &queue_;
    Clock const &clock_;
    SettlementEngine engine_;

    Result<void> require_owner(AccountId const &) const;
    Result<void> require_registered(AccountId const &) const;
    Result<void> require_staking_open() const;
    Result<void> require_withdrawals_open() const;

    // accrued vault of the account, created on demand
    Result<Vault *> prepare_vault(AccountId const &, bool create);

    // takes stake out of an accrued vault and reserves it for a settlement
    using Release = std::function<Result<Reservation>(Vault &)>;

    // Runs the release, reserves rewards when asked and dispatches. The
    // ledger is left untouched if any step fails.
    Result<SettlementReceipt> settle_stake(
        SettlementKind, AccountId const &, bool with_rewards,
        Release const &);

public:
    FarmController(
        FarmConfig, task::TaskQueue &, RegistryDirectory const &,
        Clock const &);

    FarmController(FarmController const &) = delete;
    FarmController &operator=(FarmController const &) = delete;

    Farm const &farm() const noexcept
    {
        return farm_;
    }

    FarmPhase phase() const;

    Result<void> register_account(AccountId const &);
    bool is_registered(AccountId const &) const;

    ////////////////////
    // Administrative //
    ////////////////////

    Result<void> setup_deposit(TokenId const &, uint256_t const &amount);
    Result<void> finalize_setup(AccountId const &caller);
    Result<void> set_active(AccountId const &caller, bool active);
    Result<void> set_farming_start(AccountId const &caller, uint64_t start);
    Result<SettlementReceipt> withdraw_fees(AccountId const &caller);

    /////////////
    // Staking //
    /////////////

    // called once the tokens or the item are in the farm's custody
    Result<void>
    stake(AccountId const &, TokenId const &, uint256_t const &amount);
    Result<void> stake_item(AccountId const &, StakedItem const &);
    Result<void> stake_boost(AccountId const &, StakedItem const &);

    // called once the deposit tokens are in the farm's custody
    Result<void> deposit_for_items(AccountId const &, uint256_t const &amount);

    Result<SettlementReceipt>
    unstake(AccountId const &, TokenId const &, uint256_t const &amount);
    Result<SettlementReceipt> unstake_items(
        AccountId const &, CollectionId const &, std::optional<ItemId> const &);
    Result<SettlementReceipt> unstake_boost(AccountId const &);

    Result<SettlementReceipt> harvest(AccountId const &);

    // unstake everything, harvest, and remove the account once every leg
    // succeeded
    Result<SettlementReceipt> close(AccountId const &);

    ///////////
    // Views //
    ///////////

    // nullopt for accounts that are not registered
    Result<std::optional<VaultStatus>> status(AccountId const &) const;
    FarmParams params() const;
    Result<SetupDeposits> setup_deposits() const;
};

GRANARY_FARM_NAMESPACE_END
