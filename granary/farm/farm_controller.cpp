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

#include <granary/core/assert.h>
#include <granary/core/fmt/int_fmt.hpp> // NOLINT
#include <granary/core/int.hpp>
#include <granary/core/likely.h>
#include <granary/core/result.hpp>
#include <granary/core/task/task_queue.hpp>
#include <granary/farm/clock.hpp>
#include <granary/farm/config.hpp>
#include <granary/farm/farm_config.hpp>
#include <granary/farm/farm_controller.hpp>
#include <granary/farm/farm_state.hpp>
#include <granary/farm/reward_accumulator.hpp>
#include <granary/farm/settlement.hpp>
#include <granary/farm/stake_ledger.hpp>
#include <granary/farm/token_registry.hpp>
#include <granary/farm/util/farm_error.hpp>
#include <granary/farm/util/types.hpp>
#include <granary/farm/vault.hpp>

#include <quill/Quill.h>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

GRANARY_FARM_ANONYMOUS_NAMESPACE_BEGIN

// the part of the farm an unstake touches before its settlement exists
struct LedgerSnapshot
{
    Vault vault;
    uint256_t total_weight;
    std::vector<uint256_t> total_staked;
    std::map<CollectionId, uint64_t> total_items;
    std::map<CollectionId, uint64_t> total_boosts;
    uint256_t total_item_deposit;
};

LedgerSnapshot take_snapshot(Farm const &farm, Vault const &vault)
{
    return LedgerSnapshot{
        .vault = vault,
        .total_weight = farm.total_weight,
        .total_staked = farm.total_staked,
        .total_items = farm.total_items,
        .total_boosts = farm.total_boosts,
        .total_item_deposit = farm.total_item_deposit};
}

void restore(Farm &farm, Vault &vault, LedgerSnapshot const &snapshot)
{
    vault = snapshot.vault;
    farm.total_weight = snapshot.total_weight;
    farm.total_staked = snapshot.total_staked;
    farm.total_items = snapshot.total_items;
    farm.total_boosts = snapshot.total_boosts;
    farm.total_item_deposit = snapshot.total_item_deposit;
}

GRANARY_FARM_ANONYMOUS_NAMESPACE_END

GRANARY_FARM_NAMESPACE_BEGIN

FarmController::FarmController(
    FarmConfig config, task::TaskQueue &queue,
    RegistryDirectory const &registries, Clock const &clock)
    : farm_{std::move(config)}
    , queue_{queue}
    , clock_{clock}
    , engine_{farm_, queue_, registries, clock_}
{
    GRANARY_ASSERT(
        !validate(farm_.config).has_error(),
        "farm config must be validated before use");
}

FarmPhase FarmController::phase() const
{
    if (!farm_.setup_finalized) {
        return FarmPhase::Setup;
    }
    if (clock_.now() >= farm_.config.farming_end()) {
        return FarmPhase::Closed;
    }
    return FarmPhase::Active;
}

Result<void> FarmController::require_owner(AccountId const &caller) const
{
    if (GRANARY_UNLIKELY(caller != farm_.config.owner)) {
        return FarmError::PermissionDenied;
    }
    return outcome::success();
}

Result<void>
FarmController::require_registered(AccountId const &account) const
{
    if (GRANARY_UNLIKELY(!farm_.is_registered(account))) {
        return FarmError::AccountNotRegistered;
    }
    return outcome::success();
}

Result<void> FarmController::require_staking_open() const
{
    switch (phase()) {
    case FarmPhase::Setup:
        return FarmError::SetupNotFinalized;
    case FarmPhase::Closed:
        return FarmError::FarmNotActive;
    case FarmPhase::Active:
        break;
    }
    if (GRANARY_UNLIKELY(!farm_.is_active)) {
        return FarmError::FarmPaused;
    }
    return outcome::success();
}

Result<void> FarmController::require_withdrawals_open() const
{
    if (GRANARY_UNLIKELY(!farm_.setup_finalized)) {
        return FarmError::SetupNotFinalized;
    }
    if (GRANARY_UNLIKELY(!farm_.is_active)) {
        return FarmError::FarmPaused;
    }
    return outcome::success();
}

Result<Vault *>
FarmController::prepare_vault(AccountId const &account, bool const create)
{
    uint64_t const now = clock_.now();
    // a new vault starts at the checkpoint of the current round
    BOOST_OUTCOME_TRY(advance(farm_, now));
    Vault *vault = farm_.find_vault(account);
    if (vault == nullptr) {
        if (!create) {
            return static_cast<Vault *>(nullptr);
        }
        vault = &farm_.vault_for(account);
    }
    BOOST_OUTCOME_TRY(accrue(farm_, *vault, now));
    return vault;
}

Result<void> FarmController::register_account(AccountId const &account)
{
    if (GRANARY_UNLIKELY(account.empty())) {
        return FarmError::InvalidInput;
    }
    if (GRANARY_UNLIKELY(!farm_.registered.insert(account).second)) {
        return FarmError::AccountExists;
    }
    LOG_INFO("registered {}", account);
    return outcome::success();
}

bool FarmController::is_registered(AccountId const &account) const
{
    return farm_.is_registered(account);
}

Result<void>
FarmController::setup_deposit(TokenId const &token, uint256_t const &amount)
{
    if (GRANARY_UNLIKELY(farm_.setup_finalized)) {
        return FarmError::SetupFinalized;
    }
    auto const i = farm_.config.reward_token_index(token);
    if (GRANARY_UNLIKELY(!i.has_value())) {
        return FarmError::UnknownToken;
    }
    BOOST_OUTCOME_TRY(
        auto const expected, expected_deposit(farm_.config, *i));
    if (GRANARY_UNLIKELY(farm_.farm_deposits[*i] != 0 || amount != expected)) {
        LOG_WARNING(
            "rejected deposit of {} {}, expected {}", amount, token, expected);
        return FarmError::WrongDeposit;
    }
    farm_.farm_deposits[*i] = amount;
    LOG_INFO("setup deposit of {} {}", amount, token);
    return outcome::success();
}

Result<void> FarmController::finalize_setup(AccountId const &caller)
{
    BOOST_OUTCOME_TRY(require_owner(caller));
    if (GRANARY_UNLIKELY(farm_.setup_finalized)) {
        return FarmError::SetupFinalized;
    }
    bool const funded = std::all_of(
        farm_.farm_deposits.begin(),
        farm_.farm_deposits.end(),
        [](uint256_t const &d) { return d != 0; });
    if (GRANARY_UNLIKELY(!funded)) {
        return FarmError::DepositMissing;
    }
    if (GRANARY_UNLIKELY(clock_.now() >= farm_.config.farming_start)) {
        return FarmError::FinalizeTooLate;
    }
    farm_.setup_finalized = true;
    LOG_INFO(
        "setup finalized, farming {}..{}",
        farm_.config.farming_start,
        farm_.config.farming_end());
    return outcome::success();
}

Result<void>
FarmController::set_active(AccountId const &caller, bool const active)
{
    BOOST_OUTCOME_TRY(require_owner(caller));
    farm_.is_active = active;
    LOG_INFO("farm {}", active ? "resumed" : "paused");
    return outcome::success();
}

Result<void> FarmController::set_farming_start(
    AccountId const &caller, uint64_t const start)
{
    BOOST_OUTCOME_TRY(require_owner(caller));
    uint64_t const now = clock_.now();
    // the window is fixed once farming started
    if (GRANARY_UNLIKELY(
            now >= farm_.config.farming_start || start <= now)) {
        return FarmError::InvalidSchedule;
    }
    FarmConfig config = farm_.config;
    config.farming_start = start;
    if (GRANARY_UNLIKELY(validate(config).has_error())) {
        return FarmError::InvalidSchedule;
    }
    farm_.config.farming_start = start;
    LOG_INFO("farming start moved to {}", start);
    return outcome::success();
}

Result<SettlementReceipt>
FarmController::withdraw_fees(AccountId const &caller)
{
    BOOST_OUTCOME_TRY(require_owner(caller));
    BOOST_OUTCOME_TRY(auto ticket, engine_.withdraw_fees());
    return SettlementReceipt{
        .reserved = ticket->reserved(), .settlement = std::move(ticket)};
}

Result<void> FarmController::stake(
    AccountId const &account, TokenId const &token, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(require_registered(account));
    BOOST_OUTCOME_TRY(require_staking_open());
    if (GRANARY_UNLIKELY(farm_.config.stake_kind != StakeKind::Fungible)) {
        return FarmError::WrongStakeKind;
    }
    auto const i = farm_.config.stake_token_index(token);
    if (GRANARY_UNLIKELY(!i.has_value())) {
        return FarmError::UnknownToken;
    }
    if (GRANARY_UNLIKELY(amount == 0)) {
        return FarmError::InvalidInput;
    }
    BOOST_OUTCOME_TRY(auto *const vault, prepare_vault(account, true));
    BOOST_OUTCOME_TRY(stake_amount(farm_, *vault, *i, amount));
    vault->close_requested = false;
    LOG_INFO(
        "{} staked {} {}, weight {}", account, amount, token, vault->weight);
    return outcome::success();
}

Result<void>
FarmController::stake_item(AccountId const &account, StakedItem const &item)
{
    BOOST_OUTCOME_TRY(require_registered(account));
    BOOST_OUTCOME_TRY(require_staking_open());
    if (GRANARY_UNLIKELY(farm_.config.stake_kind != StakeKind::NonFungible)) {
        return FarmError::WrongStakeKind;
    }
    if (GRANARY_UNLIKELY(
            farm_.config.find_collection(item.collection) == nullptr)) {
        return FarmError::UnknownCollection;
    }
    auto const *const existing = farm_.find_vault(account);
    if (GRANARY_UNLIKELY(existing != nullptr && existing->has_item(item))) {
        return FarmError::ItemAlreadyStaked;
    }
    // every staked item, the new one included, needs its deposit
    size_t const items = existing != nullptr ? existing->item_count() : 0;
    BOOST_OUTCOME_TRY(
        auto const required, required_item_deposit(farm_.config, items + 1));
    uint256_t const held =
        existing != nullptr ? existing->item_deposit : uint256_t{0};
    if (GRANARY_UNLIKELY(held < required)) {
        LOG_WARNING(
            "{} holds an item deposit of {}, {} needed", account, held, required);
        return FarmError::InsufficientItemDeposit;
    }
    BOOST_OUTCOME_TRY(auto *const vault, prepare_vault(account, true));
    BOOST_OUTCOME_TRY(farm::stake_item(farm_, *vault, item));
    vault->close_requested = false;
    LOG_INFO(
        "{} staked {}:{}, weight {}",
        account,
        item.collection,
        item.item,
        vault->weight);
    return outcome::success();
}

Result<void>
FarmController::stake_boost(AccountId const &account, StakedItem const &item)
{
    BOOST_OUTCOME_TRY(require_registered(account));
    BOOST_OUTCOME_TRY(require_staking_open());
    if (GRANARY_UNLIKELY(
            farm_.config.find_boost_collection(item.collection) == nullptr)) {
        return FarmError::UnknownCollection;
    }
    auto const *const existing = farm_.find_vault(account);
    if (GRANARY_UNLIKELY(
            existing != nullptr &&
            (existing->boost_item.has_value() || existing->boost_in_flight))) {
        return FarmError::BoostAlreadyStaked;
    }
    BOOST_OUTCOME_TRY(auto *const vault, prepare_vault(account, true));
    BOOST_OUTCOME_TRY(farm::stake_boost(farm_, *vault, item));
    vault->close_requested = false;
    LOG_INFO(
        "{} boosted with {}:{}, weight {}",
        account,
        item.collection,
        item.item,
        vault->weight);
    return outcome::success();
}

Result<void> FarmController::deposit_for_items(
    AccountId const &account, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(require_registered(account));
    BOOST_OUTCOME_TRY(require_staking_open());
    if (GRANARY_UNLIKELY(farm_.config.stake_kind != StakeKind::NonFungible)) {
        return FarmError::WrongStakeKind;
    }
    if (GRANARY_UNLIKELY(!farm_.config.item_deposit.has_value())) {
        return FarmError::UnknownToken;
    }
    if (GRANARY_UNLIKELY(amount == 0)) {
        return FarmError::InvalidInput;
    }
    BOOST_OUTCOME_TRY(auto *const vault, prepare_vault(account, true));
    BOOST_OUTCOME_TRY(farm::deposit_for_items(farm_, *vault, amount));
    vault->close_requested = false;
    LOG_INFO(
        "{} deposited {} {} for items, holding {}",
        account,
        amount,
        farm_.config.item_deposit->id,
        vault->item_deposit);
    return outcome::success();
}

Result<SettlementReceipt> FarmController::settle_stake(
    SettlementKind const kind, AccountId const &account,
    bool const with_rewards, Release const &release)
{
    BOOST_OUTCOME_TRY(auto *const vault, prepare_vault(account, false));
    GRANARY_ASSERT(vault != nullptr);
    LedgerSnapshot const snapshot = take_snapshot(farm_, *vault);

    auto receipt = [&]() -> Result<SettlementReceipt> {
        BOOST_OUTCOME_TRY(auto reserved, release(*vault));
        if (with_rewards) {
            auto rewards = engine_.reserve_rewards(*vault);
            reserved.reward_units = rewards.reward_units;
            reserved.recovered = std::move(rewards.recovered);
        }
        BOOST_OUTCOME_TRY(
            auto ticket, engine_.dispatch(kind, account, std::move(reserved)));
        return SettlementReceipt{
            .reserved = ticket->reserved(), .settlement = std::move(ticket)};
    }();

    // nothing was dispatched, the ledger goes back to where it was
    if (GRANARY_UNLIKELY(receipt.has_error())) {
        restore(farm_, *vault, snapshot);
        LOG_WARNING(
            "{} rejected: {}", account, receipt.error().message().c_str());
    }
    return receipt;
}

Result<SettlementReceipt> FarmController::unstake(
    AccountId const &account, TokenId const &token, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(require_registered(account));
    BOOST_OUTCOME_TRY(require_withdrawals_open());
    if (GRANARY_UNLIKELY(farm_.config.stake_kind != StakeKind::Fungible)) {
        return FarmError::WrongStakeKind;
    }
    auto const i = farm_.config.stake_token_index(token);
    if (GRANARY_UNLIKELY(!i.has_value())) {
        return FarmError::UnknownToken;
    }
    if (GRANARY_UNLIKELY(amount == 0)) {
        return FarmError::InvalidInput;
    }
    auto const *const existing = farm_.find_vault(account);
    if (GRANARY_UNLIKELY(
            existing == nullptr || existing->staked_amounts[*i] < amount)) {
        return FarmError::InsufficientStake;
    }
    return settle_stake(
        SettlementKind::Unstake,
        account,
        false,
        [&](Vault &vault) -> Result<Reservation> {
            BOOST_OUTCOME_TRY(unstake_amount(farm_, vault, *i, amount));
            LOG_INFO(
                "{} unstaked {} {}, weight {}",
                account,
                amount,
                token,
                vault.weight);
            Reservation reserved;
            reserved.stake_amounts.resize(farm_.config.stake_tokens.size());
            reserved.stake_amounts[*i] = amount;
            return reserved;
        });
}

Result<SettlementReceipt> FarmController::unstake_items(
    AccountId const &account, CollectionId const &collection,
    std::optional<ItemId> const &item)
{
    BOOST_OUTCOME_TRY(require_registered(account));
    BOOST_OUTCOME_TRY(require_withdrawals_open());
    if (GRANARY_UNLIKELY(farm_.config.stake_kind != StakeKind::NonFungible)) {
        return FarmError::WrongStakeKind;
    }
    if (GRANARY_UNLIKELY(farm_.find_vault(account) == nullptr)) {
        return item.has_value() ? FarmError::UnknownItem
                                : FarmError::InsufficientStake;
    }
    return settle_stake(
        SettlementKind::Unstake,
        account,
        false,
        [&](Vault &vault) -> Result<Reservation> {
            BOOST_OUTCOME_TRY(
                auto items,
                farm::unstake_items(farm_, vault, collection, item));
            Reservation reserved;
            BOOST_OUTCOME_TRY(
                reserved.item_deposit,
                release_item_deposit(farm_, vault, items.size()));
            LOG_INFO(
                "{} unstaked {} items of {}, weight {}",
                account,
                items.size(),
                collection,
                vault.weight);
            reserved.items = std::move(items);
            return reserved;
        });
}

Result<SettlementReceipt>
FarmController::unstake_boost(AccountId const &account)
{
    BOOST_OUTCOME_TRY(require_registered(account));
    BOOST_OUTCOME_TRY(require_withdrawals_open());
    auto const *const existing = farm_.find_vault(account);
    if (GRANARY_UNLIKELY(
            existing == nullptr || !existing->boost_item.has_value())) {
        return FarmError::NoBoostStaked;
    }
    return settle_stake(
        SettlementKind::Unstake,
        account,
        false,
        [&](Vault &vault) -> Result<Reservation> {
            BOOST_OUTCOME_TRY(auto boost, farm::unstake_boost(farm_, vault));
            LOG_INFO(
                "{} unstaked boost {}:{}, weight {}",
                account,
                boost.collection,
                boost.item,
                vault.weight);
            Reservation reserved;
            reserved.boost = std::move(boost);
            return reserved;
        });
}

Result<SettlementReceipt> FarmController::harvest(AccountId const &account)
{
    BOOST_OUTCOME_TRY(require_registered(account));
    BOOST_OUTCOME_TRY(require_withdrawals_open());
    BOOST_OUTCOME_TRY(auto *const vault, prepare_vault(account, false));
    if (GRANARY_UNLIKELY(vault == nullptr)) {
        return FarmError::InsufficientAccrual;
    }
    BOOST_OUTCOME_TRY(
        auto const amounts,
        engine_.reward_amounts(vault->accrued_units, vault->recovered));
    bool const nothing = std::all_of(
        amounts.begin(), amounts.end(), [](uint256_t const &amount) {
            return amount == 0;
        });
    if (GRANARY_UNLIKELY(nothing)) {
        return FarmError::InsufficientAccrual;
    }
    LOG_INFO("{} harvests {} units", account, vault->accrued_units);
    return settle_stake(
        SettlementKind::Harvest,
        account,
        true,
        [](Vault &) -> Result<Reservation> { return Reservation{}; });
}

Result<SettlementReceipt> FarmController::close(AccountId const &account)
{
    BOOST_OUTCOME_TRY(require_registered(account));
    BOOST_OUTCOME_TRY(require_withdrawals_open());
    auto const *const existing = farm_.find_vault(account);
    if (existing == nullptr || existing->is_empty()) {
        // nothing to pay out, the account goes right away
        farm_.vaults.erase(account);
        farm_.registered.erase(account);
        LOG_INFO("account {} closed", account);
        return SettlementReceipt{};
    }
    return settle_stake(
        SettlementKind::Close,
        account,
        true,
        [&](Vault &vault) -> Result<Reservation> {
            BOOST_OUTCOME_TRY(auto release, unstake_all(farm_, vault));
            LOG_INFO("{} closing with {} units", account, vault.accrued_units);
            Reservation reserved;
            reserved.stake_amounts = std::move(release.amounts);
            reserved.items = std::move(release.items);
            reserved.boost = std::move(release.boost);
            reserved.item_deposit = release.item_deposit;
            return reserved;
        });
}

Result<std::optional<VaultStatus>>
FarmController::status(AccountId const &account) const
{
    if (!farm_.is_registered(account)) {
        return std::optional<VaultStatus>{};
    }
    uint64_t const now = clock_.now();
    VaultStatus status;
    status.round_timestamp = round_timestamp(farm_.config, now);
    auto const *const vault = farm_.find_vault(account);
    if (vault == nullptr) {
        status.farmed_tokens.resize(farm_.config.reward_tokens.size());
        status.staked_amounts.resize(farm_.config.stake_tokens.size());
        status.recovered.resize(farm_.config.reward_tokens.size());
        return std::optional<VaultStatus>{std::move(status)};
    }
    BOOST_OUTCOME_TRY(auto const units, project(farm_, *vault, now));
    BOOST_OUTCOME_TRY(
        auto farmed, farmed_tokens(farm_.config, units));
    status.weight = vault->weight;
    status.accrued_units = units;
    status.farmed_tokens = std::move(farmed);
    status.staked_amounts = vault->staked_amounts;
    status.staked_items = vault->staked_items;
    status.boost_item = vault->boost_item;
    status.item_deposit = vault->item_deposit;
    status.recovered = vault->recovered;
    return std::optional<VaultStatus>{std::move(status)};
}

FarmParams FarmController::params() const
{
    return FarmParams{
        .phase = phase(),
        .is_active = farm_.is_active,
        .farming_start = farm_.config.farming_start,
        .farming_end = farm_.config.farming_end(),
        .reward_per_round = farm_.config.reward_per_round(),
        .total_weight = farm_.total_weight,
        .reward_per_weight_checkpoint = farm_.reward_per_weight_checkpoint,
        .last_checkpoint_round = farm_.last_checkpoint_round,
        .farm_deposits = farm_.farm_deposits,
        .total_harvested = farm_.total_harvested,
        .total_staked = farm_.total_staked,
        .fee_collected = farm_.fee_collected,
        .total_items = farm_.total_items,
        .total_boosts = farm_.total_boosts,
        .total_item_deposit = farm_.total_item_deposit,
        .accounts_registered = farm_.registered.size()};
}

Result<SetupDeposits> FarmController::setup_deposits() const
{
    SetupDeposits deposits;
    deposits.received = farm_.farm_deposits;
    for (size_t i = 0; i < farm_.config.reward_tokens.size(); ++i) {
        BOOST_OUTCOME_TRY(
            auto const expected, expected_deposit(farm_.config, i));
        deposits.expected.push_back(expected);
    }
    return deposits;
}

GRANARY_FARM_NAMESPACE_END
