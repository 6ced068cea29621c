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

#include <granary/core/checked_math.hpp>
#include <granary/core/int.hpp>
#include <granary/core/likely.h>
#include <granary/core/result.hpp>
#include <granary/farm/config.hpp>
#include <granary/farm/farm_config.hpp>
#include <granary/farm/farm_state.hpp>
#include <granary/farm/stake_ledger.hpp>
#include <granary/farm/util/constants.hpp>
#include <granary/farm/util/farm_error.hpp>
#include <granary/farm/util/types.hpp>
#include <granary/farm/vault.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

GRANARY_FARM_ANONYMOUS_NAMESPACE_BEGIN

// fungible farms need every stake token; the weight is the smallest
// rate-adjusted amount
Result<uint256_t>
fungible_weight(FarmConfig const &config, Vault const &vault)
{
    std::optional<uint256_t> weight;
    for (size_t i = 0; i < config.stake_tokens.size(); ++i) {
        BOOST_OUTCOME_TRY(
            auto const w,
            checked_mul_div(
                vault.staked_amounts[i], config.stake_tokens[i].rate, SCALE));
        if (!weight.has_value() || w < *weight) {
            weight = w;
        }
    }
    return weight.value_or(0);
}

Result<uint256_t> item_weight(FarmConfig const &config, Vault const &vault)
{
    uint256_t weight{0};
    for (auto const &[collection, items] : vault.staked_items) {
        auto const *const c = config.find_collection(collection);
        if (GRANARY_UNLIKELY(c == nullptr)) {
            return FarmError::UnknownCollection;
        }
        BOOST_OUTCOME_TRY(
            auto const w, checked_mul(c->weight, uint256_t{items.size()}));
        BOOST_OUTCOME_TRY(weight, checked_add(weight, w));
    }
    return weight;
}

Result<void> require_kind(FarmConfig const &config, StakeKind const kind)
{
    if (GRANARY_UNLIKELY(config.stake_kind != kind)) {
        return FarmError::WrongStakeKind;
    }
    return outcome::success();
}

GRANARY_FARM_ANONYMOUS_NAMESPACE_END

GRANARY_FARM_NAMESPACE_BEGIN

Result<uint256_t> compute_weight(FarmConfig const &config, Vault const &vault)
{
    uint256_t base{0};
    switch (config.stake_kind) {
    case StakeKind::Fungible: {
        BOOST_OUTCOME_TRY(base, fungible_weight(config, vault));
        break;
    }
    case StakeKind::NonFungible: {
        BOOST_OUTCOME_TRY(base, item_weight(config, vault));
        break;
    }
    }
    if (!vault.boost_item.has_value() || base == 0) {
        return base;
    }
    auto const *const boost =
        config.find_boost_collection(vault.boost_item->collection);
    if (GRANARY_UNLIKELY(boost == nullptr)) {
        return FarmError::UnknownCollection;
    }
    BOOST_OUTCOME_TRY(
        auto const extra,
        checked_mul_div(
            base, uint256_t{boost->boost_bp}, uint256_t{BASIS_POINTS}));
    return checked_add(base, extra);
}

Result<void> recompute_weight(Farm &farm, Vault &vault)
{
    BOOST_OUTCOME_TRY(auto const weight, compute_weight(farm.config, vault));
    BOOST_OUTCOME_TRY(
        auto const without, checked_sub(farm.total_weight, vault.weight));
    BOOST_OUTCOME_TRY(auto const total, checked_add(without, weight));
    farm.total_weight = total;
    vault.weight = weight;
    return outcome::success();
}

Result<void> stake_amount(
    Farm &farm, Vault &vault, size_t const token, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(require_kind(farm.config, StakeKind::Fungible));
    if (GRANARY_UNLIKELY(token >= farm.config.stake_tokens.size())) {
        return FarmError::UnknownToken;
    }
    if (GRANARY_UNLIKELY(amount == 0)) {
        return FarmError::InvalidInput;
    }
    BOOST_OUTCOME_TRY(
        auto const staked, checked_add(vault.staked_amounts[token], amount));
    BOOST_OUTCOME_TRY(
        auto const total, checked_add(farm.total_staked[token], amount));
    vault.staked_amounts[token] = staked;
    farm.total_staked[token] = total;
    return recompute_weight(farm, vault);
}

Result<void> unstake_amount(
    Farm &farm, Vault &vault, size_t const token, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(require_kind(farm.config, StakeKind::Fungible));
    if (GRANARY_UNLIKELY(token >= farm.config.stake_tokens.size())) {
        return FarmError::UnknownToken;
    }
    if (GRANARY_UNLIKELY(amount == 0)) {
        return FarmError::InvalidInput;
    }
    if (GRANARY_UNLIKELY(amount > vault.staked_amounts[token])) {
        return FarmError::InsufficientStake;
    }
    BOOST_OUTCOME_TRY(
        auto const total, checked_sub(farm.total_staked[token], amount));
    vault.staked_amounts[token] -= amount;
    farm.total_staked[token] = total;
    return recompute_weight(farm, vault);
}

Result<void> stake_item(Farm &farm, Vault &vault, StakedItem const &item)
{
    BOOST_OUTCOME_TRY(require_kind(farm.config, StakeKind::NonFungible));
    if (GRANARY_UNLIKELY(farm.config.find_collection(item.collection) ==
                         nullptr)) {
        return FarmError::UnknownCollection;
    }
    if (GRANARY_UNLIKELY(item.item.empty())) {
        return FarmError::InvalidInput;
    }
    if (GRANARY_UNLIKELY(vault.has_item(item))) {
        return FarmError::ItemAlreadyStaked;
    }
    vault.staked_items[item.collection].insert(item.item);
    ++farm.total_items[item.collection];
    return recompute_weight(farm, vault);
}

Result<std::vector<StakedItem>> unstake_items(
    Farm &farm, Vault &vault, CollectionId const &collection,
    std::optional<ItemId> const &item)
{
    BOOST_OUTCOME_TRY(require_kind(farm.config, StakeKind::NonFungible));
    if (GRANARY_UNLIKELY(farm.config.find_collection(collection) == nullptr)) {
        return FarmError::UnknownCollection;
    }
    auto const it = vault.staked_items.find(collection);
    if (it == vault.staked_items.end() || it->second.empty()) {
        return item.has_value() ? FarmError::UnknownItem
                                : FarmError::InsufficientStake;
    }
    std::vector<StakedItem> removed;
    if (item.has_value()) {
        if (GRANARY_UNLIKELY(it->second.erase(*item) == 0)) {
            return FarmError::UnknownItem;
        }
        removed.push_back(StakedItem{collection, *item});
    }
    else {
        for (auto const &id : it->second) {
            removed.push_back(StakedItem{collection, id});
        }
        it->second.clear();
    }
    if (it->second.empty()) {
        vault.staked_items.erase(it);
    }
    farm.total_items[collection] -= removed.size();
    BOOST_OUTCOME_TRY(recompute_weight(farm, vault));
    return removed;
}

Result<uint256_t>
required_item_deposit(FarmConfig const &config, size_t const items)
{
    if (!config.item_deposit.has_value()) {
        return uint256_t{0};
    }
    return checked_mul(config.item_deposit->rate, uint256_t{items});
}

Result<void>
deposit_for_items(Farm &farm, Vault &vault, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(require_kind(farm.config, StakeKind::NonFungible));
    if (GRANARY_UNLIKELY(!farm.config.item_deposit.has_value())) {
        return FarmError::UnknownToken;
    }
    if (GRANARY_UNLIKELY(amount == 0)) {
        return FarmError::InvalidInput;
    }
    BOOST_OUTCOME_TRY(
        auto const deposit, checked_add(vault.item_deposit, amount));
    BOOST_OUTCOME_TRY(
        auto const total, checked_add(farm.total_item_deposit, amount));
    vault.item_deposit = deposit;
    farm.total_item_deposit = total;
    return outcome::success();
}

Result<uint256_t>
release_item_deposit(Farm &farm, Vault &vault, size_t const items)
{
    BOOST_OUTCOME_TRY(
        auto amount, required_item_deposit(farm.config, items));
    if (amount > vault.item_deposit) {
        amount = vault.item_deposit;
    }
    BOOST_OUTCOME_TRY(
        auto const total, checked_sub(farm.total_item_deposit, amount));
    vault.item_deposit -= amount;
    farm.total_item_deposit = total;
    return amount;
}

Result<void> stake_boost(Farm &farm, Vault &vault, StakedItem const &item)
{
    if (GRANARY_UNLIKELY(
            farm.config.find_boost_collection(item.collection) == nullptr)) {
        return FarmError::UnknownCollection;
    }
    if (GRANARY_UNLIKELY(item.item.empty())) {
        return FarmError::InvalidInput;
    }
    // a boost item on its way back still occupies the slot until its
    // transfer settles
    if (GRANARY_UNLIKELY(
            vault.boost_item.has_value() || vault.boost_in_flight)) {
        return FarmError::BoostAlreadyStaked;
    }
    vault.boost_item = item;
    ++farm.total_boosts[item.collection];
    return recompute_weight(farm, vault);
}

Result<StakedItem> unstake_boost(Farm &farm, Vault &vault)
{
    if (GRANARY_UNLIKELY(!vault.boost_item.has_value())) {
        return FarmError::NoBoostStaked;
    }
    StakedItem item = std::move(*vault.boost_item);
    vault.boost_item.reset();
    --farm.total_boosts[item.collection];
    BOOST_OUTCOME_TRY(recompute_weight(farm, vault));
    return item;
}

Result<StakeRelease> unstake_all(Farm &farm, Vault &vault)
{
    StakeRelease release;
    release.amounts.resize(farm.config.stake_tokens.size());
    for (size_t i = 0; i < vault.staked_amounts.size(); ++i) {
        auto const amount = vault.staked_amounts[i];
        if (amount == 0) {
            continue;
        }
        BOOST_OUTCOME_TRY(
            auto const total, checked_sub(farm.total_staked[i], amount));
        farm.total_staked[i] = total;
        vault.staked_amounts[i] = 0;
        release.amounts[i] = amount;
    }
    for (auto const &[collection, items] : vault.staked_items) {
        for (auto const &id : items) {
            release.items.push_back(StakedItem{collection, id});
        }
        farm.total_items[collection] -= items.size();
    }
    vault.staked_items.clear();
    if (vault.item_deposit != 0) {
        BOOST_OUTCOME_TRY(
            auto const total,
            checked_sub(farm.total_item_deposit, vault.item_deposit));
        farm.total_item_deposit = total;
        release.item_deposit = vault.item_deposit;
        vault.item_deposit = 0;
    }
    if (vault.boost_item.has_value()) {
        --farm.total_boosts[vault.boost_item->collection];
        release.boost = std::move(vault.boost_item);
        vault.boost_item.reset();
    }
    BOOST_OUTCOME_TRY(recompute_weight(farm, vault));
    return release;
}

GRANARY_FARM_NAMESPACE_END
