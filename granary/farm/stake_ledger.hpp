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
#include <granary/farm/config.hpp>
#include <granary/farm/util/types.hpp>

#include <cstddef>
#include <optional>
#include <vector>

GRANARY_FARM_NAMESPACE_BEGIN

struct Farm;
struct FarmConfig;
struct Vault;

// Everything unstake_all took out of a vault.
struct StakeRelease
{
    std::vector<uint256_t> amounts; // per stake token
    std::vector<StakedItem> items;
    std::optional<StakedItem> boost;
    uint256_t item_deposit{0};
};

// Stake ledger operations. Each assumes the vault was accrued at the current
// time and keeps vault.weight and farm.total_weight in step with the stake.

Result<uint256_t> compute_weight(FarmConfig const &, Vault const &);
Result<void> recompute_weight(Farm &, Vault &);

Result<void>
stake_amount(Farm &, Vault &, size_t token, uint256_t const &amount);
Result<void>
unstake_amount(Farm &, Vault &, size_t token, uint256_t const &amount);

Result<void> stake_item(Farm &, Vault &, StakedItem const &);

// Removes the named item, or every item of the collection when no item is
// named.
Result<std::vector<StakedItem>> unstake_items(
    Farm &, Vault &, CollectionId const &, std::optional<ItemId> const &);

// Item deposits lock a fungible amount per staked item. They carry no weight.
Result<uint256_t> required_item_deposit(FarmConfig const &, size_t items);
Result<void> deposit_for_items(Farm &, Vault &, uint256_t const &amount);

// Takes the deposit of `items` returned items out of the vault, at most what
// the vault holds.
Result<uint256_t> release_item_deposit(Farm &, Vault &, size_t items);

Result<void> stake_boost(Farm &, Vault &, StakedItem const &);
Result<StakedItem> unstake_boost(Farm &, Vault &);

Result<StakeRelease> unstake_all(Farm &, Vault &);

GRANARY_FARM_NAMESPACE_END
