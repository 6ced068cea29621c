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
#include <granary/farm/config.hpp>
#include <granary/farm/farm_config.hpp>
#include <granary/farm/util/types.hpp>
#include <granary/farm/vault.hpp>

#include <cstdint>
#include <map>
#include <unordered_map>
#include <unordered_set>
#include <vector>

GRANARY_FARM_NAMESPACE_BEGIN

// The aggregate owned by one deployed farm instance. Every component takes it
// explicitly; nothing in the farm lives in process wide state.
struct Farm
{
    FarmConfig config;

    bool setup_finalized{false};
    bool is_active{true};

    // sum of all vault weights
    uint256_t total_weight{0};

    // cumulative reward units per ACC_SCALE weight, never decreases
    uint256_t reward_per_weight_checkpoint{0};
    uint64_t last_checkpoint_round{0};

    std::vector<uint256_t> farm_deposits; // per reward token
    std::vector<uint256_t> total_harvested; // per reward token
    std::vector<uint256_t> total_staked; // per stake token
    std::vector<uint256_t> fee_collected; // per stake token
    std::map<CollectionId, uint64_t> total_items;
    std::map<CollectionId, uint64_t> total_boosts;
    uint256_t total_item_deposit{0};

    std::unordered_map<AccountId, Vault> vaults;
    std::unordered_set<AccountId> registered;

    explicit Farm(FarmConfig);

    bool is_registered(AccountId const &) const;

    Vault *find_vault(AccountId const &);
    Vault const *find_vault(AccountId const &) const;

    // returns the account's vault, creating it at the current checkpoint
    Vault &vault_for(AccountId const &);
};

GRANARY_FARM_NAMESPACE_END
