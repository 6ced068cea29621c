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

#include <granary/farm/config.hpp>
#include <granary/farm/farm_config.hpp>
#include <granary/farm/farm_state.hpp>
#include <granary/farm/util/types.hpp>
#include <granary/farm/vault.hpp>

#include <utility>

GRANARY_FARM_NAMESPACE_BEGIN

Farm::Farm(FarmConfig farm_config)
    : config{std::move(farm_config)}
{
    farm_deposits.resize(config.reward_tokens.size());
    total_harvested.resize(config.reward_tokens.size());
    total_staked.resize(config.stake_tokens.size());
    fee_collected.resize(config.stake_tokens.size());
    for (auto const &c : config.collections) {
        total_items.emplace(c.id, 0);
    }
    for (auto const &c : config.boost_collections) {
        total_boosts.emplace(c.id, 0);
    }
}

bool Farm::is_registered(AccountId const &account) const
{
    return registered.contains(account);
}

Vault *Farm::find_vault(AccountId const &account)
{
    auto const it = vaults.find(account);
    return it == vaults.end() ? nullptr : &it->second;
}

Vault const *Farm::find_vault(AccountId const &account) const
{
    auto const it = vaults.find(account);
    return it == vaults.end() ? nullptr : &it->second;
}

Vault &Farm::vault_for(AccountId const &account)
{
    auto const it = vaults.find(account);
    if (it != vaults.end()) {
        return it->second;
    }
    return vaults
        .emplace(account, Vault::create(config, reward_per_weight_checkpoint))
        .first->second;
}

GRANARY_FARM_NAMESPACE_END
