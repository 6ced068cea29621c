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
#include <granary/farm/util/types.hpp>
#include <granary/farm/vault.hpp>

#include <algorithm>
#include <cstddef>

GRANARY_FARM_NAMESPACE_BEGIN

Vault Vault::create(FarmConfig const &config, uint256_t const &checkpoint)
{
    Vault vault;
    vault.checkpoint = checkpoint;
    vault.staked_amounts.resize(config.stake_tokens.size());
    vault.recovered.resize(config.reward_tokens.size());
    return vault;
}

size_t Vault::item_count() const
{
    size_t n = 0;
    for (auto const &[collection, items] : staked_items) {
        n += items.size();
    }
    return n;
}

bool Vault::has_item(StakedItem const &item) const
{
    auto const it = staked_items.find(item.collection);
    return it != staked_items.end() && it->second.contains(item.item);
}

bool Vault::has_stake() const
{
    bool const has_amount = std::any_of(
        staked_amounts.begin(),
        staked_amounts.end(),
        [](uint256_t const &amount) { return amount != 0; });
    return weight != 0 || has_amount || item_count() != 0 ||
           boost_item.has_value() || item_deposit != 0;
}

bool Vault::has_rewards() const
{
    return accrued_units != 0 ||
           std::any_of(
               recovered.begin(),
               recovered.end(),
               [](uint256_t const &amount) { return amount != 0; });
}

bool Vault::is_empty() const
{
    return !has_stake() && !has_rewards() && in_flight == 0 &&
           !boost_in_flight;
}

GRANARY_FARM_NAMESPACE_END
