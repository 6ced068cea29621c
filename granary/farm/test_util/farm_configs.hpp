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
#include <granary/farm/farm_config.hpp>
#include <granary/farm/test_util/config.hpp>
#include <granary/farm/util/constants.hpp>

GRANARY_FARM_TEST_NAMESPACE_BEGIN

inline constexpr uint64_t FARMING_START = 1000;
inline constexpr uint64_t ROUND = 60;
inline constexpr uint64_t ROUNDS = 10;
inline constexpr uint64_t FARMING_END = FARMING_START + ROUNDS * ROUND;
inline constexpr uint64_t BEFORE_START = 900;

// 1000 reward tokens over 10 one minute rounds for a single stake token
inline FarmConfig fungible_config()
{
    FarmConfig config;
    config.owner = "owner";
    config.treasury = "treasury";
    config.stake_kind = StakeKind::Fungible;
    config.stake_tokens = {TokenRate{.id = "stk", .rate = SCALE}};
    config.reward_tokens = {TokenRate{.id = "rwd", .rate = SCALE}};
    config.total_reward_supply = 1000 * SCALE;
    config.rounds_total = ROUNDS;
    config.round_duration = ROUND;
    config.farming_start = FARMING_START;
    return config;
}

inline FarmConfig item_config()
{
    FarmConfig config = fungible_config();
    config.stake_kind = StakeKind::NonFungible;
    config.stake_tokens.clear();
    config.collections = {CollectionWeight{.id = "apes", .weight = SCALE}};
    config.boost_collections = {
        BoostCollection{.id = "cheddy", .boost_bp = 2'500}};
    return config;
}

GRANARY_FARM_TEST_NAMESPACE_END
