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
#include <granary/farm/util/constants.hpp>
#include <granary/farm/util/types.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

GRANARY_FARM_NAMESPACE_BEGIN

enum class StakeKind
{
    Fungible,
    NonFungible,
};

struct TokenRate
{
    TokenId id;
    uint256_t rate{SCALE};
};

struct CollectionWeight
{
    CollectionId id;
    uint256_t weight{SCALE}; // weight contributed by each staked item
};

struct BoostCollection
{
    CollectionId id;
    uint64_t boost_bp{0};
};

struct FarmConfig
{
    AccountId owner;
    AccountId treasury;
    StakeKind stake_kind{StakeKind::Fungible};

    std::vector<TokenRate> stake_tokens;
    std::vector<CollectionWeight> collections;
    std::vector<BoostCollection> boost_collections;
    std::vector<TokenRate> reward_tokens;

    // fungible deposit locked per staked item, non-fungible farms only
    std::optional<TokenRate> item_deposit;

    uint64_t fee_rate{0}; // basis points taken from returned fungible stake

    uint256_t total_reward_supply{0};
    uint64_t rounds_total{0};
    uint64_t round_duration{DEFAULT_ROUND_DURATION};
    uint64_t farming_start{0};

    uint256_t reward_per_round() const;
    uint64_t farming_end() const;

    std::optional<size_t> stake_token_index(TokenId const &) const;
    std::optional<size_t> reward_token_index(TokenId const &) const;
    CollectionWeight const *find_collection(CollectionId const &) const;
    BoostCollection const *find_boost_collection(CollectionId const &) const;
};

Result<void> validate(FarmConfig const &);

Result<FarmConfig> parse_farm_config(nlohmann::json const &);
Result<FarmConfig> load_farm_config(std::filesystem::path const &);

GRANARY_FARM_NAMESPACE_END
