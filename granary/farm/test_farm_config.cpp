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

#include <granary/core/int.hpp>
#include <granary/farm/farm_config.hpp>
#include <granary/farm/test_util/farm_configs.hpp>
#include <granary/farm/util/constants.hpp>
#include <granary/farm/util/farm_error.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

using namespace granary;
using namespace granary::farm;
using namespace granary::farm::test;

namespace
{
    nlohmann::json farm_json()
    {
        return nlohmann::json::parse(R"({
            "owner": "owner",
            "treasury": "dao",
            "stake_kind": "fungible",
            "stake_tokens": [
                {"id": "stk", "rate": "1000000000000000000000000"},
                {"id": "lp", "rate": "2000000000000000000000000"}
            ],
            "reward_tokens": [{"id": "rwd"}],
            "boost_collections": [{"id": "cheddy", "boost_bp": 1500}],
            "fee_rate": 25,
            "total_reward_supply": "1000000000000000000000000000",
            "rounds_total": 10,
            "round_duration": 3600,
            "farming_start": 1700000000
        })");
    }
}

TEST(FarmConfig, parse)
{
    auto const res = parse_farm_config(farm_json());
    ASSERT_FALSE(res.has_error());
    auto const &config = res.value();
    EXPECT_EQ(config.owner, "owner");
    EXPECT_EQ(config.treasury, "dao");
    EXPECT_EQ(config.stake_kind, StakeKind::Fungible);
    ASSERT_EQ(config.stake_tokens.size(), 2u);
    EXPECT_EQ(config.stake_tokens[1].rate, 2 * SCALE);
    ASSERT_EQ(config.reward_tokens.size(), 1u);
    EXPECT_EQ(config.reward_tokens[0].rate, SCALE);
    EXPECT_EQ(config.boost_collections[0].boost_bp, 1500u);
    EXPECT_EQ(config.fee_rate, 25u);
    EXPECT_EQ(config.total_reward_supply, 1000 * SCALE);
    EXPECT_EQ(config.reward_per_round(), 100 * SCALE);
    EXPECT_EQ(config.farming_end(), 1700000000u + 36000u);
    EXPECT_EQ(config.stake_token_index("lp"), 1u);
    EXPECT_FALSE(config.stake_token_index("rwd").has_value());
}

TEST(FarmConfig, treasury_defaults_to_owner)
{
    auto j = farm_json();
    j.erase("treasury");
    auto const res = parse_farm_config(j);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().treasury, "owner");
}

TEST(FarmConfig, missing_field)
{
    auto j = farm_json();
    j.erase("rounds_total");
    EXPECT_EQ(parse_farm_config(j).assume_error(), FarmError::InvalidConfig);
}

TEST(FarmConfig, malformed_amount)
{
    auto j = farm_json();
    j["total_reward_supply"] = "lots";
    EXPECT_EQ(parse_farm_config(j).assume_error(), FarmError::InvalidConfig);
}

TEST(FarmConfig, unknown_stake_kind)
{
    auto j = farm_json();
    j["stake_kind"] = "semi_fungible";
    EXPECT_EQ(parse_farm_config(j).assume_error(), FarmError::InvalidConfig);
}

TEST(FarmConfig, validate)
{
    EXPECT_FALSE(validate(fungible_config()).has_error());
    EXPECT_FALSE(validate(item_config()).has_error());

    {
        // supply must split evenly into rounds
        auto config = fungible_config();
        config.total_reward_supply = 1000 * SCALE + 1;
        EXPECT_EQ(validate(config).assume_error(), FarmError::InvalidConfig);
    }
    {
        auto config = fungible_config();
        config.rounds_total = 0;
        EXPECT_EQ(validate(config).assume_error(), FarmError::InvalidConfig);
    }
    {
        auto config = fungible_config();
        config.fee_rate = BASIS_POINTS + 1;
        EXPECT_EQ(validate(config).assume_error(), FarmError::InvalidConfig);
    }
    {
        auto config = fungible_config();
        config.reward_tokens.push_back(config.reward_tokens[0]);
        EXPECT_EQ(validate(config).assume_error(), FarmError::InvalidConfig);
    }
    {
        auto config = item_config();
        config.stake_tokens = fungible_config().stake_tokens;
        EXPECT_EQ(validate(config).assume_error(), FarmError::InvalidConfig);
    }
    {
        auto config = fungible_config();
        config.reward_tokens[0].rate = 0;
        EXPECT_EQ(validate(config).assume_error(), FarmError::InvalidConfig);
    }
    {
        // item deposits only make sense for item farms
        auto config = fungible_config();
        config.item_deposit = TokenRate{.id = "chd", .rate = 1};
        EXPECT_EQ(validate(config).assume_error(), FarmError::InvalidConfig);
    }
    {
        auto config = item_config();
        config.item_deposit = TokenRate{.id = "chd", .rate = 0};
        EXPECT_EQ(validate(config).assume_error(), FarmError::InvalidConfig);
    }
}

TEST(FarmConfig, item_deposit)
{
    auto j = farm_json();
    j["stake_kind"] = "non_fungible";
    j.erase("stake_tokens");
    j["collections"] = nlohmann::json::parse(R"([{"id": "apes"}])");
    j["item_deposit"] = nlohmann::json::parse(
        R"({"id": "chd", "rate": "555000000000000000000000000"})");
    auto const config = parse_farm_config(j);
    ASSERT_TRUE(config.has_value());
    ASSERT_TRUE(config.value().item_deposit.has_value());
    EXPECT_EQ(config.value().item_deposit->id, "chd");
    EXPECT_EQ(config.value().item_deposit->rate, 555 * SCALE);

    EXPECT_FALSE(
        parse_farm_config(farm_json()).value().item_deposit.has_value());
}

TEST(FarmConfig, load_from_file)
{
    auto const path = std::filesystem::temp_directory_path() /
                      "granary_test_farm_config.json";
    {
        std::ofstream out{path};
        out << farm_json().dump(4);
    }
    auto const res = load_farm_config(path);
    std::filesystem::remove(path);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().round_duration, 3600u);

    EXPECT_EQ(
        load_farm_config(path).assume_error(), FarmError::InvalidConfig);
}
