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
#include <granary/farm/farm_state.hpp>
#include <granary/farm/stake_ledger.hpp>
#include <granary/farm/test_util/farm_configs.hpp>
#include <granary/farm/util/constants.hpp>
#include <granary/farm/util/farm_error.hpp>
#include <granary/farm/util/types.hpp>
#include <granary/farm/vault.hpp>

#include <gtest/gtest.h>

#include <optional>
#include <set>
#include <vector>

using namespace granary;
using namespace granary::farm;
using namespace granary::farm::test;

namespace
{
    FarmConfig two_token_config()
    {
        auto config = fungible_config();
        config.stake_tokens = {
            TokenRate{.id = "stk", .rate = SCALE},
            TokenRate{.id = "lp", .rate = 2 * SCALE}};
        config.boost_collections = {
            BoostCollection{.id = "cheddy", .boost_bp = 1'000}};
        return config;
    }
}

TEST(StakeLedger, fungible_weight_is_smallest_rated_stake)
{
    Farm farm{two_token_config()};
    auto &vault = farm.vault_for("alice");

    ASSERT_FALSE(stake_amount(farm, vault, 0, 10).has_error());
    // a farm with several stake tokens needs all of them
    EXPECT_EQ(vault.weight, 0);
    EXPECT_EQ(farm.total_weight, 0);

    ASSERT_FALSE(stake_amount(farm, vault, 1, 3).has_error());
    EXPECT_EQ(vault.weight, 6);
    EXPECT_EQ(farm.total_weight, 6);
    EXPECT_EQ(farm.total_staked, (std::vector<uint256_t>{10, 3}));

    ASSERT_FALSE(stake_amount(farm, vault, 1, 7).has_error());
    EXPECT_EQ(vault.weight, 10);

    ASSERT_FALSE(unstake_amount(farm, vault, 0, 4).has_error());
    EXPECT_EQ(vault.weight, 6);
    EXPECT_EQ(farm.total_weight, 6);
}

TEST(StakeLedger, boost_scales_weight)
{
    Farm farm{two_token_config()};
    auto &vault = farm.vault_for("alice");
    ASSERT_FALSE(stake_amount(farm, vault, 0, 1000).has_error());
    ASSERT_FALSE(stake_amount(farm, vault, 1, 500).has_error());
    EXPECT_EQ(vault.weight, 1000);

    ASSERT_FALSE(stake_boost(farm, vault, {"cheddy", "7"}).has_error());
    EXPECT_EQ(vault.weight, 1100);
    EXPECT_EQ(farm.total_weight, 1100);
    EXPECT_EQ(farm.total_boosts["cheddy"], 1u);

    EXPECT_EQ(
        stake_boost(farm, vault, {"cheddy", "8"}).assume_error(),
        FarmError::BoostAlreadyStaked);
    EXPECT_EQ(
        stake_boost(farm, vault, {"ape", "1"}).assume_error(),
        FarmError::UnknownCollection);

    auto const boost = unstake_boost(farm, vault);
    ASSERT_FALSE(boost.has_error());
    EXPECT_EQ(boost.value(), (StakedItem{"cheddy", "7"}));
    EXPECT_EQ(vault.weight, 1000);
    EXPECT_EQ(farm.total_boosts["cheddy"], 0u);
    EXPECT_EQ(
        unstake_boost(farm, vault).assume_error(), FarmError::NoBoostStaked);
}

TEST(StakeLedger, unstake_more_than_staked)
{
    Farm farm{fungible_config()};
    auto &vault = farm.vault_for("alice");
    ASSERT_FALSE(stake_amount(farm, vault, 0, 5).has_error());

    EXPECT_EQ(
        unstake_amount(farm, vault, 0, 6).assume_error(),
        FarmError::InsufficientStake);
    EXPECT_EQ(vault.staked_amounts[0], 5);
    EXPECT_EQ(vault.weight, 5);

    EXPECT_EQ(
        unstake_amount(farm, vault, 0, 0).assume_error(),
        FarmError::InvalidInput);
    EXPECT_EQ(
        stake_amount(farm, vault, 3, 1).assume_error(),
        FarmError::UnknownToken);
}

TEST(StakeLedger, wrong_stake_kind)
{
    Farm fungible{fungible_config()};
    auto &v1 = fungible.vault_for("alice");
    EXPECT_EQ(
        stake_item(fungible, v1, {"apes", "1"}).assume_error(),
        FarmError::WrongStakeKind);

    Farm items{item_config()};
    auto &v2 = items.vault_for("alice");
    EXPECT_EQ(
        stake_amount(items, v2, 0, 1).assume_error(),
        FarmError::WrongStakeKind);
}

TEST(StakeLedger, items)
{
    Farm farm{item_config()};
    auto &vault = farm.vault_for("alice");

    ASSERT_FALSE(stake_item(farm, vault, {"apes", "1"}).has_error());
    ASSERT_FALSE(stake_item(farm, vault, {"apes", "2"}).has_error());
    ASSERT_FALSE(stake_item(farm, vault, {"apes", "3"}).has_error());
    EXPECT_EQ(vault.weight, 3 * SCALE);
    EXPECT_EQ(farm.total_items["apes"], 3u);
    EXPECT_EQ(
        stake_item(farm, vault, {"apes", "2"}).assume_error(),
        FarmError::ItemAlreadyStaked);
    EXPECT_EQ(
        stake_item(farm, vault, {"dogs", "1"}).assume_error(),
        FarmError::UnknownCollection);

    ASSERT_FALSE(stake_boost(farm, vault, {"cheddy", "9"}).has_error());
    EXPECT_EQ(vault.weight, 3 * SCALE + 3 * SCALE / 4);

    auto const one = unstake_items(farm, vault, "apes", "2");
    ASSERT_FALSE(one.has_error());
    EXPECT_EQ(one.value(), (std::vector<StakedItem>{{"apes", "2"}}));
    EXPECT_EQ(vault.staked_items.at("apes"), (std::set<ItemId>{"1", "3"}));
    EXPECT_EQ(vault.weight, 2 * SCALE + 2 * SCALE / 4);

    EXPECT_EQ(
        unstake_items(farm, vault, "apes", "2").assume_error(),
        FarmError::UnknownItem);

    auto const rest = unstake_items(farm, vault, "apes", std::nullopt);
    ASSERT_FALSE(rest.has_error());
    EXPECT_EQ(rest.value().size(), 2u);
    EXPECT_TRUE(vault.staked_items.empty());
    EXPECT_EQ(vault.weight, 0);
    EXPECT_EQ(farm.total_items["apes"], 0u);
    EXPECT_EQ(
        unstake_items(farm, vault, "apes", std::nullopt).assume_error(),
        FarmError::InsufficientStake);
}

TEST(StakeLedger, item_deposit)
{
    auto config = item_config();
    config.item_deposit = TokenRate{.id = "chd", .rate = 555};
    Farm farm{config};
    auto &vault = farm.vault_for("alice");

    EXPECT_EQ(required_item_deposit(config, 3).value(), 1665);
    EXPECT_EQ(required_item_deposit(item_config(), 3).value(), 0);
    EXPECT_EQ(
        deposit_for_items(farm, vault, 0).assume_error(),
        FarmError::InvalidInput);

    ASSERT_FALSE(deposit_for_items(farm, vault, 1000).has_error());
    EXPECT_EQ(vault.item_deposit, 1000);
    EXPECT_EQ(farm.total_item_deposit, 1000);
    // a deposit carries no weight but keeps the vault
    EXPECT_EQ(vault.weight, 0);
    EXPECT_TRUE(vault.has_stake());

    auto const one = release_item_deposit(farm, vault, 1);
    ASSERT_FALSE(one.has_error());
    EXPECT_EQ(one.value(), 555);
    // never more than what is held
    auto const rest = release_item_deposit(farm, vault, 2);
    ASSERT_FALSE(rest.has_error());
    EXPECT_EQ(rest.value(), 445);
    EXPECT_EQ(vault.item_deposit, 0);
    EXPECT_EQ(farm.total_item_deposit, 0);

    ASSERT_FALSE(deposit_for_items(farm, vault, 700).has_error());
    ASSERT_FALSE(stake_item(farm, vault, {"apes", "1"}).has_error());
    auto const release = unstake_all(farm, vault);
    ASSERT_FALSE(release.has_error());
    EXPECT_EQ(release.value().item_deposit, 700);
    EXPECT_EQ(vault.item_deposit, 0);
    EXPECT_EQ(farm.total_item_deposit, 0);
    EXPECT_TRUE(vault.is_empty());

    Farm fungible{fungible_config()};
    EXPECT_EQ(
        deposit_for_items(fungible, fungible.vault_for("bob"), 1)
            .assume_error(),
        FarmError::WrongStakeKind);
}

TEST(StakeLedger, unstake_all)
{
    Farm farm{two_token_config()};
    auto &vault = farm.vault_for("alice");
    ASSERT_FALSE(stake_amount(farm, vault, 0, 40).has_error());
    ASSERT_FALSE(stake_amount(farm, vault, 1, 20).has_error());
    ASSERT_FALSE(stake_boost(farm, vault, {"cheddy", "1"}).has_error());
    vault.accrued_units = 77;

    auto const release = unstake_all(farm, vault);
    ASSERT_FALSE(release.has_error());
    EXPECT_EQ(release.value().amounts, (std::vector<uint256_t>{40, 20}));
    EXPECT_EQ(release.value().boost, (StakedItem{"cheddy", "1"}));
    EXPECT_TRUE(release.value().items.empty());

    EXPECT_EQ(vault.weight, 0);
    EXPECT_EQ(farm.total_weight, 0);
    EXPECT_EQ(farm.total_staked, (std::vector<uint256_t>{0, 0}));
    EXPECT_FALSE(vault.has_stake());
    // rewards are not the ledger's business
    EXPECT_EQ(vault.accrued_units, 77);
    EXPECT_FALSE(vault.is_empty());
}
