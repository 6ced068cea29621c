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
#include <granary/core/task/task_queue.hpp>
#include <granary/farm/clock.hpp>
#include <granary/farm/farm_config.hpp>
#include <granary/farm/farm_controller.hpp>
#include <granary/farm/local_registry.hpp>
#include <granary/farm/settlement.hpp>
#include <granary/farm/test_util/farm_configs.hpp>
#include <granary/farm/token_registry.hpp>
#include <granary/farm/util/constants.hpp>
#include <granary/farm/util/farm_error.hpp>
#include <granary/farm/util/types.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <vector>

using namespace granary;
using namespace granary::farm;
using namespace granary::farm::test;

namespace
{
    constexpr char CUSTODY[] = "farm";
}

struct Controller : public ::testing::Test
{
    task::TaskQueue queue;
    ManualClock clock{BEFORE_START};
    LocalTokenRegistry stk{queue, "stk", CUSTODY};
    LocalTokenRegistry rwd{queue, "rwd", CUSTODY};
    LocalItemRegistry apes{queue, "apes", CUSTODY};
    LocalItemRegistry cheddy{queue, "cheddy", CUSTODY};
    RegistryDirectory registries{
        .tokens = {{"stk", &stk}, {"rwd", &rwd}},
        .collections = {{"apes", &apes}, {"cheddy", &cheddy}}};
    std::unique_ptr<FarmController> controller;

    void SetUp() override
    {
        controller = std::make_unique<FarmController>(
            fungible_config(), queue, registries, clock);
    }

    void open(FarmConfig const &config)
    {
        controller = std::make_unique<FarmController>(
            config, queue, registries, clock);
        open();
    }

    void open()
    {
        ASSERT_FALSE(
            controller->setup_deposit("rwd", 1000 * SCALE).has_error());
        ASSERT_FALSE(controller->finalize_setup("owner").has_error());
    }

    // registers the account with the farm and every token registry
    void join(AccountId const &account)
    {
        ASSERT_FALSE(controller->register_account(account).has_error());
        stk.register_account(account);
        rwd.register_account(account);
    }

    // moves freshly minted stake tokens into custody and notifies the farm
    void deposit(AccountId const &account, uint256_t const &amount)
    {
        stk.mint(account, amount);
        ASSERT_FALSE(stk.transfer(account, CUSTODY, amount).has_error());
        ASSERT_FALSE(controller->stake(account, "stk", amount).has_error());
    }

    void deposit_item(
        LocalItemRegistry &registry, AccountId const &account,
        ItemId const &item, bool const boost)
    {
        registry.mint(account, item);
        ASSERT_FALSE(registry.transfer(account, CUSTODY, item).has_error());
        StakedItem const staked{registry.collection(), item};
        if (boost) {
            ASSERT_FALSE(controller->stake_boost(account, staked).has_error());
        }
        else {
            ASSERT_FALSE(controller->stake_item(account, staked).has_error());
        }
    }

    VaultStatus status(AccountId const &account)
    {
        auto const res = controller->status(account);
        EXPECT_TRUE(res.has_value());
        EXPECT_TRUE(res.value().has_value());
        return res.value().value();
    }
};

TEST_F(Controller, setup)
{
    EXPECT_EQ(controller->phase(), FarmPhase::Setup);
    join("alice");
    EXPECT_EQ(
        controller->stake("alice", "stk", 1).assume_error(),
        FarmError::SetupNotFinalized);
    EXPECT_EQ(
        controller->harvest("alice").assume_error(),
        FarmError::SetupNotFinalized);

    EXPECT_EQ(
        controller->finalize_setup("alice").assume_error(),
        FarmError::PermissionDenied);
    EXPECT_EQ(
        controller->finalize_setup("owner").assume_error(),
        FarmError::DepositMissing);

    EXPECT_EQ(
        controller->setup_deposit("gold", 1000 * SCALE).assume_error(),
        FarmError::UnknownToken);
    EXPECT_EQ(
        controller->setup_deposit("rwd", 999 * SCALE).assume_error(),
        FarmError::WrongDeposit);

    auto deposits = controller->setup_deposits();
    ASSERT_TRUE(deposits.has_value());
    EXPECT_EQ(deposits.value().expected, (std::vector<uint256_t>{1000 * SCALE}));
    EXPECT_EQ(deposits.value().received, (std::vector<uint256_t>{0}));

    ASSERT_FALSE(controller->setup_deposit("rwd", 1000 * SCALE).has_error());
    EXPECT_EQ(
        controller->setup_deposit("rwd", 1000 * SCALE).assume_error(),
        FarmError::WrongDeposit);
    deposits = controller->setup_deposits();
    EXPECT_EQ(deposits.value().received, (std::vector<uint256_t>{1000 * SCALE}));

    ASSERT_FALSE(controller->finalize_setup("owner").has_error());
    EXPECT_EQ(controller->phase(), FarmPhase::Active);
    EXPECT_EQ(
        controller->finalize_setup("owner").assume_error(),
        FarmError::SetupFinalized);
    EXPECT_EQ(
        controller->setup_deposit("rwd", 1000 * SCALE).assume_error(),
        FarmError::SetupFinalized);

    clock.set(FARMING_END);
    EXPECT_EQ(controller->phase(), FarmPhase::Closed);
}

TEST_F(Controller, finalize_after_start)
{
    ASSERT_FALSE(controller->setup_deposit("rwd", 1000 * SCALE).has_error());
    clock.set(FARMING_START);
    EXPECT_EQ(
        controller->finalize_setup("owner").assume_error(),
        FarmError::FinalizeTooLate);
    EXPECT_EQ(controller->phase(), FarmPhase::Setup);
}

TEST_F(Controller, registration)
{
    open();
    EXPECT_EQ(
        controller->register_account("").assume_error(),
        FarmError::InvalidInput);
    ASSERT_FALSE(controller->register_account("alice").has_error());
    EXPECT_EQ(
        controller->register_account("alice").assume_error(),
        FarmError::AccountExists);
    EXPECT_TRUE(controller->is_registered("alice"));
    EXPECT_EQ(
        controller->stake("carol", "stk", 1).assume_error(),
        FarmError::AccountNotRegistered);

    auto const carol = controller->status("carol");
    ASSERT_TRUE(carol.has_value());
    EXPECT_FALSE(carol.value().has_value());

    clock.set(FARMING_START + 3 * ROUND + 20);
    auto const s = status("alice");
    EXPECT_EQ(s.weight, 0);
    EXPECT_EQ(s.staked_amounts, (std::vector<uint256_t>{0}));
    EXPECT_EQ(s.farmed_tokens, (std::vector<uint256_t>{0}));
    EXPECT_EQ(s.recovered, (std::vector<uint256_t>{0}));
    EXPECT_EQ(s.round_timestamp, FARMING_START + 3 * ROUND);
    EXPECT_EQ(controller->params().accounts_registered, 1u);
}

TEST_F(Controller, pause)
{
    open();
    join("alice");
    deposit("alice", 100);

    EXPECT_EQ(
        controller->set_active("alice", false).assume_error(),
        FarmError::PermissionDenied);
    ASSERT_FALSE(controller->set_active("owner", false).has_error());
    EXPECT_FALSE(controller->params().is_active);

    clock.set(FARMING_START + ROUND);
    EXPECT_EQ(
        controller->stake("alice", "stk", 1).assume_error(),
        FarmError::FarmPaused);
    EXPECT_EQ(
        controller->unstake("alice", "stk", 1).assume_error(),
        FarmError::FarmPaused);
    EXPECT_EQ(
        controller->harvest("alice").assume_error(), FarmError::FarmPaused);
    EXPECT_EQ(controller->close("alice").assume_error(), FarmError::FarmPaused);
    // rewards keep accruing while paused
    EXPECT_EQ(status("alice").accrued_units, 100 * SCALE);

    ASSERT_FALSE(controller->set_active("owner", true).has_error());
    auto const receipt = controller->harvest("alice");
    ASSERT_TRUE(receipt.has_value());
    queue.run();
    EXPECT_FALSE(receipt.value().settlement->outcome().has_error());
    EXPECT_EQ(rwd.balance_of("alice"), 100 * SCALE);
}

TEST_F(Controller, staking_window)
{
    open();
    join("alice");
    clock.set(FARMING_END - 1);
    deposit("alice", 10);

    clock.set(FARMING_END);
    EXPECT_EQ(controller->phase(), FarmPhase::Closed);
    EXPECT_EQ(
        controller->stake("alice", "stk", 10).assume_error(),
        FarmError::FarmNotActive);
    // the last round is paid to whoever staked during it
    EXPECT_EQ(status("alice").accrued_units, 100 * SCALE);

    auto const receipt = controller->close("alice");
    ASSERT_TRUE(receipt.has_value());
    queue.run();
    EXPECT_FALSE(receipt.value().settlement->outcome().has_error());
    EXPECT_EQ(stk.balance_of("alice"), 10);
    EXPECT_EQ(rwd.balance_of("alice"), 100 * SCALE);
}

TEST_F(Controller, set_farming_start)
{
    EXPECT_EQ(
        controller->set_farming_start("alice", 2000).assume_error(),
        FarmError::PermissionDenied);
    EXPECT_EQ(
        controller->set_farming_start("owner", BEFORE_START).assume_error(),
        FarmError::InvalidSchedule);
    ASSERT_FALSE(controller->set_farming_start("owner", 2000).has_error());

    auto const params = controller->params();
    EXPECT_EQ(params.farming_start, 2000u);
    EXPECT_EQ(params.farming_end, 2000u + ROUNDS * ROUND);

    // finalizing is allowed until the new start
    clock.set(FARMING_START);
    open();
    clock.set(2000);
    EXPECT_EQ(
        controller->set_farming_start("owner", 3000).assume_error(),
        FarmError::InvalidSchedule);
}

TEST_F(Controller, stake_errors)
{
    open();
    join("alice");
    EXPECT_EQ(
        controller->stake("alice", "gold", 1).assume_error(),
        FarmError::UnknownToken);
    EXPECT_EQ(
        controller->stake("alice", "stk", 0).assume_error(),
        FarmError::InvalidInput);
    EXPECT_EQ(
        controller->stake_item("alice", {"apes", "1"}).assume_error(),
        FarmError::WrongStakeKind);
    EXPECT_EQ(
        controller->unstake("alice", "stk", 1).assume_error(),
        FarmError::InsufficientStake);
    EXPECT_EQ(
        controller->unstake_boost("alice").assume_error(),
        FarmError::NoBoostStaked);

    deposit("alice", 5);
    EXPECT_EQ(
        controller->unstake("alice", "stk", 6).assume_error(),
        FarmError::InsufficientStake);
    EXPECT_EQ(
        controller->unstake_items("alice", "apes", std::nullopt).assume_error(),
        FarmError::WrongStakeKind);
}

TEST_F(Controller, two_stakers)
{
    open();
    join("alice");
    join("bob");
    deposit("alice", 100);
    clock.set(FARMING_START + 5 * ROUND);
    deposit("bob", 300);

    auto params = controller->params();
    EXPECT_EQ(params.total_weight, 400);
    EXPECT_EQ(params.total_staked, (std::vector<uint256_t>{400}));
    EXPECT_EQ(params.last_checkpoint_round, 5u);
    EXPECT_EQ(stk.balance_of(CUSTODY), 400);

    clock.set(FARMING_END);
    EXPECT_EQ(status("alice").farmed_tokens[0], 625 * SCALE);
    EXPECT_EQ(status("bob").farmed_tokens[0], 375 * SCALE);

    auto const harvest = controller->harvest("alice");
    ASSERT_TRUE(harvest.has_value());
    auto const close_bob = controller->close("bob");
    ASSERT_TRUE(close_bob.has_value());
    queue.run();
    EXPECT_FALSE(harvest.value().settlement->outcome().has_error());
    EXPECT_FALSE(close_bob.value().settlement->outcome().has_error());
    EXPECT_EQ(rwd.balance_of("alice"), 625 * SCALE);
    EXPECT_EQ(rwd.balance_of("bob"), 375 * SCALE);
    EXPECT_EQ(stk.balance_of("bob"), 300);
    EXPECT_FALSE(controller->is_registered("bob"));

    auto const close_alice = controller->close("alice");
    ASSERT_TRUE(close_alice.has_value());
    // nothing left to harvest, only the stake goes back
    EXPECT_EQ(close_alice.value().settlement->legs().size(), 1u);
    queue.run();
    EXPECT_FALSE(close_alice.value().settlement->outcome().has_error());
    EXPECT_EQ(stk.balance_of("alice"), 100);
    EXPECT_EQ(stk.balance_of(CUSTODY), 0);

    params = controller->params();
    EXPECT_EQ(params.total_harvested, (std::vector<uint256_t>{1000 * SCALE}));
    EXPECT_EQ(params.total_weight, 0);
    EXPECT_EQ(params.accounts_registered, 0u);
    EXPECT_TRUE(controller->farm().vaults.empty());
}

TEST_F(Controller, receiver_not_registered)
{
    open();
    ASSERT_FALSE(controller->register_account("alice").has_error());
    stk.register_account("alice");
    deposit("alice", 100);
    clock.set(FARMING_END);

    auto const first = controller->harvest("alice");
    ASSERT_TRUE(first.has_value());
    queue.run();
    EXPECT_EQ(
        first.value().settlement->outcome().assume_error(),
        FarmError::RemoteCallFailure);
    EXPECT_EQ(status("alice").accrued_units, 1000 * SCALE);
    EXPECT_EQ(rwd.balance_of("alice"), 0);

    rwd.register_account("alice");
    auto const second = controller->harvest("alice");
    ASSERT_TRUE(second.has_value());
    queue.run();
    EXPECT_FALSE(second.value().settlement->outcome().has_error());
    EXPECT_EQ(rwd.balance_of("alice"), 1000 * SCALE);
    EXPECT_EQ(rwd.remote_calls(), 2u);
}

TEST_F(Controller, registry_unavailable)
{
    open();
    join("alice");
    deposit("alice", 100);
    stk.set_available(false);

    auto const receipt = controller->unstake("alice", "stk", 40);
    ASSERT_TRUE(receipt.has_value());
    EXPECT_EQ(status("alice").staked_amounts[0], 60);
    queue.run();
    EXPECT_EQ(
        receipt.value().settlement->outcome().assume_error(),
        FarmError::RemoteCallFailure);
    EXPECT_EQ(status("alice").staked_amounts[0], 100);
    EXPECT_EQ(stk.balance_of(CUSTODY), 100);
    EXPECT_EQ(stk.balance_of("alice"), 0);
}

TEST_F(Controller, items)
{
    open(item_config());
    join("alice");
    deposit_item(apes, "alice", "1", false);
    deposit_item(apes, "alice", "2", false);
    deposit_item(cheddy, "alice", "9", true);
    EXPECT_EQ(
        controller->stake_item("alice", {"apes", "1"}).assume_error(),
        FarmError::ItemAlreadyStaked);
    EXPECT_EQ(
        controller->stake_item("alice", {"dogs", "1"}).assume_error(),
        FarmError::UnknownCollection);
    EXPECT_EQ(
        controller->stake("alice", "stk", 1).assume_error(),
        FarmError::WrongStakeKind);

    auto const params = controller->params();
    EXPECT_EQ(params.total_items.at("apes"), 2u);
    EXPECT_EQ(params.total_boosts.at("cheddy"), 1u);
    EXPECT_EQ(params.total_weight, 2 * SCALE + SCALE / 2);

    clock.set(FARMING_END);
    auto const receipt = controller->close("alice");
    ASSERT_TRUE(receipt.has_value());
    EXPECT_EQ(receipt.value().settlement->legs().size(), 4u);
    queue.run();
    EXPECT_FALSE(receipt.value().settlement->outcome().has_error());
    ASSERT_NE(apes.owner_of("1"), nullptr);
    EXPECT_EQ(*apes.owner_of("1"), "alice");
    EXPECT_EQ(*apes.owner_of("2"), "alice");
    EXPECT_EQ(*cheddy.owner_of("9"), "alice");
    EXPECT_EQ(rwd.balance_of("alice"), 1000 * SCALE);
    EXPECT_FALSE(controller->is_registered("alice"));
}

TEST_F(Controller, item_deposit)
{
    LocalTokenRegistry chd{queue, "chd", CUSTODY};
    registries.tokens["chd"] = &chd;

    open();
    join("bob");
    EXPECT_EQ(
        controller->deposit_for_items("bob", 1).assume_error(),
        FarmError::WrongStakeKind);

    open(item_config());
    ASSERT_FALSE(controller->register_account("carol").has_error());
    EXPECT_EQ(
        controller->deposit_for_items("carol", 1).assume_error(),
        FarmError::UnknownToken);

    auto config = item_config();
    config.item_deposit = TokenRate{.id = "chd", .rate = 555 * SCALE};
    open(config);
    join("alice");
    chd.register_account("alice");
    EXPECT_EQ(
        controller->deposit_for_items("alice", 0).assume_error(),
        FarmError::InvalidInput);
    EXPECT_EQ(
        controller->deposit_for_items("carol", 1).assume_error(),
        FarmError::AccountNotRegistered);

    chd.mint("alice", 1110 * SCALE);
    ASSERT_FALSE(chd.transfer("alice", CUSTODY, 1110 * SCALE).has_error());
    ASSERT_FALSE(
        controller->deposit_for_items("alice", 1110 * SCALE).has_error());
    deposit_item(apes, "alice", "1", false);
    deposit_item(apes, "alice", "2", false);
    EXPECT_EQ(
        controller->stake_item("alice", {"apes", "3"}).assume_error(),
        FarmError::InsufficientItemDeposit);

    auto const one = controller->unstake_items("alice", "apes", "1");
    ASSERT_TRUE(one.has_value());
    queue.run();
    EXPECT_FALSE(one.value().settlement->outcome().has_error());
    EXPECT_EQ(chd.balance_of("alice"), 555 * SCALE);
    EXPECT_EQ(*apes.owner_of("1"), "alice");
    EXPECT_EQ(status("alice").item_deposit, 555 * SCALE);

    clock.set(FARMING_END);
    auto const close = controller->close("alice");
    ASSERT_TRUE(close.has_value());
    queue.run();
    EXPECT_FALSE(close.value().settlement->outcome().has_error());
    EXPECT_EQ(chd.balance_of("alice"), 1110 * SCALE);
    EXPECT_EQ(chd.balance_of(CUSTODY), 0);
    EXPECT_EQ(*apes.owner_of("2"), "alice");
    EXPECT_EQ(rwd.balance_of("alice"), 1000 * SCALE);
    EXPECT_FALSE(controller->is_registered("alice"));
    registries.tokens.erase("chd");
}
