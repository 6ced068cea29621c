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

#include <granary/core/assert.h>
#include <granary/core/checked_math.hpp>
#include <granary/core/fmt/int_fmt.hpp> // NOLINT
#include <granary/core/int.hpp>
#include <granary/core/likely.h>
#include <granary/core/result.hpp>
#include <granary/core/task/task_queue.hpp>
#include <granary/farm/clock.hpp>
#include <granary/farm/config.hpp>
#include <granary/farm/farm_state.hpp>
#include <granary/farm/reward_accumulator.hpp>
#include <granary/farm/settlement.hpp>
#include <granary/farm/stake_ledger.hpp>
#include <granary/farm/token_registry.hpp>
#include <granary/farm/util/constants.hpp>
#include <granary/farm/util/farm_error.hpp>
#include <granary/farm/vault.hpp>

#include <quill/Quill.h>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

GRANARY_FARM_ANONYMOUS_NAMESPACE_BEGIN

char const *to_string(LegKind const kind)
{
    switch (kind) {
    case LegKind::RewardCredit:
        return "reward credit";
    case LegKind::StakeReturn:
        return "stake return";
    case LegKind::ItemReturn:
        return "item return";
    case LegKind::BoostReturn:
        return "boost return";
    case LegKind::DepositReturn:
        return "deposit return";
    case LegKind::FeeWithdrawal:
        return "fee withdrawal";
    }
    return "unknown";
}

char const *to_string(SettlementKind const kind)
{
    switch (kind) {
    case SettlementKind::Harvest:
        return "harvest";
    case SettlementKind::Unstake:
        return "unstake";
    case SettlementKind::Close:
        return "close";
    case SettlementKind::FeeWithdrawal:
        return "fee withdrawal";
    }
    return "unknown";
}

GRANARY_FARM_ANONYMOUS_NAMESPACE_END

GRANARY_FARM_NAMESPACE_BEGIN

Settlement::Settlement(
    uint64_t const id, SettlementKind const kind, AccountId account,
    Reservation reserved)
    : id_{id}
    , kind_{kind}
    , account_{std::move(account)}
    , reserved_{std::move(reserved)}
{
}

size_t Settlement::failed_legs() const noexcept
{
    return static_cast<size_t>(
        std::count_if(legs_.begin(), legs_.end(), [](Leg const &leg) {
            return leg.state == LegState::Failed;
        }));
}

Result<void> Settlement::outcome() const
{
    if (!finalized_) {
        return FarmError::SettlementPending;
    }
    if (error_ != FarmError::Success) {
        return error_;
    }
    return outcome::success();
}

SettlementEngine::SettlementEngine(
    Farm &farm, task::TaskQueue &queue, RegistryDirectory const &registries,
    Clock const &clock)
    : farm_{farm}
    , queue_{queue}
    , registries_{registries}
    , clock_{clock}
{
}

Result<std::vector<uint256_t>> SettlementEngine::reward_amounts(
    uint256_t const &units, std::vector<uint256_t> const &recovered) const
{
    BOOST_OUTCOME_TRY(auto amounts, farmed_tokens(farm_.config, units));
    for (size_t i = 0; i < amounts.size() && i < recovered.size(); ++i) {
        BOOST_OUTCOME_TRY(amounts[i], checked_add(amounts[i], recovered[i]));
    }
    return amounts;
}

Reservation SettlementEngine::reserve_rewards(Vault &vault)
{
    Reservation reserved;
    reserved.reward_units = vault.accrued_units;
    reserved.recovered = vault.recovered;
    vault.accrued_units = 0;
    std::fill(vault.recovered.begin(), vault.recovered.end(), uint256_t{0});
    return reserved;
}

Result<SettlementTicket> SettlementEngine::dispatch(
    SettlementKind const kind, AccountId const &account, Reservation reserved)
{
    Vault *const vault = farm_.find_vault(account);
    GRANARY_ASSERT(vault != nullptr);

    // build every leg before touching the farm
    std::vector<Leg> legs;
    BOOST_OUTCOME_TRY(
        auto const rewards,
        reward_amounts(reserved.reward_units, reserved.recovered));
    for (size_t i = 0; i < rewards.size(); ++i) {
        if (rewards[i] == 0) {
            continue;
        }
        legs.push_back(Leg{
            .kind = LegKind::RewardCredit,
            .token = i,
            .amount = rewards[i],
            .recovered =
                i < reserved.recovered.size() ? reserved.recovered[i]
                                              : uint256_t{0}});
    }
    size_t const reward_legs = legs.size();

    std::vector<uint256_t> retained_fees(farm_.config.stake_tokens.size());
    for (size_t i = 0; i < reserved.stake_amounts.size(); ++i) {
        auto const &gross = reserved.stake_amounts[i];
        if (gross == 0) {
            continue;
        }
        BOOST_OUTCOME_TRY(
            auto const fee,
            checked_mul_div(
                gross,
                uint256_t{farm_.config.fee_rate},
                uint256_t{BASIS_POINTS}));
        if (GRANARY_UNLIKELY(fee == gross)) {
            // nothing left to send back
            retained_fees[i] = fee;
            continue;
        }
        legs.push_back(Leg{
            .kind = LegKind::StakeReturn,
            .token = i,
            .amount = gross - fee,
            .fee = fee});
    }
    for (auto const &item : reserved.items) {
        legs.push_back(Leg{.kind = LegKind::ItemReturn, .item = item});
    }
    if (reserved.boost.has_value()) {
        legs.push_back(
            Leg{.kind = LegKind::BoostReturn, .item = reserved.boost});
    }
    if (reserved.item_deposit != 0) {
        legs.push_back(Leg{
            .kind = LegKind::DepositReturn, .amount = reserved.item_deposit});
    }

    auto harvested = farm_.total_harvested;
    for (size_t i = 0; i < reward_legs; ++i) {
        BOOST_OUTCOME_TRY(
            harvested[legs[i].token],
            checked_add(harvested[legs[i].token], legs[i].amount));
    }
    auto fees = farm_.fee_collected;
    for (size_t i = 0; i < retained_fees.size(); ++i) {
        BOOST_OUTCOME_TRY(fees[i], checked_add(fees[i], retained_fees[i]));
    }

    // commit
    farm_.total_harvested = std::move(harvested);
    farm_.fee_collected = std::move(fees);
    ++vault->in_flight;
    if (reserved.boost.has_value()) {
        vault->boost_in_flight = true;
    }

    auto settlement = std::make_shared<Settlement>(
        next_id_++, kind, account, std::move(reserved));
    settlement->legs_ = std::move(legs);
    settlement->outstanding_ = settlement->legs_.size();
    settlement->reward_legs_ = reward_legs;

    LOG_INFO(
        "settlement {}: {} for {} with {} legs",
        settlement->id_,
        to_string(kind),
        account,
        settlement->legs_.size());

    if (settlement->legs_.empty()) {
        queue_.submit([this, settlement] { finalize(*settlement); });
    }
    for (size_t i = 0; i < settlement->legs_.size(); ++i) {
        issue(settlement, i);
    }
    return SettlementTicket{settlement};
}

Result<SettlementTicket> SettlementEngine::withdraw_fees()
{
    std::vector<Leg> legs;
    for (size_t i = 0; i < farm_.fee_collected.size(); ++i) {
        if (farm_.fee_collected[i] != 0) {
            legs.push_back(Leg{
                .kind = LegKind::FeeWithdrawal,
                .token = i,
                .amount = farm_.fee_collected[i]});
        }
    }
    if (GRANARY_UNLIKELY(legs.empty())) {
        return FarmError::NothingToWithdraw;
    }

    Reservation reserved;
    reserved.fees = farm_.fee_collected;
    std::fill(
        farm_.fee_collected.begin(), farm_.fee_collected.end(), uint256_t{0});

    auto settlement = std::make_shared<Settlement>(
        next_id_++,
        SettlementKind::FeeWithdrawal,
        farm_.config.treasury,
        std::move(reserved));
    settlement->legs_ = std::move(legs);
    settlement->outstanding_ = settlement->legs_.size();

    LOG_INFO(
        "settlement {}: fee withdrawal to {} with {} legs",
        settlement->id_,
        settlement->account_,
        settlement->legs_.size());

    for (size_t i = 0; i < settlement->legs_.size(); ++i) {
        issue(settlement, i);
    }
    return SettlementTicket{settlement};
}

void SettlementEngine::fail_unroutable(Completion completion, size_t const leg)
{
    LOG_ERROR("no registry to route leg {}", leg);
    queue_.submit([completion = std::move(completion)] {
        completion(RegistryError::NoRegistry);
    });
}

void SettlementEngine::issue(
    std::shared_ptr<Settlement> const &settlement, size_t const i)
{
    Leg const &leg = settlement->legs_[i];
    Completion completion = [this, settlement, i](Result<void> res) {
        reconcile(settlement, i, res);
    };
    switch (leg.kind) {
    case LegKind::RewardCredit: {
        auto *const registry =
            registries_.find_token(farm_.config.reward_tokens[leg.token].id);
        if (GRANARY_UNLIKELY(registry == nullptr)) {
            fail_unroutable(std::move(completion), i);
            return;
        }
        registry->credit(settlement->account_, leg.amount, std::move(completion));
        return;
    }
    case LegKind::StakeReturn:
    case LegKind::FeeWithdrawal: {
        auto *const registry =
            registries_.find_token(farm_.config.stake_tokens[leg.token].id);
        if (GRANARY_UNLIKELY(registry == nullptr)) {
            fail_unroutable(std::move(completion), i);
            return;
        }
        registry->debit_transfer(
            settlement->account_, leg.amount, std::move(completion));
        return;
    }
    case LegKind::DepositReturn: {
        auto *const registry =
            farm_.config.item_deposit.has_value()
                ? registries_.find_token(farm_.config.item_deposit->id)
                : nullptr;
        if (GRANARY_UNLIKELY(registry == nullptr)) {
            fail_unroutable(std::move(completion), i);
            return;
        }
        registry->debit_transfer(
            settlement->account_, leg.amount, std::move(completion));
        return;
    }
    case LegKind::ItemReturn:
    case LegKind::BoostReturn: {
        auto *const registry = registries_.find_collection(leg.item->collection);
        if (GRANARY_UNLIKELY(registry == nullptr)) {
            fail_unroutable(std::move(completion), i);
            return;
        }
        registry->transfer_item(
            settlement->account_, *leg.item, std::move(completion));
        return;
    }
    }
}

void SettlementEngine::reconcile(
    std::shared_ptr<Settlement> const &settlement, size_t const i,
    Result<void> const &res)
{
    Leg &leg = settlement->legs_[i];
    GRANARY_ASSERT(leg.state == LegState::Pending);
    GRANARY_ASSERT(settlement->outstanding_ > 0);

    Result<void> booked = outcome::success();
    if (res.has_value()) {
        leg.state = LegState::Succeeded;
        if (leg.kind == LegKind::StakeReturn && leg.fee != 0) {
            auto const fees = checked_add(
                farm_.fee_collected[leg.token], leg.fee);
            if (fees.has_value()) {
                farm_.fee_collected[leg.token] = fees.value();
            }
            else {
                booked = FarmError::InternalError;
            }
        }
        else if (leg.kind == LegKind::BoostReturn) {
            Vault *const vault = farm_.find_vault(settlement->account_);
            GRANARY_ASSERT(vault != nullptr);
            vault->boost_in_flight = false;
        }
    }
    else {
        leg.state = LegState::Failed;
        LOG_WARNING(
            "settlement {}: {} leg {} to {} failed: {}",
            settlement->id_,
            to_string(leg.kind),
            i,
            settlement->account_,
            res.error().message().c_str());
        booked = compensate(*settlement, leg);
    }

    if (leg.kind == LegKind::RewardCredit) {
        ++settlement->reward_settled_;
        if (leg.state == LegState::Failed) {
            ++settlement->reward_failed_;
        }
        if (settlement->reward_settled_ == settlement->reward_legs_ &&
            settlement->reward_failed_ > 0 && !booked.has_error()) {
            booked = compensate_rewards(*settlement);
        }
    }

    if (GRANARY_UNLIKELY(booked.has_error())) {
        LOG_ERROR(
            "settlement {}: unable to book leg {}: {}",
            settlement->id_,
            i,
            booked.error().message().c_str());
        settlement->internal_error_ = true;
    }

    if (--settlement->outstanding_ == 0) {
        queue_.submit([this, settlement] { finalize(*settlement); });
    }
}

Result<void> SettlementEngine::compensate(Settlement &settlement, Leg const &leg)
{
    if (leg.kind == LegKind::FeeWithdrawal) {
        BOOST_OUTCOME_TRY(
            auto const fees,
            checked_add(farm_.fee_collected[leg.token], leg.amount));
        farm_.fee_collected[leg.token] = fees;
        return outcome::success();
    }

    Vault *const vault = farm_.find_vault(settlement.account_);
    GRANARY_ASSERT(vault != nullptr);
    // restored stake must not earn for the time it was away
    BOOST_OUTCOME_TRY(accrue(farm_, *vault, clock_.now()));

    switch (leg.kind) {
    case LegKind::RewardCredit: {
        BOOST_OUTCOME_TRY(
            auto const harvested,
            checked_sub(farm_.total_harvested[leg.token], leg.amount));
        farm_.total_harvested[leg.token] = harvested;
        // the reward itself is restored once every reward leg settled
        return outcome::success();
    }
    case LegKind::StakeReturn: {
        BOOST_OUTCOME_TRY(auto const gross, checked_add(leg.amount, leg.fee));
        return stake_amount(farm_, *vault, leg.token, gross);
    }
    case LegKind::ItemReturn:
        return stake_item(farm_, *vault, *leg.item);
    case LegKind::BoostReturn:
        vault->boost_in_flight = false;
        return stake_boost(farm_, *vault, *leg.item);
    case LegKind::DepositReturn:
        return deposit_for_items(farm_, *vault, leg.amount);
    case LegKind::FeeWithdrawal:
        break;
    }
    return FarmError::InternalError;
}

Result<void> SettlementEngine::compensate_rewards(Settlement &settlement)
{
    Vault *const vault = farm_.find_vault(settlement.account_);
    GRANARY_ASSERT(vault != nullptr);
    BOOST_OUTCOME_TRY(accrue(farm_, *vault, clock_.now()));

    auto accrued = vault->accrued_units;
    auto recovered = vault->recovered;
    bool const nothing_paid =
        settlement.reward_failed_ == settlement.reward_legs_;
    if (nothing_paid) {
        // put the reservation back exactly as it was taken
        BOOST_OUTCOME_TRY(
            accrued,
            checked_add(accrued, settlement.reserved_.reward_units));
    }
    for (auto const &leg : settlement.legs_) {
        if (leg.kind != LegKind::RewardCredit ||
            leg.state != LegState::Failed) {
            continue;
        }
        // once any reward token was paid the units are spent; the tokens
        // that did not arrive are owed as recovered balances
        auto const &owed = nothing_paid ? leg.recovered : leg.amount;
        BOOST_OUTCOME_TRY(
            recovered[leg.token], checked_add(recovered[leg.token], owed));
    }
    vault->accrued_units = accrued;
    vault->recovered = std::move(recovered);
    LOG_WARNING(
        "settlement {}: restored rewards of {} ({} of {} reward legs failed)",
        settlement.id_,
        settlement.account_,
        settlement.reward_failed_,
        settlement.reward_legs_);
    return outcome::success();
}

void SettlementEngine::finalize(Settlement &settlement)
{
    GRANARY_ASSERT(!settlement.finalized_);
    GRANARY_ASSERT(settlement.outstanding_ == 0);

    size_t const failed = settlement.failed_legs();
    FarmError error = FarmError::Success;
    if (GRANARY_UNLIKELY(settlement.internal_error_)) {
        error = FarmError::InternalError;
    }
    else if (failed != 0) {
        error = settlement.legs_.size() == 1
                    ? FarmError::RemoteCallFailure
                    : FarmError::PartialSettlementFailure;
    }

    if (settlement.kind_ != SettlementKind::FeeWithdrawal) {
        Vault *const vault = farm_.find_vault(settlement.account_);
        GRANARY_ASSERT(vault != nullptr && vault->in_flight > 0);
        --vault->in_flight;
        if (settlement.kind_ == SettlementKind::Close &&
            error == FarmError::Success) {
            vault->close_requested = true;
        }
        if (vault->is_empty()) {
            bool const closed = vault->close_requested;
            farm_.vaults.erase(settlement.account_);
            if (closed) {
                farm_.registered.erase(settlement.account_);
                LOG_INFO("account {} closed", settlement.account_);
            }
        }
    }

    settlement.error_ = error;
    settlement.finalized_ = true;
    if (error == FarmError::Success) {
        LOG_INFO(
            "settlement {}: {} for {} finalized",
            settlement.id_,
            to_string(settlement.kind_),
            settlement.account_);
    }
    else {
        LOG_ERROR(
            "settlement {}: {} for {} finalized with {} of {} legs failed",
            settlement.id_,
            to_string(settlement.kind_),
            settlement.account_,
            failed,
            settlement.legs_.size());
    }
}

GRANARY_FARM_NAMESPACE_END
