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

#include <granary/core/checked_math.hpp>
#include <granary/core/fmt/int_fmt.hpp> // NOLINT
#include <granary/core/int.hpp>
#include <granary/core/likely.h>
#include <granary/core/result.hpp>
#include <granary/farm/config.hpp>
#include <granary/farm/farm_config.hpp>
#include <granary/farm/farm_state.hpp>
#include <granary/farm/reward_accumulator.hpp>
#include <granary/farm/util/constants.hpp>
#include <granary/farm/vault.hpp>

#include <quill/Quill.h>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

GRANARY_FARM_ANONYMOUS_NAMESPACE_BEGIN

Result<uint256_t> checkpoint_delta(
    uint256_t const &reward_per_round, uint64_t const rounds,
    uint256_t const &total_weight)
{
    BOOST_OUTCOME_TRY(
        auto const emitted, checked_mul(uint256_t{rounds}, reward_per_round));
    return checked_mul_div(emitted, ACC_SCALE, total_weight);
}

GRANARY_FARM_ANONYMOUS_NAMESPACE_END

GRANARY_FARM_NAMESPACE_BEGIN

uint64_t round_index(FarmConfig const &config, uint64_t const now) noexcept
{
    if (now < config.farming_start || config.round_duration == 0) {
        return 0;
    }
    return std::min(
        config.rounds_total, (now - config.farming_start) / config.round_duration);
}

uint64_t round_timestamp(FarmConfig const &config, uint64_t const now) noexcept
{
    return config.farming_start +
           round_index(config, now) * config.round_duration;
}

Result<uint256_t> projected_checkpoint(Farm const &farm, uint64_t const now)
{
    uint64_t const round = round_index(farm.config, now);
    if (round <= farm.last_checkpoint_round || farm.total_weight == 0) {
        return farm.reward_per_weight_checkpoint;
    }
    BOOST_OUTCOME_TRY(
        auto const delta,
        checkpoint_delta(
            farm.config.reward_per_round(),
            round - farm.last_checkpoint_round,
            farm.total_weight));
    return checked_add(farm.reward_per_weight_checkpoint, delta);
}

Result<void> advance(Farm &farm, uint64_t const now)
{
    uint64_t const round = round_index(farm.config, now);
    if (round <= farm.last_checkpoint_round) {
        return outcome::success();
    }
    if (GRANARY_UNLIKELY(farm.total_weight == 0)) {
        LOG_DEBUG(
            "rounds {}..{} elapsed with nothing staked",
            farm.last_checkpoint_round,
            round);
        farm.last_checkpoint_round = round;
        return outcome::success();
    }
    BOOST_OUTCOME_TRY(auto const checkpoint, projected_checkpoint(farm, now));
    LOG_DEBUG(
        "checkpoint {} -> {} at round {}",
        farm.reward_per_weight_checkpoint,
        checkpoint,
        round);
    farm.reward_per_weight_checkpoint = checkpoint;
    farm.last_checkpoint_round = round;
    return outcome::success();
}

Result<uint256_t> pending_units(
    uint256_t const &weight, uint256_t const &checkpoint,
    uint256_t const &vault_checkpoint)
{
    BOOST_OUTCOME_TRY(
        auto const delta, checked_sub(checkpoint, vault_checkpoint));
    return checked_mul_div(weight, delta, ACC_SCALE);
}

Result<void> accrue(Farm &farm, Vault &vault, uint64_t const now)
{
    BOOST_OUTCOME_TRY(advance(farm, now));
    if (vault.checkpoint == farm.reward_per_weight_checkpoint) {
        return outcome::success();
    }
    BOOST_OUTCOME_TRY(
        auto const units,
        pending_units(
            vault.weight, farm.reward_per_weight_checkpoint, vault.checkpoint));
    BOOST_OUTCOME_TRY(
        auto const accrued, checked_add(vault.accrued_units, units));
    vault.accrued_units = accrued;
    vault.checkpoint = farm.reward_per_weight_checkpoint;
    return outcome::success();
}

Result<uint256_t>
project(Farm const &farm, Vault const &vault, uint64_t const now)
{
    BOOST_OUTCOME_TRY(auto const checkpoint, projected_checkpoint(farm, now));
    BOOST_OUTCOME_TRY(
        auto const units,
        pending_units(vault.weight, checkpoint, vault.checkpoint));
    return checked_add(vault.accrued_units, units);
}

Result<uint256_t> farmed_tokens(uint256_t const &units, uint256_t const &rate)
{
    return checked_mul_div(units, rate, SCALE);
}

Result<std::vector<uint256_t>>
farmed_tokens(FarmConfig const &config, uint256_t const &units)
{
    std::vector<uint256_t> tokens;
    tokens.reserve(config.reward_tokens.size());
    for (auto const &reward : config.reward_tokens) {
        BOOST_OUTCOME_TRY(auto const amount, farmed_tokens(units, reward.rate));
        tokens.push_back(amount);
    }
    return tokens;
}

Result<uint256_t> expected_deposit(FarmConfig const &config, size_t const i)
{
    BOOST_OUTCOME_TRY(
        auto const units,
        checked_mul(config.reward_per_round(), uint256_t{config.rounds_total}));
    return farmed_tokens(units, config.reward_tokens.at(i).rate);
}

GRANARY_FARM_NAMESPACE_END
