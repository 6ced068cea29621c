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

#include <cstddef>
#include <cstdint>
#include <vector>

GRANARY_FARM_NAMESPACE_BEGIN

struct Farm;
struct FarmConfig;
struct Vault;

// Index of the last round that has fully elapsed at `now`, clamped to the
// farming window. Zero before farming starts.
uint64_t round_index(FarmConfig const &, uint64_t now) noexcept;

// start time of the round returned by round_index
uint64_t round_timestamp(FarmConfig const &, uint64_t now) noexcept;

// The farm checkpoint as it would be after advancing to `now`.
Result<uint256_t> projected_checkpoint(Farm const &, uint64_t now);

// Moves the farm checkpoint forward to the current round. Rounds elapsed
// with nothing staked are skipped and their emission is forfeited.
Result<void> advance(Farm &, uint64_t now);

// weight * (checkpoint - vault_checkpoint) / ACC_SCALE, rounded down
Result<uint256_t> pending_units(
    uint256_t const &weight, uint256_t const &checkpoint,
    uint256_t const &vault_checkpoint);

// Brings the vault up to date with the farm. Must run before any read or
// change of the vault's weight or accrued units.
Result<void> accrue(Farm &, Vault &, uint64_t now);

// accrued units of the vault as of `now`, without changing any state
Result<uint256_t> project(Farm const &, Vault const &, uint64_t now);

Result<uint256_t> farmed_tokens(uint256_t const &units, uint256_t const &rate);

// units converted to every reward token of the farm
Result<std::vector<uint256_t>>
farmed_tokens(FarmConfig const &, uint256_t const &units);

// deposit of reward token `i` required before setup can be finalized
Result<uint256_t> expected_deposit(FarmConfig const &, size_t i);

GRANARY_FARM_NAMESPACE_END
