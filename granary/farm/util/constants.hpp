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
#include <granary/farm/config.hpp>

#include <cstdint>

#include <intx/intx.hpp>

GRANARY_FARM_NAMESPACE_BEGIN

using namespace intx::literals;

// unit of every rate: a token rate of SCALE converts one unit to one token
inline constexpr uint256_t SCALE{1000000000000000000000000_u256}; // 1e24

// fixed point scale of the reward per weight checkpoint
inline constexpr uint256_t ACC_SCALE{1000000000000000000000000_u256}; // 1e24

inline constexpr uint64_t BASIS_POINTS{10'000};

inline constexpr uint64_t DEFAULT_ROUND_DURATION{60}; // seconds

static_assert(SCALE > 0 && ACC_SCALE > 0);

GRANARY_FARM_NAMESPACE_END
