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
#include <granary/farm/util/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

GRANARY_FARM_NAMESPACE_BEGIN

struct FarmConfig;

// Per account farming state. Reward quantities are held in units until they
// are paid out; accrued_units is zeroed before any payout is dispatched and
// restored by the settlement engine if the payout fails.
struct Vault
{
    uint256_t weight{0};
    uint256_t checkpoint{0};
    uint256_t accrued_units{0};

    std::vector<uint256_t> staked_amounts; // per stake token
    StakedItems staked_items;
    std::optional<StakedItem> boost_item;
    uint256_t item_deposit{0};

    // reward tokens which failed to pay out while another reward token of
    // the same payout succeeded
    std::vector<uint256_t> recovered; // per reward token

    uint64_t in_flight{0};
    bool boost_in_flight{false};

    // set by a close that settled; the account is unregistered once the
    // last settlement leaves the vault empty
    bool close_requested{false};

    static Vault create(FarmConfig const &, uint256_t const &checkpoint);

    size_t item_count() const;
    bool has_item(StakedItem const &) const;
    bool has_stake() const;
    bool has_rewards() const;

    // nothing staked, nothing owed and no settlement touching the vault
    bool is_empty() const;
};

GRANARY_FARM_NAMESPACE_END
