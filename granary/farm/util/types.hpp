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

#include <granary/farm/config.hpp>

#include <compare>
#include <map>
#include <set>
#include <string>

GRANARY_FARM_NAMESPACE_BEGIN

using AccountId = std::string;
using TokenId = std::string;
using CollectionId = std::string;
using ItemId = std::string;

struct StakedItem
{
    CollectionId collection;
    ItemId item;

    friend auto operator<=>(StakedItem const &, StakedItem const &) = default;
};

// collection -> item ids held for one account
using StakedItems = std::map<CollectionId, std::set<ItemId>>;

GRANARY_FARM_NAMESPACE_END
