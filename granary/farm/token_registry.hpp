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
#include <granary/farm/util/types.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <functional>
#include <initializer_list>
#include <unordered_map>

GRANARY_FARM_NAMESPACE_BEGIN

enum class RegistryError
{
    Success = 0,
    ReceiverNotRegistered,
    InsufficientBalance,
    ItemNotHeld,
    Unavailable,
    NoRegistry,
};

// Invoked exactly once with the outcome of a remote call, always as a task of
// its own and never from inside the call that issued it.
using Completion = std::function<void(Result<void>)>;

class FungibleRegistry
{
public:
    virtual ~FungibleRegistry() = default;

    // credit `amount` of newly issued reward tokens to `account`
    virtual void credit(
        AccountId const &account, uint256_t const &amount,
        Completion completion) = 0;

    // move `amount` out of the farm's custody to `account`
    virtual void debit_transfer(
        AccountId const &account, uint256_t const &amount,
        Completion completion) = 0;
};

class ItemRegistry
{
public:
    virtual ~ItemRegistry() = default;

    virtual void transfer_item(
        AccountId const &account, StakedItem const &item,
        Completion completion) = 0;
};

// Registries reachable from one farm, keyed by token or collection id. The
// registries are not owned.
struct RegistryDirectory
{
    std::unordered_map<TokenId, FungibleRegistry *> tokens;
    std::unordered_map<CollectionId, ItemRegistry *> collections;

    FungibleRegistry *find_token(TokenId const &) const;
    ItemRegistry *find_collection(CollectionId const &) const;
};

GRANARY_FARM_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<granary::farm::RegistryError>
    : quick_status_code_from_enum_defaults<granary::farm::RegistryError>
{
    static constexpr auto const domain_name = "Registry Error";
    static constexpr auto const domain_uuid =
        "e2a94c17-0b3d-4f68-8c25-93d6b1f4a07e";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
