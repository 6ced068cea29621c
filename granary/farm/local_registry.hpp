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
#include <granary/core/task/task_queue.hpp>
#include <granary/farm/config.hpp>
#include <granary/farm/token_registry.hpp>
#include <granary/farm/util/types.hpp>

#include <cstdint>
#include <map>
#include <unordered_map>
#include <unordered_set>

GRANARY_FARM_NAMESPACE_BEGIN

// In process fungible token. Receivers have to be registered, the farm's
// custody account holds staked tokens and setup deposits. Completions are
// posted to the task queue.
class LocalTokenRegistry final : public FungibleRegistry
{
    task::TaskQueue &queue_;
    TokenId token_;
    AccountId custody_;
    std::unordered_map<AccountId, uint256_t> balances_;
    std::unordered_set<AccountId> registered_;
    bool available_{true};
    uint64_t remote_calls_{0};

    Result<void> move(
        AccountId const &from, AccountId const &to, uint256_t const &amount);
    void complete(Completion, RegistryError) const;

public:
    LocalTokenRegistry(
        task::TaskQueue &, TokenId token, AccountId custody);

    TokenId const &token() const noexcept
    {
        return token_;
    }

    AccountId const &custody() const noexcept
    {
        return custody_;
    }

    void register_account(AccountId const &);
    void unregister_account(AccountId const &);
    bool is_registered(AccountId const &) const;

    void mint(AccountId const &, uint256_t const &amount);

    // synchronous transfer between holders, used for deposits into custody
    Result<void> transfer(
        AccountId const &from, AccountId const &to, uint256_t const &amount);

    uint256_t balance_of(AccountId const &) const;

    // an unavailable registry fails every remote call, like a timeout would
    void set_available(bool) noexcept;

    uint64_t remote_calls() const noexcept
    {
        return remote_calls_;
    }

    void credit(
        AccountId const &account, uint256_t const &amount,
        Completion completion) override;

    void debit_transfer(
        AccountId const &account, uint256_t const &amount,
        Completion completion) override;
};

// In process item collection.
class LocalItemRegistry final : public ItemRegistry
{
    task::TaskQueue &queue_;
    CollectionId collection_;
    AccountId custody_;
    std::map<ItemId, AccountId> owners_;
    bool available_{true};

public:
    LocalItemRegistry(
        task::TaskQueue &, CollectionId collection, AccountId custody);

    CollectionId const &collection() const noexcept
    {
        return collection_;
    }

    AccountId const &custody() const noexcept
    {
        return custody_;
    }

    void mint(AccountId const &, ItemId const &);

    Result<void>
    transfer(AccountId const &from, AccountId const &to, ItemId const &);

    AccountId const *owner_of(ItemId const &) const;

    void set_available(bool) noexcept;

    void transfer_item(
        AccountId const &account, StakedItem const &item,
        Completion completion) override;
};

GRANARY_FARM_NAMESPACE_END
