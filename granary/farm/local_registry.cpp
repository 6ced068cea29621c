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
#include <granary/core/task/task_queue.hpp>
#include <granary/farm/config.hpp>
#include <granary/farm/local_registry.hpp>
#include <granary/farm/token_registry.hpp>
#include <granary/farm/util/types.hpp>

#include <quill/Quill.h>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <utility>

GRANARY_FARM_ANONYMOUS_NAMESPACE_BEGIN

Result<void> to_result(RegistryError const error)
{
    if (error == RegistryError::Success) {
        return outcome::success();
    }
    return error;
}

GRANARY_FARM_ANONYMOUS_NAMESPACE_END

GRANARY_FARM_NAMESPACE_BEGIN

LocalTokenRegistry::LocalTokenRegistry(
    task::TaskQueue &queue, TokenId token, AccountId custody)
    : queue_{queue}
    , token_{std::move(token)}
    , custody_{std::move(custody)}
{
    registered_.insert(custody_);
}

void LocalTokenRegistry::register_account(AccountId const &account)
{
    registered_.insert(account);
}

void LocalTokenRegistry::unregister_account(AccountId const &account)
{
    registered_.erase(account);
}

bool LocalTokenRegistry::is_registered(AccountId const &account) const
{
    return registered_.contains(account);
}

void LocalTokenRegistry::mint(AccountId const &account, uint256_t const &amount)
{
    balances_[account] += amount;
}

Result<void> LocalTokenRegistry::move(
    AccountId const &from, AccountId const &to, uint256_t const &amount)
{
    if (GRANARY_UNLIKELY(!registered_.contains(to))) {
        return RegistryError::ReceiverNotRegistered;
    }
    auto const it = balances_.find(from);
    if (GRANARY_UNLIKELY(it == balances_.end() || it->second < amount)) {
        return RegistryError::InsufficientBalance;
    }
    it->second -= amount;
    BOOST_OUTCOME_TRY(auto const balance, checked_add(balances_[to], amount));
    balances_[to] = balance;
    return outcome::success();
}

Result<void> LocalTokenRegistry::transfer(
    AccountId const &from, AccountId const &to, uint256_t const &amount)
{
    return move(from, to, amount);
}

uint256_t LocalTokenRegistry::balance_of(AccountId const &account) const
{
    auto const it = balances_.find(account);
    return it == balances_.end() ? uint256_t{0} : it->second;
}

void LocalTokenRegistry::set_available(bool const available) noexcept
{
    available_ = available;
}

void LocalTokenRegistry::complete(
    Completion completion, RegistryError const error) const
{
    queue_.submit([completion = std::move(completion), error] {
        completion(to_result(error));
    });
}

void LocalTokenRegistry::credit(
    AccountId const &account, uint256_t const &amount, Completion completion)
{
    ++remote_calls_;
    if (GRANARY_UNLIKELY(!available_)) {
        complete(std::move(completion), RegistryError::Unavailable);
        return;
    }
    if (GRANARY_UNLIKELY(!registered_.contains(account))) {
        LOG_DEBUG("{}: credit to unregistered {}", token_, account);
        complete(std::move(completion), RegistryError::ReceiverNotRegistered);
        return;
    }
    balances_[account] += amount;
    LOG_DEBUG("{}: credited {} to {}", token_, amount, account);
    complete(std::move(completion), RegistryError::Success);
}

void LocalTokenRegistry::debit_transfer(
    AccountId const &account, uint256_t const &amount, Completion completion)
{
    ++remote_calls_;
    if (GRANARY_UNLIKELY(!available_)) {
        complete(std::move(completion), RegistryError::Unavailable);
        return;
    }
    auto const res = move(custody_, account, amount);
    if (res.has_error()) {
        LOG_DEBUG(
            "{}: transfer of {} to {} rejected: {}",
            token_,
            amount,
            account,
            res.error().message().c_str());
        complete(
            std::move(completion),
            registered_.contains(account) ? RegistryError::InsufficientBalance
                                          : RegistryError::ReceiverNotRegistered);
        return;
    }
    complete(std::move(completion), RegistryError::Success);
}

LocalItemRegistry::LocalItemRegistry(
    task::TaskQueue &queue, CollectionId collection, AccountId custody)
    : queue_{queue}
    , collection_{std::move(collection)}
    , custody_{std::move(custody)}
{
}

void LocalItemRegistry::mint(AccountId const &account, ItemId const &item)
{
    owners_[item] = account;
}

Result<void> LocalItemRegistry::transfer(
    AccountId const &from, AccountId const &to, ItemId const &item)
{
    auto const it = owners_.find(item);
    if (GRANARY_UNLIKELY(it == owners_.end() || it->second != from)) {
        return RegistryError::ItemNotHeld;
    }
    it->second = to;
    return outcome::success();
}

AccountId const *LocalItemRegistry::owner_of(ItemId const &item) const
{
    auto const it = owners_.find(item);
    return it == owners_.end() ? nullptr : &it->second;
}

void LocalItemRegistry::set_available(bool const available) noexcept
{
    available_ = available;
}

void LocalItemRegistry::transfer_item(
    AccountId const &account, StakedItem const &item, Completion completion)
{
    RegistryError error = RegistryError::Success;
    if (GRANARY_UNLIKELY(!available_)) {
        error = RegistryError::Unavailable;
    }
    else if (GRANARY_UNLIKELY(item.collection != collection_)) {
        error = RegistryError::ItemNotHeld;
    }
    else if (transfer(custody_, account, item.item).has_error()) {
        error = RegistryError::ItemNotHeld;
    }
    queue_.submit([completion = std::move(completion), error] {
        completion(to_result(error));
    });
}

GRANARY_FARM_NAMESPACE_END
