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
#include <granary/farm/test_util/config.hpp>
#include <granary/farm/token_registry.hpp>
#include <granary/farm/util/types.hpp>

#include <boost/outcome/success_failure.hpp>

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

GRANARY_FARM_TEST_NAMESPACE_BEGIN

// Registry whose calls stay pending until the test resolves them, in any
// order it likes.
class ScriptedRegistry final
    : public FungibleRegistry
    , public ItemRegistry
{
public:
    struct Call
    {
        std::string method;
        AccountId account;
        uint256_t amount{0};
        std::optional<StakedItem> item;
        Completion completion;
        bool resolved{false};
    };

private:
    task::TaskQueue &queue_;
    std::vector<Call> calls_;

public:
    explicit ScriptedRegistry(task::TaskQueue &queue)
        : queue_{queue}
    {
    }

    std::vector<Call> const &calls() const noexcept
    {
        return calls_;
    }

    Call const &call(size_t const i) const
    {
        return calls_.at(i);
    }

    size_t unresolved() const
    {
        size_t n = 0;
        for (auto const &c : calls_) {
            n += c.resolved ? 0 : 1;
        }
        return n;
    }

    // posts the outcome of call `i`; it runs with the next queue step
    void resolve(size_t const i, bool const ok)
    {
        auto &c = calls_.at(i);
        if (c.resolved) {
            throw std::logic_error{"call resolved twice"};
        }
        c.resolved = true;
        queue_.submit([completion = c.completion, ok] {
            if (ok) {
                completion(outcome::success());
            }
            else {
                completion(RegistryError::Unavailable);
            }
        });
    }

    void credit(
        AccountId const &account, uint256_t const &amount,
        Completion completion) override
    {
        calls_.push_back(Call{
            .method = "credit",
            .account = account,
            .amount = amount,
            .completion = std::move(completion)});
    }

    void debit_transfer(
        AccountId const &account, uint256_t const &amount,
        Completion completion) override
    {
        calls_.push_back(Call{
            .method = "debit_transfer",
            .account = account,
            .amount = amount,
            .completion = std::move(completion)});
    }

    void transfer_item(
        AccountId const &account, StakedItem const &item,
        Completion completion) override
    {
        calls_.push_back(Call{
            .method = "transfer_item",
            .account = account,
            .item = item,
            .completion = std::move(completion)});
    }
};

GRANARY_FARM_TEST_NAMESPACE_END
