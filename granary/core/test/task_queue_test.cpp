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

#include <granary/core/task/task_queue.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <vector>

using namespace granary::task;

TEST(TaskQueue, runs_in_submission_order)
{
    TaskQueue queue;
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        queue.submit([&order, i] { order.push_back(i); });
    }
    EXPECT_EQ(queue.pending(), 5u);
    EXPECT_EQ(queue.run(), 5u);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(queue.executed(), 5u);
}

TEST(TaskQueue, run_one_on_empty_queue)
{
    TaskQueue queue;
    EXPECT_FALSE(queue.run_one());
    EXPECT_EQ(queue.run(), 0u);
}

TEST(TaskQueue, submitted_work_runs_after_pending_work)
{
    TaskQueue queue;
    std::vector<char> order;
    queue.submit([&] {
        order.push_back('a');
        queue.submit([&] { order.push_back('c'); });
        // never runs inline
        EXPECT_EQ(order.size(), 1u);
    });
    queue.submit([&] { order.push_back('b'); });

    EXPECT_TRUE(queue.run_one());
    EXPECT_EQ(order, (std::vector<char>{'a'}));
    EXPECT_EQ(queue.pending(), 2u);

    EXPECT_EQ(queue.run(), 2u);
    EXPECT_EQ(order, (std::vector<char>{'a', 'b', 'c'}));
}

TEST(TaskQueue, task_released_after_running)
{
    TaskQueue queue;
    auto token = std::make_shared<int>(7);
    queue.submit([token] { EXPECT_EQ(*token, 7); });
    queue.submit([] {});
    EXPECT_EQ(token.use_count(), 2);

    EXPECT_TRUE(queue.run_one());
    EXPECT_EQ(token.use_count(), 1);
    EXPECT_EQ(queue.pending(), 1u);
    EXPECT_EQ(queue.executed(), 1u);
}
