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

#include <granary/core/task/config.hpp>
#include <granary/core/task/priority_task.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <deque>

GRANARY_TASK_NAMESPACE_BEGIN

// Single threaded cooperative scheduler. Every submitted task runs as its own
// step, after every task submitted before it. A task may submit further tasks;
// they are never run from inside the submitting step.
class TaskQueue final
{
    // ordered by sequence number, oldest first
    std::deque<PriorityTask> queue_;
    uint64_t next_sequence_{0};
    uint64_t executed_{0};

public:
    TaskQueue() = default;
    TaskQueue(TaskQueue const &) = delete;
    TaskQueue &operator=(TaskQueue const &) = delete;

    void submit(std::function<void()> task);

    // Runs the oldest pending task. Returns false if nothing was pending.
    bool run_one();

    // Runs until the queue is drained, including tasks submitted while
    // draining. Returns the number of tasks executed.
    size_t run();

    bool empty() const noexcept
    {
        return queue_.empty();
    }

    size_t pending() const noexcept
    {
        return queue_.size();
    }

    uint64_t executed() const noexcept
    {
        return executed_;
    }
};

GRANARY_TASK_NAMESPACE_END
