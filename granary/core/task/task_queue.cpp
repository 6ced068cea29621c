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

#include <granary/core/assert.h>
#include <granary/core/task/task_queue.hpp>

#include <cstddef>
#include <functional>
#include <utility>

GRANARY_TASK_NAMESPACE_BEGIN

void TaskQueue::submit(std::function<void()> task)
{
    GRANARY_ASSERT(task);
    queue_.push_back(PriorityTask{next_sequence_++, std::move(task)});
}

bool TaskQueue::run_one()
{
    if (queue_.empty()) {
        return false;
    }
    // popped before running so that the task may submit new work
    auto task = std::move(queue_.front().task);
    queue_.pop_front();
    task();
    ++executed_;
    return true;
}

size_t TaskQueue::run()
{
    size_t n = 0;
    while (run_one()) {
        ++n;
    }
    return n;
}

GRANARY_TASK_NAMESPACE_END
