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

#include <cstdint>

GRANARY_FARM_NAMESPACE_BEGIN

// Seconds since the unix epoch.
class Clock
{
public:
    virtual ~Clock() = default;

    virtual uint64_t now() const = 0;
};

class ManualClock final : public Clock
{
    uint64_t now_;

public:
    explicit ManualClock(uint64_t const now = 0)
        : now_{now}
    {
    }

    uint64_t now() const override
    {
        return now_;
    }

    void set(uint64_t const now) noexcept
    {
        now_ = now;
    }

    void advance(uint64_t const seconds) noexcept
    {
        now_ += seconds;
    }
};

GRANARY_FARM_NAMESPACE_END
