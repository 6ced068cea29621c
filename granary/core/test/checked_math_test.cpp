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
#include <granary/core/int.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace granary;
using namespace intx::literals;

TEST(CheckedMath, add_sub)
{
    EXPECT_EQ(checked_add(1, 2).value(), 3);
    EXPECT_EQ(checked_add(UINT256_MAX, 1).assume_error(), MathError::Overflow);
    EXPECT_EQ(checked_sub(5, 3).value(), 2);
    EXPECT_EQ(checked_sub(3, 5).assume_error(), MathError::Underflow);
}

TEST(CheckedMath, mul_div)
{
    EXPECT_EQ(checked_mul(1ull << 32, 1ull << 32).value(), 1_u256 << 64);
    EXPECT_EQ(
        checked_mul(UINT256_MAX, 2).assume_error(), MathError::Overflow);
    EXPECT_EQ(checked_div(7, 2).value(), 3);
    EXPECT_EQ(checked_div(7, 0).assume_error(), MathError::DivisionByZero);
}

TEST(CheckedMath, mul_div_keeps_wide_product)
{
    // the product overflows 256 bits but the quotient does not
    EXPECT_EQ(checked_mul_div(UINT256_MAX, 2, 4).value(), UINT256_MAX / 2);
    EXPECT_EQ(checked_mul_div(10, 3, 4).value(), 7);
    EXPECT_EQ(
        checked_mul_div(UINT256_MAX, 2, 1).assume_error(), MathError::Overflow);
    EXPECT_EQ(
        checked_mul_div(1, 1, 0).assume_error(), MathError::DivisionByZero);
}
