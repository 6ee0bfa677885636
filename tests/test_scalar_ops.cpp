#include "core/math/scalar_ops.hpp"
#include <array>
#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <vector>

using namespace nvec;

TEST(ScalarOps, BasicArithmetic)
{
    EXPECT_DOUBLE_EQ(scalar::add(2, 3), 5);
    EXPECT_DOUBLE_EQ(scalar::sub(2, 3), -1);
    EXPECT_DOUBLE_EQ(scalar::mul(2, 3), 6);
    EXPECT_DOUBLE_EQ(scalar::div(3, 2), 1.5);
    EXPECT_DOUBLE_EQ(scalar::square(-4), 16);
}

TEST(ScalarOps, DivisionByZeroFollowsIeee)
{
    EXPECT_EQ(scalar::div(1, 0), std::numeric_limits<real>::infinity());
    EXPECT_EQ(scalar::div(-1, 0), -std::numeric_limits<real>::infinity());
    EXPECT_TRUE(std::isnan(scalar::div(0, 0)));
}

TEST(ScalarOps, SumAndAverage)
{
    const std::vector<real> ns{1, 2, 3, 4};
    EXPECT_DOUBLE_EQ(scalar::sum(ns), 10);
    EXPECT_DOUBLE_EQ(scalar::avg(ns), 2.5);

    const std::array<real, 3> fixed{2, 4, 6};
    EXPECT_DOUBLE_EQ(scalar::avg(fixed), 4);
}

TEST(ScalarOps, EmptySequence)
{
    const std::vector<real> empty;
    EXPECT_DOUBLE_EQ(scalar::sum(empty), 0);
    EXPECT_TRUE(std::isnan(scalar::avg(empty)));
}

TEST(ScalarOps, CurriedOperandOrder)
{
    EXPECT_DOUBLE_EQ(scalar::add_to(2)(5), 7);
    EXPECT_DOUBLE_EQ(scalar::mul_by(3)(5), 15);

    // sub_from fixes the minuend, sub_by the subtrahend
    EXPECT_DOUBLE_EQ(scalar::sub_from(10)(4), 6);
    EXPECT_DOUBLE_EQ(scalar::sub_by(10)(4), -6);

    // div_into fixes the dividend, div_by the divisor
    EXPECT_DOUBLE_EQ(scalar::div_into(8)(2), 4);
    EXPECT_DOUBLE_EQ(scalar::div_by(8)(2), 0.25);
}

TEST(ScalarOps, CurriedDivByZero)
{
    EXPECT_EQ(scalar::div_by(0)(3), std::numeric_limits<real>::infinity());
    EXPECT_TRUE(std::isnan(scalar::div_into(0)(0)));
}
