#include "core/functional/fp.hpp"
#include "core/math/vector_algebra.hpp"
#include "io/exceptions.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <numbers>

using namespace nvec;

namespace {
    constexpr real tolerance = 1e-6;

    void expect_components_near(const components_t& lhs, const components_t& rhs)
    {
        ASSERT_EQ(lhs.size(), rhs.size());
        for (size_type ii = 0; ii < lhs.size(); ++ii) {
            EXPECT_NEAR(lhs[ii], rhs[ii], tolerance) << "component " << ii;
        }
    }

    const components_t a{1.5, -2.0, 3.25, 0.5};
    const components_t b{-4.0, 0.75, 2.0, 8.0};
}   // namespace

TEST(VectorAlgebra, AddIsCommutative)
{
    EXPECT_EQ(vecops::add(a, b), vecops::add(b, a));
    EXPECT_EQ(vecops::add(a, b), (components_t{-2.5, -1.25, 5.25, 8.5}));
}

TEST(VectorAlgebra, SubIsNegatedReverseSub)
{
    EXPECT_EQ(vecops::sub(a, b), vecops::mul(vecops::sub(b, a), -1));
    EXPECT_EQ(vecops::sub(a, a), (components_t{0, 0, 0, 0}));
}

TEST(VectorAlgebra, ScalarMulAndDiv)
{
    EXPECT_EQ(vecops::mul(components_t{1, 2, 3}, 2), (components_t{2, 4, 6}));
    EXPECT_EQ(vecops::div(components_t{2, 4, 6}, 2), (components_t{1, 2, 3}));
}

TEST(VectorAlgebra, DivByZeroPropagatesIeeeValues)
{
    const auto result = vecops::div(components_t{1, -1, 0}, 0);
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], std::numeric_limits<real>::infinity());
    EXPECT_EQ(result[1], -std::numeric_limits<real>::infinity());
    EXPECT_TRUE(std::isnan(result[2]));
}

TEST(VectorAlgebra, DotIsSymmetric)
{
    EXPECT_EQ(vecops::dot(a, b), vecops::dot(b, a));
    EXPECT_DOUBLE_EQ(vecops::dot(components_t{1, 2, 3}, components_t{4, 5, 6}), 32);
    EXPECT_DOUBLE_EQ(vecops::dot(components_t{}, components_t{}), 0);
}

TEST(VectorAlgebra, Magnitude)
{
    EXPECT_DOUBLE_EQ(vecops::magnitude_squared(components_t{3, 4}), 25);
    EXPECT_DOUBLE_EQ(vecops::magnitude(components_t{3, 4}), 5);
    EXPECT_DOUBLE_EQ(vecops::magnitude(components_t{0, 0, 0}), 0);
    EXPECT_GE(vecops::magnitude(a), 0);
    EXPECT_GE(vecops::magnitude(b), 0);
}

TEST(VectorAlgebra, UnitHasMagnitudeOne)
{
    for (const auto& v : {a, b, components_t{3, 4}, components_t{-1e-3}}) {
        ASSERT_NE(vecops::magnitude(v), 0);
        EXPECT_NEAR(vecops::magnitude(vecops::unit(v)), 1, tolerance);
    }
    expect_components_near(vecops::unit(components_t{3, 4}), {0.6, 0.8});
}

TEST(VectorAlgebra, UnitOfZeroVectorIsNan)
{
    const auto u = vecops::unit(components_t{0, 0});
    ASSERT_EQ(u.size(), 2u);
    EXPECT_TRUE(fp::all_of(u, [](real x) { return std::isnan(x); }));
}

TEST(VectorAlgebra, Angle)
{
    EXPECT_NEAR(vecops::angle(components_t{1, 0}, components_t{1, 0}), 0, tolerance);
    EXPECT_NEAR(
        vecops::angle(components_t{1, 0}, components_t{0, 1}),
        std::numbers::pi / 2,
        tolerance
    );
    EXPECT_NEAR(
        vecops::angle(components_t{1, 0}, components_t{-2, 0}),
        std::numbers::pi,
        tolerance
    );
}

TEST(VectorAlgebra, AngleWithZeroVectorIsNan)
{
    EXPECT_TRUE(std::isnan(vecops::angle(components_t{0, 0}, components_t{1, 0})));
}

TEST(VectorAlgebra, Midpoint)
{
    EXPECT_EQ(
        vecops::midpoint(components_t{0, 0}, components_t{2, 4}),
        (components_t{1, 2})
    );
    EXPECT_EQ(vecops::midpoint(a, b), vecops::midpoint(b, a));
}

TEST(VectorAlgebra, MapPassesComponentAndIndex)
{
    const auto result = vecops::map(
        [](real n, size_type ii) { return n * static_cast<real>(ii); },
        components_t{2, 2, 2}
    );
    EXPECT_EQ(result, (components_t{0, 2, 4}));
}

TEST(VectorAlgebra, DimensionMismatchIsReported)
{
    const components_t two{1, 2};
    const components_t three{1, 2, 3};

    EXPECT_THROW(vecops::add(two, three), exception::DimensionMismatchException);
    EXPECT_THROW(vecops::sub(two, three), exception::DimensionMismatchException);
    EXPECT_THROW(vecops::dot(two, three), exception::DimensionMismatchException);
    EXPECT_THROW(vecops::angle(two, three), exception::DimensionMismatchException);
    EXPECT_THROW(
        vecops::midpoint(three, two),
        exception::DimensionMismatchException
    );
}

TEST(VectorAlgebra, DimensionMismatchCarriesDetails)
{
    try {
        (void) vecops::add(components_t{1, 2}, components_t{1, 2, 3});
        FAIL() << "expected DimensionMismatchException";
    }
    catch (const exception::DimensionMismatchException& e) {
        EXPECT_EQ(e.operation(), "add");
        EXPECT_EQ(e.lhs_dims(), 2u);
        EXPECT_EQ(e.rhs_dims(), 3u);
        EXPECT_EQ(e.error_code(), ErrorCode::DIMENSION_MISMATCH);
        EXPECT_STREQ(e.what(), "Dimension mismatch in 'add': 2 != 3");
    }
}

TEST(VectorAlgebra, OperandsAreNotMutated)
{
    const components_t lhs{1, 2};
    const components_t rhs{3, 4};
    auto lhs_copy = lhs;
    auto rhs_copy = rhs;
    (void) vecops::add(lhs_copy, rhs_copy);
    (void) vecops::unit(lhs_copy);
    (void) vecops::midpoint(lhs_copy, rhs_copy);
    EXPECT_EQ(lhs_copy, lhs);
    EXPECT_EQ(rhs_copy, rhs);
}
