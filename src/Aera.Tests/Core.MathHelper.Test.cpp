#include "pch.h"
#include "Aera.Core/math_util.h"

#include <cmath>
#include <limits>

TEST(TestCore_MathHelper, MachinePrecision) {
    using namespace aera::core;

    auto precision = MathHelper::machine_precision();
    ASSERT_LT(0.0, precision);
    ASSERT_EQ(std::numeric_limits<double>::epsilon(), precision);
}

TEST(TestCore_MathHelper, NumericalPrecision) {
    using namespace aera::core;

    auto precision = MathHelper::default_numerical_precision();
    ASSERT_LT(MathHelper::machine_precision(), precision);
}

TEST(TestCore_MathHelper, EqualsDefaultPrecision) {
    using namespace aera::core;
    double a = (0.3 * 3.0) + 0.1;
    double b = 1.0;
    ASSERT_TRUE(MathHelper::equal(a, b));
}

TEST(TestCore_MathHelper, EqualsCustomPrecision) {
    using namespace aera::core;
    ASSERT_TRUE(MathHelper::equal(1.0, 1.0 + 1e-12, 1e-10));
    ASSERT_FALSE(MathHelper::equal(1.0, 1.001, 1e-10));
}

TEST(TestCore_MathHelper, RoundToDecimals) {
    using namespace aera::core;

    ASSERT_DOUBLE_EQ(0.4938, MathHelper::round_to(0.493824, 4));
    ASSERT_DOUBLE_EQ(3.33, MathHelper::round_to(3.3333, 2));
    ASSERT_DOUBLE_EQ(-1.5, MathHelper::round_to(-1.46, 1));
    ASSERT_DOUBLE_EQ(2.0, MathHelper::round_to(1.5, 0));
}

TEST(TestCore_MathHelper, RoundPublishedFourDecimals) {
    using namespace aera::core;

    ASSERT_EQ(4, MathHelper::published_decimals);
    ASSERT_DOUBLE_EQ(0.1667, MathHelper::round_published(1.0 / 6.0));
    ASSERT_DOUBLE_EQ(11.8, MathHelper::round_published(11.8));
}

TEST(TestCore_MathHelper, RoundKeepsNonFinite) {
    using namespace aera::core;

    auto inf = std::numeric_limits<double>::infinity();
    ASSERT_EQ(inf, MathHelper::round_published(inf));
    ASSERT_TRUE(std::isnan(MathHelper::round_published(std::numeric_limits<double>::quiet_NaN())));
}

TEST(TestCore_MathHelper, NegligibleScale) {
    using namespace aera::core;

    ASSERT_TRUE(MathHelper::is_negligible_scale(0.0, 0.0));
    ASSERT_TRUE(MathHelper::is_negligible_scale(1e-17, 1.0));
    ASSERT_FALSE(MathHelper::is_negligible_scale(0.5, 1.0));
    ASSERT_FALSE(MathHelper::is_negligible_scale(1e-6, 0.0));
}
