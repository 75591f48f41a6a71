// =============================================================================
// Parzen - Uniform Kernel Tests
// =============================================================================

#include "parzen/kernel/uniform.h"

#include <cstdint>
#include <limits>

#include <gtest/gtest.h>

namespace parzen {
namespace kernel {
namespace {

TEST(UniformKernelTest, DensityInsideAndOutsideSupport) {
    auto k = Uniform<double>::create(0.0, 1.0);
    ASSERT_TRUE(k);

    const double height = 1.0 / constants::kDoubleSqrt3;
    EXPECT_DOUBLE_EQ(k->density(0.0), height);
    EXPECT_DOUBLE_EQ(k->density(1.7), height);
    EXPECT_DOUBLE_EQ(k->density(-1.7), height);
    EXPECT_DOUBLE_EQ(k->density(1.8), 0.0);
    EXPECT_DOUBLE_EQ(k->density(-1.8), 0.0);
}

TEST(UniformKernelTest, IntegratesToOne) {
    auto k = Uniform<double>::create(2.0, 0.5);
    ASSERT_TRUE(k);

    const double step = 1e-4;
    double total = 0.0;
    for (double x = -2.0; x < 6.0; x += step) {
        total += k->density(x) * step;
    }
    EXPECT_NEAR(total, 1.0, 1e-3);
}

TEST(UniformKernelTest, FromBoundsSpansRange) {
    auto k = Uniform<double>::fromBounds(0.0, 10.0);
    ASSERT_TRUE(k);
    EXPECT_NEAR(k->min(), 0.0, 1e-12);
    EXPECT_NEAR(k->max(), 10.0, 1e-12);
    EXPECT_NEAR(k->density(5.0), 0.1, 1e-12);

    auto empty = Uniform<double>::fromBounds(3.0, 3.0);
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code(), ErrorCode::kInvalidRange);
}

TEST(UniformKernelTest, RejectsBadParameters) {
    auto zero = Uniform<double>::create(0.0, 0.0);
    ASSERT_FALSE(zero);
    EXPECT_EQ(zero.error().code(), ErrorCode::kInvalidBandwidth);

    auto negative = Uniform<int>::create(0, -3);
    ASSERT_FALSE(negative);
    EXPECT_EQ(negative.error().code(), ErrorCode::kInvalidBandwidth);

    auto infinite = Uniform<double>::create(std::numeric_limits<double>::infinity(), 1.0);
    ASSERT_FALSE(infinite);
    EXPECT_EQ(infinite.error().code(), ErrorCode::kInvalidLocation);
}

TEST(UniformKernelTest, SamplesStayInSupport) {
    auto k = Uniform<double>::create(-3.0, 2.0);
    ASSERT_TRUE(k);
    StdRandomSource rng(5);

    double sum = 0.0;
    const int n = 20000;
    for (int i = 0; i < n; ++i) {
        double x = k->sample(rng);
        ASSERT_GE(x, k->min());
        ASSERT_LE(x, k->max());
        sum += x;
    }
    EXPECT_NEAR(sum / n, -3.0, 0.05);
}

TEST(UniformKernelTest, IntegerSamplesRound) {
    auto k = Uniform<int64_t>::create(10, 2);
    ASSERT_TRUE(k);
    StdRandomSource rng(8);
    // Support is 10 ± 3.46, rounded to [7, 13]
    for (int i = 0; i < 1000; ++i) {
        int64_t x = k->sample(rng);
        ASSERT_GE(x, 7);
        ASSERT_LE(x, 13);
    }
}

}  // namespace
}  // namespace kernel
}  // namespace parzen
