// =============================================================================
// Parzen - KDE Component Tests
// =============================================================================

#include "parzen/kde/component.h"
#include "parzen/kernel/binomial.h"
#include "parzen/kernel/gaussian.h"
#include "parzen/kernel/uniform.h"

#include <cstdint>

#include <gtest/gtest.h>

namespace parzen {
namespace kde {
namespace {

TEST(AdaptiveBandwidthTest, NeighbourDistances) {
    using T = Triple<double>;
    // Full: wider of the two gaps
    EXPECT_DOUBLE_EQ(*adaptiveBandwidth(T::makeFull(1.0, 3.0, 7.0), 0.0, 10.0), 4.0);
    // MiddleRight: left gap runs to the range start
    EXPECT_DOUBLE_EQ(*adaptiveBandwidth(T::makeMiddleRight(2.0, 3.0), 0.0, 10.0), 2.0);
    // LeftMiddle: right gap runs to the range end
    EXPECT_DOUBLE_EQ(*adaptiveBandwidth(T::makeLeftMiddle(8.0, 9.0), 0.0, 10.0), 1.0);
    // Middle: both gaps run to the range bounds
    EXPECT_DOUBLE_EQ(*adaptiveBandwidth(T::makeMiddle(3.0), 0.0, 10.0), 7.0);
}

TEST(AdaptiveBandwidthTest, EdgeWindowsHaveNone) {
    using T = Triple<double>;
    EXPECT_FALSE(adaptiveBandwidth(T::makeLeft(1.0), 0.0, 10.0).has_value());
    EXPECT_FALSE(adaptiveBandwidth(T::makeRight(1.0), 0.0, 10.0).has_value());
}

TEST(AdaptiveBandwidthTest, UnsignedParametersDoNotWrap) {
    using T = Triple<uint32_t>;
    auto bw = adaptiveBandwidth(T::makeMiddleRight(2u, 3u), 0u, 10u);
    ASSERT_TRUE(bw.has_value());
    EXPECT_DOUBLE_EQ(*bw, 2.0);
}

TEST(ComponentTest, FromWindowAppliesMultiplier) {
    using Comp = Component<kernel::Gaussian<double>>;
    auto comp = Comp::fromWindow(Triple<double>::makeFull(1.0, 3.0, 7.0), 0.0, 10.0, 0.5);
    ASSERT_TRUE(comp);
    ASSERT_TRUE(comp->has_value());
    EXPECT_DOUBLE_EQ((*comp)->location(), 3.0);
    EXPECT_DOUBLE_EQ((*comp)->bandwidth(), 2.0);
    EXPECT_DOUBLE_EQ((*comp)->kernel().bandwidth(), 2.0);
}

TEST(ComponentTest, FromWindowWithoutCentre) {
    using Comp = Component<kernel::Gaussian<double>>;
    auto comp = Comp::fromWindow(Triple<double>::makeLeft(3.0), 0.0, 10.0);
    ASSERT_TRUE(comp);
    EXPECT_FALSE(comp->has_value());
}

TEST(ComponentTest, IntegerBandwidthRoundingToZeroFails) {
    using Comp = Component<kernel::Binomial<int>>;
    auto comp = Comp::fromWindow(Triple<int>::makeFull(1, 2, 3), 0, 10, 0.1);
    ASSERT_FALSE(comp);
    EXPECT_EQ(comp.error().code(), ErrorCode::kInvalidBandwidth);
}

TEST(ComponentTest, DegenerateRangeFails) {
    using Comp = Component<kernel::Uniform<double>>;
    auto comp = Comp::fromWindow(Triple<double>::makeMiddle(4.0), 4.0, 4.0);
    ASSERT_FALSE(comp);
    EXPECT_EQ(comp.error().code(), ErrorCode::kInvalidBandwidth);
}

TEST(ComponentTest, DelegatesToKernel) {
    using Comp = Component<kernel::Uniform<double>>;
    auto comp = Comp::create(5.0, 1.0);
    ASSERT_TRUE(comp);
    EXPECT_DOUBLE_EQ(comp->density(5.0), 1.0 / constants::kDoubleSqrt3);
    EXPECT_DOUBLE_EQ(comp->density(7.0), 0.0);

    StdRandomSource rng(2);
    for (int i = 0; i < 100; ++i) {
        double x = comp->sample(rng);
        EXPECT_GE(x, comp->kernel().min());
        EXPECT_LE(x, comp->kernel().max());
    }

    auto bad = Comp::create(5.0, 0.0);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code(), ErrorCode::kInvalidBandwidth);
}

}  // namespace
}  // namespace kde
}  // namespace parzen
