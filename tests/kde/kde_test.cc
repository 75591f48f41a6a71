// =============================================================================
// Parzen - Kernel Density Estimator Tests
// =============================================================================

#include "parzen/kde/kde.h"
#include "parzen/kernel/gaussian.h"
#include "parzen/kernel/uniform.h"

#include <array>
#include <set>
#include <vector>

#include <gtest/gtest.h>

namespace parzen {
namespace kde {
namespace {

using GaussianKde = KernelDensityEstimator<kernel::Gaussian<double>>;

// Always answers the low end of every request
class LowRandomSource final : public RandomSource {
  public:
    double uniformReal() override { return 0.5; }
    bool uniformBool() override { return false; }
    size_t uniformInt(size_t low, size_t /*high*/) override { return low; }
};

TEST(KdeTest, EmptyEstimator) {
    GaussianKde kde;
    StdRandomSource rng(1);
    EXPECT_TRUE(kde.empty());
    EXPECT_DOUBLE_EQ(kde.density(0.0), 0.0);
    EXPECT_EQ(kde.selectComponent(rng), nullptr);
    EXPECT_FALSE(kde.sample(rng).has_value());
    EXPECT_FALSE(kde.sampleDensity(rng).has_value());
}

TEST(KdeTest, EmptyRangeBuildsEmptyEstimator) {
    auto kde = GaussianKde::fromWindow(std::set<double>{}, 0.0, 10.0);
    ASSERT_TRUE(kde);
    EXPECT_TRUE(kde->empty());
}

TEST(KdeTest, OneComponentPerElement) {
    std::vector<double> trials = {1.0, 3.0, 7.0};
    auto kde = GaussianKde::fromWindow(trials, 0.0, 10.0);
    ASSERT_TRUE(kde);
    ASSERT_EQ(kde->size(), 3u);

    const auto& c = kde->components();
    EXPECT_DOUBLE_EQ(c[0].location(), 1.0);
    EXPECT_DOUBLE_EQ(c[0].bandwidth(), 2.0);  // max(1 - 0, 3 - 1)
    EXPECT_DOUBLE_EQ(c[1].location(), 3.0);
    EXPECT_DOUBLE_EQ(c[1].bandwidth(), 4.0);  // max(3 - 1, 7 - 3)
    EXPECT_DOUBLE_EQ(c[2].location(), 7.0);
    EXPECT_DOUBLE_EQ(c[2].bandwidth(), 4.0);  // max(7 - 3, 10 - 7)
}

TEST(KdeTest, DensityIsComponentMean) {
    std::vector<double> trials = {2.0, 8.0};
    auto kde = GaussianKde::fromWindow(trials, 0.0, 10.0);
    ASSERT_TRUE(kde);

    const auto& c = kde->components();
    const double expected = (c[0].density(5.0) + c[1].density(5.0)) / 2.0;
    EXPECT_DOUBLE_EQ(kde->density(5.0), expected);
}

TEST(KdeTest, MultiplierScalesEveryBandwidth) {
    std::vector<double> trials = {1.0, 3.0, 7.0};
    auto kde = GaussianKde::fromWindow(trials, 0.0, 10.0, 0.25);
    ASSERT_TRUE(kde);
    EXPECT_DOUBLE_EQ(kde->components()[0].bandwidth(), 0.5);
    EXPECT_DOUBLE_EQ(kde->components()[1].bandwidth(), 1.0);
    EXPECT_DOUBLE_EQ(kde->components()[2].bandwidth(), 1.0);
}

TEST(KdeTest, InvalidComponentFailsConstruction) {
    std::vector<double> trials = {1.0, 3.0};
    auto kde = GaussianKde::fromWindow(trials, 0.0, 10.0, 0.0);
    ASSERT_FALSE(kde);
    EXPECT_EQ(kde.error().code(), ErrorCode::kInvalidBandwidth);
}

TEST(KdeTest, ReservoirKeepsLastOnZeroDraws) {
    std::vector<double> trials = {1.0, 3.0, 7.0};
    auto kde = GaussianKde::fromWindow(trials, 0.0, 10.0);
    ASSERT_TRUE(kde);

    LowRandomSource rng;
    EXPECT_EQ(kde->selectComponent(rng), &kde->components()[2]);
}

TEST(KdeTest, ReservoirSelectionIsUniform) {
    std::vector<double> trials = {1.0, 3.0, 7.0, 9.0};
    auto kde = GaussianKde::fromWindow(trials, 0.0, 10.0);
    ASSERT_TRUE(kde);

    StdRandomSource rng(31);
    std::array<int, 4> counts{};
    const int n = 40000;
    for (int i = 0; i < n; ++i) {
        const auto* selected = kde->selectComponent(rng);
        ASSERT_NE(selected, nullptr);
        ++counts[selected - kde->components().data()];
    }
    for (int count : counts) {
        EXPECT_NEAR(static_cast<double>(count) / n, 0.25, 0.015);
    }
}

TEST(KdeTest, SampleComesFromComponents) {
    std::vector<double> trials = {2.0, 8.0};
    auto kde = KernelDensityEstimator<kernel::Uniform<double>>::fromWindow(trials, 0.0, 10.0);
    ASSERT_TRUE(kde);

    StdRandomSource rng(3);
    for (int i = 0; i < 500; ++i) {
        auto x = kde->sample(rng);
        ASSERT_TRUE(x.has_value());
        EXPECT_GT(kde->density(*x), 0.0);
    }
}

TEST(KdeTest, SampleDensityMatchesSample) {
    std::vector<int> trials = {1, 3, 7};
    auto kde = KernelDensityEstimator<kernel::Uniform<int>>::fromWindow(trials, 0, 10);
    ASSERT_TRUE(kde);

    // Last component, centre of its boxcar
    LowRandomSource rng;
    auto drawn = kde->sampleDensity(rng);
    ASSERT_TRUE(drawn.has_value());
    EXPECT_DOUBLE_EQ(*drawn, 7.0);
    EXPECT_EQ(kde->sample(rng).value_or(-1), 7);
}

}  // namespace
}  // namespace kde
}  // namespace parzen
