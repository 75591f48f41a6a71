// =============================================================================
// Parzen - Trial Ledger Tests
// =============================================================================

#include "parzen/optimizer/ledger.h"

#include <cmath>
#include <set>
#include <vector>

#include <gtest/gtest.h>

namespace parzen {
namespace {

using Ledger = TrialLedger<double, double>;
using T = Trial<double, double>;

TEST(TrialLedgerTest, EmptyLedger) {
    Ledger ledger;
    EXPECT_TRUE(ledger.empty());
    EXPECT_EQ(ledger.size(), 0u);
    EXPECT_FALSE(ledger.best().has_value());
    EXPECT_FALSE(ledger.worst().has_value());
    EXPECT_FALSE(ledger.popBest().has_value());
    EXPECT_FALSE(ledger.popWorst().has_value());
}

TEST(TrialLedgerTest, OrdersByMetric) {
    Ledger ledger;
    EXPECT_TRUE(ledger.insert(T{1.0, 5.0, 0}));
    EXPECT_TRUE(ledger.insert(T{2.0, 1.0, 1}));
    EXPECT_TRUE(ledger.insert(T{3.0, 9.0, 2}));

    EXPECT_EQ(ledger.size(), 3u);
    EXPECT_DOUBLE_EQ(ledger.best()->parameter, 2.0);
    EXPECT_DOUBLE_EQ(ledger.worst()->parameter, 3.0);

    std::vector<double> metrics;
    for (const auto& trial : ledger.trials()) {
        metrics.push_back(trial.metric);
    }
    EXPECT_EQ(metrics, (std::vector<double>{1.0, 5.0, 9.0}));
}

TEST(TrialLedgerTest, ParametersAscending) {
    Ledger ledger;
    ledger.insert(T{7.0, 0.0, 0});
    ledger.insert(T{-1.0, 3.0, 1});
    ledger.insert(T{2.5, 1.0, 2});

    std::vector<double> params(ledger.parameters().begin(), ledger.parameters().end());
    EXPECT_EQ(params, (std::vector<double>{-1.0, 2.5, 7.0}));
    EXPECT_TRUE(ledger.contains(2.5));
    EXPECT_FALSE(ledger.contains(2.0));
}

TEST(TrialLedgerTest, RejectsDuplicateParameter) {
    Ledger ledger;
    EXPECT_TRUE(ledger.insert(T{1.0, 5.0, 0}));
    EXPECT_FALSE(ledger.insert(T{1.0, 2.0, 1}));
    EXPECT_EQ(ledger.size(), 1u);
    EXPECT_DOUBLE_EQ(ledger.best()->metric, 5.0);
}

TEST(TrialLedgerTest, RejectsNaN) {
    Ledger ledger;
    EXPECT_FALSE(ledger.insert(T{std::nan(""), 1.0, 0}));
    EXPECT_FALSE(ledger.insert(T{1.0, std::nan(""), 1}));
    EXPECT_TRUE(ledger.empty());
}

TEST(TrialLedgerTest, EqualMetricsKeepInsertionOrder) {
    Ledger ledger;
    ledger.insert(T{3.0, 1.0, 10});
    ledger.insert(T{1.0, 1.0, 11});
    ledger.insert(T{2.0, 1.0, 12});

    EXPECT_DOUBLE_EQ(ledger.best()->parameter, 3.0);
    EXPECT_DOUBLE_EQ(ledger.worst()->parameter, 2.0);
    EXPECT_EQ(ledger.size(), 3u);
}

TEST(TrialLedgerTest, PopKeepsOrderingsInSync) {
    Ledger ledger;
    for (int i = 0; i < 10; ++i) {
        ledger.insert(T{static_cast<double>(i), static_cast<double>((i * 7) % 10),
                        static_cast<uint64_t>(i)});
    }

    auto best = ledger.popBest();
    ASSERT_TRUE(best.has_value());
    EXPECT_DOUBLE_EQ(best->metric, 0.0);
    EXPECT_FALSE(ledger.contains(best->parameter));

    auto worst = ledger.popWorst();
    ASSERT_TRUE(worst.has_value());
    EXPECT_DOUBLE_EQ(worst->metric, 9.0);
    EXPECT_FALSE(ledger.contains(worst->parameter));

    EXPECT_EQ(ledger.size(), 8u);
    EXPECT_EQ(ledger.parameters().size(), 8u);

    // A popped parameter can be inserted again
    EXPECT_TRUE(ledger.insert(*best));
    EXPECT_DOUBLE_EQ(ledger.best()->metric, 0.0);
}

TEST(TrialLedgerTest, IntegerParameters) {
    TrialLedger<int, float> ledger;
    EXPECT_TRUE(ledger.insert({3, 0.5f, 0}));
    EXPECT_TRUE(ledger.insert({-2, 0.25f, 1}));
    EXPECT_FALSE(ledger.insert({3, 0.1f, 2}));
    EXPECT_EQ(ledger.best()->parameter, -2);
}

}  // namespace
}  // namespace parzen
