#pragma once

// =============================================================================
// Parzen - Trial Ledger
// =============================================================================
//
// Duplicate-free trial collection with two orderings kept in lockstep:
//
// - by metric:    best / worst / pop in O(log n)
// - by parameter: ascending iteration and membership in O(log n)
//
// Both orderings are private and only mutated together inside insert() and
// the pop methods, which check afterwards that they still hold the same set.
//

#include "parzen/common.h"
#include "parzen/optimizer/trial.h"

#include <cstddef>
#include <iterator>
#include <optional>
#include <set>
#include <vector>

namespace parzen {

template <typename P, typename M>
class TrialLedger {
  public:
    using TrialType = Trial<P, M>;

    // -------------------------------------------------------------------------
    // Mutation
    // -------------------------------------------------------------------------

    /// Insert a trial. Returns false (and changes nothing) if its parameter is
    /// already present or either value cannot be ordered (NaN).
    bool insert(const TrialType& trial) {
        if (!isOrderable(trial.parameter) || !isOrderable(trial.metric)) {
            return false;
        }
        auto [param_it, inserted] = by_parameter_.insert(trial.parameter);
        if (!inserted) {
            return false;
        }
        auto [metric_it, metric_inserted] = by_metric_.insert(trial);
        if (!metric_inserted) {
            // Two trials with the same sequence number: roll back and fail loudly
            by_parameter_.erase(param_it);
        }
        PARZEN_CHECK(metric_inserted);
        checkConsistency();
        return true;
    }

    /// Remove and return the trial with the lowest metric
    std::optional<TrialType> popBest() {
        if (by_metric_.empty()) {
            return std::nullopt;
        }
        return extract(by_metric_.begin());
    }

    /// Remove and return the trial with the highest metric
    std::optional<TrialType> popWorst() {
        if (by_metric_.empty()) {
            return std::nullopt;
        }
        return extract(std::prev(by_metric_.end()));
    }

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    [[nodiscard]] std::optional<TrialType> best() const {
        if (by_metric_.empty()) {
            return std::nullopt;
        }
        return *by_metric_.begin();
    }

    [[nodiscard]] std::optional<TrialType> worst() const {
        if (by_metric_.empty()) {
            return std::nullopt;
        }
        return *by_metric_.rbegin();
    }

    [[nodiscard]] bool contains(P parameter) const { return by_parameter_.contains(parameter); }

    /// Ascending parameter values; iterate it as many times as needed
    [[nodiscard]] const std::set<P>& parameters() const { return by_parameter_; }

    /// All trials, best first
    [[nodiscard]] std::vector<TrialType> trials() const {
        return std::vector<TrialType>(by_metric_.begin(), by_metric_.end());
    }

    [[nodiscard]] size_t size() const { return by_metric_.size(); }
    [[nodiscard]] bool empty() const { return by_metric_.empty(); }

  private:
    using MetricSet = std::set<TrialType, TrialMetricLess>;

    TrialType extract(typename MetricSet::iterator it) {
        TrialType trial = *it;
        const size_t erased = by_parameter_.erase(trial.parameter);
        PARZEN_CHECK(erased == 1);
        by_metric_.erase(it);
        checkConsistency();
        return trial;
    }

    void checkConsistency() const { PARZEN_CHECK(by_metric_.size() == by_parameter_.size()); }

    MetricSet by_metric_;
    std::set<P> by_parameter_;
};

}  // namespace parzen
