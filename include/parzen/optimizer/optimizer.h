#pragma once

// =============================================================================
// Parzen - Tree-structured Parzen Estimator Optimizer
// =============================================================================
//
// Sequential black-box optimizer for one parameter. Observed trials are split
// by metric into a "good" class (the best `cutoff` fraction) and a "bad"
// class; each class is modelled by a KDE with neighbour-derived bandwidths,
// and the next trial is the candidate maximising l(x) / g(x), where
//
//   l(x) = (prior(x) + good(x)·|good|) / (|good| + 1)
//   g(x) = (prior(x) + bad(x)·|bad|)   / (|bad| + 1)
//
// The prior component smooths both densities so that an empty class never
// produces a zero or undefined score.
//
// Usage:
//   auto prior = kde::Component<kernel::Uniform<double>>::create(0.0, 1.0);
//   auto opt = Optimizer<kernel::Gaussian<double>, double, kernel::Uniform<double>>::create(
//       -2.0, 2.0, *prior);
//   StdRandomSource rng(42);
//   for (int i = 0; i < 100; ++i) {
//       auto x = opt->newTrial(rng);
//       if (!x) break;
//       opt->feedBack(*x, f(*x));
//   }
//

#include "parzen/common.h"
#include "parzen/error.h"
#include "parzen/kde/component.h"
#include "parzen/kde/kde.h"
#include "parzen/numeric.h"
#include "parzen/optimizer/config.h"
#include "parzen/optimizer/ledger.h"
#include "parzen/optimizer/trial.h"
#include "parzen/random.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace parzen {

template <typename Kernel, typename M = double, typename PriorKernel = Kernel>
class Optimizer {
  public:
    using Parameter = typename Kernel::Parameter;
    using Metric = M;
    using TrialType = Trial<Parameter, M>;
    using Ledger = TrialLedger<Parameter, M>;
    using Prior = kde::Component<PriorKernel>;
    using Estimator = kde::KernelDensityEstimator<Kernel>;

    static_assert(kIsParameter<Parameter>, "Optimizer needs a scalar arithmetic parameter");
    static_assert(std::is_same_v<Parameter, typename PriorKernel::Parameter>,
                  "Prior and trial kernels must share the parameter type");

    /// Good and bad class estimators built from the current ledgers
    struct Estimators {
        Estimator good;
        Estimator bad;
    };

    // -------------------------------------------------------------------------
    // Construction and Configuration
    // -------------------------------------------------------------------------

    /// Optimizer searching [min, max], starting from a prior belief
    [[nodiscard]] static Result<Optimizer> create(Parameter min, Parameter max, Prior prior,
                                                  OptimizerConfig config = {}) {
        const double lo = toDensity(min);
        const double hi = toDensity(max);
        if (!std::isfinite(lo) || !std::isfinite(hi) || !(lo < hi)) {
            PARZEN_RETURN_ERROR(ErrorCode::kInvalidRange,
                                fmt::format("parameter range [{}, {}] is empty", lo, hi));
        }
        PARZEN_TRY(config.validate());
        return Optimizer(min, max, std::move(prior), config);
    }

    Result<void> setCutoff(double cutoff) {
        OptimizerConfig updated = config_;
        updated.cutoff = cutoff;
        PARZEN_TRY(updated.validate());
        config_ = updated;
        // Re-split the existing trials for the new ratio
        rebalance(expectedGood(numTrials()));
        checkSeparation();
        return {};
    }

    Result<void> setCandidates(size_t n_candidates) {
        OptimizerConfig updated = config_;
        updated.n_candidates = n_candidates;
        PARZEN_TRY(updated.validate());
        config_ = updated;
        return {};
    }

    Result<void> setBandwidthMultiplier(double multiplier) {
        OptimizerConfig updated = config_;
        updated.bandwidth_multiplier = multiplier;
        PARZEN_TRY(updated.validate());
        config_ = updated;
        return {};
    }

    [[nodiscard]] const OptimizerConfig& config() const { return config_; }
    [[nodiscard]] Parameter min() const { return min_; }
    [[nodiscard]] Parameter max() const { return max_; }
    [[nodiscard]] const Prior& prior() const { return prior_; }

    // -------------------------------------------------------------------------
    // Feedback
    // -------------------------------------------------------------------------

    /// Record the metric observed for a parameter. Parameters that were
    /// already recorded, and NaN values, are ignored.
    void feedBack(Parameter parameter, M metric) {
        if (!isOrderable(parameter) || !isOrderable(metric)) {
            spdlog::warn("Ignoring trial with an unorderable (NaN) parameter or metric");
            return;
        }
        if (good_.contains(parameter) || bad_.contains(parameter)) {
            spdlog::debug("Parameter {} already tried, ignoring feedback", parameter);
            return;
        }

        TrialType trial{parameter, metric, next_sequence_++};
        const size_t n_expected_good = expectedGood(numTrials() + 1);

        // metric <= boundary, using only operator<
        bool to_good = true;
        if (auto worst_good = good_.worst()) {
            to_good = !(worst_good->metric < metric);
        } else if (auto best_bad = bad_.best()) {
            to_good = !(best_bad->metric < metric);
        }

        const bool inserted = (to_good ? good_ : bad_).insert(trial);
        PARZEN_CHECK(inserted);

        rebalance(n_expected_good);
        checkSeparation();
        PARZEN_CHECK(good_.size() == n_expected_good);

        spdlog::debug("Trial #{} at {} filed as {}; good={} bad={}", trial.sequence, parameter,
                      to_good ? "good" : "bad", good_.size(), bad_.size());
    }

    // -------------------------------------------------------------------------
    // Proposal
    // -------------------------------------------------------------------------

    /// Build the good and bad class estimators from the current trials
    [[nodiscard]] Result<Estimators> estimators() const {
        auto good = Estimator::fromWindow(good_.parameters(), min_, max_,
                                          config_.bandwidth_multiplier);
        if (!good) {
            return good.error();
        }
        auto bad = Estimator::fromWindow(bad_.parameters(), min_, max_,
                                         config_.bandwidth_multiplier);
        if (!bad) {
            return bad.error();
        }
        return Estimators{std::move(*good), std::move(*bad)};
    }

    /// Acquisition score l(x) / g(x) of a candidate
    [[nodiscard]] double acquisition(Parameter x, const Estimators& kdes) const {
        const auto n_good = static_cast<double>(good_.size());
        const auto n_bad = static_cast<double>(bad_.size());
        const double prior_density = prior_.density(x);

        const double l = (prior_density + kdes.good.density(x) * n_good) / (n_good + 1.0);
        const double g = (prior_density + kdes.bad.density(x) * n_bad) / (n_bad + 1.0);

        if (g == 0.0) {
            return l > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
        }
        return l / g;
    }

    /// Propose the next parameter to try. Never returns a parameter that is
    /// already recorded; fails with kCandidatesExhausted if the draw budget
    /// runs out before a single untried value turns up.
    [[nodiscard]] Result<Parameter> newTrial(RandomSource& rng) const {
        Estimators kdes;
        PARZEN_ASSIGN_OR_RETURN(kdes, estimators());

        const size_t n_good = good_.size();
        const double lo = toDensity(min_);
        const double hi = toDensity(max_);
        const size_t draw_budget = config_.n_candidates * config_.max_draws_per_candidate;

        std::vector<Parameter> candidates;
        candidates.reserve(config_.n_candidates);

        size_t draws = 0;
        while (candidates.size() < config_.n_candidates && draws < draw_budget) {
            ++draws;

            std::optional<double> drawn;
            if (n_good < 2 || rng.uniformInt(0, n_good) == 0) {
                drawn = prior_.sampleDensity(rng);
            } else {
                drawn = kdes.good.sampleDensity(rng);
            }
            if (!drawn) {
                PARZEN_RETURN_ERROR(ErrorCode::kEmptyEstimator,
                                    "good estimator has no components to sample from");
            }

            if (std::isnan(*drawn)) {
                continue;
            }
            // Clamp before converting, so draws beyond what P can hold never reach it
            const Parameter candidate = fromDensity<Parameter>(std::clamp(*drawn, lo, hi));
            if (isTried(candidate) ||
                std::find(candidates.begin(), candidates.end(), candidate) != candidates.end()) {
                continue;
            }
            candidates.push_back(candidate);
        }

        if (candidates.empty()) {
            PARZEN_RETURN_ERROR(
                ErrorCode::kCandidatesExhausted,
                fmt::format("no untried parameter in [{}, {}] after {} draws", min_, max_, draws));
        }

        // First maximum wins, so the choice is fixed by the random stream
        Parameter best = candidates.front();
        double best_score = acquisition(best, kdes);
        for (size_t i = 1; i < candidates.size(); ++i) {
            const double score = acquisition(candidates[i], kdes);
            if (score > best_score) {
                best = candidates[i];
                best_score = score;
            }
        }

        spdlog::debug("Proposing {} (score {:.6g}) out of {} candidates from {} draws", best,
                      best_score, candidates.size(), draws);
        return best;
    }

    // -------------------------------------------------------------------------
    // Inspection
    // -------------------------------------------------------------------------

    /// Best trial so far, std::nullopt before any feedback
    [[nodiscard]] std::optional<TrialType> bestTrial() const {
        if (auto best = good_.best()) {
            return best;
        }
        return bad_.best();
    }

    [[nodiscard]] const Ledger& goodTrials() const { return good_; }
    [[nodiscard]] const Ledger& badTrials() const { return bad_; }
    [[nodiscard]] size_t numTrials() const { return good_.size() + bad_.size(); }

    [[nodiscard]] bool isTried(Parameter parameter) const {
        return good_.contains(parameter) || bad_.contains(parameter);
    }

  private:
    Optimizer(Parameter min, Parameter max, Prior prior, const OptimizerConfig& config)
        : min_(min), max_(max), prior_(std::move(prior)), config_(config) {}

    [[nodiscard]] size_t expectedGood(size_t n_total) const {
        return static_cast<size_t>(std::llround(config_.cutoff * static_cast<double>(n_total)));
    }

    /// Move boundary trials between the classes until |good| == n_expected_good
    void rebalance(size_t n_expected_good) {
        while (good_.size() > n_expected_good) {
            auto worst_good = good_.popWorst();
            PARZEN_CHECK(worst_good.has_value());
            const bool moved = bad_.insert(*worst_good);
            PARZEN_CHECK(moved);
        }
        while (good_.size() < n_expected_good && !bad_.empty()) {
            auto best_bad = bad_.popBest();
            PARZEN_CHECK(best_bad.has_value());
            const bool moved = good_.insert(*best_bad);
            PARZEN_CHECK(moved);
        }
    }

    /// Every good metric must be <= every bad metric
    void checkSeparation() const {
        auto worst_good = good_.worst();
        auto best_bad = bad_.best();
        if (worst_good && best_bad) {
            PARZEN_CHECK(!(best_bad->metric < worst_good->metric));
        }
    }

    Parameter min_;
    Parameter max_;
    Prior prior_;
    OptimizerConfig config_;

    Ledger good_;
    Ledger bad_;
    uint64_t next_sequence_ = 0;
};

}  // namespace parzen
