#pragma once

// =============================================================================
// Parzen - Binomial Kernel
// =============================================================================
//
// Discrete kernel for non-negative integer parameters. The (location,
// bandwidth) pair is inverted into binomial parameters by matching the first
// two moments:
//
//   location   = n·p
//   bandwidth² = n·p·(1 − p)   =>   p = 1 − bandwidth² / location
//
// Clamp policy: p is clamped into [kMinSuccessRate, 1 − kMinSuccessRate],
// then n = round(location / p) is clamped into [1, kMaxTrials] and p is
// recomputed as location / n so the mean is always preserved. When the
// requested spread exceeds what a binomial with that mean can carry the
// variance is what gives way.
//
// The probability mass function is evaluated in log space, so neither n nor
// the binomial coefficients can overflow.
//

#include "parzen/error.h"
#include "parzen/numeric.h"
#include "parzen/random.h"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <type_traits>

namespace parzen {
namespace kernel {

inline constexpr double kMinSuccessRate = 1e-3;
inline constexpr uint64_t kMaxTrials = uint64_t{1} << 16;

/// Probability mass of Binomial(n, p) at k (0 for k > n)
[[nodiscard]] double binomialPmf(uint64_t n, double p, uint64_t k);

/// Smallest k whose cumulative mass reaches cdf (n if rounding falls short)
[[nodiscard]] uint64_t binomialInverseCdf(uint64_t n, double p, double cdf);

template <typename P>
class Binomial {
  public:
    using Parameter = P;

    static_assert(std::is_integral_v<P> && kIsParameter<P>,
                  "Binomial kernel needs an integral parameter type");

    [[nodiscard]] static Result<Binomial> create(P location, P bandwidth) {
        if (!(toDensity(bandwidth) > 0.0)) {
            return Error::make(
                ErrorCode::kInvalidBandwidth,
                fmt::format("binomial kernel bandwidth {} must be positive", bandwidth));
        }
        if (toDensity(location) < 0.0 || toDensity(location) > static_cast<double>(kMaxTrials)) {
            return Error::make(ErrorCode::kInvalidLocation,
                               fmt::format("binomial kernel location {} outside [0, {}]",
                                           location, kMaxTrials));
        }

        const double mean = toDensity(location);
        const double std_dev = toDensity(bandwidth);
        const double variance = std_dev * std_dev;

        double p = mean > 0.0 ? 1.0 - variance / mean : kMinSuccessRate;
        p = std::clamp(p, kMinSuccessRate, 1.0 - kMinSuccessRate);

        const double trials =
            std::clamp(std::round(mean / p), 1.0, static_cast<double>(kMaxTrials));
        const auto n = static_cast<uint64_t>(trials);

        return Binomial(n, mean / trials);
    }

    /// Build directly from distribution parameters
    [[nodiscard]] static Result<Binomial> fromDistribution(uint64_t n, double p) {
        if (n == 0 || n > kMaxTrials) {
            return Error::make(ErrorCode::kInvalidBandwidth,
                               fmt::format("binomial trial count {} outside [1, {}]", n,
                                           kMaxTrials));
        }
        if (!(p >= 0.0 && p <= 1.0)) {
            return Error::make(ErrorCode::kInvalidBandwidth,
                               fmt::format("binomial success rate {} outside [0, 1]", p));
        }
        return Binomial(n, p);
    }

    [[nodiscard]] double density(P at) const {
        if (toDensity(at) < 0.0) {
            return 0.0;
        }
        return binomialPmf(n_, p_, checkedCast<uint64_t>(at));
    }

    /// Number of successes in [0, n], as a density-domain value
    [[nodiscard]] double sampleDensity(RandomSource& rng) const {
        return static_cast<double>(binomialInverseCdf(n_, p_, rng.uniformReal()));
    }

    [[nodiscard]] P sample(RandomSource& rng) const {
        return checkedCast<P>(binomialInverseCdf(n_, p_, rng.uniformReal()));
    }

    [[nodiscard]] uint64_t trials() const { return n_; }
    [[nodiscard]] double successRate() const { return p_; }

    [[nodiscard]] double mean() const { return static_cast<double>(n_) * p_; }
    [[nodiscard]] double stdDev() const {
        return std::sqrt(static_cast<double>(n_) * p_ * (1.0 - p_));
    }

  private:
    Binomial(uint64_t n, double p) : n_(n), p_(p) {}

    uint64_t n_;
    double p_;
};

}  // namespace kernel
}  // namespace parzen
