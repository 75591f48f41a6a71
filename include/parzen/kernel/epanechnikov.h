#pragma once

// =============================================================================
// Parzen - Epanechnikov Kernel
// =============================================================================
//
// Parabolic kernel standardised to unit variance, supported on
// location ± √5·bandwidth.
//

#include "parzen/error.h"
#include "parzen/numeric.h"
#include "parzen/random.h"

#include <fmt/format.h>

#include <cmath>
#include <utility>

namespace parzen {
namespace kernel {

/// The two smallest of three values, in no particular order
[[nodiscard]] std::pair<double, double> selectTwoSmallest(double x1, double x2, double x3);

/// Sample from the standard (unit variance) Epanechnikov distribution
[[nodiscard]] double sampleStandardEpanechnikov(RandomSource& rng);

template <typename P>
class Epanechnikov {
  public:
    using Parameter = P;

    static_assert(kIsParameter<P>, "Epanechnikov kernel needs an arithmetic parameter type");

    [[nodiscard]] static Result<Epanechnikov> create(P location, P bandwidth) {
        const double loc = toDensity(location);
        const double bw = toDensity(bandwidth);
        if (!std::isfinite(loc)) {
            return Error::make(ErrorCode::kInvalidLocation,
                               fmt::format("epanechnikov kernel location {} is not finite", loc));
        }
        if (!(bw > 0.0) || !std::isfinite(bw)) {
            return Error::make(
                ErrorCode::kInvalidBandwidth,
                fmt::format("epanechnikov kernel bandwidth {} must be positive", bw));
        }
        return Epanechnikov(loc, bw);
    }

    [[nodiscard]] double density(P at) const {
        // Scale to -1..1
        const double normalized = (toDensity(at) - location_) / bandwidth_ / constants::kSqrt5;
        if (normalized < -1.0 || normalized > 1.0) {
            return 0.0;
        }
        return constants::kThreeQuarters / constants::kSqrt5 * (1.0 - normalized * normalized) /
               bandwidth_;
    }

    [[nodiscard]] double sampleDensity(RandomSource& rng) const {
        return std::fma(bandwidth_, sampleStandardEpanechnikov(rng), location_);
    }

    [[nodiscard]] P sample(RandomSource& rng) const { return fromDensity<P>(sampleDensity(rng)); }

    [[nodiscard]] double location() const { return location_; }
    [[nodiscard]] double bandwidth() const { return bandwidth_; }

  private:
    Epanechnikov(double location, double bandwidth)
        : location_(location), bandwidth_(bandwidth) {}

    double location_;
    double bandwidth_;
};

}  // namespace kernel
}  // namespace parzen
