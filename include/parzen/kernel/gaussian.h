#pragma once

// =============================================================================
// Parzen - Gaussian Kernel
// =============================================================================

#include "parzen/error.h"
#include "parzen/numeric.h"
#include "parzen/random.h"

#include <fmt/format.h>

#include <cmath>

namespace parzen {
namespace kernel {

/// Standard normal density at z
[[nodiscard]] double standardNormalDensity(double z);

/// Standard normal sample (Box-Muller, two uniform draws)
[[nodiscard]] double sampleStandardNormal(RandomSource& rng);

template <typename P>
class Gaussian {
  public:
    using Parameter = P;

    static_assert(kIsParameter<P>, "Gaussian kernel needs an arithmetic parameter type");

    [[nodiscard]] static Result<Gaussian> create(P location, P bandwidth) {
        const double loc = toDensity(location);
        const double bw = toDensity(bandwidth);
        if (!std::isfinite(loc)) {
            return Error::make(ErrorCode::kInvalidLocation,
                               fmt::format("gaussian kernel location {} is not finite", loc));
        }
        if (!(bw > 0.0) || !std::isfinite(bw)) {
            return Error::make(ErrorCode::kInvalidBandwidth,
                               fmt::format("gaussian kernel bandwidth {} must be positive", bw));
        }
        return Gaussian(loc, bw);
    }

    [[nodiscard]] double density(P at) const {
        const double normalized = (toDensity(at) - location_) / bandwidth_;
        return standardNormalDensity(normalized) / bandwidth_;
    }

    /// Draw in the density domain; unbounded, so it may lie outside P
    [[nodiscard]] double sampleDensity(RandomSource& rng) const {
        return std::fma(bandwidth_, sampleStandardNormal(rng), location_);
    }

    [[nodiscard]] P sample(RandomSource& rng) const { return fromDensity<P>(sampleDensity(rng)); }

    [[nodiscard]] double location() const { return location_; }
    [[nodiscard]] double bandwidth() const { return bandwidth_; }

  private:
    Gaussian(double location, double bandwidth) : location_(location), bandwidth_(bandwidth) {}

    double location_;
    double bandwidth_;
};

}  // namespace kernel
}  // namespace parzen
