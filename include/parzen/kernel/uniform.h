#pragma once

// =============================================================================
// Parzen - Uniform Kernel
// =============================================================================
//
// Boxcar kernel normalised to unit variance: the box spans
// location ± √3·bandwidth and has constant density 1 / (2√3·bandwidth).
//

#include "parzen/error.h"
#include "parzen/numeric.h"
#include "parzen/random.h"

#include <fmt/format.h>

#include <cmath>

namespace parzen {
namespace kernel {

template <typename P>
class Uniform {
  public:
    using Parameter = P;

    static_assert(kIsParameter<P>, "Uniform kernel needs an arithmetic parameter type");

    /// Kernel centred at location with the given standard deviation
    [[nodiscard]] static Result<Uniform> create(P location, P bandwidth) {
        const double loc = toDensity(location);
        const double bw = toDensity(bandwidth);
        if (!std::isfinite(loc)) {
            return Error::make(ErrorCode::kInvalidLocation,
                               fmt::format("uniform kernel location {} is not finite", loc));
        }
        if (!(bw > 0.0) || !std::isfinite(bw)) {
            return Error::make(ErrorCode::kInvalidBandwidth,
                               fmt::format("uniform kernel bandwidth {} must be positive", bw));
        }
        return Uniform(loc, bw);
    }

    /// Kernel whose box spans exactly [min, max]
    [[nodiscard]] static Result<Uniform> fromBounds(P min, P max) {
        const double lo = toDensity(min);
        const double hi = toDensity(max);
        if (!(lo < hi) || !std::isfinite(lo) || !std::isfinite(hi)) {
            return Error::make(ErrorCode::kInvalidRange,
                               fmt::format("uniform kernel bounds [{}, {}] are empty", lo, hi));
        }
        return Uniform((lo + hi) / 2.0, (hi - lo) / constants::kDoubleSqrt3);
    }

    [[nodiscard]] double density(P at) const {
        const double x = toDensity(at);
        if (x < min() || x > max()) {
            return 0.0;
        }
        return 1.0 / (constants::kDoubleSqrt3 * bandwidth_);
    }

    /// Draw in the density domain, before conversion to P
    [[nodiscard]] double sampleDensity(RandomSource& rng) const {
        const double normalized =
            std::fma(rng.uniformReal(), constants::kDoubleSqrt3, -constants::kSqrt3);
        return std::fma(bandwidth_, normalized, location_);
    }

    [[nodiscard]] P sample(RandomSource& rng) const { return fromDensity<P>(sampleDensity(rng)); }

    [[nodiscard]] double location() const { return location_; }
    [[nodiscard]] double bandwidth() const { return bandwidth_; }

    /// Support bounds
    [[nodiscard]] double min() const { return location_ - constants::kSqrt3 * bandwidth_; }
    [[nodiscard]] double max() const { return location_ + constants::kSqrt3 * bandwidth_; }

  private:
    Uniform(double location, double bandwidth) : location_(location), bandwidth_(bandwidth) {}

    double location_;
    double bandwidth_;
};

}  // namespace kernel
}  // namespace parzen
