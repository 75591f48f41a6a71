// =============================================================================
// Parzen - Gaussian Kernel Implementation
// =============================================================================

#include "parzen/kernel/gaussian.h"

#include <cmath>

namespace parzen {
namespace kernel {

double standardNormalDensity(double z) {
    return constants::kFrac1SqrtTau * std::exp(-0.5 * z * z);
}

double sampleStandardNormal(RandomSource& rng) {
    // Map u1 into (0, 1] so that log(u1) stays finite
    const double u1 = 1.0 - rng.uniformReal();
    const double u2 = rng.uniformReal();
    return std::sqrt(-2.0 * std::log(u1)) * std::cos(constants::kTau * u2);
}

}  // namespace kernel
}  // namespace parzen
