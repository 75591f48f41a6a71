// =============================================================================
// Parzen - Epanechnikov Kernel Implementation
// =============================================================================

#include "parzen/kernel/epanechnikov.h"

namespace parzen {
namespace kernel {

std::pair<double, double> selectTwoSmallest(double x1, double x2, double x3) {
    // Ensure x1 <= x2
    if (x1 > x2) {
        std::swap(x1, x2);
    }
    // x1 is one of the two smallest; the other is the smaller of x2 and x3
    return {x1, x2 > x3 ? x3 : x2};
}

double sampleStandardEpanechnikov(RandomSource& rng) {
    const double u1 = rng.uniformReal();
    const double u2 = rng.uniformReal();
    const double u3 = rng.uniformReal();
    auto [x1, x2] = selectTwoSmallest(u1, u2, u3);

    const double magnitude = rng.uniformBool() ? x1 : x2;
    const double signed_value = rng.uniformBool() ? magnitude : -magnitude;

    return signed_value * constants::kSqrt5;
}

}  // namespace kernel
}  // namespace parzen
