// =============================================================================
// Parzen - Binomial Kernel Implementation
// =============================================================================

#include "parzen/kernel/binomial.h"

#include <cmath>

namespace parzen {
namespace kernel {

namespace {

double logChoose(uint64_t n, uint64_t k) {
    const auto nd = static_cast<double>(n);
    const auto kd = static_cast<double>(k);
    return std::lgamma(nd + 1.0) - std::lgamma(kd + 1.0) - std::lgamma(nd - kd + 1.0);
}

}  // namespace

double binomialPmf(uint64_t n, double p, uint64_t k) {
    if (k > n) {
        return 0.0;
    }
    // Degenerate distributions put all mass on one end
    if (p <= 0.0) {
        return k == 0 ? 1.0 : 0.0;
    }
    if (p >= 1.0) {
        return k == n ? 1.0 : 0.0;
    }

    const auto kd = static_cast<double>(k);
    const auto rest = static_cast<double>(n - k);
    return std::exp(logChoose(n, k) + kd * std::log(p) + rest * std::log1p(-p));
}

uint64_t binomialInverseCdf(uint64_t n, double p, double cdf) {
    double accumulated = 0.0;
    for (uint64_t k = 0; k <= n; ++k) {
        accumulated += binomialPmf(n, p, k);
        if (accumulated >= cdf) {
            return k;
        }
    }
    return n;
}

}  // namespace kernel
}  // namespace parzen
