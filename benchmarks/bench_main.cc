// =============================================================================
// Parzen - Benchmark Entry Point
// =============================================================================

#define ANKERL_NANOBENCH_IMPLEMENT
#include "parzen/parzen.h"

#include <nanobench.h>

namespace parzen {
void benchKde();
void benchOptimizer();
}  // namespace parzen

int main() {
    parzen::initialize();
    parzen::benchKde();
    parzen::benchOptimizer();
    parzen::shutdown();
    return 0;
}
