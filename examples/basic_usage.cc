// =============================================================================
// Parzen - Basic Usage Example
// =============================================================================
//
// Minimises a one-dimensional function with the TPE optimizer.
//
//   basic_usage [config.json]
//

#include "parzen/parzen.h"

#include <cmath>
#include <iostream>

namespace {

double objective(double x) {
    return std::sin(3.0 * x) + 0.1 * (x - 1.0) * (x - 1.0);
}

}  // namespace

int main(int argc, char** argv) {
    parzen::RuntimeConfig runtime;
    runtime.enable_debug_output = true;

    auto init_result = parzen::initialize(runtime);
    if (!init_result) {
        std::cerr << "Failed to initialize: " << init_result.error().toString() << "\n";
        return 1;
    }

    parzen::OptimizerConfig config;
    if (argc > 1 && !config.load(argv[1])) {
        std::cerr << "Failed to load config from " << argv[1] << "\n";
        return 1;
    }

    using Opt = parzen::Optimizer<parzen::kernel::Gaussian<double>, double,
                                  parzen::kernel::Uniform<double>>;

    // Flat prior over the whole search range
    auto prior_kernel = parzen::kernel::Uniform<double>::fromBounds(-4.0, 4.0);
    if (!prior_kernel) {
        std::cerr << prior_kernel.error().toString() << "\n";
        return 1;
    }
    auto prior = parzen::kde::Component<parzen::kernel::Uniform<double>>::create(
        prior_kernel->location(), prior_kernel->bandwidth());
    if (!prior) {
        std::cerr << prior.error().toString() << "\n";
        return 1;
    }

    auto opt = Opt::create(-4.0, 4.0, *prior, config);
    if (!opt) {
        std::cerr << "Failed to create optimizer: " << opt.error().toString() << "\n";
        return 1;
    }

    parzen::StdRandomSource rng;
    for (int i = 0; i < 100; ++i) {
        auto x = opt->newTrial(rng);
        if (!x) {
            std::cerr << "Stopping early: " << x.error().toString() << "\n";
            break;
        }
        opt->feedBack(*x, objective(*x));
    }

    if (auto best = opt->bestTrial()) {
        std::cout << "Best parameter: " << best->parameter << "\n";
        std::cout << "Best metric:    " << best->metric << "\n";
    }
    std::cout << "Trials: " << opt->numTrials() << " (" << opt->goodTrials().size()
              << " good)\n";

    parzen::shutdown();
    return 0;
}
