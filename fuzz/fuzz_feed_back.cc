// =============================================================================
// Parzen - Optimizer Feedback Fuzz Target
// =============================================================================
//
// Feeds arbitrary (parameter, metric) pairs, including duplicates, and checks
// the good/bad split after every step.
//

#include "parzen/kernel/uniform.h"
#include "parzen/optimizer/optimizer.h"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 2) return 0;

    parzen::OptimizerConfig config;
    config.cutoff = 0.05 + 0.9 * (data[0] / 255.0);

    auto prior = parzen::kde::Component<parzen::kernel::Uniform<int>>::create(128, 80);
    if (!prior) return 0;
    auto opt = parzen::Optimizer<parzen::kernel::Uniform<int>>::create(0, 255, *prior, config);
    if (!opt) return 0;

    for (size_t i = 1; i + 1 < size; i += 2) {
        opt->feedBack(data[i], static_cast<double>(data[i + 1] % 16));

        const size_t total = opt->numTrials();
        const auto expected =
            static_cast<size_t>(std::llround(config.cutoff * static_cast<double>(total)));
        if (opt->goodTrials().size() != expected) {
            std::abort();
        }
        auto worst_good = opt->goodTrials().worst();
        auto best_bad = opt->badTrials().best();
        if (worst_good && best_bad && best_bad->metric < worst_good->metric) {
            std::abort();
        }
    }

    parzen::StdRandomSource rng(size);
    auto next = opt->newTrial(rng);
    if (next && opt->isTried(*next)) {
        std::abort();
    }
    return 0;
}
