// =============================================================================
// Parzen - Randomness Capability Implementation
// =============================================================================

#include "parzen/random.h"

#include <spdlog/spdlog.h>

namespace parzen {

namespace {

uint64_t resolveSeed(uint64_t seed) {
    if (seed != 0) {
        return seed;
    }
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) | rd();
}

}  // namespace

StdRandomSource::StdRandomSource(uint64_t seed) : seed_(resolveSeed(seed)), engine_(seed_) {
    spdlog::debug("StdRandomSource seeded with {}", seed_);
}

double StdRandomSource::uniformReal() {
    // generate_canonical may round up to 1.0 on some implementations
    double value = std::generate_canonical<double, 53>(engine_);
    while (value >= 1.0) {
        value = std::generate_canonical<double, 53>(engine_);
    }
    return value;
}

bool StdRandomSource::uniformBool() {
    return (engine_() >> 63) != 0;
}

size_t StdRandomSource::uniformInt(size_t low, size_t high) {
    PARZEN_ASSERT(low <= high);
    std::uniform_int_distribution<size_t> dist(low, high);
    return dist(engine_);
}

}  // namespace parzen
