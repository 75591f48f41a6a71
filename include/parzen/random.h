#pragma once

// =============================================================================
// Parzen - Randomness Capability
// =============================================================================
//
// Kernels, estimators and the optimizer never own a generator. They draw
// from a RandomSource passed in by the caller, which keeps independent
// optimization runs independent and makes every run reproducible from a seed.
//

#include "parzen/common.h"

#include <cstddef>
#include <cstdint>
#include <random>

namespace parzen {

// =============================================================================
// RandomSource
// =============================================================================

class RandomSource {
  public:
    virtual ~RandomSource() = default;

    /// Uniform real in [0, 1)
    [[nodiscard]] virtual double uniformReal() = 0;

    /// Fair coin
    [[nodiscard]] virtual bool uniformBool() = 0;

    /// Uniform integer in [low, high], both inclusive
    [[nodiscard]] virtual size_t uniformInt(size_t low, size_t high) = 0;
};

// =============================================================================
// StdRandomSource - std::mt19937_64 backed source
// =============================================================================

class StdRandomSource final : public RandomSource, NonCopyable {
  public:
    /// Seed 0 draws a seed from std::random_device
    explicit StdRandomSource(uint64_t seed = 0);

    [[nodiscard]] double uniformReal() override;
    [[nodiscard]] bool uniformBool() override;
    [[nodiscard]] size_t uniformInt(size_t low, size_t high) override;

    [[nodiscard]] uint64_t seed() const { return seed_; }

  private:
    uint64_t seed_;
    std::mt19937_64 engine_;
};

}  // namespace parzen
