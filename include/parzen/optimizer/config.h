#pragma once

// =============================================================================
// Parzen - Optimizer Configuration
// =============================================================================

#include "parzen/error.h"

#include <cstddef>
#include <string>

namespace parzen {

/// Caller-supplied optimizer settings
struct OptimizerConfig {
    // Fraction of trials (by metric) that forms the "good" class, in (0, 1)
    double cutoff = 0.1;

    // Candidates scored by the acquisition function per proposal
    size_t n_candidates = 25;

    // Scale applied to every neighbour-derived bandwidth, > 0
    double bandwidth_multiplier = 1.0;

    // Draw budget per candidate; bounds the search once untried values get scarce
    size_t max_draws_per_candidate = 8;

    /// Reject out-of-range settings (nothing is clamped)
    [[nodiscard]] Result<void> validate() const;

    // -------------------------------------------------------------------------
    // Serialization (JSON)
    // -------------------------------------------------------------------------

    [[nodiscard]] std::string serialize() const;

    /// Missing keys keep their current value; returns false on malformed input
    bool deserialize(const std::string& data);

    bool save(const std::string& path) const;
    bool load(const std::string& path);
};

}  // namespace parzen
