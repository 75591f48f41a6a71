#pragma once

// =============================================================================
// Parzen - Trial
// =============================================================================

#include <cmath>
#include <cstdint>
#include <type_traits>

namespace parzen {

/// One observation of the target function. Lower metric is better.
template <typename P, typename M>
struct Trial {
    P parameter{};
    M metric{};

    // Insertion order, used to order trials that share a metric value
    uint64_t sequence = 0;
};

/// Orders trials by metric, earlier insertion first on equal metrics
struct TrialMetricLess {
    template <typename P, typename M>
    bool operator()(const Trial<P, M>& a, const Trial<P, M>& b) const {
        if (a.metric < b.metric)
            return true;
        if (b.metric < a.metric)
            return false;
        return a.sequence < b.sequence;
    }
};

/// NaN has no place in an ordering; everything else of a non-float type does
template <typename T>
[[nodiscard]] bool isOrderable(const T& value) {
    if constexpr (std::is_floating_point_v<T>) {
        return !std::isnan(value);
    } else {
        (void)value;
        return true;
    }
}

}  // namespace parzen
