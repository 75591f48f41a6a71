#pragma once

// =============================================================================
// Parzen - KDE Component
// =============================================================================
//
// One kernel placed at a location with a bandwidth. Components of a trial
// KDE get their bandwidth from the distance to the neighbouring trials:
//
//   Full(l, x, r)       max(r - x, x - l)
//   LeftMiddle(l, x)    max(x - l, range_end - x)
//   MiddleRight(x, r)   max(r - x, x - range_start)
//   Middle(x)           max(range_end - x, x - range_start)
//
// and the result is scaled by the bandwidth multiplier.
//

#include "parzen/error.h"
#include "parzen/numeric.h"
#include "parzen/random.h"
#include "parzen/window.h"

#include <fmt/format.h>

#include <algorithm>
#include <optional>
#include <utility>

namespace parzen {
namespace kde {

/// Neighbour-derived bandwidth for the centre of a window, or std::nullopt
/// for windows without a centre (Left, Right). Distances are taken in the
/// density domain so unsigned parameters cannot wrap around.
template <typename P>
[[nodiscard]] std::optional<double> adaptiveBandwidth(const Triple<P>& window, P range_start,
                                                      P range_end) {
    if (!window.hasCenter()) {
        return std::nullopt;
    }
    const double x = toDensity(*window.middle);
    const double to_left = x - toDensity(window.left ? *window.left : range_start);
    const double to_right = toDensity(window.right ? *window.right : range_end) - x;
    return std::max(to_left, to_right);
}

template <typename Kernel>
class Component {
  public:
    using Parameter = typename Kernel::Parameter;

    [[nodiscard]] static Result<Component> create(Parameter location, Parameter bandwidth) {
        auto kernel = Kernel::create(location, bandwidth);
        if (!kernel) {
            return kernel.error();
        }
        return Component(std::move(*kernel), location, bandwidth);
    }

    /// Component centred on a window's middle element with a neighbour-derived
    /// bandwidth. Windows without a centre yield std::nullopt.
    [[nodiscard]] static Result<std::optional<Component>> fromWindow(const Triple<Parameter>& window,
                                                                     Parameter range_start,
                                                                     Parameter range_end,
                                                                     double multiplier = 1.0) {
        auto raw = adaptiveBandwidth(window, range_start, range_end);
        if (!raw) {
            return std::optional<Component>{};
        }

        const Parameter bandwidth = fromDensity<Parameter>(*raw * multiplier);
        if (!(toDensity(bandwidth) > 0.0)) {
            return Error::make(ErrorCode::kInvalidBandwidth,
                               fmt::format("bandwidth {} at {} is not positive (multiplier {})",
                                           toDensity(bandwidth), toDensity(*window.middle),
                                           multiplier));
        }

        auto component = create(*window.middle, bandwidth);
        if (!component) {
            return component.error();
        }
        return std::optional<Component>(std::move(*component));
    }

    [[nodiscard]] double density(Parameter at) const { return kernel_.density(at); }
    [[nodiscard]] Parameter sample(RandomSource& rng) const { return kernel_.sample(rng); }
    [[nodiscard]] double sampleDensity(RandomSource& rng) const {
        return kernel_.sampleDensity(rng);
    }

    [[nodiscard]] const Kernel& kernel() const { return kernel_; }
    [[nodiscard]] Parameter location() const { return location_; }
    [[nodiscard]] Parameter bandwidth() const { return bandwidth_; }

  private:
    Component(Kernel kernel, Parameter location, Parameter bandwidth)
        : kernel_(std::move(kernel)), location_(location), bandwidth_(bandwidth) {}

    Kernel kernel_;
    Parameter location_;
    Parameter bandwidth_;
};

}  // namespace kde
}  // namespace parzen
