#pragma once

// =============================================================================
// Parzen - Kernel Density Estimator
// =============================================================================
//
// Unweighted mixture of kernel components. Used by the optimizer to model the
// "good" and "bad" parameter distributions, but usable on its own as well.
//
// Features:
// - Mean-of-components density (zero for an empty estimator)
// - Single-pass reservoir selection of the component to sample from
// - Construction from an ascending parameter sequence with adaptive,
//   neighbour-derived bandwidths
//

#include "parzen/error.h"
#include "parzen/kde/component.h"
#include "parzen/random.h"
#include "parzen/window.h"

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace parzen {
namespace kde {

template <typename Kernel>
class KernelDensityEstimator {
  public:
    using Parameter = typename Kernel::Parameter;
    using ComponentType = Component<Kernel>;

    KernelDensityEstimator() = default;
    explicit KernelDensityEstimator(std::vector<ComponentType> components)
        : components_(std::move(components)) {}

    // -------------------------------------------------------------------------
    // Construction
    // -------------------------------------------------------------------------

    /// Build from an ascending, duplicate-free parameter range. Each element
    /// becomes one component whose bandwidth is derived from its neighbours,
    /// falling back to the range bounds at either end.
    template <typename Range>
    [[nodiscard]] static Result<KernelDensityEstimator>
    fromWindow(const Range& ascending, Parameter range_start, Parameter range_end,
               double multiplier = 1.0) {
        std::vector<ComponentType> components;
        auto window = makeTripleWindow(ascending);
        while (auto triple = window.next()) {
            auto component = ComponentType::fromWindow(*triple, range_start, range_end, multiplier);
            if (!component) {
                return component.error();
            }
            if (component->has_value()) {
                components.push_back(std::move(**component));
            }
        }
        return KernelDensityEstimator(std::move(components));
    }

    // -------------------------------------------------------------------------
    // Density and Sampling
    // -------------------------------------------------------------------------

    /// Mean of the component densities, 0 if there are no components
    [[nodiscard]] double density(Parameter at) const {
        if (components_.empty()) {
            return 0.0;
        }
        double sum = 0.0;
        for (const auto& component : components_) {
            sum += component.density(at);
        }
        return sum / static_cast<double>(components_.size());
    }

    /// Pick a component uniformly at random in a single pass (reservoir
    /// sampling): component i replaces the held one when a draw from [0, i]
    /// comes up 0. Returns nullptr for an empty estimator.
    [[nodiscard]] const ComponentType* selectComponent(RandomSource& rng) const {
        const ComponentType* selected = nullptr;
        for (size_t i = 0; i < components_.size(); ++i) {
            if (rng.uniformInt(0, i) == 0) {
                selected = &components_[i];
            }
        }
        return selected;
    }

    /// Random point from the mixture, std::nullopt if there are no components
    [[nodiscard]] std::optional<Parameter> sample(RandomSource& rng) const {
        const ComponentType* component = selectComponent(rng);
        if (component == nullptr) {
            return std::nullopt;
        }
        return component->sample(rng);
    }

    /// Like sample(), but the draw stays in the density domain so the caller
    /// can bound it before converting to the parameter type
    [[nodiscard]] std::optional<double> sampleDensity(RandomSource& rng) const {
        const ComponentType* component = selectComponent(rng);
        if (component == nullptr) {
            return std::nullopt;
        }
        return component->sampleDensity(rng);
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] size_t size() const { return components_.size(); }
    [[nodiscard]] bool empty() const { return components_.empty(); }
    [[nodiscard]] const std::vector<ComponentType>& components() const { return components_; }

  private:
    std::vector<ComponentType> components_;
};

}  // namespace kde
}  // namespace parzen
