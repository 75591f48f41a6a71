#pragma once

// =============================================================================
// Parzen - Multivariate Kernel
// =============================================================================
//
// Combines one kernel per dimension over std::tuple parameters. Dimensions are
// treated as independent: the density is the product of the per-dimension
// densities and each dimension is sampled on its own. Kernels are still only
// placed at observed combinations, so a KDE of MultiKernels keeps the joint
// structure of the trials even though each kernel is separable.
//

#include "parzen/error.h"
#include "parzen/random.h"

#include <cstddef>
#include <optional>
#include <tuple>
#include <utility>

namespace parzen {
namespace kernel {

template <typename... Kernels>
class MultiKernel {
  public:
    using Parameter = std::tuple<typename Kernels::Parameter...>;

    static_assert(sizeof...(Kernels) > 0, "MultiKernel needs at least one dimension");

    [[nodiscard]] static Result<MultiKernel> create(const Parameter& location,
                                                    const Parameter& bandwidth) {
        return createImpl(location, bandwidth, std::index_sequence_for<Kernels...>{});
    }

    /// Assemble from already constructed per-dimension kernels
    explicit MultiKernel(std::tuple<Kernels...> kernels) : kernels_(std::move(kernels)) {}

    [[nodiscard]] double density(const Parameter& at) const {
        return densityImpl(at, std::index_sequence_for<Kernels...>{});
    }

    [[nodiscard]] Parameter sample(RandomSource& rng) const {
        return sampleImpl(rng, std::index_sequence_for<Kernels...>{});
    }

    [[nodiscard]] const std::tuple<Kernels...>& kernels() const { return kernels_; }

    [[nodiscard]] static constexpr size_t dimensions() { return sizeof...(Kernels); }

  private:
    template <size_t... I>
    static Result<MultiKernel> createImpl(const Parameter& location, const Parameter& bandwidth,
                                          std::index_sequence<I...>) {
        std::tuple<std::optional<Kernels>...> built;
        Error failure;

        auto build = [&](auto index) {
            constexpr size_t kIndex = decltype(index)::value;
            using Kernel = std::tuple_element_t<kIndex, std::tuple<Kernels...>>;
            if (failure.isError()) {
                return;
            }
            auto result = Kernel::create(std::get<kIndex>(location), std::get<kIndex>(bandwidth));
            if (!result) {
                failure = result.error();
                return;
            }
            std::get<kIndex>(built).emplace(std::move(*result));
        };
        (build(std::integral_constant<size_t, I>{}), ...);

        if (failure.isError()) {
            return failure;
        }
        return MultiKernel(std::tuple<Kernels...>(std::move(*std::get<I>(built))...));
    }

    template <size_t... I>
    double densityImpl(const Parameter& at, std::index_sequence<I...>) const {
        return (1.0 * ... * std::get<I>(kernels_).density(std::get<I>(at)));
    }

    template <size_t... I>
    Parameter sampleImpl(RandomSource& rng, std::index_sequence<I...>) const {
        // Braced initialisation fixes the draw order to dimension order
        return Parameter{std::get<I>(kernels_).sample(rng)...};
    }

    std::tuple<Kernels...> kernels_;
};

}  // namespace kernel
}  // namespace parzen
