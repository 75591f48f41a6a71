#pragma once

// =============================================================================
// Parzen - Numeric Constants and Checked Conversions
// =============================================================================
//
// Densities are always computed in double. Parameters cross into and out of
// the density domain through toDensity()/fromDensity(), which refuse values
// the target type cannot represent instead of truncating them.
//

#include "parzen/common.h"

#include <cmath>
#include <limits>
#include <type_traits>
#include <utility>

namespace parzen {

// =============================================================================
// Constants
// =============================================================================

namespace constants {

inline constexpr double kSqrt3 = 1.7320508075688772935274463415058723669428052538103806280558069794;
inline constexpr double kDoubleSqrt3 =
    3.4641016151377545870548926830117447338856105076207612561116139589;
inline constexpr double kSqrt5 = 2.2360679774997896964091736687312762354406183596115257242708972454;
inline constexpr double kFrac1SqrtTau =
    0.3989422804014326779399460599343818684758586311649346576659258296;
inline constexpr double kThreeQuarters = 0.75;
inline constexpr double kTau = 6.2831853071795864769252867665590057683943387987502116419498891846;

}  // namespace constants

// =============================================================================
// Checked Conversions
// =============================================================================

/// Convert a parameter value into the density domain.
template <typename P>
[[nodiscard]] double toDensity(P value) {
    static_assert(kIsParameter<P>, "Parameter type must be arithmetic");
    if constexpr (std::is_integral_v<P>) {
        // Integers beyond 2^53 lose precision as double
        constexpr double kExactLimit = 9007199254740992.0;
        const double converted = static_cast<double>(value);
        PARZEN_OVERFLOW_CHECK(converted <= kExactLimit && converted >= -kExactLimit);
        return converted;
    } else {
        return static_cast<double>(value);
    }
}

/// Convert a density-domain value back into a parameter.
/// Integral parameters are rounded to the nearest integer.
template <typename P>
[[nodiscard]] P fromDensity(double value) {
    static_assert(kIsParameter<P>, "Parameter type must be arithmetic");
    PARZEN_OVERFLOW_CHECK(!std::isnan(value));
    if constexpr (std::is_integral_v<P>) {
        const double rounded = std::round(value);
        constexpr double kLowest = static_cast<double>(std::numeric_limits<P>::lowest());
        constexpr double kUpper = static_cast<double>(std::numeric_limits<P>::max()) + 1.0;
        PARZEN_OVERFLOW_CHECK(rounded >= kLowest && rounded < kUpper);
        return static_cast<P>(rounded);
    } else {
        if (std::isinf(value)) {
            return static_cast<P>(value);
        }
        PARZEN_OVERFLOW_CHECK(std::fabs(value) <= static_cast<double>(std::numeric_limits<P>::max()));
        return static_cast<P>(value);
    }
}

/// Convert between integral types, aborting if the value does not fit.
template <typename To, typename From>
[[nodiscard]] To checkedCast(From value) {
    static_assert(std::is_integral_v<To> && std::is_integral_v<From>,
                  "checkedCast converts between integral types");
    PARZEN_OVERFLOW_CHECK(std::in_range<To>(value));
    return static_cast<To>(value);
}

}  // namespace parzen
