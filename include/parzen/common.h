#pragma once

// =============================================================================
// Parzen - Common Definitions
// =============================================================================

#include <cstddef>
#include <cstdint>
#include <type_traits>

// Version information
#define PARZEN_VERSION_MAJOR 0
#define PARZEN_VERSION_MINOR 1
#define PARZEN_VERSION_PATCH 0

namespace parzen {

// =============================================================================
// Compiler Attributes
// =============================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define PARZEN_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define PARZEN_UNLIKELY(x) (x)
#endif

// =============================================================================
// Parameter Type Traits
// =============================================================================
//
// A parameter type must be ordered, closed under + - * /, and convertible to
// and from the density type (double). Arithmetic types satisfy this; the
// conversion to an integral parameter rounds to the nearest value.

template <typename T>
struct IsParameter : std::is_arithmetic<T> {};

template <>
struct IsParameter<bool> : std::false_type {};

template <typename T>
inline constexpr bool kIsParameter = IsParameter<T>::value;

// =============================================================================
// Debug Macros
// =============================================================================

#ifdef NDEBUG
    #define PARZEN_ASSERT(cond) ((void)0)
#else
    #define PARZEN_ASSERT(cond)                                  \
        do {                                                     \
            if (PARZEN_UNLIKELY(!(cond))) {                      \
                parzen::assertFailed(#cond, __FILE__, __LINE__); \
            }                                                    \
        } while (0)
#endif

// Assert failure handler (implemented in error.cc)
[[noreturn]] void assertFailed(const char* cond, const char* file, int line);

// =============================================================================
// Invariant Checks (Always Active, Even in Release)
// =============================================================================
//
// Use PARZEN_CHECK for invariants whose violation means the optimizer state
// is corrupt (ledger orderings out of sync, good/bad separation broken).
//
// Use PARZEN_OVERFLOW_CHECK at numeric conversion sites; a value that does
// not fit the target type is never truncated.

// Invariant failure handler (implemented in error.cc)
[[noreturn]] void invariantFailed(const char* cond, const char* file, int line);

// Conversion failure handler (implemented in error.cc)
[[noreturn]] void conversionFailed(const char* cond, const char* file, int line);

#define PARZEN_CHECK(cond)                                      \
    do {                                                        \
        if (PARZEN_UNLIKELY(!(cond))) {                         \
            parzen::invariantFailed(#cond, __FILE__, __LINE__); \
        }                                                       \
    } while (0)

#define PARZEN_OVERFLOW_CHECK(cond)                              \
    do {                                                         \
        if (PARZEN_UNLIKELY(!(cond))) {                          \
            parzen::conversionFailed(#cond, __FILE__, __LINE__); \
        }                                                        \
    } while (0)

// =============================================================================
// Utility Types
// =============================================================================

// Non-copyable base class
class NonCopyable {
  protected:
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable&) = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;
};

}  // namespace parzen
