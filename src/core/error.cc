// =============================================================================
// Parzen - Error Handling Implementation
// =============================================================================

#include "parzen/error.h"

#include "parzen/common.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>

namespace parzen {

// =============================================================================
// Assert Failure
// =============================================================================

[[noreturn]] void assertFailed(const char* cond, const char* file, int line) {
    spdlog::critical("Assertion failed: {} at {}:{}", cond, file, line);
    std::fflush(stderr);
    std::abort();
}

// =============================================================================
// Invariant Failure (Always Active)
// =============================================================================

[[noreturn]] void invariantFailed(const char* cond, const char* file, int line) {
    spdlog::critical("Optimizer invariant violated: {} at {}:{}", cond, file, line);
    std::fflush(stderr);
    std::abort();
}

// =============================================================================
// Numeric Conversion Failure (Always Active)
// =============================================================================

[[noreturn]] void conversionFailed(const char* cond, const char* file, int line) {
    spdlog::critical("Numeric conversion out of range: {} at {}:{}", cond, file, line);
    std::fflush(stderr);
    std::abort();
}

// =============================================================================
// Error Code to String
// =============================================================================

std::string_view errorCodeToString(ErrorCode code) {
    switch (code) {
    case ErrorCode::kOk:
        return "OK";

    // Configuration errors
    case ErrorCode::kInvalidConfig:
        return "InvalidConfig";
    case ErrorCode::kInvalidRange:
        return "InvalidRange";
    case ErrorCode::kInvalidCutoff:
        return "InvalidCutoff";
    case ErrorCode::kInvalidMultiplier:
        return "InvalidMultiplier";
    case ErrorCode::kInvalidCandidateCount:
        return "InvalidCandidateCount";

    // Kernel errors
    case ErrorCode::kInvalidBandwidth:
        return "InvalidBandwidth";
    case ErrorCode::kInvalidLocation:
        return "InvalidLocation";

    // Sampling errors
    case ErrorCode::kCandidatesExhausted:
        return "CandidatesExhausted";
    case ErrorCode::kEmptyEstimator:
        return "EmptyEstimator";

    default:
        return "UnknownError";
    }
}

// =============================================================================
// Error::toString
// =============================================================================

std::string Error::toString() const {
    if (isOk()) {
        return "OK";
    }

    auto code_str = errorCodeToString(code_);
    if (message_.empty()) {
        return std::string(code_str);
    }

    return fmt::format("{}: {}", code_str, message_);
}

}  // namespace parzen
