#pragma once

// =============================================================================
// Parzen - Main Header
// =============================================================================
//
// Tree-structured Parzen Estimator for single-parameter black-box
// optimization, with the kernels and kernel density estimators it is built on.
//
// Include this header for full API access.
//

#include "parzen/common.h"
#include "parzen/error.h"
#include "parzen/kde/component.h"
#include "parzen/kde/kde.h"
#include "parzen/kernel/binomial.h"
#include "parzen/kernel/epanechnikov.h"
#include "parzen/kernel/gaussian.h"
#include "parzen/kernel/multi.h"
#include "parzen/kernel/uniform.h"
#include "parzen/numeric.h"
#include "parzen/optimizer/config.h"
#include "parzen/optimizer/ledger.h"
#include "parzen/optimizer/optimizer.h"
#include "parzen/optimizer/trial.h"
#include "parzen/random.h"
#include "parzen/window.h"

#include <string>

namespace parzen {

// =============================================================================
// Version Information
// =============================================================================

struct Version {
    static constexpr int major = PARZEN_VERSION_MAJOR;
    static constexpr int minor = PARZEN_VERSION_MINOR;
    static constexpr int patch = PARZEN_VERSION_PATCH;

    static std::string string() {
        return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    }
};

// =============================================================================
// Runtime Initialization
// =============================================================================
//
// Optional. The library works without it; initialize() only configures
// logging for programs that want the optimizer's debug trace.

struct RuntimeConfig {
    bool enable_debug_output = false;  // Log every feedback and proposal
};

// Configure logging (call once at program start)
Result<void> initialize(const RuntimeConfig& config = {});

// Shutdown the runtime (call at program end)
void shutdown();

// Check if runtime is initialized
bool isInitialized();

}  // namespace parzen
