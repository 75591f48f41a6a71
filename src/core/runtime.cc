// =============================================================================
// Parzen - Runtime Initialization
// =============================================================================

#include "parzen/parzen.h"

#include <spdlog/spdlog.h>

#include <atomic>

namespace parzen {

namespace {
std::atomic<bool> g_initialized{false};
}  // namespace

Result<void> initialize(const RuntimeConfig& config) {
    if (g_initialized.exchange(true)) {
        spdlog::warn("Parzen runtime already initialized");
        return {};
    }

    if (config.enable_debug_output) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    spdlog::info("Parzen v{} initialized", Version::string());
    return {};
}

void shutdown() {
    if (!g_initialized.exchange(false)) {
        return;  // Not initialized
    }
    spdlog::info("Parzen shutting down");
    spdlog::default_logger()->flush();
}

bool isInitialized() {
    return g_initialized.load();
}

}  // namespace parzen
