// =============================================================================
// Parzen - Optimizer Configuration Implementation
// =============================================================================

#include "parzen/optimizer/config.h"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cmath>
#include <fstream>
#include <iterator>

namespace parzen {

namespace {

// Counts must be non-negative JSON integers; nlohmann would wrap -1 silently
bool readCount(const nlohmann::json& j, const char* key, size_t& out) {
    auto it = j.find(key);
    if (it == j.end()) {
        return true;
    }
    if (!it->is_number_unsigned()) {
        spdlog::warn("Failed to deserialize OptimizerConfig: '{}' must be a non-negative integer",
                     key);
        return false;
    }
    out = it->get<size_t>();
    return true;
}

}  // namespace

// =============================================================================
// Validation
// =============================================================================

Result<void> OptimizerConfig::validate() const {
    if (!(cutoff > 0.0 && cutoff < 1.0)) {
        PARZEN_RETURN_ERROR(ErrorCode::kInvalidCutoff,
                            fmt::format("cutoff {} must lie in (0, 1)", cutoff));
    }
    if (n_candidates == 0) {
        PARZEN_RETURN_ERROR(ErrorCode::kInvalidCandidateCount,
                            "at least one candidate is required");
    }
    if (!(bandwidth_multiplier > 0.0) || !std::isfinite(bandwidth_multiplier)) {
        PARZEN_RETURN_ERROR(
            ErrorCode::kInvalidMultiplier,
            fmt::format("bandwidth multiplier {} must be positive", bandwidth_multiplier));
    }
    if (max_draws_per_candidate == 0) {
        PARZEN_RETURN_ERROR(ErrorCode::kInvalidConfig,
                            "max_draws_per_candidate must be at least 1");
    }
    PARZEN_RETURN_OK();
}

// =============================================================================
// Serialization
// =============================================================================

std::string OptimizerConfig::serialize() const {
    nlohmann::json j;
    j["cutoff"] = cutoff;
    j["n_candidates"] = n_candidates;
    j["bandwidth_multiplier"] = bandwidth_multiplier;
    j["max_draws_per_candidate"] = max_draws_per_candidate;
    return j.dump(2);
}

bool OptimizerConfig::deserialize(const std::string& data) {
    try {
        auto j = nlohmann::json::parse(data);
        if (!j.is_object()) {
            spdlog::warn("Failed to deserialize OptimizerConfig: expected a JSON object");
            return false;
        }

        OptimizerConfig parsed = *this;
        parsed.cutoff = j.value("cutoff", parsed.cutoff);
        parsed.bandwidth_multiplier = j.value("bandwidth_multiplier", parsed.bandwidth_multiplier);
        if (!readCount(j, "n_candidates", parsed.n_candidates) ||
            !readCount(j, "max_draws_per_candidate", parsed.max_draws_per_candidate)) {
            return false;
        }

        *this = parsed;
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to deserialize OptimizerConfig: {}", e.what());
        return false;
    }
}

bool OptimizerConfig::save(const std::string& path) const {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        spdlog::warn("Failed to open file for saving: {}", path);
        return false;
    }

    std::string data = serialize();
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    return file.good();
}

bool OptimizerConfig::load(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        spdlog::warn("Failed to open file for loading: {}", path);
        return false;
    }

    std::string data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return deserialize(data);
}

}  // namespace parzen
