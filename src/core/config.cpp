/// @file src/core/config.cpp
/// @brief EngineConfig environment loading and validation.

#include "icscore/config.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <stdexcept>

namespace icscore::core {

std::string EngineConfig::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int EngineConfig::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double EngineConfig::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

EngineConfig EngineConfig::from_env() {
    EngineConfig cfg;

    cfg.threads = static_cast<std::size_t>(
        std::max(0, get_env_int("ICSCORE_THREADS", static_cast<int>(cfg.threads))));
    cfg.min_sector_sample = static_cast<std::size_t>(
        std::max(1, get_env_int("ICSCORE_MIN_SECTOR_SAMPLE",
                                static_cast<int>(cfg.min_sector_sample))));

    cfg.stabilizer.alpha      = get_env_double("ICSCORE_SMOOTHING_ALPHA", cfg.stabilizer.alpha);
    cfg.stabilizer.min_change = get_env_double("ICSCORE_MIN_SCORE_CHANGE", cfg.stabilizer.min_change);

    auto& agg = cfg.aggregator;
    agg.high_completeness   = get_env_double("ICSCORE_HIGH_COMPLETENESS", agg.high_completeness);
    agg.medium_completeness = get_env_double("ICSCORE_MEDIUM_COMPLETENESS", agg.medium_completeness);
    agg.low_completeness    = get_env_double("ICSCORE_LOW_COMPLETENESS", agg.low_completeness);
    agg.min_core_quality = static_cast<std::size_t>(
        std::max(0, get_env_int("ICSCORE_MIN_CORE_QUALITY", static_cast<int>(agg.min_core_quality))));
    agg.min_core_valuation = static_cast<std::size_t>(
        std::max(0, get_env_int("ICSCORE_MIN_CORE_VALUATION", static_cast<int>(agg.min_core_valuation))));

    cfg.log_level = get_env("ICSCORE_LOG_LEVEL", cfg.log_level);

    return cfg;
}

void EngineConfig::validate() const {
    if (!(stabilizer.alpha > 0.0 && stabilizer.alpha <= 1.0)) {
        throw std::runtime_error(fmt::format("smoothing alpha must be in (0, 1], got {}",
                                             stabilizer.alpha));
    }
    if (stabilizer.min_change < 0.0) {
        throw std::runtime_error(fmt::format("minimum score change must be >= 0, got {}",
                                             stabilizer.min_change));
    }

    const auto& agg = aggregator;
    if (!(0.0 <= agg.low_completeness &&
          agg.low_completeness <= agg.medium_completeness &&
          agg.medium_completeness <= agg.high_completeness &&
          agg.high_completeness <= 100.0)) {
        throw std::runtime_error(fmt::format(
            "confidence bands must satisfy 0 <= low <= medium <= high <= 100, got {}/{}/{}",
            agg.low_completeness, agg.medium_completeness, agg.high_completeness));
    }
    if (agg.min_core_quality > agg.core_quality.size()) {
        throw std::runtime_error(fmt::format("core quality floor {} exceeds the {} core factors",
                                             agg.min_core_quality, agg.core_quality.size()));
    }
    if (agg.min_core_valuation > agg.core_valuation.size()) {
        throw std::runtime_error(fmt::format("core valuation floor {} exceeds the {} core factors",
                                             agg.min_core_valuation, agg.core_valuation.size()));
    }
    if (min_sector_sample == 0) {
        throw std::runtime_error("minimum sector sample must be at least 1");
    }

    static constexpr std::array<const char*, 7> LEVELS{
        "trace", "debug", "info", "warn", "error", "critical", "off"};
    if (std::none_of(LEVELS.begin(), LEVELS.end(),
                     [this](const char* l) { return log_level == l; })) {
        throw std::runtime_error(fmt::format("unknown log level '{}'", log_level));
    }
}

}  // namespace icscore::core
