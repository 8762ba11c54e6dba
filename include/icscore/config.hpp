#pragma once

/// @file include/icscore/config.hpp
/// @brief EngineConfig: scoring-engine settings with environment overrides.
///
/// ## Environment variables (all optional)
///   ICSCORE_THREADS               worker threads, 0 = hardware concurrency
///   ICSCORE_MIN_SECTOR_SAMPLE     degraded-distribution threshold
///   ICSCORE_SMOOTHING_ALPHA       stabilizer α
///   ICSCORE_MIN_SCORE_CHANGE      stabilizer dead band
///   ICSCORE_HIGH_COMPLETENESS     confidence band floors, percent
///   ICSCORE_MEDIUM_COMPLETENESS
///   ICSCORE_LOW_COMPLETENESS
///   ICSCORE_MIN_CORE_QUALITY      hard floor, core quality factors
///   ICSCORE_MIN_CORE_VALUATION    hard floor, core valuation factors
///   ICSCORE_LOG_LEVEL             trace | debug | info | warn | error | off
///
/// An unparsable value logs a warning and keeps the default.

#include "icscore/aggregator.hpp"
#include "icscore/constants.hpp"
#include "icscore/stabilizer.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace icscore::core {

struct EngineConfig {
    /// Worker threads for universe runs; 0 = hardware concurrency.
    std::size_t threads = 0;

    /// Sector distributions with fewer samples are flagged degraded.
    std::size_t min_sector_sample = constants::MIN_SECTOR_SAMPLE;

    scoring::AggregatorConfig aggregator{};
    scoring::StabilizerConfig stabilizer{};

    /// Factors recomputed by a price-sensitive refresh.
    std::vector<std::string> price_sensitive_factors{"momentum", "technical"};

    std::string log_level = "info";

    /// Defaults overridden by `ICSCORE_*` environment variables.
    [[nodiscard]] static EngineConfig from_env();

    /// Throws std::runtime_error describing the first invalid setting.
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int         get_env_int(const char* name, int default_val);
    static double      get_env_double(const char* name, double default_val);
};

}  // namespace icscore::core
