#pragma once

/// @file include/icscore/aggregator.hpp
/// @brief Score Aggregator: overall and category scores, data completeness
///        and confidence.
///
/// # Module: Aggregator
///
/// ## Formulas
///   overall        = Σ wᵢ sᵢ / Σ wᵢ                 over computable factors
///   category_c     = Σ wᵢ sᵢ / Σ wᵢ                 over computable factors in c
///   completeness % = available / expected × 100
///
/// `expected` counts every factor except an optional factor that is
/// NotComputable (a non-dividend payer is not penalised for having no
/// dividend score).
///
/// ## Confidence
///   completeness ≥ 90 → High, ≥ 70 → Medium, ≥ 50 → Low, else Insufficient
///
/// Hard floor, applied after the completeness bands: fewer than
/// `min_core_quality` available core quality factors, or fewer than
/// `min_core_valuation` available core valuation factors, forces
/// Insufficient.  An Insufficient result carries no overall score.

#include "icscore/constants.hpp"
#include "icscore/factors.hpp"
#include "icscore/lifecycle.hpp"
#include "icscore/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace icscore::scoring {

// ─── ConfidenceLevel ──────────────────────────────────────────────────────────

enum class ConfidenceLevel {
    High,
    Medium,
    Low,
    Insufficient,
};

/// "High", "Medium", "Low" or "Insufficient".
[[nodiscard]] const char* to_string(ConfidenceLevel c) noexcept;

// ─── AggregatorConfig ─────────────────────────────────────────────────────────

struct AggregatorConfig {
    double high_completeness   = constants::HIGH_CONFIDENCE_COMPLETENESS;
    double medium_completeness = constants::MEDIUM_CONFIDENCE_COMPLETENESS;
    double low_completeness    = constants::LOW_CONFIDENCE_COMPLETENESS;

    std::size_t min_core_quality   = constants::MIN_CORE_QUALITY_FACTORS;
    std::size_t min_core_valuation = constants::MIN_CORE_VALUATION_FACTORS;

    std::vector<std::string> core_quality{
        "growth", "profitability", "financial_health", "dividend_quality"};
    std::vector<std::string> core_valuation{"value", "intrinsic_value"};

    /// Factors whose NotComputable result does not reduce completeness.
    std::vector<std::string> optional_factors{"dividend_quality"};
};

// ─── AggregateResult ──────────────────────────────────────────────────────────

struct AggregateResult {
    /// Empty when confidence is Insufficient or nothing is computable.
    std::optional<double> overall;

    /// Per-category weighted score; empty for a category with no computable
    /// factor.
    std::map<Category, std::optional<double>> category_scores;

    double          completeness_pct = 0.0;
    ConfidenceLevel confidence       = ConfidenceLevel::Insufficient;

    std::size_t available_factors        = 0;
    std::size_t expected_factors         = 0;
    std::size_t core_quality_available   = 0;
    std::size_t core_valuation_available = 0;
};

// ─── ScoreAggregator ──────────────────────────────────────────────────────────

class ScoreAggregator {
public:
    explicit ScoreAggregator(AggregatorConfig config = AggregatorConfig{});

    /// Combine factor results under `weights` (factor name → weight).
    /// A factor absent from `weights` falls back to its nominal weight.
    [[nodiscard]] AggregateResult
    aggregate(std::span<const factors::FactorResult> results,
              const lifecycle::WeightSet& weights) const;

    /// Completeness band → confidence, before the hard floor.
    [[nodiscard]] ConfidenceLevel band(double completeness_pct) const noexcept;

    [[nodiscard]] const AggregatorConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] bool is_optional(const std::string& factor) const noexcept;

    AggregatorConfig config_;
};

}  // namespace icscore::scoring
