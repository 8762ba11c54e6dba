/// @file src/scoring/aggregator.cpp
/// @brief ScoreAggregator: weighted overall / category scores and confidence.

#include "icscore/aggregator.hpp"

#include <algorithm>
#include <cmath>

namespace icscore::scoring {

namespace {

bool contains(const std::vector<std::string>& names, const std::string& name) noexcept {
    return std::find(names.begin(), names.end(), name) != names.end();
}

/// Running Σ w·s and Σ w.
struct WeightedSum {
    double num = 0.0;
    double den = 0.0;

    void add(double score, double weight) noexcept {
        num += score * weight;
        den += weight;
    }

    [[nodiscard]] std::optional<double> value() const noexcept {
        if (den <= 0.0) {
            return std::nullopt;
        }
        return num / den;
    }
};

}  // namespace

const char* to_string(ConfidenceLevel c) noexcept {
    switch (c) {
        case ConfidenceLevel::High:         return "High";
        case ConfidenceLevel::Medium:       return "Medium";
        case ConfidenceLevel::Low:          return "Low";
        case ConfidenceLevel::Insufficient: return "Insufficient";
    }
    return "Unknown";
}

ScoreAggregator::ScoreAggregator(AggregatorConfig config)
    : config_(std::move(config)) {}

bool ScoreAggregator::is_optional(const std::string& factor) const noexcept {
    return contains(config_.optional_factors, factor);
}

ConfidenceLevel ScoreAggregator::band(double completeness_pct) const noexcept {
    if (completeness_pct >= config_.high_completeness)   return ConfidenceLevel::High;
    if (completeness_pct >= config_.medium_completeness) return ConfidenceLevel::Medium;
    if (completeness_pct >= config_.low_completeness)    return ConfidenceLevel::Low;
    return ConfidenceLevel::Insufficient;
}

AggregateResult
ScoreAggregator::aggregate(std::span<const factors::FactorResult> results,
                           const lifecycle::WeightSet& weights) const {
    AggregateResult out;

    WeightedSum overall;
    std::map<Category, WeightedSum> by_category;

    for (const auto& r : results) {
        const bool computable = r.score.has_value() && std::isfinite(*r.score);

        if (computable || !is_optional(r.name)) {
            ++out.expected_factors;
        }
        if (!computable) {
            continue;
        }
        ++out.available_factors;

        if (contains(config_.core_quality, r.name))   ++out.core_quality_available;
        if (contains(config_.core_valuation, r.name)) ++out.core_valuation_available;

        const auto wit = weights.find(r.name);
        const double w = wit != weights.end() ? wit->second : r.weight;
        if (!(w > 0.0)) {
            continue;
        }
        overall.add(*r.score, w);
        by_category[r.category].add(*r.score, w);
    }

    for (Category c : ALL_CATEGORIES) {
        const auto it = by_category.find(c);
        out.category_scores[c] = it == by_category.end() ? std::nullopt : it->second.value();
    }

    out.completeness_pct = out.expected_factors == 0
        ? 0.0
        : static_cast<double>(out.available_factors)
              / static_cast<double>(out.expected_factors) * 100.0;

    out.confidence = band(out.completeness_pct);
    if (out.core_quality_available < config_.min_core_quality ||
        out.core_valuation_available < config_.min_core_valuation) {
        out.confidence = ConfidenceLevel::Insufficient;
    }

    if (out.confidence != ConfidenceLevel::Insufficient) {
        out.overall = overall.value();
        if (!out.overall) {
            out.confidence = ConfidenceLevel::Insufficient;
        }
    }

    return out;
}

}  // namespace icscore::scoring
