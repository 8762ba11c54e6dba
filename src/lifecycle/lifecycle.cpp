/// @file src/lifecycle/lifecycle.cpp
/// @brief LifecycleClassifier decision rules, the per-stage multiplier table,
///        and WeightAdjuster renormalisation.

#include "icscore/lifecycle.hpp"

#include <algorithm>
#include <cmath>

namespace icscore::lifecycle {

namespace {

/// Per-stage factor multipliers.  Anything not listed is 1.0.
const std::map<LifecycleStage, WeightSet>& multiplier_table() {
    static const std::map<LifecycleStage, WeightSet> table{
        {LifecycleStage::Hypergrowth, {
            {"growth",             1.5},
            {"momentum",           1.3},
            {"earnings_revisions", 1.3},
            {"profitability",      0.5},
            {"value",              0.4},
            {"intrinsic_value",    0.4},
            {"historical_value",   0.4},
            {"financial_health",   0.8},
        }},
        {LifecycleStage::Growth, {
            {"growth",             1.3},
            {"momentum",           1.2},
            {"earnings_revisions", 1.2},
            {"profitability",      0.8},
            {"value",              0.7},
            {"intrinsic_value",    0.8},
            {"historical_value",   0.8},
        }},
        {LifecycleStage::Mature, {
            {"profitability",      1.2},
            {"financial_health",   1.2},
            {"value",              1.1},
            {"intrinsic_value",    1.1},
            {"historical_value",   1.2},
            {"dividend_quality",   1.2},
            {"growth",             0.7},
            {"momentum",           0.9},
        }},
        {LifecycleStage::Value, {
            {"value",              1.4},
            {"intrinsic_value",    1.3},
            {"historical_value",   1.3},
            {"profitability",      1.2},
            {"financial_health",   1.1},
            {"dividend_quality",   1.3},
            {"growth",             0.5},
            {"momentum",           0.8},
        }},
        {LifecycleStage::Turnaround, {
            {"financial_health",   1.4},
            {"momentum",           1.3},
            {"smart_money",        1.3},
            {"value",              1.2},
            {"growth",             0.6},
            {"profitability",      0.7},
        }},
    };
    return table;
}

double value_or(const std::optional<double>& v, double fallback) noexcept {
    return (v.has_value() && std::isfinite(*v)) ? *v : fallback;
}

}  // namespace

// ─── Stage names ──────────────────────────────────────────────────────────────

const char* to_string(LifecycleStage s) noexcept {
    switch (s) {
        case LifecycleStage::Hypergrowth: return "hypergrowth";
        case LifecycleStage::Growth:      return "growth";
        case LifecycleStage::Mature:      return "mature";
        case LifecycleStage::Value:       return "value";
        case LifecycleStage::Turnaround:  return "turnaround";
    }
    return "unknown";
}

const char* describe(LifecycleStage s) noexcept {
    switch (s) {
        case LifecycleStage::Hypergrowth:
            return "Revenue growth above 50%; growth trajectory outweighs current profitability.";
        case LifecycleStage::Growth:
            return "Revenue growth of 20-50%; expansion balanced with emerging profitability.";
        case LifecycleStage::Mature:
            return "Stable operations; profitability, cash flow and capital efficiency dominate.";
        case LifecycleStage::Value:
            return "Low valuation with solid margins; intrinsic value and dividends dominate.";
        case LifecycleStage::Turnaround:
            return "Shrinking revenue; financial health and recovery signals dominate.";
    }
    return "Unknown lifecycle stage.";
}

// ─── LifecycleClassifier::classify ────────────────────────────────────────────

Classification LifecycleClassifier::classify(const Fundamentals& f) noexcept {
    const double growth = value_or(f.revenue_growth_yoy, 0.0);
    const double margin = value_or(f.net_margin, 0.0);
    const double pe     = value_or(f.pe_ratio, constants::DEFAULT_PE_RATIO);

    if (growth > constants::HYPERGROWTH_REVENUE_GROWTH) {
        return {LifecycleStage::Hypergrowth,
                std::min(1.0, (growth - 50.0) / 50.0 + 0.7)};
    }

    if (growth > constants::GROWTH_REVENUE_GROWTH) {
        return {LifecycleStage::Growth, std::min(1.0, 0.6 + (growth - 20.0) / 60.0)};
    }

    if (growth < constants::TURNAROUND_REVENUE_GROWTH) {
        return {LifecycleStage::Turnaround,
                std::min(1.0, std::abs(growth) / 20.0 + 0.5)};
    }

    if (pe < constants::VALUE_PE_THRESHOLD && margin > constants::VALUE_MARGIN_THRESHOLD) {
        // Cheaper and more profitable → more confident.
        const double pe_score     = (constants::VALUE_PE_THRESHOLD - pe) / constants::VALUE_PE_THRESHOLD;
        const double margin_score = std::min(margin / 20.0, 0.5);
        return {LifecycleStage::Value,
                std::clamp(0.5 + pe_score * 0.3 + margin_score, 0.0, 1.0)};
    }

    const bool typical = growth > 0.0 && growth < 15.0 && margin > 0.0;
    return {LifecycleStage::Mature, typical ? 0.8 : 0.6};
}

// ─── LifecycleClassifier::weight_multipliers ──────────────────────────────────

const WeightSet& LifecycleClassifier::weight_multipliers(LifecycleStage stage) {
    static const WeightSet empty{};
    const auto& table = multiplier_table();
    const auto it = table.find(stage);
    return it == table.end() ? empty : it->second;
}

double LifecycleClassifier::multiplier(LifecycleStage stage,
                                       const std::string& factor) {
    const auto& row = weight_multipliers(stage);
    const auto it = row.find(factor);
    return it == row.end() ? 1.0 : it->second;
}

// ─── WeightAdjuster ───────────────────────────────────────────────────────────

WeightSet WeightAdjuster::normalize(WeightSet weights) {
    double total = 0.0;
    for (const auto& [name, w] : weights) {
        total += w;
    }
    if (total <= 0.0) {
        return weights;
    }
    for (auto& [name, w] : weights) {
        w /= total;
    }
    return weights;
}

WeightSet WeightAdjuster::adjust(const WeightSet& base_weights,
                                 LifecycleStage stage) {
    WeightSet adjusted;
    for (const auto& [factor, base] : base_weights) {
        const double w = (std::isfinite(base) && base > 0.0) ? base : 0.0;
        adjusted[factor] = w * LifecycleClassifier::multiplier(stage, factor);
    }
    return normalize(std::move(adjusted));
}

}  // namespace icscore::lifecycle
