/// @file src/factors/factor_math.cpp
/// @brief Sub-metric scoring helpers and FactorBuilder.

#include "icscore/factors.hpp"

#include <algorithm>
#include <cmath>

namespace icscore::factors {

// ─── Scoring helpers ──────────────────────────────────────────────────────────

std::optional<double>
weighted_blend(std::span<const Component> components) noexcept {
    double weighted_sum = 0.0;
    double weight_total = 0.0;
    for (const auto& c : components) {
        if (!c.score.has_value() || !std::isfinite(*c.score) || c.weight <= 0.0) {
            continue;
        }
        weighted_sum += *c.score * c.weight;
        weight_total += c.weight;
    }
    if (weight_total <= 0.0) {
        return std::nullopt;
    }
    return weighted_sum / weight_total;
}

double clamp_score(double value) noexcept {
    return std::clamp(value, constants::SCORE_MIN, constants::SCORE_MAX);
}

double linear_score(double value, double at_zero, double at_hundred) noexcept {
    const double span = at_hundred - at_zero;
    if (span == 0.0) {
        return value >= at_hundred ? constants::SCORE_MAX : constants::SCORE_MIN;
    }
    return clamp_score((value - at_zero) / span * 100.0);
}

double triangular_score(double value, double low, double peak, double high) noexcept {
    if (value <= low || value >= high) {
        return constants::SCORE_MIN;
    }
    if (value <= peak) {
        return (value - low) / (peak - low) * 100.0;
    }
    return (high - value) / (high - peak) * 100.0;
}

// ─── FactorBuilder ────────────────────────────────────────────────────────────

FactorBuilder::FactorBuilder(const FactorCalculator& calculator,
                             const MetricsSnapshot& snapshot,
                             const stats::SectorContext& context)
    : snapshot_(snapshot)
    , context_(context) {
    result_.name     = calculator.name();
    result_.category = calculator.category();
    result_.weight   = calculator.base_weight();
}

FactorBuilder& FactorBuilder::percentile(const std::string& metric, double weight,
                                         Direction direction) {
    return percentile_of(metric, snapshot_.get(metric), weight, direction);
}

FactorBuilder& FactorBuilder::percentile_of(const std::string& metric,
                                            std::optional<double> raw,
                                            double weight,
                                            Direction direction) {
    if (!raw.has_value() || !std::isfinite(*raw)) {
        return *this;
    }
    result_.data_available = true;

    SupportingMetric& sm = record_input(metric, *raw);

    const auto* dist = context_.find(snapshot_.sector, metric);
    if (dist == nullptr) {
        // No peers to rank against: the raw value is kept but does not score.
        return *this;
    }

    const auto pct = stats::SectorStatisticsEngine::percentile_of(*dist, *raw);
    if (!pct.has_value()) {
        return *this;
    }
    sm.percentile = *pct;
    if (dist->degraded) {
        result_.reduced_reliability = true;
    }

    const double score = direction == Direction::LowerIsBetter
                             ? constants::SCORE_MAX - *pct
                             : *pct;
    components_.push_back(Component{score, weight});
    return *this;
}

FactorBuilder& FactorBuilder::scored(const std::string& name,
                                     std::optional<double> raw,
                                     std::optional<double> score,
                                     double weight) {
    if (!raw.has_value() || !std::isfinite(*raw)) {
        return *this;
    }
    result_.data_available = true;
    record_input(name, *raw);
    if (score.has_value() && std::isfinite(*score)) {
        components_.push_back(Component{clamp_score(*score), weight});
    }
    return *this;
}

FactorBuilder& FactorBuilder::note(const std::string& name, std::optional<double> raw) {
    if (raw.has_value() && std::isfinite(*raw)) {
        record_input(name, *raw);
    }
    return *this;
}

SupportingMetric& FactorBuilder::record_input(const std::string& name, double raw) {
    SupportingMetric& sm = result_.supporting[name];
    sm.raw_value = raw;
    const auto seen = snapshot_.observed.find(name);
    if (seen != snapshot_.observed.end()
        && (!result_.data_as_of || *result_.data_as_of < seen->second)) {
        result_.data_as_of = seen->second;
    }
    return sm;
}

FactorResult FactorBuilder::finish() const {
    FactorResult out = result_;
    out.score = weighted_blend(components_);
    if (out.score.has_value()) {
        out.score = clamp_score(*out.score);
    }
    return out;
}

}  // namespace icscore::factors
