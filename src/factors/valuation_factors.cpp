/// @file src/factors/valuation_factors.cpp
/// @brief Value, Intrinsic Value and Historical Value.

#include "icscore/factors.hpp"

#include <cmath>

namespace icscore::factors {

namespace {

/// Valuation multiples are only meaningful when positive (a negative P/E is
/// a loss, not a bargain).
std::optional<double> positive(std::optional<double> v) noexcept {
    if (v.has_value() && *v > 0.0) {
        return v;
    }
    return std::nullopt;
}

}  // namespace

// ─── ValueFactor ──────────────────────────────────────────────────────────────

FactorResult ValueFactor::calculate(const MetricsSnapshot& snap,
                                    const stats::SectorContext& ctx) const {
    FactorBuilder b(*this, snap, ctx);
    const auto lower = Direction::LowerIsBetter;
    b.percentile_of("pe_ratio",  positive(snap.get("pe_ratio")),  0.30, lower)
     .percentile_of("ps_ratio",  positive(snap.get("ps_ratio")),  0.20, lower)
     .percentile_of("pb_ratio",  positive(snap.get("pb_ratio")),  0.15, lower)
     .percentile_of("ev_ebitda", positive(snap.get("ev_ebitda")), 0.20, lower)
     .percentile_of("peg_ratio", positive(snap.get("peg_ratio")), 0.15, lower);
    return b.finish();
}

// ─── IntrinsicValueFactor ─────────────────────────────────────────────────────

FactorResult IntrinsicValueFactor::calculate(const MetricsSnapshot& snap,
                                             const stats::SectorContext& ctx) const {
    FactorBuilder b(*this, snap, ctx);

    const auto fair  = positive(snap.get("fair_value"));
    const auto price = positive(snap.get("current_price"));
    if (fair && price) {
        // −50 % downside → 0, +50 % upside → 100.
        const double upside_pct = (*fair / *price - 1.0) * 100.0;
        b.scored("fair_value_upside", upside_pct,
                 linear_score(upside_pct, -50.0, 50.0), 0.60);
        b.note("fair_value", fair);
        b.note("current_price", price);
    }

    b.percentile("fcf_yield", 0.40);
    return b.finish();
}

// ─── HistoricalValueFactor ────────────────────────────────────────────────────

std::optional<double>
HistoricalValueFactor::own_percentile(std::span<const double> history,
                                      double current) noexcept {
    std::size_t valid = 0;
    std::size_t below = 0;
    for (double v : history) {
        // Loss-making months have no meaningful multiple.
        if (!std::isfinite(v) || v <= 0.0) {
            continue;
        }
        ++valid;
        if (v < current) {
            ++below;
        }
    }
    if (valid < MIN_HISTORY_POINTS) {
        return std::nullopt;
    }
    return static_cast<double>(below) / static_cast<double>(valid) * 100.0;
}

FactorResult HistoricalValueFactor::calculate(const MetricsSnapshot& snap,
                                              const stats::SectorContext& ctx) const {
    FactorBuilder b(*this, snap, ctx);

    // Unprofitable or thin-margin companies are judged mostly on sales.
    const auto margin = snap.get("net_margin");
    const bool thin_margin = margin.has_value() && *margin < constants::VALUE_MARGIN_THRESHOLD;
    const double pe_weight = thin_margin ? 0.3 : 0.7;
    const double ps_weight = thin_margin ? 0.7 : 0.3;

    const auto score_against_history = [&](const std::string& metric, double weight) {
        const auto current = positive(snap.get(metric));
        if (!current) {
            return;
        }
        const auto it = snap.history.find(metric);
        std::optional<double> score;
        if (it != snap.history.end()) {
            const auto pct = own_percentile(it->second, *current);
            if (pct) {
                // Cheap relative to its own past scores high.
                score = constants::SCORE_MAX - *pct;
            }
        }
        b.scored(metric, current, score, weight);
    };

    score_against_history("pe_ratio", pe_weight);
    score_against_history("ps_ratio", ps_weight);
    b.note("net_margin", margin);
    return b.finish();
}

}  // namespace icscore::factors
