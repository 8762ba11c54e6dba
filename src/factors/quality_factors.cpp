/// @file src/factors/quality_factors.cpp
/// @brief Growth, Profitability, Financial Health and Dividend Quality.

#include "icscore/factors.hpp"

#include <algorithm>

namespace icscore::factors {

// ─── GrowthFactor ─────────────────────────────────────────────────────────────

FactorResult GrowthFactor::calculate(const MetricsSnapshot& snap,
                                     const stats::SectorContext& ctx) const {
    FactorBuilder b(*this, snap, ctx);
    b.percentile("revenue_growth_yoy", 0.40);

    // Loss → profit makes the YoY ratio meaningless; rank it at the top.
    const auto eps       = snap.get("eps_ttm");
    const auto eps_prior = snap.get("eps_ttm_prior");
    if (eps && eps_prior && *eps_prior < 0.0 && *eps > 0.0) {
        b.scored("eps_growth_yoy", snap.get("eps_growth_yoy").value_or(*eps),
                 constants::SCORE_MAX, 0.40);
        b.note("eps_ttm", eps);
        b.note("eps_ttm_prior", eps_prior);
    } else {
        b.percentile("eps_growth_yoy", 0.40);
    }

    b.percentile("fcf_growth_yoy", 0.20);
    return b.finish();
}

// ─── ProfitabilityFactor ──────────────────────────────────────────────────────

FactorResult ProfitabilityFactor::calculate(const MetricsSnapshot& snap,
                                            const stats::SectorContext& ctx) const {
    FactorBuilder b(*this, snap, ctx);
    b.percentile("net_margin",       0.25)
     .percentile("roe",              0.25)
     .percentile("roa",              0.20)
     .percentile("gross_margin",     0.15)
     .percentile("operating_margin", 0.15);
    return b.finish();
}

// ─── FinancialHealthFactor ────────────────────────────────────────────────────

FactorResult FinancialHealthFactor::calculate(const MetricsSnapshot& snap,
                                              const stats::SectorContext& ctx) const {
    FactorBuilder b(*this, snap, ctx);
    b.percentile("debt_to_equity", 0.35, Direction::LowerIsBetter);

    // Too little liquidity and idle cash are both penalised.
    const auto cr = snap.get("current_ratio");
    std::optional<double> cr_score;
    if (cr) {
        cr_score = triangular_score(*cr, 0.5, 2.0, 4.0);
    }
    b.scored("current_ratio", cr, cr_score, 0.25);

    b.percentile("interest_coverage", 0.25)
     .percentile("quick_ratio",       0.15);
    return b.finish();
}

// ─── DividendQualityFactor ────────────────────────────────────────────────────

double DividendQualityFactor::streak_score(double years) noexcept {
    if (years >= 50.0) return 100.0;
    if (years >= 25.0) return 90.0 + (years - 25.0) / 25.0 * 10.0;
    if (years >= 10.0) return 70.0 + (years - 10.0) / 15.0 * 20.0;
    if (years >= 5.0)  return 50.0 + (years - 5.0) / 5.0 * 20.0;
    return std::max(0.0, years * 10.0);
}

FactorResult DividendQualityFactor::calculate(const MetricsSnapshot& snap,
                                              const stats::SectorContext& ctx) const {
    FactorBuilder b(*this, snap, ctx);

    const auto yield = snap.get("dividend_yield");
    if (!yield || *yield < MIN_YIELD_PCT) {
        // Non-payers and token payers are not judged on dividends.
        b.note("dividend_yield", yield);
        FactorResult out = b.finish();
        out.score.reset();
        out.data_available = false;
        return out;
    }

    b.percentile("dividend_yield", 0.25);

    const auto payout = snap.get("payout_ratio");
    std::optional<double> payout_score;
    if (payout) {
        payout_score = triangular_score(*payout, 0.0, 45.0, 100.0);
    }
    b.scored("payout_ratio", payout, payout_score, 0.25);

    const auto growth = snap.get("dividend_growth_5y");
    std::optional<double> growth_score;
    if (growth) {
        growth_score = 50.0 + *growth / 10.0 * 50.0;
    }
    b.scored("dividend_growth_5y", growth, growth_score, 0.25);

    const auto streak = snap.get("dividend_streak_years");
    std::optional<double> streak_pts;
    if (streak) {
        streak_pts = streak_score(*streak);
    }
    b.scored("dividend_streak_years", streak, streak_pts, 0.25);

    return b.finish();
}

}  // namespace icscore::factors
