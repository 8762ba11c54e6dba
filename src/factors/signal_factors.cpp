/// @file src/factors/signal_factors.cpp
/// @brief Momentum, Smart Money, Earnings Revisions, Technical and Sentiment.

#include "icscore/factors.hpp"

#include <cmath>

namespace icscore::factors {

// ─── MomentumFactor ───────────────────────────────────────────────────────────

FactorResult MomentumFactor::calculate(const MetricsSnapshot& snap,
                                       const stats::SectorContext& ctx) const {
    FactorBuilder b(*this, snap, ctx);
    b.percentile("return_1m",  0.15)
     .percentile("return_3m",  0.25)
     .percentile("return_6m",  0.30)
     .percentile("return_12m", 0.30);
    return b.finish();
}

// ─── SmartMoneyFactor ─────────────────────────────────────────────────────────

namespace {

/// Net insider shares per score point: ±100k shares saturates the scale.
constexpr double INSIDER_SHARES_PER_POINT = 2000.0;

/// Institutional holdings change, percentage points per score point.
constexpr double INSTITUTIONAL_POINTS_PER_PCT = 5.0;

}  // namespace

FactorResult SmartMoneyFactor::calculate(const MetricsSnapshot& snap,
                                         const stats::SectorContext& ctx) const {
    FactorBuilder b(*this, snap, ctx);

    // Buy = 100, Hold = 50, Sell = 0.
    const double buy  = snap.get("analyst_buy").value_or(0.0);
    const double hold = snap.get("analyst_hold").value_or(0.0);
    const double sell = snap.get("analyst_sell").value_or(0.0);
    const double analysts = buy + hold + sell;
    if (analysts > 0.0) {
        const double consensus = (buy * 100.0 + hold * 50.0) / analysts;
        b.scored("analyst_consensus", consensus, consensus, 0.40);
        b.note("analyst_count", analysts);
    }

    const auto insider = snap.get("insider_net_shares_90d");
    std::optional<double> insider_score;
    if (insider) {
        insider_score = clamp_score(constants::SCORE_NEUTRAL + *insider / INSIDER_SHARES_PER_POINT);
    }
    b.scored("insider_net_shares_90d", insider, insider_score, 0.30);

    const auto shares = snap.get("institutional_shares");
    const auto prior  = snap.get("institutional_shares_prior");
    if (shares && prior && *prior > 0.0) {
        const double change_pct = (*shares - *prior) / *prior * 100.0;
        b.scored("institutional_change_pct", change_pct,
                 constants::SCORE_NEUTRAL + change_pct * INSTITUTIONAL_POINTS_PER_PCT, 0.30);
    }

    return b.finish();
}

// ─── EarningsRevisionsFactor ──────────────────────────────────────────────────

namespace {

/// Consensus change (fraction) that saturates the magnitude score.
constexpr double MAGNITUDE_MAX_CHANGE = 0.15;

/// 30d − 90d revision gap (fraction) that saturates the recency score.
constexpr double RECENCY_MAX_ACCELERATION = 0.10;

}  // namespace

FactorResult EarningsRevisionsFactor::calculate(const MetricsSnapshot& snap,
                                                const stats::SectorContext& ctx) const {
    FactorBuilder b(*this, snap, ctx);

    // Magnitude: change in consensus EPS, longest look-back available.
    const auto current = snap.get("eps_estimate_current");
    auto prior = snap.get("eps_estimate_90d");
    if (!prior || *prior == 0.0) prior = snap.get("eps_estimate_60d");
    if (!prior || *prior == 0.0) prior = snap.get("eps_estimate_30d");
    if (current && prior && *prior != 0.0) {
        const double change = (*current - *prior) / std::abs(*prior);
        b.scored("estimate_change", change,
                 50.0 + change / MAGNITUDE_MAX_CHANGE * 50.0, 0.50);
        b.note("eps_estimate_current", current);
    }

    // Breadth: share of revisions that were upgrades.
    const auto up   = snap.get("estimate_upgrades_90d");
    const auto down = snap.get("estimate_downgrades_90d");
    if (up || down) {
        const double u = up.value_or(0.0);
        const double d = down.value_or(0.0);
        const double total = u + d;
        std::optional<double> breadth;
        if (total > 0.0) {
            breadth = 50.0 + 50.0 * (u - d) / total;
        }
        b.scored("revision_breadth", total, breadth, 0.30);
    }

    // Recency: recent revisions running ahead of the quarter → acceleration.
    const auto rev30 = snap.get("revision_pct_30d");
    const auto rev90 = snap.get("revision_pct_90d");
    if (rev30 || rev90) {
        const double accel = rev30.value_or(0.0) - rev90.value_or(0.0);
        b.scored("revision_acceleration", accel,
                 50.0 + accel / RECENCY_MAX_ACCELERATION * 50.0, 0.20);
    }

    return b.finish();
}

// ─── TechnicalFactor ──────────────────────────────────────────────────────────

FactorResult TechnicalFactor::calculate(const MetricsSnapshot& snap,
                                        const stats::SectorContext& ctx) const {
    FactorBuilder b(*this, snap, ctx);

    const auto rsi = snap.get("rsi_14");
    std::optional<double> rsi_score;
    if (rsi) {
        rsi_score = linear_score(*rsi, 30.0, 70.0);
    }
    b.scored("rsi_14", rsi, rsi_score, 0.25);

    b.percentile("macd_histogram", 0.25);

    // Price relative to a moving average: −10 % → 0, +10 % → 100.
    const auto price = snap.get("current_price");
    const auto versus = [&](const char* sma_name, const char* label) {
        const auto sma = snap.get(sma_name);
        if (!price || !sma || *sma <= 0.0) {
            return;
        }
        const double gap_pct = (*price / *sma - 1.0) * 100.0;
        b.scored(label, gap_pct, linear_score(gap_pct, -10.0, 10.0), 0.25);
    };
    versus("sma_50",  "price_vs_sma50");
    versus("sma_200", "price_vs_sma200");

    return b.finish();
}

// ─── SentimentFactor ──────────────────────────────────────────────────────────

FactorResult SentimentFactor::calculate(const MetricsSnapshot& snap,
                                        const stats::SectorContext& ctx) const {
    FactorBuilder b(*this, snap, ctx);

    const auto articles = snap.get("article_count");
    if (!articles || *articles <= 0.0) {
        return b.finish();
    }
    b.note("article_count", articles);

    const auto sentiment = snap.get("news_sentiment");
    b.scored("news_sentiment", sentiment, sentiment, 0.70);

    const auto positive = snap.get("positive_articles");
    if (positive) {
        const double ratio = *positive / *articles * 100.0;
        b.scored("positive_ratio", ratio, ratio, 0.30);
    }

    return b.finish();
}

}  // namespace icscore::factors
