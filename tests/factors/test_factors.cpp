#include <gtest/gtest.h>
#include "icscore/factors.hpp"
#include "icscore/sector_stats.hpp"

#include <cmath>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace icscore;
using namespace icscore::factors;
using icscore::stats::SectorContext;
using icscore::stats::SectorMetricDistribution;
using icscore::stats::SectorStatisticsEngine;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

const Date AS_OF = make_date(2024, 6, 28);
const std::string SECTOR = "Industrials";

/// Distribution 0..100 with breakpoints at their own percentile, so that
/// percentile_of(v) == v for v in [0, 100].
SectorMetricDistribution identity_dist(const std::string& metric, bool degraded = false) {
    SectorMetricDistribution d;
    d.sector = SECTOR;
    d.metric = metric;
    d.as_of  = AS_OF;
    d.min_value = 0.0;
    d.p10 = 10.0;
    d.p25 = 25.0;
    d.p50 = 50.0;
    d.p75 = 75.0;
    d.p90 = 90.0;
    d.max_value = 100.0;
    d.sample_count = 20;
    d.degraded = degraded;
    return d;
}

SectorContext context_for(const std::vector<std::string>& metrics,
                          const std::vector<std::string>& degraded = {}) {
    std::map<SectorContext::Key, SectorMetricDistribution> m;
    for (const auto& name : metrics) {
        m.emplace(SectorContext::Key{SECTOR, name}, identity_dist(name));
    }
    for (const auto& name : degraded) {
        m.emplace(SectorContext::Key{SECTOR, name}, identity_dist(name, true));
    }
    return SectorContext(AS_OF, std::move(m));
}

MetricsSnapshot snapshot(std::map<std::string, double> metrics) {
    MetricsSnapshot s;
    s.ticker  = "ACME";
    s.sector  = SECTOR;
    s.as_of   = AS_OF;
    s.metrics = std::move(metrics);
    return s;
}

}  // namespace

// ─── Scoring helpers ─────────────────────────────────────────────────────────

TEST(FactorMath_WeightedBlend, RenormalisesOverAvailableComponents) {
    const std::vector<Component> c{{80.0, 0.5}, {std::nullopt, 0.3}, {40.0, 0.2}};
    const auto s = weighted_blend(c);
    ASSERT_TRUE(s.has_value());
    EXPECT_NEAR(*s, (80.0 * 0.5 + 40.0 * 0.2) / 0.7, 1e-12);
}

TEST(FactorMath_WeightedBlend, NothingAvailableIsNullopt) {
    const std::vector<Component> c{{std::nullopt, 0.5}, {std::nullopt, 0.5}};
    EXPECT_FALSE(weighted_blend(c).has_value());
    EXPECT_FALSE(weighted_blend({}).has_value());
}

TEST(FactorMath_LinearScore, MapsAndClamps) {
    EXPECT_DOUBLE_EQ(linear_score(50.0, 30.0, 70.0), 50.0);
    EXPECT_DOUBLE_EQ(linear_score(10.0, 30.0, 70.0), 0.0);
    EXPECT_DOUBLE_EQ(linear_score(90.0, 30.0, 70.0), 100.0);
    // Inverted scale.
    EXPECT_DOUBLE_EQ(linear_score(25.0, 50.0, 0.0), 50.0);
}

TEST(FactorMath_TriangularScore, PeaksAndFalls) {
    EXPECT_DOUBLE_EQ(triangular_score(2.0, 0.5, 2.0, 4.0), 100.0);
    EXPECT_DOUBLE_EQ(triangular_score(1.25, 0.5, 2.0, 4.0), 50.0);
    EXPECT_DOUBLE_EQ(triangular_score(3.0, 0.5, 2.0, 4.0), 50.0);
    EXPECT_DOUBLE_EQ(triangular_score(0.2, 0.5, 2.0, 4.0), 0.0);
    EXPECT_DOUBLE_EQ(triangular_score(9.0, 0.5, 2.0, 4.0), 0.0);
}

// ─── Growth ──────────────────────────────────────────────────────────────────

TEST(Factors_Growth, BlendsSectorPercentiles) {
    const auto ctx  = context_for({"revenue_growth_yoy", "eps_growth_yoy", "fcf_growth_yoy"});
    const auto snap = snapshot({{"revenue_growth_yoy", 60.0},
                                {"eps_growth_yoy", 40.0},
                                {"fcf_growth_yoy", 20.0}});
    const auto r = GrowthFactor{}.calculate(snap, ctx);
    ASSERT_TRUE(r.computable());
    EXPECT_NEAR(*r.score, 0.4 * 60.0 + 0.4 * 40.0 + 0.2 * 20.0, 1e-9);
    EXPECT_EQ(r.name, "growth");
    EXPECT_EQ(r.category, Category::Quality);
    EXPECT_DOUBLE_EQ(r.weight, 0.12);
    EXPECT_TRUE(r.data_available);
    EXPECT_FALSE(r.reduced_reliability);
    ASSERT_EQ(r.supporting.count("revenue_growth_yoy"), 1u);
    EXPECT_DOUBLE_EQ(*r.supporting.at("revenue_growth_yoy").percentile, 60.0);
}

TEST(Factors_Growth, MissingSubMetricRenormalises) {
    const auto ctx  = context_for({"revenue_growth_yoy", "eps_growth_yoy", "fcf_growth_yoy"});
    const auto snap = snapshot({{"revenue_growth_yoy", 60.0}, {"fcf_growth_yoy", 30.0}});
    const auto r = GrowthFactor{}.calculate(snap, ctx);
    ASSERT_TRUE(r.computable());
    EXPECT_NEAR(*r.score, (0.4 * 60.0 + 0.2 * 30.0) / 0.6, 1e-9);
}

TEST(Factors_Growth, LossToProfitScoresTopOfRange) {
    const auto ctx  = context_for({"eps_growth_yoy"});
    const auto snap = snapshot({{"eps_ttm", 1.2}, {"eps_ttm_prior", -0.8},
                                {"eps_growth_yoy", 5.0}});
    const auto r = GrowthFactor{}.calculate(snap, ctx);
    ASSERT_TRUE(r.computable());
    EXPECT_DOUBLE_EQ(*r.score, 100.0);
}

TEST(Factors_Growth, NoInputsIsNotComputable) {
    const auto r = GrowthFactor{}.calculate(snapshot({}), context_for({"revenue_growth_yoy"}));
    EXPECT_FALSE(r.computable());
    EXPECT_FALSE(r.data_available);
}

TEST(Factors_Growth, DegradedDistributionFlagsReducedReliability) {
    const auto ctx  = context_for({"eps_growth_yoy"}, {"revenue_growth_yoy"});
    const auto snap = snapshot({{"revenue_growth_yoy", 50.0}, {"eps_growth_yoy", 50.0}});
    const auto r = GrowthFactor{}.calculate(snap, ctx);
    ASSERT_TRUE(r.computable());
    EXPECT_TRUE(r.reduced_reliability);
}

TEST(Factors_Growth, MetricWithoutSectorDistributionDoesNotScore) {
    const auto snap = snapshot({{"revenue_growth_yoy", 50.0}});
    const auto r = GrowthFactor{}.calculate(snap, SectorContext{});
    EXPECT_FALSE(r.computable());
    EXPECT_TRUE(r.data_available);
    EXPECT_FALSE(r.supporting.at("revenue_growth_yoy").percentile.has_value());
}

// ─── Financial health ────────────────────────────────────────────────────────

TEST(Factors_FinancialHealth, LowerDebtScoresHigher) {
    const auto ctx = context_for({"debt_to_equity"});
    const auto low  = FinancialHealthFactor{}.calculate(snapshot({{"debt_to_equity", 20.0}}), ctx);
    const auto high = FinancialHealthFactor{}.calculate(snapshot({{"debt_to_equity", 80.0}}), ctx);
    ASSERT_TRUE(low.computable());
    ASSERT_TRUE(high.computable());
    EXPECT_DOUBLE_EQ(*low.score, 80.0);
    EXPECT_DOUBLE_EQ(*high.score, 20.0);
}

TEST(Factors_FinancialHealth, CurrentRatioOptimalRange) {
    const auto r = FinancialHealthFactor{}.calculate(snapshot({{"current_ratio", 2.0}}),
                                                     SectorContext{});
    ASSERT_TRUE(r.computable());
    EXPECT_DOUBLE_EQ(*r.score, 100.0);
}

// ─── Dividend quality ────────────────────────────────────────────────────────

TEST(Factors_DividendQuality, NonPayerIsNotComputable) {
    DividendQualityFactor f;
    EXPECT_TRUE(f.is_optional());
    const auto r = f.calculate(snapshot({{"dividend_yield", 0.2}, {"payout_ratio", 10.0}}),
                               context_for({"dividend_yield"}));
    EXPECT_FALSE(r.computable());
    EXPECT_FALSE(r.data_available);
    EXPECT_FALSE(r.score.has_value());
}

TEST(Factors_DividendQuality, PayerScoresAllComponents) {
    const auto snap = snapshot({{"dividend_yield", 50.0},
                                {"payout_ratio", 45.0},
                                {"dividend_growth_5y", 10.0},
                                {"dividend_streak_years", 50.0}});
    const auto r = DividendQualityFactor{}.calculate(snap, context_for({"dividend_yield"}));
    ASSERT_TRUE(r.computable());
    // 50th percentile yield, optimal payout, saturated growth and streak.
    EXPECT_NEAR(*r.score, 0.25 * 50.0 + 0.25 * 100.0 + 0.25 * 100.0 + 0.25 * 100.0, 1e-9);
}

TEST(Factors_DividendQuality, StreakScoreIsMonotonic) {
    double prev = -1.0;
    for (double years = 0.0; years <= 60.0; years += 1.0) {
        const double s = DividendQualityFactor::streak_score(years);
        EXPECT_GE(s, prev) << years;
        prev = s;
    }
    EXPECT_DOUBLE_EQ(DividendQualityFactor::streak_score(25.0), 90.0);
}

// ─── Valuation ───────────────────────────────────────────────────────────────

TEST(Factors_Value, CheapMultiplesScoreHigh) {
    const auto ctx  = context_for({"pe_ratio", "ps_ratio"});
    const auto snap = snapshot({{"pe_ratio", 10.0}, {"ps_ratio", 30.0}});
    const auto r = ValueFactor{}.calculate(snap, ctx);
    ASSERT_TRUE(r.computable());
    EXPECT_NEAR(*r.score, (0.30 * 90.0 + 0.20 * 70.0) / 0.50, 1e-9);
    EXPECT_EQ(r.category, Category::Valuation);
}

TEST(Factors_Value, NegativeMultipleIsMissing) {
    const auto ctx = context_for({"pe_ratio"});
    const auto r = ValueFactor{}.calculate(snapshot({{"pe_ratio", -12.0}}), ctx);
    EXPECT_FALSE(r.computable());
}

TEST(Factors_IntrinsicValue, UpsideMapsLinearly) {
    const auto snap = snapshot({{"fair_value", 125.0}, {"current_price", 100.0}});
    const auto r = IntrinsicValueFactor{}.calculate(snap, SectorContext{});
    ASSERT_TRUE(r.computable());
    EXPECT_NEAR(*r.score, 75.0, 1e-9);
}

TEST(Factors_HistoricalValue, ShortHistoryIsNotComputable) {
    auto snap = snapshot({{"pe_ratio", 15.0}, {"net_margin", 12.0}});
    snap.history["pe_ratio"] = std::vector<double>(6, 20.0);
    const auto r = HistoricalValueFactor{}.calculate(snap, SectorContext{});
    EXPECT_FALSE(r.computable());
    EXPECT_TRUE(r.data_available);
}

TEST(Factors_HistoricalValue, CheapAgainstOwnHistoryScoresHigh) {
    auto snap = snapshot({{"pe_ratio", 15.0}, {"net_margin", 12.0}});
    std::vector<double> hist;
    for (int i = 0; i < 20; ++i) hist.push_back(10.0 + i);  // 10..29
    snap.history["pe_ratio"] = hist;
    const auto r = HistoricalValueFactor{}.calculate(snap, SectorContext{});
    ASSERT_TRUE(r.computable());
    // 5 of 20 history points below 15 → own percentile 25 → score 75.
    EXPECT_NEAR(*r.score, 75.0, 1e-9);
}

TEST(Factors_HistoricalValue, OwnPercentile) {
    std::vector<double> hist(12);
    for (int i = 0; i < 12; ++i) hist[i] = static_cast<double>(i + 1);  // 1..12
    EXPECT_NEAR(*HistoricalValueFactor::own_percentile(hist, 7.0), 50.0, 1e-12);
    EXPECT_FALSE(HistoricalValueFactor::own_percentile(
        std::span<const double>(hist).first(11), 7.0).has_value());
}

TEST(Factors_HistoricalValue, LossMonthsIgnored) {
    std::vector<double> hist(12, -10.0);
    hist.insert(hist.end(), 12, 20.0);
    EXPECT_NEAR(*HistoricalValueFactor::own_percentile(hist, 15.0), 0.0, 1e-12);

    // Only the positive months count toward the minimum history.
    std::vector<double> mostly_losses(20, -5.0);
    mostly_losses.insert(mostly_losses.end(), 11, 20.0);
    mostly_losses.push_back(0.0);
    EXPECT_FALSE(HistoricalValueFactor::own_percentile(mostly_losses, 15.0).has_value());
}

TEST(Factors_HistoricalValue, CheaperThanEveryProfitableMonthScoresTop) {
    auto snap = snapshot({{"pe_ratio", 15.0}, {"net_margin", 12.0}});
    std::vector<double> hist(12, -10.0);
    hist.insert(hist.end(), 12, 20.0);
    snap.history["pe_ratio"] = hist;
    const auto r = HistoricalValueFactor{}.calculate(snap, SectorContext{});
    ASSERT_TRUE(r.computable());
    EXPECT_NEAR(*r.score, 100.0, 1e-9);
}

// ─── Signals ─────────────────────────────────────────────────────────────────

TEST(Factors_SmartMoney, AnalystConsensus) {
    const auto snap = snapshot({{"analyst_buy", 3.0}, {"analyst_hold", 1.0}, {"analyst_sell", 0.0}});
    const auto r = SmartMoneyFactor{}.calculate(snap, SectorContext{});
    ASSERT_TRUE(r.computable());
    EXPECT_NEAR(*r.score, (3.0 * 100.0 + 50.0) / 4.0, 1e-9);
}

TEST(Factors_EarningsRevisions, UpwardRevisionsScoreAboveNeutral) {
    const auto snap = snapshot({{"eps_estimate_current", 2.2}, {"eps_estimate_90d", 2.0},
                                {"estimate_upgrades_90d", 6.0}, {"estimate_downgrades_90d", 2.0}});
    const auto r = EarningsRevisionsFactor{}.calculate(snap, SectorContext{});
    ASSERT_TRUE(r.computable());
    EXPECT_GT(*r.score, 50.0);
}

TEST(Factors_Technical, RsiAndMovingAverages) {
    const auto snap = snapshot({{"rsi_14", 50.0}, {"current_price", 110.0},
                                {"sma_50", 100.0}, {"sma_200", 100.0}});
    const auto r = TechnicalFactor{}.calculate(snap, SectorContext{});
    ASSERT_TRUE(r.computable());
    // RSI 50 → 50; +10 % over both averages → 100.
    EXPECT_NEAR(*r.score, (50.0 + 100.0 + 100.0) / 3.0, 1e-9);
}

TEST(Factors_Sentiment, RequiresArticles) {
    const auto none = SentimentFactor{}.calculate(
        snapshot({{"news_sentiment", 80.0}, {"article_count", 0.0}}), SectorContext{});
    EXPECT_FALSE(none.computable());

    const auto some = SentimentFactor{}.calculate(
        snapshot({{"news_sentiment", 80.0}, {"article_count", 10.0}, {"positive_articles", 5.0}}),
        SectorContext{});
    ASSERT_TRUE(some.computable());
    EXPECT_NEAR(*some.score, 0.7 * 80.0 + 0.3 * 50.0, 1e-9);
}

// ─── Registry ────────────────────────────────────────────────────────────────

TEST(FactorRegistry, DefaultRegistryHoldsTwelveFactors) {
    const auto reg = FactorRegistry::with_default_factors();
    EXPECT_EQ(reg.size(), 12u);

    double sum = 0.0;
    for (const auto& [name, w] : reg.base_weights()) sum += w;
    EXPECT_NEAR(sum, 1.0, 1e-12);

    const auto optional = reg.optional_factors();
    ASSERT_EQ(optional.size(), 1u);
    EXPECT_EQ(optional.front(), "dividend_quality");
    EXPECT_EQ(reg.categories().at("momentum"), Category::Signals);
}

TEST(FactorRegistry, DuplicateNameRejected) {
    FactorRegistry reg;
    EXPECT_TRUE(reg.add(std::make_unique<GrowthFactor>()));
    EXPECT_FALSE(reg.add(std::make_unique<GrowthFactor>()));
    EXPECT_EQ(reg.size(), 1u);
    EXPECT_NE(reg.find("growth"), nullptr);
    EXPECT_EQ(reg.find("value"), nullptr);
}

TEST(FactorRegistry, CalculateAllKeepsRegistrationOrder) {
    const auto reg = FactorRegistry::with_default_factors();
    const auto results = reg.calculate_all(snapshot({}), SectorContext{});
    ASSERT_EQ(results.size(), 12u);
    EXPECT_EQ(results.front().name, "growth");
    EXPECT_EQ(results.back().name, "sentiment");
    for (const auto& r : results) {
        EXPECT_FALSE(r.computable()) << r.name;
    }
}

TEST(FactorRegistry, ScoresStayOnScale) {
    const auto ctx = context_for(stats::tracked_metrics());
    std::map<std::string, double> extreme;
    for (const auto& m : stats::tracked_metrics()) extreme[m] = 1.0e6;
    extreme["current_ratio"] = 1.0e6;
    extreme["rsi_14"] = 1.0e6;
    extreme["insider_net_shares_90d"] = -1.0e9;
    const auto results = FactorRegistry::with_default_factors().calculate_all(snapshot(extreme), ctx);
    for (const auto& r : results) {
        if (r.computable()) {
            EXPECT_GE(*r.score, 0.0) << r.name;
            EXPECT_LE(*r.score, 100.0) << r.name;
        }
    }
}
