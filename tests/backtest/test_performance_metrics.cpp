#include <gtest/gtest.h>
#include "icscore/backtest.hpp"
#include "icscore/constants.hpp"

#include <cmath>
#include <limits>
#include <vector>

using namespace icscore;
using namespace icscore::backtest;
using namespace icscore::constants;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static std::vector<double> make_constant_returns(std::size_t n, double val) {
    return std::vector<double>(n, val);
}

static std::vector<double> make_returns_with_mean_stddev(
        double target_mean, double target_stddev, std::size_t n) {
    // Alternating series: half at (mean + stddev), half at (mean - stddev)
    std::vector<double> v(n);
    for (std::size_t i = 0; i < n; ++i) {
        v[i] = (i % 2 == 0) ? target_mean + target_stddev
                              : target_mean - target_stddev;
    }
    return v;
}

static const double DAILY = periods_per_year(RebalanceFrequency::Daily);

// ─── Sharpe ──────────────────────────────────────────────────────────────────

TEST(PerformanceCalculator_Sharpe, ConstantReturns_ZeroVariance_Nullopt) {
    EXPECT_FALSE(PerformanceCalculator::sharpe(make_constant_returns(100, 0.0), 0.0, 1.0).has_value());
    EXPECT_FALSE(PerformanceCalculator::sharpe(make_constant_returns(50, 0.01), 0.0, 1.0).has_value());
}

TEST(PerformanceCalculator_Sharpe, KnownValues_CorrectAnnualised) {
    // (0.001 / 0.01) · √252 ≈ 1.5874
    auto returns = make_returns_with_mean_stddev(0.001, 0.01, 500);
    auto result  = PerformanceCalculator::sharpe(returns, 0.0, DAILY);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(*result, 0.001 / 0.01 * std::sqrt(252.0), 0.05);
}

TEST(PerformanceCalculator_Sharpe, RiskFreeSubtracted) {
    auto returns = make_returns_with_mean_stddev(0.001, 0.01, 500);
    auto result  = PerformanceCalculator::sharpe(returns, 0.0005, DAILY);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(*result, 0.0005 / 0.01 * std::sqrt(252.0), 0.05);
}

TEST(PerformanceCalculator_Sharpe, MonthlyAnnualisation) {
    auto returns = make_returns_with_mean_stddev(0.01, 0.04, 24);
    auto monthly = PerformanceCalculator::sharpe(returns, 0.0,
                                                 periods_per_year(RebalanceFrequency::Monthly));
    auto raw     = PerformanceCalculator::sharpe(returns, 0.0, 1.0);
    ASSERT_TRUE(monthly.has_value());
    ASSERT_TRUE(raw.has_value());
    EXPECT_NEAR(*monthly, *raw * std::sqrt(12.0), 1e-12);
}

TEST(PerformanceCalculator_Sharpe, TooFewReturns_Nullopt) {
    EXPECT_FALSE(PerformanceCalculator::sharpe(std::span<const double>{}, 0.0, 1.0).has_value());
    std::vector<double> one = {0.01};
    EXPECT_FALSE(PerformanceCalculator::sharpe(one, 0.0, 1.0).has_value());
}

TEST(PerformanceCalculator_Sharpe, NonFiniteInput_Nullopt) {
    std::vector<double> nan_r = {0.01, std::numeric_limits<double>::quiet_NaN(), 0.02};
    std::vector<double> inf_r = {0.01, std::numeric_limits<double>::infinity(), 0.02};
    EXPECT_FALSE(PerformanceCalculator::sharpe(nan_r, 0.0, 1.0).has_value());
    EXPECT_FALSE(PerformanceCalculator::sharpe(inf_r, 0.0, 1.0).has_value());
}

TEST(PerformanceCalculator_Sharpe, NegativeMean_NegativeSharpe) {
    auto returns = make_returns_with_mean_stddev(-0.001, 0.01, 500);
    auto result  = PerformanceCalculator::sharpe(returns, 0.0, DAILY);
    ASSERT_TRUE(result.has_value());
    EXPECT_LT(*result, 0.0);
}

// ─── Max Drawdown ─────────────────────────────────────────────────────────────

TEST(PerformanceCalculator_MaxDrawdown, EmptyInput_Nullopt) {
    EXPECT_FALSE(PerformanceCalculator::max_drawdown(std::span<const double>{}).has_value());
}

TEST(PerformanceCalculator_MaxDrawdown, MonotonicallyRising_ZeroDrawdown) {
    auto result = PerformanceCalculator::max_drawdown(make_constant_returns(100, 0.01));
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(*result, 0.0, FLOAT_EPSILON);
}

TEST(PerformanceCalculator_MaxDrawdown, SingleDropThenRecover_KnownMDD) {
    // Equity: 1 → 1.1 → 0.9 → 1.1
    std::vector<double> returns = {
        0.10,
        (0.90 - 1.10) / 1.10,
        (1.10 - 0.90) / 0.90,
    };
    auto result = PerformanceCalculator::max_drawdown(returns);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(*result, (1.10 - 0.90) / 1.10, 1e-6);
}

TEST(PerformanceCalculator_MaxDrawdown, AlwaysInUnitInterval) {
    std::vector<double> r;
    for (int i = 0; i < 200; ++i) {
        r.push_back((i % 3 == 0) ? -0.05 : 0.02);
    }
    auto result = PerformanceCalculator::max_drawdown(r);
    ASSERT_TRUE(result.has_value());
    EXPECT_GE(*result, 0.0);
    EXPECT_LE(*result, 1.0);

    std::vector<double> wipeout = {0.1, -1.0};
    EXPECT_DOUBLE_EQ(*PerformanceCalculator::max_drawdown(wipeout), 1.0);
}

// ─── Information ratio ───────────────────────────────────────────────────────

TEST(PerformanceCalculator_IR, MismatchedLengths_Nullopt) {
    std::vector<double> a = {0.01, 0.02, 0.03};
    std::vector<double> b = {0.005, 0.01};
    EXPECT_FALSE(PerformanceCalculator::information_ratio(a, b).has_value());
}

TEST(PerformanceCalculator_IR, MatchesSharpeOfActiveReturns) {
    std::vector<double> strat, bench, active;
    for (int i = 0; i < 100; ++i) {
        strat.push_back(0.001 + (i % 2 == 0 ? 0.005 : -0.005));
        bench.push_back(0.0005);
        active.push_back(strat.back() - bench.back());
    }
    auto ir     = PerformanceCalculator::information_ratio(strat, bench);
    auto sharpe = PerformanceCalculator::sharpe(active, 0.0, 1.0);
    ASSERT_TRUE(ir.has_value());
    ASSERT_TRUE(sharpe.has_value());
    EXPECT_NEAR(*ir, *sharpe, 1e-12);
    EXPECT_GT(*ir, 0.0);
}

TEST(PerformanceCalculator_IR, IdenticalSeries_Nullopt) {
    std::vector<double> same(20, 0.01);
    EXPECT_FALSE(PerformanceCalculator::information_ratio(same, same).has_value());
}

// ─── Compounding ─────────────────────────────────────────────────────────────

TEST(PerformanceCalculator_Compounding, TotalReturn) {
    std::vector<double> r = {0.10, -0.10};
    EXPECT_NEAR(PerformanceCalculator::total_return(r), 1.1 * 0.9 - 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(PerformanceCalculator::total_return(std::span<const double>{}), 0.0);
}

TEST(PerformanceCalculator_Compounding, AnnualiseCalendarYear) {
    EXPECT_NEAR(PerformanceCalculator::annualize(0.12, 365), std::pow(1.12, 365.25 / 365.0) - 1.0, 1e-12);
}

TEST(PerformanceCalculator_Compounding, AnnualiseHalfYearCompounds) {
    const int days = 183;
    const double expected = std::pow(1.05, DAYS_PER_YEAR / days) - 1.0;
    EXPECT_NEAR(PerformanceCalculator::annualize(0.05, days), expected, 1e-12);
    EXPECT_GT(PerformanceCalculator::annualize(0.05, days), 0.05);
}

TEST(PerformanceCalculator_Compounding, AnnualiseEdgeCases) {
    EXPECT_DOUBLE_EQ(PerformanceCalculator::annualize(0.07, 0), 0.07);
    EXPECT_DOUBLE_EQ(PerformanceCalculator::annualize(-1.0, 200), -1.0);
    EXPECT_DOUBLE_EQ(PerformanceCalculator::annualize(-1.5, 200), -1.0);
}

// ─── Frequency ───────────────────────────────────────────────────────────────

TEST(Backtest_Frequency, ParseAndName) {
    for (auto f : {RebalanceFrequency::Daily, RebalanceFrequency::Weekly,
                   RebalanceFrequency::Monthly, RebalanceFrequency::Quarterly}) {
        const auto parsed = parse_frequency(to_string(f));
        ASSERT_TRUE(parsed.has_value()) << to_string(f);
        EXPECT_EQ(*parsed, f);
    }
    EXPECT_FALSE(parse_frequency("hourly").has_value());
}

TEST(Backtest_Frequency, PeriodsPerYear) {
    EXPECT_DOUBLE_EQ(periods_per_year(RebalanceFrequency::Daily), 252.0);
    EXPECT_DOUBLE_EQ(periods_per_year(RebalanceFrequency::Weekly), 52.0);
    EXPECT_DOUBLE_EQ(periods_per_year(RebalanceFrequency::Monthly), 12.0);
    EXPECT_DOUBLE_EQ(periods_per_year(RebalanceFrequency::Quarterly), 4.0);
}

// ─── Report ──────────────────────────────────────────────────────────────────

TEST(Backtest_Report, EmptyResultsStillFormat) {
    BacktestResults res;
    EXPECT_FALSE(res.to_string().empty());
    EXPECT_EQ(res.periods_to_csv(), BacktestResults::period_csv_header() + "\n");
}
