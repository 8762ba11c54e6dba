#include <gtest/gtest.h>
#include "icscore/backtest.hpp"
#include "synthetic_universe.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

using namespace icscore;
using namespace icscore::backtest;
using namespace icscore::testing;

// ─── Period generation ───────────────────────────────────────────────────────

TEST(Backtester_Periods, MonthlyStartsOnFirstOfMonth) {
    const auto p = Backtester::generate_periods(make_date(2024, 1, 15), make_date(2024, 3, 31),
                                                RebalanceFrequency::Monthly);
    ASSERT_EQ(p.size(), 3u);
    EXPECT_EQ(p[0].start, make_date(2024, 1, 15));
    EXPECT_EQ(p[0].end,   make_date(2024, 2, 1));
    EXPECT_EQ(p[1].start, make_date(2024, 2, 1));
    EXPECT_EQ(p[1].end,   make_date(2024, 3, 1));
    EXPECT_EQ(p[2].start, make_date(2024, 3, 1));
    EXPECT_EQ(p[2].end,   make_date(2024, 3, 31));
}

TEST(Backtester_Periods, EachPeriodEndsOnNextRebalance) {
    for (auto f : {RebalanceFrequency::Daily, RebalanceFrequency::Weekly,
                   RebalanceFrequency::Monthly, RebalanceFrequency::Quarterly}) {
        const auto p = Backtester::generate_periods(make_date(2023, 1, 1), make_date(2023, 12, 31), f);
        ASSERT_FALSE(p.empty()) << to_string(f);
        for (std::size_t i = 0; i + 1 < p.size(); ++i) {
            EXPECT_EQ(p[i].end, p[i + 1].start) << to_string(f) << " period " << i;
            EXPECT_LT(p[i].start, p[i].end) << to_string(f) << " period " << i;
        }
        EXPECT_EQ(p.back().end, make_date(2023, 12, 31)) << to_string(f);
    }
}

TEST(Backtester_Periods, FinalPeriodCappedAtEnd) {
    const auto p = Backtester::generate_periods(make_date(2024, 1, 1), make_date(2024, 2, 10),
                                                RebalanceFrequency::Monthly);
    ASSERT_EQ(p.size(), 2u);
    EXPECT_EQ(p[1].start, make_date(2024, 2, 1));
    EXPECT_EQ(p[1].end,   make_date(2024, 2, 10));
}

TEST(Backtester_Periods, QuarterlyAlignsToCalendarQuarters) {
    const auto p = Backtester::generate_periods(make_date(2024, 2, 10), make_date(2024, 12, 31),
                                                RebalanceFrequency::Quarterly);
    ASSERT_EQ(p.size(), 4u);
    EXPECT_EQ(p[0].end,   make_date(2024, 4, 1));
    EXPECT_EQ(p[1].start, make_date(2024, 4, 1));
    EXPECT_EQ(p[3].start, make_date(2024, 10, 1));
    EXPECT_EQ(p[3].end,   make_date(2024, 12, 31));
}

TEST(Backtester_Periods, QuarterlyCrossesYearEnd) {
    const auto p = Backtester::generate_periods(make_date(2023, 11, 5), make_date(2024, 2, 1),
                                                RebalanceFrequency::Quarterly);
    ASSERT_EQ(p.size(), 2u);
    EXPECT_EQ(p[0].end,   make_date(2024, 1, 1));
    EXPECT_EQ(p[1].start, make_date(2024, 1, 1));
    EXPECT_EQ(p[1].end,   make_date(2024, 2, 1));
}

TEST(Backtester_Periods, WeeklySevenDaySteps) {
    const auto p = Backtester::generate_periods(make_date(2024, 1, 1), make_date(2024, 1, 20),
                                                RebalanceFrequency::Weekly);
    ASSERT_EQ(p.size(), 3u);
    EXPECT_EQ(p[0].end,   make_date(2024, 1, 8));
    EXPECT_EQ(p[1].start, make_date(2024, 1, 8));
    EXPECT_EQ(p[2].start, make_date(2024, 1, 15));
    EXPECT_EQ(p[2].end,   make_date(2024, 1, 20));
}

TEST(Backtester_Periods, DailyOnePerDayBeforeEnd) {
    const auto p = Backtester::generate_periods(make_date(2024, 1, 1), make_date(2024, 1, 4),
                                                RebalanceFrequency::Daily);
    ASSERT_EQ(p.size(), 3u);
    EXPECT_EQ(p[0].start, make_date(2024, 1, 1));
    EXPECT_EQ(p[0].end,   make_date(2024, 1, 2));
    EXPECT_EQ(p[2].start, make_date(2024, 1, 3));
    EXPECT_EQ(p[2].end,   make_date(2024, 1, 4));
}

TEST(Backtester_Periods, EmptyWhenStartNotBeforeEnd) {
    EXPECT_TRUE(Backtester::generate_periods(make_date(2024, 3, 1), make_date(2024, 3, 1),
                                             RebalanceFrequency::Monthly).empty());
    EXPECT_TRUE(Backtester::generate_periods(make_date(2024, 3, 1), make_date(2024, 1, 1),
                                             RebalanceFrequency::Monthly).empty());
}

// ─── Deciles and turnover ────────────────────────────────────────────────────

TEST(Backtester_Deciles, TwentyTickersTwoPerDecile) {
    const auto d = Backtester::assign_deciles(20);
    ASSERT_EQ(d.size(), 20u);
    EXPECT_EQ(d[0], 10);
    EXPECT_EQ(d[1], 10);
    EXPECT_EQ(d[2], 9);
    EXPECT_EQ(d[18], 1);
    EXPECT_EQ(d[19], 1);
    for (int decile = 1; decile <= 10; ++decile) {
        EXPECT_EQ(std::count(d.begin(), d.end(), decile), 2) << decile;
    }
}

TEST(Backtester_Deciles, UnevenUniverseStaysInRange) {
    const auto d = Backtester::assign_deciles(13);
    EXPECT_EQ(d.front(), 10);
    EXPECT_EQ(d.back(), 1);
    EXPECT_TRUE(std::is_sorted(d.rbegin(), d.rend()));
}

TEST(Backtester_Turnover, FirstPeriodIsFull) {
    EXPECT_DOUBLE_EQ(Backtester::turnover({}, {"A", "B"}), 1.0);
}

TEST(Backtester_Turnover, SharedHoldings) {
    EXPECT_DOUBLE_EQ(Backtester::turnover({"A", "B"}, {"B", "A"}), 0.0);
    EXPECT_DOUBLE_EQ(Backtester::turnover({"A", "B"}, {"B", "C"}), 0.5);
    EXPECT_DOUBLE_EQ(Backtester::turnover({"A", "B", "C", "D"}, {"A"}), 0.75);
    EXPECT_DOUBLE_EQ(Backtester::turnover({"A"}, {"X", "Y"}), 1.0);
}

// ─── Synthetic run ───────────────────────────────────────────────────────────

namespace {

constexpr int UNIVERSE_SIZE = 20;

/// Hands out snapshots stamped one day after the requested date.
class LeakyRepository final : public data::MetricRepository {
public:
    explicit LeakyRepository(const data::MetricRepository& inner) : inner_(inner) {}

    std::vector<std::string> sectors(Date as_of) const override { return inner_.sectors(as_of); }
    std::vector<MetricsSnapshot> sector_universe(const std::string& sector,
                                                 Date as_of) const override {
        auto out = inner_.sector_universe(sector, as_of);
        for (auto& s : out) s.as_of = add_days(as_of, 1);
        return out;
    }
    MetricsSnapshot ticker_fundamentals(const std::string& ticker, Date as_of) const override {
        return inner_.ticker_fundamentals(ticker, as_of);
    }
    std::vector<ScoreEvent> events_since(const std::string& ticker, Date since,
                                         Date as_of) const override {
        return inner_.events_since(ticker, since, as_of);
    }
    std::optional<double> price(const std::string& ticker, Date as_of) const override {
        return inner_.price(ticker, as_of);
    }

private:
    const data::MetricRepository& inner_;
};

class BacktesterTest : public ::testing::Test {
protected:
    void SetUp() override {
        add_universe(repo, make_date(2023, 1, 1), UNIVERSE_SIZE);
        add_quality_prices(repo, UNIVERSE_SIZE, make_date(2023, 1, 1), make_date(2023, 7, 31));
        cfg.threads = 2;
    }

    BacktestResults run(const BacktestConfig& bc) {
        core::ScoringEngine engine(repo, store, cfg);
        Backtester bt(repo, engine, bc);
        return bt.run(start, end);
    }

    const Date start = make_date(2023, 2, 1);
    const Date end   = make_date(2023, 6, 30);

    data::InMemoryRepository  repo;
    core::InMemoryRecordStore store;
    core::EngineConfig        cfg;
};

}  // namespace

TEST_F(BacktesterTest, StrongerScoresEarnMore) {
    BacktestConfig bc;
    bc.threads = 2;
    const auto res = run(bc);

    EXPECT_EQ(res.periods_run, 5u);
    EXPECT_EQ(res.periods_skipped, 0u);
    EXPECT_EQ(res.period_results.size(), 50u);
    ASSERT_EQ(res.deciles.size(), 10u);
    EXPECT_EQ(res.decile_returns.rows(), 5);
    EXPECT_EQ(res.decile_returns.cols(), 10);

    EXPECT_GT(res.deciles.back().annualized_return, res.deciles.front().annualized_return);
    EXPECT_GT(res.top_bottom_spread, 0.0);
    EXPECT_DOUBLE_EQ(res.monotonicity, 1.0);
    EXPECT_DOUBLE_EQ(res.hit_rate, 1.0);
    EXPECT_DOUBLE_EQ(res.deciles.back().average_holdings, 2.0);

    ASSERT_TRUE(res.benchmark_annualized.has_value());
    ASSERT_TRUE(res.top_vs_benchmark.has_value());
    EXPECT_GT(*res.top_vs_benchmark, 0.0);

    // The ranking never changes, so only the first period trades.
    for (const auto& pr : res.period_results) {
        const double expected = pr.period_start == start ? 1.0 : 0.0;
        EXPECT_DOUBLE_EQ(pr.turnover, expected) << to_string(pr.period_start) << " D" << pr.decile;
    }
    // Store is never touched by a backtest.
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(BacktesterTest, TopDecileHoldsStrongestTickers) {
    BacktestConfig bc;
    const auto res = run(bc);
    const auto it = std::find_if(res.period_results.begin(), res.period_results.end(),
                                 [](const BacktestPeriodResult& r) { return r.decile == 10; });
    ASSERT_NE(it, res.period_results.end());
    std::vector<std::string> held = it->holdings;
    std::sort(held.begin(), held.end());
    EXPECT_EQ(held, (std::vector<std::string>{ticker_name(18), ticker_name(19)}));
}

TEST_F(BacktesterTest, CostsReduceEveryReturn) {
    BacktestConfig no_cost;
    no_cost.transaction_cost_bps = 0.0;
    no_cost.slippage_bps         = 0.0;
    BacktestConfig costly;
    costly.transaction_cost_bps = 10.0;
    costly.slippage_bps         = 5.0;

    const auto a = run(no_cost);
    const auto b = run(costly);
    ASSERT_EQ(a.period_results.size(), b.period_results.size());
    for (std::size_t i = 0; i < a.period_results.size(); ++i) {
        EXPECT_NEAR(a.period_results[i].portfolio_return - b.period_results[i].portfolio_return,
                    0.0015, 1e-12);
    }
}

TEST_F(BacktesterTest, MarketCapWeightingTiltsTowardLargerHoldings) {
    BacktestConfig equal;
    BacktestConfig cap;
    cap.weighting = Weighting::MarketCap;

    const auto e = run(equal);
    const auto c = run(cap);
    ASSERT_EQ(e.decile_returns.rows(), c.decile_returns.rows());
    // In the top decile the larger company is also the faster grower.
    for (Eigen::Index r = 0; r < e.decile_returns.rows(); ++r) {
        EXPECT_GT(c.decile_returns(r, 9), e.decile_returns(r, 9));
    }
}

TEST_F(BacktesterTest, DailyAndWeeklyReturnsFollowPricePath) {
    // Every ticker compounds a constant daily return, so a bucket held from
    // one rebalance to the next earns (1 + r)^days − 1 per holding.
    const auto daily_return = [](const std::string& ticker) {
        const int i = std::stoi(ticker.substr(1));
        return -0.001 + 0.003 * quality_of(i, UNIVERSE_SIZE);
    };

    for (auto f : {RebalanceFrequency::Daily, RebalanceFrequency::Weekly}) {
        BacktestConfig bc;
        bc.frequency            = f;
        bc.transaction_cost_bps = 0.0;
        bc.slippage_bps         = 0.0;
        core::ScoringEngine engine(repo, store, cfg);
        Backtester bt(repo, engine, bc);
        const auto res = bt.run(make_date(2023, 3, 1), make_date(2023, 3, 29));

        EXPECT_EQ(res.periods_run, f == RebalanceFrequency::Daily ? 28u : 4u);
        ASSERT_FALSE(res.period_results.empty());
        for (const auto& pr : res.period_results) {
            const int days = days_between(pr.period_start, pr.period_end);
            double expected = 0.0;
            for (const auto& t : pr.holdings) {
                expected += std::pow(1.0 + daily_return(t), days) - 1.0;
            }
            expected /= static_cast<double>(pr.holdings.size());
            EXPECT_NEAR(pr.portfolio_return, expected, 1e-9)
                << to_string(f) << " " << to_string(pr.period_start) << " D" << pr.decile;
        }
        EXPECT_GT(res.deciles.back().total_return, 0.0) << to_string(f);
        EXPECT_LT(res.deciles.front().total_return, 0.0) << to_string(f);
    }
}

TEST_F(BacktesterTest, UnpricedDecileIsDropped) {
    data::InMemoryRepository partial;
    add_universe(partial, make_date(2023, 1, 1), UNIVERSE_SIZE);
    for (int i = 0; i < UNIVERSE_SIZE - 2; ++i) {
        add_price_path(partial, ticker_name(i), make_date(2023, 1, 1), make_date(2023, 7, 31),
                       -0.001 + 0.003 * quality_of(i, UNIVERSE_SIZE));
    }
    add_price_path(partial, "SPY", make_date(2023, 1, 1), make_date(2023, 7, 31), 0.0005);

    core::ScoringEngine engine(partial, store, cfg);
    Backtester bt(partial, engine);
    const auto res = bt.run(start, end);

    EXPECT_EQ(res.periods_run, 5u);
    EXPECT_EQ(res.period_results.size(), 45u);
    for (const auto& pr : res.period_results) {
        EXPECT_NE(pr.decile, 10);
    }
    EXPECT_EQ(res.deciles.back().periods, 0u);
    for (Eigen::Index r = 0; r < res.decile_returns.rows(); ++r) {
        EXPECT_TRUE(std::isnan(res.decile_returns(r, 9)));
    }
    // Deciles 6..9 still beat 1..5 in every period.
    EXPECT_DOUBLE_EQ(res.hit_rate, 1.0);
}

TEST_F(BacktesterTest, SmallUniverseSkipsPeriods) {
    data::InMemoryRepository small;
    add_universe(small, make_date(2023, 1, 1), 8);
    add_quality_prices(small, 8, make_date(2023, 1, 1), make_date(2023, 7, 31));

    core::ScoringEngine engine(small, store, cfg);
    Backtester bt(small, engine);
    const auto res = bt.run(start, end);
    EXPECT_EQ(res.periods_run, 0u);
    EXPECT_EQ(res.periods_skipped, 5u);
    EXPECT_TRUE(res.period_results.empty());
    EXPECT_FALSE(res.information_ratio.has_value());
}

TEST_F(BacktesterTest, FutureDataAbortsRun) {
    LeakyRepository leaky(repo);
    core::ScoringEngine engine(repo, store, cfg);
    Backtester bt(leaky, engine);
    EXPECT_THROW((void)bt.run(start, end), data::LookAheadViolation);
}

TEST_F(BacktesterTest, PeriodCsvHasOneLinePerResult) {
    BacktestConfig bc;
    const auto res = run(bc);
    const auto csv = res.periods_to_csv();
    EXPECT_EQ(static_cast<std::size_t>(std::count(csv.begin(), csv.end(), '\n')),
              res.period_results.size() + 1);
    EXPECT_EQ(csv.rfind(BacktestResults::period_csv_header(), 0), 0u);
    EXPECT_FALSE(res.to_string().empty());
}
