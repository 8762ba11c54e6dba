/// @file src/backtest/backtester.cpp
/// @brief Implementation of the decile Backtester.
///
/// The Backtester orchestrates:
///   1. Period generation from the rebalance frequency
///   2. Point-in-time universe scoring per period (concurrently)
///   3. Decile bucketing and forward-return measurement
///   4. Turnover against the previous period's holdings
///   5. Aggregation into BacktestResults

#include "icscore/backtest.hpp"
#include "icscore/thread_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <future>
#include <map>
#include <set>
#include <utility>

namespace icscore::backtest {

namespace {

/// First day of the month after `d`.
Date first_of_next_month(Date d) noexcept {
    const auto ym = (d.year() / d.month()) + std::chrono::months{1};
    return Date{ym / std::chrono::day{1}};
}

/// First day of the calendar quarter after `d`.
Date first_of_next_quarter(Date d) noexcept {
    const unsigned m = static_cast<unsigned>(d.month());
    const unsigned quarter_start = ((m - 1) / 3) * 3 + 1;
    const auto ym = (d.year() / std::chrono::month{quarter_start}) + std::chrono::months{3};
    return Date{ym / std::chrono::day{1}};
}

/// Mean of the finite entries of `v`; nullopt when there are none.
template <typename Derived>
std::optional<double> finite_mean(const Eigen::DenseBase<Derived>& v) {
    double sum = 0.0;
    int    n   = 0;
    for (Eigen::Index i = 0; i < v.size(); ++i) {
        const double x = v(i);
        if (std::isfinite(x)) {
            sum += x;
            ++n;
        }
    }
    if (n == 0) {
        return std::nullopt;
    }
    return sum / n;
}

}  // namespace

// ─── Backtester ───────────────────────────────────────────────────────────────

Backtester::Backtester(const data::MetricRepository& repo,
                       const core::ScoringEngine& engine,
                       BacktestConfig config)
    : repo_(repo)
    , engine_(engine)
    , config_(std::move(config)) {}

// ─── Static helpers ───────────────────────────────────────────────────────────

std::vector<Period>
Backtester::generate_periods(Date start, Date end, RebalanceFrequency frequency) {
    std::vector<Period> out;
    if (!start.ok() || !end.ok()) {
        return out;
    }

    Date current = start;
    while (current < end) {
        Date next{};
        switch (frequency) {
            case RebalanceFrequency::Daily:     next = add_days(current, 1);         break;
            case RebalanceFrequency::Weekly:    next = add_days(current, 7);         break;
            case RebalanceFrequency::Monthly:   next = first_of_next_month(current);  break;
            case RebalanceFrequency::Quarterly: next = first_of_next_quarter(current); break;
        }
        out.push_back(Period{.start = current, .end = std::min(next, end)});
        current = next;
    }
    return out;
}

std::vector<int> Backtester::assign_deciles(std::size_t n) {
    std::vector<int> out(n);
    const auto buckets = static_cast<std::size_t>(constants::DECILE_COUNT);
    for (std::size_t rank = 0; rank < n; ++rank) {
        out[rank] = constants::DECILE_COUNT - static_cast<int>(rank * buckets / n);
    }
    return out;
}

double Backtester::turnover(const std::vector<std::string>& previous,
                            const std::vector<std::string>& current) {
    if (previous.empty()) {
        return 1.0;
    }
    const std::set<std::string> prev(previous.begin(), previous.end());
    const std::set<std::string> curr(current.begin(), current.end());
    const std::size_t total = std::max(prev.size(), curr.size());
    if (total == 0) {
        return 0.0;
    }
    std::size_t unchanged = 0;
    for (const auto& t : curr) {
        unchanged += prev.count(t);
    }
    return 1.0 - static_cast<double>(unchanged) / static_cast<double>(total);
}

// ─── Per-period work ──────────────────────────────────────────────────────────

std::optional<double>
Backtester::price_return(const std::string& ticker, const Period& period) const {
    // Forward prices come from the unrestricted repository on purpose: the
    // holding period ends after the rebalance cutoff.
    const auto p0 = repo_.price(ticker, period.start);
    const auto p1 = repo_.price(ticker, period.end);
    if (!p0 || !p1 || *p0 <= 0.0) {
        return std::nullopt;
    }
    return *p1 / *p0 - 1.0;
}

std::optional<double> Backtester::forward_return(const std::vector<std::string>& holdings,
                                  const data::MetricRepository& pit,
                                  const Period& period) const {
    std::vector<std::pair<double, double>> priced;  // (return, weight)
    priced.reserve(holdings.size());

    for (const auto& ticker : holdings) {
        const auto r = price_return(ticker, period);
        if (!r) {
            spdlog::debug("{}: no prices for {}..{}, excluded from return",
                          ticker, icscore::to_string(period.start), icscore::to_string(period.end));
            continue;
        }
        double weight = 1.0;
        if (config_.weighting == Weighting::MarketCap) {
            std::optional<double> cap;
            try {
                cap = pit.ticker_fundamentals(ticker, period.start).get(constants::MARKET_CAP_METRIC);
            } catch (const data::RepositoryError& e) {
                spdlog::warn("{}: market cap unavailable: {}", ticker, e.what());
            }
            // Sentinel: resolved to the mean capitalisation below.
            weight = (cap && *cap > 0.0) ? *cap : -1.0;
        }
        priced.emplace_back(*r, weight);
    }

    if (priced.empty()) {
        return std::nullopt;
    }

    // Holdings without a capitalisation take the mean of those with one.
    double cap_sum = 0.0;
    std::size_t cap_count = 0;
    for (const auto& [r, w] : priced) {
        if (w > 0.0) {
            cap_sum += w;
            ++cap_count;
        }
    }
    const double fill = cap_count > 0 ? cap_sum / static_cast<double>(cap_count) : 1.0;

    double num = 0.0;
    double den = 0.0;
    for (auto& [r, w] : priced) {
        const double weight = w > 0.0 ? w : fill;
        num += r * weight;
        den += weight;
    }
    if (den <= 0.0) {
        return std::nullopt;
    }
    return num / den;
}

std::vector<BacktestPeriodResult> Backtester::run_period(const Period& period) const {
    const data::PointInTimeRepository pit(repo_, period.start);
    auto records = engine_.score_point_in_time(pit, period.start);

    records.erase(std::remove_if(records.begin(), records.end(),
                                 [](const core::ICScoreRecord& r) { return !r.raw_score; }),
                  records.end());

    if (records.size() < static_cast<std::size_t>(constants::DECILE_COUNT)) {
        spdlog::warn("backtest period {}: only {} scored tickers, period skipped",
                     icscore::to_string(period.start), records.size());
        return {};
    }

    std::sort(records.begin(), records.end(),
              [](const core::ICScoreRecord& a, const core::ICScoreRecord& b) {
                  if (*a.raw_score != *b.raw_score) return *a.raw_score > *b.raw_score;
                  return a.ticker < b.ticker;
              });

    const auto deciles = assign_deciles(records.size());

    std::map<int, std::vector<const core::ICScoreRecord*>> buckets;
    for (std::size_t i = 0; i < records.size(); ++i) {
        buckets[deciles[i]].push_back(&records[i]);
    }

    std::optional<double> bench;
    if (!config_.benchmark.empty()) {
        bench = price_return(config_.benchmark, period);
        if (!bench) {
            spdlog::debug("benchmark {}: no prices for {}", config_.benchmark,
                          icscore::to_string(period.start));
        }
    }

    const double cost = (config_.transaction_cost_bps + config_.slippage_bps) / 10000.0;

    std::vector<BacktestPeriodResult> out;
    out.reserve(buckets.size());
    for (const auto& [decile, members] : buckets) {
        BacktestPeriodResult pr;
        pr.period_start  = period.start;
        pr.period_end    = period.end;
        pr.decile        = decile;
        pr.holding_count = members.size();

        double score_sum = 0.0;
        for (const auto* rec : members) {
            pr.holdings.push_back(rec->ticker);
            score_sum += *rec->raw_score;
        }
        pr.average_score = score_sum / static_cast<double>(members.size());

        const auto gross = forward_return(pr.holdings, pit, period);
        if (!gross) {
            spdlog::warn("backtest period {}: decile {} has no priced holdings, dropped",
                         icscore::to_string(period.start), decile);
            continue;
        }
        pr.portfolio_return = *gross - cost;
        pr.benchmark_return = bench;
        if (bench) {
            pr.excess_return = pr.portfolio_return - *bench;
        }
        out.push_back(std::move(pr));
    }
    return out;
}

// ─── Backtester::run ──────────────────────────────────────────────────────────

BacktestResults Backtester::run(Date start, Date end) const {
    const auto periods = generate_periods(start, end, config_.frequency);
    spdlog::info("backtest {}..{}: {} {} periods", icscore::to_string(start), icscore::to_string(end),
                 periods.size(), to_string(config_.frequency));

    std::vector<std::vector<BacktestPeriodResult>> per_period(periods.size());
    {
        ThreadPool pool(config_.threads);
        std::vector<std::future<std::vector<BacktestPeriodResult>>> pending;
        pending.reserve(periods.size());
        for (const auto& period : periods) {
            pending.push_back(pool.submit([this, &period] { return run_period(period); }));
        }
        // LookAheadViolation and any other failure propagate from get().
        for (std::size_t i = 0; i < pending.size(); ++i) {
            per_period[i] = pending[i].get();
        }
    }

    // Turnover needs the previous run period of the same decile.
    std::map<int, std::vector<std::string>> last_holdings;
    std::vector<BacktestPeriodResult> all;
    std::size_t skipped = 0;
    for (auto& results : per_period) {
        if (results.empty()) {
            ++skipped;
            continue;
        }
        for (auto& pr : results) {
            pr.turnover = turnover(last_holdings[pr.decile], pr.holdings);
            last_holdings[pr.decile] = pr.holdings;
            all.push_back(std::move(pr));
        }
    }

    BacktestResults results = aggregate(std::move(all), start, end);
    results.periods_skipped = skipped;
    return results;
}

// ─── Backtester::aggregate ────────────────────────────────────────────────────

BacktestResults
Backtester::aggregate(std::vector<BacktestPeriodResult> period_results,
                      Date start, Date end) const {
    BacktestResults res;
    res.start     = start;
    res.end       = end;
    res.frequency = config_.frequency;
    res.benchmark = config_.benchmark;

    const int n_dec = constants::DECILE_COUNT;
    const int days  = days_between(start, end);

    // ── Period × decile return matrix ───────────────────────────────────────
    std::vector<Date> starts;
    for (const auto& pr : period_results) {
        if (std::find(starts.begin(), starts.end(), pr.period_start) == starts.end()) {
            starts.push_back(pr.period_start);
        }
    }
    std::sort(starts.begin(), starts.end());
    res.periods_run = starts.size();

    const auto rows = static_cast<Eigen::Index>(starts.size());
    res.decile_returns = Eigen::MatrixXd::Constant(rows, n_dec, std::nan(""));
    std::vector<std::optional<double>> bench_by_row(starts.size());

    for (const auto& pr : period_results) {
        if (pr.decile < 1 || pr.decile > n_dec) {
            continue;
        }
        const auto row = static_cast<Eigen::Index>(
            std::lower_bound(starts.begin(), starts.end(), pr.period_start) - starts.begin());
        res.decile_returns(row, pr.decile - 1) = pr.portfolio_return;
        if (pr.benchmark_return) {
            bench_by_row[static_cast<std::size_t>(row)] = pr.benchmark_return;
        }
    }

    // ── Per-decile statistics ───────────────────────────────────────────────
    const double ann = periods_per_year(config_.frequency);
    for (int d = 1; d <= n_dec; ++d) {
        std::vector<double> returns;
        double turnover_sum = 0.0;
        double holdings_sum = 0.0;
        for (const auto& pr : period_results) {
            if (pr.decile == d) {
                returns.push_back(pr.portfolio_return);
                turnover_sum += pr.turnover;
                holdings_sum += static_cast<double>(pr.holding_count);
            }
        }

        DecilePerformance perf;
        perf.decile  = d;
        perf.periods = returns.size();
        if (!returns.empty()) {
            const auto count = static_cast<double>(returns.size());
            perf.total_return      = PerformanceCalculator::total_return(returns);
            perf.annualized_return = PerformanceCalculator::annualize(perf.total_return, days);
            perf.sharpe_ratio      = PerformanceCalculator::sharpe(returns, config_.risk_free_rate, ann);
            perf.max_drawdown      = PerformanceCalculator::max_drawdown(returns);
            perf.average_turnover  = turnover_sum / count;
            perf.average_holdings  = holdings_sum / count;
        }
        res.deciles.push_back(perf);
    }

    if (res.periods_run == 0) {
        res.period_results = std::move(period_results);
        return res;
    }

    // ── Spread and monotonicity ─────────────────────────────────────────────
    res.top_bottom_spread = res.deciles.back().annualized_return
                          - res.deciles.front().annualized_return;

    int ordered = 0;
    int pairs   = 0;
    for (int d = 0; d + 1 < n_dec; ++d) {
        if (res.deciles[d].periods == 0 || res.deciles[d + 1].periods == 0) {
            continue;
        }
        ++pairs;
        if (res.deciles[d + 1].annualized_return >= res.deciles[d].annualized_return) {
            ++ordered;
        }
    }
    res.monotonicity = pairs > 0 ? static_cast<double>(ordered) / pairs : 0.0;

    // ── Hit rate: upper half beats lower half ───────────────────────────────
    // Dropped deciles are NaN cells; a row counts only when both halves have
    // at least one return.
    const int half = n_dec / 2;
    int hits    = 0;
    int counted = 0;
    for (Eigen::Index r = 0; r < rows; ++r) {
        const auto lower = finite_mean(res.decile_returns.row(r).head(half));
        const auto upper = finite_mean(res.decile_returns.row(r).tail(n_dec - half));
        if (!lower || !upper) {
            continue;
        }
        ++counted;
        if (*upper > *lower) {
            ++hits;
        }
    }
    res.hit_rate = counted > 0 ? static_cast<double>(hits) / counted : 0.0;

    // ── Top decile versus benchmark ─────────────────────────────────────────
    std::vector<double> top;
    std::vector<double> bench;
    for (Eigen::Index r = 0; r < rows; ++r) {
        const auto& b = bench_by_row[static_cast<std::size_t>(r)];
        const double t = res.decile_returns(r, n_dec - 1);
        if (b && std::isfinite(t)) {
            top.push_back(t);
            bench.push_back(*b);
        }
    }
    if (!bench.empty()) {
        res.information_ratio    = PerformanceCalculator::information_ratio(top, bench);
        res.benchmark_annualized = PerformanceCalculator::annualize(
            PerformanceCalculator::total_return(bench), days);
        res.top_vs_benchmark = res.deciles.back().annualized_return - *res.benchmark_annualized;
    }

    res.period_results = std::move(period_results);
    return res;
}

}  // namespace icscore::backtest
