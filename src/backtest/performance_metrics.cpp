/// @file src/backtest/performance_metrics.cpp
/// @brief PerformanceCalculator and BacktestResults formatting.
///
/// Fallible paths return std::nullopt; no function here throws.

#include "icscore/backtest.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace icscore::backtest {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

/// Return false if any element of `v` is NaN or ±Inf.
[[nodiscard]] bool all_finite(std::span<const double> v) noexcept {
    for (double x : v) {
        if (!std::isfinite(x)) return false;
    }
    return true;
}

std::string opt_pct(const std::optional<double>& v) {
    return v ? fmt::format("{:+8.2f}%", *v * 100.0) : std::string{"     n/a "};
}

std::string opt_num(const std::optional<double>& v) {
    return v ? fmt::format("{:8.3f}", *v) : std::string{"     n/a"};
}

}  // namespace

// ─── Frequency ────────────────────────────────────────────────────────────────

const char* to_string(RebalanceFrequency f) noexcept {
    switch (f) {
        case RebalanceFrequency::Daily:     return "daily";
        case RebalanceFrequency::Weekly:    return "weekly";
        case RebalanceFrequency::Monthly:   return "monthly";
        case RebalanceFrequency::Quarterly: return "quarterly";
    }
    return "unknown";
}

std::optional<RebalanceFrequency> parse_frequency(std::string_view name) noexcept {
    if (name == "daily")     return RebalanceFrequency::Daily;
    if (name == "weekly")    return RebalanceFrequency::Weekly;
    if (name == "monthly")   return RebalanceFrequency::Monthly;
    if (name == "quarterly") return RebalanceFrequency::Quarterly;
    return std::nullopt;
}

double periods_per_year(RebalanceFrequency f) noexcept {
    switch (f) {
        case RebalanceFrequency::Daily:     return 252.0;
        case RebalanceFrequency::Weekly:    return 52.0;
        case RebalanceFrequency::Monthly:   return 12.0;
        case RebalanceFrequency::Quarterly: return 4.0;
    }
    return 12.0;
}

// ─── PerformanceCalculator: private statics ──────────────────────────────────

double PerformanceCalculator::mean(std::span<const double> v) noexcept {
    // Unchecked: caller guarantees non-empty, finite.
    const double sum = std::accumulate(v.begin(), v.end(), 0.0);
    return sum / static_cast<double>(v.size());
}

double PerformanceCalculator::stddev(std::span<const double> v,
                                     double mean_val) noexcept {
    // Sample std-dev (Bessel-corrected, n−1 denominator).
    // Caller guarantees v.size() >= 2.
    double sq_sum = 0.0;
    for (double x : v) {
        const double d = x - mean_val;
        sq_sum += d * d;
    }
    return std::sqrt(sq_sum / static_cast<double>(v.size() - 1));
}

// ─── PerformanceCalculator: Sharpe ──────────────────────────────────────────

std::optional<double>
PerformanceCalculator::sharpe(std::span<const double> returns,
                              double risk_free_rate,
                              double annualisation) noexcept {
    if (returns.size() < constants::MIN_RETURN_SERIES_LENGTH) return std::nullopt;
    if (!all_finite(returns))                                  return std::nullopt;
    if (!std::isfinite(risk_free_rate))                        return std::nullopt;
    if (annualisation <= 0.0)                                  return std::nullopt;

    const double mu = mean(returns);
    const double sd = stddev(returns, mu);

    if (sd <= 0.0) return std::nullopt;  // zero variance, ratio undefined

    return (mu - risk_free_rate) / sd * std::sqrt(annualisation);
}

// ─── PerformanceCalculator: MaxDrawdown ──────────────────────────────────────

std::optional<double>
PerformanceCalculator::max_drawdown(std::span<const double> returns) noexcept {
    if (returns.empty())         return std::nullopt;
    if (!all_finite(returns))    return std::nullopt;

    double equity  = 1.0;
    double peak    = 1.0;
    double max_dd  = 0.0;

    for (double r : returns) {
        equity *= (1.0 + r);
        if (equity > peak) {
            peak = equity;
        } else if (peak > 0.0) {
            const double dd = (peak - equity) / peak;
            if (dd > max_dd) max_dd = dd;
        }
    }
    return std::min(max_dd, 1.0);
}

// ─── PerformanceCalculator: Information ratio ───────────────────────────────

std::optional<double>
PerformanceCalculator::information_ratio(std::span<const double> strategy_returns,
                                         std::span<const double> benchmark_returns) noexcept {
    const std::size_t n = strategy_returns.size();
    if (n < constants::MIN_RETURN_SERIES_LENGTH)  return std::nullopt;
    if (benchmark_returns.size() != n)             return std::nullopt;
    if (!all_finite(strategy_returns))             return std::nullopt;
    if (!all_finite(benchmark_returns))            return std::nullopt;

    std::vector<double> active(n);
    for (std::size_t i = 0; i < n; ++i) {
        active[i] = strategy_returns[i] - benchmark_returns[i];
    }

    const double mu_active = mean(active);
    const double sd_active = stddev(active, mu_active);
    if (sd_active <= 0.0) return std::nullopt;

    return mu_active / sd_active;
}

// ─── PerformanceCalculator: compounding ─────────────────────────────────────

double PerformanceCalculator::total_return(std::span<const double> returns) noexcept {
    double growth = 1.0;
    for (double r : returns) {
        growth *= (1.0 + r);
    }
    return growth - 1.0;
}

double PerformanceCalculator::annualize(double total, int days) noexcept {
    if (days <= 0) return total;
    if (total <= -1.0) return -1.0;
    const double years = static_cast<double>(days) / constants::DAYS_PER_YEAR;
    return std::pow(1.0 + total, 1.0 / years) - 1.0;
}

// ─── BacktestResults ─────────────────────────────────────────────────────────

std::string BacktestResults::to_string() const {
    std::string out = fmt::format(
        "IC Score decile backtest  {} .. {}  ({}, benchmark {})\n"
        "periods run {}  skipped {}\n\n"
        "decile  periods   total      annual     sharpe   max_dd   turnover  holdings\n",
        icscore::to_string(start), icscore::to_string(end),
        backtest::to_string(frequency), benchmark.empty() ? "none" : benchmark,
        periods_run, periods_skipped);

    for (const auto& d : deciles) {
        out += fmt::format("{:>6}  {:>7}  {} {}  {} {}  {:8.2f}  {:8.1f}\n",
                           d.decile, d.periods,
                           opt_pct(d.total_return), opt_pct(d.annualized_return),
                           opt_num(d.sharpe_ratio), opt_pct(d.max_drawdown),
                           d.average_turnover, d.average_holdings);
    }

    out += fmt::format(
        "\ntop-bottom spread (D10-D1, annual) {}\n"
        "monotonicity                       {:8.2f}\n"
        "hit rate (D6-10 > D1-5)            {:8.2f}\n"
        "information ratio (D10 vs bench)   {}\n"
        "benchmark annual                   {}\n"
        "top vs benchmark (annual)          {}\n",
        opt_pct(top_bottom_spread), monotonicity, hit_rate,
        opt_num(information_ratio), opt_pct(benchmark_annualized),
        opt_pct(top_vs_benchmark));
    return out;
}

std::string BacktestResults::period_csv_header() {
    return "period_start,period_end,decile,holding_count,portfolio_return,"
           "benchmark_return,excess_return,average_score,turnover,holdings";
}

std::string BacktestResults::periods_to_csv() const {
    const auto opt = [](const std::optional<double>& v) {
        return v ? fmt::format("{:.6f}", *v) : std::string{};
    };
    std::string out = period_csv_header() + "\n";
    for (const auto& p : period_results) {
        out += fmt::format("{},{},{},{},{:.6f},{},{},{:.2f},{:.4f},{}\n",
                           icscore::to_string(p.period_start),
                           icscore::to_string(p.period_end),
                           p.decile, p.holding_count, p.portfolio_return,
                           opt(p.benchmark_return), opt(p.excess_return),
                           p.average_score, p.turnover,
                           fmt::join(p.holdings, " "));
    }
    return out;
}

}  // namespace icscore::backtest
