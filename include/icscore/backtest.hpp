#pragma once

/// @file include/icscore/backtest.hpp
/// @brief Decile Backtester: point-in-time validation of the IC Score.
///
/// # Module: Backtester
///
/// ## Responsibility
/// At each rebalance date, score the universe using only data dated on or
/// before that date, rank tickers by raw score, split them into ten equal
/// buckets, and hold each bucket until the next rebalance date.
///
/// ## Per period
///   decile(rank) = 10 − ⌊rank · 10 / n⌋        rank 0 = highest score
///   r_bucket     = Σ wᵢ (P_end,i / P_start,i − 1) − (cost_bps + slippage_bps) / 10⁴
///   turnover     = 1 − |prev ∩ curr| / max(|prev|, |curr|)   (1.0 first period)
///
/// Fewer than 10 scored tickers: the period is skipped with a warning.
/// A bucket none of whose holdings has prices is dropped for that period.
///
/// ## Aggregate statistics
///   total_return_d      = Π (1 + r) − 1
///   annualized_return_d = (1 + total)^(365.25 / days) − 1
///   sharpe_d            = (mean(r) − r_f) / σ(r) × √periods_per_year
///   max_drawdown_d      = max peak-to-trough loss of the compounded curve
///   spread              = annualized_10 − annualized_1
///   monotonicity        = share of adjacent pairs with annualized_{N+1} ≥ annualized_N
///   hit_rate            = share of periods where mean(r_6..10) > mean(r_1..5)
///   information_ratio   = mean(r_10 − r_bm) / σ(r_10 − r_bm)
///   top_vs_benchmark    = annualized_10 − annualized_bm
///
/// Scores are raw (unsmoothed) so that no period depends on another.
/// Periods are scored concurrently.

#include "icscore/constants.hpp"
#include "icscore/engine.hpp"
#include "icscore/repository.hpp"
#include "icscore/types.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace icscore::backtest {

// ─── Types ────────────────────────────────────────────────────────────────────

enum class RebalanceFrequency {
    Daily,
    Weekly,
    Monthly,
    Quarterly,
};

[[nodiscard]] const char* to_string(RebalanceFrequency f) noexcept;

/// "daily", "weekly", "monthly" or "quarterly".
[[nodiscard]] std::optional<RebalanceFrequency> parse_frequency(std::string_view name) noexcept;

/// Rebalances per year (252 / 52 / 12 / 4).
[[nodiscard]] double periods_per_year(RebalanceFrequency f) noexcept;

enum class Weighting {
    Equal,
    MarketCap,
};

/// Configuration for a backtest run.
struct BacktestConfig {
    RebalanceFrequency frequency            = RebalanceFrequency::Monthly;
    Weighting          weighting            = Weighting::Equal;
    double             transaction_cost_bps = constants::DEFAULT_TRANSACTION_COST_BPS;
    double             slippage_bps         = constants::DEFAULT_SLIPPAGE_BPS;
    double             risk_free_rate       = constants::DEFAULT_RISK_FREE_RATE;
    std::string        benchmark            = "SPY";
    std::size_t        threads              = 0;  ///< 0 = hardware concurrency
};

/// One holding period: bought at the close of `start`, sold at the close of
/// `end`, which is the next rebalance date (or the end of the run).
struct Period {
    Date start{};
    Date end{};
};

/// Result of one decile portfolio over one period.
struct BacktestPeriodResult {
    Date                     period_start{};
    Date                     period_end{};
    int                      decile = 0;  ///< 1..10, 10 = highest scores
    std::vector<std::string> holdings;
    std::size_t              holding_count    = 0;
    double                   portfolio_return = 0.0;  ///< net of costs
    std::optional<double>    benchmark_return;
    std::optional<double>    excess_return;
    double                   average_score = 0.0;
    double                   turnover      = 0.0;
};

/// Aggregate statistics of one decile across all periods.
struct DecilePerformance {
    int                   decile = 0;
    std::size_t           periods = 0;
    double                total_return      = 0.0;
    double                annualized_return = 0.0;
    std::optional<double> sharpe_ratio;
    std::optional<double> max_drawdown;
    double                average_turnover = 0.0;
    double                average_holdings = 0.0;
};

/// Everything a backtest run produces.
struct BacktestResults {
    Date               start{};
    Date               end{};
    RebalanceFrequency frequency = RebalanceFrequency::Monthly;
    std::string        benchmark;

    std::size_t periods_run     = 0;
    std::size_t periods_skipped = 0;

    std::vector<BacktestPeriodResult> period_results;
    std::vector<DecilePerformance>    deciles;  ///< index 0 = decile 1

    /// Net return of each decile (column, decile 1 first) in each run
    /// period (row, chronological).
    Eigen::MatrixXd decile_returns;

    double                top_bottom_spread = 0.0;
    double                monotonicity      = 0.0;
    double                hit_rate          = 0.0;
    std::optional<double> information_ratio;
    std::optional<double> benchmark_annualized;
    std::optional<double> top_vs_benchmark;

    /// Formatted summary table.
    [[nodiscard]] std::string to_string() const;

    /// Column names matching periods_to_csv() rows.
    [[nodiscard]] static std::string period_csv_header();

    /// One line per period result, header first.
    [[nodiscard]] std::string periods_to_csv() const;
};

// ─── PerformanceCalculator ────────────────────────────────────────────────────

/// Stateless utility for computing financial performance metrics.
///
/// All methods are static and operate on `std::span<const double>` for
/// zero-copy access to any contiguous container.
class PerformanceCalculator {
public:
    /// Annualised Sharpe ratio.
    ///
    /// # Formula
    ///   Sharpe = (mean(R) − r_f) / σ(R) × √ann
    ///
    /// # Returns
    /// `nullopt` if series has fewer than 2 elements, σ = 0, or any NaN/Inf.
    [[nodiscard]] static std::optional<double>
    sharpe(std::span<const double> returns,
           double risk_free_rate,
           double annualisation) noexcept;

    /// Maximum drawdown of the compounded equity curve, in [0, 1].
    /// Returns `nullopt` on empty or non-finite input.
    [[nodiscard]] static std::optional<double>
    max_drawdown(std::span<const double> returns) noexcept;

    /// Information ratio of a strategy against a benchmark.
    ///
    /// # Formula
    ///   IR = mean(active) / σ(active),  active_t = strategy_t − benchmark_t
    ///
    /// # Returns
    /// `nullopt` if lengths differ, fewer than 2 periods, or σ = 0.
    [[nodiscard]] static std::optional<double>
    information_ratio(std::span<const double> strategy_returns,
                      std::span<const double> benchmark_returns) noexcept;

    /// Π (1 + r) − 1.
    [[nodiscard]] static double total_return(std::span<const double> returns) noexcept;

    /// (1 + total)^(365.25 / days) − 1.  Returns `total` when days ≤ 0 and
    /// −1 when the total return wipes out the capital.
    [[nodiscard]] static double annualize(double total, int days) noexcept;

private:
    static double mean(std::span<const double> v) noexcept;
    static double stddev(std::span<const double> v, double mean_val) noexcept;
};

// ─── Backtester ───────────────────────────────────────────────────────────────

/// Runs the decile backtest.
///
/// ```cpp
/// BacktestConfig cfg;
/// cfg.frequency = RebalanceFrequency::Quarterly;
/// Backtester bt(repo, engine, cfg);
/// auto results = bt.run(make_date(2020, 1, 1), make_date(2024, 12, 31));
/// fmt::print("{}\n", results.to_string());
/// ```
class Backtester {
public:
    Backtester(const data::MetricRepository& repo,
               const core::ScoringEngine& engine,
               BacktestConfig config = BacktestConfig{});

    /// Run over [start, end] with the configured frequency and benchmark.
    /// Throws LookAheadViolation if any period's scoring touched future data.
    [[nodiscard]] BacktestResults run(Date start, Date end) const;

    /// Holding periods from `start` to `end`.  Each period ends on the next
    /// rebalance date, so consecutive periods share a boundary.  Monthly and
    /// quarterly rebalances fall on the first of the month; the final period
    /// ends at `end`.
    [[nodiscard]] static std::vector<Period>
    generate_periods(Date start, Date end, RebalanceFrequency frequency);

    /// Decile (1..10) of each rank 0..n−1, rank 0 being the highest score.
    [[nodiscard]] static std::vector<int> assign_deciles(std::size_t n);

    /// 1 − |prev ∩ curr| / max(|prev|, |curr|); 1.0 when `previous` is empty.
    [[nodiscard]] static double turnover(const std::vector<std::string>& previous,
                                         const std::vector<std::string>& current);

    /// Summary statistics over period results.
    [[nodiscard]] BacktestResults
    aggregate(std::vector<BacktestPeriodResult> period_results,
              Date start, Date end) const;

    [[nodiscard]] const BacktestConfig& config() const noexcept { return config_; }

private:
    /// Decile results for one period, or empty when the period is skipped.
    [[nodiscard]] std::vector<BacktestPeriodResult> run_period(const Period& period) const;

    /// Weighted forward return of `holdings`, before costs; nullopt when no
    /// holding has prices for the period.
    [[nodiscard]] std::optional<double> forward_return(const std::vector<std::string>& holdings,
                                        const data::MetricRepository& pit,
                                        const Period& period) const;

    /// P_end / P_start − 1 from the unrestricted repository.
    [[nodiscard]] std::optional<double> price_return(const std::string& ticker,
                                                     const Period& period) const;

    const data::MetricRepository& repo_;
    const core::ScoringEngine&    engine_;
    BacktestConfig                config_;
};

}  // namespace icscore::backtest
