#pragma once

#include <cstddef>

/// @file include/icscore/constants.hpp
/// @brief Scoring, smoothing and backtest constants for the IC Score engine.
///
/// Defaults for the configurable values live here; the config structs copy
/// them so a run can override any of them.

namespace icscore::constants {

// ─── Score scale ──────────────────────────────────────────────────────────────

static constexpr double SCORE_MIN     = 0.0;
static constexpr double SCORE_MAX     = 100.0;
static constexpr double SCORE_NEUTRAL = 50.0;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

/// Tolerance for "weights sum to 1.0" checks.
static constexpr double WEIGHT_SUM_TOLERANCE = 1e-9;

// ─── Sector statistics ────────────────────────────────────────────────────────

/// Winsorisation bound in population standard deviations.
static constexpr double WINSOR_SIGMA = 3.0;

/// Below this sample count a sector distribution is flagged degraded.
static constexpr std::size_t MIN_SECTOR_SAMPLE = 5;

// ─── Lifecycle thresholds (percent units) ─────────────────────────────────────

static constexpr double HYPERGROWTH_REVENUE_GROWTH = 50.0;
static constexpr double GROWTH_REVENUE_GROWTH      = 20.0;
static constexpr double TURNAROUND_REVENUE_GROWTH  = -5.0;
static constexpr double VALUE_PE_THRESHOLD         = 12.0;
static constexpr double VALUE_MARGIN_THRESHOLD     = 5.0;

/// P/E assumed when a company reports none.
static constexpr double DEFAULT_PE_RATIO = 20.0;

// ─── Confidence ───────────────────────────────────────────────────────────────

static constexpr double HIGH_CONFIDENCE_COMPLETENESS   = 90.0;
static constexpr double MEDIUM_CONFIDENCE_COMPLETENESS = 70.0;
static constexpr double LOW_CONFIDENCE_COMPLETENESS    = 50.0;

/// Hard floor: available core quality factors required for a score.
static constexpr std::size_t MIN_CORE_QUALITY_FACTORS = 3;

/// Hard floor: available core valuation factors required for a score.
static constexpr std::size_t MIN_CORE_VALUATION_FACTORS = 1;

// ─── Stabilizer ───────────────────────────────────────────────────────────────

/// Weight on the new raw score in the exponential smoother.
static constexpr double SMOOTHING_ALPHA = 0.7;

/// Smaller moves than this keep the previous displayed score.
static constexpr double MIN_SCORE_CHANGE = 0.5;

// ─── Backtester Defaults ──────────────────────────────────────────────────────

/// Number of score buckets per rebalance period.
static constexpr int DECILE_COUNT = 10;

/// Default trading cost per rebalance, basis points.
static constexpr double DEFAULT_TRANSACTION_COST_BPS = 10.0;

/// Default slippage per rebalance, basis points.
static constexpr double DEFAULT_SLIPPAGE_BPS = 5.0;

/// Days per year used to annualise compounded returns.
static constexpr double DAYS_PER_YEAR = 365.25;

/// Minimum periods for a Sharpe ratio or information ratio.
static constexpr std::size_t MIN_RETURN_SERIES_LENGTH = 2;

/// Per-period risk-free rate subtracted in the Sharpe ratio.
static constexpr double DEFAULT_RISK_FREE_RATE = 0.0;

/// Metric used for capitalisation weighting.
static constexpr const char* MARKET_CAP_METRIC = "market_cap";

// ─── Score explanations ───────────────────────────────────────────────────────

/// Smallest factor move, in points, listed as a reason for a score change.
static constexpr double EXPLAIN_SIGNIFICANT_DELTA = 3.0;

/// Factor changes listed per explanation.
static constexpr std::size_t EXPLAIN_MAX_CHANGES = 5;

/// Input age limits, in days, for fresh and recent data.
static constexpr int FRESH_DATA_DAYS  = 1;
static constexpr int RECENT_DATA_DAYS = 7;

/// Inputs older than this are flagged as possibly outdated.
static constexpr int OUTDATED_DATA_DAYS = 30;

}  // namespace icscore::constants
