#pragma once

/// @file include/icscore/factors.hpp
/// @brief Factor Calculators: the twelve IC Score factors behind one
///        abstract interface, and the registry that holds them.
///
/// # Module: Factors
///
/// ## Responsibility
/// Turn a MetricsSnapshot plus the day's SectorContext into one FactorResult
/// per factor.  Each factor is a weighted blend of named sub-metrics; each
/// sub-metric becomes a 0–100 score (normally its sector percentile) before
/// blending.
///
/// ## Uniform policies
/// - Missing sub-metric: dropped, remaining weights renormalised
///     score = Σ wᵢ sᵢ / Σ wᵢ   over available i
/// - No sub-metric available: the factor is NotComputable (`score` empty).
///   A midpoint is never substituted.
/// - Lower-is-better metrics (P/E, P/S, P/B, EV/EBITDA, PEG, D/E) score
///   100 − percentile.
/// - A degraded sector distribution marks the factor `reduced_reliability`.
///
/// ## Snapshot metric names read by the calculators (beyond the sector-tracked
/// ## set in sector_stats.hpp)
///   eps_ttm, eps_ttm_prior, current_ratio, payout_ratio, dividend_growth_5y,
///   dividend_streak_years, fair_value, current_price, analyst_buy,
///   analyst_hold, analyst_sell, insider_net_shares_90d, institutional_shares,
///   institutional_shares_prior, eps_estimate_current, eps_estimate_30d,
///   eps_estimate_60d, eps_estimate_90d, estimate_upgrades_90d,
///   estimate_downgrades_90d, revision_pct_30d, revision_pct_90d, rsi_14,
///   sma_50, sma_200, news_sentiment, article_count, positive_articles
///
/// ## Guarantees
/// - Calculators are stateless; `calculate()` is const and thread-safe
/// - `score`, when present, lies in [0, 100]

#include "icscore/constants.hpp"
#include "icscore/sector_stats.hpp"
#include "icscore/types.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace icscore::factors {

// ─── FactorResult ─────────────────────────────────────────────────────────────

/// One input to a factor: the raw value and, when a sector distribution was
/// available, its sector percentile.
struct SupportingMetric {
    double                raw_value = 0.0;
    std::optional<double> percentile;
};

/// Output of one factor calculator for one ticker on one date.
struct FactorResult {
    std::string name;
    Category    category = Category::Quality;

    /// 0–100, or empty when NotComputable.
    std::optional<double> score;

    /// Nominal (base) weight of the factor.
    double weight = 0.0;

    std::map<std::string, SupportingMetric> supporting;

    /// At least one scored input was present.  False when the factor does not
    /// apply to the company (a non-payer under dividend quality).
    bool data_available = false;

    /// A degraded sector distribution contributed to the score.
    bool reduced_reliability = false;

    /// Newest observation date among the recorded inputs, when the snapshot
    /// carried observation dates.
    std::optional<Date> data_as_of;

    [[nodiscard]] bool computable() const noexcept { return score.has_value(); }
};

// ─── Scoring helpers ──────────────────────────────────────────────────────────

/// Direction of a percentile-scored metric.
enum class Direction {
    HigherIsBetter,
    LowerIsBetter,
};

/// A sub-metric score and its weight inside a factor.
struct Component {
    std::optional<double> score;
    double                weight = 0.0;
};

/// Weighted average over the components that have a score, with the weights
/// renormalised across those components.
/// Returns `nullopt` when no component has a score or all their weights are 0.
[[nodiscard]] std::optional<double>
weighted_blend(std::span<const Component> components) noexcept;

/// Map `value` linearly so that `at_zero` → 0 and `at_hundred` → 100,
/// clamped to [0, 100].  `at_zero` may exceed `at_hundred` for inverted scales.
[[nodiscard]] double linear_score(double value, double at_zero, double at_hundred) noexcept;

/// Triangular optimal-range score: 100 at `peak`, falling linearly to 0 at
/// `low` and at `high`, and 0 outside [low, high].
[[nodiscard]] double triangular_score(double value, double low, double peak, double high) noexcept;

/// Clamp to the score scale [0, 100].
[[nodiscard]] double clamp_score(double value) noexcept;

// ─── FactorBuilder ────────────────────────────────────────────────────────────

/// Accumulates sub-metrics for one factor and produces its FactorResult.
///
/// ```cpp
/// FactorBuilder b(*this, snap, ctx);
/// b.percentile("roe", 0.25);
/// b.percentile("debt_to_equity", 0.35, Direction::LowerIsBetter);
/// b.scored("current_ratio", cr, triangular_score(*cr, 0.5, 2.0, 4.0), 0.25);
/// return b.finish();
/// ```
class FactorCalculator;

class FactorBuilder {
public:
    FactorBuilder(const FactorCalculator& calculator,
                  const MetricsSnapshot& snapshot,
                  const stats::SectorContext& context);

    /// Score snapshot metric `metric` by its sector percentile.
    FactorBuilder& percentile(const std::string& metric, double weight,
                              Direction direction = Direction::HigherIsBetter);

    /// Score an explicit raw value by the sector percentile of `metric`.
    /// A missing `raw` drops the sub-metric.
    FactorBuilder& percentile_of(const std::string& metric, std::optional<double> raw,
                                 double weight,
                                 Direction direction = Direction::HigherIsBetter);

    /// Add a sub-metric the caller has already scored.  Drops it when either
    /// `raw` or `score` is missing.
    FactorBuilder& scored(const std::string& name, std::optional<double> raw,
                          std::optional<double> score, double weight);

    /// Record a raw input that does not contribute to the blend.
    FactorBuilder& note(const std::string& name, std::optional<double> raw);

    [[nodiscard]] const MetricsSnapshot& snapshot() const noexcept { return snapshot_; }

    /// Blend the accumulated components.
    [[nodiscard]] FactorResult finish() const;

private:
    /// Supporting entry for `name` holding `raw`; tracks the input's date.
    SupportingMetric& record_input(const std::string& name, double raw);

    const MetricsSnapshot&      snapshot_;
    const stats::SectorContext& context_;
    FactorResult                result_;
    std::vector<Component>      components_;
};

// ─── FactorCalculator ─────────────────────────────────────────────────────────

/// Shared capability of every factor.
class FactorCalculator {
public:
    virtual ~FactorCalculator() = default;

    [[nodiscard]] virtual std::string name()        const = 0;
    [[nodiscard]] virtual Category    category()    const noexcept = 0;
    [[nodiscard]] virtual double      base_weight() const noexcept = 0;

    /// Optional factors do not count against completeness when NotComputable.
    [[nodiscard]] virtual bool is_optional() const noexcept { return false; }

    /// Compute the factor.  Never throws for missing data; an empty `score`
    /// signals NotComputable.
    [[nodiscard]] virtual FactorResult
    calculate(const MetricsSnapshot& snapshot,
              const stats::SectorContext& context) const = 0;
};

// ─── Quality ──────────────────────────────────────────────────────────────────

/// Revenue, EPS and FCF growth.  A negative → positive EPS transition scores
/// the 100th percentile.
class GrowthFactor final : public FactorCalculator {
public:
    std::string name() const override { return "growth"; }
    Category category() const noexcept override { return Category::Quality; }
    double base_weight() const noexcept override { return 0.12; }
    FactorResult calculate(const MetricsSnapshot& snapshot,
                           const stats::SectorContext& context) const override;
};

class ProfitabilityFactor final : public FactorCalculator {
public:
    std::string name() const override { return "profitability"; }
    Category category() const noexcept override { return Category::Quality; }
    double base_weight() const noexcept override { return 0.11; }
    FactorResult calculate(const MetricsSnapshot& snapshot,
                           const stats::SectorContext& context) const override;
};

/// Leverage, liquidity and coverage.  Current ratio is scored on a
/// triangle over 0.5 / 2.0 / 4.0.
class FinancialHealthFactor final : public FactorCalculator {
public:
    std::string name() const override { return "financial_health"; }
    Category category() const noexcept override { return Category::Quality; }
    double base_weight() const noexcept override { return 0.09; }
    FactorResult calculate(const MetricsSnapshot& snapshot,
                           const stats::SectorContext& context) const override;
};

/// Yield, payout sustainability, growth and streak.  NotComputable for
/// companies yielding under 0.5 %.
class DividendQualityFactor final : public FactorCalculator {
public:
    static constexpr double MIN_YIELD_PCT = 0.5;

    std::string name() const override { return "dividend_quality"; }
    Category category() const noexcept override { return Category::Quality; }
    double base_weight() const noexcept override { return 0.04; }
    bool is_optional() const noexcept override { return true; }
    FactorResult calculate(const MetricsSnapshot& snapshot,
                           const stats::SectorContext& context) const override;

    /// Streak of consecutive years of dividend growth → 0–100.
    [[nodiscard]] static double streak_score(double years) noexcept;
};

// ─── Valuation ────────────────────────────────────────────────────────────────

/// Relative multiples; all lower-is-better; non-positive ratios are missing.
class ValueFactor final : public FactorCalculator {
public:
    std::string name() const override { return "value"; }
    Category category() const noexcept override { return Category::Valuation; }
    double base_weight() const noexcept override { return 0.11; }
    FactorResult calculate(const MetricsSnapshot& snapshot,
                           const stats::SectorContext& context) const override;
};

/// Upside to modelled fair value plus free-cash-flow yield.
class IntrinsicValueFactor final : public FactorCalculator {
public:
    std::string name() const override { return "intrinsic_value"; }
    Category category() const noexcept override { return Category::Valuation; }
    double base_weight() const noexcept override { return 0.09; }
    FactorResult calculate(const MetricsSnapshot& snapshot,
                           const stats::SectorContext& context) const override;
};

/// Current P/E and P/S against the company's own five-year monthly history.
class HistoricalValueFactor final : public FactorCalculator {
public:
    static constexpr std::size_t MIN_HISTORY_POINTS = 12;

    std::string name() const override { return "historical_value"; }
    Category category() const noexcept override { return Category::Valuation; }
    double base_weight() const noexcept override { return 0.07; }
    FactorResult calculate(const MetricsSnapshot& snapshot,
                           const stats::SectorContext& context) const override;

    /// Share of the positive points of `history` strictly below `current`,
    /// ×100.  `nullopt` when fewer than MIN_HISTORY_POINTS are positive.
    [[nodiscard]] static std::optional<double>
    own_percentile(std::span<const double> history, double current) noexcept;
};

// ─── Signals ──────────────────────────────────────────────────────────────────

class MomentumFactor final : public FactorCalculator {
public:
    std::string name() const override { return "momentum"; }
    Category category() const noexcept override { return Category::Signals; }
    double base_weight() const noexcept override { return 0.09; }
    FactorResult calculate(const MetricsSnapshot& snapshot,
                           const stats::SectorContext& context) const override;
};

/// Analyst consensus, insider net buying, institutional holdings change.
class SmartMoneyFactor final : public FactorCalculator {
public:
    std::string name() const override { return "smart_money"; }
    Category category() const noexcept override { return Category::Signals; }
    double base_weight() const noexcept override { return 0.09; }
    FactorResult calculate(const MetricsSnapshot& snapshot,
                           const stats::SectorContext& context) const override;
};

/// Magnitude, breadth and recency of consensus EPS estimate revisions.
class EarningsRevisionsFactor final : public FactorCalculator {
public:
    std::string name() const override { return "earnings_revisions"; }
    Category category() const noexcept override { return Category::Signals; }
    double base_weight() const noexcept override { return 0.08; }
    FactorResult calculate(const MetricsSnapshot& snapshot,
                           const stats::SectorContext& context) const override;
};

class TechnicalFactor final : public FactorCalculator {
public:
    std::string name() const override { return "technical"; }
    Category category() const noexcept override { return Category::Signals; }
    double base_weight() const noexcept override { return 0.06; }
    FactorResult calculate(const MetricsSnapshot& snapshot,
                           const stats::SectorContext& context) const override;
};

/// News sentiment.  Requires at least one article.
class SentimentFactor final : public FactorCalculator {
public:
    std::string name() const override { return "sentiment"; }
    Category category() const noexcept override { return Category::Signals; }
    double base_weight() const noexcept override { return 0.05; }
    FactorResult calculate(const MetricsSnapshot& snapshot,
                           const stats::SectorContext& context) const override;
};

// ─── FactorRegistry ───────────────────────────────────────────────────────────

/// Name → calculator.  The aggregator and engine iterate the registry and
/// never branch on a factor's name.
class FactorRegistry {
public:
    FactorRegistry() = default;

    /// Registry holding all twelve IC Score factors.
    [[nodiscard]] static FactorRegistry with_default_factors();

    /// Add a calculator.  Returns false (and drops it) on a duplicate name.
    bool add(std::unique_ptr<FactorCalculator> calculator);

    /// Calculator named `name`, or nullptr.
    [[nodiscard]] const FactorCalculator* find(const std::string& name) const noexcept;

    /// Base weight of every registered factor.
    [[nodiscard]] std::map<std::string, double> base_weights() const;

    /// Factor name → category.
    [[nodiscard]] std::map<std::string, Category> categories() const;

    /// Names of the optional factors.
    [[nodiscard]] std::vector<std::string> optional_factors() const;

    /// Run every calculator, in registration order.
    [[nodiscard]] std::vector<FactorResult>
    calculate_all(const MetricsSnapshot& snapshot,
                  const stats::SectorContext& context) const;

    [[nodiscard]] std::size_t size() const noexcept { return calculators_.size(); }

    [[nodiscard]] auto begin() const noexcept { return calculators_.begin(); }
    [[nodiscard]] auto end()   const noexcept { return calculators_.end(); }

private:
    std::vector<std::unique_ptr<FactorCalculator>> calculators_;
};

}  // namespace icscore::factors
