#pragma once

/// @file include/icscore/sector_stats.hpp
/// @brief Sector Statistics Engine: per (sector, metric) percentile
///        distributions and percentile lookup.
///
/// # Module: Sector Statistics
///
/// ## Responsibility
/// Turn the daily population of a metric inside one sector into an immutable
/// distribution summary, and map a raw value onto that summary as a 0–100
/// percentile.
///
/// ## Algorithm
/// 1. Drop missing / non-finite values.
/// 2. Winsorise: clip every value to mean ± 3σ (population σ).
/// 3. Compute min, p10, p25, p50, p75, p90, max, mean, σ of the clipped
///    sample. Percentiles use linear interpolation between order statistics:
///      pos = p/100 · (n − 1),  q = x[⌊pos⌋] + frac(pos) · (x[⌊pos⌋+1] − x[⌊pos⌋])
///
/// ## Percentile lookup
/// Piecewise-linear over the breakpoints
///   (min,0) (p10,10) (p25,25) (p50,50) (p75,75) (p90,90) (max,100)
/// Values at or below min map to 0, at or above max to 100.  A zero-width
/// segment yields its lower percentile.
///
/// ## Guarantees
/// - Deterministic: identical input produces bit-identical output
/// - Direction-agnostic: callers invert (100 − p) for lower-is-better metrics
/// - SectorContext is immutable after construction and safe to share across
///   threads

#include "icscore/constants.hpp"
#include "icscore/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace icscore::stats {

// ─── SectorMetricDistribution ─────────────────────────────────────────────────

/// Distribution summary of one metric across one sector on one date.
struct SectorMetricDistribution {
    std::string sector;
    std::string metric;
    Date        as_of{};

    double min_value = 0.0;
    double p10       = 0.0;
    double p25       = 0.0;
    double p50       = 0.0;
    double p75       = 0.0;
    double p90       = 0.0;
    double max_value = 0.0;
    double mean      = 0.0;
    double std_dev   = 0.0;

    std::size_t sample_count = 0;

    /// Sample smaller than the configured minimum; lookups are reduced-reliability.
    bool degraded = true;
};

// ─── SectorContext ────────────────────────────────────────────────────────────

/// The full, immutable set of distributions for one scoring date.
///
/// Built once per date before any ticker is scored and then passed by
/// const-reference through the whole pipeline.
class SectorContext {
public:
    using Key = std::pair<std::string, std::string>;  ///< (sector, metric)

    SectorContext() = default;
    SectorContext(Date as_of, std::map<Key, SectorMetricDistribution> distributions);

    /// Distribution for (sector, metric), or nullptr when none was built.
    [[nodiscard]] const SectorMetricDistribution*
    find(const std::string& sector, const std::string& metric) const noexcept;

    [[nodiscard]] Date        as_of() const noexcept { return as_of_; }
    [[nodiscard]] std::size_t size()  const noexcept { return distributions_.size(); }
    [[nodiscard]] bool        empty() const noexcept { return distributions_.empty(); }

private:
    Date                                    as_of_{};
    std::map<Key, SectorMetricDistribution> distributions_;
};

// ─── SectorStatisticsEngine ───────────────────────────────────────────────────

/// Builds sector distributions and answers percentile queries.
class SectorStatisticsEngine {
public:
    /// Construct with the degraded-sample threshold.
    explicit SectorStatisticsEngine(
        std::size_t min_sample_count = constants::MIN_SECTOR_SAMPLE) noexcept;

    /// Compute the winsorised distribution of `values`.
    ///
    /// Missing (`nullopt`) and non-finite entries are excluded from the sample.
    /// An empty sample yields an all-zero distribution with `sample_count == 0`
    /// and `degraded == true`.
    [[nodiscard]] SectorMetricDistribution
    compute_distribution(const std::string& sector,
                         const std::string& metric,
                         Date as_of,
                         std::span<const std::optional<double>> values) const;

    /// Position of `value` within `dist`, in [0, 100].
    /// Returns `nullopt` only when `value` is non-finite.
    [[nodiscard]] static std::optional<double>
    percentile_of(const SectorMetricDistribution& dist, double value) noexcept;

    /// Daily precomputation: one distribution per sector × tracked metric.
    ///
    /// # Arguments
    /// * `as_of`             : date stamped on every distribution
    /// * `universe_by_sector`: sector → snapshots of its active companies
    /// * `tracked_metrics`   : metric names to summarise
    [[nodiscard]] SectorContext
    build_context(Date as_of,
                  const std::map<std::string, std::vector<MetricsSnapshot>>& universe_by_sector,
                  std::span<const std::string> tracked_metrics) const;

    [[nodiscard]] std::size_t min_sample_count() const noexcept { return min_sample_count_; }

private:
    /// Linear-interpolated percentile of an ascending, non-empty sample.
    static double quantile(std::span<const double> sorted, double pct) noexcept;

    std::size_t min_sample_count_;
};

/// Metric names summarised by the daily sector precomputation.
[[nodiscard]] const std::vector<std::string>& tracked_metrics();

}  // namespace icscore::stats
