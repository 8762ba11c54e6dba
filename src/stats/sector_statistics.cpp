/// @file src/stats/sector_statistics.cpp
/// @brief SectorStatisticsEngine: winsorised sector distributions and
///        piecewise-linear percentile lookup.
///
/// compute_distribution():
///   1. Filters missing / non-finite values
///   2. Computes population mean and σ of the raw sample
///   3. Clips every value into [mean − 3σ, mean + 3σ]
///   4. Sorts the clipped sample and reads the order statistics

#include "icscore/sector_stats.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <numeric>

namespace icscore::stats {

namespace {

/// Mean of all values in v. Precondition: v is non-empty.
double sample_mean(std::span<const double> v) noexcept {
    const double sum = std::accumulate(v.begin(), v.end(), 0.0);
    return sum / static_cast<double>(v.size());
}

/// Population std-dev (n denominator). Returns 0.0 for fewer than 2 values.
double population_stddev(std::span<const double> v, double mean) noexcept {
    if (v.size() < 2) {
        return 0.0;
    }
    double sq_sum = 0.0;
    for (double x : v) {
        const double d = x - mean;
        sq_sum += d * d;
    }
    return std::sqrt(sq_sum / static_cast<double>(v.size()));
}

}  // namespace

// ─── SectorContext ────────────────────────────────────────────────────────────

SectorContext::SectorContext(Date as_of,
                             std::map<Key, SectorMetricDistribution> distributions)
    : as_of_(as_of)
    , distributions_(std::move(distributions)) {}

const SectorMetricDistribution*
SectorContext::find(const std::string& sector, const std::string& metric) const noexcept {
    const auto it = distributions_.find(Key{sector, metric});
    if (it == distributions_.end()) {
        return nullptr;
    }
    return &it->second;
}

// ─── Constructor ──────────────────────────────────────────────────────────────

SectorStatisticsEngine::SectorStatisticsEngine(std::size_t min_sample_count) noexcept
    : min_sample_count_(min_sample_count) {}

// ─── quantile ─────────────────────────────────────────────────────────────────

double SectorStatisticsEngine::quantile(std::span<const double> sorted,
                                        double pct) noexcept {
    // Precondition: sorted is non-empty and ascending.
    if (sorted.size() == 1) {
        return sorted.front();
    }
    const double pos   = pct / 100.0 * static_cast<double>(sorted.size() - 1);
    const auto   lower = static_cast<std::size_t>(std::floor(pos));
    const std::size_t upper = std::min(lower + 1, sorted.size() - 1);
    const double frac  = pos - static_cast<double>(lower);
    // std::lerp stays within [sorted[lower], sorted[upper]], so breakpoints
    // taken from the same sample remain ordered.
    return std::lerp(sorted[lower], sorted[upper], frac);
}

// ─── compute_distribution ─────────────────────────────────────────────────────

SectorMetricDistribution
SectorStatisticsEngine::compute_distribution(
        const std::string& sector,
        const std::string& metric,
        Date as_of,
        std::span<const std::optional<double>> values) const {
    SectorMetricDistribution dist{
        .sector = sector,
        .metric = metric,
        .as_of  = as_of,
    };

    std::vector<double> sample;
    sample.reserve(values.size());
    for (const auto& v : values) {
        if (v.has_value() && std::isfinite(*v)) {
            sample.push_back(*v);
        }
    }

    dist.sample_count = sample.size();
    dist.degraded     = sample.size() < min_sample_count_;

    if (sample.empty()) {
        return dist;
    }

    // ── Winsorise at mean ± WINSOR_SIGMA · σ ─────────────────────────────────
    const double raw_mean = sample_mean(sample);
    const double raw_sd   = population_stddev(sample, raw_mean);
    if (raw_sd > 0.0) {
        const double lo = raw_mean - constants::WINSOR_SIGMA * raw_sd;
        const double hi = raw_mean + constants::WINSOR_SIGMA * raw_sd;
        for (double& x : sample) {
            x = std::clamp(x, lo, hi);
        }
    }

    std::sort(sample.begin(), sample.end());

    dist.min_value = sample.front();
    dist.p10       = quantile(sample, 10.0);
    dist.p25       = quantile(sample, 25.0);
    dist.p50       = quantile(sample, 50.0);
    dist.p75       = quantile(sample, 75.0);
    dist.p90       = quantile(sample, 90.0);
    dist.max_value = sample.back();
    dist.mean      = sample_mean(sample);
    dist.std_dev   = population_stddev(sample, dist.mean);

    return dist;
}

// ─── percentile_of ────────────────────────────────────────────────────────────

std::optional<double>
SectorStatisticsEngine::percentile_of(const SectorMetricDistribution& dist,
                                      double value) noexcept {
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    if (value <= dist.min_value) return 0.0;
    if (value >= dist.max_value) return 100.0;

    const std::array<std::pair<double, double>, 7> breakpoints{{
        {dist.min_value, 0.0},
        {dist.p10,       10.0},
        {dist.p25,       25.0},
        {dist.p50,       50.0},
        {dist.p75,       75.0},
        {dist.p90,       90.0},
        {dist.max_value, 100.0},
    }};

    for (std::size_t i = 0; i + 1 < breakpoints.size(); ++i) {
        const auto [low_val, low_pct]   = breakpoints[i];
        const auto [high_val, high_pct] = breakpoints[i + 1];
        if (value >= low_val && value <= high_val) {
            const double width = high_val - low_val;
            if (width <= 0.0) {
                return low_pct;  // flat segment
            }
            return low_pct + (high_pct - low_pct) * (value - low_val) / width;
        }
    }

    // Unreachable for a well-formed (non-decreasing) distribution.
    return constants::SCORE_NEUTRAL;
}

// ─── build_context ────────────────────────────────────────────────────────────

SectorContext
SectorStatisticsEngine::build_context(
        Date as_of,
        const std::map<std::string, std::vector<MetricsSnapshot>>& universe_by_sector,
        std::span<const std::string> metrics) const {
    std::map<SectorContext::Key, SectorMetricDistribution> out;

    std::vector<std::optional<double>> column;
    for (const auto& [sector, snapshots] : universe_by_sector) {
        for (const auto& metric : metrics) {
            column.clear();
            column.reserve(snapshots.size());
            for (const auto& snap : snapshots) {
                column.push_back(snap.get(metric));
            }

            auto dist = compute_distribution(sector, metric, as_of, column);
            if (dist.sample_count == 0) {
                continue;
            }
            if (dist.degraded) {
                spdlog::debug("sector stats {}/{}: only {} samples, flagged degraded",
                              sector, metric, dist.sample_count);
            }
            out.emplace(SectorContext::Key{sector, metric}, std::move(dist));
        }
    }

    return SectorContext(as_of, std::move(out));
}

// ─── tracked_metrics ──────────────────────────────────────────────────────────

const std::vector<std::string>& tracked_metrics() {
    static const std::vector<std::string> metrics{
        // Growth
        "revenue_growth_yoy", "eps_growth_yoy", "fcf_growth_yoy",
        // Profitability
        "net_margin", "roe", "roa", "gross_margin", "operating_margin",
        // Financial health
        "debt_to_equity", "interest_coverage", "quick_ratio",
        // Valuation (lower is better)
        "pe_ratio", "ps_ratio", "pb_ratio", "ev_ebitda", "peg_ratio",
        // Yield
        "fcf_yield", "dividend_yield",
        // Price
        "return_1m", "return_3m", "return_6m", "return_12m", "macd_histogram",
    };
    return metrics;
}

}  // namespace icscore::stats
