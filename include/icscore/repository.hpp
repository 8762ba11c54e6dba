#pragma once

/// @file include/icscore/repository.hpp
/// @brief Metric repository interface, the in-memory implementation, and the
///        point-in-time guard used by the backtester.
///
/// # Module: Repository
///
/// ## Responsibility
/// Answer "what was known about X on date D" and nothing later.  Every query
/// carries an explicit `as_of`; implementations must not return data dated
/// after it.
///
/// ## Errors
/// - `RepositoryError`   : the data source failed or does not know a ticker.
///                          Callers treat it as missing data for that ticker.
/// - `LookAheadViolation`: a query or a result crossed the point-in-time
///                          cutoff.  Never caught by the engine.

#include "icscore/types.hpp"

#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace icscore::data {

// ─── Errors ───────────────────────────────────────────────────────────────────

/// Data-source failure for one query.
class RepositoryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A query asked for, or would have returned, data from after the cutoff.
class LookAheadViolation : public std::logic_error {
public:
    LookAheadViolation(const std::string& what, Date cutoff, Date requested);

    [[nodiscard]] Date cutoff()    const noexcept { return cutoff_; }
    [[nodiscard]] Date requested() const noexcept { return requested_; }

private:
    Date cutoff_;
    Date requested_;
};

// ─── MetricRepository ─────────────────────────────────────────────────────────

/// Read-only, as-of-aware source of metrics, prices and events.
class MetricRepository {
public:
    virtual ~MetricRepository() = default;

    /// Sectors with at least one active company on `as_of`.
    [[nodiscard]] virtual std::vector<std::string> sectors(Date as_of) const = 0;

    /// Snapshots of every active company in `sector` on `as_of`.
    [[nodiscard]] virtual std::vector<MetricsSnapshot>
    sector_universe(const std::string& sector, Date as_of) const = 0;

    /// Snapshot of one ticker.  Throws RepositoryError for an unknown ticker.
    [[nodiscard]] virtual MetricsSnapshot
    ticker_fundamentals(const std::string& ticker, Date as_of) const = 0;

    /// Events for `ticker` dated in (since, as_of].
    [[nodiscard]] virtual std::vector<ScoreEvent>
    events_since(const std::string& ticker, Date since, Date as_of) const = 0;

    /// Latest close dated ≤ `as_of`, or `nullopt` when none.
    [[nodiscard]] virtual std::optional<double>
    price(const std::string& ticker, Date as_of) const = 0;
};

// ─── InMemoryRepository ───────────────────────────────────────────────────────

/// Repository over observations held in memory, typically loaded from CSV.
///
/// Each metric carries its latest observation dated ≤ `as_of` forward,
/// bounded by `max_staleness_days`.  A company is active on `as_of` when it
/// has at least one such observation.  The snapshot's `as_of` is the date of
/// the newest observation used.
///
/// Valuation history (`pe_ratio`, `ps_ratio`) covers the five years before
/// `as_of`, one point per calendar month (the month's last observation).
///
/// Not thread-safe for writers; concurrent const queries are safe once
/// loading has finished.
class InMemoryRepository final : public MetricRepository {
public:
    static constexpr int DEFAULT_MAX_STALENESS_DAYS = 400;
    static constexpr int HISTORY_WINDOW_DAYS        = 5 * 365 + 1;

    explicit InMemoryRepository(int max_staleness_days = DEFAULT_MAX_STALENESS_DAYS);

    // ── Loading ───────────────────────────────────────────────────────────────

    void add_metric(Date date, const std::string& ticker, const std::string& sector,
                    const std::string& metric, double value);
    void add_price(Date date, const std::string& ticker, double close);
    void add_event(ScoreEvent event);

    // ── MetricRepository ──────────────────────────────────────────────────────

    std::vector<std::string> sectors(Date as_of) const override;
    std::vector<MetricsSnapshot> sector_universe(const std::string& sector,
                                                 Date as_of) const override;
    MetricsSnapshot ticker_fundamentals(const std::string& ticker,
                                        Date as_of) const override;
    std::vector<ScoreEvent> events_since(const std::string& ticker,
                                         Date since, Date as_of) const override;
    std::optional<double> price(const std::string& ticker, Date as_of) const override;

    /// Every ticker ever loaded.
    [[nodiscard]] std::vector<std::string> tickers() const;

    /// Ticker → dated price series, for benchmark construction.
    [[nodiscard]] std::map<Date, double> price_series(const std::string& ticker) const;

private:
    struct Observation {
        std::string sector;
        double      value = 0.0;
    };

    /// metric → date → observation
    using MetricSeries = std::map<std::string, std::map<Date, Observation>>;

    /// Build a snapshot, or `nullopt` when the ticker has no live data.
    [[nodiscard]] std::optional<MetricsSnapshot>
    build_snapshot(const std::string& ticker, const MetricSeries& series, Date as_of) const;

    [[nodiscard]] std::vector<double>
    monthly_history(const std::map<Date, Observation>& series, Date as_of) const;

    int                                             max_staleness_days_;
    std::map<std::string, MetricSeries>             metrics_;
    std::map<std::string, std::map<Date, double>>   prices_;
    std::map<std::string, std::vector<ScoreEvent>>  events_;
};

// ─── PointInTimeRepository ────────────────────────────────────────────────────

/// Decorator that enforces a point-in-time cutoff on another repository.
///
/// Throws LookAheadViolation when a query's `as_of` is after the cutoff or
/// when the wrapped repository returns anything dated after it.
class PointInTimeRepository final : public MetricRepository {
public:
    PointInTimeRepository(const MetricRepository& inner, Date cutoff) noexcept;

    std::vector<std::string> sectors(Date as_of) const override;
    std::vector<MetricsSnapshot> sector_universe(const std::string& sector,
                                                 Date as_of) const override;
    MetricsSnapshot ticker_fundamentals(const std::string& ticker,
                                        Date as_of) const override;
    std::vector<ScoreEvent> events_since(const std::string& ticker,
                                         Date since, Date as_of) const override;
    std::optional<double> price(const std::string& ticker, Date as_of) const override;

    [[nodiscard]] Date cutoff() const noexcept { return cutoff_; }

private:
    void check_query(const char* what, Date as_of) const;
    void check_result(const char* what, Date dated) const;

    const MetricRepository& inner_;
    Date                    cutoff_;
};

}  // namespace icscore::data
