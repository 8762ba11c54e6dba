#pragma once

/// @file include/icscore/types.hpp
/// @brief Shared value types for the IC Score engine.
///
/// Every module includes this file. It defines the calendar date type, the
/// point-in-time metric snapshot consumed by the factor calculators, and the
/// factor category enumeration.

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace icscore {

// ─── Calendar ─────────────────────────────────────────────────────────────────

/// Calendar date used for as-of queries, rebalance points and score records.
using Date = std::chrono::year_month_day;

/// Build a Date from numeric year / month / day.
[[nodiscard]] Date make_date(int year, unsigned month, unsigned day) noexcept;

/// Parse an ISO-8601 `YYYY-MM-DD` string.
/// Returns `nullopt` on malformed or invalid calendar input.
[[nodiscard]] std::optional<Date> parse_date(std::string_view text) noexcept;

/// Format as `YYYY-MM-DD`.
[[nodiscard]] std::string to_string(Date d);

/// `d` shifted by `days` calendar days (negative moves backwards).
[[nodiscard]] Date add_days(Date d, int days) noexcept;

/// Signed number of days from `from` to `to`.
[[nodiscard]] int days_between(Date from, Date to) noexcept;

// ─── Metrics ──────────────────────────────────────────────────────────────────

/// Metric name → value. A metric that is not present is "missing"; it is
/// never represented as zero.
using MetricMap = std::map<std::string, double>;

/// Everything the factor calculators may read about one ticker at one date.
struct MetricsSnapshot {
    std::string ticker;
    std::string sector;
    Date        as_of{};
    MetricMap   metrics;

    /// Observation date of each entry in `metrics`.
    std::map<std::string, Date> observed;

    /// Monthly history of valuation ratios (e.g. "pe_ratio", "ps_ratio"),
    /// oldest first, covering at most the five years before `as_of`.
    std::map<std::string, std::vector<double>> history;

    /// Value of `name`, or `nullopt` when missing or non-finite.
    [[nodiscard]] std::optional<double> get(const std::string& name) const noexcept;
};

// ─── Factor categories ────────────────────────────────────────────────────────

/// Grouping used for category sub-scores and the confidence hard floor.
enum class Category {
    Quality,
    Valuation,
    Signals,
};

/// Convert Category to a lower-case name ("quality", "valuation", "signals").
[[nodiscard]] const char* to_string(Category c) noexcept;

/// All categories in display order.
inline constexpr Category ALL_CATEGORIES[] = {
    Category::Quality, Category::Valuation, Category::Signals,
};

// ─── Events ───────────────────────────────────────────────────────────────────

/// Material corporate or market event.
enum class EventType {
    EarningsRelease,
    AnalystRatingChange,
    InsiderTradeLarge,
    DividendAnnouncement,
    AcquisitionNews,
    GuidanceUpdate,
    StockSplit,
    PriceBreakout,
    TechnicalSignal,
};

/// snake_case name, e.g. "earnings_release".
[[nodiscard]] const char* to_string(EventType e) noexcept;

/// Inverse of to_string().  `nullopt` for an unknown name.
[[nodiscard]] std::optional<EventType> parse_event_type(std::string_view name) noexcept;

/// One event for one ticker on one date.
struct ScoreEvent {
    std::string ticker;
    EventType   type = EventType::EarningsRelease;
    Date        date{};
};

}  // namespace icscore
