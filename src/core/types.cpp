/// @file src/core/types.cpp
/// @brief Calendar helpers, MetricsSnapshot lookup and Category names.

#include "icscore/types.hpp"

#include <fmt/format.h>

#include <array>
#include <charconv>
#include <cmath>
#include <utility>

namespace icscore {

// ─── Calendar ─────────────────────────────────────────────────────────────────

Date make_date(int year, unsigned month, unsigned day) noexcept {
    return Date{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
}

std::optional<Date> parse_date(std::string_view text) noexcept {
    // Strict YYYY-MM-DD.
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    const char* begin = text.data();
    if (std::from_chars(begin, begin + 4, y).ec != std::errc{})       return std::nullopt;
    if (std::from_chars(begin + 5, begin + 7, m).ec != std::errc{})   return std::nullopt;
    if (std::from_chars(begin + 8, begin + 10, d).ec != std::errc{})  return std::nullopt;

    const Date date = make_date(y, m, d);
    if (!date.ok()) {
        return std::nullopt;
    }
    return date;
}

std::string to_string(Date d) {
    return fmt::format("{:04d}-{:02d}-{:02d}",
                       static_cast<int>(d.year()),
                       static_cast<unsigned>(d.month()),
                       static_cast<unsigned>(d.day()));
}

Date add_days(Date d, int days) noexcept {
    return Date{std::chrono::sys_days{d} + std::chrono::days{days}};
}

int days_between(Date from, Date to) noexcept {
    return static_cast<int>((std::chrono::sys_days{to} - std::chrono::sys_days{from}).count());
}

// ─── MetricsSnapshot ──────────────────────────────────────────────────────────

std::optional<double> MetricsSnapshot::get(const std::string& name) const noexcept {
    const auto it = metrics.find(name);
    if (it == metrics.end() || !std::isfinite(it->second)) {
        return std::nullopt;
    }
    return it->second;
}

// ─── Category ─────────────────────────────────────────────────────────────────

const char* to_string(Category c) noexcept {
    switch (c) {
        case Category::Quality:   return "quality";
        case Category::Valuation: return "valuation";
        case Category::Signals:   return "signals";
    }
    return "unknown";
}

// ─── Events ───────────────────────────────────────────────────────────────────

namespace {

constexpr std::array<std::pair<EventType, const char*>, 9> EVENT_NAMES{{
    {EventType::EarningsRelease,      "earnings_release"},
    {EventType::AnalystRatingChange,  "analyst_rating_change"},
    {EventType::InsiderTradeLarge,    "insider_trade_large"},
    {EventType::DividendAnnouncement, "dividend_announcement"},
    {EventType::AcquisitionNews,      "acquisition_news"},
    {EventType::GuidanceUpdate,       "guidance_update"},
    {EventType::StockSplit,           "stock_split"},
    {EventType::PriceBreakout,        "price_breakout"},
    {EventType::TechnicalSignal,      "technical_signal"},
}};

}  // namespace

const char* to_string(EventType e) noexcept {
    for (const auto& [type, name] : EVENT_NAMES) {
        if (type == e) return name;
    }
    return "unknown";
}

std::optional<EventType> parse_event_type(std::string_view name) noexcept {
    for (const auto& [type, n] : EVENT_NAMES) {
        if (name == n) return type;
    }
    return std::nullopt;
}

}  // namespace icscore
