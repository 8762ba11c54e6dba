/// @file src/data/in_memory_repository.cpp
/// @brief InMemoryRepository: as-of queries over loaded observations.

#include "icscore/repository.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace icscore::data {

namespace {

/// Metrics whose own monthly history is attached to every snapshot.
const std::vector<std::string>& history_metrics() {
    static const std::vector<std::string> names{"pe_ratio", "ps_ratio"};
    return names;
}

}  // namespace

// ─── LookAheadViolation ───────────────────────────────────────────────────────

LookAheadViolation::LookAheadViolation(const std::string& what, Date cutoff, Date requested)
    : std::logic_error(fmt::format("look-ahead violation: {} at {} is after cutoff {}",
                                   what, to_string(requested), to_string(cutoff)))
    , cutoff_(cutoff)
    , requested_(requested) {}

// ─── Loading ──────────────────────────────────────────────────────────────────

InMemoryRepository::InMemoryRepository(int max_staleness_days)
    : max_staleness_days_(max_staleness_days) {}

void InMemoryRepository::add_metric(Date date, const std::string& ticker,
                                    const std::string& sector,
                                    const std::string& metric, double value) {
    metrics_[ticker][metric][date] = Observation{sector, value};
}

void InMemoryRepository::add_price(Date date, const std::string& ticker, double close) {
    prices_[ticker][date] = close;
}

void InMemoryRepository::add_event(ScoreEvent event) {
    auto& list = events_[event.ticker];
    const auto pos = std::upper_bound(
        list.begin(), list.end(), event.date,
        [](Date d, const ScoreEvent& e) { return d < e.date; });
    list.insert(pos, std::move(event));
}

// ─── Snapshot construction ────────────────────────────────────────────────────

std::vector<double>
InMemoryRepository::monthly_history(const std::map<Date, Observation>& series,
                                    Date as_of) const {
    const Date window_start = add_days(as_of, -HISTORY_WINDOW_DAYS);

    // Last observation of each calendar month, strictly before as_of.
    std::map<std::chrono::year_month, double> by_month;
    for (auto it = series.lower_bound(window_start);
         it != series.end() && it->first < as_of; ++it) {
        if (!std::isfinite(it->second.value)) {
            continue;
        }
        by_month[it->first.year() / it->first.month()] = it->second.value;
    }

    std::vector<double> out;
    out.reserve(by_month.size());
    for (const auto& [month, value] : by_month) {
        out.push_back(value);
    }
    return out;
}

std::optional<MetricsSnapshot>
InMemoryRepository::build_snapshot(const std::string& ticker,
                                   const MetricSeries& series,
                                   Date as_of) const {
    const Date oldest_live = add_days(as_of, -max_staleness_days_);

    MetricsSnapshot snap;
    snap.ticker = ticker;
    Date newest{};
    bool any = false;

    for (const auto& [metric, dated] : series) {
        // Latest observation dated ≤ as_of.
        auto it = dated.upper_bound(as_of);
        if (it == dated.begin()) {
            continue;
        }
        --it;
        if (it->first < oldest_live) {
            continue;
        }
        snap.metrics[metric]  = it->second.value;
        snap.observed[metric] = it->first;
        if (!any || newest < it->first) {
            newest      = it->first;
            snap.sector = it->second.sector;
        }
        any = true;
    }

    if (!any) {
        return std::nullopt;
    }
    snap.as_of = newest;

    for (const auto& metric : history_metrics()) {
        const auto it = series.find(metric);
        if (it == series.end()) {
            continue;
        }
        auto points = monthly_history(it->second, as_of);
        if (!points.empty()) {
            snap.history.emplace(metric, std::move(points));
        }
    }

    return snap;
}

// ─── MetricRepository ─────────────────────────────────────────────────────────

std::vector<std::string> InMemoryRepository::sectors(Date as_of) const {
    std::set<std::string> found;
    for (const auto& [ticker, series] : metrics_) {
        if (auto snap = build_snapshot(ticker, series, as_of); snap && !snap->sector.empty()) {
            found.insert(snap->sector);
        }
    }
    return {found.begin(), found.end()};
}

std::vector<MetricsSnapshot>
InMemoryRepository::sector_universe(const std::string& sector, Date as_of) const {
    std::vector<MetricsSnapshot> out;
    for (const auto& [ticker, series] : metrics_) {
        auto snap = build_snapshot(ticker, series, as_of);
        if (snap && snap->sector == sector) {
            out.push_back(std::move(*snap));
        }
    }
    return out;
}

MetricsSnapshot
InMemoryRepository::ticker_fundamentals(const std::string& ticker, Date as_of) const {
    const auto it = metrics_.find(ticker);
    if (it == metrics_.end()) {
        throw RepositoryError(fmt::format("unknown ticker '{}'", ticker));
    }
    auto snap = build_snapshot(ticker, it->second, as_of);
    if (!snap) {
        throw RepositoryError(fmt::format("no data for '{}' on or before {}",
                                          ticker, to_string(as_of)));
    }
    return std::move(*snap);
}

std::vector<ScoreEvent>
InMemoryRepository::events_since(const std::string& ticker, Date since, Date as_of) const {
    std::vector<ScoreEvent> out;
    const auto it = events_.find(ticker);
    if (it == events_.end()) {
        return out;
    }
    for (const auto& ev : it->second) {
        if (since < ev.date && ev.date <= as_of) {
            out.push_back(ev);
        }
    }
    return out;
}

std::optional<double>
InMemoryRepository::price(const std::string& ticker, Date as_of) const {
    const auto it = prices_.find(ticker);
    if (it == prices_.end()) {
        return std::nullopt;
    }
    auto p = it->second.upper_bound(as_of);
    if (p == it->second.begin()) {
        return std::nullopt;
    }
    --p;
    return p->second;
}

std::vector<std::string> InMemoryRepository::tickers() const {
    std::set<std::string> out;
    for (const auto& [ticker, series] : metrics_) out.insert(ticker);
    for (const auto& [ticker, series] : prices_)  out.insert(ticker);
    return {out.begin(), out.end()};
}

std::map<Date, double> InMemoryRepository::price_series(const std::string& ticker) const {
    const auto it = prices_.find(ticker);
    return it == prices_.end() ? std::map<Date, double>{} : it->second;
}

}  // namespace icscore::data
