/// @file src/data/point_in_time_repository.cpp
/// @brief PointInTimeRepository: cutoff enforcement around another repository.

#include "icscore/repository.hpp"

namespace icscore::data {

PointInTimeRepository::PointInTimeRepository(const MetricRepository& inner,
                                             Date cutoff) noexcept
    : inner_(inner)
    , cutoff_(cutoff) {}

void PointInTimeRepository::check_query(const char* what, Date as_of) const {
    if (cutoff_ < as_of) {
        throw LookAheadViolation(what, cutoff_, as_of);
    }
}

void PointInTimeRepository::check_result(const char* what, Date dated) const {
    if (cutoff_ < dated) {
        throw LookAheadViolation(what, cutoff_, dated);
    }
}

std::vector<std::string> PointInTimeRepository::sectors(Date as_of) const {
    check_query("sectors query", as_of);
    return inner_.sectors(as_of);
}

std::vector<MetricsSnapshot>
PointInTimeRepository::sector_universe(const std::string& sector, Date as_of) const {
    check_query("sector universe query", as_of);
    auto out = inner_.sector_universe(sector, as_of);
    for (const auto& snap : out) {
        check_result("sector universe snapshot", snap.as_of);
    }
    return out;
}

MetricsSnapshot
PointInTimeRepository::ticker_fundamentals(const std::string& ticker, Date as_of) const {
    check_query("fundamentals query", as_of);
    auto snap = inner_.ticker_fundamentals(ticker, as_of);
    check_result("fundamentals snapshot", snap.as_of);
    return snap;
}

std::vector<ScoreEvent>
PointInTimeRepository::events_since(const std::string& ticker, Date since, Date as_of) const {
    check_query("events query", as_of);
    auto out = inner_.events_since(ticker, since, as_of);
    for (const auto& ev : out) {
        check_result("event", ev.date);
    }
    return out;
}

std::optional<double>
PointInTimeRepository::price(const std::string& ticker, Date as_of) const {
    check_query("price query", as_of);
    return inner_.price(ticker, as_of);
}

}  // namespace icscore::data
