/// @file src/data/data_loader.cpp
/// @brief CSV DataLoader for metrics, prices and events.

#include "icscore/data_loader.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <fstream>
#include <sstream>
#include <string>

namespace icscore::data {

namespace {

/// Iterate data lines (header and comments skipped), handing each to `fn`
/// along with its 1-based line number.
template <typename Fn>
void for_each_data_line(const std::string& csv_content, Fn&& fn) {
    std::istringstream stream(csv_content);
    std::string line;
    bool header_skipped = false;
    std::size_t line_no = 0;

    while (std::getline(stream, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (!header_skipped) {
            header_skipped = true;
            continue;
        }
        fn(line, line_no);
    }
}

}  // namespace

// ─── DataLoader::split_row ────────────────────────────────────────────────────

std::optional<std::vector<std::string>>
DataLoader::split_row(const std::string& line, std::size_t expected) noexcept {
    std::vector<std::string> fields;
    fields.reserve(expected);

    std::istringstream ss(line);
    std::string token;
    while (std::getline(ss, token, ',')) {
        const auto first = token.find_first_not_of(" \t\r\n");
        const auto last  = token.find_last_not_of(" \t\r\n");
        if (first == std::string::npos) {
            return std::nullopt;  // empty token
        }
        fields.push_back(token.substr(first, last - first + 1));
    }

    if (fields.size() != expected) {
        return std::nullopt;
    }
    return fields;
}

// ─── DataLoader::parse_number ─────────────────────────────────────────────────

std::optional<double> DataLoader::parse_number(const std::string& field) noexcept {
    try {
        std::size_t pos = 0;
        const double val = std::stod(field, &pos);
        if (pos != field.size() || !std::isfinite(val)) {
            return std::nullopt;
        }
        return val;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ─── Parsers ──────────────────────────────────────────────────────────────────

std::vector<MetricRow>
DataLoader::parse_metrics_csv(const std::string& csv_content) noexcept {
    std::vector<MetricRow> rows;
    try {
        for_each_data_line(csv_content, [&](const std::string& line, std::size_t line_no) {
            const auto f = split_row(line, 5);
            const auto date  = f ? parse_date((*f)[0]) : std::nullopt;
            const auto value = f ? parse_number((*f)[4]) : std::nullopt;
            if (!date || !value) {
                spdlog::warn("metrics csv line {}: malformed row skipped", line_no);
                return;
            }
            rows.push_back(MetricRow{
                .date   = *date,
                .ticker = (*f)[1],
                .sector = (*f)[2],
                .metric = (*f)[3],
                .value  = *value,
            });
        });
    } catch (const std::exception& e) {
        spdlog::error("metrics csv: parse aborted: {}", e.what());
    }
    return rows;
}

std::vector<PriceRow>
DataLoader::parse_prices_csv(const std::string& csv_content) noexcept {
    std::vector<PriceRow> rows;
    try {
        for_each_data_line(csv_content, [&](const std::string& line, std::size_t line_no) {
            const auto f = split_row(line, 3);
            const auto date  = f ? parse_date((*f)[0]) : std::nullopt;
            const auto close = f ? parse_number((*f)[2]) : std::nullopt;
            if (!date || !close || *close <= 0.0) {
                spdlog::warn("prices csv line {}: malformed row skipped", line_no);
                return;
            }
            rows.push_back(PriceRow{.date = *date, .ticker = (*f)[1], .close = *close});
        });
    } catch (const std::exception& e) {
        spdlog::error("prices csv: parse aborted: {}", e.what());
    }
    return rows;
}

std::vector<ScoreEvent>
DataLoader::parse_events_csv(const std::string& csv_content) noexcept {
    std::vector<ScoreEvent> rows;
    try {
        for_each_data_line(csv_content, [&](const std::string& line, std::size_t line_no) {
            const auto f = split_row(line, 3);
            const auto date = f ? parse_date((*f)[0]) : std::nullopt;
            const auto type = f ? parse_event_type((*f)[2]) : std::nullopt;
            if (!date || !type) {
                spdlog::warn("events csv line {}: malformed row skipped", line_no);
                return;
            }
            rows.push_back(ScoreEvent{.ticker = (*f)[1], .type = *type, .date = *date});
        });
    } catch (const std::exception& e) {
        spdlog::error("events csv: parse aborted: {}", e.what());
    }
    return rows;
}

// ─── File loaders ─────────────────────────────────────────────────────────────

std::optional<std::string> DataLoader::read_file(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

std::optional<std::vector<MetricRow>>
DataLoader::load_metrics_csv(const std::string& filepath) noexcept {
    const auto text = read_file(filepath);
    if (!text) return std::nullopt;
    return parse_metrics_csv(*text);
}

std::optional<std::vector<PriceRow>>
DataLoader::load_prices_csv(const std::string& filepath) noexcept {
    const auto text = read_file(filepath);
    if (!text) return std::nullopt;
    return parse_prices_csv(*text);
}

std::optional<std::vector<ScoreEvent>>
DataLoader::load_events_csv(const std::string& filepath) noexcept {
    const auto text = read_file(filepath);
    if (!text) return std::nullopt;
    return parse_events_csv(*text);
}

// ─── DataLoader::populate ─────────────────────────────────────────────────────

void DataLoader::populate(InMemoryRepository& repo,
                          const std::vector<MetricRow>& metrics,
                          const std::vector<PriceRow>& prices,
                          const std::vector<ScoreEvent>& events) {
    for (const auto& r : metrics) {
        repo.add_metric(r.date, r.ticker, r.sector, r.metric, r.value);
    }
    for (const auto& r : prices) {
        repo.add_price(r.date, r.ticker, r.close);
    }
    for (const auto& e : events) {
        repo.add_event(e);
    }
}

}  // namespace icscore::data
