#pragma once

/// @file include/icscore/data_loader.hpp
/// @brief CSV loaders for metric observations, closing prices and events.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse the three input CSV formats into rows and populate an
/// InMemoryRepository.  Malformed rows are skipped with a warning; a bad row
/// never aborts the load.
///
/// ## Expected CSV Formats
/// ```
/// date,ticker,sector,metric,value        (metrics)
/// 2024-03-29,AAPL,Technology,pe_ratio,28.4
///
/// date,ticker,close                      (prices)
/// 2024-03-29,AAPL,171.48
///
/// date,ticker,event_type                 (events)
/// 2024-05-02,AAPL,earnings_release
/// ```
/// The first non-comment line is treated as a header and skipped.  Lines
/// beginning with `#` are ignored.
///
/// ## Guarantees
/// - Parsing never throws; `load_*` return `nullopt` only when the file cannot
///   be opened
/// - Does not modify any file or external state

#include "icscore/repository.hpp"
#include "icscore/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace icscore::data {

/// One `date,ticker,sector,metric,value` row.
struct MetricRow {
    Date        date{};
    std::string ticker;
    std::string sector;
    std::string metric;
    double      value = 0.0;
};

/// One `date,ticker,close` row.
struct PriceRow {
    Date        date{};
    std::string ticker;
    double      close = 0.0;
};

class DataLoader {
public:
    /// Parse metric rows from CSV text.
    [[nodiscard]] static std::vector<MetricRow>
    parse_metrics_csv(const std::string& csv_content) noexcept;

    /// Parse price rows from CSV text.  Non-positive closes are rejected.
    [[nodiscard]] static std::vector<PriceRow>
    parse_prices_csv(const std::string& csv_content) noexcept;

    /// Parse event rows from CSV text.  Unknown event types are rejected.
    [[nodiscard]] static std::vector<ScoreEvent>
    parse_events_csv(const std::string& csv_content) noexcept;

    [[nodiscard]] static std::optional<std::vector<MetricRow>>
    load_metrics_csv(const std::string& filepath) noexcept;

    [[nodiscard]] static std::optional<std::vector<PriceRow>>
    load_prices_csv(const std::string& filepath) noexcept;

    [[nodiscard]] static std::optional<std::vector<ScoreEvent>>
    load_events_csv(const std::string& filepath) noexcept;

    /// Add every row to `repo`.
    static void populate(InMemoryRepository& repo,
                         const std::vector<MetricRow>& metrics,
                         const std::vector<PriceRow>& prices,
                         const std::vector<ScoreEvent>& events);

private:
    /// Split on commas and trim each field.  Returns `nullopt` unless the row
    /// has exactly `expected` non-empty fields.
    [[nodiscard]] static std::optional<std::vector<std::string>>
    split_row(const std::string& line, std::size_t expected) noexcept;

    /// Strict finite double parse of a whole field.
    [[nodiscard]] static std::optional<double>
    parse_number(const std::string& field) noexcept;

    /// Read a whole file.  `nullopt` if it cannot be opened.
    [[nodiscard]] static std::optional<std::string>
    read_file(const std::string& filepath) noexcept;
};

}  // namespace icscore::data
