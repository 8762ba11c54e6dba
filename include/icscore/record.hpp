#pragma once

/// @file include/icscore/record.hpp
/// @brief ICScoreRecord and the append-only record store.
///
/// A record is the complete, immutable result of scoring one ticker on one
/// date.  Stores append; they never overwrite.  Invariant: a record with
/// Insufficient confidence has neither an overall nor a raw score.
///
/// ## Persistence
/// A record is written as one record-level CSV line plus factor-level CSV
/// lines (one per factor input, carrying the weight used).  Doubles are
/// written in shortest round-trip form, so records_from_csv() rebuilds the
/// records exactly.

#include "icscore/aggregator.hpp"
#include "icscore/factors.hpp"
#include "icscore/lifecycle.hpp"
#include "icscore/types.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace icscore::core {

// ─── ICScoreRecord ────────────────────────────────────────────────────────────

struct ICScoreRecord {
    std::string ticker;
    std::string sector;
    Date        date{};

    std::optional<double> overall_score;  ///< displayed (stabilised) score
    std::optional<double> raw_score;      ///< unsmoothed weighted score

    std::map<Category, std::optional<double>> category_scores;
    std::vector<factors::FactorResult>        factors;

    lifecycle::LifecycleStage stage            = lifecycle::LifecycleStage::Mature;
    double                    stage_confidence = 0.0;
    lifecycle::WeightSet      weights;

    std::optional<int>    sector_rank;
    std::optional<int>    sector_total;
    std::optional<double> sector_percentile;

    double                  completeness_pct = 0.0;
    scoring::ConfidenceLevel confidence      = scoring::ConfidenceLevel::Insufficient;

    std::optional<double>  previous_score;
    bool                   smoothing_applied = false;
    std::vector<EventType> reset_events;

    /// Factor result named `name`, or nullptr.
    [[nodiscard]] const factors::FactorResult* factor(const std::string& name) const noexcept;

    /// Multi-line human-readable summary.
    [[nodiscard]] std::string to_string() const;

    /// Column names matching to_csv_row().
    [[nodiscard]] static std::string csv_header();

    /// One CSV line (no trailing newline).  Missing values are empty fields;
    /// reset events are `;`-separated.
    [[nodiscard]] std::string to_csv_row() const;

    /// Column names matching factor_csv_rows().
    [[nodiscard]] static std::string factor_csv_header();

    /// One line per factor input; a factor without inputs gets one line with
    /// empty metric fields, and a weight with no factor result one line with
    /// only `weight_used` set.
    [[nodiscard]] std::vector<std::string> factor_csv_rows() const;
};

/// Record-level CSV of `records`, header first.
[[nodiscard]] std::string records_to_csv(const std::vector<ICScoreRecord>& records);

/// Factor-level CSV of `records`, header first.
[[nodiscard]] std::string factors_to_csv(const std::vector<ICScoreRecord>& records);

/// Rebuild records written by records_to_csv() and factors_to_csv().
/// Throws std::runtime_error naming the first malformed line, or a factor line
/// whose record is absent.
[[nodiscard]] std::vector<ICScoreRecord>
records_from_csv(const std::string& records_csv, const std::string& factors_csv);

/// Assign sector rank, total and percentile among records that have an
/// overall score.  Rank 1 is the highest score; ties share the better rank.
/// Percentile = (total − rank) / (total − 1) × 100, and 100 for a lone record.
void assign_sector_ranks(std::vector<ICScoreRecord>& records);

// ─── RecordStore ──────────────────────────────────────────────────────────────

class RecordStore {
public:
    virtual ~RecordStore() = default;

    /// Most recent record for `ticker` dated strictly before `before`.
    [[nodiscard]] virtual std::optional<ICScoreRecord>
    latest(const std::string& ticker, Date before) const = 0;

    /// Most recent record of every ticker.
    [[nodiscard]] virtual std::vector<ICScoreRecord> latest_all() const = 0;

    virtual void append(ICScoreRecord record) = 0;
};

/// Thread-safe in-memory store.  Records per ticker are kept in date order.
class InMemoryRecordStore final : public RecordStore {
public:
    std::optional<ICScoreRecord> latest(const std::string& ticker, Date before) const override;
    std::vector<ICScoreRecord> latest_all() const override;
    void append(ICScoreRecord record) override;

    /// Every record of `ticker`, oldest first.
    [[nodiscard]] std::vector<ICScoreRecord> history(const std::string& ticker) const;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex                                 mutex_;
    std::map<std::string, std::vector<ICScoreRecord>>  records_;
};

}  // namespace icscore::core
