#pragma once

/// @file include/icscore/explainer.hpp
/// @brief Score-change explanations and per-factor data confidence.
///
/// # Module: Score Explainer
///
/// Compares a new ICScoreRecord with the ticker's previous one and reports
/// which factors moved the score, largest weighted contribution first, with a
/// one-line summary.  Alongside it, GranularConfidence lists the freshness of
/// every factor's inputs and the reason each missing factor is missing.
///
/// ## Usage
/// ```cpp
/// ScoreExplainer explainer;
/// const auto previous = store.latest(rec.ticker, rec.date);
/// fmt::print("{}\n", explainer.explain(rec, previous).to_string());
/// ```
///
/// A factor missing on one side of the comparison counts as neutral (50).
/// Only factor deltas of at least `significant_delta` points are reported.

#include "icscore/aggregator.hpp"
#include "icscore/constants.hpp"
#include "icscore/record.hpp"
#include "icscore/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace icscore::core {

// ─── Factor changes ───────────────────────────────────────────────────────────

/// One factor's move between two records.
struct FactorChange {
    std::string           factor;
    std::optional<double> previous_score;
    std::optional<double> current_score;
    double                delta        = 0.0;  ///< missing sides count as 50
    double                weight       = 0.0;  ///< weight used for the new record
    double                contribution = 0.0;  ///< delta × weight
    std::string           explanation;
};

// ─── GranularConfidence ───────────────────────────────────────────────────────

enum class Freshness {
    Fresh,    ///< at most `fresh_days` old
    Recent,   ///< at most `recent_days` old
    Stale,
    Missing,  ///< factor not computable
    Unknown,  ///< computable but no observation date recorded
};

/// "fresh", "recent", "stale", "missing" or "unknown".
[[nodiscard]] const char* to_string(Freshness f) noexcept;

struct FactorStatus {
    bool                       available = false;
    Freshness                  freshness = Freshness::Unknown;
    std::optional<int>         age_days;
    std::optional<std::string> warning;
    std::optional<std::string> missing_reason;
};

struct GranularConfidence {
    scoring::ConfidenceLevel            level = scoring::ConfidenceLevel::Insufficient;
    double                              percentage = 0.0;  ///< completeness, 0–100
    std::map<std::string, FactorStatus> factors;
    std::vector<std::string>            warnings;  ///< "<factor>: <warning>"
};

// ─── ScoreChangeExplanation ───────────────────────────────────────────────────

struct ScoreChangeExplanation {
    std::string           ticker;
    Date                  date{};
    std::optional<double> previous_score;
    std::optional<double> current_score;

    /// current − previous, 0 when either side has no score.
    double delta = 0.0;

    /// Significant factor changes, largest |contribution| first.
    std::vector<FactorChange> changes;

    std::string            summary;
    GranularConfidence     confidence;
    bool                   smoothing_applied = false;
    std::vector<EventType> reset_events;

    /// Multi-line report.
    [[nodiscard]] std::string to_string() const;
};

// ─── ScoreExplainer ───────────────────────────────────────────────────────────

struct ExplainerConfig {
    double      significant_delta = constants::EXPLAIN_SIGNIFICANT_DELTA;
    std::size_t max_changes       = constants::EXPLAIN_MAX_CHANGES;
    int         fresh_days        = constants::FRESH_DATA_DAYS;
    int         recent_days       = constants::RECENT_DATA_DAYS;
    int         outdated_days     = constants::OUTDATED_DATA_DAYS;
};

class ScoreExplainer {
public:
    explicit ScoreExplainer(ExplainerConfig config = ExplainerConfig{});

    /// Explain `current` against `previous`, the ticker's prior record.
    /// Without a previous record the delta is 0 and no factor change is listed.
    [[nodiscard]] ScoreChangeExplanation
    explain(const ICScoreRecord& current,
            const std::optional<ICScoreRecord>& previous) const;

    /// Per-factor availability and freshness of `record`, measured from the
    /// record's date.
    [[nodiscard]] GranularConfidence confidence(const ICScoreRecord& record) const;

    /// Classify data `age_days` old.
    [[nodiscard]] Freshness freshness_of(int age_days) const noexcept;

    /// Sentence describing a move of `factor` in the direction of `delta`.
    [[nodiscard]] static std::string explanation_for(const std::string& factor, double delta);

    /// Why `factor` is typically not computable.
    [[nodiscard]] static std::string missing_reason(const std::string& factor);

private:
    ExplainerConfig config_;
};

}  // namespace icscore::core
