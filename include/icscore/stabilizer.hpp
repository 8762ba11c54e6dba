#pragma once

/// @file include/icscore/stabilizer.hpp
/// @brief Score Stabilizer: exponential smoothing of the displayed score
///        with event-driven reset.
///
/// # Module: Stabilizer
///
/// ## States
///   Unseeded  no previous displayable score → raw score shown directly
///   Stable    previous score exists         → smoothed unless reset
///
/// ## Transition (Stable)
///   reset event in period       → s = raw
///   otherwise                   → s = α · raw + (1 − α) · prev      (α = 0.7)
///                                 if |s − prev| < min_change: s = prev
///
/// Every output is rounded to one decimal place.  The unrounded raw score is
/// kept separately on the record.

#include "icscore/constants.hpp"
#include "icscore/types.hpp"

#include <optional>
#include <set>
#include <span>
#include <vector>

namespace icscore::scoring {

// ─── Reset events ─────────────────────────────────────────────────────────────

/// The first six event types.
[[nodiscard]] std::set<EventType> default_reset_events();

// ─── Config / result ──────────────────────────────────────────────────────────

struct StabilizerConfig {
    double              alpha        = constants::SMOOTHING_ALPHA;
    double              min_change   = constants::MIN_SCORE_CHANGE;
    std::set<EventType> reset_events = default_reset_events();
};

enum class StabilizerState {
    Unseeded,
    Stable,
};

struct StabilizationResult {
    double                 score = 0.0;  ///< displayed score, one decimal
    StabilizerState        state = StabilizerState::Unseeded;
    bool                   smoothing_applied = false;
    bool                   reset_triggered   = false;
    std::vector<EventType> reset_events;     ///< reset events seen this period
    std::optional<double>  previous;
    std::optional<double>  change;           ///< score − previous
};

// ─── ScoreStabilizer ──────────────────────────────────────────────────────────

class ScoreStabilizer {
public:
    explicit ScoreStabilizer(StabilizerConfig config = StabilizerConfig{});

    /// Produce the displayed score.
    ///
    /// # Arguments
    /// * `raw`     : this period's unsmoothed score
    /// * `previous`: last displayed score, `nullopt` when Unseeded
    /// * `events`  : events that occurred during the current period
    [[nodiscard]] StabilizationResult
    stabilize(double raw,
              std::optional<double> previous,
              std::span<const ScoreEvent> events) const;

    /// Round half away from zero to one decimal.
    [[nodiscard]] static double round1(double value) noexcept;

    [[nodiscard]] const StabilizerConfig& config() const noexcept { return config_; }

private:
    StabilizerConfig config_;
};

}  // namespace icscore::scoring
