/// @file src/scoring/stabilizer.cpp
/// @brief ScoreStabilizer and the default reset-event set.

#include "icscore/stabilizer.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <utility>

namespace icscore::scoring {

// ─── Reset events ─────────────────────────────────────────────────────────────

std::set<EventType> default_reset_events() {
    return {
        EventType::EarningsRelease,
        EventType::AnalystRatingChange,
        EventType::InsiderTradeLarge,
        EventType::DividendAnnouncement,
        EventType::AcquisitionNews,
        EventType::GuidanceUpdate,
    };
}

// ─── ScoreStabilizer ──────────────────────────────────────────────────────────

ScoreStabilizer::ScoreStabilizer(StabilizerConfig config)
    : config_(std::move(config)) {}

double ScoreStabilizer::round1(double value) noexcept {
    return std::round(value * 10.0) / 10.0;
}

StabilizationResult
ScoreStabilizer::stabilize(double raw,
                           std::optional<double> previous,
                           std::span<const ScoreEvent> events) const {
    StabilizationResult out;
    out.previous = previous;

    for (const auto& ev : events) {
        if (config_.reset_events.count(ev.type) != 0) {
            out.reset_events.push_back(ev.type);
        }
    }

    if (!previous.has_value()) {
        out.state = StabilizerState::Unseeded;
        out.score = round1(raw);
        return out;
    }

    out.state  = StabilizerState::Stable;
    const double prev = *previous;

    if (!out.reset_events.empty()) {
        out.reset_triggered = true;
        out.score  = round1(raw);
        out.change = out.score - prev;
        spdlog::debug("stabilizer: reset by {} event(s), {:.1f} -> {:.1f}",
                      out.reset_events.size(), prev, out.score);
        return out;
    }

    out.smoothing_applied = true;
    const double smoothed = config_.alpha * raw + (1.0 - config_.alpha) * prev;
    if (std::abs(smoothed - prev) < config_.min_change) {
        out.score = round1(prev);
    } else {
        out.score = round1(smoothed);
    }
    out.change = out.score - prev;
    return out;
}

}  // namespace icscore::scoring
