/// @file src/core/explainer.cpp
/// @brief ScoreExplainer: factor-level breakdown of score changes.

#include "icscore/explainer.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace icscore::core {

namespace {

struct Phrases {
    const char* improved;
    const char* declined;
    const char* missing;
};

const std::map<std::string, Phrases>& phrase_table() {
    static const std::map<std::string, Phrases> table = {
        {"growth",             {"Revenue and earnings growth improved",
                                "Growth metrics declined",
                                "Insufficient historical financial data"}},
        {"profitability",      {"Profitability margins improved",
                                "Profitability margins contracted",
                                "Missing profitability metrics"}},
        {"financial_health",   {"Balance sheet strength improved",
                                "Debt or liquidity metrics worsened",
                                "Missing balance sheet data"}},
        {"dividend_quality",   {"Dividend quality improved",
                                "Dividend quality weakened",
                                "No qualifying dividend"}},
        {"value",              {"Stock appears more undervalued vs sector peers",
                                "Stock appears more overvalued vs sector peers",
                                "Missing valuation data (P/E, P/B, P/S)"}},
        {"intrinsic_value",    {"Upside to fair value widened",
                                "Upside to fair value narrowed",
                                "Missing fair value or free cash flow data"}},
        {"historical_value",   {"Valuation cheapened against its own history",
                                "Valuation richened against its own history",
                                "Insufficient valuation history"}},
        {"momentum",           {"Price momentum strengthened",
                                "Price momentum weakened",
                                "Missing price data"}},
        {"smart_money",        {"Analyst and insider positioning improved",
                                "Analyst and insider positioning deteriorated",
                                "No analyst coverage or ownership data"}},
        {"earnings_revisions", {"Earnings estimates revised up",
                                "Earnings estimates revised down",
                                "No estimate revisions reported"}},
        {"technical",          {"Technical indicators turned bullish",
                                "Technical indicators turned bearish",
                                "Missing technical indicators"}},
        {"sentiment",          {"News sentiment improved",
                                "News sentiment worsened",
                                "No recent news articles"}},
    };
    return table;
}

/// "financial_health" → "financial health".
std::string spaced(std::string name) {
    std::replace(name.begin(), name.end(), '_', ' ');
    return name;
}

/// "financial_health" → "Financial Health".
std::string titled(const std::string& name) {
    std::string out = spaced(name);
    bool word_start = true;
    for (char& c : out) {
        if (word_start) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        word_start = c == ' ';
    }
    return out;
}

std::optional<double> score_of(const ICScoreRecord& rec, const std::string& factor) {
    const auto* f = rec.factor(factor);
    return f == nullptr ? std::nullopt : f->score;
}

std::string summary_of(const std::string& ticker, double delta,
                       const std::vector<FactorChange>& changes) {
    if (changes.empty()) {
        if (std::abs(delta) < constants::MIN_SCORE_CHANGE) {
            return fmt::format("{}'s IC Score is unchanged", ticker);
        }
        return fmt::format("{}'s IC Score {} slightly", ticker,
                           delta > 0.0 ? "improved" : "declined");
    }

    const char* direction = "declined";
    if (delta > constants::EXPLAIN_SIGNIFICANT_DELTA) {
        direction = "improved significantly";
    } else if (delta > 0.0) {
        direction = "improved";
    } else if (delta < -constants::EXPLAIN_SIGNIFICANT_DELTA) {
        direction = "declined significantly";
    }

    const FactorChange& top = changes.front();
    return fmt::format("{}'s IC Score {} ({:+.1f} points), primarily due to {} ({:+.1f})",
                       ticker, direction, delta, spaced(top.factor), top.delta);
}

std::string opt_score(const std::optional<double>& v) {
    return v ? fmt::format("{:.1f}", *v) : std::string{"n/a"};
}

}  // namespace

const char* to_string(Freshness f) noexcept {
    switch (f) {
        case Freshness::Fresh:   return "fresh";
        case Freshness::Recent:  return "recent";
        case Freshness::Stale:   return "stale";
        case Freshness::Missing: return "missing";
        case Freshness::Unknown: return "unknown";
    }
    return "unknown";
}

// ─── ScoreExplainer ───────────────────────────────────────────────────────────

ScoreExplainer::ScoreExplainer(ExplainerConfig config)
    : config_(config) {}

std::string ScoreExplainer::explanation_for(const std::string& factor, double delta) {
    const auto& table = phrase_table();
    if (const auto it = table.find(factor); it != table.end()) {
        return delta > 0.0 ? it->second.improved : it->second.declined;
    }
    return fmt::format("{} {}", titled(factor), delta > 0.0 ? "improved" : "declined");
}

std::string ScoreExplainer::missing_reason(const std::string& factor) {
    const auto& table = phrase_table();
    if (const auto it = table.find(factor); it != table.end()) {
        return it->second.missing;
    }
    return "Data not available";
}

Freshness ScoreExplainer::freshness_of(int age_days) const noexcept {
    if (age_days <= config_.fresh_days)  return Freshness::Fresh;
    if (age_days <= config_.recent_days) return Freshness::Recent;
    return Freshness::Stale;
}

GranularConfidence ScoreExplainer::confidence(const ICScoreRecord& record) const {
    GranularConfidence out;
    out.level      = record.confidence;
    out.percentage = record.completeness_pct;

    for (const auto& f : record.factors) {
        FactorStatus status;
        status.available = f.computable();

        if (!status.available) {
            status.freshness      = Freshness::Missing;
            status.missing_reason = missing_reason(f.name);
        } else if (f.data_as_of) {
            const int age    = std::max(0, days_between(*f.data_as_of, record.date));
            status.age_days  = age;
            status.freshness = freshness_of(age);
            if (age > config_.recent_days) {
                status.warning = fmt::format("Data is {} days old{}", age,
                                             age > config_.outdated_days ? " (may be outdated)" : "");
                out.warnings.push_back(fmt::format("{}: {}", f.name, *status.warning));
            }
        }

        out.factors.emplace(f.name, std::move(status));
    }
    return out;
}

ScoreChangeExplanation
ScoreExplainer::explain(const ICScoreRecord& current,
                        const std::optional<ICScoreRecord>& previous) const {
    ScoreChangeExplanation out;
    out.ticker            = current.ticker;
    out.date              = current.date;
    out.current_score     = current.overall_score;
    out.smoothing_applied = current.smoothing_applied;
    out.reset_events      = current.reset_events;
    out.confidence        = confidence(current);

    if (previous) {
        out.previous_score = previous->overall_score;
    }
    if (out.current_score && out.previous_score) {
        out.delta = *out.current_score - *out.previous_score;
    }

    if (previous) {
        std::vector<std::string> names;
        for (const auto& f : current.factors) {
            names.push_back(f.name);
        }
        for (const auto& f : previous->factors) {
            if (current.factor(f.name) == nullptr) {
                names.push_back(f.name);
            }
        }

        for (const auto& name : names) {
            FactorChange change;
            change.factor         = name;
            change.current_score  = score_of(current, name);
            change.previous_score = score_of(*previous, name);
            if (!change.current_score && !change.previous_score) {
                continue;
            }

            change.delta = change.current_score.value_or(constants::SCORE_NEUTRAL)
                         - change.previous_score.value_or(constants::SCORE_NEUTRAL);
            if (std::abs(change.delta) < config_.significant_delta) {
                continue;
            }

            if (const auto w = current.weights.find(name); w != current.weights.end()) {
                change.weight = w->second;
            } else if (const auto pw = previous->weights.find(name); pw != previous->weights.end()) {
                change.weight = pw->second;
            }
            change.contribution = change.delta * change.weight;
            change.explanation  = explanation_for(name, change.delta);
            out.changes.push_back(std::move(change));
        }

        std::stable_sort(out.changes.begin(), out.changes.end(),
                         [](const FactorChange& a, const FactorChange& b) {
                             return std::abs(a.contribution) > std::abs(b.contribution);
                         });
        if (out.changes.size() > config_.max_changes) {
            out.changes.resize(config_.max_changes);
        }
    }

    if (!out.current_score) {
        out.summary = fmt::format("{}'s IC Score is unavailable (insufficient data)", current.ticker);
    } else if (!previous) {
        out.summary = fmt::format("{}'s IC Score is {:.1f} (no previous score)",
                                  current.ticker, *out.current_score);
    } else {
        out.summary = summary_of(current.ticker, out.delta, out.changes);
    }
    return out;
}

// ─── ScoreChangeExplanation ───────────────────────────────────────────────────

std::string ScoreChangeExplanation::to_string() const {
    std::string out = fmt::format("{} {}  score={}  previous={}  delta={:+.1f}\n",
                                  ticker, icscore::to_string(date),
                                  opt_score(current_score), opt_score(previous_score), delta);
    out += fmt::format("  {}\n", summary);

    for (const auto& c : changes) {
        out += fmt::format("    {:<20} {:>6} -> {:>6}  {:+6.1f}  w={:.3f}  contrib={:+.2f}  {}\n",
                           c.factor, opt_score(c.previous_score), opt_score(c.current_score),
                           c.delta, c.weight, c.contribution, c.explanation);
    }
    if (smoothing_applied) {
        out += "  smoothing applied\n";
    }
    for (EventType e : reset_events) {
        out += fmt::format("  reset by {}\n", icscore::to_string(e));
    }

    out += fmt::format("  confidence {} ({:.0f}% complete)\n",
                       scoring::to_string(confidence.level), confidence.percentage);
    for (const auto& [name, status] : confidence.factors) {
        if (status.missing_reason) {
            out += fmt::format("    {:<20} missing: {}\n", name, *status.missing_reason);
        }
    }
    for (const auto& w : confidence.warnings) {
        out += fmt::format("    warning: {}\n", w);
    }
    return out;
}

}  // namespace icscore::core
