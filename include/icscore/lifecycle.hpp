#pragma once

/// @file include/icscore/lifecycle.hpp
/// @brief Lifecycle Classifier and Weight Adjuster.
///
/// # Module: Lifecycle
///
/// ## Responsibility
/// Assign a company to one lifecycle stage from three fundamentals and turn
/// the stage into factor-weight multipliers.  The multiplier table is plain
/// data: adding a stage means adding a table row, not a type.
///
/// ## Classification (first match wins)
///   revenue_growth >  50 %              → Hypergrowth
///   revenue_growth >  20 %              → Growth
///   revenue_growth < −5 %               → Turnaround
///   P/E < 12 and net_margin > 5 %       → Value
///   otherwise                           → Mature
///
/// Missing inputs default to growth 0 %, margin 0 %, P/E 20.
///
/// ## Weight adjustment
///   adjusted_f = base_f × multiplier(stage, f)       (multiplier default 1.0)
///   final_f    = adjusted_f / Σ adjusted
///
/// ## Guarantees
/// - Pure functions; thread-safe
/// - adjust() output sums to 1.0 whenever any base weight is positive

#include "icscore/constants.hpp"

#include <map>
#include <optional>
#include <string>

namespace icscore::lifecycle {

// ─── LifecycleStage ───────────────────────────────────────────────────────────

/// Company lifecycle stage.  Declining companies are classified Turnaround.
enum class LifecycleStage {
    Hypergrowth,
    Growth,
    Mature,
    Value,
    Turnaround,
};

/// Convert LifecycleStage to a lower-case name.
[[nodiscard]] const char* to_string(LifecycleStage s) noexcept;

/// One-line description for reports.
[[nodiscard]] const char* describe(LifecycleStage s) noexcept;

/// All stages, in declaration order.
inline constexpr LifecycleStage ALL_STAGES[] = {
    LifecycleStage::Hypergrowth, LifecycleStage::Growth, LifecycleStage::Mature,
    LifecycleStage::Value, LifecycleStage::Turnaround,
};

// ─── Inputs / outputs ─────────────────────────────────────────────────────────

/// Classifier inputs, all in percent except the P/E multiple.
struct Fundamentals {
    std::optional<double> revenue_growth_yoy;
    std::optional<double> net_margin;
    std::optional<double> pe_ratio;
};

/// Stage plus how strongly the inputs support it (0..1).
struct Classification {
    LifecycleStage stage;
    double         confidence;
};

/// Factor name → weight (or multiplier).
using WeightSet = std::map<std::string, double>;

// ─── LifecycleClassifier ──────────────────────────────────────────────────────

class LifecycleClassifier {
public:
    /// Classify a company.  See the module header for the decision order.
    [[nodiscard]] static Classification classify(const Fundamentals& f) noexcept;

    /// Stage multipliers; factors not listed use 1.0.
    [[nodiscard]] static const WeightSet& weight_multipliers(LifecycleStage stage);

    /// Multiplier for one factor under `stage`.
    [[nodiscard]] static double multiplier(LifecycleStage stage,
                                           const std::string& factor);
};

// ─── WeightAdjuster ───────────────────────────────────────────────────────────

class WeightAdjuster {
public:
    /// Apply stage multipliers and renormalise to sum to 1.0.
    ///
    /// Negative or non-finite base weights are treated as 0.  If every
    /// adjusted weight is 0 the (zero) map is returned unchanged.
    [[nodiscard]] static WeightSet adjust(const WeightSet& base_weights,
                                          LifecycleStage stage);

    /// Divide every weight by the total.  No-op for an all-zero set.
    [[nodiscard]] static WeightSet normalize(WeightSet weights);
};

}  // namespace icscore::lifecycle
