/**
 * @file  prop_weights_sum.cpp
 * @brief Property: ∀ stage, ∀ non-negative base weights with positive total:
 *        Σ adjust(base, stage) = 1 and every adjusted weight is ≥ 0.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_weights_sum
 *
 * The lifecycle multipliers are all positive, so a positive base total stays
 * positive after multiplication and renormalisation divides it back to one.
 */

#include <rapidcheck.h>
#include <cmath>
#include <iterator>
#include <string>
#include <vector>

#include "icscore/constants.hpp"
#include "icscore/factors.hpp"
#include "icscore/lifecycle.hpp"

using namespace icscore;
using namespace icscore::lifecycle;

int main() {
    const auto registry = factors::FactorRegistry::with_default_factors();
    std::vector<std::string> names;
    for (const auto& calc : registry) {
        names.push_back(calc->name());
    }

    // ── Property 1: adjusted weights sum to one ──────────────────────────────
    rc::check(
        "weights_sum: adjust() renormalises to 1 for every stage",
        [&](const std::vector<double>& raw, unsigned stage_pick) {
            WeightSet base;
            double total = 0.0;
            for (std::size_t i = 0; i < names.size(); ++i) {
                const double r = i < raw.size() ? raw[i] : 1.0;
                const double w = std::isfinite(r) ? std::abs(std::tanh(r)) : 0.0;
                base[names[i]] = w;
                total += w;
            }
            RC_PRE(total > 1e-6);

            const auto stage = ALL_STAGES[stage_pick % std::size(ALL_STAGES)];
            const auto adjusted = WeightAdjuster::adjust(base, stage);

            double sum = 0.0;
            for (const auto& [name, w] : adjusted) {
                RC_ASSERT(w >= 0.0);
                sum += w;
            }
            RC_ASSERT(adjusted.size() == base.size());
            RC_ASSERT(std::abs(sum - 1.0) < constants::WEIGHT_SUM_TOLERANCE);
        }
    );

    // ── Property 2: the default registry weights always renormalise ──────────
    rc::check(
        "weights_sum: registry base weights sum to 1 after any stage",
        [&](unsigned stage_pick) {
            const auto stage = ALL_STAGES[stage_pick % std::size(ALL_STAGES)];
            const auto adjusted = WeightAdjuster::adjust(registry.base_weights(), stage);
            double sum = 0.0;
            for (const auto& [name, w] : adjusted) sum += w;
            RC_ASSERT(std::abs(sum - 1.0) < constants::WEIGHT_SUM_TOLERANCE);
        }
    );

    return 0;
}
