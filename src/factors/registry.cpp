/// @file src/factors/registry.cpp
/// @brief FactorRegistry: ordered name → calculator map.

#include "icscore/factors.hpp"

#include <algorithm>

namespace icscore::factors {

FactorRegistry FactorRegistry::with_default_factors() {
    FactorRegistry r;
    // Quality
    r.add(std::make_unique<GrowthFactor>());
    r.add(std::make_unique<ProfitabilityFactor>());
    r.add(std::make_unique<FinancialHealthFactor>());
    r.add(std::make_unique<DividendQualityFactor>());
    // Valuation
    r.add(std::make_unique<ValueFactor>());
    r.add(std::make_unique<IntrinsicValueFactor>());
    r.add(std::make_unique<HistoricalValueFactor>());
    // Signals
    r.add(std::make_unique<MomentumFactor>());
    r.add(std::make_unique<SmartMoneyFactor>());
    r.add(std::make_unique<EarningsRevisionsFactor>());
    r.add(std::make_unique<TechnicalFactor>());
    r.add(std::make_unique<SentimentFactor>());
    return r;
}

bool FactorRegistry::add(std::unique_ptr<FactorCalculator> calculator) {
    if (!calculator || find(calculator->name()) != nullptr) {
        return false;
    }
    calculators_.push_back(std::move(calculator));
    return true;
}

const FactorCalculator* FactorRegistry::find(const std::string& name) const noexcept {
    const auto it = std::find_if(calculators_.begin(), calculators_.end(),
                                 [&](const auto& c) { return c->name() == name; });
    return it == calculators_.end() ? nullptr : it->get();
}

std::map<std::string, double> FactorRegistry::base_weights() const {
    std::map<std::string, double> out;
    for (const auto& c : calculators_) {
        out[c->name()] = c->base_weight();
    }
    return out;
}

std::map<std::string, Category> FactorRegistry::categories() const {
    std::map<std::string, Category> out;
    for (const auto& c : calculators_) {
        out[c->name()] = c->category();
    }
    return out;
}

std::vector<std::string> FactorRegistry::optional_factors() const {
    std::vector<std::string> out;
    for (const auto& c : calculators_) {
        if (c->is_optional()) {
            out.push_back(c->name());
        }
    }
    return out;
}

std::vector<FactorResult>
FactorRegistry::calculate_all(const MetricsSnapshot& snapshot,
                              const stats::SectorContext& context) const {
    std::vector<FactorResult> out;
    out.reserve(calculators_.size());
    for (const auto& c : calculators_) {
        out.push_back(c->calculate(snapshot, context));
    }
    return out;
}

}  // namespace icscore::factors
