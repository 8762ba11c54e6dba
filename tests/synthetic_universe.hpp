#pragma once

/// @file tests/synthetic_universe.hpp
/// @brief Synthetic single-sector universes shared by the engine, backtest
///        and end-to-end tests.
///
/// Every company is driven by one quality knob q ∈ [0, 1].  Every metric
/// improves with q (higher for higher-is-better metrics, lower for the
/// valuation multiples), so raw IC Scores are strictly increasing in q.
/// All companies classify as Mature: revenue growth stays inside (0, 15) %
/// and P/E stays above 12.

#include "icscore/repository.hpp"
#include "icscore/types.hpp"

#include <fmt/format.h>

#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace icscore::testing {

inline std::string ticker_name(int i) {
    return fmt::format("T{:02d}", i);
}

/// Quality of company i in a universe of n, evenly spaced over [0, 1].
inline double quality_of(int i, int n) {
    return n <= 1 ? 0.5 : static_cast<double>(i) / static_cast<double>(n - 1);
}

/// The full metric set of a company of quality `q`.
inline std::vector<std::pair<std::string, double>> company_metrics(double q) {
    std::vector<std::pair<std::string, double>> out;
    const auto m = [&](const char* metric, double value) { out.emplace_back(metric, value); };

    // Quality
    m("revenue_growth_yoy", 2.0 + 10.0 * q);
    m("eps_growth_yoy",     -5.0 + 30.0 * q);
    m("fcf_growth_yoy",     -10.0 + 40.0 * q);
    m("eps_ttm",            1.0 + 4.0 * q);
    m("eps_ttm_prior",      0.9 + 3.0 * q);
    m("net_margin",         6.0 + 20.0 * q);
    m("roe",                5.0 + 25.0 * q);
    m("roa",                2.0 + 12.0 * q);
    m("gross_margin",       30.0 + 40.0 * q);
    m("operating_margin",   8.0 + 25.0 * q);
    m("debt_to_equity",     2.0 - 1.8 * q);
    m("current_ratio",      0.8 + 1.1 * q);
    m("interest_coverage",  2.0 + 20.0 * q);
    m("quick_ratio",        0.5 + 1.5 * q);
    m("dividend_yield",     1.0 + 2.0 * q);
    m("payout_ratio",       10.0 + 30.0 * q);
    m("dividend_growth_5y", 1.0 + 8.0 * q);
    m("dividend_streak_years", 2.0 + 20.0 * q);

    // Valuation
    m("pe_ratio",      30.0 - 15.0 * q);
    m("ps_ratio",      6.0 - 4.0 * q);
    m("pb_ratio",      5.0 - 3.0 * q);
    m("ev_ebitda",     20.0 - 10.0 * q);
    m("peg_ratio",     3.0 - 2.0 * q);
    m("fcf_yield",     1.0 + 7.0 * q);
    m("current_price", 100.0);
    m("fair_value",    80.0 + 50.0 * q);

    // Signals
    m("return_1m",   -3.0 + 6.0 * q);
    m("return_3m",   -6.0 + 12.0 * q);
    m("return_6m",   -10.0 + 20.0 * q);
    m("return_12m",  -15.0 + 35.0 * q);
    m("analyst_buy",  2.0 + 10.0 * q);
    m("analyst_hold", 6.0);
    m("analyst_sell", 4.0 - 3.0 * q);
    m("insider_net_shares_90d", -20000.0 + 40000.0 * q);
    m("institutional_shares",       1.0e6 * (1.0 + 0.05 * q));
    m("institutional_shares_prior", 1.0e6);
    m("eps_estimate_current", 2.0 + 0.2 * q);
    m("eps_estimate_90d",     2.0);
    m("estimate_upgrades_90d",   1.0 + 8.0 * q);
    m("estimate_downgrades_90d", 5.0 - 4.0 * q);
    m("revision_pct_30d", 0.01 * q);
    m("revision_pct_90d", 0.0);
    m("rsi_14",          35.0 + 30.0 * q);
    m("macd_histogram",  -1.0 + 2.0 * q);
    m("sma_50",          105.0 - 8.0 * q);
    m("sma_200",         108.0 - 12.0 * q);
    m("news_sentiment",  30.0 + 50.0 * q);
    m("article_count",   10.0);
    m("positive_articles", 2.0 + 6.0 * q);

    m("market_cap", 1.0e9 * (1.0 + q));
    return out;
}

/// Add the full metric set of one company dated `date`.
inline void add_company(data::InMemoryRepository& repo, Date date,
                        const std::string& ticker, const std::string& sector,
                        double q) {
    for (const auto& [metric, value] : company_metrics(q)) {
        repo.add_metric(date, ticker, sector, metric, value);
    }
}

/// `date,ticker,sector,metric,value` rows of `n` companies, header first.
inline std::string universe_csv(Date date, int n, const std::string& sector = "Technology") {
    std::string out = "date,ticker,sector,metric,value\n";
    for (int i = 0; i < n; ++i) {
        for (const auto& [metric, value] : company_metrics(quality_of(i, n))) {
            out += fmt::format("{},{},{},{},{}\n", to_string(date), ticker_name(i), sector,
                               metric, value);
        }
    }
    return out;
}

/// `n` companies T00..T(n−1) in `sector`, T00 the weakest.
inline void add_universe(data::InMemoryRepository& repo, Date date, int n,
                         const std::string& sector = "Technology") {
    for (int i = 0; i < n; ++i) {
        add_company(repo, date, ticker_name(i), sector, quality_of(i, n));
    }
}

/// Daily closes from `from` to `to` inclusive, compounding `daily_return`.
inline void add_price_path(data::InMemoryRepository& repo, const std::string& ticker,
                           Date from, Date to, double daily_return,
                           double start_price = 100.0) {
    double price = start_price;
    for (Date d = from; d <= to; d = add_days(d, 1)) {
        repo.add_price(d, ticker, price);
        price *= 1.0 + daily_return;
    }
}

/// Price paths where stronger companies earn more: daily return rises
/// linearly from −0.1 % (q = 0) to +0.2 % (q = 1).  The benchmark earns
/// +0.05 % per day.
inline void add_quality_prices(data::InMemoryRepository& repo, int n, Date from, Date to,
                               const std::string& benchmark = "SPY") {
    for (int i = 0; i < n; ++i) {
        add_price_path(repo, ticker_name(i), from, to, -0.001 + 0.003 * quality_of(i, n));
    }
    add_price_path(repo, benchmark, from, to, 0.0005);
}

}  // namespace icscore::testing
