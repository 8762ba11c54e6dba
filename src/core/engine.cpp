/// @file src/core/engine.cpp
/// @brief ScoringEngine: pipeline orchestration, universe runs and the
///        per-date SectorContext cache.

#include "icscore/engine.hpp"
#include "icscore/thread_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <utility>

namespace icscore::core {

namespace {

/// Aggregator settings with the optional-factor list taken from the registry.
scoring::AggregatorConfig aggregator_config(const EngineConfig& cfg,
                                            const factors::FactorRegistry& registry) {
    scoring::AggregatorConfig out = cfg.aggregator;
    out.optional_factors = registry.optional_factors();
    return out;
}

lifecycle::Fundamentals fundamentals_of(const MetricsSnapshot& snap) {
    return lifecycle::Fundamentals{
        .revenue_growth_yoy = snap.get("revenue_growth_yoy"),
        .net_margin         = snap.get("net_margin"),
        .pe_ratio           = snap.get("pe_ratio"),
    };
}

}  // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

ScoringEngine::ScoringEngine(const data::MetricRepository& repo,
                             RecordStore& store,
                             EngineConfig config)
    : ScoringEngine(repo, store, factors::FactorRegistry::with_default_factors(),
                    std::move(config)) {}

ScoringEngine::ScoringEngine(const data::MetricRepository& repo,
                             RecordStore& store,
                             factors::FactorRegistry registry,
                             EngineConfig config)
    : repo_(repo)
    , store_(store)
    , config_(std::move(config))
    , registry_(std::move(registry))
    , stats_(config_.min_sector_sample)
    , aggregator_(aggregator_config(config_, registry_))
    , stabilizer_(config_.stabilizer) {}

// ─── Repository access ────────────────────────────────────────────────────────

ScoringEngine::Universe
ScoringEngine::load_universe(const data::MetricRepository& repo, Date as_of) {
    Universe out;
    std::vector<std::string> sectors;
    try {
        sectors = repo.sectors(as_of);
    } catch (const data::RepositoryError& e) {
        spdlog::warn("universe {}: sector list unavailable: {}", icscore::to_string(as_of), e.what());
        return out;
    }

    for (const auto& sector : sectors) {
        try {
            out[sector] = repo.sector_universe(sector, as_of);
        } catch (const data::RepositoryError& e) {
            spdlog::warn("universe {}: sector '{}' skipped: {}", icscore::to_string(as_of), sector, e.what());
        }
    }
    return out;
}

stats::SectorContext
ScoringEngine::build_context(const Universe& universe, Date as_of) const {
    return stats_.build_context(as_of, universe, stats::tracked_metrics());
}

MetricsSnapshot
ScoringEngine::load_snapshot(const data::MetricRepository& repo,
                             const std::string& ticker, Date as_of) {
    try {
        return repo.ticker_fundamentals(ticker, as_of);
    } catch (const data::RepositoryError& e) {
        spdlog::warn("{}: fundamentals unavailable, scoring with no metrics: {}",
                     ticker, e.what());
        MetricsSnapshot empty;
        empty.ticker = ticker;
        empty.as_of  = as_of;
        return empty;
    }
}

std::vector<ScoreEvent>
ScoringEngine::load_events(const data::MetricRepository& repo,
                           const std::string& ticker,
                           const std::optional<ICScoreRecord>& previous,
                           Date as_of) {
    const Date since = previous ? previous->date : add_days(as_of, -1);
    try {
        return repo.events_since(ticker, since, as_of);
    } catch (const data::RepositoryError& e) {
        spdlog::warn("{}: events unavailable, assuming none: {}", ticker, e.what());
        return {};
    }
}

std::shared_ptr<const stats::SectorContext> ScoringEngine::sector_context(Date as_of) {
    {
        std::lock_guard<std::mutex> lock(context_mutex_);
        const auto it = context_cache_.find(as_of);
        if (it != context_cache_.end()) {
            return it->second;
        }
    }

    auto ctx = std::make_shared<const stats::SectorContext>(
        build_context(load_universe(repo_, as_of), as_of));

    std::lock_guard<std::mutex> lock(context_mutex_);
    // A concurrent caller may have built it first; keep whichever landed.
    return context_cache_.emplace(as_of, std::move(ctx)).first->second;
}

// ─── Pure pipeline ────────────────────────────────────────────────────────────

ICScoreRecord
ScoringEngine::assemble(const MetricsSnapshot& snapshot,
                        Date as_of,
                        std::vector<factors::FactorResult> results,
                        lifecycle::Classification classification,
                        lifecycle::WeightSet weights,
                        const std::optional<ICScoreRecord>& previous,
                        std::span<const ScoreEvent> events) const {
    const auto agg = aggregator_.aggregate(results, weights);

    ICScoreRecord rec;
    rec.ticker           = snapshot.ticker;
    rec.sector           = snapshot.sector;
    rec.date             = as_of;
    rec.category_scores  = agg.category_scores;
    rec.factors          = std::move(results);
    rec.stage            = classification.stage;
    rec.stage_confidence = classification.confidence;
    rec.weights          = std::move(weights);
    rec.completeness_pct = agg.completeness_pct;
    rec.confidence       = agg.confidence;

    const std::optional<double> prev_display =
        previous ? previous->overall_score : std::nullopt;
    rec.previous_score = prev_display;

    if (!agg.overall) {
        spdlog::debug("{} {}: insufficient data ({:.0f}% complete)",
                      rec.ticker, icscore::to_string(as_of), agg.completeness_pct);
        return rec;
    }

    rec.raw_score = *agg.overall;
    const auto stab = stabilizer_.stabilize(*agg.overall, prev_display, events);
    rec.overall_score     = stab.score;
    rec.smoothing_applied = stab.smoothing_applied;
    rec.reset_events      = stab.reset_events;
    return rec;
}

ICScoreRecord
ScoringEngine::score(const MetricsSnapshot& snapshot,
                     const stats::SectorContext& context,
                     Date as_of,
                     const std::optional<ICScoreRecord>& previous,
                     std::span<const ScoreEvent> events) const {
    const auto classification = lifecycle::LifecycleClassifier::classify(fundamentals_of(snapshot));
    auto weights = lifecycle::WeightAdjuster::adjust(registry_.base_weights(), classification.stage);
    auto results = registry_.calculate_all(snapshot, context);
    return assemble(snapshot, as_of, std::move(results), classification,
                    std::move(weights), previous, events);
}

// ─── Entry points ─────────────────────────────────────────────────────────────

void ScoringEngine::rank_against_store(ICScoreRecord& record) const {
    if (!record.overall_score) {
        return;
    }
    std::vector<ICScoreRecord> peers;
    for (auto& r : store_.latest_all()) {
        if (r.ticker != record.ticker && r.sector == record.sector && r.date == record.date) {
            peers.push_back(std::move(r));
        }
    }
    peers.push_back(record);
    assign_sector_ranks(peers);
    const ICScoreRecord& ranked = peers.back();
    record.sector_rank       = ranked.sector_rank;
    record.sector_total      = ranked.sector_total;
    record.sector_percentile = ranked.sector_percentile;
}

ICScoreRecord ScoringEngine::run_full_score(const std::string& ticker, Date as_of) {
    const auto ctx      = sector_context(as_of);
    const auto snapshot = load_snapshot(repo_, ticker, as_of);
    const auto previous = store_.latest(ticker, as_of);
    const auto events   = load_events(repo_, ticker, previous, as_of);

    ICScoreRecord rec = score(snapshot, *ctx, as_of, previous, events);
    rank_against_store(rec);
    store_.append(rec);
    return rec;
}

ICScoreRecord ScoringEngine::run_price_sensitive_refresh(const std::string& ticker, Date as_of) {
    // Latest record on or before as_of.
    const auto previous = store_.latest(ticker, add_days(as_of, 1));
    if (!previous) {
        spdlog::info("{}: no previous record, running full score", ticker);
        return run_full_score(ticker, as_of);
    }

    const auto ctx      = sector_context(as_of);
    const auto snapshot = load_snapshot(repo_, ticker, as_of);
    const auto events   = load_events(repo_, ticker, previous, as_of);

    const auto& refresh = config_.price_sensitive_factors;
    std::vector<factors::FactorResult> results;
    results.reserve(registry_.size());
    for (const auto& calc : registry_) {
        const std::string name = calc->name();
        const bool recompute =
            std::find(refresh.begin(), refresh.end(), name) != refresh.end();
        const auto* kept = previous->factor(name);
        if (recompute || kept == nullptr) {
            results.push_back(calc->calculate(snapshot, *ctx));
        } else {
            results.push_back(*kept);
        }
    }

    MetricsSnapshot identity;
    identity.ticker = ticker;
    identity.sector = snapshot.sector.empty() ? previous->sector : snapshot.sector;

    ICScoreRecord rec = assemble(identity, as_of, std::move(results),
                                 {previous->stage, previous->stage_confidence},
                                 previous->weights, previous, events);
    rank_against_store(rec);
    store_.append(rec);
    return rec;
}

std::vector<ICScoreRecord> ScoringEngine::run_universe(Date as_of) {
    const Universe universe = load_universe(repo_, as_of);

    std::shared_ptr<const stats::SectorContext> ctx;
    {
        std::lock_guard<std::mutex> lock(context_mutex_);
        const auto it = context_cache_.find(as_of);
        if (it != context_cache_.end()) {
            ctx = it->second;
        }
    }
    if (!ctx) {
        auto built = std::make_shared<const stats::SectorContext>(build_context(universe, as_of));
        std::lock_guard<std::mutex> lock(context_mutex_);
        ctx = context_cache_.emplace(as_of, std::move(built)).first->second;
    }

    ThreadPool pool(config_.threads);
    std::vector<std::pair<std::string, std::future<ICScoreRecord>>> pending;

    for (const auto& [sector, snapshots] : universe) {
        for (const auto& snap : snapshots) {
            pending.emplace_back(snap.ticker, pool.submit([this, &snap, ctx, as_of] {
                const auto previous = store_.latest(snap.ticker, as_of);
                const auto events   = load_events(repo_, snap.ticker, previous, as_of);
                return score(snap, *ctx, as_of, previous, events);
            }));
        }
    }

    std::vector<ICScoreRecord> records;
    records.reserve(pending.size());
    std::size_t failed = 0;
    for (auto& [ticker, fut] : pending) {
        try {
            records.push_back(fut.get());
        } catch (const data::LookAheadViolation&) {
            throw;
        } catch (const std::exception& e) {
            ++failed;
            spdlog::warn("{}: scoring failed, skipped: {}", ticker, e.what());
        }
    }

    assign_sector_ranks(records);
    for (const auto& rec : records) {
        store_.append(rec);
    }

    const auto scored = std::count_if(records.begin(), records.end(),
                                      [](const ICScoreRecord& r) { return r.overall_score.has_value(); });
    spdlog::info("universe {}: {} tickers, {} scored, {} insufficient, {} failed",
                 icscore::to_string(as_of), records.size(), scored,
                 records.size() - static_cast<std::size_t>(scored), failed);
    return records;
}

std::vector<ICScoreRecord>
ScoringEngine::score_point_in_time(const data::MetricRepository& repo, Date as_of) const {
    const Universe universe = load_universe(repo, as_of);
    const stats::SectorContext ctx = build_context(universe, as_of);

    std::vector<ICScoreRecord> out;
    for (const auto& [sector, snapshots] : universe) {
        for (const auto& snap : snapshots) {
            try {
                out.push_back(score(snap, ctx, as_of, std::nullopt, {}));
            } catch (const data::LookAheadViolation&) {
                throw;
            } catch (const std::exception& e) {
                spdlog::warn("{} {}: scoring failed, skipped: {}", snap.ticker, icscore::to_string(as_of), e.what());
            }
        }
    }
    return out;
}

}  // namespace icscore::core
