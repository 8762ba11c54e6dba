#pragma once

/// @file include/icscore/engine.hpp
/// @brief Scoring Engine: orchestrates the IC Score pipeline.
///
/// # Module: Scoring Engine
///
/// ## Pipeline (per ticker)
///   MetricsSnapshot → LifecycleClassifier → WeightAdjuster
///                   → FactorRegistry (12 calculators, with SectorContext)
///                   → ScoreAggregator → ScoreStabilizer → ICScoreRecord
///
/// ## Usage
/// ```cpp
/// data::InMemoryRepository repo;
/// data::DataLoader::populate(repo, metrics, prices, events);
/// InMemoryRecordStore store;
/// ScoringEngine engine(repo, store);
/// for (const auto& rec : engine.run_universe(as_of))
///     fmt::print("{}", rec.to_string());
/// ```
///
/// ## Concurrency
/// The day's SectorContext is fully built (and cached) before any ticker is
/// scored.  `run_universe` then scores tickers on a ThreadPool; each task
/// reads only immutable inputs and its own ticker's previous record.
///
/// ## Failure isolation
/// RepositoryError for one ticker is logged and treated as missing data.
/// Any other failure in one ticker is logged and that ticker is skipped.
/// LookAheadViolation always propagates.

#include "icscore/aggregator.hpp"
#include "icscore/config.hpp"
#include "icscore/factors.hpp"
#include "icscore/lifecycle.hpp"
#include "icscore/record.hpp"
#include "icscore/repository.hpp"
#include "icscore/sector_stats.hpp"
#include "icscore/stabilizer.hpp"
#include "icscore/types.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace icscore::core {

class ScoringEngine {
public:
    /// Engine over the twelve default factors.
    ScoringEngine(const data::MetricRepository& repo,
                  RecordStore& store,
                  EngineConfig config = EngineConfig{});

    /// Engine over a custom factor registry.
    ScoringEngine(const data::MetricRepository& repo,
                  RecordStore& store,
                  factors::FactorRegistry registry,
                  EngineConfig config);

    // ── Pure pipeline ─────────────────────────────────────────────────────────

    /// Score one snapshot.  Touches neither the repository nor the store.
    ///
    /// # Arguments
    /// * `snapshot`: point-in-time metrics of the ticker
    /// * `context` : the day's sector distributions
    /// * `as_of`   : calculation date stamped on the record
    /// * `previous`: last record of the ticker, if any
    /// * `events`  : events since the previous record
    [[nodiscard]] ICScoreRecord
    score(const MetricsSnapshot& snapshot,
          const stats::SectorContext& context,
          Date as_of,
          const std::optional<ICScoreRecord>& previous,
          std::span<const ScoreEvent> events) const;

    // ── Entry points ──────────────────────────────────────────────────────────

    /// Full recomputation of one ticker; appends and returns the record.
    ICScoreRecord run_full_score(const std::string& ticker, Date as_of);

    /// Recompute only the price-sensitive factors, reusing every other factor,
    /// the lifecycle stage and the weights from the ticker's latest record.
    /// Falls back to run_full_score() when there is no previous record.
    ICScoreRecord run_price_sensitive_refresh(const std::string& ticker, Date as_of);

    /// Score every active ticker in parallel, rank within sectors, append all.
    std::vector<ICScoreRecord> run_universe(Date as_of);

    /// Raw, unsmoothed scores of the whole universe visible through `repo` on
    /// `as_of`.  Used by the backtester; the store is not read or written.
    [[nodiscard]] std::vector<ICScoreRecord>
    score_point_in_time(const data::MetricRepository& repo, Date as_of) const;

    /// The SectorContext for `as_of`, built on first use and then cached.
    [[nodiscard]] std::shared_ptr<const stats::SectorContext> sector_context(Date as_of);

    [[nodiscard]] const factors::FactorRegistry& registry() const noexcept { return registry_; }
    [[nodiscard]] const EngineConfig&            config()   const noexcept { return config_; }

private:
    using Universe = std::map<std::string, std::vector<MetricsSnapshot>>;

    /// Sector → snapshots visible on `as_of`.  Sectors whose query fails are
    /// logged and left out.
    [[nodiscard]] static Universe load_universe(const data::MetricRepository& repo, Date as_of);

    [[nodiscard]] stats::SectorContext build_context(const Universe& universe, Date as_of) const;

    /// Snapshot of one ticker; an empty snapshot when the repository fails.
    [[nodiscard]] static MetricsSnapshot
    load_snapshot(const data::MetricRepository& repo, const std::string& ticker, Date as_of);

    /// Events after the previous record (or on `as_of` alone when there is
    /// none).  No events when the repository fails.
    [[nodiscard]] static std::vector<ScoreEvent>
    load_events(const data::MetricRepository& repo, const std::string& ticker,
                const std::optional<ICScoreRecord>& previous, Date as_of);

    /// Aggregate and stabilise already-computed factor results.
    [[nodiscard]] ICScoreRecord
    assemble(const MetricsSnapshot& snapshot,
             Date as_of,
             std::vector<factors::FactorResult> results,
             lifecycle::Classification classification,
             lifecycle::WeightSet weights,
             const std::optional<ICScoreRecord>& previous,
             std::span<const ScoreEvent> events) const;

    /// Rank `record` against same-day peers already in the store.
    void rank_against_store(ICScoreRecord& record) const;

    const data::MetricRepository&  repo_;
    RecordStore&                   store_;
    EngineConfig                   config_;
    factors::FactorRegistry        registry_;
    stats::SectorStatisticsEngine  stats_;
    scoring::ScoreAggregator       aggregator_;
    scoring::ScoreStabilizer       stabilizer_;

    std::mutex                                                  context_mutex_;
    std::map<Date, std::shared_ptr<const stats::SectorContext>> context_cache_;
};

}  // namespace icscore::core
