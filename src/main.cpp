/// @file src/main.cpp
/// @brief icscore CLI entry point.
///
/// Usage:
///   icscore --score <metrics.csv> --date YYYY-MM-DD [--history <records.csv>] [options]
///   icscore --backtest <metrics.csv> --prices <prices.csv> --start D --end D [options]
///   icscore --help

#include "icscore/backtest.hpp"
#include "icscore/config.hpp"
#include "icscore/data_loader.hpp"
#include "icscore/engine.hpp"
#include "icscore/explainer.hpp"
#include "icscore/record.hpp"

#include <fmt/core.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  icscore --score <metrics.csv> --date YYYY-MM-DD\n"
        "          [--events <events.csv>] [--prices <prices.csv>]\n"
        "          [--history <records.csv>] [--output <records.csv>]\n"
        "  icscore --backtest <metrics.csv> --prices <prices.csv> --start YYYY-MM-DD --end YYYY-MM-DD\n"
        "          [--frequency daily|weekly|monthly|quarterly] [--benchmark TICKER]\n"
        "          [--weighting equal|cap] [--cost BPS] [--slippage BPS] [--output <periods.csv>]\n"
        "  icscore --help\n"
        "\n"
        "CSV formats (header required):\n"
        "  metrics: date,ticker,sector,metric,value\n"
        "  prices:  date,ticker,close\n"
        "  events:  date,ticker,event_type\n"
        "\n"
        "--output writes <records.csv> and <records>_factors.csv; --history reads\n"
        "the same pair and explains each score change against it.\n"
        "\n"
        "Engine settings are read from ICSCORE_* environment variables.\n"
    );
}

/// Logs go to stderr so that stdout carries only results.
void init_logging(const std::string& level) {
    auto sink   = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("icscore", sink);
    logger->set_level(spdlog::level::from_str(level));
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

/// `--flag value` pairs after the mode argument.
std::map<std::string, std::string> parse_options(int argc, char* argv[]) {
    std::map<std::string, std::string> out;
    for (int i = 3; i < argc; ++i) {
        const std::string key(argv[i]);
        if (key.rfind("--", 0) != 0 || i + 1 >= argc) {
            throw std::runtime_error(fmt::format("unexpected argument '{}'", key));
        }
        out[key] = argv[++i];
    }
    return out;
}

icscore::Date require_date(const std::map<std::string, std::string>& opts,
                           const std::string& key) {
    const auto it = opts.find(key);
    if (it == opts.end()) {
        throw std::runtime_error(fmt::format("{} is required", key));
    }
    const auto d = icscore::parse_date(it->second);
    if (!d) {
        throw std::runtime_error(fmt::format("{}: invalid date '{}'", key, it->second));
    }
    return *d;
}

double option_double(const std::map<std::string, std::string>& opts,
                     const std::string& key, double default_val) {
    const auto it = opts.find(key);
    if (it == opts.end()) {
        return default_val;
    }
    try {
        return std::stod(it->second);
    } catch (const std::exception&) {
        throw std::runtime_error(fmt::format("{}: invalid number '{}'", key, it->second));
    }
}

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error(fmt::format("cannot open '{}'", path));
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

/// "out/scores.csv" → "out/scores_factors.csv".
std::string factors_path_for(const std::string& records_path) {
    const std::filesystem::path p(records_path);
    std::filesystem::path out = p.parent_path() / (p.stem().string() + "_factors");
    out += p.has_extension() ? p.extension() : std::filesystem::path(".csv");
    return out.string();
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error(fmt::format("cannot open '{}' for writing", path));
    }
    out << content;
    spdlog::info("wrote {}", path);
}

/// Load the CSV inputs named on the command line into `repo`.
void load_inputs(icscore::data::InMemoryRepository& repo,
                 const std::string& metrics_path,
                 const std::map<std::string, std::string>& opts) {
    using icscore::data::DataLoader;

    auto metrics = DataLoader::load_metrics_csv(metrics_path);
    if (!metrics) {
        throw std::runtime_error(fmt::format("cannot open metrics file '{}'", metrics_path));
    }

    std::vector<icscore::data::PriceRow> prices;
    if (const auto it = opts.find("--prices"); it != opts.end()) {
        auto loaded = DataLoader::load_prices_csv(it->second);
        if (!loaded) {
            throw std::runtime_error(fmt::format("cannot open prices file '{}'", it->second));
        }
        prices = std::move(*loaded);
    }

    std::vector<icscore::ScoreEvent> events;
    if (const auto it = opts.find("--events"); it != opts.end()) {
        auto loaded = DataLoader::load_events_csv(it->second);
        if (!loaded) {
            throw std::runtime_error(fmt::format("cannot open events file '{}'", it->second));
        }
        events = std::move(*loaded);
    }

    DataLoader::populate(repo, *metrics, prices, events);
    spdlog::info("loaded {} metric rows, {} prices, {} events",
                 metrics->size(), prices.size(), events.size());
}

int run_score(const std::string& metrics_path,
              const std::map<std::string, std::string>& opts,
              const icscore::core::EngineConfig& config) {
    const icscore::Date as_of = require_date(opts, "--date");

    icscore::data::InMemoryRepository repo;
    load_inputs(repo, metrics_path, opts);

    icscore::core::InMemoryRecordStore store;
    if (const auto it = opts.find("--history"); it != opts.end()) {
        auto history = icscore::core::records_from_csv(read_file(it->second),
                                                       read_file(factors_path_for(it->second)));
        spdlog::info("loaded {} history records", history.size());
        for (auto& rec : history) {
            store.append(std::move(rec));
        }
    }

    icscore::core::ScoringEngine engine(repo, store, config);
    const auto records = engine.run_universe(as_of);

    if (records.empty()) {
        fmt::print(stderr, "Error: no tickers in the universe on {}\n", icscore::to_string(as_of));
        return 1;
    }

    for (const auto& rec : records) {
        fmt::print("{}\n", rec.to_string());
    }

    const icscore::core::ScoreExplainer explainer;
    for (const auto& rec : records) {
        if (const auto previous = store.latest(rec.ticker, rec.date)) {
            fmt::print("{}\n", explainer.explain(rec, previous).to_string());
        }
    }

    if (const auto it = opts.find("--output"); it != opts.end()) {
        write_file(it->second, icscore::core::records_to_csv(records));
        write_file(factors_path_for(it->second), icscore::core::factors_to_csv(records));
    }
    return 0;
}

int run_backtest(const std::string& metrics_path,
                 const std::map<std::string, std::string>& opts,
                 const icscore::core::EngineConfig& config) {
    namespace bt = icscore::backtest;

    if (opts.find("--prices") == opts.end()) {
        throw std::runtime_error("--prices is required for a backtest");
    }
    const icscore::Date start = require_date(opts, "--start");
    const icscore::Date end   = require_date(opts, "--end");
    if (end <= start) {
        throw std::runtime_error("--end must be after --start");
    }

    bt::BacktestConfig bt_config;
    bt_config.threads              = config.threads;
    bt_config.transaction_cost_bps = option_double(opts, "--cost", bt_config.transaction_cost_bps);
    bt_config.slippage_bps         = option_double(opts, "--slippage", bt_config.slippage_bps);
    if (const auto it = opts.find("--frequency"); it != opts.end()) {
        const auto f = bt::parse_frequency(it->second);
        if (!f) {
            throw std::runtime_error(fmt::format("unknown frequency '{}'", it->second));
        }
        bt_config.frequency = *f;
    }
    if (const auto it = opts.find("--benchmark"); it != opts.end()) {
        bt_config.benchmark = it->second;
    }
    if (const auto it = opts.find("--weighting"); it != opts.end()) {
        if (it->second == "equal") {
            bt_config.weighting = bt::Weighting::Equal;
        } else if (it->second == "cap") {
            bt_config.weighting = bt::Weighting::MarketCap;
        } else {
            throw std::runtime_error(fmt::format("unknown weighting '{}'", it->second));
        }
    }

    icscore::data::InMemoryRepository repo;
    load_inputs(repo, metrics_path, opts);

    icscore::core::InMemoryRecordStore store;
    const icscore::core::ScoringEngine engine(repo, store, config);
    const bt::Backtester backtester(repo, engine, bt_config);
    const auto results = backtester.run(start, end);

    if (results.periods_run == 0) {
        fmt::print(stderr, "Error: no period had enough scored tickers\n");
        return 1;
    }

    fmt::print("{}\n", results.to_string());
    if (const auto it = opts.find("--output"); it != opts.end()) {
        write_file(it->second, results.periods_to_csv());
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode != "--score" && mode != "--backtest") {
        fmt::print(stderr, "Unknown option: {}\n", mode);
        print_usage();
        return 1;
    }

    if (argc < 3) {
        fmt::print(stderr, "Error: {} requires a metrics CSV file path\n", mode);
        print_usage();
        return 1;
    }

    try {
        const auto config = icscore::core::EngineConfig::from_env();
        config.validate();
        init_logging(config.log_level);

        const std::string metrics_path(argv[2]);
        const auto opts = parse_options(argc, argv);

        if (mode == "--score") {
            return run_score(metrics_path, opts, config);
        }
        return run_backtest(metrics_path, opts, config);
    } catch (const std::exception& e) {
        fmt::print(stderr, "[FATAL] {}\n", e.what());
        return 1;
    }
}
