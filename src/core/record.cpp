/// @file src/core/record.cpp
/// @brief ICScoreRecord formatting, sector ranking and InMemoryRecordStore.

#include "icscore/record.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace icscore::core {

namespace {

constexpr scoring::ConfidenceLevel ALL_CONFIDENCE_LEVELS[] = {
    scoring::ConfidenceLevel::High, scoring::ConfidenceLevel::Medium,
    scoring::ConfidenceLevel::Low,  scoring::ConfidenceLevel::Insufficient,
};

/// Shortest representation that reads back to the same double.
std::string num(double v) {
    return fmt::format("{}", v);
}

std::string opt_num(const std::optional<double>& v) {
    return v ? num(*v) : std::string{};
}

std::string opt_int(const std::optional<int>& v) {
    return v ? fmt::format("{}", *v) : std::string{};
}

const char* flag(bool b) noexcept {
    return b ? "true" : "false";
}

std::string opt_display(const std::optional<double>& v) {
    return v ? fmt::format("{:5.1f}", *v) : std::string{"  n/a"};
}

// ─── Reading ──────────────────────────────────────────────────────────────────

/// Split on every comma; empty fields are kept.
std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> out;
    std::size_t begin = 0;
    while (true) {
        const auto comma = line.find(',', begin);
        out.push_back(line.substr(begin, comma == std::string::npos ? std::string::npos
                                                                     : comma - begin));
        if (comma == std::string::npos) {
            return out;
        }
        begin = comma + 1;
    }
}

/// Field reader for one CSV line; every failure names the file and line.
class FieldReader {
public:
    FieldReader(const char* file, std::size_t line_no, std::vector<std::string> fields)
        : file_(file)
        , line_no_(line_no)
        , fields_(std::move(fields)) {}

    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error(fmt::format("{} line {}: {}", file_, line_no_, what));
    }

    const std::string& text(std::size_t i) const { return fields_[i]; }

    std::optional<double> opt_number(std::size_t i) const {
        const std::string& f = fields_[i];
        if (f.empty()) {
            return std::nullopt;
        }
        std::size_t pos = 0;
        double v = 0.0;
        try {
            v = std::stod(f, &pos);
        } catch (const std::exception&) {
            fail(fmt::format("invalid number '{}'", f));
        }
        if (pos != f.size()) {
            fail(fmt::format("invalid number '{}'", f));
        }
        return v;
    }

    double number(std::size_t i) const {
        const auto v = opt_number(i);
        if (!v) {
            fail(fmt::format("field {} is empty", i + 1));
        }
        return *v;
    }

    std::optional<int> opt_integer(std::size_t i) const {
        const auto v = opt_number(i);
        if (!v) {
            return std::nullopt;
        }
        if (*v != std::floor(*v)) {
            fail(fmt::format("invalid integer '{}'", fields_[i]));
        }
        return static_cast<int>(*v);
    }

    bool boolean(std::size_t i) const {
        if (fields_[i] == "true")  return true;
        if (fields_[i] == "false") return false;
        fail(fmt::format("invalid flag '{}'", fields_[i]));
    }

    std::optional<Date> opt_date(std::size_t i) const {
        if (fields_[i].empty()) {
            return std::nullopt;
        }
        const auto d = parse_date(fields_[i]);
        if (!d) {
            fail(fmt::format("invalid date '{}'", fields_[i]));
        }
        return d;
    }

    Date date(std::size_t i) const {
        const auto d = opt_date(i);
        if (!d) {
            fail(fmt::format("field {} is empty", i + 1));
        }
        return *d;
    }

    /// Enumerator whose to_string() equals field `i`.
    template <typename Enum, std::size_t N, typename Name>
    Enum named(std::size_t i, const Enum (&all)[N], Name&& name) const {
        for (Enum e : all) {
            if (fields_[i] == name(e)) {
                return e;
            }
        }
        fail(fmt::format("unknown value '{}'", fields_[i]));
    }

private:
    const char*              file_;
    std::size_t              line_no_;
    std::vector<std::string> fields_;
};

/// Hand each data line of `csv` to `fn` after checking the header.
template <typename Fn>
void for_each_row(const std::string& csv, const char* file, const std::string& header,
                  std::size_t columns, Fn&& fn) {
    std::istringstream stream(csv);
    std::string line;
    std::size_t line_no = 0;
    bool header_seen = false;
    while (std::getline(stream, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        if (!header_seen) {
            if (line != header) {
                throw std::runtime_error(fmt::format("{} line {}: unexpected header", file, line_no));
            }
            header_seen = true;
            continue;
        }
        auto fields = split_fields(line);
        if (fields.size() != columns) {
            throw std::runtime_error(fmt::format("{} line {}: expected {} fields, found {}",
                                                 file, line_no, columns, fields.size()));
        }
        fn(FieldReader(file, line_no, std::move(fields)));
    }
}

std::size_t column_count(const std::string& header) {
    return static_cast<std::size_t>(std::count(header.begin(), header.end(), ',')) + 1;
}

}  // namespace

// ─── ICScoreRecord ────────────────────────────────────────────────────────────

const factors::FactorResult*
ICScoreRecord::factor(const std::string& name) const noexcept {
    for (const auto& f : factors) {
        if (f.name == name) return &f;
    }
    return nullptr;
}

std::string ICScoreRecord::to_string() const {
    std::string out = fmt::format(
        "{} [{}] {}  score={}  raw={}  confidence={}  completeness={:.0f}%  stage={}\n",
        ticker, sector, icscore::to_string(date),
        opt_display(overall_score), opt_display(raw_score),
        scoring::to_string(confidence), completeness_pct,
        lifecycle::to_string(stage));

    for (Category c : ALL_CATEGORIES) {
        const auto it = category_scores.find(c);
        const std::optional<double> v = it == category_scores.end() ? std::nullopt : it->second;
        out += fmt::format("  {:<10} {}\n", icscore::to_string(c), opt_display(v));
    }

    for (const auto& f : factors) {
        const auto w = weights.find(f.name);
        out += fmt::format("    {:<20} {}  w={:.3f}{}\n",
                           f.name, opt_display(f.score),
                           w == weights.end() ? 0.0 : w->second,
                           f.reduced_reliability ? "  (reduced reliability)" : "");
    }

    if (sector_rank && sector_total) {
        out += fmt::format("  sector rank {}/{} ({:.1f} pct)\n",
                           *sector_rank, *sector_total, sector_percentile.value_or(0.0));
    }
    if (previous_score) {
        out += fmt::format("  previous {:.1f}{}{}\n", *previous_score,
                           smoothing_applied ? "  smoothed" : "",
                           reset_events.empty() ? "" : "  reset");
    }
    return out;
}

std::string ICScoreRecord::csv_header() {
    return "date,ticker,sector,overall_score,raw_score,quality,valuation,signals,"
           "lifecycle_stage,stage_confidence,completeness_pct,confidence,sector_rank,"
           "sector_total,sector_percentile,previous_score,smoothing_applied,reset_events";
}

std::string ICScoreRecord::to_csv_row() const {
    const auto cat = [this](Category c) -> std::optional<double> {
        const auto it = category_scores.find(c);
        return it == category_scores.end() ? std::nullopt : it->second;
    };
    std::string events;
    for (EventType e : reset_events) {
        if (!events.empty()) events += ';';
        events += icscore::to_string(e);
    }
    return fmt::format("{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{}",
                       icscore::to_string(date), ticker, sector,
                       opt_num(overall_score), opt_num(raw_score),
                       opt_num(cat(Category::Quality)),
                       opt_num(cat(Category::Valuation)),
                       opt_num(cat(Category::Signals)),
                       lifecycle::to_string(stage), num(stage_confidence),
                       num(completeness_pct), scoring::to_string(confidence),
                       opt_int(sector_rank), opt_int(sector_total),
                       opt_num(sector_percentile), opt_num(previous_score),
                       flag(smoothing_applied), events);
}

std::string ICScoreRecord::factor_csv_header() {
    return "date,ticker,factor,category,score,base_weight,weight_used,data_available,"
           "reduced_reliability,data_as_of,metric,raw,percentile";
}

std::vector<std::string> ICScoreRecord::factor_csv_rows() const {
    std::vector<std::string> out;
    const std::string key = fmt::format("{},{}", icscore::to_string(date), ticker);

    for (const auto& f : factors) {
        const auto w = weights.find(f.name);
        const std::string head = fmt::format(
            "{},{},{},{},{},{},{},{},{}",
            key, f.name, icscore::to_string(f.category), opt_num(f.score), num(f.weight),
            w == weights.end() ? std::string{} : num(w->second),
            flag(f.data_available), flag(f.reduced_reliability),
            f.data_as_of ? icscore::to_string(*f.data_as_of) : std::string{});
        if (f.supporting.empty()) {
            out.push_back(head + ",,,");
            continue;
        }
        for (const auto& [metric, sm] : f.supporting) {
            out.push_back(fmt::format("{},{},{},{}", head, metric, num(sm.raw_value),
                                      opt_num(sm.percentile)));
        }
    }

    for (const auto& [name, w] : weights) {
        if (factor(name) == nullptr) {
            out.push_back(fmt::format("{},{},,,,{},,,,,,", key, name, num(w)));
        }
    }
    return out;
}

// ─── CSV persistence ──────────────────────────────────────────────────────────

std::string records_to_csv(const std::vector<ICScoreRecord>& records) {
    std::string out = ICScoreRecord::csv_header() + "\n";
    for (const auto& r : records) {
        out += r.to_csv_row();
        out += '\n';
    }
    return out;
}

std::string factors_to_csv(const std::vector<ICScoreRecord>& records) {
    std::string out = ICScoreRecord::factor_csv_header() + "\n";
    for (const auto& r : records) {
        for (const auto& line : r.factor_csv_rows()) {
            out += line;
            out += '\n';
        }
    }
    return out;
}

std::vector<ICScoreRecord>
records_from_csv(const std::string& records_csv, const std::string& factors_csv) {
    std::vector<ICScoreRecord> out;
    std::map<std::pair<std::string, Date>, std::size_t> index;

    const std::string header = ICScoreRecord::csv_header();
    for_each_row(records_csv, "records csv", header, column_count(header),
                 [&](const FieldReader& f) {
        ICScoreRecord r;
        r.date   = f.date(0);
        r.ticker = f.text(1);
        r.sector = f.text(2);
        r.overall_score = f.opt_number(3);
        r.raw_score     = f.opt_number(4);
        r.category_scores[Category::Quality]   = f.opt_number(5);
        r.category_scores[Category::Valuation] = f.opt_number(6);
        r.category_scores[Category::Signals]   = f.opt_number(7);
        r.stage = f.named(8, lifecycle::ALL_STAGES,
                          [](lifecycle::LifecycleStage s) { return lifecycle::to_string(s); });
        r.stage_confidence = f.number(9);
        r.completeness_pct = f.number(10);
        r.confidence = f.named(11, ALL_CONFIDENCE_LEVELS,
                               [](scoring::ConfidenceLevel c) { return scoring::to_string(c); });
        r.sector_rank       = f.opt_integer(12);
        r.sector_total      = f.opt_integer(13);
        r.sector_percentile = f.opt_number(14);
        r.previous_score    = f.opt_number(15);
        r.smoothing_applied = f.boolean(16);

        std::istringstream events(f.text(17));
        std::string name;
        while (std::getline(events, name, ';')) {
            const auto e = parse_event_type(name);
            if (!e) {
                f.fail(fmt::format("unknown event type '{}'", name));
            }
            r.reset_events.push_back(*e);
        }

        if (!index.emplace(std::make_pair(r.ticker, r.date), out.size()).second) {
            f.fail(fmt::format("duplicate record {} {}", r.ticker, f.text(0)));
        }
        out.push_back(std::move(r));
    });

    const std::string factor_header = ICScoreRecord::factor_csv_header();
    for_each_row(factors_csv, "factors csv", factor_header, column_count(factor_header),
                 [&](const FieldReader& f) {
        const auto it = index.find(std::make_pair(f.text(1), f.date(0)));
        if (it == index.end()) {
            f.fail(fmt::format("no record for {} {}", f.text(1), f.text(0)));
        }
        ICScoreRecord& r = out[it->second];
        const std::string& name = f.text(2);

        if (const auto used = f.opt_number(6)) {
            r.weights[name] = *used;
        }
        if (f.text(3).empty()) {
            return;  // weight without a factor result
        }

        auto fr = std::find_if(r.factors.begin(), r.factors.end(),
                               [&](const factors::FactorResult& x) { return x.name == name; });
        if (fr == r.factors.end()) {
            factors::FactorResult created;
            created.name     = name;
            created.category = f.named(3, ALL_CATEGORIES,
                                       [](Category c) { return icscore::to_string(c); });
            created.score               = f.opt_number(4);
            created.weight              = f.number(5);
            created.data_available      = f.boolean(7);
            created.reduced_reliability = f.boolean(8);
            created.data_as_of          = f.opt_date(9);
            r.factors.push_back(std::move(created));
            fr = std::prev(r.factors.end());
        }

        if (!f.text(10).empty()) {
            fr->supporting[f.text(10)] = factors::SupportingMetric{
                .raw_value  = f.number(11),
                .percentile = f.opt_number(12),
            };
        }
    });

    return out;
}

// ─── assign_sector_ranks ──────────────────────────────────────────────────────

void assign_sector_ranks(std::vector<ICScoreRecord>& records) {
    std::map<std::string, std::vector<ICScoreRecord*>> by_sector;
    for (auto& r : records) {
        r.sector_rank.reset();
        r.sector_total.reset();
        r.sector_percentile.reset();
        if (r.overall_score) {
            by_sector[r.sector].push_back(&r);
        }
    }

    for (auto& [sector, members] : by_sector) {
        std::stable_sort(members.begin(), members.end(),
                         [](const ICScoreRecord* a, const ICScoreRecord* b) {
                             return *a->overall_score > *b->overall_score;
                         });
        const int total = static_cast<int>(members.size());
        int rank = 0;
        for (int i = 0; i < total; ++i) {
            if (i == 0 || *members[i]->overall_score < *members[i - 1]->overall_score) {
                rank = i + 1;
            }
            members[i]->sector_rank  = rank;
            members[i]->sector_total = total;
            members[i]->sector_percentile =
                total == 1 ? 100.0
                           : static_cast<double>(total - rank) / static_cast<double>(total - 1) * 100.0;
        }
    }
}

// ─── InMemoryRecordStore ──────────────────────────────────────────────────────

std::optional<ICScoreRecord>
InMemoryRecordStore::latest(const std::string& ticker, Date before) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = records_.find(ticker);
    if (it == records_.end()) {
        return std::nullopt;
    }
    const auto& list = it->second;
    for (auto r = list.rbegin(); r != list.rend(); ++r) {
        if (r->date < before) {
            return *r;
        }
    }
    return std::nullopt;
}

std::vector<ICScoreRecord> InMemoryRecordStore::latest_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ICScoreRecord> out;
    out.reserve(records_.size());
    for (const auto& [ticker, list] : records_) {
        if (!list.empty()) {
            out.push_back(list.back());
        }
    }
    return out;
}

void InMemoryRecordStore::append(ICScoreRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& list = records_[record.ticker];
    const auto pos = std::upper_bound(
        list.begin(), list.end(), record.date,
        [](Date d, const ICScoreRecord& r) { return d < r.date; });
    list.insert(pos, std::move(record));
}

std::vector<ICScoreRecord> InMemoryRecordStore::history(const std::string& ticker) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = records_.find(ticker);
    return it == records_.end() ? std::vector<ICScoreRecord>{} : it->second;
}

std::size_t InMemoryRecordStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = 0;
    for (const auto& [ticker, list] : records_) {
        n += list.size();
    }
    return n;
}

}  // namespace icscore::core
