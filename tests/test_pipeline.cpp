#include <gtest/gtest.h>
#include <atomic>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "fake_bar_source.h"
#include "pipeline.h"
#include "scanner.h"

using namespace ds;
using ds::testing_support::FakeBarSource;
using ds::testing_support::bars_from_closes;
using ds::testing_support::divergence_bars;

namespace {

PipelineSettings small_settings() {
    PipelineSettings s;
    s.rsi_period = 3;
    s.pivot_left = 5;
    s.pivot_right = 5;
    return s;
}

/// Rising closes: RSI never forms a pivot low, so no divergences.
std::vector<OHLCVBar> quiet_bars() {
    std::vector<double> closes;
    for (int i = 0; i < 40; i++) closes.push_back(50.0 + i);
    return bars_from_closes(closes);
}

const Date kSignalDate = divergence_bars()[25].date;

/// Scanner stack over a FakeBarSource with a fixed "today".
struct Harness {
    FakeBarSource source;
    Pipeline pipeline{small_settings()};
    Date today = kSignalDate.add_days(30);
    SymbolDataCache cache{source, pipeline, [this] { return today; }};

    Scanner make_scanner(int concurrency = 4) {
        ScannerSettings s;
        s.max_concurrency = concurrency;
        return Scanner(cache, s, [this] { return today; });
    }
};

} // anonymous namespace


// ========== Pipeline Tests ==========

TEST(PipelineTest, EngineeredSeriesPivotsAndDivergence) {
    Pipeline pipeline(small_settings());
    auto a = pipeline.compute(divergence_bars());

    ASSERT_EQ(a.bars.size(), 40u);
    ASSERT_EQ(a.rsi.size(), 40u);
    for (int i = 0; i < 3; i++) EXPECT_FALSE(a.rsi[i].has_value());
    for (int i = 3; i < 40; i++) EXPECT_TRUE(a.rsi[i].has_value());

    EXPECT_EQ(a.pivots, (std::vector<int>{10, 25}));
    EXPECT_EQ(a.divergences, (std::vector<int>{25}));

    EXPECT_GT(*a.rsi[25], *a.rsi[10]);
    EXPECT_LT(a.bars[25].low, a.bars[10].low);
}

TEST(PipelineTest, DefaultSettingsNeedLongerHistory) {
    Pipeline pipeline;  // 14 / 5 / 5
    auto a = pipeline.compute(bars_from_closes({100, 101, 102, 101, 100}));
    for (const auto& v : a.rsi) EXPECT_FALSE(v.has_value());
    EXPECT_TRUE(a.pivots.empty());
    EXPECT_TRUE(a.divergences.empty());
}

TEST(PipelineTest, EmptySeries) {
    Pipeline pipeline(small_settings());
    auto a = pipeline.compute({});
    EXPECT_TRUE(a.bars.empty());
    EXPECT_TRUE(a.rsi.empty());
    EXPECT_TRUE(a.divergences.empty());
}

TEST(PipelineTest, RejectsUnorderedBars) {
    Pipeline pipeline(small_settings());
    auto bars = divergence_bars();
    std::swap(bars[5], bars[6]);
    EXPECT_THROW(pipeline.compute(bars), std::runtime_error);

    auto dup = divergence_bars();
    dup[7].date = dup[6].date;
    EXPECT_THROW(pipeline.compute(dup), std::runtime_error);
}

TEST(PipelineTest, InvalidSettingsThrow) {
    PipelineSettings s;
    s.rsi_period = 0;
    EXPECT_THROW(Pipeline{s}, std::invalid_argument);
    s.rsi_period = 1;
    EXPECT_THROW(Pipeline{s}, std::invalid_argument);

    s = PipelineSettings{};
    s.pivot_left = -1;
    EXPECT_THROW(Pipeline{s}, std::invalid_argument);
}

TEST(PipelineTest, IndexOfDate) {
    Pipeline pipeline(small_settings());
    auto a = pipeline.compute(divergence_bars());
    EXPECT_EQ(a.index_of(a.bars[0].date), 0);
    EXPECT_EQ(a.index_of(kSignalDate), 25);
    EXPECT_EQ(a.index_of(a.bars[39].date.add_days(1)), -1);
    EXPECT_EQ(a.index_of(Date{1999, 1, 1}), -1);
}


// ========== Scanner Tests ==========

TEST(ScannerTest, ReportsDivergenceOnItsDate) {
    Harness h;
    h.source.set_bars("DIV.NS", divergence_bars());
    h.source.set_bars("FLAT.NS", quiet_bars());
    auto scanner = h.make_scanner();

    auto result = scanner.scan(kSignalDate, {"FLAT.NS", "DIV.NS"});

    EXPECT_EQ(result.symbols_total, 2);
    EXPECT_EQ(result.symbols_processed, 2);
    EXPECT_TRUE(result.errors.empty());
    ASSERT_EQ(result.matches.size(), 1u);

    const auto bars = divergence_bars();
    const auto& s = result.matches[0];
    EXPECT_EQ(s.symbol, "DIV.NS");
    EXPECT_EQ(s.date, kSignalDate);
    EXPECT_DOUBLE_EQ(s.close, bars[25].close);
    EXPECT_DOUBLE_EQ(s.low, bars[25].low);
    EXPECT_DOUBLE_EQ(s.high, bars[25].high);
    EXPECT_EQ(s.volume, bars[25].volume);

    auto a = h.cache.get("DIV.NS");
    EXPECT_DOUBLE_EQ(s.rsi, *a->rsi[25]);
}

TEST(ScannerTest, OtherDatesHaveNoSignals) {
    Harness h;
    h.source.set_bars("DIV.NS", divergence_bars());
    auto scanner = h.make_scanner();

    EXPECT_TRUE(scanner.scan(divergence_bars()[10].date, {"DIV.NS"}).matches.empty());
    EXPECT_TRUE(scanner.scan(divergence_bars()[24].date, {"DIV.NS"}).matches.empty());
    EXPECT_TRUE(scanner.scan_with_projection(divergence_bars()[24].date, {"DIV.NS"}, false).matches.empty());
    EXPECT_TRUE(scanner.scan(kSignalDate.add_days(1), {"DIV.NS"}).matches.empty());
    EXPECT_EQ(h.source.fetch_count("DIV.NS"), 1);
}

TEST(ScannerTest, FailingSymbolsAreIsolated) {
    Harness h;
    auto unordered = divergence_bars();
    std::swap(unordered[1], unordered[2]);

    h.source.set_bars("DIV.NS", divergence_bars());
    h.source.set_missing("GONE.NS");
    h.source.set_bars("BAD.NS", unordered);
    auto scanner = h.make_scanner();

    auto result = scanner.scan(kSignalDate, {"GONE.NS", "DIV.NS", "EMPTY.NS", "BAD.NS"});

    EXPECT_EQ(result.symbols_processed, 4);
    ASSERT_EQ(result.matches.size(), 1u);
    EXPECT_EQ(result.matches[0].symbol, "DIV.NS");

    ASSERT_EQ(result.errors.size(), 3u);
    EXPECT_EQ(result.errors[0].symbol, "GONE.NS");
    EXPECT_EQ(result.errors[1].symbol, "EMPTY.NS");
    EXPECT_EQ(result.errors[2].symbol, "BAD.NS");
    for (const auto& e : result.errors) EXPECT_FALSE(e.message.empty());
}

TEST(ScannerTest, MatchesFollowUniverseOrder) {
    Harness h;
    std::vector<std::string> symbols;
    for (int i = 0; i < 20; i++) {
        symbols.push_back("S" + std::to_string(i) + ".NS");
        if (i % 3 == 0) {
            h.source.set_bars(symbols.back(), divergence_bars());
        } else {
            h.source.set_bars(symbols.back(), quiet_bars());
        }
    }
    h.source.set_delay(std::chrono::milliseconds(2));
    auto scanner = h.make_scanner(4);

    auto result = scanner.scan(kSignalDate, symbols);

    EXPECT_EQ(result.symbols_processed, 20);
    ASSERT_EQ(result.matches.size(), 7u);
    for (size_t k = 0; k < result.matches.size(); k++) {
        EXPECT_EQ(result.matches[k].symbol, symbols[k * 3]);
    }
}

TEST(ScannerTest, DuplicatesScannedOnceWithProgress) {
    Harness h;
    h.source.set_bars("A.NS", quiet_bars());
    h.source.set_bars("B.NS", divergence_bars());
    auto scanner = h.make_scanner(2);

    std::vector<int> done_values;
    std::set<std::string> seen;
    int last_total = 0;
    auto result = scanner.scan(kSignalDate, {"A.NS", "B.NS", "A.NS", "B.NS"},
        [&](int done, int total, const std::string& symbol) {
            done_values.push_back(done);
            seen.insert(symbol);
            last_total = total;
        });

    EXPECT_EQ(result.symbols_total, 2);
    EXPECT_EQ(result.matches.size(), 1u);
    EXPECT_EQ(done_values, (std::vector<int>{1, 2}));
    EXPECT_EQ(last_total, 2);
    EXPECT_EQ(seen, (std::set<std::string>{"A.NS", "B.NS"}));
    EXPECT_EQ(h.source.fetch_count("A.NS"), 1);
}

TEST(ScannerTest, EmptyUniverse) {
    Harness h;
    auto scanner = h.make_scanner();
    auto result = scanner.scan(kSignalDate, {});
    EXPECT_EQ(result.symbols_total, 0);
    EXPECT_EQ(result.symbols_processed, 0);
    EXPECT_TRUE(result.matches.empty());
}

TEST(ScannerTest, StopEndsScanEarly) {
    Harness h;
    std::vector<std::string> symbols;
    for (int i = 0; i < 6; i++) {
        symbols.push_back("S" + std::to_string(i) + ".NS");
        h.source.set_bars(symbols.back(), quiet_bars());
    }
    auto scanner = h.make_scanner(1);

    auto result = scanner.scan(kSignalDate, symbols,
        [&](int done, int, const std::string&) {
            if (done == 2) scanner.stop();
        });

    EXPECT_EQ(result.symbols_total, 6);
    EXPECT_EQ(result.symbols_processed, 2);
    EXPECT_EQ(h.source.total_fetches(), 2);
}

TEST(ScannerTest, StopBeforeScanProcessesNothing) {
    Harness h;
    std::vector<std::string> symbols;
    for (int i = 0; i < 5; i++) {
        symbols.push_back("S" + std::to_string(i) + ".NS");
        h.source.set_bars(symbols.back(), quiet_bars());
    }
    auto scanner = h.make_scanner(1);
    scanner.stop();

    auto result = scanner.scan(kSignalDate, symbols);
    EXPECT_EQ(result.symbols_total, 5);
    EXPECT_EQ(result.symbols_processed, 0);
    EXPECT_TRUE(result.matches.empty());
    EXPECT_EQ(h.source.total_fetches(), 0);

    // Still stopped for the next scan.
    EXPECT_EQ(scanner.scan_with_projection(kSignalDate, symbols, false).symbols_processed, 0);
    EXPECT_EQ(h.source.total_fetches(), 0);
}

TEST(ScannerTest, DedupeKeepsFirstOccurrence) {
    EXPECT_EQ(dedupe_symbols({"B", "A", "B", "C", "A"}),
              (std::vector<std::string>{"B", "A", "C"}));
    EXPECT_TRUE(dedupe_symbols({}).empty());
}

TEST(ScannerTest, InvalidSettingsThrow) {
    Harness h;
    EXPECT_THROW(h.make_scanner(0), std::invalid_argument);

    ScannerSettings s;
    s.horizon = 0;
    EXPECT_THROW(Scanner(h.cache, s), std::invalid_argument);
}


// ========== Projection Scan Tests ==========

TEST(ScannerTest, ProjectionForHistoricalSignal) {
    Harness h;
    h.source.set_bars("DIV.NS", divergence_bars());
    auto scanner = h.make_scanner();

    auto result = scanner.scan_with_projection(kSignalDate, {"DIV.NS"}, false);
    ASSERT_EQ(result.matches.size(), 1u);

    const auto& r = result.matches[0];
    EXPECT_EQ(r.symbol, "DIV.NS");
    EXPECT_EQ(r.date, kSignalDate);
    EXPECT_FALSE(r.is_today_signal);
    EXPECT_EQ(r.projection.index, 25);
    EXPECT_EQ(r.projection.basis, PriceBasis::Close);
    EXPECT_TRUE(r.projection.available);
    EXPECT_EQ(r.projection.available_days, 5);

    // Close 88.0 rising by 1.0 per bar.
    ASSERT_TRUE(r.projection.forward_returns[0].has_value());
    EXPECT_NEAR(*r.projection.forward_returns[0], 1.14, 1e-9);
    EXPECT_NEAR(*r.projection.forward_returns[4], 5.68, 1e-9);
}

TEST(ScannerTest, ProjectionOnTodayIsFlagged) {
    Harness h;
    auto bars = divergence_bars();
    bars.resize(31);  // divergence bar plus five confirming bars
    h.source.set_bars("DIV.NS", bars);
    h.today = kSignalDate;
    auto scanner = h.make_scanner();

    auto result = scanner.scan_with_projection(kSignalDate, {"DIV.NS"}, true);
    ASSERT_EQ(result.matches.size(), 1u);
    EXPECT_TRUE(result.matches[0].is_today_signal);
    EXPECT_EQ(result.matches[0].projection.basis, PriceBasis::NextOpen);
}

TEST(ScannerTest, ProjectionWithoutSignalIsEmpty) {
    Harness h;
    h.source.set_bars("FLAT.NS", quiet_bars());
    auto scanner = h.make_scanner();

    auto result = scanner.scan_with_projection(kSignalDate, {"FLAT.NS"}, false);
    EXPECT_TRUE(result.matches.empty());
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.symbols_processed, 1);
}
