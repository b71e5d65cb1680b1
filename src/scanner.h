#pragma once

#include "projector.h"
#include "symbol_cache.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace ds {

/// Same-day divergence hit.
struct DivergenceSignal {
    std::string symbol;
    Date date;
    double rsi = 0.0;
    double close = 0.0;
    double low = 0.0;
    double high = 0.0;
    int64_t volume = 0;
};

/// Divergence on a queried date plus its forward-return projection.
struct ProjectionRecord {
    std::string symbol;
    Date date;
    double rsi = 0.0;
    bool is_today_signal = false;
    SignalProjection projection;
};

struct SymbolError {
    std::string symbol;
    std::string message;
};

template <typename T>
struct ScanResult {
    std::vector<T> matches;         // in universe order
    std::vector<SymbolError> errors;
    int symbols_total = 0;
    int symbols_processed = 0;
};

/// Called after each symbol completes. Calls are serialized.
using ProgressCallback = std::function<void(int done, int total, const std::string& symbol)>;

struct ScannerSettings {
    int max_concurrency = 8;
    int horizon = DEFAULT_HORIZON;

    void validate() const;
};

/// Keep the first occurrence of each symbol, preserving order.
std::vector<std::string> dedupe_symbols(const std::vector<std::string>& symbols);

/// Runs the cached pipeline across a symbol universe on a bounded worker pool.
/// A failing symbol is logged and recorded in ScanResult::errors; the rest of
/// the universe is still scanned.
class Scanner {
public:
    Scanner(SymbolDataCache& cache, const ScannerSettings& settings,
            SymbolDataCache::Clock today = &Date::today);

    /// Divergences whose bar is dated `date`.
    ScanResult<DivergenceSignal> scan(const Date& date,
                                      const std::vector<std::string>& symbols,
                                      const ProgressCallback& progress = nullptr);

    /// Divergences dated `date` with forward returns from that bar.
    ScanResult<ProjectionRecord> scan_with_projection(const Date& date,
                                                      const std::vector<std::string>& symbols,
                                                      bool use_next_open,
                                                      const ProgressCallback& progress = nullptr);

    /// Workers finish their current symbol and pick up no more. The running
    /// scan returns what was processed so far. Stopping is permanent: later
    /// scans on this scanner process nothing.
    void stop();

private:
    template <typename T, typename Extract>
    ScanResult<T> run(const std::vector<std::string>& symbols,
                      const ProgressCallback& progress,
                      Extract extract);

    SymbolDataCache& cache_;
    ScannerSettings settings_;
    SymbolDataCache::Clock today_;
    std::atomic<bool> running_{true};
};

} // namespace ds
