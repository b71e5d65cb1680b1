#include "scanner.h"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <optional>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <thread>
#include <unordered_set>
#include <utility>

namespace ds {

void ScannerSettings::validate() const {
    if (max_concurrency <= 0) {
        throw std::invalid_argument("max_concurrency must be positive, got " + std::to_string(max_concurrency));
    }
    if (horizon <= 0) {
        throw std::invalid_argument("horizon must be positive, got " + std::to_string(horizon));
    }
}

std::vector<std::string> dedupe_symbols(const std::vector<std::string>& symbols) {
    std::unordered_set<std::string> seen;
    std::vector<std::string> out;
    out.reserve(symbols.size());
    for (const auto& s : symbols) {
        if (seen.insert(s).second) out.push_back(s);
    }
    return out;
}


Scanner::Scanner(SymbolDataCache& cache, const ScannerSettings& settings, SymbolDataCache::Clock today)
    : cache_(cache), settings_(settings), today_(std::move(today)) {
    settings_.validate();
}


template <typename T, typename Extract>
ScanResult<T> Scanner::run(const std::vector<std::string>& requested,
                           const ProgressCallback& progress,
                           Extract extract)
{
    const auto symbols = dedupe_symbols(requested);
    const int total = static_cast<int>(symbols.size());

    ScanResult<T> result;
    result.symbols_total = total;
    if (total == 0) return result;

    auto start = std::chrono::steady_clock::now();

    // One slot per symbol so output order follows the universe, not completion.
    std::vector<std::vector<T>> matches(total);
    std::vector<std::optional<std::string>> failures(total);

    std::atomic<int> next{0};
    std::mutex progress_mtx;
    int done = 0;

    auto worker = [&]() {
        while (running_) {
            const int i = next.fetch_add(1);
            if (i >= total) break;
            const auto& symbol = symbols[i];

            try {
                auto analysis = cache_.get(symbol);
                matches[i] = extract(symbol, *analysis);
            } catch (const DataUnavailable& e) {
                spdlog::warn("Skipping {}: {}", symbol, e.what());
                failures[i] = e.what();
            } catch (const std::exception& e) {
                spdlog::warn("Error processing {}: {}", symbol, e.what());
                failures[i] = e.what();
            }

            std::lock_guard<std::mutex> lock(progress_mtx);
            done++;
            if (progress) {
                try {
                    progress(done, total, symbol);
                } catch (const std::exception& e) {
                    spdlog::warn("Progress callback failed: {}", e.what());
                }
            }
        }
    };

    const int n_workers = std::min(settings_.max_concurrency, total);
    std::vector<std::thread> pool;
    pool.reserve(n_workers);
    for (int w = 0; w < n_workers; w++) pool.emplace_back(worker);
    for (auto& t : pool) t.join();

    for (int i = 0; i < total; i++) {
        for (auto& m : matches[i]) result.matches.push_back(std::move(m));
        if (failures[i]) result.errors.push_back({symbols[i], *failures[i]});
    }
    result.symbols_processed = done;

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    spdlog::info("Scan complete: {}/{} symbols, {} matches, {} errors, {}ms",
                 done, total, result.matches.size(), result.errors.size(), ms);
    if (done < total) {
        spdlog::warn("Scan stopped early after {} of {} symbols", done, total);
    }
    return result;
}


ScanResult<DivergenceSignal> Scanner::scan(const Date& date,
                                           const std::vector<std::string>& symbols,
                                           const ProgressCallback& progress)
{
    spdlog::info("Scanning {} symbols for bullish RSI divergences on {}", symbols.size(), date.to_string());

    return run<DivergenceSignal>(symbols, progress,
        [&date](const std::string& symbol, const SymbolAnalysis& a) {
            std::vector<DivergenceSignal> hits;
            const int idx = a.index_of(date);
            if (idx >= 0 && std::binary_search(a.divergences.begin(), a.divergences.end(), idx)) {
                const auto& bar = a.bars[idx];

                DivergenceSignal s;
                s.symbol = symbol;
                s.date = bar.date;
                s.rsi = *a.rsi[idx];
                s.close = bar.close;
                s.low = bar.low;
                s.high = bar.high;
                s.volume = bar.volume;
                hits.push_back(s);

                spdlog::info("Bullish RSI divergence detected for {} on {} | RSI: {:.2f}",
                             symbol, date.to_string(), s.rsi);
            }
            return hits;
        });
}


ScanResult<ProjectionRecord> Scanner::scan_with_projection(const Date& date,
                                                           const std::vector<std::string>& symbols,
                                                           bool use_next_open,
                                                           const ProgressCallback& progress)
{
    const bool is_today = (date == today_());
    const int horizon = settings_.horizon;

    spdlog::info("Projecting divergences on {} for {} symbols (base={}, horizon={})",
                 date.to_string(), symbols.size(),
                 to_string(use_next_open ? PriceBasis::NextOpen : PriceBasis::Close), horizon);

    return run<ProjectionRecord>(symbols, progress,
        [&date, is_today, use_next_open, horizon](const std::string& symbol, const SymbolAnalysis& a) {
            std::vector<ProjectionRecord> records;
            const int idx = a.index_of(date);
            if (idx >= 0 && std::binary_search(a.divergences.begin(), a.divergences.end(), idx)) {
                ProjectionRecord r;
                r.symbol = symbol;
                r.date = date;
                r.rsi = *a.rsi[idx];
                r.is_today_signal = is_today;
                r.projection = project_signal(a.bars, idx, use_next_open, horizon);

                if (!r.projection.available) {
                    spdlog::warn("{} on {}: base price {} is degenerate, returns unavailable",
                                 symbol, date.to_string(), r.projection.base_price);
                }
                records.push_back(std::move(r));
            }
            return records;
        });
}


void Scanner::stop() {
    running_ = false;
}

} // namespace ds
