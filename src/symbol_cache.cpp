#include "symbol_cache.h"

#include <spdlog/spdlog.h>
#include <utility>

namespace ds {

SymbolDataCache::SymbolDataCache(const BarSource& source, const Pipeline& pipeline, Clock today)
    : source_(source), pipeline_(pipeline), today_(std::move(today)) {}


std::shared_ptr<const SymbolAnalysis> SymbolDataCache::get(const std::string& symbol) {
    const Date today = today_();

    std::promise<std::shared_ptr<const SymbolAnalysis>> promise;
    Result result;
    uint64_t generation = 0;
    bool owner = false;

    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (today != epoch_) purge_stale(today);

        auto it = entries_.find(symbol);
        if (it != entries_.end() && it->second.epoch == today) {
            stats_.hits++;
            result = it->second.result;
        } else {
            generation = next_generation_++;
            result = promise.get_future().share();
            entries_[symbol] = Entry{today, generation, result};
            stats_.fetches++;
            owner = true;
        }
    }

    if (!owner) return result.get();

    try {
        promise.set_value(build(symbol));
    } catch (...) {
        // Hand the failure to every waiter, then forget the entry so the
        // next lookup fetches again.
        promise.set_exception(std::current_exception());
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = entries_.find(symbol);
        if (it != entries_.end() && it->second.generation == generation) {
            entries_.erase(it);
        }
    }
    return result.get();
}


size_t SymbolDataCache::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.size();
}


SymbolDataCache::Stats SymbolDataCache::stats() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return stats_;
}


std::shared_ptr<const SymbolAnalysis> SymbolDataCache::build(const std::string& symbol) const {
    auto bars = source_.fetch(symbol);
    if (bars.empty()) {
        throw DataUnavailable(symbol, "empty bar series");
    }

    const size_t n = bars.size();
    if (n < static_cast<size_t>(pipeline_.settings().rsi_period) + 1) {
        spdlog::debug("{}: only {} bars, insufficient history for rsi_period={}", symbol, n,
                      pipeline_.settings().rsi_period);
    }

    auto analysis = std::make_shared<const SymbolAnalysis>(pipeline_.compute(std::move(bars)));
    spdlog::debug("{}: cached {} bars, {} divergences", symbol, n, analysis->divergences.size());
    return analysis;
}


void SymbolDataCache::purge_stale(const Date& today) {
    size_t before = entries_.size();
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.epoch != today) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    if (before != entries_.size()) {
        spdlog::info("Symbol cache rolled over to {}: dropped {} entries", today.to_string(),
                     before - entries_.size());
    }
    epoch_ = today;
}

} // namespace ds
