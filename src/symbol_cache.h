#pragma once

#include "bar_source.h"
#include "pipeline.h"

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ds {

/// Per-symbol memo of fetch + Pipeline::compute, valid for one calendar day.
///
/// An entry is keyed by symbol and stamped with the date ("epoch") it was
/// built on. A lookup on a later date rebuilds it. The first caller for a
/// (symbol, epoch) runs the fetch outside the lock; concurrent callers for the
/// same key wait on its result. A failed build is removed so the next lookup
/// retries, and every waiter of that build receives the same exception.
class SymbolDataCache {
public:
    using Clock = std::function<Date()>;

    SymbolDataCache(const BarSource& source, const Pipeline& pipeline, Clock today = &Date::today);

    SymbolDataCache(const SymbolDataCache&) = delete;
    SymbolDataCache& operator=(const SymbolDataCache&) = delete;

    /// Throws whatever the fetch or computation threw (DataUnavailable, ...).
    std::shared_ptr<const SymbolAnalysis> get(const std::string& symbol);

    size_t size() const;

    struct Stats {
        int64_t fetches = 0;
        int64_t hits = 0;
    };

    Stats stats() const;

private:
    using Result = std::shared_future<std::shared_ptr<const SymbolAnalysis>>;

    struct Entry {
        Date epoch;
        uint64_t generation;
        Result result;
    };

    std::shared_ptr<const SymbolAnalysis> build(const std::string& symbol) const;

    /// Remove entries stamped with another date. Caller holds mtx_.
    void purge_stale(const Date& today);

    const BarSource& source_;
    const Pipeline& pipeline_;
    Clock today_;

    mutable std::mutex mtx_;
    std::unordered_map<std::string, Entry> entries_;
    Date epoch_;
    uint64_t next_generation_ = 0;
    Stats stats_;
};

} // namespace ds
