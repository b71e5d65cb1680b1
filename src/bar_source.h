#pragma once

#include "indicators/base.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace ds {

/// No bars could be obtained for a symbol.
class DataUnavailable : public std::runtime_error {
public:
    DataUnavailable(const std::string& symbol, const std::string& reason)
        : std::runtime_error("No data for " + symbol + ": " + reason), symbol_(symbol) {}

    const std::string& symbol() const { return symbol_; }

private:
    std::string symbol_;
};

/// Provider of daily bar series. Implementations must be safe to call from
/// several threads at once.
class BarSource {
public:
    virtual ~BarSource() = default;

    /// Daily bars for `symbol`, ascending by date.
    /// Throws DataUnavailable when the symbol has no bars.
    virtual std::vector<OHLCVBar> fetch(const std::string& symbol) const = 0;

    /// Active symbols, used when no universe is configured.
    virtual std::vector<std::string> list_symbols() const = 0;

    /// Exchange holidays known to the source.
    virtual std::vector<Date> list_holidays() const = 0;

    virtual bool health_check() const = 0;
};

} // namespace ds
