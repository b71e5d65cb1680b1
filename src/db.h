#pragma once

#include "bar_source.h"
#include "config.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ds {

/// PostgreSQL bar source via libpq.
///
/// Reads `ohlcv_bars` rows of the configured timeframe, joined to `tickers`
/// by symbol, with the session date taken in the configured exchange timezone.
class Database : public BarSource {
public:
    Database(const DatabaseConfig& config, const ScannerConfig& scanner);
    ~Database() override;

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /// Daily bars for the last `history_days` days.
    std::vector<OHLCVBar> fetch(const std::string& symbol) const override;

    /// Daily bars with session date >= start.
    std::vector<OHLCVBar> read_daily_bars(const std::string& symbol, const Date& start) const;

    /// Active tickers, ordered by symbol.
    std::vector<std::string> list_symbols() const override;

    /// Rows of `market_holidays`.
    std::vector<Date> list_holidays() const override;

    /// Check database connectivity.
    bool health_check() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ds
