#pragma once

#include "bar_source.h"
#include "config.h"

#include <memory>
#include <string>
#include <vector>

namespace ds {

/// gRPC client for the market data-service (market.v1.MarketDataService).
class DataServiceClient : public BarSource {
public:
    DataServiceClient(const DataServiceConfig& config, const ScannerConfig& scanner);
    ~DataServiceClient() override;

    DataServiceClient(const DataServiceClient&) = delete;
    DataServiceClient& operator=(const DataServiceClient&) = delete;

    /// Daily bars for the last `history_days` days (uses StreamDailyBars).
    std::vector<OHLCVBar> fetch(const std::string& symbol) const override;

    /// Daily bars in [start, end]. A default Date bound means unbounded.
    std::vector<OHLCVBar> read_daily_bars(const std::string& symbol,
                                          const Date& start,
                                          const Date& end) const;

    std::vector<std::string> list_symbols() const override;

    std::vector<Date> list_holidays() const override;

    /// Check gRPC connectivity.
    bool health_check() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ds
