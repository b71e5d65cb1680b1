#pragma once

#include "bar_source.h"
#include "calendar.h"
#include "config.h"
#include "pipeline.h"
#include "redis_bus.h"
#include "scanner.h"
#include "symbol_cache.h"

#include <atomic>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ds {

/// A decoded divergence_scan_request envelope.
struct ScanRequest {
    std::string correlation_id;
    std::optional<Date> date;                         // today when absent
    std::optional<std::vector<std::string>> symbols;  // universe when absent
    bool use_next_open = false;
};

/// Decode a scan request. Absent or null fields take their defaults.
/// Throws std::invalid_argument on malformed JSON, a field of the wrong type,
/// or a date that is not YYYY-MM-DD.
ScanRequest parse_scan_request(const std::string& message, bool default_use_next_open);

/// Best-effort correlation id of a request, "" when it cannot be read.
std::string correlation_id_of(const std::string& message);

/// Runs divergence scans against the configured universe and hands the
/// results to stdout, an optional JSON file and Redis.
class Service {
public:
    /// `redis` may be null; alerts are then only printed.
    Service(const Config& config, const BarSource& source, const TradingCalendar& calendar, RedisBus* redis);

    /// Scan today's bars. Returns a process exit code.
    int run_scan();

    /// Projection scan for a past (or current) date. Returns a process exit code.
    int run_date(const Date& date, bool use_next_open);

    /// Serve divergence_scan_request events until stop().
    void run_listener();

    /// Stop the listener and any running scan.
    void stop();

    /// Configured symbols, or the bar source's active symbols, deduplicated.
    std::vector<std::string> universe() const;

private:
    const Config& config_;
    const BarSource& source_;
    const TradingCalendar& calendar_;
    RedisBus* redis_;
    Pipeline pipeline_;
    SymbolDataCache cache_;
    Scanner scanner_;
    std::atomic<bool> running_{true};

    /// Handle an incoming divergence_scan_request from Redis. Every failure,
    /// a malformed request included, is published as divergence_scan_failed.
    void handle_scan_request(const std::string& message);

    void publish(const std::string& event_type, const nlohmann::json& payload,
                 const std::string& correlation_id = "");

    void write_output(const nlohmann::json& doc) const;
};

} // namespace ds
