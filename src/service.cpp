#include "service.h"
#include "report.h"

#include <ctime>
#include <fstream>
#include <iostream>
#include <spdlog/spdlog.h>
#include <stdexcept>

using json = nlohmann::json;

namespace ds {

namespace {

ProgressCallback log_progress() {
    return [](int done, int total, const std::string& symbol) {
        spdlog::debug("[{}/{}] {}", done, total, symbol);
        if (done == total || done % 50 == 0) {
            spdlog::info("Progress: {}/{} symbols", done, total);
        }
    };
}

std::string local_timestamp() {
    time_t now = std::time(nullptr);
    struct tm t;
    localtime_r(&now, &t);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%A, %B %d, %Y at %I:%M %p", &t);
    return buf;
}

template <typename T>
json result_payload(const Date& date, const ScanResult<T>& result) {
    json payload;
    payload["date"] = date.to_string();
    payload["symbols_total"] = result.symbols_total;
    payload["symbols_processed"] = result.symbols_processed;
    payload["signal_count"] = result.matches.size();
    payload["signals"] = result.matches;
    payload["errors"] = result.errors;
    return payload;
}

} // anonymous namespace


ScanRequest parse_scan_request(const std::string& message, bool default_use_next_open) {
    ScanRequest req;
    req.use_next_open = default_use_next_open;

    try {
        json doc = json::parse(message);
        if (!doc.is_object()) {
            throw std::invalid_argument("scan request must be a JSON object");
        }

        if (doc.contains("correlation_id") && !doc["correlation_id"].is_null()) {
            req.correlation_id = doc["correlation_id"].get<std::string>();
        }

        if (!doc.contains("payload") || doc["payload"].is_null()) return req;
        const json& payload = doc["payload"];
        if (!payload.is_object()) {
            throw std::invalid_argument("scan request payload must be an object");
        }

        if (payload.contains("date") && !payload["date"].is_null()) {
            if (!payload["date"].is_string()) {
                throw std::invalid_argument("payload.date must be a string");
            }
            req.date = Date::parse(payload["date"].get<std::string>());
        }

        if (payload.contains("symbols") && !payload["symbols"].is_null()) {
            req.symbols = payload["symbols"].get<std::vector<std::string>>();
        }

        if (payload.contains("use_next_open") && !payload["use_next_open"].is_null()) {
            if (!payload["use_next_open"].is_boolean()) {
                throw std::invalid_argument("payload.use_next_open must be a boolean");
            }
            req.use_next_open = payload["use_next_open"].get<bool>();
        }
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Malformed scan request: ") + e.what());
    }
    return req;
}


std::string correlation_id_of(const std::string& message) {
    json doc = json::parse(message, nullptr, false);
    if (doc.is_object() && doc.contains("correlation_id") && doc["correlation_id"].is_string()) {
        return doc["correlation_id"].get<std::string>();
    }
    return "";
}

Service::Service(const Config& config, const BarSource& source, const TradingCalendar& calendar, RedisBus* redis)
    : config_(config),
      source_(source),
      calendar_(calendar),
      redis_(redis),
      pipeline_(config.scanner.pipeline()),
      cache_(source_, pipeline_),
      scanner_(cache_, config.scanner_settings()) {}


std::vector<std::string> Service::universe() const {
    if (!config_.universe.symbols.empty()) {
        return dedupe_symbols(config_.universe.symbols);
    }
    auto symbols = dedupe_symbols(source_.list_symbols());
    spdlog::info("Universe: {} active symbols from data source", symbols.size());
    return symbols;
}


int Service::run_scan() {
    const Date today = Date::today();
    if (!calendar_.is_trading_day(today)) {
        spdlog::info("{} is not a trading day. Exiting.", today.to_string());
        return 0;
    }

    auto result = scanner_.scan(today, universe(), log_progress());

    std::cout << build_text_report(result.matches, local_timestamp()) << std::flush;

    json payload = result_payload(today, result);
    payload["subject"] = build_alert_subject(result.matches.size(), today);
    write_output(payload);

    if (!result.matches.empty()) {
        publish("divergence_signals_detected", payload);
    } else {
        spdlog::info("No bullish divergences found today");
    }
    return 0;
}


int Service::run_date(const Date& date, bool use_next_open) {
    if (!calendar_.is_trading_day(date)) {
        spdlog::warn("{} is not a trading day, expecting no bars on that date", date.to_string());
    }

    auto result = scanner_.scan_with_projection(date, universe(), use_next_open, log_progress());

    std::cout << build_projection_table(result.matches) << std::flush;

    json payload = result_payload(date, result);
    payload["use_next_open"] = use_next_open;
    write_output(payload);
    publish("divergence_projection_complete", payload);
    return 0;
}


void Service::run_listener() {
    if (!redis_) throw std::runtime_error("Listener mode requires Redis");

    std::string channel = redis_->channel_for("divergence_scan_request");
    spdlog::info("Listener started on channel: {}", channel);

    redis_->subscribe(channel, [this](const std::string&, const std::string& msg) {
        if (!running_) return false;
        try {
            handle_scan_request(msg);
        } catch (const std::exception& e) {
            spdlog::error("Error handling scan request: {}", e.what());
        }
        return running_.load();
    });

    spdlog::info("Listener stopped");
}


void Service::stop() {
    running_ = false;
    scanner_.stop();
}


void Service::handle_scan_request(const std::string& message) {
    const std::string correlation_id = correlation_id_of(message);
    std::string date_str;

    try {
        ScanRequest req = parse_scan_request(message, config_.scanner.use_next_open);
        Date date = req.date ? *req.date : Date::today();
        date_str = date.to_string();

        spdlog::info("Handling scan request: date={}, use_next_open={}, correlation_id={}",
                     date_str, req.use_next_open, correlation_id);

        std::vector<std::string> symbols = req.symbols ? dedupe_symbols(*req.symbols) : universe();
        auto result = scanner_.scan_with_projection(date, symbols, req.use_next_open);

        json payload = result_payload(date, result);
        payload["use_next_open"] = req.use_next_open;
        publish("divergence_scan_complete", payload, correlation_id);

        spdlog::info("Scan request complete: date={}, signals={}, errors={}",
                     date_str, result.matches.size(), result.errors.size());

    } catch (const std::exception& e) {
        spdlog::error("Scan request failed: {}", e.what());
        json payload;
        payload["date"] = date_str;
        payload["error"] = e.what();
        publish("divergence_scan_failed", payload, correlation_id);
    }
}


void Service::publish(const std::string& event_type, const json& payload, const std::string& correlation_id) {
    if (!redis_) return;
    try {
        redis_->publish_event(event_type, payload, correlation_id);
        spdlog::info("Published {} to Redis", event_type);
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish {}: {}", event_type, e.what());
    }
}


void Service::write_output(const json& doc) const {
    const auto& path = config_.service.output_path;
    if (path.empty()) return;

    std::ofstream f(path);
    if (!f.is_open()) {
        spdlog::error("Cannot open output file {}", path);
        return;
    }
    f << doc.dump(2) << "\n";
    spdlog::info("Wrote results to {}", path);
}

} // namespace ds
