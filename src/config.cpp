#include "config.h"

#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

using json = nlohmann::json;

namespace ds {

std::string DatabaseConfig::connection_string() const {
    return "host=" + host +
           " port=" + std::to_string(port) +
           " dbname=" + dbname +
           " user=" + user +
           " password=" + password +
           " connect_timeout=" + std::to_string(connect_timeout_seconds);
}

PipelineSettings ScannerConfig::pipeline() const {
    PipelineSettings s;
    s.rsi_period = rsi_period;
    s.pivot_left = pivot_left;
    s.pivot_right = pivot_right;
    return s;
}

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    return val ? std::atoi(val) : fallback;
}

template <typename T>
void read(const json& section, const char* key, T& out) {
    if (section.count(key)) out = section[key].get<T>();
}

void apply_json(Config& cfg, const json& j) {
    if (j.count("database")) {
        auto& db = j["database"];
        read(db, "host", cfg.database.host);
        read(db, "port", cfg.database.port);
        read(db, "dbname", cfg.database.dbname);
        read(db, "user", cfg.database.user);
        read(db, "password", cfg.database.password);
        read(db, "connect_timeout_seconds", cfg.database.connect_timeout_seconds);
    }

    if (j.count("redis")) {
        auto& r = j["redis"];
        read(r, "host", cfg.redis.host);
        read(r, "port", cfg.redis.port);
        read(r, "channel_prefix", cfg.redis.channel_prefix);
    }

    if (j.count("data_service")) {
        auto& d = j["data_service"];
        read(d, "target", cfg.data_service.target);
        read(d, "timeout_seconds", cfg.data_service.timeout_seconds);
    }

    if (j.count("service")) {
        auto& s = j["service"];
        read(s, "mode", cfg.service.mode);
        read(s, "log_level", cfg.service.log_level);
        read(s, "data_source", cfg.service.data_source);
        read(s, "max_concurrency", cfg.service.max_concurrency);
        read(s, "output_path", cfg.service.output_path);
    }

    if (j.count("scanner")) {
        auto& sc = j["scanner"];
        // pivot_lookback sets both sides; explicit left/right win.
        if (sc.count("pivot_lookback")) {
            cfg.scanner.pivot_left = sc["pivot_lookback"].get<int>();
            cfg.scanner.pivot_right = cfg.scanner.pivot_left;
        }
        read(sc, "rsi_period", cfg.scanner.rsi_period);
        read(sc, "pivot_left", cfg.scanner.pivot_left);
        read(sc, "pivot_right", cfg.scanner.pivot_right);
        read(sc, "horizon", cfg.scanner.horizon);
        read(sc, "use_next_open", cfg.scanner.use_next_open);
        read(sc, "history_days", cfg.scanner.history_days);
        read(sc, "timeframe", cfg.scanner.timeframe);
        read(sc, "timezone", cfg.scanner.timezone);
    }

    if (j.count("universe")) {
        auto& u = j["universe"];
        read(u, "symbols", cfg.universe.symbols);
        read(u, "holidays", cfg.universe.holidays);
    }
}

} // anonymous namespace

Config Config::load(const std::string& path) {
    Config cfg;

    // Load from JSON file if it exists
    std::ifstream f(path);
    if (f.is_open()) {
        try {
            apply_json(cfg, json::parse(f));
            spdlog::info("Loaded config from {}", path);
        } catch (const std::exception& e) {
            spdlog::warn("Failed to parse config file {}: {}", path, e.what());
        }
    } else {
        spdlog::info("Config file {} not found, using defaults + env vars", path);
    }

    // Override with environment variables
    cfg.database.host = env_or("DB_HOST", cfg.database.host);
    cfg.database.port = env_int_or("DB_PORT", cfg.database.port);
    cfg.database.dbname = env_or("DB_NAME", cfg.database.dbname);
    cfg.database.user = env_or("DB_USER", cfg.database.user);
    cfg.database.password = env_or("DB_PASSWORD", cfg.database.password);

    cfg.redis.host = env_or("REDIS_HOST", cfg.redis.host);
    cfg.redis.port = env_int_or("REDIS_PORT", cfg.redis.port);
    cfg.redis.channel_prefix = env_or("REDIS_CHANNEL_PREFIX", cfg.redis.channel_prefix);

    cfg.data_service.target = env_or("DATA_SERVICE_TARGET", cfg.data_service.target);
    cfg.data_service.timeout_seconds = env_int_or("DATA_SERVICE_TIMEOUT", cfg.data_service.timeout_seconds);

    cfg.service.mode = env_or("SCANNER_MODE", cfg.service.mode);
    cfg.service.log_level = env_or("SCANNER_LOG_LEVEL", cfg.service.log_level);
    cfg.service.data_source = env_or("SCANNER_DATA_SOURCE", cfg.service.data_source);
    cfg.service.max_concurrency = env_int_or("SCANNER_MAX_CONCURRENCY", cfg.service.max_concurrency);
    cfg.service.output_path = env_or("SCANNER_OUTPUT_PATH", cfg.service.output_path);

    return cfg;
}

void Config::validate() const {
    scanner.pipeline().validate();
    scanner_settings().validate();

    if (scanner.history_days <= 0) {
        throw std::invalid_argument("history_days must be positive, got " + std::to_string(scanner.history_days));
    }
    if (data_service.timeout_seconds <= 0) {
        throw std::invalid_argument("data_service.timeout_seconds must be positive");
    }
    if (service.data_source != "data-service" && service.data_source != "database") {
        throw std::invalid_argument("Unknown data_source '" + service.data_source +
                                    "', expected data-service or database");
    }
    if (service.mode != "scan" && service.mode != "date" && service.mode != "listener") {
        throw std::invalid_argument("Unknown mode '" + service.mode + "', expected scan, date or listener");
    }
    for (const auto& h : universe.holidays) {
        Date::parse(h);
    }
}

ScannerSettings Config::scanner_settings() const {
    ScannerSettings s;
    s.max_concurrency = service.max_concurrency;
    s.horizon = scanner.horizon;
    return s;
}

} // namespace ds
