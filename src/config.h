#pragma once

#include "pipeline.h"
#include "scanner.h"

#include <string>
#include <vector>

namespace ds {

struct DatabaseConfig {
    std::string host = "localhost";
    int port = 5432;
    std::string dbname = "algomatic";
    std::string user = "algomatic";
    std::string password = "algomatic_dev";
    int connect_timeout_seconds = 10;

    std::string connection_string() const;
};

struct RedisConfig {
    std::string host = "localhost";
    int port = 6379;
    std::string channel_prefix = "divergence";
};

struct DataServiceConfig {
    std::string target = "localhost:50051";
    int timeout_seconds = 30;
};

struct ServiceConfig {
    std::string mode = "scan";                  // "scan", "date", "listener"
    std::string log_level = "info";
    std::string data_source = "data-service";   // "data-service", "database"
    int max_concurrency = 8;
    std::string output_path;                    // JSON results file, empty = none
};

struct ScannerConfig {
    int rsi_period = 14;
    int pivot_left = 5;
    int pivot_right = 5;
    int horizon = 5;
    bool use_next_open = false;
    int history_days = 365;
    std::string timeframe = "1Day";
    std::string timezone = "Asia/Kolkata";

    PipelineSettings pipeline() const;
};

struct UniverseConfig {
    std::vector<std::string> symbols;   // empty = ask the bar source
    std::vector<std::string> holidays;  // YYYY-MM-DD
};

struct Config {
    DatabaseConfig database;
    RedisConfig redis;
    DataServiceConfig data_service;
    ServiceConfig service;
    ScannerConfig scanner;
    UniverseConfig universe;

    /// Load from JSON file, then override with environment variables.
    static Config load(const std::string& path);

    /// Throws std::invalid_argument on structural misconfiguration.
    void validate() const;

    ScannerSettings scanner_settings() const;
};

} // namespace ds
