#include "config.h"
#include "data_service_client.h"
#include "db.h"
#include "redis_bus.h"
#include "service.h"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <csignal>
#include <cstring>
#include <memory>
#include <string>

static ds::Service* g_service = nullptr;

void signal_handler(int sig) {
    spdlog::info("Received signal {}, shutting down...", sig);
    if (g_service) g_service->stop();
}

void setup_logging(const std::string& level) {
    auto console = spdlog::stdout_color_mt("console");
    spdlog::set_default_logger(console);

    if (level == "debug") spdlog::set_level(spdlog::level::debug);
    else if (level == "warn") spdlog::set_level(spdlog::level::warn);
    else if (level == "error") spdlog::set_level(spdlog::level::err);
    else spdlog::set_level(spdlog::level::info);

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
}

std::unique_ptr<ds::BarSource> make_bar_source(const ds::Config& config) {
    if (config.service.data_source == "database") {
        return std::make_unique<ds::Database>(config.database, config.scanner);
    }
    return std::make_unique<ds::DataServiceClient>(config.data_service, config.scanner);
}

ds::TradingCalendar make_calendar(const ds::Config& config, const ds::BarSource& source) {
    ds::TradingCalendar calendar;
    for (const auto& h : config.universe.holidays) {
        calendar.add_holiday(ds::Date::parse(h));
    }
    try {
        for (const auto& d : source.list_holidays()) calendar.add_holiday(d);
    } catch (const std::exception& e) {
        spdlog::warn("Could not load holidays from data source: {}", e.what());
    }
    spdlog::info("Trading calendar: {} holidays", calendar.holiday_count());
    return calendar;
}

int main(int argc, char* argv[]) {
    // Parse --config, --mode, --date and --next-open from CLI
    std::string config_path = "config.json";
    std::string mode_override;
    std::string date_arg;
    bool next_open_flag = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strncmp(argv[i], "--mode=", 7) == 0) {
            mode_override = argv[i] + 7;
        } else if (std::strcmp(argv[i], "--mode") == 0 && i + 1 < argc) {
            mode_override = argv[++i];
        } else if (std::strcmp(argv[i], "--date") == 0 && i + 1 < argc) {
            date_arg = argv[++i];
        } else if (std::strcmp(argv[i], "--next-open") == 0) {
            next_open_flag = true;
        }
    }

    // Load configuration
    ds::Config config = ds::Config::load(config_path);
    if (!mode_override.empty()) {
        config.service.mode = mode_override;
    } else if (!date_arg.empty()) {
        config.service.mode = "date";
    }

    setup_logging(config.service.log_level);

    spdlog::info("divergence-scanner v1.0.0 starting (mode={}, source={})",
                 config.service.mode, config.service.data_source);

    // Set up signal handling
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        // Structural misconfiguration is fatal before any symbol is touched.
        config.validate();

        auto source = make_bar_source(config);
        if (!source->health_check()) {
            spdlog::warn("Data source health check failed, symbols may be skipped");
        }

        ds::TradingCalendar calendar = make_calendar(config, *source);

        // Redis is required only for the listener
        std::unique_ptr<ds::RedisBus> redis;
        try {
            redis = std::make_unique<ds::RedisBus>(config.redis);
            if (!redis->health_check()) {
                spdlog::warn("Redis health check failed, alerts will not be published");
                redis.reset();
            }
        } catch (const std::exception& e) {
            if (config.service.mode == "listener") throw;
            spdlog::warn("Redis unavailable ({}), alerts will not be published", e.what());
        }

        ds::Service service(config, *source, calendar, redis.get());
        g_service = &service;

        int rc = 0;
        if (config.service.mode == "listener") {
            service.run_listener();
        } else if (config.service.mode == "date") {
            if (date_arg.empty()) {
                spdlog::error("--date YYYY-MM-DD is required in date mode");
                g_service = nullptr;
                return 1;
            }
            rc = service.run_date(ds::Date::parse(date_arg),
                                  next_open_flag || config.scanner.use_next_open);
        } else {
            rc = service.run_scan();
        }

        g_service = nullptr;
        spdlog::info("divergence-scanner shut down cleanly");
        return rc;

    } catch (const std::exception& e) {
        g_service = nullptr;
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
