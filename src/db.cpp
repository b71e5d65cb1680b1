#include "db.h"

#include <libpq-fe.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace ds {

namespace {

// Server-side cap on any single query.
constexpr const char* STATEMENT_TIMEOUT_SQL = "SET statement_timeout = '30s'";

} // anonymous namespace

struct Database::Impl {
    DatabaseConfig config;
    ScannerConfig scanner;
    PGconn* conn = nullptr;
    mutable std::mutex mtx;

    Impl(const DatabaseConfig& cfg, const ScannerConfig& sc) : config(cfg), scanner(sc) {
        connect();
    }

    ~Impl() {
        if (conn) PQfinish(conn);
    }

    void connect() {
        conn = PQconnectdb(config.connection_string().c_str());
        if (PQstatus(conn) != CONNECTION_OK) {
            std::string err = PQerrorMessage(conn);
            PQfinish(conn);
            conn = nullptr;
            throw std::runtime_error("DB connect failed: " + err);
        }

        PGresult* res = PQexec(conn, STATEMENT_TIMEOUT_SQL);
        if (!res || PQresultStatus(res) != PGRES_COMMAND_OK) {
            spdlog::warn("Could not set statement_timeout: {}", PQerrorMessage(conn));
        }
        if (res) PQclear(res);

        spdlog::info("Connected to PostgreSQL at {}:{}/{}", config.host, config.port, config.dbname);
    }

    void ensure_connected() {
        if (!conn || PQstatus(conn) != CONNECTION_OK) {
            spdlog::warn("DB connection lost, reconnecting...");
            if (conn) PQfinish(conn);
            conn = nullptr;
            connect();
        }
    }

    PGresult* exec(const char* sql) {
        ensure_connected();
        PGresult* res = PQexec(conn, sql);
        if (!res) throw std::runtime_error("PQexec returned null");
        return res;
    }

    PGresult* exec_params(const char* sql, int nParams, const char* const* paramValues) {
        ensure_connected();
        PGresult* res = PQexecParams(conn, sql, nParams, nullptr, paramValues, nullptr, nullptr, 0);
        if (!res) throw std::runtime_error("PQexecParams returned null");
        return res;
    }

    /// Throws with the server message unless the result holds rows.
    static void expect_tuples(PGresult* res, const std::string& method) {
        if (PQresultStatus(res) != PGRES_TUPLES_OK) {
            std::string err = PQresultErrorMessage(res);
            PQclear(res);
            throw std::runtime_error(method + " failed: " + err);
        }
    }
};


Database::Database(const DatabaseConfig& config, const ScannerConfig& scanner)
    : impl_(std::make_unique<Impl>(config, scanner)) {}
Database::~Database() = default;


std::vector<OHLCVBar> Database::fetch(const std::string& symbol) const {
    return read_daily_bars(symbol, Date::today().add_days(-impl_->scanner.history_days));
}


std::vector<OHLCVBar> Database::read_daily_bars(const std::string& symbol, const Date& start) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);

    const std::string start_str = start.to_string();
    const char* params[] = {
        symbol.c_str(),
        impl_->scanner.timeframe.c_str(),
        impl_->scanner.timezone.c_str(),
        start_str.c_str(),
    };

    PGresult* res = impl_->exec_params(
        "SELECT to_char(b.timestamp AT TIME ZONE $3, 'YYYY-MM-DD'), "
        "b.open, b.high, b.low, b.close, b.volume "
        "FROM ohlcv_bars b JOIN tickers t ON t.id = b.ticker_id "
        "WHERE t.symbol = $1 AND b.timeframe = $2 "
        "AND (b.timestamp AT TIME ZONE $3)::date >= $4::date "
        "ORDER BY b.timestamp ASC",
        4, params);
    Impl::expect_tuples(res, "read_daily_bars");

    int nrows = PQntuples(res);
    std::vector<OHLCVBar> bars;
    bars.reserve(nrows);

    try {
        for (int i = 0; i < nrows; i++) {
            OHLCVBar bar;
            bar.date = Date::parse(PQgetvalue(res, i, 0));
            bar.open = std::stod(PQgetvalue(res, i, 1));
            bar.high = std::stod(PQgetvalue(res, i, 2));
            bar.low = std::stod(PQgetvalue(res, i, 3));
            bar.close = std::stod(PQgetvalue(res, i, 4));
            bar.volume = std::stoll(PQgetvalue(res, i, 5));
            bars.push_back(bar);
        }
    } catch (...) {
        PQclear(res);
        throw;
    }

    PQclear(res);

    if (bars.empty()) {
        throw DataUnavailable(symbol, "no " + impl_->scanner.timeframe + " bars since " + start_str);
    }

    spdlog::debug("Read {} daily bars for {} since {}", nrows, symbol, start_str);
    return bars;
}


std::vector<std::string> Database::list_symbols() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);

    PGresult* res = impl_->exec(
        "SELECT symbol FROM tickers WHERE is_active = true ORDER BY symbol");
    Impl::expect_tuples(res, "list_symbols");

    std::vector<std::string> symbols;
    for (int i = 0; i < PQntuples(res); i++) {
        symbols.push_back(PQgetvalue(res, i, 0));
    }
    PQclear(res);
    return symbols;
}


std::vector<Date> Database::list_holidays() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);

    PGresult* res = impl_->exec(
        "SELECT to_char(holiday_date, 'YYYY-MM-DD') FROM market_holidays ORDER BY holiday_date");
    Impl::expect_tuples(res, "list_holidays");

    std::vector<Date> dates;
    try {
        for (int i = 0; i < PQntuples(res); i++) {
            dates.push_back(Date::parse(PQgetvalue(res, i, 0)));
        }
    } catch (...) {
        PQclear(res);
        throw;
    }
    PQclear(res);
    return dates;
}


bool Database::health_check() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->conn && PQstatus(impl_->conn) == CONNECTION_OK;
}

} // namespace ds
