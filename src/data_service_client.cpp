#include "data_service_client.h"

#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>

#include "market/v1/service.grpc.pb.h"
#include "market/v1/bar.pb.h"

#include <chrono>
#include <stdexcept>

namespace ds {

namespace {

void check_status(const grpc::Status& status, const std::string& method) {
    if (!status.ok()) {
        throw std::runtime_error(
            method + " failed: [" + std::to_string(status.error_code()) + "] " + status.error_message());
    }
}

} // anonymous namespace

struct DataServiceClient::Impl {
    DataServiceConfig config;
    int history_days;
    std::shared_ptr<grpc::Channel> channel;
    std::unique_ptr<market::v1::MarketDataService::Stub> stub;

    Impl(const DataServiceConfig& cfg, int history)
        : config(cfg), history_days(history) {
        channel = grpc::CreateChannel(config.target, grpc::InsecureChannelCredentials());
        stub = market::v1::MarketDataService::NewStub(channel);
        spdlog::info("DataServiceClient connected to {}", config.target);
    }

    // Applied to every call.
    void set_deadline(grpc::ClientContext& ctx) const {
        ctx.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(config.timeout_seconds));
    }
};

DataServiceClient::DataServiceClient(const DataServiceConfig& config, const ScannerConfig& scanner)
    : impl_(std::make_unique<Impl>(config, scanner.history_days)) {}

DataServiceClient::~DataServiceClient() = default;


std::vector<OHLCVBar> DataServiceClient::fetch(const std::string& symbol) const {
    Date today = Date::today();
    return read_daily_bars(symbol, today.add_days(-impl_->history_days), today);
}


std::vector<OHLCVBar> DataServiceClient::read_daily_bars(
    const std::string& symbol,
    const Date& start,
    const Date& end) const
{
    market::v1::StreamDailyBarsRequest req;
    req.set_symbol(symbol);
    if (start != Date{}) req.set_start_date(start.to_string());
    if (end != Date{}) req.set_end_date(end.to_string());

    grpc::ClientContext ctx;
    impl_->set_deadline(ctx);
    auto reader = impl_->stub->StreamDailyBars(&ctx, req);

    std::vector<OHLCVBar> bars;
    market::v1::DailyBar pb_bar;

    while (reader->Read(&pb_bar)) {
        OHLCVBar bar;
        bar.date = Date::parse(pb_bar.session_date());
        bar.open = pb_bar.open();
        bar.high = pb_bar.high();
        bar.low = pb_bar.low();
        bar.close = pb_bar.close();
        bar.volume = pb_bar.volume();
        bars.push_back(bar);
    }

    auto status = reader->Finish();
    if (status.error_code() == grpc::StatusCode::NOT_FOUND) {
        throw DataUnavailable(symbol, status.error_message());
    }
    check_status(status, "StreamDailyBars");

    if (bars.empty()) {
        throw DataUnavailable(symbol, "data-service returned no bars");
    }

    spdlog::debug("Read {} daily bars via gRPC for {} ({} .. {})", bars.size(), symbol,
                  bars.front().date.to_string(), bars.back().date.to_string());
    return bars;
}


std::vector<std::string> DataServiceClient::list_symbols() const {
    market::v1::ListSymbolsRequest req;
    req.set_active_only(true);

    grpc::ClientContext ctx;
    impl_->set_deadline(ctx);
    market::v1::ListSymbolsResponse resp;
    auto status = impl_->stub->ListSymbols(&ctx, req, &resp);
    check_status(status, "ListSymbols");

    return {resp.symbols().begin(), resp.symbols().end()};
}


std::vector<Date> DataServiceClient::list_holidays() const {
    market::v1::ListHolidaysRequest req;

    grpc::ClientContext ctx;
    impl_->set_deadline(ctx);
    market::v1::ListHolidaysResponse resp;
    auto status = impl_->stub->ListHolidays(&ctx, req, &resp);
    check_status(status, "ListHolidays");

    std::vector<Date> dates;
    dates.reserve(resp.dates_size());
    for (const auto& d : resp.dates()) {
        dates.push_back(Date::parse(d));
    }
    return dates;
}


bool DataServiceClient::health_check() const {
    // Simple health check: try to list symbols with a short deadline.
    market::v1::ListSymbolsRequest req;
    req.set_active_only(true);

    grpc::ClientContext ctx;
    ctx.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(5));

    market::v1::ListSymbolsResponse resp;
    auto status = impl_->stub->ListSymbols(&ctx, req, &resp);
    if (!status.ok()) {
        spdlog::warn("data-service health check failed: {}", status.error_message());
    }
    return status.ok();
}

} // namespace ds
