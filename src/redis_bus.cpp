#include "redis_bus.h"

#include <hiredis/hiredis.h>
#include <spdlog/spdlog.h>

#include <ctime>
#include <mutex>
#include <stdexcept>

namespace ds {

namespace {

constexpr const char* EVENT_SOURCE = "divergence-scanner";

redisContext* connect_or_throw(const RedisConfig& config, const char* purpose) {
    struct timeval timeout = {5, 0};
    redisContext* ctx = redisConnectWithTimeout(config.host.c_str(), config.port, timeout);
    if (!ctx || ctx->err) {
        std::string err = ctx ? ctx->errstr : "null context";
        if (ctx) redisFree(ctx);
        throw std::runtime_error(std::string("Redis ") + purpose + " connect failed: " + err);
    }
    return ctx;
}

std::string utc_timestamp() {
    time_t now = std::time(nullptr);
    struct tm t;
    gmtime_r(&now, &t);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &t);
    return buf;
}

} // anonymous namespace

struct RedisBus::Impl {
    RedisConfig config;
    redisContext* pub_ctx = nullptr;
    std::mutex pub_mtx;

    explicit Impl(const RedisConfig& cfg) : config(cfg) {
        pub_ctx = connect_or_throw(config, "publish");
        spdlog::info("Connected to Redis at {}:{}", config.host, config.port);
    }

    ~Impl() {
        if (pub_ctx) redisFree(pub_ctx);
    }
};


RedisBus::RedisBus(const RedisConfig& config) : impl_(std::make_unique<Impl>(config)) {}
RedisBus::~RedisBus() = default;


void RedisBus::publish(const std::string& channel, const std::string& message) {
    std::lock_guard<std::mutex> lock(impl_->pub_mtx);
    if (!impl_->pub_ctx) throw std::runtime_error("Redis not connected");

    redisReply* reply = static_cast<redisReply*>(
        redisCommand(impl_->pub_ctx, "PUBLISH %s %b", channel.c_str(), message.data(), message.size()));

    if (!reply) {
        throw std::runtime_error("Redis PUBLISH to " + channel + " failed: " + impl_->pub_ctx->errstr);
    }
    bool failed = reply->type == REDIS_REPLY_ERROR;
    std::string err = failed ? std::string(reply->str, reply->len) : "";
    freeReplyObject(reply);
    if (failed) {
        throw std::runtime_error("Redis PUBLISH to " + channel + " rejected: " + err);
    }

    spdlog::debug("Published to {}: {} bytes", channel, message.size());
}


void RedisBus::publish_event(const std::string& event_type,
                             const nlohmann::json& payload,
                             const std::string& correlation_id)
{
    nlohmann::json event;
    event["event_type"] = event_type;
    event["payload"] = payload;
    event["source"] = EVENT_SOURCE;
    event["correlation_id"] = correlation_id;
    event["timestamp"] = utc_timestamp();

    publish(channel_for(event_type), event.dump());
}


void RedisBus::subscribe(const std::string& channel, MessageHandler handler) {
    // Create a separate connection for subscribing (hiredis requirement)
    redisContext* sub_ctx = connect_or_throw(impl_->config, "subscribe");

    redisReply* reply = static_cast<redisReply*>(
        redisCommand(sub_ctx, "SUBSCRIBE %s", channel.c_str()));
    if (!reply || reply->type == REDIS_REPLY_ERROR) {
        std::string err = reply ? std::string(reply->str, reply->len) : sub_ctx->errstr;
        if (reply) freeReplyObject(reply);
        redisFree(sub_ctx);
        throw std::runtime_error("Redis SUBSCRIBE " + channel + " failed: " + err);
    }
    freeReplyObject(reply);

    spdlog::info("Subscribed to Redis channel: {}", channel);

    bool keep_going = true;
    while (keep_going) {
        redisReply* msg = nullptr;
        if (redisGetReply(sub_ctx, reinterpret_cast<void**>(&msg)) != REDIS_OK) {
            spdlog::error("Redis subscribe read error: {}", sub_ctx->errstr);
            break;
        }

        if (msg && msg->type == REDIS_REPLY_ARRAY && msg->elements >= 3) {
            std::string type(msg->element[0]->str, msg->element[0]->len);
            if (type == "message") {
                std::string ch(msg->element[1]->str, msg->element[1]->len);
                std::string data(msg->element[2]->str, msg->element[2]->len);
                keep_going = handler(ch, data);
            }
        }
        if (msg) freeReplyObject(msg);
    }

    redisFree(sub_ctx);
    spdlog::info("Unsubscribed from Redis channel: {}", channel);
}


std::string RedisBus::channel_for(const std::string& event_type) const {
    return impl_->config.channel_prefix + ":" + event_type;
}


bool RedisBus::health_check() const {
    std::lock_guard<std::mutex> lock(impl_->pub_mtx);
    if (!impl_->pub_ctx) return false;
    redisReply* reply = static_cast<redisReply*>(redisCommand(impl_->pub_ctx, "PING"));
    if (!reply) return false;
    bool ok = (reply->type == REDIS_REPLY_STATUS && std::string(reply->str) == "PONG");
    freeReplyObject(reply);
    return ok;
}

} // namespace ds
