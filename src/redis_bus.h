#pragma once

#include "config.h"

#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace ds {

/// Redis pub/sub client using hiredis.
///
/// Events are JSON envelopes:
/// {"event_type", "payload", "source": "divergence-scanner", "correlation_id", "timestamp"}
class RedisBus {
public:
    explicit RedisBus(const RedisConfig& config);
    ~RedisBus();

    RedisBus(const RedisBus&) = delete;
    RedisBus& operator=(const RedisBus&) = delete;

    /// Return false to unsubscribe and make subscribe() return.
    using MessageHandler = std::function<bool(const std::string& channel, const std::string& message)>;

    /// Publish a raw message to a channel. Throws std::runtime_error on failure.
    void publish(const std::string& channel, const std::string& message);

    /// Wrap `payload` in an event envelope and publish it on
    /// channel_for(event_type).
    void publish_event(const std::string& event_type,
                       const nlohmann::json& payload,
                       const std::string& correlation_id = "");

    /// Subscribe and block, calling handler for each message.
    /// Returns when the handler returns false or on a read error.
    void subscribe(const std::string& channel, MessageHandler handler);

    /// Build the full channel name for an event type.
    std::string channel_for(const std::string& event_type) const;

    bool health_check() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ds
