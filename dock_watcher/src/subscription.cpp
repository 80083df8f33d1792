#include "subscription.hpp"

#include <spdlog/spdlog.h>

#include <atomic>

namespace DockWatch {

    uint64_t next_subscription_id() {
        static std::atomic<uint64_t> counter{0};
        return ++counter;
    }

    std::shared_ptr<LogSubscription> open_log_subscription(ResourceClient& client, const std::string& container_id,
                                                           const LogOptions& options) {
        auto stream = client.open_log_stream(container_id, options);
        if (!stream) throw ClientError("log stream unavailable for " + short_id(container_id));
        auto sub = std::make_shared<LogSubscription>(next_subscription_id(), container_id, std::move(stream));
        spdlog::info("log subscription {} opened for {}", sub->id(), short_id(container_id));
        return sub;
    }

    std::shared_ptr<StatsSubscription> open_stats_subscription(ResourceClient& client, const std::string& container_id) {
        auto stream = client.open_stats_stream(container_id);
        if (!stream) throw ClientError("stats stream unavailable for " + short_id(container_id));
        auto sub = std::make_shared<StatsSubscription>(next_subscription_id(), container_id, std::move(stream));
        spdlog::info("stats subscription {} opened for {}", sub->id(), short_id(container_id));
        return sub;
    }

    Command next_log_command(std::shared_ptr<LogSubscription> sub, CancelToken token) {
        return [sub, token]() -> std::optional<Event> {
            auto got = sub->receive(token);
            switch (got.status) {
                case ReceiveStatus::Item:
                    return Event{LogReceived{sub->id(), std::move(*got.item)}};
                case ReceiveStatus::Error:
                    spdlog::warn("log subscription {} failed: {}", sub->id(), got.error);
                    return Event{StreamFailed{sub->id(), got.error}};
                case ReceiveStatus::Closed:
                    spdlog::info("log subscription {} ended", sub->id());
                    return std::nullopt;
                case ReceiveStatus::Cancelled:
                    return std::nullopt;
            }
            return std::nullopt;
        };
    }

    Command next_stats_command(std::shared_ptr<StatsSubscription> sub, CancelToken token) {
        return [sub, token]() -> std::optional<Event> {
            auto got = sub->receive(token);
            switch (got.status) {
                case ReceiveStatus::Item:
                    return Event{StatsReceived{sub->id(), std::move(*got.item)}};
                case ReceiveStatus::Error:
                    spdlog::warn("stats subscription {} failed: {}", sub->id(), got.error);
                    return Event{StreamFailed{sub->id(), got.error}};
                case ReceiveStatus::Closed:
                    spdlog::info("stats subscription {} ended", sub->id());
                    return std::nullopt;
                case ReceiveStatus::Cancelled:
                    return std::nullopt;
            }
            return std::nullopt;
        };
    }

}
