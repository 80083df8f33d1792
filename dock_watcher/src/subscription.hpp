#ifndef DOCKWATCH_SUBSCRIPTION_HPP
#define DOCKWATCH_SUBSCRIPTION_HPP

#include "events.hpp"
#include "resource_client.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace DockWatch {

    // A live client stream exposed as one-shot receive commands. The reducer
    // must issue a fresh `next` command after every delivered item.
    template <typename T>
    class Subscription {
    public:
        Subscription(uint64_t id, std::string container_id, std::unique_ptr<Stream<T>> stream)
            : id_(id), container_id_(std::move(container_id)), stream_(std::move(stream)) {}

        uint64_t id() const { return id_; }
        const std::string& container_id() const { return container_id_; }

        Received<T> receive(const CancelToken& token) { return stream_->channel().receive(token); }

        // Stops the producer. The thread is joined when the last owner lets go.
        void close() { stream_->cancel(); }
        bool closed() const { return stream_->token().cancelled(); }

    private:
        uint64_t id_;
        std::string container_id_;
        std::unique_ptr<Stream<T>> stream_;
    };

    uint64_t next_subscription_id();

    // Both throw ClientError when the stream cannot be opened.
    std::shared_ptr<LogSubscription> open_log_subscription(ResourceClient& client, const std::string& container_id,
                                                           const LogOptions& options);
    std::shared_ptr<StatsSubscription> open_stats_subscription(ResourceClient& client, const std::string& container_id);

    // Item -> LogReceived / StatsReceived, error -> StreamFailed,
    // closed or cancelled -> no event.
    Command next_log_command(std::shared_ptr<LogSubscription> sub, CancelToken token);
    Command next_stats_command(std::shared_ptr<StatsSubscription> sub, CancelToken token);

}

#endif
