#ifndef DOCKWATCH_RESOURCE_CLIENT_HPP
#define DOCKWATCH_RESOURCE_CLIENT_HPP

#include "cancel.hpp"
#include "models.hpp"
#include "stream.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace DockWatch {

    class ClientError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    struct LogOptions {
        bool follow = true;
        std::string since; // RFC3339 or relative ("10m"), empty for all
        int tail = 100;
    };

    struct PruneReport {
        int removed = 0;
        uint64_t space_reclaimed = 0;
    };

    using LogStream = Stream<LogEntry>;
    using StatsStream = Stream<ContainerStats>;

    // Blocking calls against the container daemon. Every call throws
    // ClientError on failure and honours the context deadline.
    class ResourceClient {
    public:
        virtual ~ResourceClient() = default;

        virtual std::string ping(const OpContext& ctx) = 0;

        // --- Containers ---
        virtual std::vector<Container> list_containers(const OpContext& ctx, bool all) = 0;
        virtual ContainerFullConfig inspect_container(const OpContext& ctx, const std::string& id) = 0;
        virtual void start_container(const OpContext& ctx, const std::string& id) = 0;
        virtual void stop_container(const OpContext& ctx, const std::string& id, int timeout_seconds) = 0;
        virtual void restart_container(const OpContext& ctx, const std::string& id, int timeout_seconds) = 0;
        virtual void remove_container(const OpContext& ctx, const std::string& id, bool force) = 0;
        // Creates the container attached to `network` only (may be empty); returns the new id.
        virtual std::string create_container(const OpContext& ctx, const ContainerFullConfig& config,
                                             const std::string& network) = 0;

        // --- Networks ---
        virtual std::vector<Network> list_networks(const OpContext& ctx) = 0;
        virtual void attach_network(const OpContext& ctx, const std::string& network, const std::string& container,
                                    const std::vector<std::string>& aliases) = 0;
        virtual void detach_network(const OpContext& ctx, const std::string& network, const std::string& container) = 0;
        virtual void create_network(const OpContext& ctx, const std::string& name, const std::string& driver) = 0;
        virtual void remove_network(const OpContext& ctx, const std::string& id) = 0;

        // --- Images ---
        virtual std::vector<Image> list_images(const OpContext& ctx) = 0;
        virtual void remove_image(const OpContext& ctx, const std::string& id, bool force) = 0;
        virtual void pull_image(const OpContext& ctx, const std::string& reference) = 0;
        virtual PruneReport prune_images(const OpContext& ctx) = 0;

        // --- Volumes ---
        virtual std::vector<Volume> list_volumes(const OpContext& ctx) = 0;
        virtual void remove_volume(const OpContext& ctx, const std::string& name, bool force) = 0;
        virtual PruneReport prune_volumes(const OpContext& ctx) = 0;

        // --- Compose ---
        virtual std::vector<ComposeProject> list_compose_projects(const OpContext& ctx) = 0;

        // --- Streams ---
        // The returned stream owns its producer thread; destroying it stops the producer.
        virtual std::unique_ptr<LogStream> open_log_stream(const std::string& id, const LogOptions& options) = 0;
        virtual std::unique_ptr<StatsStream> open_stats_stream(const std::string& id) = 0;
    };

}

#endif
