#ifndef DOCKWATCH_DOCKER_CLI_HPP
#define DOCKWATCH_DOCKER_CLI_HPP

#include "resource_client.hpp"

#include <string>
#include <vector>

namespace DockWatch {

    // ResourceClient backed by the `docker` command line. Every blocking call
    // runs one child process bounded by the context deadline.
    class DockerCliClient : public ResourceClient {
    public:
        explicit DockerCliClient(std::string docker_binary = "docker");

        std::string ping(const OpContext& ctx) override;

        // --- Containers ---
        std::vector<Container> list_containers(const OpContext& ctx, bool all) override;
        ContainerFullConfig inspect_container(const OpContext& ctx, const std::string& id) override;
        void start_container(const OpContext& ctx, const std::string& id) override;
        void stop_container(const OpContext& ctx, const std::string& id, int timeout_seconds) override;
        void restart_container(const OpContext& ctx, const std::string& id, int timeout_seconds) override;
        void remove_container(const OpContext& ctx, const std::string& id, bool force) override;
        std::string create_container(const OpContext& ctx, const ContainerFullConfig& config,
                                     const std::string& network) override;

        // --- Networks ---
        std::vector<Network> list_networks(const OpContext& ctx) override;
        void attach_network(const OpContext& ctx, const std::string& network, const std::string& container,
                            const std::vector<std::string>& aliases) override;
        void detach_network(const OpContext& ctx, const std::string& network, const std::string& container) override;
        void create_network(const OpContext& ctx, const std::string& name, const std::string& driver) override;
        void remove_network(const OpContext& ctx, const std::string& id) override;

        // --- Images ---
        std::vector<Image> list_images(const OpContext& ctx) override;
        void remove_image(const OpContext& ctx, const std::string& id, bool force) override;
        void pull_image(const OpContext& ctx, const std::string& reference) override;
        PruneReport prune_images(const OpContext& ctx) override;

        // --- Volumes ---
        std::vector<Volume> list_volumes(const OpContext& ctx) override;
        void remove_volume(const OpContext& ctx, const std::string& name, bool force) override;
        PruneReport prune_volumes(const OpContext& ctx) override;

        // --- Compose ---
        std::vector<ComposeProject> list_compose_projects(const OpContext& ctx) override;

        // --- Streams ---
        std::unique_ptr<LogStream> open_log_stream(const std::string& id, const LogOptions& options) override;
        std::unique_ptr<StatsStream> open_stats_stream(const std::string& id) override;

        // Argument list for `docker create`, exposed for tests.
        static std::vector<std::string> create_args(const ContainerFullConfig& config, const std::string& network);

    private:
        // Runs `docker <args>` and returns its output; throws ClientError on failure.
        std::string run(const OpContext& ctx, const std::vector<std::string>& args) const;

        std::string binary_;
    };

}

#endif
