#include "docker_cli.hpp"
#include "docker_parse.hpp"
#include "shell.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace DockWatch {

    namespace {

        const char* kJsonFormat = "{{json .}}";

        // Network-scoped aliases are rejected on the built-in networks
        bool supports_aliases(const std::string& network) {
            return network != "bridge" && network != "host" && network != "none" && network != "default";
        }

    }

    DockerCliClient::DockerCliClient(std::string docker_binary) : binary_(std::move(docker_binary)) {}

    std::string DockerCliClient::run(const OpContext& ctx, const std::vector<std::string>& args) const {
        std::string verb = args.empty() ? "" : args.front();
        if (ctx.token.cancelled()) throw ClientError(fmt::format("docker {}: cancelled", verb));
        if (ctx.expired()) throw ClientError(fmt::format("docker {}: deadline exceeded", verb));

        std::vector<std::string> argv{binary_};
        argv.insert(argv.end(), args.begin(), args.end());

        CommandResult result = run_command(argv, ctx.remaining_seconds());
        if (result.timed_out()) {
            spdlog::warn("docker {} timed out", verb);
            throw ClientError(fmt::format("docker {}: timed out", verb));
        }
        if (!result.ok()) {
            std::string detail = result.trimmed();
            spdlog::debug("docker {} failed ({}): {}", verb, result.exit_code, detail);
            if (detail.empty()) detail = fmt::format("exit code {}", result.exit_code);
            throw ClientError(fmt::format("docker {}: {}", verb, detail));
        }
        return result.output;
    }

    std::string DockerCliClient::ping(const OpContext& ctx) {
        std::string version = CommandResult{0, run(ctx, {"version", "--format", "{{.Server.Version}}"})}.trimmed();
        if (version.empty()) throw ClientError("docker daemon did not report a version");
        return version;
    }

    // --- Containers ---

    std::vector<Container> DockerCliClient::list_containers(const OpContext& ctx, bool all) {
        std::vector<std::string> args{"ps", "--no-trunc", "--format", kJsonFormat};
        if (all) args.insert(args.begin() + 1, "--all");

        std::vector<Container> containers;
        for (const auto& line : split_lines(run(ctx, args))) {
            containers.push_back(parse_container_line(line));
        }
        return containers;
    }

    ContainerFullConfig DockerCliClient::inspect_container(const OpContext& ctx, const std::string& id) {
        return parse_inspect_config(run(ctx, {"container", "inspect", id}));
    }

    void DockerCliClient::start_container(const OpContext& ctx, const std::string& id) {
        run(ctx, {"start", id});
    }

    void DockerCliClient::stop_container(const OpContext& ctx, const std::string& id, int timeout_seconds) {
        run(ctx, {"stop", "--time", std::to_string(timeout_seconds), id});
    }

    void DockerCliClient::restart_container(const OpContext& ctx, const std::string& id, int timeout_seconds) {
        run(ctx, {"restart", "--time", std::to_string(timeout_seconds), id});
    }

    void DockerCliClient::remove_container(const OpContext& ctx, const std::string& id, bool force) {
        if (force) run(ctx, {"rm", "--force", id});
        else run(ctx, {"rm", id});
    }

    std::vector<std::string> DockerCliClient::create_args(const ContainerFullConfig& config, const std::string& network) {
        std::vector<std::string> args{"create"};
        auto add = [&](const std::string& flag, const std::string& value) {
            args.push_back(flag);
            args.push_back(value);
        };

        if (!config.name.empty()) add("--name", config.name);
        for (const auto& e : config.env) add("--env", e);
        for (const auto& b : config.binds) add("--volume", b);
        for (const auto& label : config.labels) add("--label", label.first + "=" + label.second);
        if (!config.working_dir.empty()) add("--workdir", config.working_dir);
        if (!config.user.empty()) add("--user", config.user);
        if (config.privileged) args.push_back("--privileged");
        for (const auto& cap : config.cap_add) add("--cap-add", cap);
        for (const auto& cap : config.cap_drop) add("--cap-drop", cap);

        const RestartPolicy& policy = config.restart_policy;
        if (!policy.name.empty() && policy.name != "no") {
            if (policy.name == "on-failure" && policy.maximum_retry_count > 0) {
                add("--restart", fmt::format("on-failure:{}", policy.maximum_retry_count));
            } else {
                add("--restart", policy.name);
            }
        }

        for (const auto& port : config.port_bindings) {
            if (port.second.empty()) {
                add("--publish", port.first);
                continue;
            }
            for (const auto& b : port.second) {
                std::string publish = b.host_port.empty() ? port.first : b.host_port + ":" + port.first;
                if (!b.host_ip.empty()) publish = b.host_ip + ":" + (b.host_port.empty() ? ":" + port.first : publish);
                add("--publish", publish);
            }
        }

        if (!network.empty()) {
            add("--network", network);
            auto endpoint = config.networks.find(network);
            if (endpoint != config.networks.end() && supports_aliases(network)) {
                for (const auto& alias : endpoint->second.aliases) add("--network-alias", alias);
            }
        } else if (!config.network_mode.empty() && config.network_mode != "default") {
            add("--network", config.network_mode);
        }

        std::vector<std::string> trailing;
        if (!config.entrypoint.empty()) {
            add("--entrypoint", config.entrypoint.front());
            trailing.assign(config.entrypoint.begin() + 1, config.entrypoint.end());
        }
        trailing.insert(trailing.end(), config.cmd.begin(), config.cmd.end());

        args.push_back(config.image);
        args.insert(args.end(), trailing.begin(), trailing.end());
        return args;
    }

    std::string DockerCliClient::create_container(const OpContext& ctx, const ContainerFullConfig& config,
                                                  const std::string& network) {
        if (config.image.empty()) throw ClientError("docker create: no image in configuration");
        auto lines = split_lines(run(ctx, create_args(config, network)));
        // Pull progress may precede the id when the image is missing locally
        if (lines.empty()) throw ClientError("docker create: no container id returned");
        return lines.back();
    }

    // --- Networks ---

    std::vector<Network> DockerCliClient::list_networks(const OpContext& ctx) {
        auto ids = split_lines(run(ctx, {"network", "ls", "--quiet", "--no-trunc"}));
        if (ids.empty()) return {};

        std::vector<std::string> args{"network", "inspect"};
        args.insert(args.end(), ids.begin(), ids.end());
        return parse_network_inspect(run(ctx, args));
    }

    void DockerCliClient::attach_network(const OpContext& ctx, const std::string& network, const std::string& container,
                                         const std::vector<std::string>& aliases) {
        std::vector<std::string> args{"network", "connect"};
        if (supports_aliases(network)) {
            for (const auto& alias : aliases) {
                args.push_back("--alias");
                args.push_back(alias);
            }
        }
        args.push_back(network);
        args.push_back(container);
        run(ctx, args);
    }

    void DockerCliClient::detach_network(const OpContext& ctx, const std::string& network, const std::string& container) {
        run(ctx, {"network", "disconnect", network, container});
    }

    void DockerCliClient::create_network(const OpContext& ctx, const std::string& name, const std::string& driver) {
        if (driver.empty()) run(ctx, {"network", "create", name});
        else run(ctx, {"network", "create", "--driver", driver, name});
    }

    void DockerCliClient::remove_network(const OpContext& ctx, const std::string& id) {
        run(ctx, {"network", "rm", id});
    }

    // --- Images ---

    std::vector<Image> DockerCliClient::list_images(const OpContext& ctx) {
        return parse_image_lines(run(ctx, {"images", "--no-trunc", "--format", kJsonFormat}));
    }

    void DockerCliClient::remove_image(const OpContext& ctx, const std::string& id, bool force) {
        if (force) run(ctx, {"rmi", "--force", id});
        else run(ctx, {"rmi", id});
    }

    void DockerCliClient::pull_image(const OpContext& ctx, const std::string& reference) {
        run(ctx, {"pull", "--quiet", reference});
    }

    PruneReport DockerCliClient::prune_images(const OpContext& ctx) {
        return parse_prune_output(run(ctx, {"image", "prune", "--force"}));
    }

    // --- Volumes ---

    std::vector<Volume> DockerCliClient::list_volumes(const OpContext& ctx) {
        std::vector<Volume> volumes;
        for (const auto& line : split_lines(run(ctx, {"volume", "ls", "--format", kJsonFormat}))) {
            volumes.push_back(parse_volume_line(line));
        }
        if (volumes.empty()) return volumes;

        // Reference counts come from the mounts of every container, running or not
        for (const auto& c : list_containers(ctx, true)) {
            for (const auto& m : c.mounts) {
                for (auto& v : volumes) {
                    if (m.name == v.name) v.ref_count++;
                }
            }
        }
        return volumes;
    }

    void DockerCliClient::remove_volume(const OpContext& ctx, const std::string& name, bool force) {
        if (force) run(ctx, {"volume", "rm", "--force", name});
        else run(ctx, {"volume", "rm", name});
    }

    PruneReport DockerCliClient::prune_volumes(const OpContext& ctx) {
        return parse_prune_output(run(ctx, {"volume", "prune", "--force"}));
    }

    // --- Compose ---

    std::vector<ComposeProject> DockerCliClient::list_compose_projects(const OpContext& ctx) {
        return build_compose_projects(list_containers(ctx, true));
    }

    // --- Streams ---

    std::unique_ptr<LogStream> DockerCliClient::open_log_stream(const std::string& id, const LogOptions& options) {
        std::vector<std::string> argv{binary_, "logs", "--timestamps", "--tail", std::to_string(options.tail)};
        if (options.follow) argv.push_back("--follow");
        if (!options.since.empty()) {
            argv.push_back("--since");
            argv.push_back(options.since);
        }
        argv.push_back(id);

        auto stream = std::make_unique<LogStream>();
        stream->start([argv, id](StreamChannel<LogEntry>& channel, const CancelToken& token) {
            ChildProcess child;
            if (!child.spawn(argv)) {
                channel.fail("failed to start docker logs");
                return;
            }
            spdlog::debug("log stream opened for {}", short_id(id));

            std::string line;
            while (!token.cancelled()) {
                auto status = child.read_line(line, 200);
                if (status == ChildProcess::ReadStatus::Timeout) continue;
                if (status == ChildProcess::ReadStatus::Eof) break;
                if (!channel.push(parse_log_line(line))) break;
            }

            if (token.cancelled()) {
                child.terminate();
                spdlog::debug("log stream for {} cancelled", short_id(id));
                return;
            }
            int code = child.wait();
            if (code != 0) channel.fail(fmt::format("docker logs {} exited with code {}", short_id(id), code));
        });
        return stream;
    }

    std::unique_ptr<StatsStream> DockerCliClient::open_stats_stream(const std::string& id) {
        std::vector<std::string> argv{binary_, "stats", "--no-trunc", "--format", kJsonFormat, id};

        auto stream = std::make_unique<StatsStream>();
        stream->start([argv, id](StreamChannel<ContainerStats>& channel, const CancelToken& token) {
            ChildProcess child;
            if (!child.spawn(argv)) {
                channel.fail("failed to start docker stats");
                return;
            }
            spdlog::debug("stats stream opened for {}", short_id(id));

            std::string line;
            std::string last_output;
            while (!token.cancelled()) {
                auto status = child.read_line(line, 200);
                if (status == ChildProcess::ReadStatus::Timeout) continue;
                if (status == ChildProcess::ReadStatus::Eof) break;
                try {
                    auto sample = parse_stats_line(line);
                    if (!sample) {
                        if (!line.empty()) last_output = line;
                        continue;
                    }
                    if (sample->container_id.empty()) sample->container_id = id;
                    if (!channel.push(*sample)) break;
                } catch (const ClientError& e) {
                    spdlog::debug("skipping stats line: {}", e.what());
                }
            }

            if (token.cancelled()) {
                child.terminate();
                return;
            }
            int code = child.wait();
            if (code != 0) {
                channel.fail(last_output.empty() ? fmt::format("docker stats exited with code {}", code) : last_output);
            }
        });
        return stream;
    }

}
