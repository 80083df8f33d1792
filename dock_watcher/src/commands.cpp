#include "commands.hpp"
#include "subscription.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <functional>

namespace DockWatch {
namespace Commands {

    namespace {

        using Body = std::function<std::string(const OpContext& ctx)>;

        // Runs `body` under its own deadline; the returned text is the success detail.
        Command operation(const Services& s, OperationKind kind, const std::string& subject, int timeout, Body body) {
            return [s, kind, subject, timeout, body]() -> std::optional<Event> {
                OperationFinished done{kind, subject, "", ""};
                try {
                    done.detail = body(OpContext::with_timeout(s.root, timeout));
                    spdlog::info("{} {}: ok", operation_name(kind), subject);
                } catch (const std::exception& e) {
                    done.error = e.what();
                    spdlog::error("{} {} failed: {}", operation_name(kind), subject, done.error);
                }
                return Event{std::move(done)};
            };
        }

        template <typename Loaded, typename Fetch>
        Command listing(const Services& s, const char* what, Fetch fetch) {
            return [s, what, fetch]() -> std::optional<Event> {
                Loaded loaded;
                try {
                    fetch(s, OpContext::with_timeout(s.root, s.config.list_timeout), loaded);
                } catch (const std::exception& e) {
                    loaded.error = e.what();
                    spdlog::warn("listing {} failed: {}", what, loaded.error);
                }
                return Event{std::move(loaded)};
            };
        }

        std::string prune_summary(const char* what, const PruneReport& report) {
            return fmt::format("removed {} {}, reclaimed {}", report.removed, what, format_bytes(report.space_reclaimed));
        }

        BatchOperation batch_operation(const Services& s, BatchKind kind) {
            auto client = s.client;
            int grace = s.config.stop_grace;
            switch (kind) {
                case BatchKind::StartGroup:
                case BatchKind::StartProject:
                    return [client](const OpContext& ctx, const std::string& id) { client->start_container(ctx, id); };
                case BatchKind::StopGroup:
                case BatchKind::StopProject:
                    return [client, grace](const OpContext& ctx, const std::string& id) {
                        client->stop_container(ctx, id, grace);
                    };
                case BatchKind::RestartProject:
                    return [client, grace](const OpContext& ctx, const std::string& id) {
                        client->restart_container(ctx, id, grace);
                    };
            }
            return nullptr;
        }

    }

    // --- Listings ---

    Command fetch_containers(const Services& s) {
        return listing<ContainersLoaded>(s, "containers", [](const Services& s, const OpContext& ctx, ContainersLoaded& out) {
            out.containers = s.client->list_containers(ctx, true);
        });
    }

    Command fetch_images(const Services& s) {
        return listing<ImagesLoaded>(s, "images", [](const Services& s, const OpContext& ctx, ImagesLoaded& out) {
            out.images = s.client->list_images(ctx);
        });
    }

    Command fetch_volumes(const Services& s) {
        return listing<VolumesLoaded>(s, "volumes", [](const Services& s, const OpContext& ctx, VolumesLoaded& out) {
            out.volumes = s.client->list_volumes(ctx);
        });
    }

    Command fetch_networks(const Services& s) {
        return listing<NetworksLoaded>(s, "networks", [](const Services& s, const OpContext& ctx, NetworksLoaded& out) {
            out.networks = s.client->list_networks(ctx);
        });
    }

    Command fetch_compose(const Services& s) {
        return listing<ComposeLoaded>(s, "compose projects", [](const Services& s, const OpContext& ctx, ComposeLoaded& out) {
            out.projects = s.client->list_compose_projects(ctx);
        });
    }

    Command fetch_groups(const Services& s) {
        return listing<GroupsLoaded>(s, "groups", [](const Services& s, const OpContext&, GroupsLoaded& out) {
            out.groups = s.groups->list();
        });
    }

    // --- Containers ---

    Command start_container(const Services& s, const std::string& id, const std::string& name) {
        auto client = s.client;
        return operation(s, OperationKind::StartContainer, name, s.config.operation_timeout,
                         [client, id](const OpContext& ctx) {
                             client->start_container(ctx, id);
                             return std::string();
                         });
    }

    Command stop_container(const Services& s, const std::string& id, const std::string& name) {
        auto client = s.client;
        int grace = s.config.stop_grace;
        return operation(s, OperationKind::StopContainer, name, s.config.operation_timeout + grace,
                         [client, id, grace](const OpContext& ctx) {
                             client->stop_container(ctx, id, grace);
                             return std::string();
                         });
    }

    Command restart_container(const Services& s, const std::string& id, const std::string& name) {
        auto client = s.client;
        int grace = s.config.stop_grace;
        return operation(s, OperationKind::RestartContainer, name, s.config.operation_timeout + grace,
                         [client, id, grace](const OpContext& ctx) {
                             client->restart_container(ctx, id, grace);
                             return std::string();
                         });
    }

    Command remove_container(const Services& s, const std::string& id, const std::string& name) {
        auto client = s.client;
        // The subject carries the id so the follow-up can clean up groups
        return [s, client, id, name]() -> std::optional<Event> {
            OperationFinished done{OperationKind::RemoveContainer, id, "", ""};
            try {
                client->remove_container(OpContext::with_timeout(s.root, s.config.operation_timeout), id, true);
                done.detail = fmt::format("removed {}", name);
                spdlog::info("removed container {}", short_id(id));
            } catch (const std::exception& e) {
                done.error = e.what();
                spdlog::error("remove {} failed: {}", short_id(id), done.error);
            }
            return Event{std::move(done)};
        };
    }

    Command load_config(const Services& s, const std::string& id) {
        return [s, id]() -> std::optional<Event> {
            ConfigLoaded loaded;
            loaded.container_id = id;
            try {
                loaded.config = s.client->inspect_container(OpContext::with_timeout(s.root, s.config.operation_timeout), id);
            } catch (const std::exception& e) {
                loaded.error = e.what();
                spdlog::error("inspect {} failed: {}", short_id(id), loaded.error);
            }
            return Event{std::move(loaded)};
        };
    }

    Command recreate(const Services& s, const std::string& id, const std::string& name,
                     const ContainerFullConfig& config) {
        return [s, id, name, config]() -> std::optional<Event> {
            RecreateWorkflow workflow(*s.client, s.config.stop_grace, [name](RecreateStep step, const std::string& detail) {
                spdlog::debug("recreate {}: {} {}", name, step_name(step), detail);
            });
            RecreateFinished finished;
            finished.old_id = id;
            finished.name = name;
            finished.outcome = workflow.run(OpContext::with_timeout(s.root, s.config.recreate_timeout), id, config);
            return Event{std::move(finished)};
        };
    }

    // --- Images / volumes ---

    Command remove_image(const Services& s, const std::string& id, const std::string& name) {
        auto client = s.client;
        return operation(s, OperationKind::RemoveImage, name, s.config.operation_timeout, [client, id](const OpContext& ctx) {
            client->remove_image(ctx, id, false);
            return std::string();
        });
    }

    Command pull_image(const Services& s, const std::string& reference) {
        auto client = s.client;
        return operation(s, OperationKind::PullImage, reference, s.config.pull_timeout,
                         [client, reference](const OpContext& ctx) {
                             client->pull_image(ctx, reference);
                             return fmt::format("pulled {}", reference);
                         });
    }

    Command prune_images(const Services& s) {
        auto client = s.client;
        return operation(s, OperationKind::PruneImages, "dangling images", s.config.batch_timeout,
                         [client](const OpContext& ctx) { return prune_summary("images", client->prune_images(ctx)); });
    }

    Command remove_volume(const Services& s, const std::string& name) {
        auto client = s.client;
        return operation(s, OperationKind::RemoveVolume, name, s.config.operation_timeout, [client, name](const OpContext& ctx) {
            client->remove_volume(ctx, name, false);
            return std::string();
        });
    }

    Command prune_volumes(const Services& s) {
        auto client = s.client;
        return operation(s, OperationKind::PruneVolumes, "unused volumes", s.config.batch_timeout,
                         [client](const OpContext& ctx) { return prune_summary("volumes", client->prune_volumes(ctx)); });
    }

    // --- Networks ---

    Command create_network(const Services& s, const std::string& name, const std::string& driver) {
        auto client = s.client;
        return operation(s, OperationKind::CreateNetwork, name, s.config.operation_timeout,
                         [client, name, driver](const OpContext& ctx) {
                             client->create_network(ctx, name, driver);
                             return std::string();
                         });
    }

    Command remove_network(const Services& s, const std::string& id, const std::string& name) {
        auto client = s.client;
        return operation(s, OperationKind::RemoveNetwork, name, s.config.operation_timeout, [client, id](const OpContext& ctx) {
            client->remove_network(ctx, id);
            return std::string();
        });
    }

    Command connect_network(const Services& s, const std::string& network, const std::string& network_name,
                            const std::string& container) {
        auto client = s.client;
        return operation(s, OperationKind::ConnectNetwork, network_name, s.config.operation_timeout,
                         [client, network, network_name, container](const OpContext& ctx) {
                             client->attach_network(ctx, network, container, {});
                             return fmt::format("connected {} to {}", short_id(container), network_name);
                         });
    }

    Command disconnect_network(const Services& s, const std::string& network, const std::string& network_name,
                               const std::string& container) {
        auto client = s.client;
        return operation(s, OperationKind::DisconnectNetwork, network_name, s.config.operation_timeout,
                         [client, network, network_name, container](const OpContext& ctx) {
                             client->detach_network(ctx, network, container);
                             return fmt::format("disconnected {} from {}", short_id(container), network_name);
                         });
    }

    // --- Groups ---

    Command create_group(const Services& s, const std::string& name, const std::string& description) {
        auto store = s.groups;
        return operation(s, OperationKind::CreateGroup, name, s.config.operation_timeout,
                         [store, name, description](const OpContext&) {
                             Group g = store->create(name, description, {});
                             return fmt::format("created group {}", g.name);
                         });
    }

    Command delete_group(const Services& s, const std::string& id, const std::string& name) {
        auto store = s.groups;
        return operation(s, OperationKind::DeleteGroup, name, s.config.operation_timeout, [store, id](const OpContext&) {
            store->remove(id);
            return std::string();
        });
    }

    Command add_to_group(const Services& s, const std::string& group_id, const std::string& group_name,
                         const std::string& container_id) {
        auto store = s.groups;
        return operation(s, OperationKind::AddToGroup, group_name, s.config.operation_timeout,
                         [store, group_id, group_name, container_id](const OpContext&) {
                             store->add_member(group_id, container_id);
                             return fmt::format("added {} to {}", short_id(container_id), group_name);
                         });
    }

    Command remove_from_group(const Services& s, const std::string& group_id, const std::string& group_name,
                              const std::string& container_id) {
        auto store = s.groups;
        return operation(s, OperationKind::RemoveFromGroup, group_name, s.config.operation_timeout,
                         [store, group_id, group_name, container_id](const OpContext&) {
                             store->remove_member(group_id, container_id);
                             return fmt::format("removed {} from {}", short_id(container_id), group_name);
                         });
    }

    Command forget_container(const Services& s, const std::string& container_id) {
        auto store = s.groups;
        return operation(s, OperationKind::ForgetContainer, short_id(container_id), s.config.operation_timeout,
                         [store, container_id](const OpContext&) {
                             int changed = store->remove_member_everywhere(container_id);
                             return changed == 0 ? std::string() : fmt::format("removed from {} group(s)", changed);
                         });
    }

    Command replace_container(const Services& s, const std::string& old_id, const std::string& new_id) {
        auto store = s.groups;
        return operation(s, OperationKind::ReplaceContainer, short_id(new_id), s.config.operation_timeout,
                         [store, old_id, new_id](const OpContext&) {
                             int changed = store->replace_member(old_id, new_id);
                             return changed == 0 ? std::string() : fmt::format("updated {} group(s)", changed);
                         });
    }

    // --- Batches ---

    Command group_batch(const Services& s, BatchKind kind, const std::string& group_id, const std::string& group_name) {
        return [s, kind, group_id, group_name]() -> std::optional<Event> {
            BatchFinished finished{kind, group_name, {}};
            auto group = s.groups->get(group_id);
            if (!group) {
                finished.outcome.total = 1;
                finished.outcome.failures.push_back({group_id, "group no longer exists"});
                return Event{std::move(finished)};
            }
            spdlog::info("{} {} ({} members)", batch_name(kind), group_name, group->container_ids.size());
            finished.outcome = run_batch(group->container_ids, batch_operation(s, kind),
                                         OpContext::with_timeout(s.root, s.config.batch_timeout));
            return Event{std::move(finished)};
        };
    }

    Command project_batch(const Services& s, BatchKind kind, const std::string& project,
                          const std::vector<std::string>& container_ids) {
        return [s, kind, project, container_ids]() -> std::optional<Event> {
            spdlog::info("{} {} ({} containers)", batch_name(kind), project, container_ids.size());
            BatchFinished finished{kind, project, {}};
            finished.outcome = run_batch(container_ids, batch_operation(s, kind),
                                         OpContext::with_timeout(s.root, s.config.batch_timeout));
            return Event{std::move(finished)};
        };
    }

    // --- Streams ---

    Command open_logs(const Services& s, const std::string& container_id) {
        return [s, container_id]() -> std::optional<Event> {
            LogStreamOpened opened;
            opened.container_id = container_id;
            try {
                LogOptions options;
                options.tail = s.config.log_tail;
                opened.sub = open_log_subscription(*s.client, container_id, options);
            } catch (const std::exception& e) {
                opened.error = e.what();
                spdlog::error("cannot open logs for {}: {}", short_id(container_id), opened.error);
            }
            return Event{std::move(opened)};
        };
    }

    Command open_stats(const Services& s, const std::string& container_id) {
        return [s, container_id]() -> std::optional<Event> {
            StatsStreamOpened opened;
            opened.container_id = container_id;
            try {
                opened.sub = open_stats_subscription(*s.client, container_id);
            } catch (const std::exception& e) {
                opened.error = e.what();
                spdlog::error("cannot open stats for {}: {}", short_id(container_id), opened.error);
            }
            return Event{std::move(opened)};
        };
    }

}
}
