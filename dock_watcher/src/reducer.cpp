#include "reducer.hpp"
#include "subscription.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace DockWatch {

    namespace {

        bool view_filtering(const AppState& s) {
            switch (s.current_view) {
                case ViewKind::Containers: return s.containers.is_filtering();
                case ViewKind::Images: return s.images.is_filtering();
                case ViewKind::Groups: return s.groups.is_filtering();
                case ViewKind::Volumes: return s.volumes.is_filtering();
                case ViewKind::Compose: return s.compose.is_filtering();
                case ViewKind::Networks: return s.networks.is_filtering();
                case ViewKind::Logs: return s.logs.is_filtering();
                case ViewKind::Stats: return s.stats.is_filtering();
                case ViewKind::EnvVars: return s.env.is_filtering();
                case ViewKind::About: return s.about.is_filtering();
            }
            return false;
        }

        // Views with their own "go up one level" on esc
        bool view_consumes_esc(const AppState& s) {
            switch (s.current_view) {
                case ViewKind::Groups: return s.groups.consumes_esc();
                case ViewKind::Networks: return s.networks.consumes_esc();
                case ViewKind::Compose: return s.compose.consumes_esc();
                case ViewKind::EnvVars: return s.env.consumes_esc();
                default: return false;
            }
        }

        bool is_digit_key(const Key& key) {
            return key.printable && key.name.size() == 1 && key.name[0] >= '1' && key.name[0] <= '9';
        }

        void append(std::vector<Command>& to, std::vector<Command> more) {
            for (auto& c : more) to.push_back(std::move(c));
        }

    }

    bool is_detail_view(ViewKind kind) {
        return kind == ViewKind::Logs || kind == ViewKind::Stats || kind == ViewKind::EnvVars || kind == ViewKind::About;
    }

    bool is_global_key(const AppState& s, const Key& key) {
        if (key.is("q") || key.is("ctrl+c") || key.is("?")) return true;
        if (key.is("tab") || key.is("shift+tab")) return true;
        if (key.is("esc")) return !view_consumes_esc(s);
        if (is_digit_key(key)) return key.name[0] - '1' < (int)main_views().size();
        return false;
    }

    KeyConsumer route_key(const AppState& s, const Key& key) {
        if (s.modal) return KeyConsumer::Modal;
        if (view_filtering(s)) return KeyConsumer::Filter;
        if (is_global_key(s, key)) return KeyConsumer::Global;
        return KeyConsumer::View;
    }

    Reducer::Reducer(Services services) : services_(std::move(services)) {}

    std::vector<Command> Reducer::reduce(AppState& state, const Event& event) {
        return std::visit([&](const auto& e) { return handle(state, e); }, event);
    }

    std::vector<Command> Reducer::start(AppState& s) {
        s.last_refresh = Clock::now();
        return {
            Commands::fetch_containers(services_), Commands::fetch_images(services_),
            Commands::fetch_volumes(services_), Commands::fetch_networks(services_),
            Commands::fetch_compose(services_), Commands::fetch_groups(services_),
        };
    }

    void Reducer::teardown(AppState& s) {
        close_streams(s);
    }

    void Reducer::close_streams(AppState& s) {
        if (s.logs.sub) {
            spdlog::info("closing log subscription {}", s.logs.sub->id());
            s.logs.sub->close();
            s.logs.sub.reset();
        }
        if (s.stats.sub) {
            spdlog::info("closing stats subscription {}", s.stats.sub->id());
            s.stats.sub->close();
            s.stats.sub.reset();
        }
    }

    void Reducer::set_banner(AppState& s, const std::string& text, bool is_error) const {
        int ttl = is_error ? services_.config.error_banner_ttl_ms : services_.config.banner_ttl_ms;
        s.banner = Banner{text, is_error, Clock::now() + std::chrono::milliseconds(ttl)};
    }

    // --- Navigation ---

    std::vector<Command> Reducer::refresh(const AppState&, ViewKind view) const {
        switch (view) {
            case ViewKind::Containers: return {Commands::fetch_containers(services_)};
            case ViewKind::Images: return {Commands::fetch_images(services_)};
            case ViewKind::Groups: return {Commands::fetch_groups(services_), Commands::fetch_containers(services_)};
            case ViewKind::Volumes: return {Commands::fetch_volumes(services_)};
            case ViewKind::Compose: return {Commands::fetch_compose(services_)};
            case ViewKind::Networks: return {Commands::fetch_networks(services_), Commands::fetch_containers(services_)};
            default: return {};
        }
    }

    std::vector<Command> Reducer::switch_view(AppState& s, ViewKind target) {
        if (target == s.current_view) return {};
        if (s.current_view == ViewKind::Logs || s.current_view == ViewKind::Stats) close_streams(s);
        if (!is_detail_view(s.current_view)) s.previous_view = s.current_view;
        s.current_view = target;
        s.last_refresh = Clock::now();
        return refresh(s, target);
    }

    // --- Input ---

    std::vector<Command> Reducer::handle(AppState& s, const KeyPressed& e) {
        switch (route_key(s, e.key)) {
            case KeyConsumer::Modal: return modal_key(s, e.key);
            case KeyConsumer::Filter: filter_key(s, e.key); return {};
            case KeyConsumer::Global: return global_key(s, e.key);
            case KeyConsumer::View: return perform(s, view_key(s, e.key));
        }
        return {};
    }

    std::vector<Command> Reducer::modal_key(AppState& s, const Key& key) {
        Modal::Result result = s.modal->handle_key(key);
        if (result == Modal::Result::Pending) return {};

        Modal modal = *s.modal;
        PendingAction action = s.pending.value_or(PendingAction{});
        s.modal.reset();
        s.pending.reset();

        if (result == Modal::Result::Cancelled) {
            spdlog::debug("modal '{}' cancelled", modal.title());
            return {};
        }
        return confirm(s, action, modal);
    }

    void Reducer::filter_key(AppState& s, const Key& key) {
        switch (s.current_view) {
            case ViewKind::Containers: s.containers.handle_filter_key(key); break;
            case ViewKind::Images: s.images.handle_filter_key(key); break;
            case ViewKind::Groups: s.groups.handle_filter_key(key); break;
            case ViewKind::Volumes: s.volumes.handle_filter_key(key); break;
            case ViewKind::Compose: s.compose.handle_filter_key(key); break;
            case ViewKind::Networks: s.networks.handle_filter_key(key); break;
            case ViewKind::EnvVars: s.env.handle_filter_key(key); break;
            case ViewKind::Logs:
            case ViewKind::Stats:
            case ViewKind::About: break;
        }
    }

    std::vector<Command> Reducer::global_key(AppState& s, const Key& key) {
        if (key.is("q") || key.is("ctrl+c")) {
            if (is_detail_view(s.current_view)) return switch_view(s, ViewKind::Containers);
            teardown(s);
            s.quit = true;
            return {};
        }
        if (key.is("?")) return switch_view(s, ViewKind::About);
        if (key.is("esc")) {
            if (is_detail_view(s.current_view)) return switch_view(s, s.previous_view);
            s.banner.reset();
            return {};
        }

        const auto& views = main_views();
        int n = (int)views.size();
        if (key.is("tab") || key.is("shift+tab")) {
            auto it = std::find(views.begin(), views.end(), s.current_view);
            int index = it == views.end() ? 0 : (int)(it - views.begin());
            int delta = key.is("tab") ? 1 : -1;
            return switch_view(s, views[((index + delta) % n + n) % n]);
        }
        if (is_digit_key(key)) {
            int index = key.name[0] - '1';
            if (index < n) return switch_view(s, views[index]);
        }
        return {};
    }

    Intent Reducer::view_key(AppState& s, const Key& key) {
        switch (s.current_view) {
            case ViewKind::Containers: return s.containers.handle_key(key);
            case ViewKind::Images: return s.images.handle_key(key);
            case ViewKind::Groups: return s.groups.handle_key(key);
            case ViewKind::Volumes: return s.volumes.handle_key(key);
            case ViewKind::Compose: return s.compose.handle_key(key);
            case ViewKind::Networks: return s.networks.handle_key(key);
            case ViewKind::Logs: return s.logs.handle_key(key);
            case ViewKind::Stats: return s.stats.handle_key(key);
            case ViewKind::EnvVars: return s.env.handle_key(key);
            case ViewKind::About: return s.about.handle_key(key);
        }
        return {};
    }

    void Reducer::ask(AppState& s, const Intent& intent, Modal modal) {
        s.modal = std::move(modal);
        s.pending = PendingAction{intent.kind, intent.id, intent.name, intent.parent_id, intent.parent_name};
    }

    std::vector<Command> Reducer::perform(AppState& s, const Intent& intent) {
        const Services& sv = services_;
        switch (intent.kind) {
            case IntentKind::None:
                return {};

            // --- Containers ---
            case IntentKind::Start:
                set_banner(s, fmt::format("Starting {}...", intent.name), false);
                return {Commands::start_container(sv, intent.id, intent.name)};
            case IntentKind::Stop:
                set_banner(s, fmt::format("Stopping {}...", intent.name), false);
                return {Commands::stop_container(sv, intent.id, intent.name)};
            case IntentKind::Restart:
                set_banner(s, fmt::format("Restarting {}...", intent.name), false);
                return {Commands::restart_container(sv, intent.id, intent.name)};
            case IntentKind::Delete:
                ask(s, intent, Modal::confirm("Delete container",
                                              fmt::format("Remove container {} ({})?", intent.name, short_id(intent.id))));
                return {};
            case IntentKind::Logs: {
                close_streams(s);
                s.selected_container_id = intent.id;
                s.selected_container_name = intent.name;
                s.logs.open(intent.id, intent.name, sv.config.log_buffer_lines);
                s.logs.set_size(s.width, s.height);
                auto cmds = switch_view(s, ViewKind::Logs);
                cmds.push_back(Commands::open_logs(sv, intent.id));
                return cmds;
            }
            case IntentKind::Stats: {
                close_streams(s);
                s.selected_container_id = intent.id;
                s.selected_container_name = intent.name;
                s.stats.open(intent.id, intent.name, sv.config.stats_history);
                auto cmds = switch_view(s, ViewKind::Stats);
                cmds.push_back(Commands::open_stats(sv, intent.id));
                return cmds;
            }
            case IntentKind::Shell: {
                auto it = std::find_if(s.containers.items.begin(), s.containers.items.end(),
                                       [&](const Container& c) { return c.id == intent.id; });
                if (it != s.containers.items.end() && !it->is_running()) {
                    set_banner(s, fmt::format("{} is not running", intent.name), true);
                    return {};
                }
                s.selected_container_id = intent.id;
                s.selected_container_name = intent.name;
                s.shell_request = ShellRequest{intent.id, intent.name};
                return {};
            }
            case IntentKind::EditEnv: {
                s.selected_container_id = intent.id;
                s.selected_container_name = intent.name;
                s.env.open(intent.id, intent.name);
                s.env.set_size(s.width, s.height);
                auto cmds = switch_view(s, ViewKind::EnvVars);
                cmds.push_back(Commands::load_config(sv, intent.id));
                return cmds;
            }

            // --- Images / volumes ---
            case IntentKind::DeleteImage:
                ask(s, intent, Modal::confirm("Delete image", fmt::format("Remove image {}?", intent.name)));
                return {};
            case IntentKind::PullImage:
                ask(s, intent, Modal::form("Pull image", {{"Image", "", true}}));
                return {};
            case IntentKind::PruneImages:
                ask(s, intent, Modal::confirm("Prune images", "Remove all dangling images?"));
                return {};
            case IntentKind::DeleteVolume:
                ask(s, intent, Modal::confirm("Delete volume", fmt::format("Remove volume {}?", intent.name)));
                return {};
            case IntentKind::PruneVolumes:
                ask(s, intent, Modal::confirm("Prune volumes", "Remove all unused volumes?"));
                return {};

            // --- Groups ---
            case IntentKind::CreateGroup:
                ask(s, intent, Modal::form("New group", {{"Name", "", true}, {"Description", "", false}}));
                return {};
            case IntentKind::DeleteGroup:
                ask(s, intent, Modal::confirm("Delete group",
                                              fmt::format("Delete group {}? Its containers are not touched.", intent.name)));
                return {};
            case IntentKind::StartGroup:
                set_banner(s, fmt::format("Starting group {}...", intent.name), false);
                return {Commands::group_batch(sv, BatchKind::StartGroup, intent.id, intent.name)};
            case IntentKind::StopGroup:
                set_banner(s, fmt::format("Stopping group {}...", intent.name), false);
                return {Commands::group_batch(sv, BatchKind::StopGroup, intent.id, intent.name)};
            case IntentKind::AddToGroup:
                return {Commands::add_to_group(sv, intent.parent_id, intent.parent_name, intent.id)};
            case IntentKind::RemoveFromGroup:
                ask(s, intent, Modal::confirm("Remove from group",
                                              fmt::format("Remove {} from {}?", intent.name, intent.parent_name)));
                return {};

            // --- Networks ---
            case IntentKind::CreateNetwork:
                ask(s, intent, Modal::form("New network", {{"Name", "", true}, {"Driver", "bridge", false}}));
                return {};
            case IntentKind::DeleteNetwork: {
                auto it = std::find_if(s.networks.networks.begin(), s.networks.networks.end(),
                                       [&](const Network& n) { return n.id == intent.id; });
                if (it != s.networks.networks.end() && it->is_system()) {
                    set_banner(s, fmt::format("{} is a system network and cannot be removed", intent.name), true);
                    return {};
                }
                ask(s, intent, Modal::confirm("Delete network", fmt::format("Remove network {}?", intent.name)));
                return {};
            }
            case IntentKind::Connect:
                return {Commands::connect_network(sv, intent.parent_id, intent.parent_name, intent.id)};
            case IntentKind::Disconnect:
                ask(s, intent, Modal::confirm("Disconnect",
                                              fmt::format("Disconnect {} from {}?", intent.name, intent.parent_name)));
                return {};

            // --- Compose ---
            case IntentKind::StartProject:
            case IntentKind::StopProject:
            case IntentKind::RestartProject: {
                auto it = std::find_if(s.compose.projects.begin(), s.compose.projects.end(),
                                       [&](const ComposeProject& p) { return p.name == intent.id; });
                if (it == s.compose.projects.end() || it->container_ids.empty()) {
                    set_banner(s, fmt::format("project {} has no containers", intent.name), true);
                    return {};
                }
                BatchKind kind = intent.kind == IntentKind::StartProject  ? BatchKind::StartProject
                                 : intent.kind == IntentKind::StopProject ? BatchKind::StopProject
                                                                          : BatchKind::RestartProject;
                set_banner(s, fmt::format("{} {}...", batch_name(kind), intent.name), false);
                return {Commands::project_batch(sv, kind, intent.name, it->container_ids)};
            }

            // --- Environment ---
            case IntentKind::SaveEnv:
                if (!s.env.loaded) {
                    set_banner(s, "configuration not loaded yet", true);
                    return {};
                }
                if (!s.env.dirty) {
                    set_banner(s, "no changes to save", false);
                    return {};
                }
                ask(s, intent, Modal::confirm("Recreate container",
                                              fmt::format("Recreate {} with the edited environment? "
                                                          "It will be stopped, removed and created again.",
                                                          intent.name)));
                return {};
        }
        return {};
    }

    std::vector<Command> Reducer::confirm(AppState& s, const PendingAction& a, const Modal& modal) {
        const Services& sv = services_;
        switch (a.kind) {
            case IntentKind::Delete:
                set_banner(s, fmt::format("Removing {}...", a.target_name), false);
                return {Commands::remove_container(sv, a.target, a.target_name)};
            case IntentKind::DeleteImage:
                return {Commands::remove_image(sv, a.target, a.target_name)};
            case IntentKind::PullImage: {
                std::string reference = modal.value("Image");
                set_banner(s, fmt::format("Pulling {}...", reference), false);
                return {Commands::pull_image(sv, reference)};
            }
            case IntentKind::PruneImages:
                return {Commands::prune_images(sv)};
            case IntentKind::DeleteVolume:
                return {Commands::remove_volume(sv, a.target)};
            case IntentKind::PruneVolumes:
                return {Commands::prune_volumes(sv)};
            case IntentKind::CreateGroup:
                return {Commands::create_group(sv, modal.value("Name"), modal.value("Description"))};
            case IntentKind::DeleteGroup:
                return {Commands::delete_group(sv, a.target, a.target_name)};
            case IntentKind::RemoveFromGroup:
                return {Commands::remove_from_group(sv, a.parent, a.parent_name, a.target)};
            case IntentKind::CreateNetwork:
                return {Commands::create_network(sv, modal.value("Name"), modal.value("Driver"))};
            case IntentKind::DeleteNetwork:
                return {Commands::remove_network(sv, a.target, a.target_name)};
            case IntentKind::Disconnect:
                return {Commands::disconnect_network(sv, a.parent, a.parent_name, a.target)};
            case IntentKind::SaveEnv:
                set_banner(s, fmt::format("Recreating {}...", a.target_name), false);
                return {Commands::recreate(sv, a.target, a.target_name, s.env.edited_config())};
            default:
                spdlog::warn("confirmed modal '{}' has no action", modal.title());
                return {};
        }
    }

    // --- Loop ---

    std::vector<Command> Reducer::handle(AppState& s, const Resized& e) {
        s.width = e.width;
        s.height = e.height;
        s.containers.set_size(e.width, e.height);
        s.images.set_size(e.width, e.height);
        s.groups.set_size(e.width, e.height);
        s.volumes.set_size(e.width, e.height);
        s.compose.set_size(e.width, e.height);
        s.networks.set_size(e.width, e.height);
        s.logs.set_size(e.width, e.height);
        s.stats.set_size(e.width, e.height);
        s.env.set_size(e.width, e.height);
        s.about.set_size(e.width, e.height);
        return {};
    }

    std::vector<Command> Reducer::handle(AppState& s, const Tick& e) {
        if (s.banner && e.now >= s.banner->expires_at) s.banner.reset();

        if (s.modal || view_filtering(s)) return {};
        if (e.now - s.last_refresh < std::chrono::milliseconds(services_.config.refresh_interval_ms)) return {};
        s.last_refresh = e.now;
        return refresh(s, s.current_view);
    }

    // --- Listings ---

    std::vector<Command> Reducer::handle(AppState& s, const ContainersLoaded& e) {
        if (!e.error.empty()) {
            set_banner(s, "Error listing containers: " + e.error, true);
            return {};
        }
        s.containers.set_items(e.containers);
        s.groups.set_containers(e.containers);
        s.networks.set_containers(e.containers);
        s.ready = true;
        return {};
    }

    std::vector<Command> Reducer::handle(AppState& s, const ImagesLoaded& e) {
        if (!e.error.empty()) set_banner(s, "Error listing images: " + e.error, true);
        else s.images.set_items(e.images);
        return {};
    }

    std::vector<Command> Reducer::handle(AppState& s, const VolumesLoaded& e) {
        if (!e.error.empty()) set_banner(s, "Error listing volumes: " + e.error, true);
        else s.volumes.set_items(e.volumes);
        return {};
    }

    std::vector<Command> Reducer::handle(AppState& s, const NetworksLoaded& e) {
        if (!e.error.empty()) set_banner(s, "Error listing networks: " + e.error, true);
        else s.networks.set_networks(e.networks);
        return {};
    }

    std::vector<Command> Reducer::handle(AppState& s, const ComposeLoaded& e) {
        if (!e.error.empty()) set_banner(s, "Error listing compose projects: " + e.error, true);
        else s.compose.set_projects(e.projects);
        return {};
    }

    std::vector<Command> Reducer::handle(AppState& s, const GroupsLoaded& e) {
        if (!e.error.empty()) set_banner(s, "Error loading groups: " + e.error, true);
        else s.groups.set_groups(e.groups);
        return {};
    }

    // --- Results ---

    std::vector<Command> Reducer::handle(AppState& s, const OperationFinished& e) {
        bool ok = e.error.empty();
        bool group_sync = e.kind == OperationKind::ForgetContainer || e.kind == OperationKind::ReplaceContainer;

        if (!ok) {
            set_banner(s, fmt::format("{} {} failed: {}", operation_name(e.kind), e.subject, e.error), true);
        } else if (!e.detail.empty()) {
            set_banner(s, e.detail, false);
        } else if (!group_sync) {
            set_banner(s, fmt::format("{} {}: done", operation_name(e.kind), e.subject), false);
        }

        std::vector<Command> cmds;
        const Services& sv = services_;
        switch (e.kind) {
            case OperationKind::RemoveContainer:
                if (ok) cmds.push_back(Commands::forget_container(sv, e.subject));
                cmds.push_back(Commands::fetch_containers(sv));
                break;
            case OperationKind::StartContainer:
            case OperationKind::StopContainer:
            case OperationKind::RestartContainer:
                cmds.push_back(Commands::fetch_containers(sv));
                if (s.current_view == ViewKind::Compose) cmds.push_back(Commands::fetch_compose(sv));
                break;
            case OperationKind::RemoveImage:
            case OperationKind::PullImage:
            case OperationKind::PruneImages:
                cmds.push_back(Commands::fetch_images(sv));
                break;
            case OperationKind::RemoveVolume:
            case OperationKind::PruneVolumes:
                cmds.push_back(Commands::fetch_volumes(sv));
                break;
            case OperationKind::CreateNetwork:
            case OperationKind::RemoveNetwork:
            case OperationKind::ConnectNetwork:
            case OperationKind::DisconnectNetwork:
                cmds.push_back(Commands::fetch_networks(sv));
                cmds.push_back(Commands::fetch_containers(sv));
                break;
            case OperationKind::CreateGroup:
            case OperationKind::DeleteGroup:
            case OperationKind::AddToGroup:
            case OperationKind::RemoveFromGroup:
            case OperationKind::ForgetContainer:
            case OperationKind::ReplaceContainer:
                cmds.push_back(Commands::fetch_groups(sv));
                break;
        }
        return cmds;
    }

    std::vector<Command> Reducer::handle(AppState& s, const BatchFinished& e) {
        std::string text = fmt::format("{} {}: {}", batch_name(e.kind), e.subject, e.outcome.message());
        set_banner(s, text, !e.outcome.ok());

        std::vector<Command> cmds{Commands::fetch_containers(services_)};
        if (s.current_view == ViewKind::Compose) cmds.push_back(Commands::fetch_compose(services_));
        if (s.current_view == ViewKind::Groups) cmds.push_back(Commands::fetch_groups(services_));
        return cmds;
    }

    std::vector<Command> Reducer::handle(AppState& s, const ConfigLoaded& e) {
        if (s.env.container_id != e.container_id) return {};
        if (!e.error.empty()) {
            s.env.error = e.error;
            set_banner(s, "Cannot read configuration: " + e.error, true);
            return {};
        }
        s.env.load(e.config);
        return {};
    }

    std::vector<Command> Reducer::handle(AppState& s, const RecreateFinished& e) {
        const RecreateOutcome& out = e.outcome;
        std::vector<Command> cmds;
        if (out.created()) cmds.push_back(Commands::replace_container(services_, e.old_id, out.new_id));

        if (out.ok()) {
            std::string text = fmt::format("Recreated {} as {}", e.name, short_id(out.new_id));
            if (!out.warnings.empty()) text += fmt::format(" ({} warning(s), see log)", out.warnings.size());
            set_banner(s, text, false);
        } else if (out.created()) {
            set_banner(s, fmt::format("Recreated {} as {} but {} failed: {}", e.name, short_id(out.new_id),
                                      step_name(out.aborted_at), out.cause), true);
        } else {
            set_banner(s, fmt::format("Recreate {} failed at {}: {}", e.name, step_name(out.aborted_at), out.cause), true);
        }

        if (s.env.container_id == e.old_id && out.created()) {
            s.env.dirty = false;
            s.env.container_id = out.new_id;
            if (s.selected_container_id == e.old_id) s.selected_container_id = out.new_id;
            if (s.current_view == ViewKind::EnvVars) append(cmds, switch_view(s, ViewKind::Containers));
        }
        cmds.push_back(Commands::fetch_containers(services_));
        return cmds;
    }

    // --- Streams ---

    std::vector<Command> Reducer::handle(AppState& s, const LogStreamOpened& e) {
        if (!e.sub) {
            if (s.logs.container_id == e.container_id) s.logs.error = e.error;
            set_banner(s, "Cannot open logs: " + e.error, true);
            return {};
        }
        if (s.current_view != ViewKind::Logs || s.logs.container_id != e.container_id || s.logs.sub) {
            e.sub->close();
            return {};
        }
        s.logs.sub = e.sub;
        return {next_log_command(s.logs.sub, services_.root)};
    }

    std::vector<Command> Reducer::handle(AppState& s, const StatsStreamOpened& e) {
        if (!e.sub) {
            if (s.stats.container_id == e.container_id) s.stats.error = e.error;
            set_banner(s, "Cannot open stats: " + e.error, true);
            return {};
        }
        if (s.current_view != ViewKind::Stats || s.stats.container_id != e.container_id || s.stats.sub) {
            e.sub->close();
            return {};
        }
        s.stats.sub = e.sub;
        return {next_stats_command(s.stats.sub, services_.root)};
    }

    std::vector<Command> Reducer::handle(AppState& s, const LogReceived& e) {
        if (!s.logs.sub || s.logs.sub->id() != e.sub_id) return {};
        s.logs.append(e.entry);
        return {next_log_command(s.logs.sub, services_.root)};
    }

    std::vector<Command> Reducer::handle(AppState& s, const StatsReceived& e) {
        if (!s.stats.sub || s.stats.sub->id() != e.sub_id) return {};
        s.stats.add(e.stats);
        return {next_stats_command(s.stats.sub, services_.root)};
    }

    std::vector<Command> Reducer::handle(AppState& s, const StreamFailed& e) {
        if (s.logs.sub && s.logs.sub->id() == e.sub_id) {
            s.logs.error = e.error;
            s.logs.sub->close();
            s.logs.sub.reset();
            set_banner(s, "Log stream error: " + e.error, true);
        } else if (s.stats.sub && s.stats.sub->id() == e.sub_id) {
            s.stats.error = e.error;
            s.stats.sub->close();
            s.stats.sub.reset();
            set_banner(s, "Stats stream error: " + e.error, true);
        }
        return {};
    }

    // --- Misc ---

    std::vector<Command> Reducer::handle(AppState& s, const ShellExited& e) {
        if (e.exit_code < 0) set_banner(s, fmt::format("could not start a shell in {}", short_id(e.container_id)), true);
        else set_banner(s, fmt::format("shell in {} exited ({})", short_id(e.container_id), e.exit_code), false);
        return {Commands::fetch_containers(services_)};
    }

    std::vector<Command> Reducer::handle(AppState& s, const Notice& e) {
        set_banner(s, e.text, e.is_error);
        return {};
    }

}
