#ifndef DOCKWATCH_APP_STATE_HPP
#define DOCKWATCH_APP_STATE_HPP

#include "modal.hpp"
#include "views.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace DockWatch {

    using Clock = std::chrono::steady_clock;

    struct Banner {
        std::string text;
        bool is_error = false;
        Clock::time_point expires_at;
    };

    // Action waiting on the open modal.
    struct PendingAction {
        IntentKind kind = IntentKind::None;
        std::string target;       // resource id or name
        std::string target_name;
        std::string parent;       // group / network id
        std::string parent_name;
    };

    struct ShellRequest {
        std::string container_id;
        std::string container_name;
    };

    // Root aggregate, mutated only by the reducer on the UI thread.
    struct AppState {
        ViewKind current_view = ViewKind::Containers;
        ViewKind previous_view = ViewKind::Containers;

        ContainersView containers;
        ImagesView images;
        GroupsView groups;
        VolumesView volumes;
        ComposeView compose;
        NetworksView networks;
        LogsView logs;
        StatsView stats;
        EnvVarsView env;
        AboutView about;

        std::optional<Modal> modal;
        std::optional<PendingAction> pending;

        std::string selected_container_id;
        std::string selected_container_name;

        std::optional<Banner> banner;
        std::string docker_version;

        int width = 80;
        int height = 24;
        bool ready = false;
        bool quit = false;
        std::optional<ShellRequest> shell_request;
        Clock::time_point last_refresh;
    };

}

#endif
