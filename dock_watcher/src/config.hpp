#ifndef DOCKWATCH_CONFIG_HPP
#define DOCKWATCH_CONFIG_HPP

#include <cstddef>
#include <string>

namespace DockWatch {

    struct AppConfig {
        // --- Loop ---
        int refresh_interval_ms = 2000;
        int tick_interval_ms = 500;
        int banner_ttl_ms = 2000;
        int error_banner_ttl_ms = 3000;

        // --- Timeouts (seconds) ---
        int list_timeout = 5;
        int operation_timeout = 10;
        int stop_grace = 10;
        int batch_timeout = 30;
        int recreate_timeout = 60;
        int pull_timeout = 120;

        // --- Streams ---
        int log_tail = 100;
        size_t log_buffer_lines = 1000;
        size_t stats_history = 60;

        std::string docker_binary = "docker";
        std::string log_level = "info";
        std::string config_dir;

        std::string groups_path() const { return config_dir + "/groups.json"; }
        std::string log_path() const { return config_dir + "/dock-watcher.log"; }
    };

    // $DOCKWATCH_CONFIG_PATH, else $HOME/.config/dock-watcher
    std::string default_config_dir();

    // Defaults, then <dir>/settings.json when present, then environment overrides.
    // A malformed settings file throws std::runtime_error.
    AppConfig load_config(const std::string& config_dir);

}

#endif
