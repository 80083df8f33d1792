#include "config.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace pt = boost::property_tree;

namespace DockWatch {

    namespace {

        template <typename T>
        void override_from(const pt::ptree& tree, const char* key, T& target) {
            target = tree.get<T>(key, target);
        }

    }

    std::string default_config_dir() {
        const char* explicit_dir = std::getenv("DOCKWATCH_CONFIG_PATH");
        if (explicit_dir && *explicit_dir) return explicit_dir;
        const char* home = std::getenv("HOME");
        return std::string(home && *home ? home : ".") + "/.config/dock-watcher";
    }

    AppConfig load_config(const std::string& config_dir) {
        AppConfig cfg;
        cfg.config_dir = config_dir;

        std::string settings = config_dir + "/settings.json";
        std::error_code ec;
        if (std::filesystem::exists(settings, ec)) {
            pt::ptree tree;
            try {
                pt::read_json(settings, tree);
                override_from(tree, "refresh_interval_ms", cfg.refresh_interval_ms);
                override_from(tree, "tick_interval_ms", cfg.tick_interval_ms);
                override_from(tree, "banner_ttl_ms", cfg.banner_ttl_ms);
                override_from(tree, "error_banner_ttl_ms", cfg.error_banner_ttl_ms);
                override_from(tree, "timeouts.list", cfg.list_timeout);
                override_from(tree, "timeouts.operation", cfg.operation_timeout);
                override_from(tree, "timeouts.stop_grace", cfg.stop_grace);
                override_from(tree, "timeouts.batch", cfg.batch_timeout);
                override_from(tree, "timeouts.recreate", cfg.recreate_timeout);
                override_from(tree, "timeouts.pull", cfg.pull_timeout);
                override_from(tree, "logs.tail", cfg.log_tail);
                override_from(tree, "logs.buffer_lines", cfg.log_buffer_lines);
                override_from(tree, "stats.history", cfg.stats_history);
                override_from(tree, "docker_binary", cfg.docker_binary);
                override_from(tree, "log_level", cfg.log_level);
            } catch (const pt::ptree_error& e) {
                throw std::runtime_error("invalid " + settings + ": " + e.what());
            }
        }

        if (const char* level = std::getenv("DOCKWATCH_LOG_LEVEL")) {
            if (*level) cfg.log_level = level;
        }
        if (const char* docker = std::getenv("DOCKWATCH_DOCKER")) {
            if (*docker) cfg.docker_binary = docker;
        }

        if (cfg.tick_interval_ms < 50) cfg.tick_interval_ms = 50;
        if (cfg.refresh_interval_ms < cfg.tick_interval_ms) cfg.refresh_interval_ms = cfg.tick_interval_ms;
        if (cfg.log_buffer_lines == 0) cfg.log_buffer_lines = 1;
        if (cfg.stats_history == 0) cfg.stats_history = 1;
        return cfg;
    }

}
