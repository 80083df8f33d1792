#include "logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>

namespace DockWatch {

    bool setup_logging(const AppConfig& config) {
        std::error_code ec;
        std::filesystem::create_directories(config.config_dir, ec);

        std::shared_ptr<spdlog::logger> logger;
        bool ok = true;
        try {
            logger = spdlog::basic_logger_mt("dock-watcher", config.log_path());
        } catch (const spdlog::spdlog_ex&) {
            logger = spdlog::null_logger_mt("dock-watcher");
            ok = false;
        }

        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        logger->set_level(spdlog::level::from_str(config.log_level));
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
        spdlog::flush_every(std::chrono::seconds(2));
        return ok;
    }

}
