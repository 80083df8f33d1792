#ifndef DOCKWATCH_LOGGING_HPP
#define DOCKWATCH_LOGGING_HPP

#include "config.hpp"

namespace DockWatch {

    // Installs a file logger as the spdlog default. The terminal belongs to
    // the UI, so nothing is logged to stdout. Returns false when the log file
    // cannot be opened (logging then goes nowhere).
    bool setup_logging(const AppConfig& config);

}

#endif
