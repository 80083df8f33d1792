#ifndef DOCKWATCH_BATCH_HPP
#define DOCKWATCH_BATCH_HPP

#include "cancel.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace DockWatch {

    struct BatchFailure {
        std::string id;
        std::string cause;
    };

    struct BatchOutcome {
        size_t total = 0;
        std::vector<BatchFailure> failures; // in task order

        bool ok() const { return failures.empty(); }
        size_t succeeded() const { return total - failures.size(); }
        std::vector<std::string> failed_ids() const;
        // "2 of 3 failed: <id>: <cause>; <id>: <cause>"
        std::string message() const;
    };

    using BatchOperation = std::function<void(const OpContext& ctx, const std::string& id)>;

    // Runs `op` for every id on its own thread, waits for all of them and
    // collects every failure. One failing task never cancels the others.
    BatchOutcome run_batch(const std::vector<std::string>& ids, const BatchOperation& op, const OpContext& ctx);

}

#endif
