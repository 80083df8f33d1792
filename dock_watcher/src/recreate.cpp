#include "recreate.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace DockWatch {

    const char* step_name(RecreateStep step) {
        switch (step) {
            case RecreateStep::Stopping: return "stop";
            case RecreateStep::Removing: return "remove";
            case RecreateStep::Creating: return "create";
            case RecreateStep::Attaching: return "attach";
            case RecreateStep::Starting: return "start";
            case RecreateStep::Done: return "done";
            case RecreateStep::Aborted: return "aborted";
        }
        return "unknown";
    }

    RecreateWorkflow::RecreateWorkflow(ResourceClient& client, int stop_grace_seconds, Observer observer)
        : client_(client), stop_grace_(stop_grace_seconds), observer_(std::move(observer)) {}

    void RecreateWorkflow::notify(RecreateStep step, const std::string& detail) {
        spdlog::info("recreate: {} {}", step_name(step), detail);
        if (observer_) observer_(step, detail);
    }

    RecreateOutcome& RecreateWorkflow::abort(RecreateOutcome& outcome, RecreateStep step, const std::string& cause) {
        outcome.state = RecreateStep::Aborted;
        outcome.aborted_at = step;
        outcome.cause = cause;
        spdlog::error("recreate aborted at {}: {}", step_name(step), cause);
        notify(RecreateStep::Aborted, cause);
        return outcome;
    }

    RecreateOutcome RecreateWorkflow::run(const OpContext& ctx, const std::string& container_id,
                                          const ContainerFullConfig& config) {
        RecreateOutcome outcome;

        // --- stop (best effort, the container may already be stopped) ---
        notify(RecreateStep::Stopping, short_id(container_id));
        try {
            client_.stop_container(ctx, container_id, stop_grace_);
        } catch (const std::exception& e) {
            spdlog::warn("recreate: ignoring stop failure: {}", e.what());
            outcome.warnings.push_back(std::string("stop: ") + e.what());
        }

        // --- remove ---
        notify(RecreateStep::Removing, short_id(container_id));
        try {
            client_.remove_container(ctx, container_id, true);
        } catch (const std::exception& e) {
            return abort(outcome, RecreateStep::Removing, e.what());
        }

        // --- create on the first network ---
        std::string first_network = config.networks.empty() ? "" : config.networks.begin()->first;
        notify(RecreateStep::Creating, config.name);
        try {
            outcome.new_id = client_.create_container(ctx, config, first_network);
        } catch (const std::exception& e) {
            return abort(outcome, RecreateStep::Creating, e.what());
        }

        // --- attach the remaining networks (best effort) ---
        for (auto it = config.networks.begin(); it != config.networks.end(); ++it) {
            if (it == config.networks.begin()) continue;
            notify(RecreateStep::Attaching, it->first);
            try {
                client_.attach_network(ctx, it->first, outcome.new_id, it->second.aliases);
            } catch (const std::exception& e) {
                spdlog::warn("recreate: could not attach {}: {}", it->first, e.what());
                outcome.warnings.push_back("attach " + it->first + ": " + e.what());
            }
        }

        // --- start ---
        notify(RecreateStep::Starting, short_id(outcome.new_id));
        try {
            client_.start_container(ctx, outcome.new_id);
        } catch (const std::exception& e) {
            return abort(outcome, RecreateStep::Starting, e.what());
        }

        outcome.state = RecreateStep::Done;
        notify(RecreateStep::Done, short_id(outcome.new_id));
        return outcome;
    }

}
