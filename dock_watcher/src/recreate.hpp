#ifndef DOCKWATCH_RECREATE_HPP
#define DOCKWATCH_RECREATE_HPP

#include "resource_client.hpp"

#include <functional>
#include <string>
#include <vector>

namespace DockWatch {

    enum class RecreateStep { Stopping, Removing, Creating, Attaching, Starting, Done, Aborted };

    const char* step_name(RecreateStep step);

    struct RecreateOutcome {
        RecreateStep state = RecreateStep::Done;  // Done or Aborted
        RecreateStep aborted_at = RecreateStep::Done;
        std::string cause;
        std::string new_id;                        // set once Creating succeeded
        std::vector<std::string> warnings;         // ignored stop/attach failures

        bool ok() const { return state == RecreateStep::Done; }
        bool created() const { return !new_id.empty(); }
    };

    // stop -> remove -> create (first network) -> attach (remaining networks) -> start.
    // Stop and attach failures are recorded as warnings; remove, create and
    // start failures abort. A start failure still reports the new id.
    class RecreateWorkflow {
    public:
        using Observer = std::function<void(RecreateStep step, const std::string& detail)>;

        RecreateWorkflow(ResourceClient& client, int stop_grace_seconds, Observer observer = nullptr);

        RecreateOutcome run(const OpContext& ctx, const std::string& container_id, const ContainerFullConfig& config);

    private:
        void notify(RecreateStep step, const std::string& detail);
        RecreateOutcome& abort(RecreateOutcome& outcome, RecreateStep step, const std::string& cause);

        ResourceClient& client_;
        int stop_grace_;
        Observer observer_;
    };

}

#endif
