#ifndef DOCKWATCH_EVENTS_HPP
#define DOCKWATCH_EVENTS_HPP

#include "batch.hpp"
#include "keys.hpp"
#include "models.hpp"
#include "recreate.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace DockWatch {

    template <typename T>
    class Subscription;
    using LogSubscription = Subscription<LogEntry>;
    using StatsSubscription = Subscription<ContainerStats>;

    enum class OperationKind {
        StartContainer,
        StopContainer,
        RestartContainer,
        RemoveContainer,
        RemoveImage,
        PullImage,
        PruneImages,
        RemoveVolume,
        PruneVolumes,
        CreateNetwork,
        RemoveNetwork,
        ConnectNetwork,
        DisconnectNetwork,
        CreateGroup,
        DeleteGroup,
        AddToGroup,
        RemoveFromGroup,
        ForgetContainer,   // removed container dropped from every group
        ReplaceContainer,  // recreated container id swapped in every group
    };

    enum class BatchKind { StartGroup, StopGroup, StartProject, StopProject, RestartProject };

    const char* operation_name(OperationKind kind);
    const char* batch_name(BatchKind kind);

    // --- Input ---
    struct KeyPressed { Key key; };
    struct Resized { int width = 0; int height = 0; };
    struct Tick { std::chrono::steady_clock::time_point now; };

    // --- Listings (error is empty on success) ---
    struct ContainersLoaded { std::vector<Container> containers; std::string error; };
    struct ImagesLoaded { std::vector<Image> images; std::string error; };
    struct VolumesLoaded { std::vector<Volume> volumes; std::string error; };
    struct NetworksLoaded { std::vector<Network> networks; std::string error; };
    struct ComposeLoaded { std::vector<ComposeProject> projects; std::string error; };
    struct GroupsLoaded { std::vector<Group> groups; std::string error; };

    // --- Mutations ---
    struct OperationFinished {
        OperationKind kind;
        std::string subject;  // resource id or name
        std::string error;
        std::string detail;   // success text such as a prune summary
    };
    struct BatchFinished {
        BatchKind kind;
        std::string subject;  // group or project name
        BatchOutcome outcome;
    };
    struct ConfigLoaded {
        std::string container_id;
        ContainerFullConfig config;
        std::string error;
    };
    struct RecreateFinished {
        std::string old_id;
        std::string name;
        RecreateOutcome outcome;
    };

    // --- Streams ---
    struct LogStreamOpened { std::string container_id; std::shared_ptr<LogSubscription> sub; std::string error; };
    struct StatsStreamOpened { std::string container_id; std::shared_ptr<StatsSubscription> sub; std::string error; };
    struct LogReceived { uint64_t sub_id = 0; LogEntry entry; };
    struct StatsReceived { uint64_t sub_id = 0; ContainerStats stats; };
    struct StreamFailed { uint64_t sub_id = 0; std::string error; };

    // --- Misc ---
    struct ShellExited { std::string container_id; int exit_code = 0; };
    struct Notice { std::string text; bool is_error = false; };

    using Event = std::variant<KeyPressed, Resized, Tick,
                               ContainersLoaded, ImagesLoaded, VolumesLoaded, NetworksLoaded, ComposeLoaded, GroupsLoaded,
                               OperationFinished, BatchFinished, ConfigLoaded, RecreateFinished,
                               LogStreamOpened, StatsStreamOpened, LogReceived, StatsReceived, StreamFailed,
                               ShellExited, Notice>;

    // Deferred work producing at most one event. An empty result is dropped.
    using Command = std::function<std::optional<Event>()>;

}

#endif
