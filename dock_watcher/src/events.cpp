#include "events.hpp"

namespace DockWatch {

    const char* operation_name(OperationKind kind) {
        switch (kind) {
            case OperationKind::StartContainer: return "start";
            case OperationKind::StopContainer: return "stop";
            case OperationKind::RestartContainer: return "restart";
            case OperationKind::RemoveContainer: return "remove";
            case OperationKind::RemoveImage: return "remove image";
            case OperationKind::PullImage: return "pull";
            case OperationKind::PruneImages: return "prune images";
            case OperationKind::RemoveVolume: return "remove volume";
            case OperationKind::PruneVolumes: return "prune volumes";
            case OperationKind::CreateNetwork: return "create network";
            case OperationKind::RemoveNetwork: return "remove network";
            case OperationKind::ConnectNetwork: return "connect";
            case OperationKind::DisconnectNetwork: return "disconnect";
            case OperationKind::CreateGroup: return "create group";
            case OperationKind::DeleteGroup: return "delete group";
            case OperationKind::AddToGroup: return "add to group";
            case OperationKind::RemoveFromGroup: return "remove from group";
            case OperationKind::ForgetContainer: return "update groups";
            case OperationKind::ReplaceContainer: return "update groups";
        }
        return "operation";
    }

    const char* batch_name(BatchKind kind) {
        switch (kind) {
            case BatchKind::StartGroup: return "start group";
            case BatchKind::StopGroup: return "stop group";
            case BatchKind::StartProject: return "start project";
            case BatchKind::StopProject: return "stop project";
            case BatchKind::RestartProject: return "restart project";
        }
        return "batch";
    }

}
