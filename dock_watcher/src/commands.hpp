#ifndef DOCKWATCH_COMMANDS_HPP
#define DOCKWATCH_COMMANDS_HPP

#include "cancel.hpp"
#include "config.hpp"
#include "events.hpp"
#include "group_store.hpp"
#include "resource_client.hpp"

#include <memory>
#include <string>
#include <vector>

namespace DockWatch {

    // Collaborators handed to the reducer and captured by every command.
    struct Services {
        std::shared_ptr<ResourceClient> client;
        std::shared_ptr<GroupStore> groups;
        AppConfig config;
        CancelToken root; // cancelled on shutdown
    };

    // Every factory returns a Command that blocks on its worker thread and
    // reports failure inside the Event it produces.
    namespace Commands {

        // --- Listings ---
        Command fetch_containers(const Services& s);
        Command fetch_images(const Services& s);
        Command fetch_volumes(const Services& s);
        Command fetch_networks(const Services& s);
        Command fetch_compose(const Services& s);
        Command fetch_groups(const Services& s);

        // --- Containers ---
        Command start_container(const Services& s, const std::string& id, const std::string& name);
        Command stop_container(const Services& s, const std::string& id, const std::string& name);
        Command restart_container(const Services& s, const std::string& id, const std::string& name);
        Command remove_container(const Services& s, const std::string& id, const std::string& name);
        Command load_config(const Services& s, const std::string& id);
        Command recreate(const Services& s, const std::string& id, const std::string& name,
                         const ContainerFullConfig& config);

        // --- Images / volumes ---
        Command remove_image(const Services& s, const std::string& id, const std::string& name);
        Command pull_image(const Services& s, const std::string& reference);
        Command prune_images(const Services& s);
        Command remove_volume(const Services& s, const std::string& name);
        Command prune_volumes(const Services& s);

        // --- Networks ---
        Command create_network(const Services& s, const std::string& name, const std::string& driver);
        Command remove_network(const Services& s, const std::string& id, const std::string& name);
        Command connect_network(const Services& s, const std::string& network, const std::string& network_name,
                                const std::string& container);
        Command disconnect_network(const Services& s, const std::string& network, const std::string& network_name,
                                   const std::string& container);

        // --- Groups ---
        Command create_group(const Services& s, const std::string& name, const std::string& description);
        Command delete_group(const Services& s, const std::string& id, const std::string& name);
        Command add_to_group(const Services& s, const std::string& group_id, const std::string& group_name,
                             const std::string& container_id);
        Command remove_from_group(const Services& s, const std::string& group_id, const std::string& group_name,
                                  const std::string& container_id);
        Command forget_container(const Services& s, const std::string& container_id);
        Command replace_container(const Services& s, const std::string& old_id, const std::string& new_id);

        // --- Batches ---
        // Members are read from the store when the command runs.
        Command group_batch(const Services& s, BatchKind kind, const std::string& group_id, const std::string& group_name);
        Command project_batch(const Services& s, BatchKind kind, const std::string& project,
                              const std::vector<std::string>& container_ids);

        // --- Streams ---
        Command open_logs(const Services& s, const std::string& container_id);
        Command open_stats(const Services& s, const std::string& container_id);

    }

}

#endif
