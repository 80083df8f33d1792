#ifndef DOCKWATCH_MODELS_HPP
#define DOCKWATCH_MODELS_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace DockWatch {

    using SystemTime = std::chrono::system_clock::time_point;

    // --- Containers ---
    struct PortMapping {
        int private_port = 0;
        int public_port = 0;
        std::string type; // tcp, udp
        std::string ip;
    };

    struct MountPoint {
        std::string type; // volume, bind, tmpfs
        std::string name;
        std::string source;
        std::string destination;
    };

    struct Container {
        std::string id;
        std::string name;
        std::string image;
        std::string status;
        std::string state; // running, exited, paused...
        std::string created;
        std::vector<PortMapping> ports;
        std::vector<std::string> networks;
        std::vector<MountPoint> mounts;
        std::map<std::string, std::string> labels;

        std::string short_id() const;
        bool is_running() const { return state == "running"; }
        std::string ports_string() const;
    };

    struct ContainerStats {
        std::string container_id;
        double cpu_percent = 0.0;
        uint64_t memory_usage = 0;
        uint64_t memory_limit = 0;
        double memory_percent = 0.0;
        uint64_t network_rx = 0;
        uint64_t network_tx = 0;
        uint64_t block_read = 0;
        uint64_t block_write = 0;
        uint64_t pids = 0;
        SystemTime timestamp;
    };

    struct LogEntry {
        std::string line;
        SystemTime timestamp;
        bool is_error = false;
    };

    // --- Recreate configuration ---
    struct HostPortBinding {
        std::string host_ip;
        std::string host_port;
    };

    struct RestartPolicy {
        std::string name;
        int maximum_retry_count = 0;
    };

    struct NetworkEndpoint {
        std::string network_id;
        std::string ip_address;
        std::vector<std::string> aliases;
    };

    struct ContainerFullConfig {
        std::string name;
        std::string image;
        std::vector<std::string> env; // KEY=value
        std::vector<std::string> cmd;
        std::vector<std::string> entrypoint;
        std::string working_dir;
        std::string user;
        std::map<std::string, std::string> labels;

        std::vector<std::string> binds;
        std::map<std::string, std::vector<HostPortBinding>> port_bindings; // "80/tcp" -> bindings
        RestartPolicy restart_policy;
        std::string network_mode;
        bool privileged = false;
        std::vector<std::string> cap_add;
        std::vector<std::string> cap_drop;

        // Ordered by network name; the first one is attached at create time.
        std::map<std::string, NetworkEndpoint> networks;
    };

    struct EnvVar {
        std::string key;
        std::string value;
    };

    std::vector<EnvVar> parse_env_vars(const std::vector<std::string>& env);
    std::vector<std::string> env_vars_to_strings(const std::vector<EnvVar>& vars);

    // --- Images ---
    struct Image {
        std::string id;
        std::vector<std::string> repo_tags;
        std::string created;
        int64_t size = 0;
        int containers = 0;

        std::string short_id() const;
        std::string primary_tag() const;
        std::string repository() const;
        std::string tag() const;
    };

    // --- Networks ---
    struct Network {
        std::string id;
        std::string name;
        std::string driver;
        std::string scope;
        bool internal = false;
        bool attachable = false;
        std::string subnet;
        std::string gateway;
        std::vector<std::string> containers; // filled from container data

        std::string short_id() const;
        bool is_system() const;
    };

    // --- Volumes ---
    struct Volume {
        std::string name;
        std::string driver;
        std::string mountpoint;
        std::string scope;
        std::map<std::string, std::string> labels;
        int ref_count = 0;

        bool in_use() const { return ref_count > 0; }
    };

    // --- Compose ---
    struct ComposeService {
        std::string name;
        std::vector<Container> containers;
    };

    struct ComposeProject {
        std::string name;
        std::string working_dir;
        std::string config_hash;
        std::vector<ComposeService> services;
        std::vector<std::string> container_ids;

        int running_count() const;
        bool all_running() const;
    };

    // --- Groups ---
    struct Group {
        std::string id;
        std::string name;
        std::string description;
        std::vector<std::string> container_ids;
        std::string created;
        std::string modified;
        std::string color;

        bool contains(const std::string& container_id) const;
    };

    std::string short_id(const std::string& id);
    std::string format_bytes(uint64_t bytes);
}

#endif
