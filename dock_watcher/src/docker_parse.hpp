#ifndef DOCKWATCH_DOCKER_PARSE_HPP
#define DOCKWATCH_DOCKER_PARSE_HPP

#include "models.hpp"
#include "resource_client.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace DockWatch {

    // Decoders for the `docker ... --format '{{json .}}'` and `docker inspect`
    // output. Malformed input throws ClientError.

    // --- Helpers ---
    std::vector<std::string> split_lines(const std::string& text);
    uint64_t parse_size(const std::string& text);      // "1.5MiB", "12kB", "0B"
    double parse_percent(const std::string& text);     // "12.50%"
    std::vector<PortMapping> parse_ports(const std::string& text);
    std::map<std::string, std::string> parse_label_list(const std::string& text); // "a=b,c=d"

    // --- Listings ---
    Container parse_container_line(const std::string& json);
    std::vector<Image> parse_image_lines(const std::string& output); // merges tags per image id
    std::vector<Network> parse_network_inspect(const std::string& json);
    Volume parse_volume_line(const std::string& json);
    std::vector<ComposeProject> build_compose_projects(const std::vector<Container>& containers);

    // --- Inspect ---
    ContainerFullConfig parse_inspect_config(const std::string& json);

    // --- Streams ---
    std::optional<ContainerStats> parse_stats_line(const std::string& line);
    LogEntry parse_log_line(const std::string& line);

    // --- Prune ---
    PruneReport parse_prune_output(const std::string& output);
}

#endif
