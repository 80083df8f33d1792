#include "docker_parse.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>

namespace pt = boost::property_tree;

namespace DockWatch {

    namespace {

        pt::ptree read_tree(const std::string& json) {
            pt::ptree tree;
            std::istringstream in(json);
            try {
                pt::read_json(in, tree);
            } catch (const pt::json_parser_error& e) {
                throw ClientError(std::string("malformed docker output: ") + e.what());
            }
            return tree;
        }

        std::string field(const pt::ptree& tree, const std::string& path) {
            auto value = tree.get_optional<std::string>(path);
            if (!value || *value == "null") return "";
            return *value;
        }

        bool flag(const pt::ptree& tree, const std::string& path) {
            return field(tree, path) == "true";
        }

        std::vector<std::string> string_array(const pt::ptree& tree, const std::string& path) {
            std::vector<std::string> out;
            auto child = tree.get_child_optional(path);
            if (!child) return out;
            for (const auto& item : *child) {
                if (item.second.data() != "null") out.push_back(item.second.data());
            }
            return out;
        }

        std::map<std::string, std::string> string_map(const pt::ptree& tree, const std::string& path) {
            std::map<std::string, std::string> out;
            auto child = tree.get_child_optional(path);
            if (!child) return out;
            for (const auto& item : *child) {
                if (!item.first.empty()) out[item.first] = item.second.data();
            }
            return out;
        }

        std::string trim(const std::string& s) {
            size_t b = s.find_first_not_of(" \t\r\n");
            if (b == std::string::npos) return "";
            size_t e = s.find_last_not_of(" \t\r\n");
            return s.substr(b, e - b + 1);
        }

        std::vector<std::string> split(const std::string& s, char sep) {
            std::vector<std::string> out;
            std::stringstream ss(s);
            std::string segment;
            while (std::getline(ss, segment, sep)) {
                segment = trim(segment);
                if (!segment.empty()) out.push_back(segment);
            }
            return out;
        }

        int to_int(const std::string& s) {
            return (int)std::strtol(s.c_str(), nullptr, 10);
        }

        // "a / b" pairs used by MemUsage, NetIO and BlockIO
        std::pair<uint64_t, uint64_t> size_pair(const std::string& s) {
            size_t slash = s.find('/');
            if (slash == std::string::npos) return {parse_size(s), 0};
            return {parse_size(s.substr(0, slash)), parse_size(s.substr(slash + 1))};
        }

    }

    // --- Helpers ---

    std::vector<std::string> split_lines(const std::string& text) {
        std::vector<std::string> lines;
        std::stringstream ss(text);
        std::string line;
        while (std::getline(ss, line)) {
            line = trim(line);
            if (!line.empty()) lines.push_back(line);
        }
        return lines;
    }

    uint64_t parse_size(const std::string& text) {
        std::string s = trim(text);
        if (s.empty() || s == "--" || s == "N/A") return 0;

        char* end = nullptr;
        double value = std::strtod(s.c_str(), &end);
        std::string unit = trim(std::string(end));

        static const std::map<std::string, double> units = {
            {"", 1.0}, {"B", 1.0},
            {"kB", 1e3}, {"KB", 1e3}, {"MB", 1e6}, {"GB", 1e9}, {"TB", 1e12},
            {"KiB", 1024.0}, {"MiB", 1048576.0}, {"GiB", 1073741824.0}, {"TiB", 1099511627776.0},
        };
        auto it = units.find(unit);
        double factor = it == units.end() ? 1.0 : it->second;
        return (uint64_t)(value * factor + 0.5);
    }

    double parse_percent(const std::string& text) {
        std::string s = trim(text);
        if (!s.empty() && s.back() == '%') s.pop_back();
        if (s.empty() || s == "--") return 0.0;
        return std::strtod(s.c_str(), nullptr);
    }

    std::vector<PortMapping> parse_ports(const std::string& text) {
        std::vector<PortMapping> ports;
        std::set<std::string> seen;
        for (const auto& entry : split(text, ',')) {
            PortMapping p;
            std::string container_side = entry;
            size_t arrow = entry.find("->");
            if (arrow != std::string::npos) {
                std::string host = entry.substr(0, arrow);
                container_side = entry.substr(arrow + 2);
                size_t colon = host.rfind(':');
                p.ip = colon == std::string::npos ? "" : host.substr(0, colon);
                p.public_port = to_int(colon == std::string::npos ? host : host.substr(colon + 1));
            }
            size_t slash = container_side.find('/');
            p.private_port = to_int(container_side.substr(0, slash));
            p.type = slash == std::string::npos ? "tcp" : container_side.substr(slash + 1);

            // IPv4 and IPv6 bindings of the same port are reported twice
            std::string key = std::to_string(p.public_port) + ":" + std::to_string(p.private_port) + "/" + p.type;
            if (seen.insert(key).second) ports.push_back(p);
        }
        return ports;
    }

    std::map<std::string, std::string> parse_label_list(const std::string& text) {
        std::map<std::string, std::string> labels;
        for (const auto& item : split(text, ',')) {
            size_t eq = item.find('=');
            if (eq == std::string::npos) labels[item] = "";
            else labels[item.substr(0, eq)] = item.substr(eq + 1);
        }
        return labels;
    }

    // --- Listings ---

    Container parse_container_line(const std::string& json) {
        pt::ptree tree = read_tree(json);
        Container c;
        c.id = field(tree, "ID");
        c.name = field(tree, "Names");
        c.image = field(tree, "Image");
        c.status = field(tree, "Status");
        c.state = field(tree, "State");
        c.created = field(tree, "CreatedAt");
        c.ports = parse_ports(field(tree, "Ports"));
        c.networks = split(field(tree, "Networks"), ',');
        c.labels = parse_label_list(field(tree, "Labels"));
        for (const auto& m : split(field(tree, "Mounts"), ',')) {
            MountPoint mount;
            mount.type = m.front() == '/' ? "bind" : "volume";
            mount.name = mount.type == "volume" ? m : "";
            mount.source = m;
            c.mounts.push_back(mount);
        }
        if (c.id.empty()) throw ClientError("container entry without an ID");
        return c;
    }

    std::vector<Image> parse_image_lines(const std::string& output) {
        std::vector<Image> images;
        std::map<std::string, size_t> index;
        for (const auto& line : split_lines(output)) {
            pt::ptree tree = read_tree(line);
            std::string id = field(tree, "ID");
            auto it = index.find(id);
            if (it == index.end()) {
                Image img;
                img.id = id;
                img.created = field(tree, "CreatedAt");
                img.size = (int64_t)parse_size(field(tree, "Size"));
                img.containers = to_int(field(tree, "Containers"));
                index[id] = images.size();
                images.push_back(img);
                it = index.find(id);
            }
            std::string repo = field(tree, "Repository");
            std::string tag = field(tree, "Tag");
            if (repo != "<none>" && !repo.empty()) {
                images[it->second].repo_tags.push_back(tag == "<none>" || tag.empty() ? repo : repo + ":" + tag);
            }
        }
        return images;
    }

    std::vector<Network> parse_network_inspect(const std::string& json) {
        std::vector<Network> networks;
        pt::ptree tree = read_tree(json);
        for (const auto& item : tree) {
            const pt::ptree& n = item.second;
            Network net;
            net.id = field(n, "Id");
            net.name = field(n, "Name");
            net.driver = field(n, "Driver");
            net.scope = field(n, "Scope");
            net.internal = flag(n, "Internal");
            net.attachable = flag(n, "Attachable");
            auto ipam = n.get_child_optional("IPAM.Config");
            if (ipam && !ipam->empty()) {
                net.subnet = field(ipam->front().second, "Subnet");
                net.gateway = field(ipam->front().second, "Gateway");
            }
            auto attached = n.get_child_optional("Containers");
            if (attached) {
                for (const auto& c : *attached) net.containers.push_back(c.first);
            }
            networks.push_back(net);
        }
        return networks;
    }

    Volume parse_volume_line(const std::string& json) {
        pt::ptree tree = read_tree(json);
        Volume v;
        v.name = field(tree, "Name");
        v.driver = field(tree, "Driver");
        v.mountpoint = field(tree, "Mountpoint");
        v.scope = field(tree, "Scope");
        v.labels = parse_label_list(field(tree, "Labels"));
        return v;
    }

    std::vector<ComposeProject> build_compose_projects(const std::vector<Container>& containers) {
        std::map<std::string, ComposeProject> projects;
        for (const auto& c : containers) {
            auto label = c.labels.find("com.docker.compose.project");
            if (label == c.labels.end()) continue;

            ComposeProject& project = projects[label->second];
            if (project.name.empty()) {
                project.name = label->second;
                auto dir = c.labels.find("com.docker.compose.project.working_dir");
                if (dir != c.labels.end()) project.working_dir = dir->second;
                auto hash = c.labels.find("com.docker.compose.config-hash");
                if (hash != c.labels.end()) project.config_hash = hash->second;
            }
            project.container_ids.push_back(c.id);

            auto svc = c.labels.find("com.docker.compose.service");
            std::string service_name = svc == c.labels.end() ? "" : svc->second;
            auto it = std::find_if(project.services.begin(), project.services.end(),
                                   [&](const ComposeService& s) { return s.name == service_name; });
            if (it == project.services.end()) {
                project.services.push_back({service_name, {}});
                it = project.services.end() - 1;
            }
            it->containers.push_back(c);
        }

        std::vector<ComposeProject> result;
        for (auto& entry : projects) result.push_back(std::move(entry.second));
        return result;
    }

    // --- Inspect ---

    ContainerFullConfig parse_inspect_config(const std::string& json) {
        pt::ptree root = read_tree(json);
        if (root.empty()) throw ClientError("empty inspect result");
        const pt::ptree& tree = root.front().second;

        ContainerFullConfig cfg;
        cfg.name = field(tree, "Name");
        if (!cfg.name.empty() && cfg.name.front() == '/') cfg.name.erase(0, 1);
        cfg.image = field(tree, "Config.Image");
        cfg.env = string_array(tree, "Config.Env");
        cfg.cmd = string_array(tree, "Config.Cmd");
        cfg.entrypoint = string_array(tree, "Config.Entrypoint");
        cfg.working_dir = field(tree, "Config.WorkingDir");
        cfg.user = field(tree, "Config.User");
        cfg.labels = string_map(tree, "Config.Labels");

        cfg.binds = string_array(tree, "HostConfig.Binds");
        cfg.network_mode = field(tree, "HostConfig.NetworkMode");
        cfg.privileged = flag(tree, "HostConfig.Privileged");
        cfg.cap_add = string_array(tree, "HostConfig.CapAdd");
        cfg.cap_drop = string_array(tree, "HostConfig.CapDrop");
        cfg.restart_policy.name = field(tree, "HostConfig.RestartPolicy.Name");
        cfg.restart_policy.maximum_retry_count = to_int(field(tree, "HostConfig.RestartPolicy.MaximumRetryCount"));

        auto bindings = tree.get_child_optional("HostConfig.PortBindings");
        if (bindings) {
            for (const auto& port : *bindings) {
                auto& list = cfg.port_bindings[port.first];
                for (const auto& b : port.second) {
                    list.push_back({field(b.second, "HostIp"), field(b.second, "HostPort")});
                }
            }
        }

        auto networks = tree.get_child_optional("NetworkSettings.Networks");
        if (networks) {
            for (const auto& net : *networks) {
                NetworkEndpoint ep;
                ep.network_id = field(net.second, "NetworkID");
                ep.ip_address = field(net.second, "IPAddress");
                ep.aliases = string_array(net.second, "Aliases");
                cfg.networks[net.first] = ep;
            }
        }
        return cfg;
    }

    // --- Streams ---

    std::optional<ContainerStats> parse_stats_line(const std::string& line) {
        // `docker stats` prefixes every refresh with terminal control codes
        size_t brace = line.find('{');
        if (brace == std::string::npos) return std::nullopt;
        pt::ptree tree = read_tree(line.substr(brace));

        ContainerStats s;
        s.container_id = field(tree, "ID");
        s.cpu_percent = parse_percent(field(tree, "CPUPerc"));
        s.memory_percent = parse_percent(field(tree, "MemPerc"));
        auto mem = size_pair(field(tree, "MemUsage"));
        s.memory_usage = mem.first;
        s.memory_limit = mem.second;
        auto net = size_pair(field(tree, "NetIO"));
        s.network_rx = net.first;
        s.network_tx = net.second;
        auto block = size_pair(field(tree, "BlockIO"));
        s.block_read = block.first;
        s.block_write = block.second;
        s.pids = (uint64_t)to_int(field(tree, "PIDs"));
        s.timestamp = std::chrono::system_clock::now();
        return s;
    }

    LogEntry parse_log_line(const std::string& line) {
        LogEntry entry;
        entry.timestamp = std::chrono::system_clock::now();
        entry.line = line;

        size_t space = line.find(' ');
        if (space == std::string::npos || space < 19 || line[4] != '-' || line[10] != 'T') return entry;

        std::tm tm{};
        std::istringstream in(line.substr(0, 19));
        in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (in.fail()) return entry;

        entry.timestamp = std::chrono::system_clock::from_time_t(timegm(&tm));
        entry.line = line.substr(space + 1);
        return entry;
    }

    // --- Prune ---

    PruneReport parse_prune_output(const std::string& output) {
        PruneReport report;
        bool in_list = false;
        std::stringstream ss(output);
        std::string line;
        while (std::getline(ss, line)) {
            std::string t = trim(line);
            if (t.rfind("Deleted ", 0) == 0) {
                in_list = true;
                continue;
            }
            if (t.rfind("Total reclaimed space:", 0) == 0) {
                report.space_reclaimed = parse_size(t.substr(22));
                in_list = false;
                continue;
            }
            if (t.empty()) {
                in_list = false;
                continue;
            }
            if (in_list && t.rfind("untagged:", 0) != 0) report.removed++;
        }
        return report;
    }

}
