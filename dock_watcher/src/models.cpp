#include "models.hpp"

#include <algorithm>
#include <cstdio>

namespace DockWatch {

    std::string short_id(const std::string& id) {
        std::string s = id;
        if (s.rfind("sha256:", 0) == 0) s = s.substr(7);
        return s.size() > 12 ? s.substr(0, 12) : s;
    }

    std::string format_bytes(uint64_t bytes) {
        static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
        double value = (double)bytes;
        int unit = 0;
        while (value >= 1024.0 && unit < 4) {
            value /= 1024.0;
            unit++;
        }
        char buffer[32];
        if (unit == 0) std::snprintf(buffer, sizeof(buffer), "%llu B", (unsigned long long)bytes);
        else std::snprintf(buffer, sizeof(buffer), "%.1f %s", value, units[unit]);
        return buffer;
    }

    // --- Containers ---

    std::string Container::short_id() const {
        return DockWatch::short_id(id);
    }

    std::string Container::ports_string() const {
        std::string result;
        for (size_t i = 0; i < ports.size(); ++i) {
            if (i > 0) result += ", ";
            const auto& p = ports[i];
            if (p.public_port > 0)
                result += std::to_string(p.public_port) + ":" + std::to_string(p.private_port) + "/" + p.type;
            else
                result += std::to_string(p.private_port) + "/" + p.type;
        }
        return result;
    }

    std::vector<EnvVar> parse_env_vars(const std::vector<std::string>& env) {
        std::vector<EnvVar> result;
        result.reserve(env.size());
        for (const auto& e : env) {
            if (e.empty()) continue;
            size_t eq = e.find('=');
            if (eq == std::string::npos) result.push_back({e, ""});
            else result.push_back({e.substr(0, eq), e.substr(eq + 1)});
        }
        return result;
    }

    std::vector<std::string> env_vars_to_strings(const std::vector<EnvVar>& vars) {
        std::vector<std::string> result;
        result.reserve(vars.size());
        for (const auto& v : vars) result.push_back(v.key + "=" + v.value);
        return result;
    }

    // --- Images ---

    std::string Image::short_id() const {
        return DockWatch::short_id(id);
    }

    std::string Image::primary_tag() const {
        return repo_tags.empty() ? "<none>" : repo_tags.front();
    }

    std::string Image::repository() const {
        std::string t = primary_tag();
        if (t == "<none>") return t;
        size_t colon = t.rfind(':');
        // a colon before the last slash belongs to a registry port
        if (colon == std::string::npos || (t.rfind('/') != std::string::npos && colon < t.rfind('/'))) return t;
        return t.substr(0, colon);
    }

    std::string Image::tag() const {
        std::string t = primary_tag();
        if (t == "<none>") return t;
        std::string repo = repository();
        return repo.size() == t.size() ? "latest" : t.substr(repo.size() + 1);
    }

    // --- Networks ---

    std::string Network::short_id() const {
        return DockWatch::short_id(id);
    }

    bool Network::is_system() const {
        return name == "bridge" || name == "host" || name == "none";
    }

    // --- Compose ---

    int ComposeProject::running_count() const {
        int count = 0;
        for (const auto& s : services)
            for (const auto& c : s.containers)
                if (c.is_running()) count++;
        return count;
    }

    bool ComposeProject::all_running() const {
        return !container_ids.empty() && running_count() == (int)container_ids.size();
    }

    // --- Groups ---

    bool Group::contains(const std::string& container_id) const {
        return std::find(container_ids.begin(), container_ids.end(), container_id) != container_ids.end();
    }

}
