#include "group_store.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>

namespace pt = boost::property_tree;
namespace fs = std::filesystem;

namespace DockWatch {

    namespace {

        const char* kFormatVersion = "1.0";
        const std::vector<std::string> kColors = {"blue", "green", "yellow", "magenta", "cyan", "red"};

        std::string now_iso8601() {
            std::time_t t = std::time(nullptr);
            std::tm tm{};
            gmtime_r(&t, &tm);
            char buf[32];
            std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
            return buf;
        }

        std::string new_group_id() {
            static boost::uuids::random_generator generator;
            return boost::uuids::to_string(generator());
        }

        pt::ptree string_array(const std::vector<std::string>& values) {
            pt::ptree arr;
            for (const auto& v : values) {
                pt::ptree item;
                item.put_value(v);
                arr.push_back(std::make_pair("", item));
            }
            return arr;
        }

        Group group_from_tree(const pt::ptree& tree) {
            Group g;
            g.id = tree.get<std::string>("id", "");
            g.name = tree.get<std::string>("name", "");
            g.description = tree.get<std::string>("description", "");
            g.created = tree.get<std::string>("created", "");
            g.modified = tree.get<std::string>("modified", "");
            g.color = tree.get<std::string>("color", "");
            auto ids = tree.get_child_optional("container_ids");
            if (ids) {
                for (const auto& item : *ids) g.container_ids.push_back(item.second.data());
            }
            return g;
        }

        std::vector<Group>::iterator find_group(std::vector<Group>& groups, const std::string& id) {
            return std::find_if(groups.begin(), groups.end(), [&](const Group& g) { return g.id == id; });
        }

        pt::ptree group_to_tree(const Group& g) {
            pt::ptree tree;
            tree.put("id", g.id);
            tree.put("name", g.name);
            tree.put("description", g.description);
            tree.add_child("container_ids", string_array(g.container_ids));
            tree.put("created", g.created);
            tree.put("modified", g.modified);
            tree.put("color", g.color);
            return tree;
        }

    }

    GroupStore::GroupStore(Key, std::string path) : path_(std::move(path)) {}

    std::shared_ptr<GroupStore> GroupStore::open(const std::string& path) {
        auto store = std::make_shared<GroupStore>(Key{}, path);
        store->load();
        return store;
    }

    std::shared_ptr<GroupStore> GroupStore::in_memory() {
        return std::make_shared<GroupStore>(Key{}, "");
    }

    void GroupStore::load() {
        std::error_code ec;
        if (!fs::exists(path_, ec)) {
            spdlog::info("no group file at {}, starting empty", path_);
            return;
        }

        pt::ptree tree;
        try {
            pt::read_json(path_, tree);
        } catch (const pt::json_parser_error& e) {
            throw StoreError("cannot read groups from " + path_ + ": " + e.what());
        }

        last_modified_ = tree.get<std::string>("last_modified", "");
        auto groups = tree.get_child_optional("groups");
        if (groups) {
            for (const auto& item : *groups) groups_.push_back(group_from_tree(item.second));
        }
        spdlog::info("loaded {} groups from {}", groups_.size(), path_);
    }

    void GroupStore::commit(std::vector<Group> next) {
        std::string modified = now_iso8601();
        if (path_.empty()) {
            groups_ = std::move(next);
            last_modified_ = modified;
            return;
        }

        pt::ptree tree;
        tree.put("version", kFormatVersion);
        pt::ptree arr;
        for (const auto& g : next) arr.push_back(std::make_pair("", group_to_tree(g)));
        tree.add_child("groups", arr);
        tree.put("last_modified", modified);

        fs::path target(path_);
        fs::path tmp = target;
        tmp += ".tmp";
        fs::path backup = target;
        backup += ".bak";

        std::error_code ec;
        if (target.has_parent_path()) fs::create_directories(target.parent_path(), ec);

        {
            std::ofstream out(tmp);
            if (!out) throw StoreError("cannot write " + tmp.string());
            try {
                pt::write_json(out, tree);
            } catch (const pt::json_parser_error& e) {
                throw StoreError(std::string("cannot encode groups: ") + e.what());
            }
            if (!out.good()) throw StoreError("short write to " + tmp.string());
        }

        if (fs::exists(target, ec)) {
            fs::copy_file(target, backup, fs::copy_options::overwrite_existing, ec);
            if (ec) spdlog::warn("could not back up {}: {}", path_, ec.message());
        }

        fs::rename(tmp, target, ec);
        if (ec) throw StoreError("cannot replace " + path_ + ": " + ec.message());

        groups_ = std::move(next);
        last_modified_ = modified;
    }

    std::vector<Group> GroupStore::list() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return groups_;
    }

    std::optional<Group> GroupStore::get(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& g : groups_) {
            if (g.id == id) return g;
        }
        return std::nullopt;
    }

    Group GroupStore::create(const std::string& name, const std::string& description,
                             const std::vector<std::string>& container_ids) {
        if (name.empty()) throw StoreError("group name is required");

        std::lock_guard<std::mutex> lock(mutex_);
        Group g;
        g.id = new_group_id();
        g.name = name;
        g.description = description;
        for (const auto& id : container_ids) {
            if (!g.contains(id)) g.container_ids.push_back(id);
        }
        g.created = now_iso8601();
        g.modified = g.created;
        g.color = kColors[groups_.size() % kColors.size()];

        auto next = groups_;
        next.push_back(g);
        commit(std::move(next));
        return g;
    }

    void GroupStore::update(const Group& group) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto next = groups_;
        auto it = find_group(next, group.id);
        if (it == next.end()) throw StoreError("group not found: " + group.id);
        *it = group;
        it->modified = now_iso8601();
        commit(std::move(next));
    }

    void GroupStore::remove(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto next = groups_;
        auto it = find_group(next, id);
        if (it == next.end()) throw StoreError("group not found: " + id);
        next.erase(it);
        commit(std::move(next));
    }

    void GroupStore::add_member(const std::string& group_id, const std::string& container_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto next = groups_;
        auto g = find_group(next, group_id);
        if (g == next.end()) throw StoreError("group not found: " + group_id);
        if (g->contains(container_id)) return;
        g->container_ids.push_back(container_id);
        g->modified = now_iso8601();
        commit(std::move(next));
    }

    void GroupStore::remove_member(const std::string& group_id, const std::string& container_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto next = groups_;
        auto g = find_group(next, group_id);
        if (g == next.end()) throw StoreError("group not found: " + group_id);
        auto& ids = g->container_ids;
        auto it = std::remove(ids.begin(), ids.end(), container_id);
        if (it == ids.end()) return;
        ids.erase(it, ids.end());
        g->modified = now_iso8601();
        commit(std::move(next));
    }

    int GroupStore::replace_member(const std::string& old_id, const std::string& new_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto next = groups_;
        int changed = 0;
        for (auto& g : next) {
            auto it = std::find(g.container_ids.begin(), g.container_ids.end(), old_id);
            if (it == g.container_ids.end()) continue;
            if (g.contains(new_id)) g.container_ids.erase(it);
            else *it = new_id;
            g.modified = now_iso8601();
            changed++;
        }
        if (changed > 0) commit(std::move(next));
        return changed;
    }

    int GroupStore::remove_member_everywhere(const std::string& container_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto next = groups_;
        int changed = 0;
        for (auto& g : next) {
            auto& ids = g.container_ids;
            auto it = std::remove(ids.begin(), ids.end(), container_id);
            if (it == ids.end()) continue;
            ids.erase(it, ids.end());
            g.modified = now_iso8601();
            changed++;
        }
        if (changed > 0) commit(std::move(next));
        return changed;
    }

}
