#ifndef DOCKWATCH_GROUP_STORE_HPP
#define DOCKWATCH_GROUP_STORE_HPP

#include "models.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace DockWatch {

    class StoreError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // User-defined container groups persisted as one JSON document.
    // Every call holds the store lock; every mutation is written to disk
    // before it returns (last writer wins).
    class GroupStore {
        struct Key {
            explicit Key() = default;
        };

    public:
        GroupStore(Key, std::string path);

        // Loads `path`; a missing file is an empty store. Throws StoreError on unreadable data.
        static std::shared_ptr<GroupStore> open(const std::string& path);
        // Store that never touches the disk (used when the file cannot be loaded).
        static std::shared_ptr<GroupStore> in_memory();

        std::vector<Group> list() const;
        std::optional<Group> get(const std::string& id) const;

        Group create(const std::string& name, const std::string& description,
                     const std::vector<std::string>& container_ids);
        void update(const Group& group);
        void remove(const std::string& id);

        void add_member(const std::string& group_id, const std::string& container_id);
        void remove_member(const std::string& group_id, const std::string& container_id);

        // Both return the number of groups that changed.
        int replace_member(const std::string& old_id, const std::string& new_id);
        int remove_member_everywhere(const std::string& container_id);

        const std::string& path() const { return path_; }

    private:
        void load();
        // Writes `next` and only then makes it the current state. Caller holds mutex_.
        void commit(std::vector<Group> next);

        std::string path_;
        mutable std::mutex mutex_;
        std::vector<Group> groups_;
        std::string last_modified_;
    };

}

#endif
