#ifndef DOCKWATCH_VIEWS_HPP
#define DOCKWATCH_VIEWS_HPP

#include "keys.hpp"
#include "list_state.hpp"
#include "models.hpp"

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace DockWatch {

    template <typename T>
    class Subscription;
    using LogSubscription = Subscription<LogEntry>;
    using StatsSubscription = Subscription<ContainerStats>;

    enum class ViewKind { Containers, Images, Groups, Volumes, Compose, Networks, Logs, Stats, EnvVars, About };

    const char* view_title(ViewKind kind);
    // Views reachable from the sidebar, in tab order.
    const std::vector<ViewKind>& main_views();

    // What a view wants done after a key. The reducer turns it into commands or a modal.
    enum class IntentKind {
        None,
        // containers
        Start, Stop, Restart, Delete, Logs, Stats, Shell, EditEnv,
        // images / volumes
        DeleteImage, PullImage, PruneImages, DeleteVolume, PruneVolumes,
        // groups
        CreateGroup, DeleteGroup, StartGroup, StopGroup, AddToGroup, RemoveFromGroup,
        // networks
        CreateNetwork, DeleteNetwork, Connect, Disconnect,
        // compose
        StartProject, StopProject, RestartProject,
        // env editor
        SaveEnv,
    };

    struct Intent {
        IntentKind kind = IntentKind::None;
        std::string id;
        std::string name;
        std::string parent_id;
        std::string parent_name;

        bool none() const { return kind == IntentKind::None; }
    };

    // s/x/r/d/l/t/e/v on a container row
    Intent container_intent(const Key& key, const Container& c);

    // --- Containers ---
    struct ContainersView {
        std::vector<Container> items;
        ListState list;

        void set_items(std::vector<Container> containers);
        void set_size(int width, int height);
        Intent handle_key(const Key& key);
        void handle_filter_key(const Key& key);
        bool is_filtering() const { return list.filtering(); }

        std::vector<const Container*> visible() const;
        const Container* selected() const;
        void sync();
    };

    // --- Images ---
    struct ImagesView {
        std::vector<Image> items;
        ListState list;

        void set_items(std::vector<Image> images);
        void set_size(int width, int height);
        Intent handle_key(const Key& key);
        void handle_filter_key(const Key& key);
        bool is_filtering() const { return list.filtering(); }

        std::vector<const Image*> visible() const;
        const Image* selected() const;
        void sync();
    };

    // --- Volumes ---
    struct VolumesView {
        std::vector<Volume> items;
        ListState list;

        void set_items(std::vector<Volume> volumes);
        void set_size(int width, int height);
        Intent handle_key(const Key& key);
        void handle_filter_key(const Key& key);
        bool is_filtering() const { return list.filtering(); }

        std::vector<const Volume*> visible() const;
        const Volume* selected() const;
        void sync();
    };

    // --- Groups: Groups / In Group / Available ---
    struct GroupsView {
        enum Tab { GroupList = 0, Members = 1, Available = 2, TabCount = 3 };

        std::vector<Group> groups;
        std::vector<Container> containers;
        int tab = GroupList;
        std::string parent_id; // drill-down target, re-resolved on every refresh
        ListState lists[TabCount];

        void set_groups(std::vector<Group> items);
        void set_containers(std::vector<Container> items);
        void set_size(int width, int height);
        Intent handle_key(const Key& key);
        void handle_filter_key(const Key& key);
        bool is_filtering() const { return lists[tab].filtering(); }
        bool consumes_esc() const { return tab != GroupList; }

        void cycle_tab(int delta);
        const Group* parent() const;
        const Group* highlighted_group() const;
        std::vector<const Group*> visible_groups() const;
        std::vector<Container> members() const;   // missing ids appear with state "missing"
        std::vector<Container> available() const;
        std::optional<Container> selected_member() const;
        std::optional<Container> selected_available() const;
        void sync();

    private:
        void resolve_parent();
        std::vector<Container> filtered(std::vector<Container> items, const ListState& list) const;
    };

    // --- Networks: Networks / In Network / Available ---
    struct NetworksView {
        enum Tab { NetworkList = 0, Attached = 1, Available = 2, TabCount = 3 };

        std::vector<Network> networks;
        std::vector<Container> containers;
        int tab = NetworkList;
        std::string parent_id;
        ListState lists[TabCount];

        void set_networks(std::vector<Network> items);
        void set_containers(std::vector<Container> items);
        void set_size(int width, int height);
        Intent handle_key(const Key& key);
        void handle_filter_key(const Key& key);
        bool is_filtering() const { return lists[tab].filtering(); }
        bool consumes_esc() const { return tab != NetworkList; }

        void cycle_tab(int delta);
        const Network* parent() const;
        const Network* highlighted_network() const;
        std::vector<const Network*> visible_networks() const;
        std::vector<Container> attached() const;
        std::vector<Container> available() const;
        std::optional<Container> selected_attached() const;
        std::optional<Container> selected_available() const;
        void sync();

    private:
        void resolve_parent();
        std::vector<Container> filtered(std::vector<Container> items, const ListState& list) const;
    };

    // --- Compose: projects -> services -> containers of a scaled service ---
    struct ComposeView {
        enum Level { Projects = 0, Services = 1, Replicas = 2 };

        std::vector<ComposeProject> projects;
        Level level = Projects;
        std::string project_name;
        std::string service_name;
        ListState lists[3];

        void set_projects(std::vector<ComposeProject> items);
        void set_size(int width, int height);
        Intent handle_key(const Key& key);
        void handle_filter_key(const Key& key);
        bool is_filtering() const { return lists[level].filtering(); }
        bool consumes_esc() const { return level != Projects; }

        std::vector<const ComposeProject*> visible_projects() const;
        std::vector<const ComposeService*> visible_services() const;
        std::vector<const Container*> visible_replicas() const;
        const ComposeProject* selected_project() const; // drill-down parent
        const ComposeService* selected_service() const;
        const ComposeProject* highlighted_project() const;
        const ComposeService* highlighted_service() const;
        const Container* highlighted_replica() const;
        void sync();

    private:
        void resolve_parent();
    };

    // --- Logs ---
    struct LogsView {
        std::string container_id;
        std::string container_name;
        std::deque<LogEntry> lines;
        size_t capacity = 1000;
        bool follow = true;
        int scroll = 0;  // first visible line when not following
        int page = 20;
        std::string error;
        std::shared_ptr<LogSubscription> sub;

        void open(const std::string& id, const std::string& name, size_t max_lines);
        void append(LogEntry entry);
        void set_size(int width, int height);
        Intent handle_key(const Key& key);
        bool is_filtering() const { return false; }
        int first_visible() const;
    };

    // --- Stats ---
    struct StatsView {
        std::string container_id;
        std::string container_name;
        std::optional<ContainerStats> latest;
        std::deque<double> cpu_history;
        std::deque<double> memory_history;
        size_t capacity = 60;
        std::string error;
        std::shared_ptr<StatsSubscription> sub;

        void open(const std::string& id, const std::string& name, size_t history);
        void add(const ContainerStats& stats);
        void set_size(int, int) {}
        Intent handle_key(const Key&) { return {}; }
        bool is_filtering() const { return false; }
    };

    // --- Environment editor ---
    struct EnvVarsView {
        enum class Mode { List, EditKey, EditValue };

        std::string container_id;
        std::string container_name;
        bool loaded = false;
        bool dirty = false;
        ContainerFullConfig config;
        std::vector<EnvVar> vars;
        ListState list;
        Mode mode = Mode::List;
        int editing = -1; // index being edited, -1 for a new entry
        std::string key_buffer;
        std::string value_buffer;
        std::string error;

        void open(const std::string& id, const std::string& name);
        void load(const ContainerFullConfig& cfg);
        void set_size(int width, int height);
        Intent handle_key(const Key& key);
        void handle_filter_key(const Key& key); // text entry while editing
        bool is_filtering() const { return mode != Mode::List; }
        bool consumes_esc() const { return false; }

        // Config with the edited variables applied.
        ContainerFullConfig edited_config() const;

    private:
        void begin_edit(int index);
        void commit_edit();
    };

    struct AboutView {
        void set_size(int, int) {}
        Intent handle_key(const Key&) { return {}; }
        bool is_filtering() const { return false; }
    };

}

#endif
