#include "views.hpp"

#include <algorithm>

namespace DockWatch {

    namespace {

        // Header, column titles, borders and footer around a list
        constexpr int kListChrome = 7;

        int list_rows(int height) {
            return std::max(1, height - kListChrome);
        }

        template <typename T, typename KeyFn>
        void reselect(ListState& list, const std::vector<T>& visible, const std::string& keep, KeyFn key_of) {
            list.set_count((int)visible.size());
            if (keep.empty()) return;
            for (size_t i = 0; i < visible.size(); ++i) {
                if (key_of(visible[i]) == keep) {
                    list.select((int)i);
                    return;
                }
            }
        }

        std::string container_text(const Container& c) {
            return c.name + " " + c.image + " " + c.state + " " + c.id;
        }

        std::optional<Container> pick(const std::vector<Container>& items, const ListState& list) {
            if (!list.has_selection() || list.selected() >= (int)items.size()) return std::nullopt;
            return items[list.selected()];
        }

    }

    const char* view_title(ViewKind kind) {
        switch (kind) {
            case ViewKind::Containers: return "Containers";
            case ViewKind::Images: return "Images";
            case ViewKind::Groups: return "Groups";
            case ViewKind::Volumes: return "Volumes";
            case ViewKind::Compose: return "Compose";
            case ViewKind::Networks: return "Networks";
            case ViewKind::Logs: return "Logs";
            case ViewKind::Stats: return "Stats";
            case ViewKind::EnvVars: return "Environment";
            case ViewKind::About: return "About";
        }
        return "";
    }

    const std::vector<ViewKind>& main_views() {
        static const std::vector<ViewKind> views = {
            ViewKind::Containers, ViewKind::Images, ViewKind::Groups, ViewKind::Volumes,
            ViewKind::Compose, ViewKind::Networks, ViewKind::About,
        };
        return views;
    }

    Intent container_intent(const Key& key, const Container& c) {
        Intent intent;
        intent.id = c.id;
        intent.name = c.name;
        if (key.is("s")) intent.kind = IntentKind::Start;
        else if (key.is("x")) intent.kind = IntentKind::Stop;
        else if (key.is("r")) intent.kind = IntentKind::Restart;
        else if (key.is("d")) intent.kind = IntentKind::Delete;
        else if (key.is("l")) intent.kind = IntentKind::Logs;
        else if (key.is("t")) intent.kind = IntentKind::Stats;
        else if (key.is("e")) intent.kind = IntentKind::Shell;
        else if (key.is("v")) intent.kind = IntentKind::EditEnv;
        return intent;
    }

    // --- Containers ---

    std::vector<const Container*> ContainersView::visible() const {
        std::vector<const Container*> out;
        for (const auto& c : items) {
            if (list.matches(container_text(c))) out.push_back(&c);
        }
        return out;
    }

    const Container* ContainersView::selected() const {
        auto vis = visible();
        if (!list.has_selection() || list.selected() >= (int)vis.size()) return nullptr;
        return vis[list.selected()];
    }

    void ContainersView::sync() {
        list.set_count((int)visible().size());
    }

    void ContainersView::set_items(std::vector<Container> containers) {
        const Container* current = selected();
        std::string keep = current ? current->id : "";
        items = std::move(containers);
        reselect(list, visible(), keep, [](const Container* c) { return c->id; });
    }

    void ContainersView::set_size(int, int height) {
        list.set_page(list_rows(height));
        sync();
    }

    Intent ContainersView::handle_key(const Key& key) {
        if (list.handle_key(key)) return {};
        const Container* c = selected();
        if (!c) return {};
        return container_intent(key, *c);
    }

    void ContainersView::handle_filter_key(const Key& key) {
        list.handle_filter_key(key);
        sync();
    }

    // --- Images ---

    std::vector<const Image*> ImagesView::visible() const {
        std::vector<const Image*> out;
        for (const auto& img : items) {
            std::string text = img.id;
            for (const auto& t : img.repo_tags) text += " " + t;
            if (list.matches(text)) out.push_back(&img);
        }
        return out;
    }

    const Image* ImagesView::selected() const {
        auto vis = visible();
        if (!list.has_selection() || list.selected() >= (int)vis.size()) return nullptr;
        return vis[list.selected()];
    }

    void ImagesView::sync() {
        list.set_count((int)visible().size());
    }

    void ImagesView::set_items(std::vector<Image> images) {
        const Image* current = selected();
        std::string keep = current ? current->id : "";
        items = std::move(images);
        reselect(list, visible(), keep, [](const Image* i) { return i->id; });
    }

    void ImagesView::set_size(int, int height) {
        list.set_page(list_rows(height));
        sync();
    }

    Intent ImagesView::handle_key(const Key& key) {
        if (list.handle_key(key)) return {};
        if (key.is("p")) return {IntentKind::PullImage};
        if (key.is("P")) return {IntentKind::PruneImages};

        const Image* img = selected();
        if (img && key.is("d")) return {IntentKind::DeleteImage, img->id, img->primary_tag()};
        return {};
    }

    void ImagesView::handle_filter_key(const Key& key) {
        list.handle_filter_key(key);
        sync();
    }

    // --- Volumes ---

    std::vector<const Volume*> VolumesView::visible() const {
        std::vector<const Volume*> out;
        for (const auto& v : items) {
            if (list.matches(v.name + " " + v.driver)) out.push_back(&v);
        }
        return out;
    }

    const Volume* VolumesView::selected() const {
        auto vis = visible();
        if (!list.has_selection() || list.selected() >= (int)vis.size()) return nullptr;
        return vis[list.selected()];
    }

    void VolumesView::sync() {
        list.set_count((int)visible().size());
    }

    void VolumesView::set_items(std::vector<Volume> volumes) {
        const Volume* current = selected();
        std::string keep = current ? current->name : "";
        items = std::move(volumes);
        reselect(list, visible(), keep, [](const Volume* v) { return v->name; });
    }

    void VolumesView::set_size(int, int height) {
        list.set_page(list_rows(height));
        sync();
    }

    Intent VolumesView::handle_key(const Key& key) {
        if (list.handle_key(key)) return {};
        if (key.is("p")) return {IntentKind::PruneVolumes};

        const Volume* v = selected();
        if (v && key.is("d")) return {IntentKind::DeleteVolume, v->name, v->name};
        return {};
    }

    void VolumesView::handle_filter_key(const Key& key) {
        list.handle_filter_key(key);
        sync();
    }

    // --- Groups ---

    std::vector<const Group*> GroupsView::visible_groups() const {
        std::vector<const Group*> out;
        for (const auto& g : groups) {
            if (lists[GroupList].matches(g.name + " " + g.description)) out.push_back(&g);
        }
        return out;
    }

    const Group* GroupsView::highlighted_group() const {
        auto vis = visible_groups();
        const ListState& list = lists[GroupList];
        if (!list.has_selection() || list.selected() >= (int)vis.size()) return nullptr;
        return vis[list.selected()];
    }

    const Group* GroupsView::parent() const {
        if (parent_id.empty()) return nullptr;
        for (const auto& g : groups) {
            if (g.id == parent_id) return &g;
        }
        return nullptr;
    }

    std::vector<Container> GroupsView::filtered(std::vector<Container> items, const ListState& list) const {
        items.erase(std::remove_if(items.begin(), items.end(),
                                   [&](const Container& c) { return !list.matches(container_text(c)); }),
                    items.end());
        return items;
    }

    std::vector<Container> GroupsView::members() const {
        const Group* g = parent();
        if (!g) return {};
        std::vector<Container> out;
        for (const auto& id : g->container_ids) {
            auto it = std::find_if(containers.begin(), containers.end(), [&](const Container& c) { return c.id == id; });
            if (it != containers.end()) {
                out.push_back(*it);
                continue;
            }
            Container missing;
            missing.id = id;
            missing.name = short_id(id);
            missing.state = "missing";
            out.push_back(missing);
        }
        return filtered(std::move(out), lists[Members]);
    }

    std::vector<Container> GroupsView::available() const {
        const Group* g = parent();
        if (!g) return {};
        std::vector<Container> out;
        for (const auto& c : containers) {
            if (!g->contains(c.id)) out.push_back(c);
        }
        return filtered(std::move(out), lists[Available]);
    }

    std::optional<Container> GroupsView::selected_member() const {
        return pick(members(), lists[Members]);
    }

    std::optional<Container> GroupsView::selected_available() const {
        return pick(available(), lists[Available]);
    }

    void GroupsView::sync() {
        lists[GroupList].set_count((int)visible_groups().size());
        lists[Members].set_count((int)members().size());
        lists[Available].set_count((int)available().size());
    }

    void GroupsView::resolve_parent() {
        if (!parent_id.empty() && !parent()) {
            parent_id.clear();
            lists[Members].reset();
            lists[Available].reset();
        }
    }

    void GroupsView::set_groups(std::vector<Group> items) {
        const Group* current = highlighted_group();
        std::string keep = current ? current->id : "";
        groups = std::move(items);
        resolve_parent();
        sync();
        reselect(lists[GroupList], visible_groups(), keep, [](const Group* g) { return g->id; });
    }

    void GroupsView::set_containers(std::vector<Container> items) {
        auto member = selected_member();
        auto avail = selected_available();
        containers = std::move(items);
        sync();
        auto id_of = [](const Container& c) { return c.id; };
        reselect(lists[Members], members(), member ? member->id : "", id_of);
        reselect(lists[Available], available(), avail ? avail->id : "", id_of);
    }

    void GroupsView::set_size(int, int height) {
        for (auto& l : lists) l.set_page(list_rows(height) - 2);
        sync();
    }

    void GroupsView::cycle_tab(int delta) {
        if (tab == GroupList) {
            const Group* g = highlighted_group();
            if (g) parent_id = g->id;
        }
        tab = ((tab + delta) % TabCount + TabCount) % TabCount;
        sync();
    }

    Intent GroupsView::handle_key(const Key& key) {
        if (key.is("left")) {
            cycle_tab(-1);
            return {};
        }
        if (key.is("right")) {
            cycle_tab(1);
            return {};
        }
        if (key.is("esc") && tab != GroupList) {
            tab = GroupList;
            return {};
        }
        if (lists[tab].handle_key(key)) return {};

        if (tab == GroupList) {
            if (key.is("n")) return {IntentKind::CreateGroup};
            const Group* g = highlighted_group();
            if (!g) return {};
            if (key.is("enter")) {
                parent_id = g->id;
                tab = Members;
                lists[Members].reset();
                sync();
                return {};
            }
            if (key.is("s")) return {IntentKind::StartGroup, g->id, g->name};
            if (key.is("x")) return {IntentKind::StopGroup, g->id, g->name};
            if (key.is("d")) return {IntentKind::DeleteGroup, g->id, g->name};
            return {};
        }

        const Group* g = parent();
        if (!g) return {};

        if (tab == Members) {
            auto c = selected_member();
            if (!c) return {};
            if (key.is("u")) return {IntentKind::RemoveFromGroup, c->id, c->name, g->id, g->name};
            Intent intent = container_intent(key, *c);
            intent.parent_id = g->id;
            intent.parent_name = g->name;
            return intent;
        }

        auto c = selected_available();
        if (c && key.is("enter")) return {IntentKind::AddToGroup, c->id, c->name, g->id, g->name};
        return {};
    }

    void GroupsView::handle_filter_key(const Key& key) {
        lists[tab].handle_filter_key(key);
        sync();
    }

    // --- Networks ---

    std::vector<const Network*> NetworksView::visible_networks() const {
        std::vector<const Network*> out;
        for (const auto& n : networks) {
            if (lists[NetworkList].matches(n.name + " " + n.driver + " " + n.id)) out.push_back(&n);
        }
        return out;
    }

    const Network* NetworksView::highlighted_network() const {
        auto vis = visible_networks();
        const ListState& list = lists[NetworkList];
        if (!list.has_selection() || list.selected() >= (int)vis.size()) return nullptr;
        return vis[list.selected()];
    }

    const Network* NetworksView::parent() const {
        if (parent_id.empty()) return nullptr;
        for (const auto& n : networks) {
            if (n.id == parent_id) return &n;
        }
        return nullptr;
    }

    std::vector<Container> NetworksView::filtered(std::vector<Container> items, const ListState& list) const {
        items.erase(std::remove_if(items.begin(), items.end(),
                                   [&](const Container& c) { return !list.matches(container_text(c)); }),
                    items.end());
        return items;
    }

    namespace {

        bool on_network(const Network& n, const Container& c) {
            if (std::find(n.containers.begin(), n.containers.end(), c.id) != n.containers.end()) return true;
            return std::find(c.networks.begin(), c.networks.end(), n.name) != c.networks.end();
        }

    }

    std::vector<Container> NetworksView::attached() const {
        const Network* n = parent();
        if (!n) return {};
        std::vector<Container> out;
        for (const auto& c : containers) {
            if (on_network(*n, c)) out.push_back(c);
        }
        return filtered(std::move(out), lists[Attached]);
    }

    std::vector<Container> NetworksView::available() const {
        const Network* n = parent();
        if (!n) return {};
        std::vector<Container> out;
        for (const auto& c : containers) {
            if (!on_network(*n, c)) out.push_back(c);
        }
        return filtered(std::move(out), lists[Available]);
    }

    std::optional<Container> NetworksView::selected_attached() const {
        return pick(attached(), lists[Attached]);
    }

    std::optional<Container> NetworksView::selected_available() const {
        return pick(available(), lists[Available]);
    }

    void NetworksView::sync() {
        lists[NetworkList].set_count((int)visible_networks().size());
        lists[Attached].set_count((int)attached().size());
        lists[Available].set_count((int)available().size());
    }

    void NetworksView::resolve_parent() {
        if (!parent_id.empty() && !parent()) {
            parent_id.clear();
            lists[Attached].reset();
            lists[Available].reset();
        }
    }

    void NetworksView::set_networks(std::vector<Network> items) {
        const Network* current = highlighted_network();
        std::string keep = current ? current->id : "";
        networks = std::move(items);
        resolve_parent();
        sync();
        reselect(lists[NetworkList], visible_networks(), keep, [](const Network* n) { return n->id; });
    }

    void NetworksView::set_containers(std::vector<Container> items) {
        auto att = selected_attached();
        auto avail = selected_available();
        containers = std::move(items);
        sync();
        auto id_of = [](const Container& c) { return c.id; };
        reselect(lists[Attached], attached(), att ? att->id : "", id_of);
        reselect(lists[Available], available(), avail ? avail->id : "", id_of);
    }

    void NetworksView::set_size(int, int height) {
        for (auto& l : lists) l.set_page(list_rows(height) - 2);
        sync();
    }

    void NetworksView::cycle_tab(int delta) {
        if (tab == NetworkList) {
            const Network* n = highlighted_network();
            if (n) parent_id = n->id;
        }
        tab = ((tab + delta) % TabCount + TabCount) % TabCount;
        sync();
    }

    Intent NetworksView::handle_key(const Key& key) {
        if (key.is("left")) {
            cycle_tab(-1);
            return {};
        }
        if (key.is("right")) {
            cycle_tab(1);
            return {};
        }
        if (key.is("esc") && tab != NetworkList) {
            tab = NetworkList;
            return {};
        }
        if (lists[tab].handle_key(key)) return {};

        if (tab == NetworkList) {
            if (key.is("n")) return {IntentKind::CreateNetwork};
            const Network* n = highlighted_network();
            if (!n) return {};
            if (key.is("enter")) {
                parent_id = n->id;
                tab = Attached;
                lists[Attached].reset();
                sync();
                return {};
            }
            if (key.is("d")) return {IntentKind::DeleteNetwork, n->id, n->name};
            return {};
        }

        const Network* n = parent();
        if (!n) return {};

        if (tab == Attached) {
            auto c = selected_attached();
            if (!c) return {};
            if (key.is("u")) return {IntentKind::Disconnect, c->id, c->name, n->id, n->name};
            Intent intent = container_intent(key, *c);
            intent.parent_id = n->id;
            intent.parent_name = n->name;
            return intent;
        }

        auto c = selected_available();
        if (c && key.is("enter")) return {IntentKind::Connect, c->id, c->name, n->id, n->name};
        return {};
    }

    void NetworksView::handle_filter_key(const Key& key) {
        lists[tab].handle_filter_key(key);
        sync();
    }

    // --- Compose ---

    std::vector<const ComposeProject*> ComposeView::visible_projects() const {
        std::vector<const ComposeProject*> out;
        for (const auto& p : projects) {
            if (lists[Projects].matches(p.name + " " + p.working_dir)) out.push_back(&p);
        }
        return out;
    }

    const ComposeProject* ComposeView::selected_project() const {
        if (project_name.empty()) return nullptr;
        for (const auto& p : projects) {
            if (p.name == project_name) return &p;
        }
        return nullptr;
    }

    const ComposeService* ComposeView::selected_service() const {
        const ComposeProject* p = selected_project();
        if (!p || service_name.empty()) return nullptr;
        for (const auto& s : p->services) {
            if (s.name == service_name) return &s;
        }
        return nullptr;
    }

    const ComposeProject* ComposeView::highlighted_project() const {
        auto vis = visible_projects();
        const ListState& list = lists[Projects];
        if (!list.has_selection() || list.selected() >= (int)vis.size()) return nullptr;
        return vis[list.selected()];
    }

    std::vector<const ComposeService*> ComposeView::visible_services() const {
        std::vector<const ComposeService*> out;
        const ComposeProject* p = selected_project();
        if (!p) return out;
        for (const auto& s : p->services) {
            if (lists[Services].matches(s.name)) out.push_back(&s);
        }
        return out;
    }

    std::vector<const Container*> ComposeView::visible_replicas() const {
        std::vector<const Container*> out;
        const ComposeService* s = selected_service();
        if (!s) return out;
        for (const auto& c : s->containers) {
            if (lists[Replicas].matches(container_text(c))) out.push_back(&c);
        }
        return out;
    }

    const ComposeService* ComposeView::highlighted_service() const {
        auto vis = visible_services();
        const ListState& list = lists[Services];
        if (!list.has_selection() || list.selected() >= (int)vis.size()) return nullptr;
        return vis[list.selected()];
    }

    const Container* ComposeView::highlighted_replica() const {
        auto vis = visible_replicas();
        const ListState& list = lists[Replicas];
        if (!list.has_selection() || list.selected() >= (int)vis.size()) return nullptr;
        return vis[list.selected()];
    }

    void ComposeView::sync() {
        lists[Projects].set_count((int)visible_projects().size());
        lists[Services].set_count((int)visible_services().size());
        lists[Replicas].set_count((int)visible_replicas().size());
    }

    void ComposeView::resolve_parent() {
        if (!project_name.empty() && !selected_project()) {
            project_name.clear();
            service_name.clear();
            level = Projects;
            lists[Services].reset();
            lists[Replicas].reset();
            return;
        }
        if (!service_name.empty() && !selected_service()) {
            service_name.clear();
            if (level == Replicas) level = Services;
            lists[Replicas].reset();
        }
    }

    void ComposeView::set_projects(std::vector<ComposeProject> items) {
        const ComposeProject* current = highlighted_project();
        std::string keep = current ? current->name : "";
        projects = std::move(items);
        resolve_parent();
        sync();
        reselect(lists[Projects], visible_projects(), keep, [](const ComposeProject* p) { return p->name; });
    }

    void ComposeView::set_size(int, int height) {
        for (auto& l : lists) l.set_page(list_rows(height));
        sync();
    }

    Intent ComposeView::handle_key(const Key& key) {
        if (key.is("esc")) {
            if (level == Replicas) {
                level = Services;
                service_name.clear();
            } else if (level == Services) {
                level = Projects;
                project_name.clear();
            }
            sync();
            return {};
        }
        if (lists[level].handle_key(key)) return {};

        if (level == Projects) {
            const ComposeProject* p = highlighted_project();
            if (!p) return {};
            if (key.is("enter")) {
                project_name = p->name;
                level = Services;
                lists[Services].reset();
                sync();
                return {};
            }
            if (key.is("s")) return {IntentKind::StartProject, p->name, p->name};
            if (key.is("x")) return {IntentKind::StopProject, p->name, p->name};
            if (key.is("r")) return {IntentKind::RestartProject, p->name, p->name};
            return {};
        }

        if (level == Services) {
            const ComposeService* s = highlighted_service();
            if (!s) return {};
            if (key.is("enter")) {
                if (s->containers.size() > 1) {
                    service_name = s->name;
                    level = Replicas;
                    lists[Replicas].reset();
                    sync();
                }
                return {};
            }
            // Single-container services take container actions directly
            if (s->containers.size() != 1) return {};
            Intent intent = container_intent(key, s->containers.front());
            intent.parent_name = project_name;
            return intent;
        }

        const Container* c = highlighted_replica();
        if (!c) return {};
        Intent intent = container_intent(key, *c);
        intent.parent_name = project_name;
        return intent;
    }

    void ComposeView::handle_filter_key(const Key& key) {
        lists[level].handle_filter_key(key);
        sync();
    }

    // --- Logs ---

    void LogsView::open(const std::string& id, const std::string& name, size_t max_lines) {
        container_id = id;
        container_name = name;
        capacity = max_lines == 0 ? 1 : max_lines;
        lines.clear();
        follow = true;
        scroll = 0;
        error.clear();
        sub.reset();
    }

    void LogsView::append(LogEntry entry) {
        lines.push_back(std::move(entry));
        while (lines.size() > capacity) {
            lines.pop_front();
            if (!follow && scroll > 0) scroll--;
        }
    }

    int LogsView::first_visible() const {
        int last_page = std::max(0, (int)lines.size() - page);
        if (follow) return last_page;
        return std::max(0, std::min(scroll, last_page));
    }

    void LogsView::set_size(int, int height) {
        page = std::max(1, height - 6);
    }

    Intent LogsView::handle_key(const Key& key) {
        int last_page = std::max(0, (int)lines.size() - page);
        auto move = [&](int delta) {
            scroll = std::max(0, std::min(first_visible() + delta, last_page));
            follow = scroll >= last_page;
        };

        if (key.is("f")) {
            if (follow) scroll = first_visible();
            follow = !follow;
        } else if (key.is("g") || key.is("home")) {
            follow = false;
            scroll = 0;
        } else if (key.is("G") || key.is("end")) {
            follow = true;
        } else if (key.is("up") || key.is("k")) {
            move(-1);
        } else if (key.is("down") || key.is("j")) {
            move(1);
        } else if (key.is("pgup")) {
            move(-page);
        } else if (key.is("pgdn")) {
            move(page);
        }
        return {};
    }

    // --- Stats ---

    void StatsView::open(const std::string& id, const std::string& name, size_t history) {
        container_id = id;
        container_name = name;
        capacity = history == 0 ? 1 : history;
        latest.reset();
        cpu_history.clear();
        memory_history.clear();
        error.clear();
        sub.reset();
    }

    void StatsView::add(const ContainerStats& stats) {
        latest = stats;
        cpu_history.push_back(stats.cpu_percent);
        memory_history.push_back(stats.memory_percent);
        while (cpu_history.size() > capacity) cpu_history.pop_front();
        while (memory_history.size() > capacity) memory_history.pop_front();
    }

    // --- Environment editor ---

    void EnvVarsView::open(const std::string& id, const std::string& name) {
        container_id = id;
        container_name = name;
        loaded = false;
        dirty = false;
        config = ContainerFullConfig{};
        vars.clear();
        list.reset();
        list.set_count(0);
        mode = Mode::List;
        editing = -1;
        error.clear();
    }

    void EnvVarsView::load(const ContainerFullConfig& cfg) {
        config = cfg;
        vars = parse_env_vars(cfg.env);
        loaded = true;
        dirty = false;
        list.set_count((int)vars.size());
    }

    void EnvVarsView::set_size(int, int height) {
        list.set_page(list_rows(height));
        list.set_count((int)vars.size());
    }

    void EnvVarsView::begin_edit(int index) {
        editing = index;
        key_buffer = index >= 0 ? vars[index].key : "";
        value_buffer = index >= 0 ? vars[index].value : "";
        mode = index >= 0 ? Mode::EditValue : Mode::EditKey;
        error.clear();
    }

    void EnvVarsView::commit_edit() {
        if (key_buffer.empty()) {
            error = "variable name is required";
            mode = Mode::EditKey;
            return;
        }
        if (key_buffer.find('=') != std::string::npos) {
            error = "variable name cannot contain '='";
            mode = Mode::EditKey;
            return;
        }
        for (int i = 0; i < (int)vars.size(); ++i) {
            if (i != editing && vars[i].key == key_buffer) {
                error = key_buffer + " is already defined";
                mode = Mode::EditKey;
                return;
            }
        }

        if (editing >= 0 && editing < (int)vars.size()) {
            vars[editing] = {key_buffer, value_buffer};
        } else {
            vars.push_back({key_buffer, value_buffer});
            editing = (int)vars.size() - 1;
        }
        dirty = true;
        mode = Mode::List;
        error.clear();
        list.set_count((int)vars.size());
        list.select(editing);
    }

    Intent EnvVarsView::handle_key(const Key& key) {
        if (!loaded) return {};
        // No filter on the variable list
        if (key.is("/")) return {};
        if (list.handle_key(key)) return {};

        if (key.is("a") || key.is("n")) {
            begin_edit(-1);
        } else if ((key.is("e") || key.is("enter")) && list.has_selection()) {
            begin_edit(list.selected());
        } else if (key.is("d") && list.has_selection()) {
            vars.erase(vars.begin() + list.selected());
            dirty = true;
            list.set_count((int)vars.size());
        } else if (key.is("ctrl+s")) {
            return {IntentKind::SaveEnv, container_id, container_name};
        }
        return {};
    }

    void EnvVarsView::handle_filter_key(const Key& key) {
        std::string& buffer = mode == Mode::EditKey ? key_buffer : value_buffer;
        if (key.is("esc")) {
            mode = Mode::List;
            error.clear();
        } else if (key.is("tab") || key.is("shift+tab")) {
            mode = mode == Mode::EditKey ? Mode::EditValue : Mode::EditKey;
        } else if (key.is("enter")) {
            commit_edit();
        } else if (key.is("backspace")) {
            if (!buffer.empty()) buffer.pop_back();
        } else if (key.printable) {
            buffer += key.name;
        }
    }

    ContainerFullConfig EnvVarsView::edited_config() const {
        ContainerFullConfig cfg = config;
        cfg.env = env_vars_to_strings(vars);
        return cfg;
    }

}
