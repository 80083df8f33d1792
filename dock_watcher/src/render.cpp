#include "render.hpp"
#include "reducer.hpp"

#include <ftxui/screen/color.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <ctime>

using namespace ftxui;

namespace DockWatch {

    namespace {

        // --- Helpers ---

        Element cell(const std::string& s, int width) {
            return text(s) | size(WIDTH, EQUAL, width);
        }

        Color state_color(const std::string& state) {
            if (state == "running") return Color::Green;
            if (state == "paused" || state == "restarting") return Color::Yellow;
            if (state == "missing" || state == "dead") return Color::Red;
            return Color::GrayDark;
        }

        Color group_color(const std::string& name) {
            if (name == "blue") return Color::Blue;
            if (name == "green") return Color::Green;
            if (name == "yellow") return Color::Yellow;
            if (name == "magenta") return Color::Magenta;
            if (name == "cyan") return Color::Cyan;
            if (name == "red") return Color::Red;
            return Color::White;
        }

        std::string clock_time(SystemTime t) {
            std::time_t tt = std::chrono::system_clock::to_time_t(t);
            std::tm tm{};
            localtime_r(&tt, &tm);
            char buf[16];
            std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
            return buf;
        }

        // Visible slice of `rows` following the list scroll window.
        Elements window_rows(const Elements& rows, const ListState& list) {
            Elements out;
            int begin = std::min(list.scroll(), (int)rows.size());
            int end = std::min((int)rows.size(), begin + list.page());
            for (int i = begin; i < end; ++i) out.push_back(rows[i]);
            return out;
        }

        Element filter_line(const ListState& list) {
            if (!list.filtering() && list.filter().empty()) return text("");
            auto prompt = hbox(text(" / ") | bold, text(list.filter()), text(list.filtering() ? "_" : "") | blink);
            return list.filtering() ? prompt | color(Color::Yellow) : prompt | dim;
        }

        Element list_window(const std::string& title, Element header, const Elements& rows, const ListState& list,
                            const std::string& empty_text) {
            Elements lines;
            lines.push_back(header | bold | underlined);
            if (rows.empty()) lines.push_back(text(empty_text) | dim | center);
            for (auto& r : window_rows(rows, list)) lines.push_back(r);
            lines.push_back(filler());
            lines.push_back(filter_line(list));
            return window(text(" " + title + " "), vbox(std::move(lines)) | flex);
        }

        Element select_row(Element row, bool selected) {
            return selected ? row | inverted : row;
        }

        Element tab_bar(const std::vector<std::string>& names, int active) {
            Elements items;
            for (int i = 0; i < (int)names.size(); ++i) {
                auto item = text(" " + names[i] + " ");
                items.push_back(i == active ? item | bold | inverted : item | dim);
                items.push_back(text("│") | dim);
            }
            return hbox(std::move(items));
        }

        Element container_header() {
            return hbox(cell("NAME", 24), cell("IMAGE", 28), cell("STATE", 10), cell("STATUS", 24), cell("ID", 14),
                        text("PORTS") | flex);
        }

        Element container_row(const Container& c, bool selected) {
            auto row = hbox(cell(c.name, 24), cell(c.image, 28), cell(c.state, 10) | color(state_color(c.state)),
                            cell(c.status, 24), cell(c.short_id(), 14), text(c.ports_string()) | flex);
            return select_row(row, selected);
        }

        Elements container_rows(const std::vector<Container>& items, const ListState& list) {
            Elements rows;
            for (int i = 0; i < (int)items.size(); ++i) rows.push_back(container_row(items[i], i == list.selected()));
            return rows;
        }

        // --- Views ---

        Element render_containers(const ContainersView& v) {
            auto vis = v.visible();
            Elements rows;
            for (int i = 0; i < (int)vis.size(); ++i) rows.push_back(container_row(*vis[i], i == v.list.selected()));
            int running = (int)std::count_if(v.items.begin(), v.items.end(), [](const Container& c) { return c.is_running(); });
            return list_window(fmt::format("Containers ({} running / {})", running, v.items.size()), container_header(),
                               rows, v.list, "No containers");
        }

        Element render_images(const ImagesView& v) {
            auto vis = v.visible();
            Elements rows;
            for (int i = 0; i < (int)vis.size(); ++i) {
                const Image& img = *vis[i];
                auto row = hbox(cell(img.repository(), 36), cell(img.tag(), 18), cell(img.short_id(), 14),
                                cell(format_bytes((uint64_t)img.size), 12), text(img.created) | flex);
                rows.push_back(select_row(row, i == v.list.selected()));
            }
            auto header = hbox(cell("REPOSITORY", 36), cell("TAG", 18), cell("ID", 14), cell("SIZE", 12), text("CREATED") | flex);
            return list_window(fmt::format("Images ({})", v.items.size()), header, rows, v.list, "No images");
        }

        Element render_volumes(const VolumesView& v) {
            auto vis = v.visible();
            Elements rows;
            for (int i = 0; i < (int)vis.size(); ++i) {
                const Volume& vol = *vis[i];
                auto in_use = vol.in_use() ? text(fmt::format("{}", vol.ref_count)) | color(Color::Green) : text("-") | dim;
                auto row = hbox(cell(vol.name, 40), cell(vol.driver, 10), in_use | size(WIDTH, EQUAL, 8),
                                text(vol.mountpoint) | flex);
                rows.push_back(select_row(row, i == v.list.selected()));
            }
            auto header = hbox(cell("NAME", 40), cell("DRIVER", 10), cell("USED BY", 8), text("MOUNTPOINT") | flex);
            return list_window(fmt::format("Volumes ({})", v.items.size()), header, rows, v.list, "No volumes");
        }

        Element render_groups(const GroupsView& v) {
            Element body;
            const Group* parent = v.parent();
            std::string scope = parent ? " " + parent->name + " " : " no group selected ";

            if (v.tab == GroupsView::GroupList) {
                auto vis = v.visible_groups();
                Elements rows;
                for (int i = 0; i < (int)vis.size(); ++i) {
                    const Group& g = *vis[i];
                    auto row = hbox(text("● ") | color(group_color(g.color)), cell(g.name, 24),
                                    cell(fmt::format("{} members", g.container_ids.size()), 14), text(g.description) | flex);
                    rows.push_back(select_row(row, i == v.lists[GroupsView::GroupList].selected()));
                }
                auto header = hbox(text("  "), cell("NAME", 24), cell("MEMBERS", 14), text("DESCRIPTION") | flex);
                body = list_window("Groups", header, rows, v.lists[GroupsView::GroupList], "No groups, press n to create one");
            } else if (v.tab == GroupsView::Members) {
                body = list_window("In group:" + scope, container_header(),
                                   container_rows(v.members(), v.lists[GroupsView::Members]), v.lists[GroupsView::Members],
                                   parent ? "Group is empty" : "Select a group first");
            } else {
                body = list_window("Available:" + scope, container_header(),
                                   container_rows(v.available(), v.lists[GroupsView::Available]),
                                   v.lists[GroupsView::Available], parent ? "Every container is in this group" : "Select a group first");
            }
            return vbox(tab_bar({"Groups", "In Group", "Available"}, v.tab), body | flex);
        }

        Element render_networks(const NetworksView& v) {
            Element body;
            const Network* parent = v.parent();
            std::string scope = parent ? " " + parent->name + " " : " no network selected ";

            if (v.tab == NetworksView::NetworkList) {
                auto vis = v.visible_networks();
                Elements rows;
                for (int i = 0; i < (int)vis.size(); ++i) {
                    const Network& n = *vis[i];
                    auto name = n.is_system() ? cell(n.name, 24) | dim : cell(n.name, 24);
                    auto row = hbox(name, cell(n.driver, 10), cell(n.scope, 8), cell(n.subnet, 20), cell(n.short_id(), 14),
                                    text(n.internal ? "internal" : "") | flex);
                    rows.push_back(select_row(row, i == v.lists[NetworksView::NetworkList].selected()));
                }
                auto header = hbox(cell("NAME", 24), cell("DRIVER", 10), cell("SCOPE", 8), cell("SUBNET", 20), cell("ID", 14),
                                   text("") | flex);
                body = list_window(fmt::format("Networks ({})", v.networks.size()), header, rows,
                                   v.lists[NetworksView::NetworkList], "No networks");
            } else if (v.tab == NetworksView::Attached) {
                body = list_window("In network:" + scope, container_header(),
                                   container_rows(v.attached(), v.lists[NetworksView::Attached]),
                                   v.lists[NetworksView::Attached], parent ? "No containers attached" : "Select a network first");
            } else {
                body = list_window("Available:" + scope, container_header(),
                                   container_rows(v.available(), v.lists[NetworksView::Available]),
                                   v.lists[NetworksView::Available], parent ? "Nothing to connect" : "Select a network first");
            }
            return vbox(tab_bar({"Networks", "In Network", "Available"}, v.tab), body | flex);
        }

        Element render_compose(const ComposeView& v) {
            std::string crumbs = "Projects";
            if (!v.project_name.empty()) crumbs += " > " + v.project_name;
            if (!v.service_name.empty()) crumbs += " > " + v.service_name;
            auto breadcrumbs = text(" " + crumbs + " ") | bold | color(Color::Cyan);

            if (v.level == ComposeView::Projects) {
                auto vis = v.visible_projects();
                Elements rows;
                for (int i = 0; i < (int)vis.size(); ++i) {
                    const ComposeProject& p = *vis[i];
                    int total = (int)p.container_ids.size();
                    auto running = text(fmt::format("{}/{}", p.running_count(), total))
                                   | color(p.all_running() ? Color::Green : Color::Yellow);
                    auto row = hbox(cell(p.name, 28), cell(fmt::format("{}", p.services.size()), 10),
                                    running | size(WIDTH, EQUAL, 10), text(p.working_dir) | flex);
                    rows.push_back(select_row(row, i == v.lists[ComposeView::Projects].selected()));
                }
                auto header = hbox(cell("PROJECT", 28), cell("SERVICES", 10), cell("RUNNING", 10), text("WORKING DIR") | flex);
                return vbox(breadcrumbs, list_window("Compose", header, rows, v.lists[ComposeView::Projects],
                                                     "No compose projects") | flex);
            }

            if (v.level == ComposeView::Services) {
                auto vis = v.visible_services();
                Elements rows;
                for (int i = 0; i < (int)vis.size(); ++i) {
                    const ComposeService& svc = *vis[i];
                    int total = (int)svc.containers.size();
                    int running = (int)std::count_if(svc.containers.begin(), svc.containers.end(),
                                                     [](const Container& c) { return c.is_running(); });
                    std::string state = total == 1 ? svc.containers.front().state : fmt::format("{}/{} running", running, total);
                    auto row = hbox(cell(svc.name, 28), cell(fmt::format("{}", total), 10),
                                    text(state) | flex | color(running == total ? Color::Green : Color::Yellow));
                    rows.push_back(select_row(row, i == v.lists[ComposeView::Services].selected()));
                }
                auto header = hbox(cell("SERVICE", 28), cell("REPLICAS", 10), text("STATE") | flex);
                return vbox(breadcrumbs, list_window("Services", header, rows, v.lists[ComposeView::Services], "No services") | flex);
            }

            auto vis = v.visible_replicas();
            Elements rows;
            for (int i = 0; i < (int)vis.size(); ++i) {
                rows.push_back(container_row(*vis[i], i == v.lists[ComposeView::Replicas].selected()));
            }
            return vbox(breadcrumbs, list_window("Containers", container_header(), rows, v.lists[ComposeView::Replicas],
                                                 "No containers") | flex);
        }

        Element render_logs(const LogsView& v) {
            Elements lines;
            int begin = v.first_visible();
            int end = std::min((int)v.lines.size(), begin + v.page);
            for (int i = begin; i < end; ++i) {
                const LogEntry& e = v.lines[i];
                auto line = hbox(text(clock_time(e.timestamp) + " ") | dim, text(e.line));
                lines.push_back(e.is_error ? line | color(Color::Red) : line);
            }
            if (v.lines.empty()) lines.push_back(text(v.sub ? "Waiting for output..." : "No output") | dim | center);
            lines.push_back(filler());
            if (!v.error.empty()) lines.push_back(text("stream ended: " + v.error) | color(Color::Red));

            std::string mode = v.follow ? "follow" : fmt::format("line {}/{}", begin + 1, v.lines.size());
            return window(text(fmt::format(" Logs: {} [{}] ", v.container_name, mode)), vbox(std::move(lines)) | flex);
        }

        Element history_graph(const std::deque<double>& history, Color c) {
            return graph([&history](int width, int height) {
                       std::vector<int> result(width, 0);
                       int offset = (int)history.size() - width;
                       for (int i = 0; i < width; ++i) {
                           int idx = offset + i;
                           if (idx >= 0 && idx < (int)history.size()) {
                               result[i] = (int)(std::min(history[idx], 100.0) * height / 100.0);
                           }
                       }
                       return result;
                   })
                   | color(c);
        }

        Element render_stats(const StatsView& v) {
            std::string title = fmt::format(" Stats: {} ", v.container_name);
            if (!v.latest) {
                auto msg = v.error.empty() ? text("Waiting for samples...") | dim : text(v.error) | color(Color::Red);
                return window(text(title), msg | center | flex);
            }
            const ContainerStats& s = *v.latest;

            Elements left;
            left.push_back(text("Resources") | bold | underlined);
            left.push_back(hbox(text("CPU: "), text(fmt::format("{:.1f}%", s.cpu_percent)) | bold | color(Color::Cyan)));
            left.push_back(gauge((float)std::min(s.cpu_percent, 100.0) / 100.0f) | color(Color::Cyan));
            left.push_back(text(""));
            left.push_back(hbox(text("Memory: "), text(fmt::format("{:.1f}%", s.memory_percent)) | bold | color(Color::Magenta),
                                text(fmt::format("  {} / {}", format_bytes(s.memory_usage), format_bytes(s.memory_limit)))));
            left.push_back(gauge((float)std::min(s.memory_percent, 100.0) / 100.0f) | color(Color::Magenta));
            left.push_back(text(""));
            left.push_back(separator());
            left.push_back(hbox(text("Net I/O:   "), text(fmt::format("rx {}  tx {}", format_bytes(s.network_rx), format_bytes(s.network_tx))) | color(Color::Green)));
            left.push_back(hbox(text("Block I/O: "), text(fmt::format("read {}  write {}", format_bytes(s.block_read), format_bytes(s.block_write))) | color(Color::Yellow)));
            left.push_back(hbox(text("PIDs:      "), text(fmt::format("{}", s.pids))));
            if (!v.error.empty()) left.push_back(text("stream ended: " + v.error) | color(Color::Red));

            Elements right;
            right.push_back(text(fmt::format("CPU history ({} samples)", v.cpu_history.size())) | center);
            right.push_back(history_graph(v.cpu_history, Color::Cyan) | flex);
            right.push_back(separator());
            right.push_back(text("Memory history") | center);
            right.push_back(history_graph(v.memory_history, Color::Magenta) | flex);

            return window(text(title), hbox(vbox(std::move(left)) | flex, separator(), vbox(std::move(right)) | flex));
        }

        Element render_env(const EnvVarsView& v) {
            std::string title = fmt::format(" Environment: {}{} ", v.container_name, v.dirty ? " [modified]" : "");
            if (!v.loaded) {
                auto msg = v.error.empty() ? text("Loading configuration...") | dim : text(v.error) | color(Color::Red);
                return window(text(title), msg | center | flex);
            }

            Elements rows;
            for (int i = 0; i < (int)v.vars.size(); ++i) {
                auto row = hbox(cell(v.vars[i].key, 32) | color(Color::Cyan), text(v.vars[i].value) | flex);
                rows.push_back(select_row(row, i == v.list.selected()));
            }

            Elements lines;
            lines.push_back(hbox(cell("KEY", 32), text("VALUE") | flex) | bold | underlined);
            if (rows.empty()) lines.push_back(text("No variables") | dim | center);
            for (auto& r : window_rows(rows, v.list)) lines.push_back(r);
            lines.push_back(filler());

            if (v.mode != EnvVarsView::Mode::List) {
                bool on_key = v.mode == EnvVarsView::Mode::EditKey;
                auto field = [](const std::string& label, const std::string& value, bool focused) {
                    auto input = text(value + (focused ? "_" : ""));
                    return hbox(cell(label, 8) | bold, focused ? input | inverted : input) | flex;
                };
                lines.push_back(separator());
                lines.push_back(hbox(field("Key", v.key_buffer, on_key), field("Value", v.value_buffer, !on_key)));
            }
            if (!v.error.empty()) lines.push_back(text(v.error) | color(Color::Red));
            return window(text(title), vbox(std::move(lines)) | flex);
        }

        Element render_about(const AppState& s) {
            auto line = [](const std::string& keys, const std::string& what) {
                return hbox(cell(keys, 22) | bold | color(Color::Cyan), text(what));
            };
            Elements lines;
            lines.push_back(text("dock-watcher") | bold | color(Color::Cyan));
            lines.push_back(text(s.docker_version.empty() ? "Docker daemon" : "Docker engine " + s.docker_version) | dim);
            lines.push_back(text(""));
            lines.push_back(text("Global") | bold | underlined);
            lines.push_back(line("1-7 / tab / shift+tab", "switch view"));
            lines.push_back(line("q / ctrl+c", "quit (leave detail views)"));
            lines.push_back(line("esc", "back"));
            lines.push_back(line("/", "filter the current list"));
            lines.push_back(line("?", "this screen"));
            lines.push_back(text(""));
            lines.push_back(text("Containers") | bold | underlined);
            lines.push_back(line("s / x / r", "start / stop / restart"));
            lines.push_back(line("d", "delete"));
            lines.push_back(line("l / t", "logs / stats"));
            lines.push_back(line("e", "shell"));
            lines.push_back(line("v", "edit environment and recreate"));
            lines.push_back(text(""));
            lines.push_back(text("Groups / Networks") | bold | underlined);
            lines.push_back(line("left / right", "switch tab"));
            lines.push_back(line("enter", "open / add / connect"));
            lines.push_back(line("n", "create"));
            lines.push_back(line("u", "unlink / disconnect"));
            lines.push_back(line("s / x", "start / stop every group member"));
            return window(text(" About "), vbox(std::move(lines)) | flex);
        }

        // --- Frame ---

        std::string help_text(const AppState& s) {
            switch (s.current_view) {
                case ViewKind::Containers: return "s start  x stop  r restart  d delete  l logs  t stats  e shell  v env  / filter";
                case ViewKind::Images: return "d delete  p pull  P prune  / filter";
                case ViewKind::Groups: return "←/→ tab  enter open/add  n new  s/x start/stop all  d delete  u unlink";
                case ViewKind::Volumes: return "d delete  p prune  / filter";
                case ViewKind::Compose: return "enter drill down  esc up  s/x/r start/stop/restart";
                case ViewKind::Networks: return "←/→ tab  enter open/connect  n new  d delete  u disconnect";
                case ViewKind::Logs: return "f follow  g/G top/bottom  ↑/↓ scroll  q back";
                case ViewKind::Stats: return "q back";
                case ViewKind::EnvVars:
                    return s.env.mode == EnvVarsView::Mode::List ? "a add  e edit  d delete  ctrl+s save & recreate  esc back"
                                                                 : "tab key/value  enter apply  esc cancel";
                case ViewKind::About: return "q back";
            }
            return "";
        }

        Element render_sidebar(const AppState& s) {
            Elements items;
            const auto& views = main_views();
            for (int i = 0; i < (int)views.size(); ++i) {
                bool active = views[i] == s.current_view || (is_detail_view(s.current_view) && views[i] == s.previous_view
                                                             && s.current_view != ViewKind::About);
                auto item = text(fmt::format(" {} {} ", i + 1, view_title(views[i])));
                items.push_back(active ? item | bold | inverted : item);
            }
            items.push_back(filler());
            return vbox(std::move(items)) | border | size(WIDTH, EQUAL, 18);
        }

        Element render_header(const AppState& s) {
            std::string detail = s.ready ? fmt::format("{} containers", s.containers.items.size()) : "connecting...";
            if (!s.selected_container_name.empty()) detail += "  │  selected: " + s.selected_container_name;
            return hbox(text(" dock-watcher ") | bold | color(Color::Cyan), text(view_title(s.current_view)) | bold,
                        filler(), text(detail + " ") | color(Color::GrayDark));
        }

        Element render_footer(const AppState& s) {
            if (s.banner) {
                auto banner = text(" " + s.banner->text + " ");
                return s.banner->is_error ? banner | color(Color::Red) | bold : banner | color(Color::Green);
            }
            return text(" " + help_text(s) + " ") | color(Color::GrayDark);
        }

        Element render_view(const AppState& s) {
            switch (s.current_view) {
                case ViewKind::Containers: return render_containers(s.containers);
                case ViewKind::Images: return render_images(s.images);
                case ViewKind::Groups: return render_groups(s.groups);
                case ViewKind::Volumes: return render_volumes(s.volumes);
                case ViewKind::Compose: return render_compose(s.compose);
                case ViewKind::Networks: return render_networks(s.networks);
                case ViewKind::Logs: return render_logs(s.logs);
                case ViewKind::Stats: return render_stats(s.stats);
                case ViewKind::EnvVars: return render_env(s.env);
                case ViewKind::About: return render_about(s);
            }
            return text("");
        }

        Element render_modal(const Modal& m) {
            Elements lines;
            if (m.kind() == Modal::Kind::Confirm) {
                lines.push_back(text(m.message()));
                lines.push_back(text(""));
                lines.push_back(hbox(filler(), text(" [y] confirm ") | color(Color::Green), text(" [n] cancel ") | color(Color::Red)));
            } else {
                for (int i = 0; i < (int)m.fields().size(); ++i) {
                    const FormField& f = m.fields()[i];
                    bool focused = i == m.focus();
                    auto value = text(f.value + (focused ? "_" : "")) | flex;
                    auto label = cell(f.label + (f.required ? " *" : ""), 16) | bold;
                    lines.push_back(hbox(label, focused ? value | inverted : value));
                }
                if (!m.error().empty()) lines.push_back(text(m.error()) | color(Color::Red));
                lines.push_back(text(""));
                lines.push_back(text("tab next field  enter confirm  esc cancel") | dim);
            }
            return window(text(" " + m.title() + " "), vbox(std::move(lines))) | size(WIDTH, GREATER_THAN, 50) | clear_under | center;
        }

    }

    Element render(const AppState& state) {
        Element body;
        if (is_detail_view(state.current_view)) {
            body = render_view(state) | flex;
        } else {
            body = hbox(render_sidebar(state), render_view(state) | flex) | flex;
        }

        auto frame = vbox(render_header(state), separator(), body, render_footer(state));
        if (state.modal) return dbox({frame, render_modal(*state.modal)});
        return frame;
    }

    std::optional<Key> to_key(const ftxui::Event& event) {
        if (event == ftxui::Event::Return) return Key::named("enter");
        if (event == ftxui::Event::Escape) return Key::named("esc");
        if (event == ftxui::Event::Tab) return Key::named("tab");
        if (event == ftxui::Event::TabReverse) return Key::named("shift+tab");
        if (event == ftxui::Event::Backspace) return Key::named("backspace");
        if (event == ftxui::Event::Delete) return Key::named("delete");
        if (event == ftxui::Event::ArrowUp) return Key::named("up");
        if (event == ftxui::Event::ArrowDown) return Key::named("down");
        if (event == ftxui::Event::ArrowLeft) return Key::named("left");
        if (event == ftxui::Event::ArrowRight) return Key::named("right");
        if (event == ftxui::Event::Home) return Key::named("home");
        if (event == ftxui::Event::End) return Key::named("end");
        if (event == ftxui::Event::PageUp) return Key::named("pgup");
        if (event == ftxui::Event::PageDown) return Key::named("pgdn");
        if (event == ftxui::Event::Special("\x03")) return Key::named("ctrl+c");
        if (event == ftxui::Event::Special("\x13")) return Key::named("ctrl+s");
        if (event.is_character()) return Key::rune(event.character());
        return std::nullopt;
    }

}
