#include "fake_client.hpp"
#include "views.hpp"

#include <gtest/gtest.h>

using namespace DockWatch;

namespace {

    Group make_group(const std::string& id, const std::string& name, std::vector<std::string> members) {
        Group g;
        g.id = id;
        g.name = name;
        g.container_ids = std::move(members);
        return g;
    }

    ComposeProject make_project() {
        ComposeProject p;
        p.name = "shop";
        Container web1 = make_container("w1", "shop-web-1");
        Container web2 = make_container("w2", "shop-web-2");
        Container db = make_container("d1", "shop-db-1");
        p.services = {{"web", {web1, web2}}, {"db", {db}}};
        p.container_ids = {"w1", "w2", "d1"};
        return p;
    }

}

// --- Containers ---

TEST(ContainersView, SelectionFollowsIdAcrossRefresh) {
    ContainersView v;
    v.set_size(120, 40);
    v.set_items({make_container("a", "alpha"), make_container("b", "beta"), make_container("c", "gamma")});
    v.handle_key(Key::named("down"));
    ASSERT_EQ(v.selected()->id, "b");

    v.set_items({make_container("z", "zeta"), make_container("a", "alpha"), make_container("b", "beta")});
    EXPECT_EQ(v.selected()->id, "b");
}

TEST(ContainersView, FilterNarrowsVisibleRows) {
    ContainersView v;
    v.set_items({make_container("a", "web"), make_container("b", "db"), make_container("c", "webhook")});
    v.handle_key(Key::rune("/"));
    for (char ch : std::string("web")) v.handle_filter_key(Key::rune(std::string(1, ch)));
    EXPECT_EQ(v.visible().size(), 2u);
    EXPECT_EQ(v.list.count(), 2);
}

TEST(ContainersView, ActionKeysBecomeIntents) {
    ContainersView v;
    v.set_items({make_container("a", "web")});
    auto intent = v.handle_key(Key::rune("x"));
    EXPECT_EQ(intent.kind, IntentKind::Stop);
    EXPECT_EQ(intent.id, "a");
    EXPECT_EQ(v.handle_key(Key::rune("v")).kind, IntentKind::EditEnv);
    EXPECT_TRUE(v.handle_key(Key::rune("z")).none());
}

TEST(ContainersView, EmptyListProducesNoIntent) {
    ContainersView v;
    EXPECT_TRUE(v.handle_key(Key::rune("d")).none());
}

// --- Groups ---

TEST(GroupsView, TabsWrapInBothDirections) {
    GroupsView v;
    v.set_groups({make_group("g1", "stack", {})});
    v.handle_key(Key::named("left"));
    EXPECT_EQ(v.tab, GroupsView::Available);
    v.handle_key(Key::named("right"));
    EXPECT_EQ(v.tab, GroupsView::GroupList);
    v.handle_key(Key::named("right"));
    EXPECT_EQ(v.tab, GroupsView::Members);
}

TEST(GroupsView, LeavingGroupListSetsParent) {
    GroupsView v;
    v.set_groups({make_group("g1", "stack", {"a"})});
    v.set_containers({make_container("a", "web"), make_container("b", "db")});
    v.cycle_tab(1);
    ASSERT_NE(v.parent(), nullptr);
    EXPECT_EQ(v.parent()->id, "g1");
    EXPECT_EQ(v.members().size(), 1u);
    ASSERT_EQ(v.available().size(), 1u);
    EXPECT_EQ(v.available()[0].id, "b");
}

TEST(GroupsView, MissingMembersAreShown) {
    GroupsView v;
    v.set_groups({make_group("g1", "stack", {"a", "gone0123456789"})});
    v.set_containers({make_container("a", "web")});
    v.handle_key(Key::named("enter"));
    auto members = v.members();
    ASSERT_EQ(members.size(), 2u);
    EXPECT_EQ(members[1].state, "missing");
    EXPECT_EQ(members[1].name, "gone01234567");
}

TEST(GroupsView, DeletedParentClearsDrillDown) {
    GroupsView v;
    v.set_groups({make_group("g1", "stack", {"a"}), make_group("g2", "other", {})});
    v.set_containers({make_container("a", "web")});
    v.handle_key(Key::named("enter"));
    ASSERT_EQ(v.tab, GroupsView::Members);
    ASSERT_EQ(v.parent_id, "g1");

    v.set_groups({make_group("g2", "other", {})});
    EXPECT_TRUE(v.parent_id.empty());
    EXPECT_EQ(v.parent(), nullptr);
    EXPECT_TRUE(v.members().empty());
    EXPECT_TRUE(v.handle_key(Key::rune("u")).none());
}

TEST(GroupsView, MemberAndAvailableIntents) {
    GroupsView v;
    v.set_groups({make_group("g1", "stack", {"a"})});
    v.set_containers({make_container("a", "web"), make_container("b", "db")});
    v.handle_key(Key::named("enter"));

    auto unlink = v.handle_key(Key::rune("u"));
    EXPECT_EQ(unlink.kind, IntentKind::RemoveFromGroup);
    EXPECT_EQ(unlink.id, "a");
    EXPECT_EQ(unlink.parent_id, "g1");

    auto stop = v.handle_key(Key::rune("x"));
    EXPECT_EQ(stop.kind, IntentKind::Stop);
    EXPECT_EQ(stop.parent_name, "stack");

    v.handle_key(Key::named("right"));
    auto add = v.handle_key(Key::named("enter"));
    EXPECT_EQ(add.kind, IntentKind::AddToGroup);
    EXPECT_EQ(add.id, "b");
    EXPECT_EQ(add.parent_id, "g1");
}

TEST(GroupsView, GroupListIntents) {
    GroupsView v;
    EXPECT_EQ(v.handle_key(Key::rune("n")).kind, IntentKind::CreateGroup);
    EXPECT_TRUE(v.handle_key(Key::rune("s")).none());

    v.set_groups({make_group("g1", "stack", {})});
    EXPECT_EQ(v.handle_key(Key::rune("s")).kind, IntentKind::StartGroup);
    EXPECT_EQ(v.handle_key(Key::rune("d")).kind, IntentKind::DeleteGroup);
}

// --- Networks ---

TEST(NetworksView, AttachedUsesBothSources) {
    Network net;
    net.id = "n1";
    net.name = "backend";
    net.containers = {"a"};

    Container b = make_container("b", "api");
    b.networks = {"backend"};

    NetworksView v;
    v.set_networks({net});
    v.set_containers({make_container("a", "db"), b, make_container("c", "cache")});
    v.handle_key(Key::named("enter"));

    EXPECT_EQ(v.tab, NetworksView::Attached);
    EXPECT_EQ(v.attached().size(), 2u);
    ASSERT_EQ(v.available().size(), 1u);
    EXPECT_EQ(v.available()[0].id, "c");

    auto disconnect = v.handle_key(Key::rune("u"));
    EXPECT_EQ(disconnect.kind, IntentKind::Disconnect);
    EXPECT_EQ(disconnect.parent_id, "n1");

    v.handle_key(Key::named("right"));
    auto connect = v.handle_key(Key::named("enter"));
    EXPECT_EQ(connect.kind, IntentKind::Connect);
    EXPECT_EQ(connect.id, "c");
}

TEST(NetworksView, RemovedNetworkResetsTabs) {
    Network net;
    net.id = "n1";
    net.name = "backend";
    NetworksView v;
    v.set_networks({net});
    v.handle_key(Key::named("enter"));
    ASSERT_EQ(v.parent_id, "n1");

    v.set_networks({});
    EXPECT_TRUE(v.parent_id.empty());
    EXPECT_TRUE(v.attached().empty());
}

// --- Compose ---

TEST(ComposeView, DrillDownAndBack) {
    ComposeView v;
    v.set_projects({make_project()});

    v.handle_key(Key::named("enter"));
    EXPECT_EQ(v.level, ComposeView::Services);
    EXPECT_EQ(v.project_name, "shop");
    ASSERT_NE(v.highlighted_service(), nullptr);
    EXPECT_EQ(v.highlighted_service()->name, "web");

    // Scaled service: container actions need the replica level
    EXPECT_TRUE(v.handle_key(Key::rune("s")).none());
    v.handle_key(Key::named("enter"));
    EXPECT_EQ(v.level, ComposeView::Replicas);
    EXPECT_EQ(v.visible_replicas().size(), 2u);
    auto intent = v.handle_key(Key::rune("s"));
    EXPECT_EQ(intent.kind, IntentKind::Start);
    EXPECT_EQ(intent.id, "w1");

    v.handle_key(Key::named("esc"));
    EXPECT_EQ(v.level, ComposeView::Services);
    v.handle_key(Key::named("esc"));
    EXPECT_EQ(v.level, ComposeView::Projects);
    EXPECT_TRUE(v.project_name.empty());
}

TEST(ComposeView, SingleContainerServiceTakesActions) {
    ComposeView v;
    v.set_projects({make_project()});
    v.handle_key(Key::named("enter"));
    v.handle_key(Key::named("down"));
    ASSERT_EQ(v.highlighted_service()->name, "db");

    v.handle_key(Key::named("enter"));
    EXPECT_EQ(v.level, ComposeView::Services);
    auto intent = v.handle_key(Key::rune("r"));
    EXPECT_EQ(intent.kind, IntentKind::Restart);
    EXPECT_EQ(intent.id, "d1");
}

TEST(ComposeView, ProjectActions) {
    ComposeView v;
    v.set_projects({make_project()});
    auto intent = v.handle_key(Key::rune("x"));
    EXPECT_EQ(intent.kind, IntentKind::StopProject);
    EXPECT_EQ(intent.id, "shop");
}

TEST(ComposeView, VanishedProjectReturnsToTop) {
    ComposeView v;
    v.set_projects({make_project()});
    v.handle_key(Key::named("enter"));
    v.handle_key(Key::named("enter"));
    ASSERT_EQ(v.level, ComposeView::Replicas);

    v.set_projects({});
    EXPECT_EQ(v.level, ComposeView::Projects);
    EXPECT_TRUE(v.project_name.empty());
    EXPECT_TRUE(v.service_name.empty());
}

// --- Logs / stats ---

TEST(LogsView, BufferIsCapped) {
    LogsView v;
    v.open("a", "web", 3);
    for (int i = 0; i < 5; ++i) v.append(LogEntry{std::to_string(i), std::chrono::system_clock::now(), false});
    ASSERT_EQ(v.lines.size(), 3u);
    EXPECT_EQ(v.lines.front().line, "2");
}

TEST(LogsView, ScrollingStopsFollow) {
    LogsView v;
    v.open("a", "web", 100);
    v.set_size(80, 16); // page of 10
    for (int i = 0; i < 30; ++i) v.append(LogEntry{std::to_string(i), std::chrono::system_clock::now(), false});
    EXPECT_EQ(v.first_visible(), 20);

    v.handle_key(Key::named("up"));
    EXPECT_FALSE(v.follow);
    EXPECT_EQ(v.first_visible(), 19);

    v.append(LogEntry{"new", std::chrono::system_clock::now(), false});
    EXPECT_EQ(v.first_visible(), 19);

    v.handle_key(Key::rune("G"));
    EXPECT_TRUE(v.follow);
    EXPECT_EQ(v.first_visible(), 21);

    v.handle_key(Key::rune("g"));
    EXPECT_EQ(v.first_visible(), 0);
}

TEST(StatsView, HistoryIsCapped) {
    StatsView v;
    v.open("a", "web", 2);
    for (int i = 1; i <= 3; ++i) {
        ContainerStats s;
        s.cpu_percent = i * 10.0;
        v.add(s);
    }
    EXPECT_EQ(v.cpu_history.size(), 2u);
    EXPECT_DOUBLE_EQ(v.cpu_history.front(), 20.0);
    EXPECT_DOUBLE_EQ(v.latest->cpu_percent, 30.0);
}

// --- Environment ---

TEST(EnvVarsView, EditingValidatesKeys) {
    ContainerFullConfig cfg;
    cfg.env = {"A=1", "B=two=2"};

    EnvVarsView v;
    v.open("a", "web");
    v.load(cfg);
    ASSERT_EQ(v.vars.size(), 2u);
    EXPECT_EQ(v.vars[1].value, "two=2");

    v.handle_key(Key::rune("a"));
    EXPECT_TRUE(v.is_filtering());
    v.handle_filter_key(Key::rune("A"));
    v.handle_filter_key(Key::named("enter"));
    EXPECT_EQ(v.error, "A is already defined");
    EXPECT_TRUE(v.is_filtering());

    v.handle_filter_key(Key::named("esc"));
    EXPECT_FALSE(v.is_filtering());
    EXPECT_FALSE(v.dirty);
}

TEST(EnvVarsView, DeleteAndEditMarkDirty) {
    ContainerFullConfig cfg;
    cfg.env = {"A=1", "B=2"};

    EnvVarsView v;
    v.open("a", "web");
    v.load(cfg);

    v.handle_key(Key::rune("d"));
    EXPECT_TRUE(v.dirty);
    ASSERT_EQ(v.vars.size(), 1u);

    v.handle_key(Key::rune("e"));
    v.handle_filter_key(Key::named("backspace"));
    v.handle_filter_key(Key::rune("9"));
    v.handle_filter_key(Key::named("enter"));
    EXPECT_EQ(v.edited_config().env, (std::vector<std::string>{"B=9"}));
}

TEST(EnvVarsView, SlashDoesNotStartAFilter) {
    ContainerFullConfig cfg;
    cfg.env = {"A=1"};

    EnvVarsView v;
    v.open("a", "web");
    v.load(cfg);
    v.handle_key(Key::rune("/"));
    EXPECT_FALSE(v.list.filtering());
    EXPECT_FALSE(v.is_filtering());

    v.handle_key(Key::rune("a"));
    EXPECT_EQ(v.mode, EnvVarsView::Mode::EditKey);
}

TEST(EnvVarsView, SaveIntentOnlyWhenLoaded) {
    EnvVarsView v;
    v.open("a", "web");
    EXPECT_TRUE(v.handle_key(Key::named("ctrl+s")).none());
    v.load(ContainerFullConfig{});
    EXPECT_EQ(v.handle_key(Key::named("ctrl+s")).kind, IntentKind::SaveEnv);
}
