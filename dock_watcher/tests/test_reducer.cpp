#include "fake_client.hpp"
#include "group_store.hpp"
#include "reducer.hpp"
#include "subscription.hpp"

#include <gtest/gtest.h>

#include <deque>

using namespace DockWatch;

namespace {

    class ReducerTest : public ::testing::Test {
    protected:
        ReducerTest()
            : client(std::make_shared<FakeClient>()), store(GroupStore::in_memory()),
              reducer(Services{client, store, AppConfig{}, CancelToken()}) {
            client->containers = {make_container("aaa111", "web"), make_container("bbb222", "db", "exited")};
            reducer.reduce(state, Resized{120, 40});
        }

        void press(const std::string& name) {
            Key key = name.size() == 1 ? Key::rune(name) : Key::named(name);
            pending_ = reducer.reduce(state, KeyPressed{key});
        }

        // Runs the pending commands inline, feeding every event back in,
        // until nothing is left or `limit` events were reduced.
        int settle(int limit = 100) {
            std::deque<Command> queue(pending_.begin(), pending_.end());
            pending_.clear();
            int reduced = 0;
            while (!queue.empty() && reduced < limit) {
                Command cmd = std::move(queue.front());
                queue.pop_front();
                auto event = cmd();
                if (!event) continue;
                reduced++;
                for (auto& next : reducer.reduce(state, *event)) queue.push_back(std::move(next));
            }
            return reduced;
        }

        void load() {
            pending_ = reducer.start(state);
            settle();
        }

        std::shared_ptr<FakeClient> client;
        std::shared_ptr<GroupStore> store;
        Reducer reducer;
        AppState state;
        std::vector<Command> pending_;
    };

}

// --- Startup ---

TEST_F(ReducerTest, StartLoadsEveryListing) {
    load();
    EXPECT_TRUE(state.ready);
    EXPECT_EQ(state.containers.items.size(), 2u);
    EXPECT_TRUE(client->called("list_images"));
    EXPECT_TRUE(client->called("list_volumes"));
    EXPECT_TRUE(client->called("list_networks"));
    EXPECT_TRUE(client->called("list_compose"));
}

TEST_F(ReducerTest, ListingErrorKeepsPreviousItems) {
    load();
    client->fail("list_containers", "daemon timeout");
    pending_ = {Commands::fetch_containers(reducer.services())};
    settle();
    EXPECT_EQ(state.containers.items.size(), 2u);
    ASSERT_TRUE(state.banner);
    EXPECT_TRUE(state.banner->is_error);
}

// --- Confirmation ---

TEST_F(ReducerTest, CancelledDeleteLeavesNoTrace) {
    load();
    size_t calls = client->call_count();

    press("d");
    ASSERT_TRUE(state.modal);
    ASSERT_TRUE(state.pending);
    EXPECT_EQ(state.pending->target, "aaa111");

    press("n");
    EXPECT_FALSE(state.modal);
    EXPECT_FALSE(state.pending);
    EXPECT_TRUE(pending_.empty());
    EXPECT_EQ(client->call_count(), calls);
}

TEST_F(ReducerTest, ConfirmedDeleteRemovesAndForgetsMembership) {
    load();
    auto group = store->create("stack", "", {"aaa111", "bbb222"});

    press("d");
    press("y");
    EXPECT_FALSE(state.modal);
    settle();

    EXPECT_TRUE(client->called("remove:aaa111"));
    EXPECT_EQ(state.containers.items.size(), 1u);
    EXPECT_EQ(store->get(group.id)->container_ids, (std::vector<std::string>{"bbb222"}));
}

TEST_F(ReducerTest, ModalSwallowsGlobalKeys) {
    load();
    press("d");
    press("q");
    EXPECT_FALSE(state.quit);
    EXPECT_TRUE(state.modal);
}

// --- Navigation ---

TEST_F(ReducerTest, QuitFromMainView) {
    press("q");
    EXPECT_TRUE(state.quit);
}

TEST_F(ReducerTest, TabCyclesMainViewsWithWrap) {
    press("shift+tab");
    EXPECT_EQ(state.current_view, ViewKind::About);
    press("tab");
    EXPECT_EQ(state.current_view, ViewKind::Containers);
    press("tab");
    EXPECT_EQ(state.current_view, ViewKind::Images);
}

TEST_F(ReducerTest, DigitsSelectViews) {
    press("6");
    EXPECT_EQ(state.current_view, ViewKind::Networks);
    EXPECT_EQ(pending_.size(), 2u);
    press("3");
    EXPECT_EQ(state.current_view, ViewKind::Groups);
    press("9");
    EXPECT_EQ(state.current_view, ViewKind::Groups);
}

TEST_F(ReducerTest, DetailViewReturnsWithEscAndQ) {
    press("2");
    press("?");
    EXPECT_EQ(state.current_view, ViewKind::About);
    press("esc");
    EXPECT_EQ(state.current_view, ViewKind::Images);

    press("?");
    press("q");
    EXPECT_EQ(state.current_view, ViewKind::Containers);
    EXPECT_FALSE(state.quit);
}

TEST_F(ReducerTest, FilterModeCapturesEveryKey) {
    load();
    press("/");
    press("q");
    press("w");
    EXPECT_FALSE(state.quit);
    EXPECT_EQ(state.containers.list.filter(), "qw");
    press("esc");
    EXPECT_FALSE(state.containers.is_filtering());
    EXPECT_EQ(state.current_view, ViewKind::Containers);
}

TEST_F(ReducerTest, EscInsideGroupTabsGoesBackToGroupList) {
    load();
    store->create("stack", "", {"aaa111"});
    pending_ = {Commands::fetch_groups(reducer.services())};
    settle();

    press("3");
    press("enter");
    EXPECT_EQ(state.groups.tab, GroupsView::Members);
    press("esc");
    EXPECT_EQ(state.groups.tab, GroupsView::GroupList);
    EXPECT_EQ(state.current_view, ViewKind::Groups);
}

// --- Tick ---

TEST_F(ReducerTest, TickExpiresBannerAndRefreshes) {
    load();
    state.banner = Banner{"hello", false, Clock::now()};
    auto cmds = reducer.reduce(state, Tick{Clock::now() + std::chrono::seconds(10)});
    EXPECT_FALSE(state.banner);
    EXPECT_EQ(cmds.size(), 1u);

    auto again = reducer.reduce(state, Tick{state.last_refresh + std::chrono::milliseconds(10)});
    EXPECT_TRUE(again.empty());
}

TEST_F(ReducerTest, NoRefreshWhileModalOpen) {
    load();
    press("d");
    auto cmds = reducer.reduce(state, Tick{Clock::now() + std::chrono::seconds(10)});
    EXPECT_TRUE(cmds.empty());
}

// --- Containers ---

TEST_F(ReducerTest, ShellRefusedForStoppedContainer) {
    load();
    press("down");
    press("e");
    EXPECT_FALSE(state.shell_request);
    ASSERT_TRUE(state.banner);
    EXPECT_TRUE(state.banner->is_error);

    press("up");
    press("e");
    ASSERT_TRUE(state.shell_request);
    EXPECT_EQ(state.shell_request->container_id, "aaa111");
}

TEST_F(ReducerTest, StartReportsFailureInBanner) {
    load();
    client->fail("start:bbb222", "no such image");
    press("down");
    press("s");
    settle();
    ASSERT_TRUE(state.banner);
    EXPECT_TRUE(state.banner->is_error);
    EXPECT_NE(state.banner->text.find("no such image"), std::string::npos);
}

TEST_F(ReducerTest, GroupBatchReportsPartialFailure) {
    load();
    store->create("stack", "", {"aaa111", "bbb222"});
    client->fail("start:bbb222", "port in use");
    pending_ = {Commands::fetch_groups(reducer.services())};
    settle();

    press("3");
    press("s");
    settle();
    EXPECT_TRUE(client->called("start:aaa111"));
    ASSERT_TRUE(state.banner);
    EXPECT_TRUE(state.banner->is_error);
    EXPECT_NE(state.banner->text.find("1 of 2 failed"), std::string::npos);
}

// --- Streams ---

TEST_F(ReducerTest, LogsStreamIntoTheView) {
    load();
    for (int i = 0; i < 3; ++i) client->log_lines.push_back(LogEntry{"line", std::chrono::system_clock::now(), false});

    press("l");
    EXPECT_EQ(state.current_view, ViewKind::Logs);
    EXPECT_EQ(state.logs.container_id, "aaa111");
    settle();
    EXPECT_EQ(state.logs.lines.size(), 3u);
    EXPECT_TRUE(client->called("logs:aaa111"));
}

TEST_F(ReducerTest, EveryLogItemRearmsExactlyOnce) {
    load();
    const int n = 4;
    for (int i = 0; i < n; ++i) {
        client->log_lines.push_back(LogEntry{"line " + std::to_string(i), std::chrono::system_clock::now(), false});
    }

    press("l");
    ASSERT_EQ(pending_.size(), 1u);
    auto opened = pending_.front()();
    ASSERT_TRUE(opened);
    auto cmds = reducer.reduce(state, *opened);
    ASSERT_EQ(cmds.size(), 1u);

    for (int i = 0; i < n; ++i) {
        auto event = cmds.front()();
        ASSERT_TRUE(event);
        ASSERT_TRUE(std::holds_alternative<LogReceived>(*event));
        cmds = reducer.reduce(state, *event);
        ASSERT_EQ(cmds.size(), 1u) << "item " << i;
    }
    EXPECT_EQ(state.logs.lines.size(), (size_t)n);

    // Clean end of stream: the pending receive yields nothing to reduce
    EXPECT_FALSE(cmds.front()());

    uint64_t id = state.logs.sub->id();
    reducer.teardown(state);
    EXPECT_TRUE(reducer.reduce(state, LogReceived{id, LogEntry{"late", std::chrono::system_clock::now(), false}}).empty());
}

TEST_F(ReducerTest, EveryStatsSampleRearmsExactlyOnce) {
    load();
    const int n = 3;
    for (int i = 0; i < n; ++i) {
        ContainerStats sample;
        sample.container_id = "aaa111";
        sample.cpu_percent = 10.0 * (i + 1);
        client->stats_samples.push_back(sample);
    }

    press("t");
    EXPECT_EQ(state.current_view, ViewKind::Stats);
    ASSERT_EQ(pending_.size(), 1u);
    auto opened = pending_.front()();
    ASSERT_TRUE(opened);
    auto cmds = reducer.reduce(state, *opened);
    ASSERT_EQ(cmds.size(), 1u);

    for (int i = 0; i < n; ++i) {
        auto event = cmds.front()();
        ASSERT_TRUE(event);
        ASSERT_TRUE(std::holds_alternative<StatsReceived>(*event));
        cmds = reducer.reduce(state, *event);
        ASSERT_EQ(cmds.size(), 1u) << "sample " << i;
    }
    EXPECT_EQ(state.stats.cpu_history.size(), (size_t)n);
    ASSERT_TRUE(state.stats.latest);
    EXPECT_DOUBLE_EQ(state.stats.latest->cpu_percent, 30.0);

    EXPECT_FALSE(cmds.front()());

    uint64_t id = state.stats.sub->id();
    reducer.teardown(state);
    EXPECT_TRUE(reducer.reduce(state, StatsReceived{id, ContainerStats{}}).empty());
}

TEST_F(ReducerTest, LeavingLogsClosesTheSubscription) {
    load();
    client->log_hold_open = true;

    press("l");
    // Open the stream but do not start receiving
    ASSERT_EQ(pending_.size(), 1u);
    auto opened = pending_.front()();
    ASSERT_TRUE(opened);
    pending_ = reducer.reduce(state, *opened);
    ASSERT_TRUE(state.logs.sub);
    auto sub = state.logs.sub;

    press("esc");
    EXPECT_EQ(state.current_view, ViewKind::Containers);
    EXPECT_FALSE(state.logs.sub);
    EXPECT_TRUE(sub->closed());
}

TEST_F(ReducerTest, StaleStreamEventsAreDropped) {
    load();
    press("l");
    auto cmds = reducer.reduce(state, LogReceived{987654, LogEntry{"ghost", std::chrono::system_clock::now(), false}});
    EXPECT_TRUE(cmds.empty());
    EXPECT_TRUE(state.logs.lines.empty());

    cmds = reducer.reduce(state, StreamFailed{987654, "gone"});
    EXPECT_TRUE(cmds.empty());
    EXPECT_FALSE(state.banner && state.banner->is_error);
}

TEST_F(ReducerTest, LateStreamOpenIsClosed) {
    load();
    client->log_hold_open = true;
    auto sub = open_log_subscription(*client, "aaa111", LogOptions{});

    // Still on the containers view
    auto cmds = reducer.reduce(state, LogStreamOpened{"aaa111", sub, ""});
    EXPECT_TRUE(cmds.empty());
    EXPECT_TRUE(sub->closed());
}

TEST_F(ReducerTest, StreamFailureShowsError) {
    load();
    client->log_error = "container gone";
    press("l");
    settle();
    EXPECT_FALSE(state.logs.sub);
    EXPECT_EQ(state.logs.error, "container gone");
    ASSERT_TRUE(state.banner);
    EXPECT_TRUE(state.banner->is_error);
}

// --- Networks ---

TEST_F(ReducerTest, SystemNetworkCannotBeDeleted) {
    Network bridge;
    bridge.id = "n0";
    bridge.name = "bridge";
    client->networks = {bridge};
    load();

    press("6");
    press("d");
    EXPECT_FALSE(state.modal);
    ASSERT_TRUE(state.banner);
    EXPECT_TRUE(state.banner->is_error);
}

// --- Environment ---

TEST_F(ReducerTest, RecreateMovesGroupMembershipToNewContainer) {
    ContainerFullConfig cfg;
    cfg.name = "web";
    cfg.image = "nginx:latest";
    cfg.env = {"MODE=dev"};
    client->configs["aaa111"] = cfg;
    load();
    auto group = store->create("stack", "", {"aaa111"});

    press("v");
    EXPECT_EQ(state.current_view, ViewKind::EnvVars);
    settle();
    ASSERT_TRUE(state.env.loaded);
    ASSERT_EQ(state.env.vars.size(), 1u);

    // Add NEW=1
    press("a");
    press("N");
    press("E");
    press("W");
    press("tab");
    press("1");
    press("enter");
    EXPECT_TRUE(state.env.dirty);
    EXPECT_EQ(state.env.vars.size(), 2u);

    press("ctrl+s");
    ASSERT_TRUE(state.modal);
    press("y");
    settle();

    EXPECT_TRUE(client->called("remove:aaa111"));
    EXPECT_TRUE(client->called("start:new-web"));
    EXPECT_EQ(client->created_config.env, (std::vector<std::string>{"MODE=dev", "NEW=1"}));
    EXPECT_EQ(store->get(group.id)->container_ids, (std::vector<std::string>{"new-web"}));
    EXPECT_EQ(state.current_view, ViewKind::Containers);
    ASSERT_TRUE(state.banner);
    EXPECT_FALSE(state.banner->is_error);
}

TEST_F(ReducerTest, SaveWithoutChangesDoesNothing) {
    ContainerFullConfig cfg;
    cfg.name = "web";
    cfg.image = "nginx:latest";
    client->configs["aaa111"] = cfg;
    load();

    press("v");
    settle();
    press("ctrl+s");
    EXPECT_FALSE(state.modal);
}
