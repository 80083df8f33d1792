#include "fake_client.hpp"
#include "subscription.hpp"

#include <gtest/gtest.h>

using namespace DockWatch;

namespace {

    LogEntry entry(const std::string& text) {
        LogEntry e;
        e.line = text;
        e.timestamp = std::chrono::system_clock::now();
        return e;
    }

}

TEST(Subscription, FiveRecordsThenCloseYieldExactlyFiveEvents) {
    FakeClient client;
    for (int i = 0; i < 5; ++i) client.log_lines.push_back(entry("line " + std::to_string(i)));

    CancelToken root;
    auto sub = open_log_subscription(client, "abc", LogOptions{});

    int received = 0;
    while (true) {
        auto event = next_log_command(sub, root)();
        if (!event) break;
        auto* log = std::get_if<LogReceived>(&*event);
        ASSERT_NE(log, nullptr);
        EXPECT_EQ(log->sub_id, sub->id());
        EXPECT_EQ(log->entry.line, "line " + std::to_string(received));
        received++;
    }
    EXPECT_EQ(received, 5);
}

TEST(Subscription, ErrorBecomesStreamFailed) {
    FakeClient client;
    client.log_lines.push_back(entry("only line"));
    client.log_error = "container removed";

    CancelToken root;
    auto sub = open_log_subscription(client, "abc", LogOptions{});

    auto first = next_log_command(sub, root)();
    ASSERT_TRUE(first);
    EXPECT_TRUE(std::holds_alternative<LogReceived>(*first));

    auto second = next_log_command(sub, root)();
    ASSERT_TRUE(second);
    auto* failed = std::get_if<StreamFailed>(&*second);
    ASSERT_NE(failed, nullptr);
    EXPECT_EQ(failed->error, "container removed");
}

TEST(Subscription, CloseEndsPendingReceiveWithoutEvent) {
    FakeClient client;
    client.log_hold_open = true;

    CancelToken root;
    auto sub = open_log_subscription(client, "abc", LogOptions{});
    auto cmd = next_log_command(sub, root);

    std::thread closer([sub] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        sub->close();
    });
    EXPECT_FALSE(cmd());
    closer.join();
    EXPECT_TRUE(sub->closed());
}

TEST(Subscription, RootCancellationEndsReceive) {
    FakeClient client;
    client.log_hold_open = true;

    CancelToken root;
    auto sub = open_log_subscription(client, "abc", LogOptions{});
    root.cancel();
    EXPECT_FALSE(next_log_command(sub, root)());
    sub->close();
}

TEST(Subscription, StatsSamplesAreDelivered) {
    FakeClient client;
    ContainerStats s;
    s.container_id = "abc";
    s.cpu_percent = 12.5;
    client.stats_samples = {s, s};

    CancelToken root;
    auto sub = open_stats_subscription(client, "abc");
    EXPECT_EQ(sub->container_id(), "abc");

    int received = 0;
    while (auto event = next_stats_command(sub, root)()) {
        auto* stats = std::get_if<StatsReceived>(&*event);
        ASSERT_NE(stats, nullptr);
        EXPECT_DOUBLE_EQ(stats->stats.cpu_percent, 12.5);
        received++;
    }
    EXPECT_EQ(received, 2);
}

TEST(Subscription, IdsAreUnique) {
    FakeClient client;
    auto a = open_stats_subscription(client, "a");
    auto b = open_stats_subscription(client, "b");
    EXPECT_NE(a->id(), b->id());
}
