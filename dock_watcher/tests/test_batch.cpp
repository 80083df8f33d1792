#include "batch.hpp"
#include "fake_client.hpp"

#include <gtest/gtest.h>

#include <atomic>

using namespace DockWatch;

TEST(Batch, OneFailureDoesNotStopTheOthers) {
    FakeClient client;
    client.containers = {make_container("aaa", "a", "exited"), make_container("bbb", "b", "exited"),
                         make_container("ccc", "c", "exited")};
    client.fail("start:bbb", "port already allocated");

    CancelToken root;
    auto outcome = run_batch({"aaa", "bbb", "ccc"},
                             [&](const OpContext& ctx, const std::string& id) { client.start_container(ctx, id); },
                             OpContext::with_timeout(root, 5));

    EXPECT_EQ(outcome.total, 3u);
    EXPECT_EQ(outcome.succeeded(), 2u);
    ASSERT_EQ(outcome.failures.size(), 1u);
    EXPECT_EQ(outcome.failures[0].id, "bbb");
    EXPECT_EQ(outcome.failures[0].cause, "port already allocated");
    EXPECT_TRUE(client.called("start:aaa"));
    EXPECT_TRUE(client.called("start:ccc"));
    EXPECT_EQ(outcome.message(), "1 of 3 failed: bbb: port already allocated");
}

TEST(Batch, FailuresKeepTaskOrder) {
    CancelToken root;
    auto outcome = run_batch({"one", "two", "three"},
                             [](const OpContext&, const std::string& id) {
                                 if (id != "two") throw ClientError(id + " failed");
                             },
                             OpContext::with_timeout(root, 5));

    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failed_ids(), (std::vector<std::string>{"one", "three"}));
}

TEST(Batch, AllSucceeded) {
    std::atomic<int> runs{0};
    CancelToken root;
    auto outcome = run_batch({"x", "y"}, [&](const OpContext&, const std::string&) { runs++; },
                             OpContext::with_timeout(root, 5));
    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(runs, 2);
    EXPECT_EQ(outcome.message(), "2 of 2 succeeded");
}

TEST(Batch, EmptyBatch) {
    CancelToken root;
    auto outcome = run_batch({}, [](const OpContext&, const std::string&) {}, OpContext::with_timeout(root, 5));
    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.total, 0u);
}
