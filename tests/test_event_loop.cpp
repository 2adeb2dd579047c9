#include <gtest/gtest.h>
#include <scenebridge/core/event_loop.hpp>

#include <stdexcept>
#include <thread>
#include <vector>

using namespace scenebridge;

TEST(EventLoopTest, RunsPostedTasksInOrder) {
    EventLoop loop;
    std::vector<int> order;
    loop.post([&]() { order.push_back(1); });
    loop.post([&]() { order.push_back(2); });

    EXPECT_EQ(loop.pendingCount(), 2u);
    EXPECT_EQ(loop.runPending(), 2u);
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
    EXPECT_EQ(loop.pendingCount(), 0u);
}

TEST(EventLoopTest, TaskPostedWhileDrainingWaitsForNextRun) {
    EventLoop loop;
    int runs = 0;
    loop.post([&]() {
        ++runs;
        loop.post([&]() { ++runs; });
    });

    EXPECT_EQ(loop.runPending(), 1u);
    EXPECT_EQ(runs, 1);
    EXPECT_EQ(loop.runPending(), 1u);
    EXPECT_EQ(runs, 2);
}

TEST(EventLoopTest, ThrowingTaskDoesNotStopTheBatch) {
    EventLoop loop;
    bool after = false;
    loop.post([]() { throw std::runtime_error("task failed"); });
    loop.post([&]() { after = true; });

    EXPECT_EQ(loop.runPending(), 2u);
    EXPECT_TRUE(after);
}

TEST(EventLoopTest, EmptyTaskIgnored) {
    EventLoop loop;
    loop.post(EventLoop::Task());
    EXPECT_EQ(loop.pendingCount(), 0u);
}

TEST(EventLoopTest, WaitForWakesOnPostFromWorker) {
    EventLoop loop;
    bool ran = false;

    std::thread worker([&loop, &ran]() {
        loop.post([&ran]() { ran = true; });
    });

    bool pending = false;
    for (int i = 0; i < 100 && !pending; ++i) {
        pending = loop.waitFor(Milliseconds(50));
    }
    worker.join();

    EXPECT_TRUE(pending);
    loop.runPending();
    EXPECT_TRUE(ran);
}

TEST(EventLoopTest, WaitForTimesOutWhenIdle) {
    EventLoop loop;
    EXPECT_FALSE(loop.waitFor(Milliseconds(1)));
}
