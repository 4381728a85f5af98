#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>

#include "orchestrator/event_loop.hpp"
#include "test_fakes.hpp"

using App::EventLoop;
using namespace std::chrono_literals;

TEST(EventLoop, RunsTasksInPostOrder) {
    EventLoop loop;
    std::vector<int> seen;
    for (int i = 0; i < 5; ++i) loop.post([&seen, i] { seen.push_back(i); });

    EXPECT_EQ(loop.pendingCount(), 5u);
    EXPECT_EQ(loop.runPending(), 5u);
    EXPECT_EQ(seen, (std::vector<int>{ 0, 1, 2, 3, 4 }));
    EXPECT_FALSE(loop.pumpOnce());
}

TEST(EventLoop, TasksPostedWhileDrainingWaitForNextRound) {
    EventLoop loop;
    int count = 0;
    loop.post([&] {
        ++count;
        loop.post([&] { ++count; });
    });

    EXPECT_EQ(loop.runPending(), 1u);
    EXPECT_EQ(count, 1);
    EXPECT_EQ(loop.runPending(), 1u);
    EXPECT_EQ(count, 2);
}

TEST(EventLoop, DelayedTasksRunWhenDue) {
    EventLoop loop;
    std::vector<std::string> seen;
    loop.postAfter(30ms, [&] { seen.push_back("late"); });
    loop.postAfter(5ms, [&] { seen.push_back("early"); });
    loop.post([&] { seen.push_back("now"); });

    loop.runPending();
    EXPECT_EQ(seen, (std::vector<std::string>{ "now" }));

    ASSERT_TRUE(TestFakes::waitFor([&] { loop.runPending(); return seen.size() == 3; }));
    EXPECT_EQ(seen, (std::vector<std::string>{ "now", "early", "late" }));
}

TEST(EventLoop, ThrowingTaskDoesNotStopTheLoop) {
    EventLoop loop;
    bool after = false;
    loop.post([] { throw std::runtime_error("boom"); });
    loop.post([&] { after = true; });

    EXPECT_EQ(loop.runPending(), 2u);
    EXPECT_TRUE(after);
}

TEST(EventLoop, ThreadRunsPostedAndDelayedTasks) {
    EventLoop loop;
    std::atomic<int> count{0};
    std::atomic<bool> onLoop{false};

    loop.start();
    EXPECT_TRUE(loop.running());

    loop.post([&] { onLoop = loop.isLoopThread(); ++count; });
    loop.postAfter(10ms, [&] { ++count; });

    EXPECT_TRUE(TestFakes::waitFor([&] { return count.load() == 2; }));
    EXPECT_TRUE(onLoop.load());
    EXPECT_FALSE(loop.isLoopThread());

    loop.stop();
    EXPECT_FALSE(loop.running());
}

TEST(EventLoop, StopDiscardsPendingWork) {
    EventLoop loop;
    std::atomic<int> count{0};
    loop.start();
    loop.postAfter(50ms, [&] { ++count; });
    loop.stop();

    std::this_thread::sleep_for(80ms);
    EXPECT_EQ(count.load(), 0);
    EXPECT_EQ(loop.pendingCount(), 0u);
}
