#include <gtest/gtest.h>
#include "engine/ControlLoop.hpp"
#include "source/ReplayEventSource.hpp"
#include <chrono>
#include <functional>
#include <limits>
#include <thread>

using namespace fence;

namespace {

bool WaitUntil(const std::function<bool()>& condition,
               std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

PolicyConfig EtcPolicy(uint32_t threshold, uint32_t target_pid = kAllPids) {
    PolicyConfig policy;
    policy.disallowed_patterns = {"/etc/*"};
    policy.threshold = threshold;
    policy.target_pid = target_pid;
    return policy;
}

} // namespace

class ControlLoopTest : public ::testing::Test {
protected:
    CancellationToken cancel;
    ActionResult run_result{false, "not run"};
    std::thread loop_thread;

    void StartLoop(ControlLoop& loop) {
        loop_thread = std::thread([this, &loop]() { run_result = loop.Run(cancel); });
    }

    void StopLoop() {
        cancel.Cancel();
        if (loop_thread.joinable()) {
            loop_thread.join();
        }
    }

    void TearDown() override {
        StopLoop();
    }
};

TEST_F(ControlLoopTest, ProcessesEveryEventThenWaitsForCancellation) {
    ReplayEventSource source({
        AccessEvent(1234, 1000, "cat", "/etc/passwd"),
        AccessEvent(1234, 1000, "cat", "/home/safe.txt"),
        AccessEvent(1234, 1000, "cat", "/etc/shadow"),
    });
    DecisionEngine engine(EtcPolicy(2), source);
    ControlLoop loop(source, engine);

    StartLoop(loop);
    ASSERT_TRUE(WaitUntil([&] { return loop.GetEventsProcessed() == 3; }));

    // The source is exhausted; the loop stays parked in Next().
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_TRUE(loop.IsRunning());
    EXPECT_EQ(loop.GetReadErrors(), 0u);

    StopLoop();

    EXPECT_TRUE(run_result.success);
    EXPECT_FALSE(loop.IsRunning());
    EXPECT_EQ(engine.GetViolationCount(1234), 2u);
    EXPECT_TRUE(engine.IsBlocked(1234));
    EXPECT_EQ(source.GetBlockCallCount(1234), 1u);
}

TEST_F(ControlLoopTest, CancelledBeforeStartReturnsCleanly) {
    ReplayEventSource source(std::vector<AccessEvent>{});
    DecisionEngine engine(EtcPolicy(2), source);
    ControlLoop loop(source, engine);

    cancel.Cancel();
    ActionResult result = loop.Run(cancel);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(loop.GetEventsProcessed(), 0u);
}

TEST_F(ControlLoopTest, CancellationWithPendingEventsIsNotAnError) {
    ReplayEventSource source({
        AccessEvent(1, 0, "a", "/etc/passwd"),
        AccessEvent(1, 0, "a", "/etc/shadow"),
    });
    DecisionEngine engine(EtcPolicy(2), source);
    ControlLoop loop(source, engine);

    cancel.Cancel();
    ActionResult result = loop.Run(cancel);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(source.GetRemainingEvents(), 2u);
    EXPECT_EQ(engine.GetViolationCount(), 0u);
}

TEST_F(ControlLoopTest, CancellationWhileParkedOnEmptySource) {
    ReplayEventSource source(std::vector<AccessEvent>{});
    DecisionEngine engine(EtcPolicy(2), source);
    ControlLoop loop(source, engine);

    StartLoop(loop);
    ASSERT_TRUE(WaitUntil([&] { return loop.IsRunning(); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    StopLoop();
    EXPECT_TRUE(run_result.success);
    EXPECT_EQ(loop.GetReadErrors(), 0u);
}

TEST_F(ControlLoopTest, PersistentReadFailureKeepsLoopAlive) {
    ReplayEventSource source({AccessEvent(7, 0, "x", "/etc/passwd")});
    source.FailNextReads(std::numeric_limits<size_t>::max());
    DecisionEngine engine(EtcPolicy(1), source);
    ControlLoop loop(source, engine);

    StartLoop(loop);

    // No backoff and no error budget: errors pile up while the loop runs.
    ASSERT_TRUE(WaitUntil([&] { return loop.GetReadErrors() >= 200; }));
    EXPECT_TRUE(loop.IsRunning());
    EXPECT_EQ(loop.GetEventsProcessed(), 0u);

    StopLoop();
    EXPECT_TRUE(run_result.success);
}

TEST_F(ControlLoopTest, RecoversAfterTransientReadFailures) {
    ReplayEventSource source({AccessEvent(7, 0, "x", "/etc/passwd")});
    source.FailNextReads(3);
    DecisionEngine engine(EtcPolicy(1), source);
    ControlLoop loop(source, engine);

    StartLoop(loop);
    ASSERT_TRUE(WaitUntil([&] { return loop.GetEventsProcessed() == 1; }));
    StopLoop();

    EXPECT_EQ(loop.GetReadErrors(), 3u);
    EXPECT_TRUE(engine.IsBlocked(7));
}

TEST_F(ControlLoopTest, ClosedSourceIsTreatedAsReadFailure) {
    ReplayEventSource source({AccessEvent(7, 0, "x", "/etc/passwd")});
    ASSERT_TRUE(source.Close().success);
    DecisionEngine engine(EtcPolicy(1), source);
    ControlLoop loop(source, engine);

    StartLoop(loop);
    ASSERT_TRUE(WaitUntil([&] { return loop.GetReadErrors() >= 10; }));
    EXPECT_TRUE(loop.IsRunning());

    StopLoop();
    EXPECT_TRUE(run_result.success);
    EXPECT_EQ(loop.GetEventsProcessed(), 0u);
}

TEST_F(ControlLoopTest, BlockFailureDoesNotStopProcessing) {
    ReplayEventSource source({
        AccessEvent(1, 0, "a", "/etc/passwd"),
        AccessEvent(2, 0, "b", "/etc/passwd"),
        AccessEvent(2, 0, "b", "/etc/shadow"),
    });
    source.SetBlockFailure("enforcement unavailable");
    DecisionEngine engine(EtcPolicy(1), source);
    ControlLoop loop(source, engine);

    StartLoop(loop);
    ASSERT_TRUE(WaitUntil([&] { return loop.GetEventsProcessed() == 3; }));
    StopLoop();

    EXPECT_TRUE(run_result.success);
    EXPECT_EQ(loop.GetProcessErrors(), 2u);
    EXPECT_TRUE(engine.IsBlocked(1));
    EXPECT_TRUE(engine.IsBlocked(2));
    EXPECT_EQ(engine.GetViolationCount(2), 2u);
}

TEST_F(ControlLoopTest, SecondConcurrentRunIsRejected) {
    ReplayEventSource source(std::vector<AccessEvent>{});
    DecisionEngine engine(EtcPolicy(2), source);
    ControlLoop loop(source, engine);

    StartLoop(loop);
    ASSERT_TRUE(WaitUntil([&] { return loop.IsRunning(); }));

    CancellationToken other;
    ActionResult second = loop.Run(other);
    EXPECT_FALSE(second.success);

    StopLoop();
    EXPECT_TRUE(run_result.success);
}

TEST_F(ControlLoopTest, QueriesAreSafeWhileLoopRuns) {
    std::vector<AccessEvent> events;
    for (uint32_t i = 0; i < 2000; ++i) {
        events.emplace_back(i % 10, 0, "worker", i % 2 ? "/etc/passwd" : "/tmp/ok");
    }
    ReplayEventSource source(std::move(events));
    DecisionEngine engine(EtcPolicy(50), source);
    ControlLoop loop(source, engine);

    StartLoop(loop);
    uint64_t last_total = 0;
    while (loop.GetEventsProcessed() < 2000) {
        uint64_t total = engine.GetViolationCount();
        EXPECT_GE(total, last_total);
        last_total = total;
        engine.GetBlockedPids();
    }
    StopLoop();

    EXPECT_EQ(engine.GetViolationCount(), 1000u);
}
