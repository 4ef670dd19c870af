#include <cadence/clock.hpp>
#include <cadence/context.hpp>
#include <cadence/process.hpp>
#include <cadence/scheduler.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <thread>

using namespace cadence;
using cadence::test::CapturedOutput;
using cadence::test::TempDir;
using cadence::test::shell;

class SchedulerTest : public ::testing::Test {
protected:
    std::filesystem::path dataDir() const { return dir_.path() / "data"; }

    SupervisorState persisted() const {
        return StateStore(dataDir() / Context::kStateFileName).load();
    }

    static bool waitUntil(const std::function<bool()>& condition,
                          std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (condition()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return condition();
    }

    TempDir dir_;
    CapturedOutput output_;
};

TEST_F(SchedulerTest, TriggerIsSkippedWhileRunIsInProgress) {
    Context context(test::fastConfig(shell("exit 0"), test::jobs({{"A", true}})), dataDir());
    TimePoint planned{Millis(1'736'929'800'000)};
    context.state().isRunning = true;
    context.state().nextScheduledRun = planned;
    Scheduler scheduler(context, output_.sink());

    EXPECT_EQ(scheduler.trigger(), TriggerResult::Skipped);

    EXPECT_TRUE(context.state().runHistory.empty());
    ASSERT_TRUE(context.state().nextScheduledRun.has_value());
    EXPECT_EQ(*context.state().nextScheduledRun, planned);
    EXPECT_FALSE(std::filesystem::exists(dataDir() / "A"));
}

TEST_F(SchedulerTest, TriggerRunsCycleAndPlansNextOne) {
    Context context(test::fastConfig(shell("exit 0"), test::jobs({{"A", true}})), dataDir());
    Scheduler scheduler(context, output_.sink());

    auto before = now();
    EXPECT_EQ(scheduler.trigger(), TriggerResult::Ran);
    auto after = now();

    const SupervisorState& state = context.state();
    ASSERT_EQ(state.runHistory.size(), 1U);
    ASSERT_TRUE(state.nextScheduledRun.has_value());
    EXPECT_GE(*state.nextScheduledRun, before + context.config().interval());
    EXPECT_LE(*state.nextScheduledRun, after + context.config().interval());
    EXPECT_EQ(persisted(), state);
}

TEST_F(SchedulerTest, FirstCycleRunsImmediatelyOnStart) {
    Context context(test::fastConfig(shell("exit 0"), test::jobs({{"A", true}})), dataDir());
    Scheduler scheduler(context, output_.sink());

    ASSERT_TRUE(scheduler.start());
    EXPECT_TRUE(scheduler.isRunning());
    ASSERT_TRUE(waitUntil([&] { return persisted().nextScheduledRun.has_value(); }));

    auto state = persisted();
    EXPECT_EQ(state.runHistory.size(), 1U);
    EXPECT_FALSE(state.isRunning);

    scheduler.shutdown();
    EXPECT_FALSE(scheduler.isRunning());
    EXPECT_FALSE(persisted().nextScheduledRun.has_value());
}

TEST_F(SchedulerTest, RunsOnFixedInterval) {
    auto config = test::fastConfig(shell("exit 0"), test::jobs({{"A", true}}));
    config.intervalHours = 0.0001;  // 360ms
    Context context(config, dataDir());
    Scheduler scheduler(context, output_.sink());

    ASSERT_TRUE(scheduler.start());
    ASSERT_TRUE(waitUntil([&] { return persisted().runHistory.size() >= 3; }));
    scheduler.shutdown();

    auto history = persisted().runHistory;
    ASSERT_GE(history.size(), 3U);
    // Newest first; starts are roughly one interval apart
    auto gap = history[0].startTime - history[1].startTime;
    EXPECT_GE(gap, Millis(250));
    EXPECT_LE(gap, Millis(2'000));
}

TEST_F(SchedulerTest, StartResetsStaleRunningFlag) {
    SupervisorState stale;
    stale.isRunning = true;
    stale.currentJob = "A";
    ASSERT_TRUE(StateStore(dataDir() / Context::kStateFileName).save(stale));

    Context context(test::fastConfig(shell("exit 0"), test::jobs({{"A", true}})), dataDir());
    ASSERT_TRUE(context.state().isRunning);
    // Keep the loop from starting a cycle so the reset is observable on its own
    context.requestShutdown();
    Scheduler scheduler(context, output_.sink());

    ASSERT_TRUE(scheduler.start());
    EXPECT_FALSE(context.state().isRunning);
    EXPECT_FALSE(context.state().currentJob.has_value());

    auto state = persisted();
    EXPECT_FALSE(state.isRunning);
    EXPECT_FALSE(state.currentJob.has_value());
    EXPECT_TRUE(state.runHistory.empty());
}

TEST_F(SchedulerTest, StartFailsWhenDataDirectoryCannotBeCreated) {
    auto blocker = dir_.path() / "file";
    test::writeFile(blocker, "x");

    Context context(test::fastConfig(shell("exit 0"), test::jobs({{"A", true}})), blocker / "data");
    Scheduler scheduler(context, output_.sink());

    EXPECT_FALSE(scheduler.start());
    EXPECT_FALSE(scheduler.isRunning());
}

TEST_F(SchedulerTest, ShutdownForceKillsInFlightJobAndClearsState) {
    auto config = test::fastConfig(shell("trap '' TERM; echo started; sleep 30"), test::jobs({{"A", true}}));
    config.shutdownGrace = Millis(300);
    Context context(config, dataDir());
    Scheduler scheduler(context, output_.sink());

    ASSERT_TRUE(scheduler.start());
    ASSERT_TRUE(waitUntil([&] { return !output_.lines().empty() && context.currentProcess() != nullptr; }));
    auto process = context.currentProcess();
    ASSERT_NE(process, nullptr);

    auto started = std::chrono::steady_clock::now();
    scheduler.shutdown();
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(process->forceKilled());
    EXPECT_GE(elapsed, std::chrono::milliseconds(300));
    EXPECT_LT(elapsed, std::chrono::seconds(10));

    auto state = persisted();
    EXPECT_FALSE(state.isRunning);
    EXPECT_FALSE(state.currentJob.has_value());
    EXPECT_FALSE(state.nextScheduledRun.has_value());
    ASSERT_EQ(state.runHistory.size(), 1U);
    EXPECT_FALSE(state.runHistory.front().jobsProcessed.front().success);
}

TEST_F(SchedulerTest, ShutdownIsIdempotent) {
    Context context(test::fastConfig(shell("exit 0"), test::jobs({{"A", true}})), dataDir());
    Scheduler scheduler(context, output_.sink());

    ASSERT_TRUE(scheduler.start());
    scheduler.shutdown();
    auto first = persisted();
    scheduler.shutdown();

    EXPECT_FALSE(scheduler.isRunning());
    EXPECT_EQ(persisted(), first);
    EXPECT_TRUE(context.shutdownRequested());
}

TEST_F(SchedulerTest, ShutdownWithoutStartLeavesStateAlone) {
    Context context(test::fastConfig(shell("exit 0"), test::jobs({{"A", true}})), dataDir());
    {
        Scheduler scheduler(context, output_.sink());
        scheduler.shutdown();
    }
    EXPECT_FALSE(std::filesystem::exists(dataDir() / Context::kStateFileName));
}
