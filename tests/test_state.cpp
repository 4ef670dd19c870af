#include <cadence/state.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace cadence;
using cadence::test::TempDir;

namespace {

JobRunResult makeResult(const std::string& name, bool success, int attempt) {
    JobRunResult result;
    result.jobName = name;
    result.success = success;
    result.startTime = TimePoint(Millis(1'736'929'800'000));
    result.endTime = TimePoint(Millis(1'736'929'812'345));
    result.durationMs = 12'345;
    result.exitCode = success ? 0 : 1;
    result.attempt = attempt;
    if (!success) {
        result.errorMessage = "Failed after 3 attempts: Exited with code 1";
    }
    return result;
}

RunRecord makeRecord(const std::string& id) {
    RunRecord record;
    record.runId = id;
    record.startTime = TimePoint(Millis(1'736'929'800'000));
    record.endTime = TimePoint(Millis(1'736'929'830'000));
    record.durationMs = 30'000;
    record.jobsProcessed = {makeResult("A", true, 1), makeResult("B", false, 3)};
    record.status = classifyRun(record.jobsProcessed);
    return record;
}

}

TEST(StateTest, ClassifiesRuns) {
    EXPECT_EQ(classifyRun({}), RunStatus::Completed);
    EXPECT_EQ(classifyRun({makeResult("A", true, 1), makeResult("B", true, 2)}), RunStatus::Completed);
    EXPECT_EQ(classifyRun({makeResult("A", false, 3), makeResult("B", false, 3)}), RunStatus::Failed);
    EXPECT_EQ(classifyRun({makeResult("A", true, 1), makeResult("B", false, 3)}), RunStatus::Partial);
}

TEST(StateTest, StatusNamesRoundTrip) {
    for (auto status : {RunStatus::Completed, RunStatus::Failed, RunStatus::Partial}) {
        auto parsed = parseRunStatus(toString(status));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, status);
    }
    EXPECT_FALSE(parseRunStatus("running").has_value());
}

TEST(StateTest, AppendRunKeepsNewestHundred) {
    SupervisorState state;
    for (int i = 0; i < 101; ++i) {
        appendRun(state, makeRecord("run_" + std::to_string(i)));
    }

    ASSERT_EQ(state.runHistory.size(), kMaxRunHistory);
    EXPECT_EQ(state.runHistory.front().runId, "run_100");
    EXPECT_EQ(state.runHistory.back().runId, "run_1");
}

TEST(StateTest, SerializedDocumentUsesCamelCaseAndNulls) {
    SupervisorState state;
    state.runHistory.push_back(makeRecord("run_1"));

    auto text = serializeState(state);
    EXPECT_NE(text.find("\"lastRunStartTime\": null"), std::string::npos);
    EXPECT_NE(text.find("\"currentJob\": null"), std::string::npos);
    EXPECT_NE(text.find("\"isRunning\": false"), std::string::npos);
    EXPECT_NE(text.find("\"status\": \"partial\""), std::string::npos);
    EXPECT_NE(text.find("\"startTime\": \"2025-01-15T08:30:00.000Z\""), std::string::npos);
    // Successful results carry no errorMessage key at all
    EXPECT_EQ(text.find("\"errorMessage\": null"), std::string::npos);
}

TEST(StateTest, PersistThenReloadIsLossless) {
    TempDir dir;
    StateStore store(dir.path() / "scheduler_state.json");

    SupervisorState state;
    state.lastRunStartTime = TimePoint(Millis(1'736'929'800'000));
    state.lastRunEndTime = TimePoint(Millis(1'736'929'830'001));
    state.nextScheduledRun = TimePoint(Millis(1'736'951'400'000));
    state.isRunning = true;
    state.currentJob = "B";
    state.runHistory = {makeRecord("run_2"), makeRecord("run_1")};

    ASSERT_TRUE(store.save(state));
    EXPECT_EQ(store.load(), state);
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "scheduler_state.json.tmp"));
}

TEST(StateTest, SaveCreatesParentDirectories) {
    TempDir dir;
    StateStore store(dir.path() / "nested" / "data" / "scheduler_state.json");

    ASSERT_TRUE(store.save(SupervisorState{}));
    EXPECT_TRUE(std::filesystem::exists(store.path()));
}

TEST(StateTest, MissingFileLoadsDefault) {
    TempDir dir;
    StateStore store(dir.path() / "scheduler_state.json");

    EXPECT_EQ(store.load(), SupervisorState{});
}

TEST(StateTest, CorruptFileLoadsDefault) {
    TempDir dir;
    auto path = dir.path() / "scheduler_state.json";
    cadence::test::writeFile(path, "{ this is not json");

    StateStore store(path);
    EXPECT_EQ(store.load(), SupervisorState{});

    cadence::test::writeFile(path, R"({"runHistory": [{"runId": "x"}]})");
    EXPECT_EQ(store.load(), SupervisorState{});
}

TEST(StateTest, ReadsLegacyCurrentAvatarKey) {
    auto state = deserializeState(R"({"isRunning": true, "currentAvatar": "alpha", "runHistory": []})");
    EXPECT_TRUE(state.isRunning);
    ASSERT_TRUE(state.currentJob.has_value());
    EXPECT_EQ(*state.currentJob, "alpha");
    EXPECT_FALSE(state.nextScheduledRun.has_value());
}

TEST(StateTest, LoadsAvatarSchedulerStateWithHistory) {
    TempDir dir;
    auto path = dir.path() / "scheduler_state.json";
    cadence::test::writeFile(path, R"({
        "lastRunStartTime": "2025-01-15T08:30:00.000Z",
        "lastRunEndTime": "2025-01-15T08:30:30.000Z",
        "nextScheduledRun": "2025-01-15T14:30:30.000Z",
        "isRunning": true,
        "currentAvatar": "beta",
        "runHistory": [{
            "runId": "run_1736929800000",
            "startTime": "2025-01-15T08:30:00.000Z",
            "endTime": "2025-01-15T08:30:30.000Z",
            "durationMs": 30000,
            "avatarsProcessed": [
                {"avatarName": "alpha", "success": true, "startTime": "2025-01-15T08:30:00.000Z",
                 "endTime": "2025-01-15T08:30:10.000Z", "durationMs": 10000, "exitCode": 0, "attempt": 1},
                {"avatarName": "beta", "success": false, "startTime": "2025-01-15T08:30:10.000Z",
                 "endTime": "2025-01-15T08:30:30.000Z", "durationMs": 20000, "exitCode": 1,
                 "errorMessage": "Failed after 3 attempts", "attempt": 3}
            ],
            "status": "partial"
        }]
    })");

    auto state = StateStore(path).load();

    ASSERT_TRUE(state.lastRunStartTime.has_value());
    EXPECT_EQ(state.lastRunStartTime->time_since_epoch().count(), 1'736'929'800'000);
    EXPECT_TRUE(state.isRunning);
    ASSERT_TRUE(state.currentJob.has_value());
    EXPECT_EQ(*state.currentJob, "beta");
    ASSERT_EQ(state.runHistory.size(), 1U);
    const RunRecord& run = state.runHistory.front();
    EXPECT_EQ(run.status, RunStatus::Partial);
    ASSERT_EQ(run.jobsProcessed.size(), 2U);
    EXPECT_EQ(run.jobsProcessed[0].jobName, "alpha");
    EXPECT_EQ(run.jobsProcessed[1].jobName, "beta");
    EXPECT_EQ(run.jobsProcessed[1].attempt, 3);

    // Saving again writes the current key names
    ASSERT_TRUE(StateStore(path).save(state));
    auto text = serializeState(state);
    EXPECT_NE(text.find("\"jobsProcessed\""), std::string::npos);
    EXPECT_EQ(text.find("avatarsProcessed"), std::string::npos);
}

TEST(StateTest, SaveFailsIntoUnwritableLocation) {
    TempDir dir;
    auto blocker = dir.path() / "file";
    cadence::test::writeFile(blocker, "x");

    StateStore store(blocker / "scheduler_state.json");
    EXPECT_FALSE(store.save(SupervisorState{}));
}
