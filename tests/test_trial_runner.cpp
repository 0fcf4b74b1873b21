#include <gtest/gtest.h>

#include "fakes.hpp"
#include "runner/trial_runner.hpp"

using namespace trialbench;
using namespace trialbench::fakes;

namespace {

runner::TrialOpts MakeOpts(const TempDir& dir) {
    WriteFile(dir.path() / "adapter.sh", "#!/bin/bash\n");
    runner::TrialOpts opts;
    opts.orchestrator.name = "solo";
    opts.orchestrator.adapter = (dir.path() / "adapter.sh").string();
    opts.orchestrator.image = "agent:latest";
    opts.orchestrator.env = {{"MODEL", "fast"}};
    opts.task.repo = "https://example.com/org/todo-api";
    opts.task.tag = "v1";
    opts.task.category = "feature";
    opts.trial = 1;
    opts.run_dir = dir.path() / "run";
    return opts;
}

}  // namespace

TEST(ExitReasonTest, MapsCodes) {
    EXPECT_EQ(runner::ExitReasonFromCode(0, false), "completed");
    EXPECT_EQ(runner::ExitReasonFromCode(2, false), "gave_up");
    EXPECT_EQ(runner::ExitReasonFromCode(1, false), "crashed");
    EXPECT_EQ(runner::ExitReasonFromCode(137, false), "crashed");
    EXPECT_EQ(runner::ExitReasonFromCode(0, true), "timeout");
}

TEST(TimeoutTest, CategoryTiers) {
    EXPECT_EQ(runner::TimeoutForCategory("marathon-refactor"), std::chrono::minutes(60));
    EXPECT_EQ(runner::TimeoutForCategory("feature-complex"), std::chrono::minutes(30));
    EXPECT_EQ(runner::TimeoutForCategory("bugfix"), std::chrono::minutes(10));
    EXPECT_EQ(runner::TimeoutForCategory(""), std::chrono::minutes(10));

    config::TaskConfig task;
    task.category = "marathon";
    task.time_limit_minutes = 5;
    EXPECT_EQ(runner::TimeoutForTask(task), std::chrono::minutes(5));
}

TEST(TaskNameTest, LastPathComponent) {
    config::TaskConfig task;
    task.repo = "https://example.com/org/todo-api/";
    EXPECT_EQ(runner::TaskName(task), "todo-api");
    task.repo = "local-repo";
    EXPECT_EQ(runner::TaskName(task), "local-repo");
}

TEST(TrialRunnerTest, RunsAdapterAndRecordsOutcome) {
    TempDir dir;
    FakeContainer container;
    container.result.exit_code = 2;
    container.result.duration = std::chrono::seconds(42);
    FakeSourceControl git;
    git.files_by_tag["v1"] = {{"TASK.md", "Build the todo API"}, {"package.json", "{}"}};
    git.diff = "diff --git a/src/app.ts b/src/app.ts\n";

    auto opts = MakeOpts(dir);
    opts.gateway_url = "http://localhost:4100";
    opts.cpu_limit = 2.0;
    runner::TrialRunner trial_runner(container, git);
    const auto meta = trial_runner.RunTrial(opts, {});

    EXPECT_EQ(meta.orchestrator, "solo");
    EXPECT_EQ(meta.task, "todo-api");
    EXPECT_EQ(meta.exit_code, 2);
    EXPECT_EQ(meta.exit_reason, "gave_up");
    EXPECT_EQ(meta.duration_s, 42);

    ASSERT_EQ(container.runs.size(), 1u);
    const auto& run = container.runs.front();
    EXPECT_EQ(run.image, "agent:latest");
    EXPECT_EQ(run.env.at("TASK_DIR"), "/workspace");
    EXPECT_EQ(run.env.at("TASK_DESCRIPTION"), "/task.md");
    EXPECT_EQ(run.env.at("PROXY_URL"), "http://host.docker.internal:4100");
    EXPECT_EQ(run.env.at("MODEL"), "fast");
    EXPECT_EQ(run.timeout, std::chrono::minutes(10));
    EXPECT_DOUBLE_EQ(run.cpu_limit, 2.0);
    EXPECT_FALSE(run.user.empty());
    ASSERT_GE(run.extra_mounts.size(), 2u);
    EXPECT_EQ(run.extra_mounts[0].target, "/adapter.sh");
    EXPECT_TRUE(run.extra_mounts[0].read_only);

    const auto trial_dir = result::TrialDir(opts.run_dir, "solo", "todo-api", 1);
    EXPECT_EQ(ReadFile(trial_dir / "task.md"), "Build the todo API");
    EXPECT_EQ(ReadFile(trial_dir / "diff.patch"), git.diff);
    EXPECT_EQ(result::ReadTrialMeta(trial_dir / "meta.json"), meta);
}

TEST(TrialRunnerTest, MissingTaskFileGetsPlaceholder) {
    TempDir dir;
    FakeContainer container;
    FakeSourceControl git;
    runner::TrialRunner trial_runner(container, git);
    auto opts = MakeOpts(dir);
    trial_runner.RunTrial(opts, {});
    const auto trial_dir = result::TrialDir(opts.run_dir, "solo", "todo-api", 1);
    EXPECT_EQ(ReadFile(trial_dir / "task.md"), runner::kNoTaskDescription);
    EXPECT_EQ(container.runs.front().env.count("PROXY_URL"), 0u);
}

TEST(TrialRunnerTest, TimeoutIsRecorded) {
    TempDir dir;
    FakeContainer container;
    container.result.exit_code = sandbox::kTimeoutExitCode;
    container.result.timed_out = true;
    FakeSourceControl git;
    runner::TrialRunner trial_runner(container, git);
    EXPECT_EQ(trial_runner.RunTrial(MakeOpts(dir), {}).exit_reason, "timeout");
}

TEST(TrialRunnerTest, UsageIsTotalledAndBudgetChecked) {
    TempDir dir;
    FakeContainer container;
    FakeSourceControl git;
    auto opts = MakeOpts(dir);
    opts.usage_log = dir.path() / "usage.jsonl";
    opts.budget_usd = 1.0;
    container.hook = [&](const sandbox::RunOpts&) {
        WriteFile(opts.usage_log,
                  "{\"model\":\"claude-opus-4-1\",\"input_tokens\":100000,\"output_tokens\":10000}\n"
                  "garbage line\n");
    };
    runner::TrialRunner trial_runner(container, git);
    const auto meta = trial_runner.RunTrial(opts, {});
    EXPECT_EQ(meta.input_tokens, 100000);
    EXPECT_EQ(meta.output_tokens, 10000);
    EXPECT_EQ(meta.total_tokens, 110000);
    EXPECT_NEAR(meta.total_cost_usd, 1.5 + 0.75, 1e-9);
    EXPECT_TRUE(meta.budget_exceeded);
}

TEST(TrialRunnerTest, MissingUsageLogIsNotAnError) {
    TempDir dir;
    FakeContainer container;
    FakeSourceControl git;
    auto opts = MakeOpts(dir);
    opts.usage_log = dir.path() / "never-written.jsonl";
    runner::TrialRunner trial_runner(container, git);
    const auto meta = trial_runner.RunTrial(opts, {});
    EXPECT_EQ(meta.total_tokens, 0);
    EXPECT_FALSE(meta.budget_exceeded);
}

TEST(TrialRunnerTest, CloneFailureLeavesNoMeta) {
    TempDir dir;
    FakeContainer container;
    FakeSourceControl git;
    git.fail_clone = true;
    auto opts = MakeOpts(dir);
    runner::TrialRunner trial_runner(container, git);
    try {
        trial_runner.RunTrial(opts, {});
        FAIL() << "expected an exception";
    } catch (const std::runtime_error& ex) {
        EXPECT_NE(std::string(ex.what()).find("cloning task repo"), std::string::npos);
    }
    EXPECT_TRUE(container.runs.empty());
    EXPECT_FALSE(fs::exists(result::TrialDir(opts.run_dir, "solo", "todo-api", 1) / "meta.json"));
}

TEST(TrialRunnerTest, MissingAdapterFailsBeforeRunning) {
    TempDir dir;
    FakeContainer container;
    FakeSourceControl git;
    auto opts = MakeOpts(dir);
    opts.orchestrator.adapter = (dir.path() / "nope.sh").string();
    runner::TrialRunner trial_runner(container, git);
    EXPECT_THROW(trial_runner.RunTrial(opts, {}), std::runtime_error);
    EXPECT_TRUE(container.runs.empty());
}

TEST(TrialRunnerTest, OrchestratorMountsNeedAnExistingSource) {
    TempDir dir;
    FakeContainer container;
    FakeSourceControl git;
    auto opts = MakeOpts(dir);
    fs::create_directories(dir.path() / "cache");
    opts.orchestrator.mounts = {{(dir.path() / "cache").string(), "/cache"},
                                {(dir.path() / "absent").string(), "/absent"}};
    runner::TrialRunner trial_runner(container, git);
    trial_runner.RunTrial(opts, {});
    const auto& mounts = container.runs.front().extra_mounts;
    ASSERT_EQ(mounts.size(), 3u);
    EXPECT_EQ(mounts[2].target, "/cache");
}
