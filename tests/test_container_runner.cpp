#include <gtest/gtest.h>

#include <algorithm>

#include "fake_executor.hpp"
#include "sandbox/container_runner.hpp"
#include "validation/validation_runner.hpp"

using namespace trialbench;
using trialbench::fakes::FakeExecutor;
using trialbench::fakes::Output;

namespace {

bool Contains(const std::vector<std::string>& args, const std::string& value) {
    return std::find(args.begin(), args.end(), value) != args.end();
}

sandbox::RunOpts BasicOpts() {
    sandbox::RunOpts opts;
    opts.image = "agent:latest";
    opts.command = {"/adapter/run.sh", "/task.md"};
    opts.work_dir = "/tmp/ws";
    opts.env = {{"ANTHROPIC_API_KEY", "sk-secret"}, {"TASK_DIR", "/workspace"}};
    opts.timeout = std::chrono::minutes(10);
    return opts;
}

}  // namespace

// ─── Argument construction ─────────────────────────────────────

TEST(DockerCliRunnerTest, CreateArgsCarryLimitsMountsAndEnvNames) {
    auto opts = BasicOpts();
    opts.user = "1000:1000";
    opts.cpu_limit = 1.5;
    opts.memory_limit = 2147483648;
    opts.extra_mounts = {{"/home/me/adapter.sh", "/adapter/run.sh", true}};

    const auto args = sandbox::DockerCliRunner::BuildCreateArgs(opts, "", "host-gateway");
    ASSERT_GE(args.size(), 4u);
    EXPECT_EQ(args[0], "create");
    EXPECT_TRUE(Contains(args, "--init"));
    EXPECT_TRUE(Contains(args, "trialbench=true"));
    EXPECT_TRUE(Contains(args, "1000:1000"));
    EXPECT_TRUE(Contains(args, "1.5"));
    EXPECT_TRUE(Contains(args, "2147483648"));
    EXPECT_FALSE(Contains(args, "--network"));
    EXPECT_TRUE(Contains(args, "host.docker.internal:host-gateway"));
    EXPECT_TRUE(Contains(args, "type=bind,source=/tmp/ws,target=/workspace"));
    EXPECT_TRUE(Contains(args, "type=bind,source=/home/me/adapter.sh,target=/adapter/run.sh,readonly"));
    EXPECT_TRUE(Contains(args, "ANTHROPIC_API_KEY"));
    for (const auto& arg : args) {
        EXPECT_EQ(arg.find("sk-secret"), std::string::npos) << "secret leaked into argv";
    }
    ASSERT_GE(args.size(), 3u);
    EXPECT_EQ(args[args.size() - 3], "agent:latest");
    EXPECT_EQ(args.back(), "/task.md");
}

TEST(DockerCliRunnerTest, NoLimitsMeansNoFlags) {
    const auto args = sandbox::DockerCliRunner::BuildCreateArgs(BasicOpts(), "", "host-gateway");
    EXPECT_FALSE(Contains(args, "--cpus"));
    EXPECT_FALSE(Contains(args, "--memory"));
    EXPECT_FALSE(Contains(args, "--user"));
}

// ─── Lifecycle ─────────────────────────────────────────────────

TEST(DockerCliRunnerTest, RunReportsExitCodeAndRemovesContainer) {
    FakeExecutor fake;
    fake.Script("create", Output("abc123\n"));
    fake.Script("wait", Output("3\n"));
    sandbox::DockerCliRunner runner("docker", fake.Executor());

    const auto result = runner.Run(BasicOpts(), {});
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.timed_out);

    ASSERT_EQ(fake.CallsFor("create").size(), 1u);
    EXPECT_EQ(fake.calls.front().options.env.at("ANTHROPIC_API_KEY"), "sk-secret");
    const auto removed = fake.CallsFor("rm");
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed.front().back(), "abc123");
    EXPECT_TRUE(fake.CallsFor("kill").empty());
}

TEST(DockerCliRunnerTest, TimeoutKillsAndReports124) {
    FakeExecutor fake;
    fake.Script("create", Output("abc123"));
    sandbox::ProcessResult timed_out{};
    timed_out.timed_out = true;
    fake.Script("wait", timed_out);
    sandbox::DockerCliRunner runner("docker", fake.Executor());

    const auto result = runner.Run(BasicOpts(), {});
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, sandbox::kTimeoutExitCode);
    EXPECT_EQ(fake.CallsFor("kill").size(), 1u);
    EXPECT_EQ(fake.CallsFor("rm").size(), 1u);
}

TEST(DockerCliRunnerTest, CancelThrowsAfterCleanup) {
    FakeExecutor fake;
    fake.Script("create", Output("abc123"));
    sandbox::ProcessResult cancelled{};
    cancelled.cancelled = true;
    fake.Script("wait", cancelled);
    sandbox::DockerCliRunner runner("docker", fake.Executor());

    EXPECT_THROW(runner.Run(BasicOpts(), {}), std::runtime_error);
    EXPECT_EQ(fake.CallsFor("kill").size(), 1u);
    EXPECT_EQ(fake.CallsFor("rm").size(), 1u);
}

TEST(DockerCliRunnerTest, StartFailureStillRemovesContainer) {
    FakeExecutor fake;
    fake.Script("create", Output("abc123"));
    fake.Script("start", Output("no such image", 125));
    sandbox::DockerCliRunner runner("docker", fake.Executor());

    EXPECT_THROW(runner.Run(BasicOpts(), {}), std::runtime_error);
    EXPECT_EQ(fake.CallsFor("rm").size(), 1u);
    EXPECT_TRUE(fake.CallsFor("wait").empty());
}

TEST(DockerCliRunnerTest, CreateFailureLeavesNothingToRemove) {
    FakeExecutor fake;
    fake.Script("create", Output("invalid mount", 125));
    sandbox::DockerCliRunner runner("docker", fake.Executor());

    EXPECT_THROW(runner.Run(BasicOpts(), {}), std::runtime_error);
    EXPECT_TRUE(fake.CallsFor("rm").empty());
}

TEST(DockerCliRunnerTest, IsolatedNetworkUsesGatewayAndIsRemoved) {
    FakeExecutor fake;
    fake.Script("network", Output("172.30.0.1\n"));
    fake.Script("create", Output("abc123"));
    fake.Script("wait", Output("0"));
    sandbox::DockerCliRunner runner("docker", fake.Executor());

    auto opts = BasicOpts();
    opts.isolate_network = true;
    opts.allowlist = {"registry.npmjs.org"};
    EXPECT_EQ(runner.Run(opts, {}).exit_code, 0);

    const auto network_calls = fake.CallsFor("network");
    ASSERT_EQ(network_calls.size(), 3u);
    EXPECT_EQ(network_calls[0][2], "create");
    EXPECT_TRUE(Contains(network_calls[0], "--internal"));
    EXPECT_EQ(network_calls[1][2], "inspect");
    EXPECT_EQ(network_calls[2][2], "rm");

    const auto create = fake.CallsFor("create").front();
    EXPECT_TRUE(Contains(create, "--network"));
    EXPECT_TRUE(Contains(create, "host.docker.internal:172.30.0.1"));
}

// ─── Validation containers ─────────────────────────────────────

TEST(DockerValidationRunnerTest, RunsShellCommandInWorkspace) {
    FakeExecutor fake;
    fake.Script("run", Output("5 passed"));
    validation::DockerValidationRunner runner("podman", fake.Executor());

    const auto result = runner.RunInImage("/tmp/ws", "node:20", "npm test", {});
    EXPECT_EQ(result.output, "5 passed");
    ASSERT_EQ(fake.calls.size(), 1u);
    const auto& argv = fake.calls.front().argv;
    EXPECT_EQ(argv[0], "podman");
    EXPECT_TRUE(Contains(argv, "--rm"));
    EXPECT_TRUE(Contains(argv, "/tmp/ws:/workspace"));
    EXPECT_EQ(argv[argv.size() - 4], "node:20");
    EXPECT_EQ(argv.back(), "npm test");
    EXPECT_TRUE(fake.calls.front().options.merge_stderr);
}

TEST(DockerValidationRunnerTest, TimeoutRemovesNamedContainer) {
    FakeExecutor fake;
    sandbox::ProcessResult timed_out{};
    timed_out.timed_out = true;
    fake.Script("run", timed_out);
    validation::DockerValidationRunner runner("docker", fake.Executor());

    const auto result = runner.RunInImage("/tmp/ws", "node:20", "npm test", {});
    EXPECT_TRUE(result.timed_out);
    const auto removed = fake.CallsFor("rm");
    ASSERT_EQ(removed.size(), 1u);
    const auto& run_argv = fake.calls.front().argv;
    const auto name_it = std::find(run_argv.begin(), run_argv.end(), "--name");
    ASSERT_NE(name_it, run_argv.end());
    EXPECT_EQ(removed.front().back(), *(name_it + 1));
}
