#include <gtest/gtest.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include "filesystem_policy.h"
#include "process.h"
#include "supervisor.h"
#include "temp_dir.h"

using confine::ConfigBuilder;
using confine::ResourceBudget;
using confine::RunResult;
using confine::SandboxConfig;
using confine::SyscallAction;
using Stage = confine::ChildSetupPipeline::Stage;

namespace {

RunResult Run(const SandboxConfig &config) {
    EventLoop loop;
    confine::Supervisor supervisor(loop, config);
    return supervisor.Run();
}

// Runs |config| and also returns the last setup stage the child reported.
Pair<RunResult, Optional<Stage>> RunWithStage(const SandboxConfig &config) {
    EventLoop loop;
    confine::Supervisor supervisor(loop, config);
    RunResult result = supervisor.Run();
    return {result, supervisor.setup_stage()};
}

ConfigBuilder Shell(const String &script) {
    ConfigBuilder builder("/bin/sh");
    builder.AddArg("-c").AddArg(script).AddArg("sh");
    return builder;
}

// Directories a dynamically linked /bin/sh needs to start.
ConfigBuilder &AllowSystemDirs(ConfigBuilder &builder) {
    for (const char *dir : {"/bin", "/usr", "/lib", "/lib64", "/etc"}) {
        if (Exists(dir)) {
            builder.ReadOnly(dir);
        }
    }
    return builder;
}

}  // namespace

TEST(supervisor, exit_code_is_propagated) {
    ResourceBudget limits;
    limits.real_time_ms = 5000;
    RunResult result = Run(Shell("exit 3").Limits(limits).Build());
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.timed_out);
    EXPECT_LT(result.wall_time_ms, 5000);
}

TEST(supervisor, success_without_limits) {
    auto outcome = RunWithStage(Shell("true").Build());
    EXPECT_EQ(outcome.first.exit_code, 0);
    EXPECT_FALSE(outcome.first.timed_out);
    EXPECT_GT(outcome.first.max_resident_kb, 0);
    ASSERT_TRUE(outcome.second);
    EXPECT_EQ(*outcome.second, Stage::kExec);
}

TEST(supervisor, real_time_watchdog_kills_loop) {
    ResourceBudget limits;
    limits.real_time_ms = 200;
    RunResult result = Run(Shell("while :; do :; done").Limits(limits).Build());
    EXPECT_EQ(result.exit_code, 128 + SIGKILL);
    EXPECT_TRUE(result.timed_out);
    EXPECT_GE(result.wall_time_ms, 200);
    EXPECT_LT(result.wall_time_ms, 3000);
}

TEST(supervisor, cpu_limit_kills_busy_loop) {
    ResourceBudget limits;
    limits.cpu_time_ms = 500;
    limits.real_time_ms = 10000;
    RunResult result = Run(Shell("while :; do :; done").Limits(limits).Build());
    EXPECT_EQ(result.exit_code, 128 + SIGKILL);
    EXPECT_TRUE(result.timed_out);
    EXPECT_GE(confine::WithTolerance(result.cpu_time_ms), 500.0);
    EXPECT_LT(result.wall_time_ms, 10000);
}

TEST(supervisor, memory_limit_stops_growing_program) {
    TempDir dir;
    Path output = dir.path() / "output.txt";
    ResourceBudget limits;
    limits.memory_kb = 64000;
    limits.real_time_ms = 10000;
    auto outcome = RunWithStage(ConfigBuilder(CONFINE_MEMORY_HOG)
                                    .Limits(limits)
                                    .RedirectStdout(output)
                                    .Build());
    ASSERT_TRUE(outcome.second);
    EXPECT_EQ(*outcome.second, Stage::kExec);
    EXPECT_EQ(ReadFile(output), "started\n");
    EXPECT_GE(outcome.first.exit_code, 128);
    EXPECT_FALSE(outcome.first.timed_out);
}

TEST(supervisor, redirects_streams) {
    TempDir dir;
    Path input = dir.Write("input.txt", "hello\n");
    Path output = dir.path() / "output.txt";
    RunResult result = Run(Shell("read line; echo \"$line-out\"; echo err >&2")
                               .RedirectStdin(input)
                               .RedirectStdout(output)
                               .MergeStderrIntoStdout(true)
                               .Build());
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(ReadFile(output), "hello-out\nerr\n");
}

TEST(supervisor, redirects_with_standard_streams_closed) {
    TempDir dir;
    Path output = dir.path() / "output.txt";
    Path errors = dir.path() / "errors.txt";
    SandboxConfig config = Shell("echo OUT; echo ERR >&2")
                               .RedirectStdout(output)
                               .RedirectStderr(errors)
                               .Build();
    pid_t pid = Fork([&config]() {
        // A launcher started with stdin and stdout closed.
        CHECK_UNIX(close(STDIN_FILENO));
        CHECK_UNIX(close(STDOUT_FILENO));
        _exit(Run(config).exit_code);
    });
    int status;
    CHECK_UNIX(waitpid(pid, &status, 0));
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
    EXPECT_EQ(ReadFile(output), "OUT\n");
    EXPECT_EQ(ReadFile(errors), "ERR\n");
}

TEST(supervisor, separate_stderr_file_is_truncated) {
    TempDir dir;
    Path errors = dir.Write("errors.txt", "stale contents that must go away\n");
    RunResult result = Run(Shell("echo oops >&2").RedirectStderr(errors).Build());
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(ReadFile(errors), "oops\n");
}

TEST(supervisor, environment_overrides) {
    RunResult result = Run(Shell("test \"$FOO\" = bar && test -z \"$CONFINE_TEST_MARKER\"")
                               .SetEnv("FOO", "bar")
                               .EmptyEnv(true)
                               .Build());
    EXPECT_EQ(result.exit_code, 0);
}

TEST(supervisor, environment_is_inherited) {
    setenv("CONFINE_TEST_MARKER", "inherited", 1);
    RunResult result = Run(Shell("test \"$CONFINE_TEST_MARKER\" = inherited").Build());
    unsetenv("CONFINE_TEST_MARKER");
    EXPECT_EQ(result.exit_code, 0);
}

TEST(supervisor, exec_failure_is_not_a_timeout) {
    ResourceBudget limits;
    limits.real_time_ms = 5000;
    auto outcome =
        RunWithStage(ConfigBuilder("/nonexistent/confine-test-program").Limits(limits).Build());
    EXPECT_EQ(outcome.first.exit_code, 128 + SIGABRT);
    EXPECT_FALSE(outcome.first.timed_out);
    ASSERT_TRUE(outcome.second);
    EXPECT_EQ(*outcome.second, Stage::kExecFailed);
}

TEST(supervisor, setup_failure_aborts_child) {
    TempDir dir;
    Path input = dir.Write("input.txt", "hello\n");
    SandboxConfig config = Shell("exit 0").RedirectStdin(input).Build();
    boost::filesystem::remove(input);
    auto outcome = RunWithStage(config);
    EXPECT_EQ(outcome.first.exit_code, 128 + SIGABRT);
    EXPECT_FALSE(outcome.first.timed_out);
    ASSERT_TRUE(outcome.second);
    EXPECT_EQ(*outcome.second, Stage::kOpenStreams);
}

TEST(supervisor, default_filter_denies_kill) {
    RunResult result = Run(Shell("kill -0 $$").Build());
    EXPECT_NE(result.exit_code, 0);
    EXPECT_FALSE(result.timed_out);

    result = Run(Shell("kill -0 $$").SyscallDefault(SyscallAction::kNone).Build());
    EXPECT_EQ(result.exit_code, 0);
}

TEST(supervisor, deny_list_returns_error) {
    TempDir dir;
    RunResult result = Run(Shell("mkdir \"$1/sub\" || exit 9")
                               .AddArg(dir.path().string())
                               .SyscallDefault(SyscallAction::kAllow)
                               .DenySyscall("mkdir")
                               .DenySyscall("mkdirat")
                               .Build());
    EXPECT_EQ(result.exit_code, 9);
    EXPECT_FALSE(Exists(dir.path() / "sub"));
}

TEST(supervisor, kill_list_terminates_program) {
    TempDir dir;
    RunResult result = Run(ConfigBuilder("/bin/mkdir")
                               .AddArg((dir.path() / "sub").string())
                               .SyscallDefault(SyscallAction::kAllow)
                               .KillSyscall("mkdir")
                               .KillSyscall("mkdirat")
                               .Build());
    EXPECT_EQ(result.exit_code, 128 + SIGSYS);
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(Exists(dir.path() / "sub"));
}

TEST(supervisor, kill_default_without_allow_list) {
    ResourceBudget limits;
    limits.real_time_ms = 5000;
    auto outcome = RunWithStage(
        Shell("exit 0").Limits(limits).SyscallDefault(SyscallAction::kKill).Build());
    EXPECT_EQ(outcome.first.exit_code, 128 + SIGSYS);
    EXPECT_FALSE(outcome.first.timed_out);
    ASSERT_TRUE(outcome.second);
    EXPECT_EQ(*outcome.second, Stage::kSyscallFilter);
}

TEST(supervisor, kill_default_ignores_kill_list_entries) {
    auto outcome = RunWithStage(Shell("exit 0")
                                    .SyscallDefault(SyscallAction::kKill)
                                    .KillSyscall("mkdir")
                                    .Build());
    EXPECT_EQ(outcome.first.exit_code, 128 + SIGSYS);
    ASSERT_TRUE(outcome.second);
    EXPECT_EQ(*outcome.second, Stage::kSyscallFilter);
}

TEST(supervisor, deny_default_refuses_exec) {
    ResourceBudget limits;
    limits.real_time_ms = 5000;
    auto outcome = RunWithStage(Shell("exit 0")
                                    .Limits(limits)
                                    .SyscallDefault(SyscallAction::kDeny)
                                    .AllowSyscall("exit_group")
                                    .Build());
    EXPECT_GE(outcome.first.exit_code, 128);
    EXPECT_FALSE(outcome.first.timed_out);
    ASSERT_TRUE(outcome.second);
    EXPECT_EQ(*outcome.second, Stage::kSyscallFilter);
}

TEST(supervisor, read_only_rule_is_enforced) {
    if (confine::LandlockAbiVersion() < 1) {
        GTEST_SKIP() << "landlock is not available";
    }
    TempDir allowed;
    TempDir outside;
    Path inside_file = allowed.Write("file", "inside\n");
    Path outside_file = outside.Write("file", "outside\n");

    ConfigBuilder reader = Shell("read line < \"$1\"");
    reader.AddArg(inside_file.string()).ReadOnly(allowed.path());
    EXPECT_EQ(Run(AllowSystemDirs(reader).Build()).exit_code, 0);

    ConfigBuilder writer = Shell("echo x > \"$1\"");
    writer.AddArg(inside_file.string()).ReadOnly(allowed.path());
    EXPECT_NE(Run(AllowSystemDirs(writer).Build()).exit_code, 0);
    EXPECT_EQ(ReadFile(inside_file), "inside\n");

    ConfigBuilder stranger = Shell("read line < \"$1\"");
    stranger.AddArg(outside_file.string()).ReadOnly(allowed.path());
    EXPECT_NE(Run(AllowSystemDirs(stranger).Build()).exit_code, 0);
}

TEST(supervisor, redirect_target_outside_rules) {
    if (confine::LandlockAbiVersion() < 1) {
        GTEST_SKIP() << "landlock is not available";
    }
    TempDir dir;
    Path output = dir.path() / "output.txt";
    ConfigBuilder builder = Shell("echo redirected");
    builder.RedirectStdout(output);
    RunResult result = Run(AllowSystemDirs(builder).Build());
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(ReadFile(output), "redirected\n");
}

TEST(supervisor, write_only_directory) {
    if (confine::LandlockAbiVersion() < 1) {
        GTEST_SKIP() << "landlock is not available";
    }
    TempDir dir;
    ConfigBuilder builder = Shell("echo data > \"$1/new.txt\"");
    builder.AddArg(dir.path().string()).WriteOnly(dir.path());
    EXPECT_EQ(Run(AllowSystemDirs(builder).Build()).exit_code, 0);
    EXPECT_EQ(ReadFile(dir.path() / "new.txt"), "data\n");
}

TEST(supervisor, drop_capabilities) {
    RunResult result = Run(Shell("grep -q '^CapEff:[[:space:]]*0*$' /proc/self/status")
                               .DropCapabilities(true)
                               .Build());
    EXPECT_EQ(result.exit_code, 0);
}
