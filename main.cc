#include <gflags/gflags.h>
#include <glog/logging.h>
#include <boost/asio.hpp>
#include "src/run_result.h"
#include "src/sandbox_config.h"
#include "src/supervisor.h"
#include "src/util.h"

DEFINE_int64(memory, 0, "The program's maximum memory address space in kilobytes.");
DEFINE_int64(cpu_time, 0, "The program's maximum CPU time in milliseconds.");
DEFINE_int64(real_time, 0, "The program's maximum real-time execution time in milliseconds.");
DEFINE_int64(stack, 0, "The program's stack size limit in kilobytes, negative for unlimited.");
DEFINE_int64(file_size, 0, "The program's maximum file size in kilobytes that it can create or modify.");
DEFINE_int64(processes, 0, "The number of threads, or processes, the program can use.");
DEFINE_string(stdin, "", "Redirect a file to the program's stdin.");
DEFINE_string(stdout, "", "Redirect the program's stdout to a file.");
DEFINE_string(stderr, "", "Redirect the program's stderr to a file.");
DEFINE_bool(stderr_to_stdout, false, "Redirect the program's stderr to stdout.");
DEFINE_string(stats, "", "Save execution statistics to a file.");
DEFINE_string(fs_readonly, "", "Comma-separated paths the program may read and execute.");
DEFINE_string(fs_writeonly, "", "Comma-separated paths the program may write.");
DEFINE_string(fs_readwrite, "", "Comma-separated paths the program may read and write.");
DEFINE_string(env, "", "Comma-separated KEY=VALUE environment overrides.");
DEFINE_bool(empty_env, false, "Do not inherit parent's environment.");
DEFINE_bool(drop_caps, false, "Drop the program's capabilities.");
DEFINE_string(seccomp_default, "", "Default syscall action: allow, deny, kill or none.");
DEFINE_string(seccomp_allow, "", "Comma-separated syscalls to allow.");
DEFINE_string(seccomp_deny, "", "Comma-separated syscalls failing with EPERM.");
DEFINE_string(seccomp_kill, "", "Comma-separated syscalls killing the program.");
DEFINE_bool(mirror_exit_code, true, "Exit with the program's exit code.");

namespace {

Optional<int64_t> FlagValue(const char *name, int64_t value) {
    if (gflags::GetCommandLineFlagInfoOrDie(name).is_default) {
        return boost::none;
    }
    return value;
}

confine::SandboxConfig BuildConfig(int argc, char *argv[]) {
    if (argc < 2) {
        throw confine::ConfigurationError("no program given");
    }
    confine::ConfigBuilder builder(argv[1]);
    for (int i = 2; i < argc; ++i) {
        builder.AddArg(argv[i]);
    }

    confine::ResourceBudget limits;
    limits.memory_kb = FlagValue("memory", FLAGS_memory);
    limits.stack_kb = FlagValue("stack", FLAGS_stack);
    limits.cpu_time_ms = FlagValue("cpu_time", FLAGS_cpu_time);
    limits.real_time_ms = FlagValue("real_time", FLAGS_real_time);
    limits.file_size_kb = FlagValue("file_size", FLAGS_file_size);
    limits.max_processes = FlagValue("processes", FLAGS_processes);
    builder.Limits(limits);

    for (const String &path : SplitList(FLAGS_fs_readonly)) {
        builder.ReadOnly(path);
    }
    for (const String &path : SplitList(FLAGS_fs_writeonly)) {
        builder.WriteOnly(path);
    }
    for (const String &path : SplitList(FLAGS_fs_readwrite)) {
        builder.ReadWrite(path);
    }

    builder.SyscallDefault(confine::ParseSyscallAction(FLAGS_seccomp_default));
    for (const String &name : SplitList(FLAGS_seccomp_allow)) {
        builder.AllowSyscall(name);
    }
    for (const String &name : SplitList(FLAGS_seccomp_deny)) {
        builder.DenySyscall(name);
    }
    for (const String &name : SplitList(FLAGS_seccomp_kill)) {
        builder.KillSyscall(name);
    }

    builder.DropCapabilities(FLAGS_drop_caps);
    if (!FLAGS_stdin.empty()) {
        builder.RedirectStdin(FLAGS_stdin);
    }
    if (!FLAGS_stdout.empty()) {
        builder.RedirectStdout(FLAGS_stdout);
    }
    if (!FLAGS_stderr.empty()) {
        builder.RedirectStderr(FLAGS_stderr);
    }
    builder.MergeStderrIntoStdout(FLAGS_stderr_to_stdout);

    for (const String &assignment : SplitList(FLAGS_env)) {
        Pair<String, String> entry = SplitAssignment(assignment);
        builder.SetEnv(entry.first, entry.second);
    }
    builder.EmptyEnv(FLAGS_empty_env);
    return builder.Build();
}

}  // namespace

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    gflags::SetUsageMessage("[flags] -- program [args...]");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    confine::SandboxConfig config;
    try {
        config = BuildConfig(argc, argv);
    } catch (const confine::ConfigurationError &error) {
        LOG(ERROR) << error.what();
        return 2;
    }

    EventLoop loop;
    confine::Supervisor supervisor(loop, config);
    confine::RunResult result = supervisor.Run();
    if (!FLAGS_stats.empty()) {
        confine::WriteStats(result, FLAGS_stats);
    }
    return FLAGS_mirror_exit_code ? result.exit_code : 0;
}
