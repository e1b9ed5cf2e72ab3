#ifndef CONFINE_SANDBOX_CONFIG_H
#define CONFINE_SANDBOX_CONFIG_H

#include <cstdint>
#include <stdexcept>
#include "shim.h"
#include "util.h"

namespace confine {

// Raised before fork when the requested confinement is invalid or
// contradictory. The target is never started.
class ConfigurationError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

enum class SyscallAction {
  kUnspecified,
  kNone,
  kAllow,
  kDeny,
  kKill,
};

// Accepts "allow", "deny", "kill", "none", and "" (unspecified).
SyscallAction ParseSyscallAction(const String& name);
const char* SyscallActionName(SyscallAction action);

// Largest accepted kilobyte budget. Anything above would wrap once
// converted to bytes for setrlimit.
constexpr int64_t kMaxKilobytes = INT64_MAX / 1000;
// Largest accepted millisecond budget. Leaves room in steady_clock's
// nanosecond representation for the watchdog deadline.
constexpr int64_t kMaxMilliseconds = INT64_MAX / 2000000;

struct ResourceBudget {
  Optional<int64_t> memory_kb;
  // Negative means unlimited, zero leaves the inherited limit.
  Optional<int64_t> stack_kb;
  Optional<int64_t> cpu_time_ms;
  Optional<int64_t> real_time_ms;
  Optional<int64_t> file_size_kb;
  Optional<int64_t> max_processes;
};

struct FilesystemRules {
  Vector<Path> read_only;
  Vector<Path> write_only;
  Vector<Path> read_write;

  bool empty() const {
    return read_only.empty() && write_only.empty() && read_write.empty();
  }
};

struct SyscallRules {
  SyscallAction default_action = SyscallAction::kUnspecified;
  Vector<String> always_allow;
  Vector<String> deny;
  Vector<String> kill;
};

struct StreamRedirection {
  Optional<Path> stdin_path;
  Optional<Path> stdout_path;
  Optional<Path> stderr_path;
  bool stderr_to_stdout = false;
};

struct SandboxConfig {
  ResourceBudget limits;
  FilesystemRules filesystem;
  SyscallRules syscalls;
  bool drop_capabilities = false;
  StreamRedirection streams;
  Environment env_overrides;
  bool empty_env = false;
  Path executable;
  // Arguments following argv[0].
  Vector<String> args;
};

// Throws ConfigurationError describing the first problem found.
void Validate(const SandboxConfig& config);

class ConfigBuilder {
 public:
  explicit ConfigBuilder(Path executable);

  ConfigBuilder& Limits(const ResourceBudget& limits);
  ConfigBuilder& ReadOnly(Path path);
  ConfigBuilder& WriteOnly(Path path);
  ConfigBuilder& ReadWrite(Path path);
  ConfigBuilder& SyscallDefault(SyscallAction action);
  ConfigBuilder& AllowSyscall(String name);
  ConfigBuilder& DenySyscall(String name);
  ConfigBuilder& KillSyscall(String name);
  ConfigBuilder& DropCapabilities(bool drop);
  ConfigBuilder& RedirectStdin(Path path);
  ConfigBuilder& RedirectStdout(Path path);
  ConfigBuilder& RedirectStderr(Path path);
  ConfigBuilder& MergeStderrIntoStdout(bool merge);
  ConfigBuilder& SetEnv(String key, String value);
  ConfigBuilder& EmptyEnv(bool empty);
  ConfigBuilder& AddArg(String arg);

  // Validates and returns the finished configuration.
  SandboxConfig Build() const;

 private:
  SandboxConfig config_;
};

}  // namespace confine

#endif  // CONFINE_SANDBOX_CONFIG_H
