#include "sandbox_config.h"

#include <unistd.h>
#include <boost/format.hpp>
#include "syscall_policy.h"

namespace {

using confine::ConfigurationError;

void CheckPositive(const Optional<int64_t>& value, const char* name) {
  if (value && *value <= 0) {
    throw ConfigurationError(
        (boost::format("%s must be positive, got %d") % name % *value).str());
  }
}

void CheckAtMost(const Optional<int64_t>& value, int64_t limit, const char* name) {
  if (value && *value > limit) {
    throw ConfigurationError(
        (boost::format("%s must be at most %d, got %d") % name % limit % *value).str());
  }
}

void CheckRulePaths(const Vector<Path>& paths, const char* kind) {
  for (const Path& path : paths) {
    if (!Exists(path)) {
      throw ConfigurationError(
          (boost::format("%s path %s does not exist") % kind % path).str());
    }
  }
}

void CheckSyscalls(const Vector<String>& names, const char* kind) {
  for (const String& name : names) {
    if (!confine::IsKnownSyscall(name)) {
      throw ConfigurationError(
          (boost::format("unknown syscall '%s' in %s list") % name % kind).str());
    }
  }
}

void CheckOutputPath(const Optional<Path>& path, const char* stream) {
  if (path && IsDirectory(*path)) {
    throw ConfigurationError(
        (boost::format("%s destination %s is a directory") % stream % *path).str());
  }
}

}  // namespace

namespace confine {

SyscallAction ParseSyscallAction(const String& name) {
  if (name.empty()) {
    return SyscallAction::kUnspecified;
  }
  if (name == "none") {
    return SyscallAction::kNone;
  }
  if (name == "allow") {
    return SyscallAction::kAllow;
  }
  if (name == "deny") {
    return SyscallAction::kDeny;
  }
  if (name == "kill") {
    return SyscallAction::kKill;
  }
  throw ConfigurationError("unknown syscall default action '" + name + "'");
}

const char* SyscallActionName(SyscallAction action) {
  switch (action) {
  case SyscallAction::kUnspecified:
    return "unspecified";
  case SyscallAction::kNone:
    return "none";
  case SyscallAction::kAllow:
    return "allow";
  case SyscallAction::kDeny:
    return "deny";
  case SyscallAction::kKill:
    return "kill";
  }
  return "?";
}

void Validate(const SandboxConfig& config) {
  if (config.executable.empty()) {
    throw ConfigurationError("no program given");
  }

  const ResourceBudget& limits = config.limits;
  CheckPositive(limits.memory_kb, "memory");
  CheckPositive(limits.cpu_time_ms, "cpu time");
  CheckPositive(limits.real_time_ms, "real time");
  CheckPositive(limits.file_size_kb, "file size");
  CheckPositive(limits.max_processes, "process count");
  CheckAtMost(limits.memory_kb, kMaxKilobytes, "memory");
  CheckAtMost(limits.stack_kb, kMaxKilobytes, "stack");
  CheckAtMost(limits.file_size_kb, kMaxKilobytes, "file size");
  CheckAtMost(limits.cpu_time_ms, kMaxMilliseconds, "cpu time");
  CheckAtMost(limits.real_time_ms, kMaxMilliseconds, "real time");

  CheckRulePaths(config.filesystem.read_only, "read-only");
  CheckRulePaths(config.filesystem.write_only, "write-only");
  CheckRulePaths(config.filesystem.read_write, "read-write");

  const SyscallRules& syscalls = config.syscalls;
  bool has_lists = !syscalls.always_allow.empty() || !syscalls.deny.empty() ||
                   !syscalls.kill.empty();
  if (has_lists && (syscalls.default_action == SyscallAction::kUnspecified ||
                    syscalls.default_action == SyscallAction::kNone)) {
    throw ConfigurationError(
        (boost::format("syscall lists require an explicit default action, got %s") %
         SyscallActionName(syscalls.default_action)).str());
  }
  CheckSyscalls(syscalls.always_allow, "allow");
  CheckSyscalls(syscalls.deny, "deny");
  CheckSyscalls(syscalls.kill, "kill");
  HashMap<String, String> seen;
  auto check_unique = [&seen](const Vector<String>& names, const String& kind) {
    for (const String& name : names) {
      auto inserted = seen.emplace(name, kind);
      if (!inserted.second && inserted.first->second != kind) {
        throw ConfigurationError(
            (boost::format("syscall '%s' is in both the %s and %s lists") % name %
             inserted.first->second % kind).str());
      }
    }
  };
  check_unique(syscalls.always_allow, "allow");
  check_unique(syscalls.deny, "deny");
  check_unique(syscalls.kill, "kill");

  const StreamRedirection& streams = config.streams;
  if (streams.stdin_path) {
    const Path& path = *streams.stdin_path;
    if (!Exists(path) || IsDirectory(path)) {
      throw ConfigurationError(
          (boost::format("stdin source %s is not a file") % path).str());
    }
    if (access(path.c_str(), R_OK) != 0) {
      throw ConfigurationError(
          (boost::format("stdin source %s is not readable") % path).str());
    }
  }
  CheckOutputPath(streams.stdout_path, "stdout");
  CheckOutputPath(streams.stderr_path, "stderr");

  for (const auto& entry : config.env_overrides) {
    if (entry.first.empty() || entry.first.find('=') != String::npos) {
      throw ConfigurationError("invalid environment variable name '" +
                               entry.first + "'");
    }
  }
}

ConfigBuilder::ConfigBuilder(Path executable) {
  config_.executable = std::move(executable);
}

ConfigBuilder& ConfigBuilder::Limits(const ResourceBudget& limits) {
  config_.limits = limits;
  return *this;
}

ConfigBuilder& ConfigBuilder::ReadOnly(Path path) {
  config_.filesystem.read_only.push_back(std::move(path));
  return *this;
}

ConfigBuilder& ConfigBuilder::WriteOnly(Path path) {
  config_.filesystem.write_only.push_back(std::move(path));
  return *this;
}

ConfigBuilder& ConfigBuilder::ReadWrite(Path path) {
  config_.filesystem.read_write.push_back(std::move(path));
  return *this;
}

ConfigBuilder& ConfigBuilder::SyscallDefault(SyscallAction action) {
  config_.syscalls.default_action = action;
  return *this;
}

ConfigBuilder& ConfigBuilder::AllowSyscall(String name) {
  config_.syscalls.always_allow.push_back(std::move(name));
  return *this;
}

ConfigBuilder& ConfigBuilder::DenySyscall(String name) {
  config_.syscalls.deny.push_back(std::move(name));
  return *this;
}

ConfigBuilder& ConfigBuilder::KillSyscall(String name) {
  config_.syscalls.kill.push_back(std::move(name));
  return *this;
}

ConfigBuilder& ConfigBuilder::DropCapabilities(bool drop) {
  config_.drop_capabilities = drop;
  return *this;
}

ConfigBuilder& ConfigBuilder::RedirectStdin(Path path) {
  config_.streams.stdin_path = std::move(path);
  return *this;
}

ConfigBuilder& ConfigBuilder::RedirectStdout(Path path) {
  config_.streams.stdout_path = std::move(path);
  return *this;
}

ConfigBuilder& ConfigBuilder::RedirectStderr(Path path) {
  config_.streams.stderr_path = std::move(path);
  return *this;
}

ConfigBuilder& ConfigBuilder::MergeStderrIntoStdout(bool merge) {
  config_.streams.stderr_to_stdout = merge;
  return *this;
}

ConfigBuilder& ConfigBuilder::SetEnv(String key, String value) {
  config_.env_overrides.emplace_back(std::move(key), std::move(value));
  return *this;
}

ConfigBuilder& ConfigBuilder::EmptyEnv(bool empty) {
  config_.empty_env = empty;
  return *this;
}

ConfigBuilder& ConfigBuilder::AddArg(String arg) {
  config_.args.push_back(std::move(arg));
  return *this;
}

SandboxConfig ConfigBuilder::Build() const {
  Validate(config_);
  return config_;
}

}  // namespace confine
