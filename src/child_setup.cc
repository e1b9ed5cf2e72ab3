#include "child_setup.h"

#include <errno.h>
#include <unistd.h>
#include "filesystem_policy.h"
#include "privileges.h"
#include "resource_limits.h"
#include "stream_redirector.h"
#include "syscall_policy.h"

namespace confine {

ChildSetupPipeline::ChildSetupPipeline(const SandboxConfig& config,
                                       Environment inherited_env,
                                       int status_fd)
    : config_(config),
      inherited_env_(std::move(inherited_env)),
      status_fd_(status_fd) {}

void ChildSetupPipeline::Advance(Stage next) {
  CHECK_EQ(static_cast<int>(next), static_cast<int>(stage_) + 1)
      << "child setup stages out of order";
  stage_ = next;
  if (status_fd_ < 0) {
    return;
  }
  char byte = static_cast<char>(stage_);
  if (write(status_fd_, &byte, 1) != 1) {
    // Refused by a deny-by-default syscall filter. The reader keeps the
    // last stage that got through.
    status_fd_ = -1;
  }
}

void ChildSetupPipeline::Run() {
  Advance(Stage::kResourceLimits);
  ApplyResourceLimits(config_.limits);

  Advance(Stage::kSyscallFilter);
  InstallSyscallFilter(config_.syscalls);

  Advance(Stage::kOpenStreams);
  StreamRedirector redirector(config_.streams);
  redirector.Open();

  Advance(Stage::kFilesystemPolicy);
  FilesystemPolicy(config_.filesystem).Activate();

  Advance(Stage::kPrivilegeDrop);
  if (config_.drop_capabilities) {
    DropPrivileges();
  }

  Advance(Stage::kRedirectStreams);
  redirector.Apply();

  Advance(Stage::kEnvironment);
  Vector<String> envs = BuildEnvironment(inherited_env_, config_.env_overrides,
                                         !config_.empty_env);

  Advance(Stage::kExec);
  Exec(config_.executable, BuildArguments(config_.executable, config_.args), envs);
  int exec_errno = errno;
  Advance(Stage::kExecFailed);
  errno = exec_errno;
  PLOG(FATAL) << "execve " << config_.executable;
  abort();
}

const char* StageName(ChildSetupPipeline::Stage stage) {
  using Stage = ChildSetupPipeline::Stage;
  switch (stage) {
  case Stage::kStart:
    return "start";
  case Stage::kResourceLimits:
    return "resource limits";
  case Stage::kSyscallFilter:
    return "syscall filter";
  case Stage::kOpenStreams:
    return "open streams";
  case Stage::kFilesystemPolicy:
    return "filesystem policy";
  case Stage::kPrivilegeDrop:
    return "privilege drop";
  case Stage::kRedirectStreams:
    return "redirect streams";
  case Stage::kEnvironment:
    return "environment";
  case Stage::kExec:
    return "exec";
  case Stage::kExecFailed:
    return "exec failed";
  }
  return "?";
}

}  // namespace confine
