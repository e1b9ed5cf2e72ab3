#ifndef CONFINE_CHILD_SETUP_H
#define CONFINE_CHILD_SETUP_H

#include "sandbox_config.h"
#include "util.h"

namespace confine {

// Confines the calling (freshly forked) process and replaces it with the
// target program. Stages run strictly in order and never go back:
//
//   1. resource limits
//   2. syscall filter
//   3. open redirection targets
//   4. filesystem policy
//   5. privilege drop
//   6. standard stream redirection
//   7. environment assembly
//   8. exec
//
// Every stage either succeeds or aborts the process, so the target never
// runs partially confined.
//
// Each stage is written as one byte to |status_fd| when it starts. The
// descriptor is close-on-exec, so a reader sees kExec followed by end of
// file once the target runs, kExecFailed if execve returned, or an earlier
// stage if setup died there.
class ChildSetupPipeline {
 public:
  enum class Stage {
    kStart,
    kResourceLimits,
    kSyscallFilter,
    kOpenStreams,
    kFilesystemPolicy,
    kPrivilegeDrop,
    kRedirectStreams,
    kEnvironment,
    kExec,
    kExecFailed,
  };

  // |status_fd| may be -1 to skip stage reporting.
  ChildSetupPipeline(const SandboxConfig& config, Environment inherited_env,
                     int status_fd = -1);

  [[noreturn]] void Run();

  Stage stage() const { return stage_; }

 private:
  void Advance(Stage next);

  const SandboxConfig& config_;
  const Environment inherited_env_;
  int status_fd_;
  Stage stage_ = Stage::kStart;

  ChildSetupPipeline(const ChildSetupPipeline&) = delete;
  ChildSetupPipeline& operator=(const ChildSetupPipeline&) = delete;
};

const char* StageName(ChildSetupPipeline::Stage stage);

}  // namespace confine

#endif  // CONFINE_CHILD_SETUP_H
