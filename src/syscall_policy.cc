#include "syscall_policy.h"

#include <errno.h>
#include <string.h>
#include <seccomp.h>

namespace {

void AddRule(scmp_filter_ctx ctx, uint32_t action, int syscall_number,
             const String& name) {
  int rc = seccomp_rule_add(ctx, action, syscall_number, 0);
  CHECK_EQ(rc, 0) << "seccomp_rule_add " << name << ": " << strerror(-rc);
}

void AddRules(scmp_filter_ctx ctx, uint32_t default_action, uint32_t action,
              const Vector<String>& names) {
  // libseccomp rejects rules that repeat the default action.
  if (action == default_action) {
    return;
  }
  for (const String& name : names) {
    int syscall_number = seccomp_syscall_resolve_name(name.c_str());
    CHECK_NE(syscall_number, __NR_SCMP_ERROR) << "unknown syscall " << name;
    AddRule(ctx, action, syscall_number, name);
  }
}

}  // namespace

namespace confine {

bool IsKnownSyscall(const String& name) {
  return seccomp_syscall_resolve_name(name.c_str()) != __NR_SCMP_ERROR;
}

uint32_t SeccompAction(SyscallAction action) {
  switch (action) {
  case SyscallAction::kAllow:
    return SCMP_ACT_ALLOW;
  case SyscallAction::kDeny:
    return SCMP_ACT_ERRNO(EPERM);
  case SyscallAction::kKill:
    return SCMP_ACT_KILL_PROCESS;
  default:
    LOG(FATAL) << "no seccomp action for " << SyscallActionName(action);
  }
  return SCMP_ACT_KILL_PROCESS;
}

void InstallSyscallFilter(const SyscallRules& rules) {
  if (rules.default_action == SyscallAction::kNone) {
    return;
  }

  scmp_filter_ctx ctx;
  if (rules.default_action == SyscallAction::kUnspecified) {
    ctx = seccomp_init(SCMP_ACT_ALLOW);
    CHECK(ctx != nullptr) << "seccomp_init";
    AddRule(ctx, SCMP_ACT_ERRNO(EPERM), SCMP_SYS(kill), "kill");
  } else {
    uint32_t default_action = SeccompAction(rules.default_action);
    ctx = seccomp_init(default_action);
    CHECK(ctx != nullptr) << "seccomp_init";
    AddRules(ctx, default_action, SeccompAction(SyscallAction::kAllow), rules.always_allow);
    AddRules(ctx, default_action, SeccompAction(SyscallAction::kDeny), rules.deny);
    AddRules(ctx, default_action, SeccompAction(SyscallAction::kKill), rules.kill);
  }

  int rc = seccomp_load(ctx);
  seccomp_release(ctx);
  CHECK_EQ(rc, 0) << "seccomp_load: " << strerror(-rc);
  VLOG(1) << "seccomp filter loaded, default "
          << SyscallActionName(rules.default_action);
}

}  // namespace confine
