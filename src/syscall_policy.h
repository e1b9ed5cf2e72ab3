#ifndef CONFINE_SYSCALL_POLICY_H
#define CONFINE_SYSCALL_POLICY_H

#include <cstdint>
#include "sandbox_config.h"

namespace confine {

// True if |name| is a syscall of the native architecture.
bool IsKnownSyscall(const String& name);

// libseccomp action for an explicit default or list action. Only kAllow,
// kDeny and kKill map to a filter action.
uint32_t SeccompAction(SyscallAction action);

// Builds and loads the seccomp filter described by |rules|:
//  - kNone installs nothing;
//  - kUnspecified allows everything except kill(2), which fails with EPERM;
//  - otherwise the default action applies, overridden per syscall by the
//    allow, deny (EPERM) and kill (whole process) lists.
// Aborts on failure.
void InstallSyscallFilter(const SyscallRules& rules);

}  // namespace confine

#endif  // CONFINE_SYSCALL_POLICY_H
