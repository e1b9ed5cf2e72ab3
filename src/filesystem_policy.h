#ifndef CONFINE_FILESYSTEM_POLICY_H
#define CONFINE_FILESYSTEM_POLICY_H

#include <cstdint>
#include "sandbox_config.h"

namespace confine {

enum class AccessMode {
  kReadOnly,
  kWriteOnly,
  kReadWrite,
};

// Landlock access rights granted to a single rule.
uint64_t AccessRights(AccessMode mode, bool is_directory);

// Filesystem access rights handled for the given Landlock ABI version, up
// to ABI 5.
uint64_t HandledAccessRights(int abi);

// Landlock ABI version of the running kernel, or a negative value when
// Landlock is unavailable.
int LandlockAbiVersion();

// A least-privilege Landlock ruleset built from the three path lists.
// Activation is irrevocable for the calling process and its descendants.
class FilesystemPolicy {
 public:
  explicit FilesystemPolicy(const FilesystemRules& rules);

  bool empty() const { return rules_.empty(); }

  // Classifies every path, installs the ruleset and restricts the calling
  // process. Does nothing when no paths were given. Aborts on failure.
  void Activate() const;

 private:
  const FilesystemRules& rules_;
};

}  // namespace confine

#endif  // CONFINE_FILESYSTEM_POLICY_H
