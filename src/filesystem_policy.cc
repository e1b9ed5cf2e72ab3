#include "filesystem_policy.h"

#include <fcntl.h>
#include <linux/landlock.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <unistd.h>

// Rights added after Landlock ABI 1, for kernel headers that predate them.
#ifndef LANDLOCK_ACCESS_FS_REFER
#define LANDLOCK_ACCESS_FS_REFER (1ULL << 13)
#endif
#ifndef LANDLOCK_ACCESS_FS_TRUNCATE
#define LANDLOCK_ACCESS_FS_TRUNCATE (1ULL << 14)
#endif
#ifndef LANDLOCK_ACCESS_FS_IOCTL_DEV
#define LANDLOCK_ACCESS_FS_IOCTL_DEV (1ULL << 15)
#endif

namespace {

constexpr uint64_t kReadFile =
    LANDLOCK_ACCESS_FS_READ_FILE | LANDLOCK_ACCESS_FS_EXECUTE;
constexpr uint64_t kReadDir = kReadFile | LANDLOCK_ACCESS_FS_READ_DIR;
constexpr uint64_t kWriteFile = LANDLOCK_ACCESS_FS_WRITE_FILE;
constexpr uint64_t kWriteDir =
    LANDLOCK_ACCESS_FS_WRITE_FILE | LANDLOCK_ACCESS_FS_READ_DIR |
    LANDLOCK_ACCESS_FS_REMOVE_FILE | LANDLOCK_ACCESS_FS_REMOVE_DIR |
    LANDLOCK_ACCESS_FS_MAKE_REG | LANDLOCK_ACCESS_FS_MAKE_DIR;

constexpr uint64_t kAbi1Rights =
    LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_WRITE_FILE |
    LANDLOCK_ACCESS_FS_READ_FILE | LANDLOCK_ACCESS_FS_READ_DIR |
    LANDLOCK_ACCESS_FS_REMOVE_DIR | LANDLOCK_ACCESS_FS_REMOVE_FILE |
    LANDLOCK_ACCESS_FS_MAKE_CHAR | LANDLOCK_ACCESS_FS_MAKE_DIR |
    LANDLOCK_ACCESS_FS_MAKE_REG | LANDLOCK_ACCESS_FS_MAKE_SOCK |
    LANDLOCK_ACCESS_FS_MAKE_FIFO | LANDLOCK_ACCESS_FS_MAKE_BLOCK |
    LANDLOCK_ACCESS_FS_MAKE_SYM;

int CreateRuleset(const landlock_ruleset_attr* attr, size_t size, uint32_t flags) {
  return static_cast<int>(syscall(__NR_landlock_create_ruleset, attr, size, flags));
}

void AddRules(int ruleset_fd, const Vector<Path>& paths,
              confine::AccessMode mode, uint64_t handled) {
  for (const Path& path : paths) {
    int fd = open(path.c_str(), O_PATH | O_CLOEXEC);
    PCHECK(fd >= 0) << "open " << path;
    struct stat sb;
    PCHECK(fstat(fd, &sb) == 0) << "fstat " << path;

    landlock_path_beneath_attr beneath = {};
    beneath.parent_fd = fd;
    beneath.allowed_access = confine::AccessRights(mode, S_ISDIR(sb.st_mode));
    if (beneath.allowed_access & LANDLOCK_ACCESS_FS_WRITE_FILE) {
      beneath.allowed_access |= LANDLOCK_ACCESS_FS_TRUNCATE;
    }
    beneath.allowed_access &= handled;

    PCHECK(syscall(__NR_landlock_add_rule, ruleset_fd,
                   LANDLOCK_RULE_PATH_BENEATH, &beneath, 0) == 0)
        << "landlock_add_rule " << path;
    VLOG(1) << "landlock rule " << path << " access 0x" << std::hex
            << beneath.allowed_access;
    CHECK_UNIX(close(fd));
  }
}

}  // namespace

namespace confine {

uint64_t AccessRights(AccessMode mode, bool is_directory) {
  switch (mode) {
  case AccessMode::kReadOnly:
    return is_directory ? kReadDir : kReadFile;
  case AccessMode::kWriteOnly:
    return is_directory ? kWriteDir : kWriteFile;
  case AccessMode::kReadWrite:
    return is_directory ? (kReadDir | kWriteDir) : (kReadFile | kWriteFile);
  }
  return 0;
}

uint64_t HandledAccessRights(int abi) {
  if (abi < 1) {
    return 0;
  }
  uint64_t handled = kAbi1Rights;
  if (abi >= 2) {
    handled |= LANDLOCK_ACCESS_FS_REFER;
  }
  if (abi >= 3) {
    handled |= LANDLOCK_ACCESS_FS_TRUNCATE;
  }
  // ABI 4 only adds network rights.
  if (abi >= 5) {
    handled |= LANDLOCK_ACCESS_FS_IOCTL_DEV;
  }
  return handled;
}

int LandlockAbiVersion() {
  return CreateRuleset(nullptr, 0, LANDLOCK_CREATE_RULESET_VERSION);
}

FilesystemPolicy::FilesystemPolicy(const FilesystemRules& rules)
    : rules_(rules) {}

void FilesystemPolicy::Activate() const {
  if (empty()) {
    return;
  }
  int abi = LandlockAbiVersion();
  PCHECK(abi >= 1) << "landlock is not available";

  landlock_ruleset_attr attr = {};
  attr.handled_access_fs = HandledAccessRights(abi);
  int ruleset_fd = CreateRuleset(&attr, sizeof(attr), 0);
  PCHECK(ruleset_fd >= 0) << "landlock_create_ruleset";

  AddRules(ruleset_fd, rules_.read_only, AccessMode::kReadOnly, attr.handled_access_fs);
  AddRules(ruleset_fd, rules_.write_only, AccessMode::kWriteOnly, attr.handled_access_fs);
  AddRules(ruleset_fd, rules_.read_write, AccessMode::kReadWrite, attr.handled_access_fs);

  // Required for an unprivileged process to restrict itself.
  CHECK_UNIX(prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0));
  PCHECK(syscall(__NR_landlock_restrict_self, ruleset_fd, 0) == 0)
      << "landlock_restrict_self";
  CHECK_UNIX(close(ruleset_fd));
  VLOG(1) << "landlock ABI " << abi << " active";
}

}  // namespace confine
