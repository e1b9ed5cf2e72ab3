#include "privileges.h"

#include <errno.h>
#include <sys/capability.h>
#include <sys/prctl.h>
#include "shim.h"

namespace confine {

void DropPrivileges() {
  cap_t caps = cap_init();
  PCHECK(caps != nullptr) << "cap_init";
  int rc = cap_set_proc(caps);
  int saved_errno = errno;
  CHECK_UNIX(cap_free(caps));
  errno = saved_errno;
  PCHECK(rc == 0) << "cap_set_proc";
  CHECK_UNIX(prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0));
  VLOG(1) << "capabilities dropped";
}

}  // namespace confine
