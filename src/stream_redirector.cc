#include "stream_redirector.h"

#include <fcntl.h>
#include <unistd.h>
#include "util.h"

namespace {

int OpenTarget(const Optional<Path>& path, int flags) {
  if (!path) {
    return -1;
  }
  int fd = open(path->c_str(), flags | O_CLOEXEC, 0644);
  PCHECK(fd >= 0) << "open " << *path;
  // A launcher started with closed standard streams hands out 0 to 2 here.
  // Targets must not occupy a slot another target is moved onto.
  return MoveAboveStdio(fd);
}

void MoveOnto(int& fd, int target) {
  if (fd < 0) {
    return;
  }
  CHECK_UNIX(dup2(fd, target));
  CHECK_UNIX(close(fd));
  fd = -1;
}

}  // namespace

namespace confine {

StreamRedirector::StreamRedirector(const StreamRedirection& streams)
    : streams_(streams) {}

StreamRedirector::~StreamRedirector() {
  for (int fd : {stdin_fd_, stdout_fd_, stderr_fd_}) {
    if (fd >= 0) {
      close(fd);
    }
  }
}

void StreamRedirector::Open() {
  stdin_fd_ = OpenTarget(streams_.stdin_path, O_RDONLY);
  stdout_fd_ = OpenTarget(streams_.stdout_path, O_WRONLY | O_CREAT | O_TRUNC);
  stderr_fd_ = OpenTarget(streams_.stderr_path, O_WRONLY | O_CREAT | O_TRUNC);
}

void StreamRedirector::Apply() {
  MoveOnto(stdin_fd_, STDIN_FILENO);
  MoveOnto(stdout_fd_, STDOUT_FILENO);
  MoveOnto(stderr_fd_, STDERR_FILENO);
  if (streams_.stderr_to_stdout) {
    CHECK_UNIX(dup2(STDOUT_FILENO, STDERR_FILENO));
  }
}

}  // namespace confine
