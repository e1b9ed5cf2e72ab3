#ifndef CONFINE_STREAM_REDIRECTOR_H
#define CONFINE_STREAM_REDIRECTOR_H

#include "sandbox_config.h"

namespace confine {

// Redirects the standard streams in two halves: Open() before the
// filesystem policy is active, Apply() after it.
class StreamRedirector {
 public:
  explicit StreamRedirector(const StreamRedirection& streams);
  ~StreamRedirector();

  // Opens the configured files. stdout and stderr targets are created with
  // mode 0644 and truncated.
  void Open();

  // Moves the opened files onto descriptors 0, 1 and 2, then merges stderr
  // into stdout if requested.
  void Apply();

 private:
  const StreamRedirection& streams_;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;

  StreamRedirector(const StreamRedirector&) = delete;
  StreamRedirector& operator=(const StreamRedirector&) = delete;
};

}  // namespace confine

#endif  // CONFINE_STREAM_REDIRECTOR_H
