#include "watchdog.h"

#include <errno.h>
#include <signal.h>
#include <boost/bind.hpp>

namespace confine {

Watchdog::Watchdog(EventLoop& loop, pid_t pid, std::chrono::milliseconds limit)
    : pid_(pid),
      timer_(loop) {
  timer_.expires_from_now(limit);
  timer_.async_wait(boost::bind(&Watchdog::HandleTimer, this,
                                boost::asio::placeholders::error));
}

void Watchdog::Cancel() {
  cancelled_ = true;
  timer_.cancel();
}

void Watchdog::HandleTimer(const boost::system::error_code& error_code) {
  // An expiry already queued when Cancel() ran must not signal a reaped pid.
  if (error_code == boost::asio::error::operation_aborted || cancelled_) {
    return;
  }
  CHECK(!error_code) << error_code.message();
  LOG(WARNING) << "PID " << pid_ << " exceeded its real time limit, killing";
  fired_ = true;
  // The child is not reaped yet, so the pid cannot have been reused.
  PCHECK(kill(pid_, SIGKILL) == 0 || errno == ESRCH) << "kill " << pid_;
}

}  // namespace confine
