#ifndef CONFINE_WATCHDOG_H
#define CONFINE_WATCHDOG_H

#include <sys/types.h>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include "shim.h"

namespace confine {

// One-shot real-time limit for a single child. When the timer expires
// before Cancel() the child is sent SIGKILL.
class Watchdog {
 public:
  Watchdog(EventLoop& loop, pid_t pid, std::chrono::milliseconds limit);

  // Disarms the timer. Must be called before the child is reaped.
  void Cancel();

  bool fired() const { return fired_; }

 private:
  void HandleTimer(const boost::system::error_code& error_code);

 private:
  const pid_t pid_;
  boost::asio::steady_timer timer_;
  bool cancelled_ = false;
  bool fired_ = false;
};

}  // namespace confine

#endif  // CONFINE_WATCHDOG_H
