#ifndef CONFINE_SUPERVISOR_H
#define CONFINE_SUPERVISOR_H

#include <sys/resource.h>
#include <sys/types.h>
#include <boost/asio.hpp>
#include <chrono>
#include "child_setup.h"
#include "run_result.h"
#include "sandbox_config.h"
#include "watchdog.h"

namespace confine {

// Forks the confined child, watches it and classifies how it ended.
class Supervisor {
 public:
  // SIGCHLD is registered here, before any child exists, so that an early
  // exit cannot be missed.
  Supervisor(EventLoop& loop, const SandboxConfig& config);
  ~Supervisor();

  // Runs the child to completion. May only be called once.
  RunResult Run();

  // Last setup stage the child reported. kExec means the target program
  // replaced the child; anything else means it never ran.
  Optional<ChildSetupPipeline::Stage> setup_stage() const { return setup_stage_; }

 private:
  void StartSignalWait();
  void HandleSignalWait(const boost::system::error_code& error_code);
  void ReadSetupStage();
  void Classify(int status, const rusage& usage);

 private:
  EventLoop& loop_;
  const SandboxConfig& config_;
  boost::asio::signal_set signal_set_;
  pid_t child_pid_ = -1;
  int status_fd_ = -1;
  Optional<ChildSetupPipeline::Stage> setup_stage_;
  Box<Watchdog> watchdog_;
  std::chrono::steady_clock::time_point start_time_;
  Optional<RunResult> result_;
};

}  // namespace confine

#endif  // CONFINE_SUPERVISOR_H
