#include "supervisor.h"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/bind.hpp>
#include "child_setup.h"
#include "process.h"
#include "util.h"

namespace {

int64_t ToMilliseconds(const timeval& time) {
  return static_cast<int64_t>(time.tv_sec) * 1000 + time.tv_usec / 1000;
}

}  // namespace

namespace confine {

Supervisor::Supervisor(EventLoop& loop, const SandboxConfig& config)
    : loop_(loop),
      config_(config),
      signal_set_(loop, SIGCHLD) {}

Supervisor::~Supervisor() {
  if (status_fd_ >= 0) {
    CHECK_UNIX(close(status_fd_));
  }
}

RunResult Supervisor::Run() {
  CHECK_EQ(child_pid_, -1) << "Supervisor::Run called twice";
  Environment inherited_env = CurrentEnvironment();

  int status_pipe[2];
  CHECK_UNIX(pipe2(status_pipe, O_CLOEXEC));
  status_fd_ = MoveAboveStdio(status_pipe[0]);
  int status_write_fd = MoveAboveStdio(status_pipe[1]);

  start_time_ = std::chrono::steady_clock::now();
  child_pid_ = Fork(loop_, [this, &inherited_env, status_write_fd]() {
    ChildSetupPipeline(config_, inherited_env, status_write_fd).Run();
  });
  CHECK_UNIX(close(status_write_fd));
  LOG(INFO) << "PID " << child_pid_ << " started " << config_.executable;

  if (config_.limits.real_time_ms) {
    watchdog_.reset(new Watchdog(
        loop_, child_pid_, std::chrono::milliseconds(*config_.limits.real_time_ms)));
  }
  StartSignalWait();
  loop_.run();
  CHECK(result_) << "event loop stopped before PID " << child_pid_ << " exited";
  return *result_;
}

void Supervisor::StartSignalWait() {
  signal_set_.async_wait(boost::bind(&Supervisor::HandleSignalWait, this,
                                     boost::asio::placeholders::error));
}

void Supervisor::HandleSignalWait(const boost::system::error_code& error_code) {
  CHECK(!error_code) << error_code.message();
  int status;
  rusage usage;
  pid_t pid = wait4(child_pid_, &status, WNOHANG, &usage);
  CHECK_UNIX(pid);
  if (pid == 0) {
    // SIGCHLD for a stop or continue, keep waiting.
    StartSignalWait();
    return;
  }
  ReadSetupStage();
  Classify(status, usage);
  if (watchdog_) {
    watchdog_->Cancel();
  }
}

void Supervisor::ReadSetupStage() {
  // The only write end closed at exec or with the reaped child, so this
  // reaches end of file without blocking.
  char buffer[16];
  for (;;) {
    ssize_t size = read(status_fd_, buffer, sizeof(buffer));
    if (size < 0 && errno == EINTR) {
      continue;
    }
    CHECK_UNIX(size);
    if (size == 0) {
      break;
    }
    setup_stage_ = static_cast<ChildSetupPipeline::Stage>(buffer[size - 1]);
  }
  CHECK_UNIX(close(status_fd_));
  status_fd_ = -1;
}

void Supervisor::Classify(int status, const rusage& usage) {
  auto elapsed = std::chrono::steady_clock::now() - start_time_;

  Measurement measurement;
  measurement.wall_time_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
  measurement.cpu_time_ms = ToMilliseconds(usage.ru_utime);
  measurement.term_signal = WIFSIGNALED(status) ? WTERMSIG(status) : 0;

  RunResult result;
  result.exit_code = ExitCodeFromStatus(status);
  // ru_maxrss is in KiB.
  result.max_resident_kb = static_cast<int64_t>(usage.ru_maxrss * 1.024);
  result.cpu_time_ms = measurement.cpu_time_ms;
  result.wall_time_ms = measurement.wall_time_ms;
  result.timed_out = ClassifyTimeout(config_.limits, measurement);
  result_ = result;

  LOG(INFO) << "PID " << child_pid_ << " exited with code " << result.exit_code
            << ", wall " << result.wall_time_ms << " ms, cpu "
            << result.cpu_time_ms << " ms, rss " << result.max_resident_kb
            << " kB" << (result.timed_out ? ", timed out" : "");
  if (!setup_stage_) {
    LOG(ERROR) << "PID " << child_pid_ << " died before starting setup";
  } else if (*setup_stage_ != ChildSetupPipeline::Stage::kExec) {
    LOG(ERROR) << "PID " << child_pid_ << " stopped during setup stage '"
               << StageName(*setup_stage_)
               << "', the program did not run; see its stderr for details";
  }
}

}  // namespace confine
