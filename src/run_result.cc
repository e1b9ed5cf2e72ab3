#include "run_result.h"

#include <signal.h>
#include <sys/wait.h>
#include <algorithm>
#include <boost/format.hpp>
#include "util.h"

namespace confine {

double WithTolerance(int64_t measured_ms) {
  return std::max(measured_ms * 1.02, measured_ms + 15.0);
}

bool ClassifyTimeout(const ResourceBudget& budget, const Measurement& measurement) {
  const Optional<int64_t>& real_time = budget.real_time_ms;
  const Optional<int64_t>& cpu_time = budget.cpu_time_ms;
  if (real_time && measurement.wall_time_ms >= *real_time) {
    return true;
  }
  if (cpu_time && measurement.cpu_time_ms >= *cpu_time) {
    return true;
  }
  if (measurement.term_signal == SIGKILL) {
    if (real_time && WithTolerance(measurement.wall_time_ms) >= *real_time) {
      return true;
    }
    if (cpu_time && WithTolerance(measurement.cpu_time_ms) >= *cpu_time) {
      return true;
    }
  }
  return false;
}

int ExitCodeFromStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  CHECK(WIFSIGNALED(status)) << "unexpected wait status " << status;
  return 128 + WTERMSIG(status);
}

String FormatStats(const RunResult& result) {
  return (boost::format("{\"exit_code\": %d, \"max_rss\": %d, \"cpu_time\": %d, "
                        "\"real_time\": %d, \"timeouted\": %s}") %
          result.exit_code % result.max_resident_kb % result.cpu_time_ms %
          result.wall_time_ms % (result.timed_out ? "true" : "false")).str();
}

void WriteStats(const RunResult& result, const Path& file) {
  WriteFile(file, FormatStats(result));
}

}  // namespace confine
