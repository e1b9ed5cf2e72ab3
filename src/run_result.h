#ifndef CONFINE_RUN_RESULT_H
#define CONFINE_RUN_RESULT_H

#include <cstdint>
#include "sandbox_config.h"

namespace confine {

struct RunResult {
  // Exit status, or 128 + signal for a signal death.
  int exit_code = 0;
  int64_t max_resident_kb = 0;
  int64_t cpu_time_ms = 0;
  int64_t wall_time_ms = 0;
  bool timed_out = false;
};

struct Measurement {
  int64_t wall_time_ms = 0;
  int64_t cpu_time_ms = 0;
  // Terminating signal, or 0 if the child exited.
  int term_signal = 0;
};

// Slack added to measurements of a SIGKILLed child: the larger of 2% and
// 15 ms.
double WithTolerance(int64_t measured_ms);

// Decides whether the run exceeded its time budget. A SIGKILL death (sent by
// the watchdog or by the kernel's CPU limit) is re-checked with tolerance,
// but only when the exact comparison did not already decide.
bool ClassifyTimeout(const ResourceBudget& budget, const Measurement& measurement);

// Translates a wait status into an exit code.
int ExitCodeFromStatus(int status);

// Flat JSON record with keys exit_code, max_rss, cpu_time, real_time and
// timeouted.
String FormatStats(const RunResult& result);

void WriteStats(const RunResult& result, const Path& file);

}  // namespace confine

#endif  // CONFINE_RUN_RESULT_H
