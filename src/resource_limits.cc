#include "resource_limits.h"

namespace {

const char* ResourceName(int resource) {
  switch (resource) {
  case RLIMIT_AS:
    return "RLIMIT_AS";
  case RLIMIT_STACK:
    return "RLIMIT_STACK";
  case RLIMIT_CPU:
    return "RLIMIT_CPU";
  case RLIMIT_FSIZE:
    return "RLIMIT_FSIZE";
  case RLIMIT_NPROC:
    return "RLIMIT_NPROC";
  case RLIMIT_CORE:
    return "RLIMIT_CORE";
  default:
    return "RLIMIT_?";
  }
}

rlim_t KilobytesToBytes(int64_t kilobytes) {
  return static_cast<rlim_t>(kilobytes) * 1000;
}

}  // namespace

namespace confine {

Vector<ResourceLimit> PlanResourceLimits(const ResourceBudget& budget) {
  Vector<ResourceLimit> limits;
  if (budget.memory_kb) {
    limits.push_back({RLIMIT_AS, KilobytesToBytes(*budget.memory_kb)});
  }
  if (budget.stack_kb && *budget.stack_kb > 0) {
    limits.push_back({RLIMIT_STACK, KilobytesToBytes(*budget.stack_kb)});
  } else if (budget.stack_kb && *budget.stack_kb < 0) {
    limits.push_back({RLIMIT_STACK, RLIM_INFINITY});
  }
  if (budget.cpu_time_ms) {
    // Rounded up so that sub-second budgets still get a whole second.
    rlim_t milliseconds = static_cast<rlim_t>(*budget.cpu_time_ms);
    rlim_t seconds = milliseconds / 1000 + (milliseconds % 1000 != 0);
    limits.push_back({RLIMIT_CPU, seconds});
  }
  if (budget.file_size_kb) {
    limits.push_back({RLIMIT_FSIZE, KilobytesToBytes(*budget.file_size_kb)});
  }
  if (budget.max_processes) {
    limits.push_back({RLIMIT_NPROC, static_cast<rlim_t>(*budget.max_processes)});
  }
  limits.push_back({RLIMIT_CORE, 0});
  return limits;
}

void ApplyResourceLimits(const ResourceBudget& budget) {
  for (const ResourceLimit& limit : PlanResourceLimits(budget)) {
    rlimit value = {limit.value, limit.value};
    PCHECK(setrlimit(limit.resource, &value) == 0)
        << "setrlimit " << ResourceName(limit.resource) << " " << limit.value;
    VLOG(1) << ResourceName(limit.resource) << " = " << limit.value;
  }
}

}  // namespace confine
