#ifndef CONFINE_RESOURCE_LIMITS_H
#define CONFINE_RESOURCE_LIMITS_H

#include <sys/resource.h>
#include "sandbox_config.h"

namespace confine {

struct ResourceLimit {
  int resource;
  rlim_t value;  // applied as both soft and hard limit
};

// The limits to install for |budget|, in installation order. The core dump
// limit is always present and always zero.
Vector<ResourceLimit> PlanResourceLimits(const ResourceBudget& budget);

// Installs the planned limits on the calling process. Aborts on failure.
void ApplyResourceLimits(const ResourceBudget& budget);

}  // namespace confine

#endif  // CONFINE_RESOURCE_LIMITS_H
