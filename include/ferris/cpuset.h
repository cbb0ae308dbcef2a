#ifndef INCLUDE_FERRIS_CPUSET_H_
#define INCLUDE_FERRIS_CPUSET_H_

#include <sched.h>
#include <cstddef>

// Parses a CPU list such as "0-3,8" or "0-15:2" into set.
// "all" selects every CPU below ncpu, "none" selects nothing.
bool CpusetParse(const char* str, cpu_set_t* set, size_t ncpu);

#endif  // INCLUDE_FERRIS_CPUSET_H_
