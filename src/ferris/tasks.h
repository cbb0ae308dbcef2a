#ifndef FERRIS_TASKS_H_
#define FERRIS_TASKS_H_

#include <string>
#include <vector>

#include <cjail/cjail.h>
#include <ferris/tasks.h>
#include <ferris/workspace.h>
#include "sandbox.h"

struct Task {
  TaskType type;
  // staged input name for RUN
  std::string input;
};

// We're not sure whether cjail is thread-safe. Thus, we use fork() for every RunTask,
//  and hand the result back through a pipe.

// RunTask blocks until one of the kMaxParallel slots is free,
//   then returns a handle to obtain the result (-1 if error)
int RunTask(const Workspace&, const Task&);

// Blocks until the task finishes; the handle is invalid afterwards
struct cjail_result WaitResult(int handle);

// exited normally with status 0
bool TaskSucceeded(const struct cjail_result&);
// logging
std::string DescribeResult(const struct cjail_result&);

namespace internal {

// /usr/bin/env timeout --kill-after=<kKillAfter>s <timeout>s <command split on whitespace>
std::vector<std::string> TimeoutCommand(long timeout, const std::string& command);
// sandbox settings of each step, without output redirection
SandboxOptions BuildOptions(const Workspace&, int uid, int cpuid);
SandboxOptions RunOptions(const Workspace&, const std::string& input, int uid, int cpuid);

} // internal

#endif // FERRIS_TASKS_H_
