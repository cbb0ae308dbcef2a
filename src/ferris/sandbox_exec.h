#ifndef FERRIS_SANDBOX_EXEC_H_
#define FERRIS_SANDBOX_EXEC_H_

#include "sandbox.h"

// We separate this from sandbox.h because this function needs libferris and logging,
//   while sandbox.h is also linked into the small sandbox-exec helper

// SandboxExec runs the helper executable, which calls cjail_exec in a fresh process
//   and sends the cjail_result back through a pipe.
// On error, timekill is set to -1 and oomkill holds errno.
struct cjail_result SandboxExec(const SandboxOptions&);

#endif  // FERRIS_SANDBOX_EXEC_H_
