#ifndef CODEBOX_SANDBOX_EXEC_H_
#define CODEBOX_SANDBOX_EXEC_H_

#include "sandbox.h"

// We separate this from sandbox.h because this function needs libcodebox and other logging functions,
//   while we need to keep sandbox.h as small as possible

// SandboxExec forks and execs the sandbox-exec helper, which runs cjail_exec once and
//   reports the cjail_result back through a pipe. cjail is not known to be thread-safe,
//   so every worker thread gets its own helper process.
// before SandboxExec:
// 1. create the box with an empty workdir writable by uid and the bind mount points
// 2. pre-open the capture files outside workdir with O_CLOEXEC and assign them to
//    fd_output/fd_error, so the jailed program cannot reopen them and no other
//    worker's helper inherits them
// on error, timekill = -1 and oomkill = errno
struct cjail_result SandboxExec(const SandboxOptions&);

#endif  // CODEBOX_SANDBOX_EXEC_H_
