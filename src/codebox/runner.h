#ifndef CODEBOX_RUNNER_H_
#define CODEBOX_RUNNER_H_

#include <string>

#include <cjail/cjail.h>
#include <codebox/execution.h>
#include "sandbox.h"
#include "environment.h"

// exit code reported for a wall-clock kill, as timeout(1) does
constexpr int kTimeoutExitCode = 124;
// added to the memory ceiling for the jail, so that a program hitting the
//   limit is distinguishable from one that merely crashed
constexpr long kMemoryMargin = 8 * 1024; // KiB

struct RawExecutionOutcome {
  std::string output, error;
  int exit_code;
  int signal; // 0 if not killed by a signal
  bool timed_out;
  bool resource_limited;
  bool output_limited;
  bool sandbox_error;
  long duration; // us
  long max_vss, max_rss; // KiB

  RawExecutionOutcome() :
      exit_code(-1), signal(0),
      timed_out(false), resource_limited(false), output_limited(false), sandbox_error(false),
      duration(0), max_vss(0), max_rss(0) {}
};

// jail settings for one run; fds are not filled in
SandboxOptions ExecutionSandboxOptions(const ExecutionEnvironment&, const ExecutionLimits&, int uid);

// whether the last non-empty line of stderr is an uncaught MemoryError; RLIMIT_AS
//   refuses a single oversized allocation before the peak memory ever grows
bool EndsWithMemoryError(const std::string& stderr_text);

// classify a finished jail; output / error are not touched
// captured = largest capture file size in bytes, for output limit detection
// memory_error = the program died of an uncaught MemoryError (see EndsWithMemoryError)
RawExecutionOutcome InterpretResult(const struct cjail_result&, const ExecutionLimits&,
                                    long captured = 0, bool memory_error = false);

// Write source into the box and run it under limits as uid.
// Blocks for at most limits.wall_time plus jail teardown.
RawExecutionOutcome RunProcess(const std::string& source, const ExecutionEnvironment&,
                               const ExecutionLimits&, int uid);

#endif  // CODEBOX_RUNNER_H_
