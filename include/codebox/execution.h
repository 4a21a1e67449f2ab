#ifndef INCLUDE_CODEBOX_EXECUTION_H_
#define INCLUDE_CODEBOX_EXECUTION_H_

#include <map>
#include <string>
#include <memory>
#include <functional>

#include <nlohmann/json_fwd.hpp>
#include <codebox/filter.h>

extern int kMaxParallel;
// program that runs the submitted script
extern std::string kInterpreter;
// bytes; cap on every collected file
extern long kMaxCollectedFileSize;
// worker i runs its jailed programs as uid/gid kUidBase + i
constexpr int kUidBase = 50000;

// the status of a finished execution; success iff OK
#define ENUM_EXECUTION_STATUS_ \
  X(OK, "OK", "Exited normally") \
  X(REJECTED, "FR", "Security violation") \
  X(ENV_ERROR, "EE", "Execution environment error") \
  X(TIMEOUT, "TLE", "Execution timeout") \
  X(RESOURCE_LIMIT, "MLE", "Memory limit exceeded") \
  X(OUTPUT_LIMIT, "OLE", "Output limit exceeded") \
  X(RUNTIME_FAULT, "RE", "Runtime error (exited with nonzero status)") \
  X(SIGNALED, "SIG", "Runtime error (exited with signal)") \
  X(SANDBOX_ERROR, "JE", "Sandbox error")
enum class ExecutionStatus {
#define X(name, abr, desc) name,
  ENUM_EXECUTION_STATUS_
#undef X
};

struct ExecutionLimits {
  long wall_time; // us
  long memory; // KiB
  long output; // KiB; per file, stdout/stderr included
  int proc_num;
  int file_num;

  ExecutionLimits() :
      wall_time(30L * 1'000'000),
      memory(256L * 1024),
      output(16L * 1024),
      proc_num(16),
      file_num(64) {}
};

class ExecutionResult;

class ExecutionRequest {
 public:
  std::string code;
  // called from the worker thread once the result is ready; should not block
  std::function<void(const ExecutionRequest&, const ExecutionResult&)> report_result;

  ExecutionRequest() {}
  explicit ExecutionRequest(std::string code_) : code(std::move(code_)) {}
};

class ExecutionResult {
 public:
  std::string execution_id;
  std::string output, error;
  double execution_time; // seconds, rounded to ms
  std::map<std::string, std::string> files;
  bool success;
  int return_code;
  ExecutionStatus status;

  ExecutionResult() :
      execution_time(0), success(false), return_code(-1),
      status(ExecutionStatus::SANDBOX_ERROR) {}
};

nlohmann::json ResultToJson(const ExecutionResult&);

class Executor {
  PatternFilter filter_;
  ExecutionLimits limits_;
 public:
  Executor(std::shared_ptr<const DenyRuleSet> rules, const ExecutionLimits& limits) :
      filter_(std::move(rules)), limits_(limits) {}

  const ExecutionLimits& Limits() const { return limits_; }
  // Filter -> environment -> jailed run -> assemble; never leaves a box behind
  ExecutionResult Execute(const ExecutionRequest&, int uid = kUidBase) const;
};

// Call from main thread; with loop = false, return once the queue is drained
void WorkLoop(const Executor&, bool loop = true);

size_t CurrentQueueSize();

// Called from any thread
// 0 = no limit; return false only if queue size exceeded
bool PushRequest(ExecutionRequest&&, size_t max_queue = 0);

#endif  // INCLUDE_CODEBOX_EXECUTION_H_
