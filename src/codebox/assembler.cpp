#include "assembler.h"

#include <cmath>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"

long kMaxCollectedFileSize = 1024 * 1024;

namespace {

inline double RoundSeconds(long us) {
  return std::round(us / 1000.0) / 1000.0;
}

inline std::string WithStderr(std::string message, const std::string& stderr_text) {
  if (stderr_text.empty()) return message;
  message += '\n';
  message += stderr_text;
  return message;
}

ExecutionStatus GetStatus(const RawExecutionOutcome& outcome) {
  if (outcome.sandbox_error) return ExecutionStatus::SANDBOX_ERROR;
  if (outcome.timed_out) return ExecutionStatus::TIMEOUT;
  if (outcome.resource_limited) return ExecutionStatus::RESOURCE_LIMIT;
  if (outcome.output_limited) return ExecutionStatus::OUTPUT_LIMIT;
  if (outcome.signal) return ExecutionStatus::SIGNALED;
  if (outcome.exit_code != 0) return ExecutionStatus::RUNTIME_FAULT;
  return ExecutionStatus::OK;
}

std::string ErrorText(ExecutionStatus status, const RawExecutionOutcome& outcome,
                      const ExecutionLimits& lim, std::string stderr_text) {
  switch (status) {
    case ExecutionStatus::OK: [[fallthrough]];
    case ExecutionStatus::RUNTIME_FAULT: return stderr_text;
    case ExecutionStatus::TIMEOUT:
      return WithStderr(fmt::format("Execution timeout: code execution exceeded {:g} second limit",
                                    lim.wall_time / 1e6), stderr_text);
    case ExecutionStatus::RESOURCE_LIMIT:
      return WithStderr(fmt::format("Memory limit exceeded: code execution exceeded {:g} MB limit",
                                    lim.memory / 1024.0), stderr_text);
    case ExecutionStatus::OUTPUT_LIMIT:
      return WithStderr(fmt::format("Output limit exceeded: code execution exceeded {} KB limit",
                                    lim.output), stderr_text);
    case ExecutionStatus::SIGNALED:
      return WithStderr(fmt::format("Runtime error: terminated by signal {} ({})",
                                    outcome.signal, SignalName(outcome.signal)), stderr_text);
    case ExecutionStatus::SANDBOX_ERROR: return "Execution failed: sandbox error";
    case ExecutionStatus::REJECTED: [[fallthrough]];
    case ExecutionStatus::ENV_ERROR: break;
  }
  __builtin_unreachable();
}

} // namespace

std::map<std::string, std::string> CollectProducedFiles(const ExecutionEnvironment& env) {
  std::map<std::string, std::string> files;
  std::error_code ec;
  fs::directory_iterator it(env.Workdir(), ec), end;
  if (ec) {
    spdlog::warn("Failed listing {}: {}", env.Workdir().c_str(), ec.message());
    return files;
  }
  for (; it != end; it.increment(ec)) {
    const fs::path& path = it->path();
    std::string name = path.filename();
    if (IsBoxScript(name)) continue; // skip the script file itself
    // symlink_status: never follow a link planted by the program
    if (!fs::is_regular_file(it->symlink_status(ec))) continue;
    bool truncated = false;
    std::string error;
    auto content = ReadFile(path, kMaxCollectedFileSize, &truncated, &error);
    if (!content) {
      files[name] = "<Error reading file: " + error + ">";
      continue;
    }
    std::string text = SanitizeUtf8(*content);
    if (truncated) {
      text += "\n[File truncated after " + std::to_string(kMaxCollectedFileSize) + " bytes]";
    }
    files[name] = std::move(text);
  }
  if (ec) {
    spdlog::warn("Failed listing {}: {}", env.Workdir().c_str(), ec.message());
  }
  return files;
}

ExecutionResult AssembleResult(const RawExecutionOutcome& outcome, ExecutionEnvironment& env,
                               const ExecutionLimits& lim) {
  ExecutionResult ret;
  ret.execution_id = env.id;
  try {
    ret.files = CollectProducedFiles(env);
  } catch (const std::exception& err) {
    // the box must go even if collection failed halfway
    spdlog::warn("Failed collecting files of {}: {}", env.id, err.what());
  }
  ReleaseEnvironment(env);
  ret.status = GetStatus(outcome);
  ret.output = SanitizeUtf8(outcome.output);
  ret.error = ErrorText(ret.status, outcome, lim, SanitizeUtf8(outcome.error));
  ret.execution_time = RoundSeconds(outcome.duration);
  ret.return_code = outcome.exit_code;
  ret.success = ret.status == ExecutionStatus::OK;
  return ret;
}

ExecutionResult AssembleRejection(const std::string& id, const FilterVerdict& verdict) {
  ExecutionResult ret;
  ret.execution_id = id;
  ret.status = ExecutionStatus::REJECTED;
  ret.error = fmt::format("Security violation: {} ({})", verdict.reason, verdict.rule.reason);
  ret.return_code = -1;
  ret.success = false;
  return ret;
}

ExecutionResult AssembleEnvironmentError(const std::string& id) {
  ExecutionResult ret;
  ret.execution_id = id;
  ret.status = ExecutionStatus::ENV_ERROR;
  ret.error = "Execution failed: could not create execution environment";
  ret.return_code = -1;
  ret.success = false;
  return ret;
}
