#include <codebox/execution.h>

#include <mutex>
#include <queue>
#include <thread>
#include <vector>
#include <algorithm>
#include <functional>
#include <condition_variable>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include "utils.h"
#include "runner.h"
#include "assembler.h"
#include "environment.h"

int kMaxParallel = 1;
std::string kInterpreter = "/usr/bin/python3";

nlohmann::json ResultToJson(const ExecutionResult& res) {
  return {
    {"execution_id", res.execution_id},
    {"output", res.output},
    {"error", res.error},
    {"execution_time", res.execution_time},
    {"files", res.files},
    {"success", res.success},
    {"return_code", res.return_code},
    {"status", StatusToAbr(res.status)},
  };
}

ExecutionResult Executor::Execute(const ExecutionRequest& req, int uid) const {
  FilterVerdict verdict = filter_.Check(req.code);
  if (verdict.rejected) {
    std::string id = NewExecutionId();
    spdlog::info("Execution rejected: id={} {} pattern=\"{}\" reason={}", id,
                 MatchTypeName(verdict.rule.type), verdict.rule.pattern, verdict.rule.reason);
    return AssembleRejection(id, verdict);
  }
  // released by AssembleResult; the guard covers the paths that never get there
  ScopedEnvironment env(AcquireEnvironment());
  if (!env) {
    std::string id = NewExecutionId();
    spdlog::error("Execution failed: id={} could not create execution environment", id);
    return AssembleEnvironmentError(id);
  }
  spdlog::info("Execution started: id={} uid={} size={}", env->id, uid, req.code.size());
  RawExecutionOutcome outcome = RunProcess(req.code, *env, limits_, uid);
  ExecutionResult result = AssembleResult(outcome, *env, limits_);
  spdlog::info("Execution finished: id={} status={} return_code={} time={}",
               result.execution_id, StatusToAbr(result.status), result.return_code, result.execution_time);
  return result;
}

namespace {

std::mutex queue_mtx;
std::condition_variable queue_cv;
std::queue<ExecutionRequest> request_queue;

void Worker(const Executor& executor, int index, bool loop) {
  const int uid = kUidBase + index;
  spdlog::debug("Worker {} started, uid={}", index, uid);
  while (true) {
    ExecutionRequest req;
    {
      std::unique_lock lck(queue_mtx);
      if (loop) {
        queue_cv.wait(lck, [](){ return !request_queue.empty(); });
      } else if (request_queue.empty()) {
        break;
      }
      req = std::move(request_queue.front());
      request_queue.pop();
    }
    ExecutionResult result = executor.Execute(req, uid);
    if (req.report_result) req.report_result(req, result);
  }
  spdlog::debug("Worker {} finished", index);
}

} // namespace

void WorkLoop(const Executor& executor, bool loop) {
  std::vector<std::thread> workers;
  int parallel = std::max(kMaxParallel, 1);
  for (int i = 0; i < parallel; i++) {
    workers.emplace_back(Worker, std::cref(executor), i, loop);
  }
  for (auto& worker : workers) worker.join();
}

size_t CurrentQueueSize() {
  std::lock_guard lck(queue_mtx);
  return request_queue.size();
}

bool PushRequest(ExecutionRequest&& req, size_t max_queue) {
  {
    std::lock_guard lck(queue_mtx);
    if (max_queue && request_queue.size() >= max_queue) return false;
    request_queue.push(std::move(req));
  }
  queue_cv.notify_one();
  return true;
}
