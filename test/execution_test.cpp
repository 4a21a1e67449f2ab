#include <mutex>
#include <set>
#include <vector>

#include "utils.h"

class ExecutionTest : public SandboxTest {
 protected:
  ExecutionResult Run(const std::string& code, const ExecutionLimits& lim = TestLimits()) {
    Executor executor(DefaultRuleSet(), lim);
    return executor.Execute(ExecutionRequest(code));
  }
};

TEST_F(ExecutionTest, Simple) {
  auto res = Run("print(2 + 2)\n");
  EXPECT_TRUE(res.success) << res.error;
  EXPECT_EQ(res.status, ExecutionStatus::OK);
  EXPECT_EQ(res.output, "4\n");
  EXPECT_EQ(res.error, "");
  EXPECT_EQ(res.return_code, 0);
  EXPECT_TRUE(res.files.empty());
  EXPECT_EQ(res.execution_id.size(), 8u);
  EXPECT_EQ(CountBoxes(), 0u);
}

TEST_F(ExecutionTest, RejectedBeforeRunning) {
  auto res = Run("import os\nos.system('touch /tmp/pwned')\n");
  EXPECT_FALSE(res.success);
  EXPECT_EQ(res.status, ExecutionStatus::REJECTED);
  EXPECT_EQ(res.return_code, -1);
  EXPECT_EQ(res.output, "");
  EXPECT_NE(res.error.find("Dangerous pattern detected: import os"), std::string::npos) << res.error;
  EXPECT_EQ(res.execution_time, 0);
  EXPECT_EQ(CountBoxes(), 0u);
}

TEST_F(ExecutionTest, Timeout) {
  ExecutionLimits lim = TestLimits();
  lim.wall_time = 2'000'000;
  auto res = Run("import time\nprint('before')\ntime.sleep(10)\nprint('after')\n", lim);
  EXPECT_FALSE(res.success);
  EXPECT_EQ(res.status, ExecutionStatus::TIMEOUT);
  EXPECT_EQ(res.return_code, 124);
  EXPECT_EQ(res.output, "before\n");
  EXPECT_NE(res.error.find("exceeded 2 second limit"), std::string::npos) << res.error;
  EXPECT_GE(res.execution_time, 1.5);
  EXPECT_LT(res.execution_time, 6);
  EXPECT_EQ(CountBoxes(), 0u);
}

TEST_F(ExecutionTest, MemoryLimit) {
  ExecutionLimits lim = TestLimits();
  lim.memory = 64 * 1024;
  auto res = Run("data = []\nwhile True:\n    data.append(bytearray(1 << 20))\n", lim);
  EXPECT_FALSE(res.success);
  EXPECT_EQ(res.status, ExecutionStatus::RESOURCE_LIMIT) << res.error;
  EXPECT_NE(res.error.find("Memory limit exceeded"), std::string::npos) << res.error;
  EXPECT_EQ(CountBoxes(), 0u);
}

TEST_F(ExecutionTest, SingleHugeAllocation) {
  // refused at once by the address space limit, so peak memory stays low
  auto res = Run("x = bytearray(10**10)\nprint('unreachable')\n");
  EXPECT_FALSE(res.success);
  EXPECT_EQ(res.status, ExecutionStatus::RESOURCE_LIMIT) << res.error;
  EXPECT_EQ(res.output, "");
  EXPECT_NE(res.error.find("Memory limit exceeded"), std::string::npos) << res.error;
  EXPECT_NE(res.error.find("MemoryError"), std::string::npos) << res.error;
  EXPECT_EQ(CountBoxes(), 0u);
}

TEST_F(ExecutionTest, RuntimeFault) {
  auto res = Run("print('start')\nx = 1 / 0\n");
  EXPECT_FALSE(res.success);
  EXPECT_EQ(res.status, ExecutionStatus::RUNTIME_FAULT);
  EXPECT_EQ(res.return_code, 1);
  EXPECT_EQ(res.output, "start\n");
  EXPECT_NE(res.error.find("ZeroDivisionError"), std::string::npos) << res.error;
}

TEST_F(ExecutionTest, StderrIsSeparate) {
  auto res = Run("import warnings\nprint('out')\nwarnings.warn('careful')\nprint('done')\n");
  EXPECT_TRUE(res.success) << res.error;
  EXPECT_EQ(res.output, "out\ndone\n");
  EXPECT_NE(res.error.find("UserWarning: careful"), std::string::npos) << res.error;
  EXPECT_EQ(res.output.find("careful"), std::string::npos) << res.output;
}

TEST_F(ExecutionTest, ProducedFiles) {
  auto res = Run(
      "from pathlib import Path\n"
      "Path('result.txt').write_text('forty-two')\n"
      "Path('data.csv').write_bytes(b'a,b\\n1,2\\n')\n"
      "print('written')\n");
  EXPECT_TRUE(res.success) << res.error;
  ASSERT_EQ(res.files.size(), 2u);
  EXPECT_EQ(res.files["result.txt"], "forty-two");
  EXPECT_EQ(res.files["data.csv"], "a,b\n1,2\n");
  EXPECT_EQ(CountBoxes(), 0u);
}

TEST_F(ExecutionTest, NoNetwork) {
  // the deny list blocks the module names; reach the network namespace through asyncio instead
  auto res = Run(
      "import asyncio\n"
      "async def main():\n"
      "    await asyncio.open_connection('1.1.1.1', 80)\n"
      "asyncio.run(main())\n");
  EXPECT_FALSE(res.success);
  EXPECT_EQ(res.status, ExecutionStatus::RUNTIME_FAULT);
}

TEST_F(ExecutionTest, RepeatedRunsAreIndependent) {
  const std::string code = "from pathlib import Path\n"
                           "p = Path('counter.txt')\n"
                           "print(p.exists())\n"
                           "p.write_text('1')\n";
  auto res1 = Run(code);
  auto res2 = Run(code);
  EXPECT_NE(res1.execution_id, res2.execution_id);
  EXPECT_EQ(res1.output, "False\n");
  EXPECT_EQ(res2.output, "False\n");
}

TEST_F(ExecutionTest, ConcurrentWorkers) {
  int saved = kMaxParallel;
  kMaxParallel = 4;
  Executor executor(DefaultRuleSet(), TestLimits());
  constexpr int kRequests = 8;
  std::mutex mtx;
  std::vector<ExecutionResult> results(kRequests);
  for (int i = 0; i < kRequests; i++) {
    ExecutionRequest req(
        "from pathlib import Path\n"
        "Path('mine.txt').write_text('" + std::to_string(i) + "')\n"
        "print(" + std::to_string(i) + " * 10)\n");
    req.report_result = [&mtx, &results, i](const ExecutionRequest&, const ExecutionResult& res) {
      std::lock_guard lck(mtx);
      results[i] = res;
    };
    ASSERT_TRUE(PushRequest(std::move(req)));
  }
  WorkLoop(executor, false);
  kMaxParallel = saved;

  EXPECT_EQ(CurrentQueueSize(), 0u);
  std::set<std::string> ids;
  for (int i = 0; i < kRequests; i++) {
    EXPECT_TRUE(results[i].success) << i << ": " << results[i].error;
    EXPECT_EQ(results[i].output, std::to_string(i * 10) + "\n");
    ASSERT_EQ(results[i].files.size(), 1u);
    EXPECT_EQ(results[i].files["mine.txt"], std::to_string(i));
    ids.insert(results[i].execution_id);
  }
  EXPECT_EQ(ids.size(), (size_t)kRequests);
  EXPECT_EQ(CountBoxes(), 0u);
}

TEST_F(ExecutionTest, NoDescriptorSharingBetweenWorkers) {
  int saved = kMaxParallel;
  kMaxParallel = 4;
  Executor executor(DefaultRuleSet(), TestLimits());
  // writes to every descriptor it might have inherited from a concurrent run
  const std::string writer =
      "from os import write\n"
      "import time\n"
      "end = time.time() + 3\n"
      "while time.time() < end:\n"
      "    for fd in range(3, 256):\n"
      "        try:\n"
      "            write(fd, b'INTRUDER')\n"
      "        except OSError:\n"
      "            pass\n"
      "    time.sleep(0.05)\n";
  const std::string sleeper = "import time\ntime.sleep(2)\nprint('quiet')\n";
  constexpr int kRequests = 4;
  std::mutex mtx;
  std::vector<ExecutionResult> results(kRequests);
  for (int i = 0; i < kRequests; i++) {
    ExecutionRequest req(i == 0 ? writer : sleeper);
    req.report_result = [&mtx, &results, i](const ExecutionRequest&, const ExecutionResult& res) {
      std::lock_guard lck(mtx);
      results[i] = res;
    };
    ASSERT_TRUE(PushRequest(std::move(req)));
  }
  WorkLoop(executor, false);
  kMaxParallel = saved;

  for (int i = 1; i < kRequests; i++) {
    EXPECT_TRUE(results[i].success) << i << ": " << results[i].error;
    EXPECT_EQ(results[i].output, "quiet\n");
    EXPECT_EQ(results[i].error, "");
  }
  EXPECT_EQ(CountBoxes(), 0u);
}

TEST(WorkQueue, BoundedPush) {
  EXPECT_EQ(CurrentQueueSize(), 0u);
  EXPECT_TRUE(PushRequest(ExecutionRequest("print(1)"), 1));
  EXPECT_FALSE(PushRequest(ExecutionRequest("print(2)"), 1));
  EXPECT_EQ(CurrentQueueSize(), 1u);
  // rejected requests never reach the jail, so this drains without root
  ExecutionResult result;
  Executor executor(std::make_shared<const DenyRuleSet>(std::vector<DenyRule>{
    {MatchType::SUBSTRING, "print", "test"},
  }), TestLimits());
  auto report = [&result](const ExecutionRequest&, const ExecutionResult& res) { result = res; };
  ExecutionRequest req("print(3)");
  req.report_result = report;
  EXPECT_TRUE(PushRequest(std::move(req)));
  WorkLoop(executor, false);
  EXPECT_EQ(CurrentQueueSize(), 0u);
  EXPECT_EQ(result.status, ExecutionStatus::REJECTED);
}
