#include "utils.h"

#include <unistd.h>
#include <fstream>
#include <codebox/paths.h>

size_t CountBoxes() {
  std::error_code ec;
  if (!fs::exists(kBoxRoot, ec)) return 0;
  size_t ret = 0;
  for (fs::directory_iterator it(kBoxRoot, ec), end; !ec && it != end; it.increment(ec)) ret++;
  return ret;
}

ExecutionLimits TestLimits() {
  ExecutionLimits lim;
  lim.wall_time = 10L * 1'000'000;
  lim.memory = 128L * 1024;
  return lim;
}

std::shared_ptr<const DenyRuleSet> DefaultRuleSet() {
  return std::make_shared<const DenyRuleSet>(DefaultDenyRules());
}

void WriteTestFile(const fs::path& path, const std::string& content) {
  std::ofstream fout(path, std::ios::binary);
  fout << content;
}

void SandboxTest::SetUp() {
  if (geteuid() != 0) GTEST_SKIP() << "jailed execution requires root";
}
