#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <memory>
#include <string>
#include <filesystem>

#include <gtest/gtest.h>
#include <codebox/filter.h>
#include <codebox/execution.h>

// boxes currently under kBoxRoot; 0 if it does not exist
size_t CountBoxes();

ExecutionLimits TestLimits();
std::shared_ptr<const DenyRuleSet> DefaultRuleSet();

void WriteTestFile(const std::filesystem::path&, const std::string& content);

// jailed execution needs root
class SandboxTest : public ::testing::Test {
 protected:
  void SetUp() override;
};

#endif // TEST_UTILS_H_
