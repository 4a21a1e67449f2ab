#include <cctype>

#include <codebox/paths.h>
#include "codebox/environment.h"
#include "utils.h"

TEST(Environment, AcquireCreatesEmptyWorkdir) {
  auto env = AcquireEnvironment();
  ASSERT_TRUE(env);
  ASSERT_EQ(env->id.size(), 8u);
  for (char c : env->id) EXPECT_TRUE(std::isxdigit((unsigned char)c)) << env->id;
  EXPECT_EQ(env->root.string(), BoxPath(env->id).string());
  EXPECT_TRUE(fs::is_directory(env->Workdir()));
  EXPECT_TRUE(fs::is_empty(env->Workdir()));
  EXPECT_EQ(env->Script().filename().string(), "script_" + env->id + ".py");
  EXPECT_EQ(env->Script().parent_path().string(), env->Workdir().string());
  EXPECT_TRUE(ReleaseEnvironment(*env));
  EXPECT_FALSE(fs::exists(env->root));
}

TEST(Environment, DistinctBoxes) {
  auto env1 = AcquireEnvironment();
  auto env2 = AcquireEnvironment();
  ASSERT_TRUE(env1);
  ASSERT_TRUE(env2);
  EXPECT_NE(env1->id, env2->id);
  EXPECT_NE(env1->root.string(), env2->root.string());
  EXPECT_TRUE(ReleaseEnvironment(*env1));
  EXPECT_TRUE(fs::is_directory(env2->Workdir()));
  EXPECT_TRUE(ReleaseEnvironment(*env2));
}

TEST(Environment, ReleaseIsIdempotent) {
  auto env = AcquireEnvironment();
  ASSERT_TRUE(env);
  WriteTestFile(env->Workdir() / "leftover.txt", "data");
  EXPECT_TRUE(ReleaseEnvironment(*env));
  EXPECT_TRUE(env->released);
  EXPECT_TRUE(ReleaseEnvironment(*env));
  EXPECT_FALSE(fs::exists(env->root));
}

TEST(Environment, ScopedRelease) {
  fs::path root;
  {
    ScopedEnvironment env(AcquireEnvironment());
    ASSERT_TRUE(env);
    root = env->root;
    WriteTestFile(env->Workdir() / "out.txt", "data");
    EXPECT_TRUE(fs::exists(root));
  }
  EXPECT_FALSE(fs::exists(root));
  EXPECT_EQ(CountBoxes(), 0u);
}

TEST(Environment, RefusesPopulatedMountPoint) {
  auto env = AcquireEnvironment();
  ASSERT_TRUE(env);
  fs::path point = env->root / "usr";
  ASSERT_TRUE(fs::is_directory(point));
  WriteTestFile(point / "host_file", "must survive");
  EXPECT_FALSE(ReleaseEnvironment(*env));
  EXPECT_FALSE(env->released);
  EXPECT_TRUE(fs::exists(point / "host_file"));

  fs::remove(point / "host_file");
  EXPECT_TRUE(ReleaseEnvironment(*env));
  EXPECT_FALSE(fs::exists(env->root));
}

TEST(Environment, FailureLeavesNothing) {
  fs::path saved = kBoxRoot;
  kBoxRoot = "/proc/codebox_nonexistent";
  auto env = AcquireEnvironment();
  kBoxRoot = saved;
  EXPECT_FALSE(env);
  EXPECT_FALSE(fs::exists("/proc/codebox_nonexistent"));
}
