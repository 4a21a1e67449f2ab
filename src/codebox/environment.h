#ifndef CODEBOX_ENVIRONMENT_H_
#define CODEBOX_ENVIRONMENT_H_

#include <string>
#include <optional>
#include <filesystem>

// One box per execution; exclusively owned by the worker that acquired it.
class ExecutionEnvironment {
 public:
  std::string id; // execution id; also names the box
  std::filesystem::path root; // jail root
  bool released;

  ExecutionEnvironment() : released(false) {}
  ExecutionEnvironment(std::string id_, std::filesystem::path root_) :
      id(std::move(id_)), root(std::move(root_)), released(false) {}

  std::filesystem::path Workdir() const;
  std::filesystem::path Script() const;
  std::filesystem::path Stdout() const;
  std::filesystem::path Stderr() const;
};

// Creates a fresh, empty, uniquely named box under kBoxRoot.
// Returns nullopt on failure (logged); nothing is left behind in that case.
std::optional<ExecutionEnvironment> AcquireEnvironment();
// Idempotent; returns false if the box could not be fully removed.
// Never recurses into a bind mount point that is still populated.
bool ReleaseEnvironment(ExecutionEnvironment&);

class ScopedEnvironment {
  std::optional<ExecutionEnvironment> env_;
 public:
  ScopedEnvironment() {}
  explicit ScopedEnvironment(std::optional<ExecutionEnvironment>&& env) : env_(std::move(env)) {}
  ScopedEnvironment(const ScopedEnvironment&) = delete;
  ScopedEnvironment& operator=(const ScopedEnvironment&) = delete;
  ~ScopedEnvironment() {
    if (env_) ReleaseEnvironment(*env_);
  }

  explicit operator bool() const { return env_.has_value(); }
  ExecutionEnvironment& operator*() { return *env_; }
  ExecutionEnvironment* operator->() { return &*env_; }
};

#endif  // CODEBOX_ENVIRONMENT_H_
