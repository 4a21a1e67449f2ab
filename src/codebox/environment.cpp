#include "environment.h"

#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"

namespace {

constexpr int kAcquireAttempts = 8;

constexpr fs::perms kPerm711 =
    fs::perms::owner_all | fs::perms::group_exec | fs::perms::others_exec;
constexpr fs::perms kPerm755 = kPerm711 | fs::perms::group_read | fs::perms::others_read;

// the jail root must not be writable by the jailed uid; only workdir is
bool PopulateBox(const std::string& id) {
  fs::path box = BoxPath(id);
  std::error_code ec;
  fs::permissions(box, kPerm755, ec);
  if (ec) {
    spdlog::warn("Failed setting permission of {}: {}", box.c_str(), ec.message());
    return false;
  }
  if (!CreateDirs(BoxWorkdir(id), fs::perms::all)) return false;
  for (auto& dir : BoxBindDirs()) {
    if (!fs::is_directory(dir, ec)) continue;
    // relative to the box; dir always starts with '/'
    if (!CreateDirs(box / fs::path(dir).relative_path(), kPerm755)) return false;
  }
  return true;
}

// bind mount points are removed non-recursively first, so that a mount that
//   outlived its jail can never lead us into a host directory
bool RemoveBox(const fs::path& box) {
  std::error_code ec;
  if (!fs::exists(box, ec)) return !ec;
  bool ok = true;
  for (auto& dir : BoxBindDirs()) {
    fs::path point = box / fs::path(dir).relative_path();
    if (!fs::is_directory(fs::symlink_status(point, ec))) continue;
    if (!fs::is_empty(point, ec) || ec) {
      spdlog::error("Mount point {} is not empty; refusing to delete box {}", point.c_str(), box.c_str());
      return false;
    }
    fs::remove(point, ec);
    if (ec) {
      spdlog::warn("Failed deleting {}: {}", point.c_str(), ec.message());
      ok = false;
    }
  }
  if (!ok) return false;
  return RemoveAll(box);
}

} // namespace

fs::path ExecutionEnvironment::Workdir() const { return BoxWorkdir(id); }
fs::path ExecutionEnvironment::Script() const { return BoxScript(id); }
fs::path ExecutionEnvironment::Stdout() const { return BoxStdout(id); }
fs::path ExecutionEnvironment::Stderr() const { return BoxStderr(id); }

std::optional<ExecutionEnvironment> AcquireEnvironment() {
  if (!CreateDirs(kBoxRoot, kPerm711)) {
    spdlog::error("Cannot create box root {}", kBoxRoot.c_str());
    return std::nullopt;
  }
  for (int attempt = 0; attempt < kAcquireAttempts; attempt++) {
    std::string id = NewExecutionId();
    fs::path box = BoxPath(id);
    std::error_code ec;
    // create_directory is atomic and false if the directory already exists
    if (!fs::create_directory(box, ec)) {
      if (ec) {
        spdlog::error("Cannot create box {}: {}", box.c_str(), ec.message());
        return std::nullopt;
      }
      spdlog::debug("Box {} already exists, drawing another id", box.c_str());
      continue;
    }
    if (!PopulateBox(id)) {
      spdlog::error("Cannot set up box {}", box.c_str());
      RemoveBox(box);
      return std::nullopt;
    }
    spdlog::debug("Acquired box {}", box.c_str());
    return ExecutionEnvironment(id, box);
  }
  spdlog::error("Cannot find an unused box name after {} attempts", kAcquireAttempts);
  return std::nullopt;
}

bool ReleaseEnvironment(ExecutionEnvironment& env) {
  if (env.released) return true;
  if (!RemoveBox(env.root)) {
    spdlog::error("Failed releasing box {}", env.root.c_str());
    return false;
  }
  env.released = true;
  spdlog::debug("Released box {}", env.root.c_str());
  return true;
}
