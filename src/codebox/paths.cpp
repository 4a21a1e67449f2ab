#include "paths.h"

fs::path kBoxRoot = "/tmp/codebox_box";

namespace internal {
fs::path kDataDir = fs::path(CODEBOX_DATA_DIR);
} // internal

const char kWorkdirRelative[] = "workdir";
fs::path Workdir(fs::path&& path) {
  path /= kWorkdirRelative;
  return path;
}

namespace {

constexpr char kScriptPrefix[] = "script_";
constexpr char kScriptExtension[] = ".py";

inline fs::path BoxRoot(const std::string& id, bool inside_box) {
  return inside_box ? fs::path("/") : BoxPath(id);
}

} // namespace

fs::path BoxPath(const std::string& id) {
  return kBoxRoot / id;
}

fs::path SandboxExecPath() {
  return internal::kDataDir / "sandbox-exec";
}

fs::path BoxWorkdir(const std::string& id, bool inside_box) {
  return Workdir(BoxRoot(id, inside_box));
}
fs::path BoxScript(const std::string& id, bool inside_box) {
  return BoxWorkdir(id, inside_box) / (kScriptPrefix + id + kScriptExtension);
}
fs::path BoxStdout(const std::string& id) {
  return BoxPath(id) / "stdout";
}
fs::path BoxStderr(const std::string& id) {
  return BoxPath(id) / "stderr";
}

bool IsBoxScript(const std::string& filename) {
  const std::string prefix = kScriptPrefix, ext = kScriptExtension;
  return filename.size() >= prefix.size() + ext.size() &&
         filename.compare(0, prefix.size(), prefix) == 0 &&
         filename.compare(filename.size() - ext.size(), ext.size(), ext) == 0;
}

const std::vector<std::string>& BoxBindDirs() {
  static const std::vector<std::string> kDirs = {
    "/usr", "/bin", "/lib", "/lib64", "/lib32", "/etc/alternatives"
  };
  return kDirs;
}
