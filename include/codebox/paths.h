#ifndef INCLUDE_CODEBOX_PATHS_H_
#define INCLUDE_CODEBOX_PATHS_H_

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// parent of all box directories; each execution gets its own box
extern fs::path kBoxRoot;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

fs::path BoxPath(const std::string& id);
fs::path SandboxExecPath();

#endif  // INCLUDE_CODEBOX_PATHS_H_
