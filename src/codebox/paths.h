#ifndef CODEBOX_PATHS_H_
#define CODEBOX_PATHS_H_

#include <string>
#include <vector>

#include <codebox/paths.h>

extern const char kWorkdirRelative[];
fs::path Workdir(fs::path&&);

// if inside_box = true, the path is as seen by the jailed program and id is only
//   used to name the script
fs::path BoxWorkdir(const std::string& id, bool inside_box = false);
fs::path BoxScript(const std::string& id, bool inside_box = false);
// capture files live outside workdir; never visible inside the box
fs::path BoxStdout(const std::string& id);
fs::path BoxStderr(const std::string& id);
bool IsBoxScript(const std::string& filename);

// host directories bind-mounted into every box so the interpreter can run
const std::vector<std::string>& BoxBindDirs();

#endif  // CODEBOX_PATHS_H_
