#ifndef CODEBOX_UTILS_H_
#define CODEBOX_UTILS_H_

#include <string>
#include <optional>
#include <filesystem>

#include <codebox/utils.h>

namespace fs = std::filesystem;

constexpr fs::perms kPerm644 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::others_read;

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);
// read at most max_bytes; truncated is set if the file is longer
std::optional<std::string> ReadFile(const fs::path&, size_t max_bytes, bool* truncated = nullptr,
                                    std::string* error = nullptr);

const char* SignalName(int sig);

#endif  // CODEBOX_UTILS_H_
