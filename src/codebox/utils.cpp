#include "utils.h"

#include <string.h>
#include <signal.h>
#include <random>
#include <cstdint>
#include <algorithm>
#include <fstream>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

std::string NewExecutionId() {
  thread_local std::mt19937 gen(std::random_device{}());
  return fmt::format("{:08x}", static_cast<uint32_t>(gen()));
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG3(ExecutionStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* StatusToDesc, ExecutionStatus, ENUM_EXECUTION_STATUS_)
#undef X

#define X(...) X_RETURN_ARG2(MatchType, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* MatchTypeName, MatchType, ENUM_MATCH_TYPE_)
#undef X

static const char* kStatusAbrTable[] = {
#define X(name, abr, desc) abr,
  ENUM_EXECUTION_STATUS_
#undef X
};

const char* StatusToAbr(ExecutionStatus status) {
  return kStatusAbrTable[(int)status];
}

ExecutionStatus AbrToStatus(const std::string& str) {
  for (size_t i = 0; i < sizeof(kStatusAbrTable) / sizeof(kStatusAbrTable[0]); i++) {
    if (str == kStatusAbrTable[i]) return (ExecutionStatus)i;
  }
  return ExecutionStatus::SANDBOX_ERROR;
}

static const char* kMatchTypeTable[] = {
#define X(name, str) str,
  ENUM_MATCH_TYPE_
#undef X
};

std::optional<MatchType> GetMatchType(const std::string& str) {
  for (size_t i = 0; i < sizeof(kMatchTypeTable) / sizeof(kMatchTypeTable[0]); i++) {
    if (str == kMatchTypeTable[i]) return (MatchType)i;
  }
  return std::nullopt;
}

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3

std::string SanitizeUtf8(const std::string& str) {
  std::string ret;
  ret.reserve(str.size());
  const auto* s = reinterpret_cast<const unsigned char*>(str.data());
  size_t n = str.size();
  for (size_t i = 0; i < n;) {
    unsigned char c = s[i];
    size_t len = 0;
    uint32_t min_cp = 0, cp = 0;
    if (c < 0x80) {
      ret.push_back(c);
      i++;
      continue;
    } else if ((c & 0xe0) == 0xc0) {
      len = 2, min_cp = 0x80, cp = c & 0x1f;
    } else if ((c & 0xf0) == 0xe0) {
      len = 3, min_cp = 0x800, cp = c & 0x0f;
    } else if ((c & 0xf8) == 0xf0) {
      len = 4, min_cp = 0x10000, cp = c & 0x07;
    } else {
      i++; // stray continuation byte or invalid lead
      continue;
    }
    size_t j = 1;
    for (; j < len && i + j < n && (s[i + j] & 0xc0) == 0x80; j++) {
      cp = (cp << 6) | (s[i + j] & 0x3f);
    }
    if (j < len || cp < min_cp || cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff)) {
      i++; // drop the lead byte; continuation bytes are dropped on the next rounds
      continue;
    }
    ret.append(str, i, len);
    i += len;
  }
  return ret;
}

const char* SignalName(int sig) {
  const char* desc = strsignal(sig);
  return desc ? desc : "unknown signal";
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write file {}, size {}", path.c_str(), content.size());
  std::error_code ec;
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout || !fout.write(content.data(), content.size()) || !fout.flush()) {
      spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
      return false;
    }
  }
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permission of {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

std::optional<std::string> ReadFile(const fs::path& path, size_t max_bytes, bool* truncated,
                                    std::string* error) {
  std::error_code ec;
  size_t total_length = fs::file_size(path, ec);
  std::ifstream fin(path, std::ios::binary);
  if (ec || !fin) {
    std::string msg = ec ? ec.message() : std::string(strerror(errno));
    spdlog::warn("Failed reading {}: {}", path.c_str(), msg);
    if (error) *error = std::move(msg);
    return std::nullopt;
  }
  std::string ret(std::min(total_length, max_bytes), '\0');
  fin.read(ret.data(), ret.size());
  ret.resize(fin.gcount());
  if (truncated) *truncated = total_length > max_bytes;
  return ret;
}
