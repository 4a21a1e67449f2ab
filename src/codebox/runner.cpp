#include "runner.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cstring>
#include <limits>
#include <string_view>
#include <algorithm>

#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"
#include "sandbox_exec.h"

namespace {

inline long ToUs(const struct timeval& v) {
  return (long)v.tv_sec * 1'000'000 + v.tv_usec;
}

// closes on scope exit; the capture files must stay open until the helper has exited
class FileDescriptor {
  int fd_;
 public:
  explicit FileDescriptor(int fd) : fd_(fd) {}
  FileDescriptor(const FileDescriptor&) = delete;
  ~FileDescriptor() {
    if (fd_ >= 0) close(fd_);
  }
  int Get() const { return fd_; }
  bool Valid() const { return fd_ >= 0; }
};

// limit_kib = 0 for no limit
std::string ReadCapture(const fs::path& path, long limit_kib) {
  size_t max_bytes = limit_kib ? limit_kib * 1024 : std::numeric_limits<size_t>::max();
  auto content = ReadFile(path, max_bytes);
  if (!content) return "";
  return std::move(*content);
}

} // namespace

SandboxOptions ExecutionSandboxOptions(const ExecutionEnvironment& env, const ExecutionLimits& lim, int uid) {
  SandboxOptions opt;
  opt.boxdir = env.root;
  opt.command = {kInterpreter, BoxScript(env.id, true)};
  opt.envs = {
    "PATH=/usr/local/bin:/usr/bin:/bin",
    "HOME=" + BoxWorkdir(env.id, true).string(),
    "LANG=C.UTF-8",
    "PYTHONIOENCODING=utf-8",
    "PYTHONUNBUFFERED=1", // keep partial output if killed
    "PYTHONDONTWRITEBYTECODE=1",
  };
  opt.workdir = BoxWorkdir(env.id, true);
  opt.uid = uid;
  opt.wall_time = lim.wall_time;
  opt.memory = lim.memory ? lim.memory + kMemoryMargin : 0;
  opt.proc_num = lim.proc_num;
  opt.file_num = lim.file_num;
  opt.fsize = lim.output;
  opt.share_net = false;
  opt.dirs = BoxBindDirs();
  opt.FilterDirs();
  return opt;
}

bool EndsWithMemoryError(const std::string& stderr_text) {
  size_t end = stderr_text.find_last_not_of(" \t\r\n");
  if (end == std::string::npos) return false;
  size_t begin = stderr_text.rfind('\n', end);
  begin = begin == std::string::npos ? 0 : begin + 1;
  std::string_view line(stderr_text.data() + begin, end - begin + 1);
  constexpr std::string_view kMemoryError = "MemoryError";
  if (line.compare(0, kMemoryError.size(), kMemoryError) != 0) return false;
  return line.size() == kMemoryError.size() || line[kMemoryError.size()] == ':';
}

RawExecutionOutcome InterpretResult(const struct cjail_result& res, const ExecutionLimits& lim,
                                    long captured, bool memory_error) {
  RawExecutionOutcome ret;
  ret.duration = ToUs(res.time);
  ret.max_vss = res.stats.hiwater_vm;
  ret.max_rss = res.rus.ru_maxrss;
  bool killed = res.info.si_code == CLD_KILLED || res.info.si_code == CLD_DUMPED;
  bool over_memory = lim.memory && (ret.max_vss > lim.memory || ret.max_rss > lim.memory);
  if (killed) {
    ret.signal = res.info.si_status;
    ret.exit_code = 128 + res.info.si_status;
  } else {
    ret.exit_code = res.info.si_status;
  }

  if (res.timekill == -1) {
    // timekill = -1 means SandboxExec error (see sandbox_exec.cpp, sandbox_main.cpp)
    ret.sandbox_error = true;
    ret.exit_code = -1;
    ret.signal = 0;
  } else if (res.oomkill > 0) {
    // oomkill = -1 means failed to read oom (see cjail/cjail.h)
    ret.resource_limited = true;
  } else if (res.timekill) {
    ret.timed_out = true;
    ret.exit_code = kTimeoutExitCode;
  } else if (killed) {
    if (ret.signal == SIGXFSZ) {
      ret.output_limited = true;
    } else if (over_memory) {
      // hitting RLIMIT_AS will likely end in SIGSEGV or SIGABRT, so we check it before plain signals
      ret.resource_limited = true;
    }
  } else if (over_memory || (lim.memory && memory_error && ret.exit_code != 0)) {
    // python reports MemoryError and exits with 1
    ret.resource_limited = true;
  } else if (lim.output && captured >= lim.output * 1024) {
    // python ignores SIGXFSZ and fails the write instead
    ret.output_limited = true;
  }
  return ret;
}

RawExecutionOutcome RunProcess(const std::string& source, const ExecutionEnvironment& env,
                               const ExecutionLimits& lim, int uid) {
  RawExecutionOutcome ret;
  if (!WriteFile(env.Script(), source, kPerm644)) {
    ret.sandbox_error = true;
    return ret;
  }
  // O_CLOEXEC: helpers forked concurrently by other workers must not inherit these;
  //   SandboxExec clears the flag in its own child only
  FileDescriptor fd_input(open("/dev/null", O_RDONLY | O_CLOEXEC));
  FileDescriptor fd_output(open(env.Stdout().c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600));
  FileDescriptor fd_error(open(env.Stderr().c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600));
  if (!fd_input.Valid() || !fd_output.Valid() || !fd_error.Valid()) {
    spdlog::warn("Failed opening capture files in {}: {}", env.root.c_str(), strerror(errno));
    ret.sandbox_error = true;
    return ret;
  }

  SandboxOptions opt = ExecutionSandboxOptions(env, lim, uid);
  opt.fd_input = fd_input.Get();
  opt.fd_output = fd_output.Get();
  opt.fd_error = fd_error.Get();
  spdlog::debug("Generating execute settings: id={} uid={} wall_time={} memory={} fsize={}",
                env.id, uid, opt.wall_time, opt.memory, opt.fsize);
  struct cjail_result res = SandboxExec(opt);

  std::error_code ec;
  long captured = 0;
  for (auto& path : {env.Stdout(), env.Stderr()}) {
    auto size = fs::file_size(path, ec);
    if (!ec) captured = std::max(captured, (long)size);
  }
  std::string output = ReadCapture(env.Stdout(), lim.output);
  std::string error = ReadCapture(env.Stderr(), lim.output);
  ret = InterpretResult(res, lim, captured, EndsWithMemoryError(error));
  ret.output = std::move(output);
  ret.error = std::move(error);
  spdlog::info("Execute finished: id={} code={} status={} timekill={} oomkill={} time={} vss={} rss={}",
               env.id, res.info.si_code, res.info.si_status, res.timekill, res.oomkill,
               ret.duration, ret.max_vss, ret.max_rss);
  return ret;
}
