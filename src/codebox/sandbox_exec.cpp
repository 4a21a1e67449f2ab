#include "sandbox_exec.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <codebox/paths.h>

namespace {

bool WriteAll(int fd, const void* buf, size_t len) {
  const char* ptr = static_cast<const char*>(buf);
  while (len) {
    ssize_t ret = write(fd, ptr, len);
    if (ret < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    ptr += ret;
    len -= ret;
  }
  return true;
}

bool ReadAll(int fd, void* buf, size_t len) {
  char* ptr = static_cast<char*>(buf);
  while (len) {
    ssize_t ret = read(fd, ptr, len);
    if (ret < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (ret == 0) {
      errno = EPIPE;
      return false;
    }
    ptr += ret;
    len -= ret;
  }
  return true;
}

} // namespace

struct cjail_result SandboxExec(const SandboxOptions& opt) {
  struct cjail_result ret = {};
  // prepare everything before fork; the child of a multithreaded process must not allocate
  const std::string cmd = SandboxExecPath();
  const auto vec = opt.Serialize();
  const long size = vec.size();
  int inpipe[2], outpipe[2];
  pid_t pid;
  if (pipe2(inpipe, O_CLOEXEC) < 0) goto err;
  if (pipe2(outpipe, O_CLOEXEC) < 0) {
    close(inpipe[0]);
    close(inpipe[1]);
    goto err;
  }
  pid = fork();
  if (pid < 0) {
    int saved = errno;
    close(inpipe[0]);
    close(inpipe[1]);
    close(outpipe[0]);
    close(outpipe[1]);
    errno = saved;
    goto err;
  }
  if (pid == 0) {
    // dup2 clears O_CLOEXEC on the new descriptors
    dup2(inpipe[1], 1);
    dup2(outpipe[0], 0);
    // the jail's descriptors are opened O_CLOEXEC so that only this helper gets them
    for (int fd : {opt.fd_input, opt.fd_output, opt.fd_error}) {
      if (fd > 2) fcntl(fd, F_SETFD, 0);
    }
    execl(cmd.c_str(), cmd.c_str(), nullptr);
    _exit(1);
  }
  spdlog::debug("cjail_exec pid={} childpid={} boxdir={} command={}",
      getpid(), pid, opt.boxdir, fmt::format("{}", opt.command));
  close(inpipe[1]);
  close(outpipe[0]);
  if (!WriteAll(outpipe[1], &size, sizeof(size)) ||
      !WriteAll(outpipe[1], vec.data(), vec.size()) ||
      !ReadAll(inpipe[0], &ret, sizeof(ret))) {
    int saved = errno;
    kill(pid, SIGKILL);
    waitpid(pid, nullptr, 0);
    close(inpipe[0]);
    close(outpipe[1]);
    errno = saved;
    goto err;
  }
  close(inpipe[0]);
  close(outpipe[1]);
  waitpid(pid, nullptr, 0);
  if (ret.timekill == -1) {
    spdlog::warn("cjail_exec error: errno={} {}", ret.oomkill, strerror(ret.oomkill));
  }
  return ret;
err:
  spdlog::warn("SandboxExec error: errno={} {}", errno, strerror(errno));
  ret = {};
  ret.oomkill = errno;
  ret.timekill = -1;
  return ret;
}
