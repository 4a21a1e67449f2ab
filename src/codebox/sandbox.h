#ifndef CODEBOX_SANDBOX_H_
#define CODEBOX_SANDBOX_H_

#include <string>
#include <vector>
#include <cstdint>

#include <cjail/cjail.h>

class SandboxOptions;
class CJailCtxClass {
 private:
  std::vector<const char*> argv_buf_;
  std::vector<const char*> env_buf_;
  std::vector<std::string> str_buf_;
  std::vector<struct jail_mount_ctx> mnt_buf_;
  struct jail_mount_list* mnt_list_;
  struct cjail_ctx ctx_;
 public:
  CJailCtxClass() : mnt_list_(mnt_list_new()) {}
  CJailCtxClass(const CJailCtxClass&) = delete;
  ~CJailCtxClass() {
    mnt_list_free(mnt_list_);
  }
  struct cjail_ctx& GetCtx() { return ctx_; }
  const struct cjail_ctx& GetCtx() const { return ctx_; }

  friend class SandboxOptions;
};

class SandboxOptions {
  using Int = long; // serialize
 public:
  std::string boxdir;
  std::vector<std::string> command;
  std::vector<std::string> envs;
  // inside box (relative to boxdir but start with /)
  std::string workdir;
  int fd_input, fd_output, fd_error; // -1 for not dup
  int uid; // also the gid
  long wall_time; // us
  long memory; // KiB; both RLIMIT_AS and cgroup RSS, 0 for no limit
  int proc_num;
  int file_num;
  long fsize; // KiB
  bool share_net;
  // bind mounts, same path inside and outside the box
  std::vector<std::string> dirs;

  SandboxOptions() :
      fd_input(-1), fd_output(-1), fd_error(-1),
      uid(65534),
      wall_time(0),
      memory(0),
      proc_num(0),
      file_num(0),
      fsize(0),
      share_net(false) {}
  SandboxOptions(const std::vector<uint8_t>& serial);

  // drop bind mounts that do not exist on the host
  void FilterDirs();
  // platform dependent, only intended for same machine
  std::vector<uint8_t> Serialize() const;
  // the result is invalidated after reassignment/reallocation of any string/vector member
  void ToCJailCtx(CJailCtxClass&) const;
};

#endif  // CODEBOX_SANDBOX_H_
