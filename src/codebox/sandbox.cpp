#include "sandbox.h"

#include <cstring>
#include <stdexcept>
#include <filesystem>
#include <algorithm>

namespace {

// native layout; both ends are built from the same tree
class WireWriter {
  std::vector<uint8_t>& buf_;
 public:
  explicit WireWriter(std::vector<uint8_t>& buf) : buf_(buf) {}

  void Put(long val) {
    size_t pos = buf_.size();
    buf_.resize(pos + sizeof(val));
    memcpy(buf_.data() + pos, &val, sizeof(val));
  }
  void Put(const std::string& str) {
    Put((long)str.size());
    buf_.insert(buf_.end(), str.begin(), str.end());
  }
  void Put(const std::vector<std::string>& list) {
    Put((long)list.size());
    for (auto& i : list) Put(i);
  }
};

class WireReader {
  const std::vector<uint8_t>& buf_;
  size_t pos_;

  void Need(size_t len) const {
    if (len > buf_.size() - pos_) throw std::out_of_range("truncated sandbox options");
  }
 public:
  explicit WireReader(const std::vector<uint8_t>& buf) : buf_(buf), pos_(0) {}

  long GetLong() {
    long val;
    Need(sizeof(val));
    memcpy(&val, buf_.data() + pos_, sizeof(val));
    pos_ += sizeof(val);
    return val;
  }
  std::string GetString() {
    long len = GetLong();
    if (len < 0) throw std::out_of_range("negative string length");
    Need(len);
    std::string str(reinterpret_cast<const char*>(buf_.data() + pos_), len);
    pos_ += len;
    return str;
  }
  std::vector<std::string> GetList() {
    long len = GetLong();
    if (len < 0) throw std::out_of_range("negative list length");
    std::vector<std::string> list;
    for (long i = 0; i < len; i++) list.push_back(GetString());
    return list;
  }
};

inline struct timeval ToTimeval(long us) {
  struct timeval ret;
  ret.tv_sec = us / 1'000'000;
  ret.tv_usec = us % 1'000'000;
  return ret;
}

} // namespace

SandboxOptions::SandboxOptions(const std::vector<uint8_t>& vec) {
  WireReader in(vec);
  boxdir = in.GetString();
  workdir = in.GetString();
  command = in.GetList();
  envs = in.GetList();
  dirs = in.GetList();
  fd_input = in.GetLong();
  fd_output = in.GetLong();
  fd_error = in.GetLong();
  uid = in.GetLong();
  wall_time = in.GetLong();
  memory = in.GetLong();
  proc_num = in.GetLong();
  file_num = in.GetLong();
  fsize = in.GetLong();
  share_net = in.GetLong();
}

std::vector<uint8_t> SandboxOptions::Serialize() const {
  std::vector<uint8_t> ret;
  WireWriter out(ret);
  out.Put(boxdir);
  out.Put(workdir);
  out.Put(command);
  out.Put(envs);
  out.Put(dirs);
  for (long val : {(long)fd_input, (long)fd_output, (long)fd_error, (long)uid,
                   wall_time, memory, (long)proc_num, (long)file_num, fsize, (long)share_net}) {
    out.Put(val);
  }
  return ret;
}

void SandboxOptions::FilterDirs() {
  std::error_code ec;
  dirs.erase(std::remove_if(dirs.begin(), dirs.end(), [&](const std::string& dir) {
    return !std::filesystem::is_directory(dir, ec);
  }), dirs.end());
}

void SandboxOptions::ToCJailCtx(CJailCtxClass& ret) const {
  struct cjail_ctx& ctx = ret.ctx_;
  cjail_ctx_init(&ctx);
  ctx.sharenet = share_net;
  if (fd_input != -1) ctx.fd_input = fd_input;
  if (fd_output != -1) ctx.fd_output = fd_output;
  if (fd_error != -1) ctx.fd_error = fd_error;

  for (auto& i : command) ret.argv_buf_.push_back(i.c_str());
  ret.argv_buf_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(ret.argv_buf_.data());
  // never inherit the host environment
  for (auto& i : envs) ret.env_buf_.push_back(i.c_str());
  ret.env_buf_.push_back(nullptr);
  ctx.environ = const_cast<char* const*>(ret.env_buf_.data());
  ctx.chroot = const_cast<char*>(boxdir.c_str());
  ctx.working_dir = const_cast<char*>(workdir.c_str());
  ctx.cpuset = nullptr;
  ctx.uid = uid;
  ctx.gid = uid;

  ctx.rlim_as = memory;
  ctx.rlim_core = 0;
  ctx.rlim_nofile = file_num;
  ctx.rlim_fsize = fsize;
  ctx.rlim_proc = proc_num;
  ctx.cg_rss = memory;
  ctx.lim_time = ToTimeval(wall_time);

  // every mount ctx points into str_buf_ and dirs; no reallocation allowed after this
  ret.str_buf_.assign(1, "bind");
  ret.mnt_buf_.resize(dirs.size());
  for (size_t i = 0; i < dirs.size(); i++) {
    struct jail_mount_ctx& mnt = ret.mnt_buf_[i];
    mnt.type = ret.str_buf_[0].data();
    mnt.source = mnt.target = const_cast<char*>(dirs[i].c_str());
    mnt.fstype = mnt.data = nullptr;
    mnt.flags = 0;
    mnt_list_add(ret.mnt_list_, &mnt);
  }
  ctx.mount_cfg = ret.mnt_list_;
}
