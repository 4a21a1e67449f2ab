#include <errno.h>
#include <unistd.h>
#include <vector>
#include <stdexcept>

#include "sandbox.h"

namespace {

struct cjail_result SandboxExec(const SandboxOptions& opt) {
  CJailCtxClass ctx;
  opt.ToCJailCtx(ctx);
  struct cjail_result ret = {};
  if (cjail_exec(&ctx.GetCtx(), &ret) < 0) {
    ret.oomkill = errno;
    ret.timekill = -1;
  }
  return ret;
}

bool ReadAll(int fd, void* buf, size_t len) {
  char* ptr = static_cast<char*>(buf);
  while (len) {
    ssize_t ret = read(fd, ptr, len);
    if (ret < 0 && errno == EINTR) continue;
    if (ret <= 0) return false;
    ptr += ret;
    len -= ret;
  }
  return true;
}

} // namespace

int main() {
  long sz = 0;
  if (!ReadAll(0, &sz, sizeof(sz)) || sz <= 0) return 1;
  std::vector<uint8_t> buf(sz);
  if (!ReadAll(0, buf.data(), sz)) return 1;
  struct cjail_result res;
  try {
    res = SandboxExec(SandboxOptions(buf));
  } catch (const std::out_of_range&) {
    return 1;
  }
  if (write(1, &res, sizeof(res)) != (ssize_t)sizeof(res)) return 1;
}
