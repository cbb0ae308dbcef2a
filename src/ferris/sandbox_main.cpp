#include <errno.h>
#include <unistd.h>

#include "sandbox.h"

namespace {

bool ReadAll(int fd, void* buf, size_t size) {
  auto ptr = static_cast<uint8_t*>(buf);
  while (size) {
    ssize_t cnt = read(fd, ptr, size);
    if (cnt <= 0) return false;
    ptr += cnt;
    size -= cnt;
  }
  return true;
}

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

} // namespace

int main() {
  long sz = 0;
  if (!ReadAll(0, &sz, sizeof(sz)) || sz < 0) return 1;
  std::vector<uint8_t> buf(sz);
  if (!ReadAll(0, buf.data(), sz)) return 1;
  struct cjail_result res = SandboxExec(SandboxOptions(buf));
  if (write(1, &res, sizeof(res)) < 0) return 1;
}
