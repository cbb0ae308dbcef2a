#include "sandbox_exec.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "paths.h"

namespace {

bool WriteAll(int fd, const void* buf, size_t size) {
  auto ptr = static_cast<const uint8_t*>(buf);
  while (size) {
    ssize_t cnt = write(fd, ptr, size);
    if (cnt < 0 && errno == EINTR) continue;
    if (cnt <= 0) return false;
    ptr += cnt;
    size -= cnt;
  }
  return true;
}

// the helper reads [size][options] on stdin and answers with a cjail_result on stdout
pid_t StartHelper(int& to_helper, int& from_helper) {
  int request[2], response[2];
  if (pipe2(request, O_CLOEXEC) < 0) return -1;
  if (pipe2(response, O_CLOEXEC) < 0) {
    close(request[0]);
    close(request[1]);
    return -1;
  }
  pid_t pid = fork();
  if (pid == 0) {
    // dup2 clears O_CLOEXEC on the new descriptors
    dup2(request[0], 0);
    dup2(response[1], 1);
    auto cmd = SandboxExecPath();
    execl(cmd.c_str(), cmd.c_str(), nullptr);
    _exit(1);
  }
  close(request[0]);
  close(response[1]);
  if (pid < 0) {
    close(request[1]);
    close(response[0]);
    return -1;
  }
  to_helper = request[1];
  from_helper = response[0];
  return pid;
}

} // namespace

struct cjail_result SandboxExec(const SandboxOptions& opt) {
  struct cjail_result ret = {};
  int to_helper, from_helper;
  pid_t pid = StartHelper(to_helper, from_helper);
  if (pid < 0) {
    spdlog::warn("Failed starting {}: errno={} {}", SandboxExecPath().c_str(), errno, strerror(errno));
    ret.oomkill = errno;
    ret.timekill = -1;
    return ret;
  }
  spdlog::debug("cjail_exec pid={} helper={} root={} workdir={} command={} mounts={}",
      getpid(), pid, opt.boxdir, opt.workdir, fmt::format("{}", opt.command), fmt::format("{}", opt.mounts));

  auto vec = opt.Serialize();
  long size = vec.size();
  bool ok = WriteAll(to_helper, &size, sizeof(size)) && WriteAll(to_helper, vec.data(), vec.size());
  close(to_helper);
  ssize_t cnt = 0;
  if (ok) {
    while ((cnt = read(from_helper, &ret, sizeof(ret))) < 0 && errno == EINTR);
    ok = cnt == sizeof(ret);
  }
  int err = errno;
  close(from_helper);
  if (!ok) kill(pid, SIGKILL);
  waitpid(pid, nullptr, 0);

  if (!ok) {
    // a short read means the helper died before reporting
    if (cnt >= 0) err = EPIPE;
    spdlog::warn("Sandbox helper failed: errno={} {}", err, strerror(err));
    ret = {};
    ret.oomkill = err;
    ret.timekill = -1;
  } else if (ret.timekill == -1) {
    spdlog::warn("cjail_exec error: errno={} {}", ret.oomkill, strerror(ret.oomkill));
  }
  return ret;
}
