#include "tasks.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/sysinfo.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <sstream>
#include <unordered_map>
#include <condition_variable>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <ferris/benchmark.h>
#include "paths.h"
#include "utils.h"
#include "sandbox_exec.h"

std::vector<std::string> kSandboxEnv = {
  "PATH=/usr/local/cargo/bin:/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin",
  "RUSTUP_HOME=/usr/local/rustup",
  "CARGO_HOME=/app/.cargo",
  "CARGO_TERM_COLOR=never",
  "TERM=dumb",
};

namespace {

// passed to the submitted program; absolute path of the staged input inside the box
const char kInputEnvName[] = "FERRIS_ELF_INPUT_FILE_NAME";
// hard ceiling on top of timeout + kill-after, in case timeout itself misbehaves
constexpr long kWallTimeSlack = 5;

SandboxOptions BaseOptions(const Workspace& ws, long timeout, int uid, int cpuid) {
  SandboxOptions opt;
  opt.boxdir = kSandboxImage;
  opt.envs = kSandboxEnv;
  opt.workdir = kMountPoint;
  opt.mounts = {{ws.AppDir().string(), kMountPoint.string()}};
  if (cpuid != -1) opt.cpu_set.push_back(cpuid);
  opt.uid = opt.gid = uid;
  opt.wall_time = (timeout + kKillAfter + kWallTimeSlack) * 1'000'000;
  opt.rss = kMemoryLimit;
  opt.proc_num = kProcessLimit;
  opt.fsize = kMaxOutput;
  // cargo downloads crates during the build; the run step shares the same image
  // and registry, so neither step is isolated from the network
  opt.share_net = true;
  return opt;
}

} // namespace

namespace internal {

std::vector<std::string> TimeoutCommand(long timeout, const std::string& command) {
  std::vector<std::string> ret = {
    "/usr/bin/env", "timeout",
    fmt::format("--kill-after={}s", kKillAfter),
    fmt::format("{}s", timeout),
  };
  std::istringstream ss(command);
  for (std::string arg; ss >> arg;) ret.push_back(std::move(arg));
  return ret;
}

SandboxOptions BuildOptions(const Workspace& ws, int uid, int cpuid) {
  SandboxOptions opt = BaseOptions(ws, kBuildTimeout, uid, cpuid);
  opt.command = TimeoutCommand(kBuildTimeout, kBuildCommand);
  return opt;
}

SandboxOptions RunOptions(const Workspace& ws, const std::string& input, int uid, int cpuid) {
  SandboxOptions opt = BaseOptions(ws, kRunTimeout, uid, cpuid);
  opt.command = TimeoutCommand(kRunTimeout, kRunCommand);
  opt.envs.push_back(std::string(kInputEnvName) + "=" + MountedInput(input).string());
  return opt;
}

} // internal

namespace {

/// child
// Invoke sandbox with correct settings
// Output is read back by the executor from the workspace logs
struct cjail_result RunBuild(const Workspace& ws, int uid, int cpuid) {
  spdlog::debug("Generating build settings: workspace={}", ws.Root().c_str());
  SandboxOptions opt = internal::BuildOptions(ws, uid, cpuid);
  opt.fd_output = open(ws.BuildLog().c_str(), O_WRONLY | O_TRUNC | O_CREAT, 0600);
  opt.fd_error = opt.fd_output;
  // we don't need to close the opened files because the process is about to terminate
  return SandboxExec(opt);
}

struct cjail_result RunExecute(const Workspace& ws, const std::string& input, int uid, int cpuid) {
  spdlog::debug("Generating run settings: workspace={} input={}", ws.Root().c_str(), input);
  SandboxOptions opt = internal::RunOptions(ws, input, uid, cpuid);
  opt.fd_output = open(ws.RunLog().c_str(), O_WRONLY | O_TRUNC | O_CREAT, 0600);
  opt.fd_error = opt.fd_output;
  return SandboxExec(opt);
}

/// parent
constexpr int kUidBase = 50000, kUidPoolSize = 100;

struct RunningTask {
  pid_t pid;
  int uid, cpuid;
};

std::mutex pool_mtx;
std::condition_variable pool_cv;
std::vector<int> uid_pool, cpuid_pool;
bool pool_init = false;
int reserved = 0; // slots in use, including tasks being forked
std::unordered_map<int, RunningTask> running; // fd -> task

void InitPools() {
  for (int i = 0; i < kUidPoolSize; i++) uid_pool.push_back(i + kUidBase);
  for (int i = 0, N = get_nprocs(); i < N; i++) {
    if (CPU_ISSET(i, &kPinnedCpus)) cpuid_pool.push_back(i);
  }
  pool_init = true;
}

// pool_mtx must be held
void ReleaseSlot(int uid, int cpuid) {
  uid_pool.push_back(uid);
  if (cpuid != -1) cpuid_pool.push_back(cpuid);
  reserved--;
  pool_cv.notify_all();
}

} // namespace

int RunTask(const Workspace& ws, const Task& task) {
  int uid, cpuid = -1;
  {
    std::unique_lock lck(pool_mtx);
    if (!pool_init) InitPools();
    pool_cv.wait(lck, [] { return reserved < kMaxParallel && !uid_pool.empty(); });
    reserved++;
    uid = uid_pool.back();
    uid_pool.pop_back();
    if (cpuid_pool.empty()) {
      if (CPU_COUNT(&kPinnedCpus)) {
        spdlog::warn("No available cpu; task won\'t be pinned");
      }
    } else {
      cpuid = cpuid_pool.back();
      cpuid_pool.pop_back();
    }
  }
  int pipefd[2] = {-1, -1};
  pid_t pid = -1;
  if (pipe2(pipefd, O_CLOEXEC) < 0 || (pid = fork()) < 0) {
    spdlog::warn("Failed to start task: errno={} {}", errno, strerror(errno));
    if (pid < 0 && pipefd[0] >= 0) {
      close(pipefd[0]);
      close(pipefd[1]);
    }
    std::lock_guard lck(pool_mtx);
    ReleaseSlot(uid, cpuid);
    return -1;
  }
  if (pid == 0) {
    close(pipefd[0]);
    struct cjail_result ret;
    switch (task.type) {
      case TaskType::BUILD: ret = RunBuild(ws, uid, cpuid); break;
      case TaskType::RUN: ret = RunExecute(ws, task.input, uid, cpuid); break;
    }
    IGNORE_RETURN(write(pipefd[1], &ret, sizeof(struct cjail_result)));
    _exit(0); // since forked, some atexit() may hang by deadlocks
  }
  close(pipefd[1]);
  {
    std::lock_guard lck(pool_mtx);
    running[pipefd[0]] = {pid, uid, cpuid};
  }
  spdlog::debug("Task type={} of {} started, handle={} pid={} uid={} cpuid={}",
                TaskTypeName(task.type), ws.Root().c_str(), pipefd[0], pid, uid, cpuid);
  return pipefd[0];
}

struct cjail_result WaitResult(int handle) {
  struct cjail_result res = {};
  ssize_t cnt;
  while ((cnt = read(handle, &res, sizeof(res))) < 0 && errno == EINTR);
  if (cnt != sizeof(res)) {
    spdlog::warn("Task handle={} returned no result", handle);
    res = {};
    res.oomkill = cnt < 0 ? errno : EPIPE;
    res.timekill = -1;
  }
  std::lock_guard lck(pool_mtx);
  // close only after erasing, otherwise the fd may be reused by another task first
  auto it = running.find(handle);
  if (it != running.end()) {
    waitpid(it->second.pid, nullptr, 0);
    ReleaseSlot(it->second.uid, it->second.cpuid);
    running.erase(it);
  }
  close(handle);
  spdlog::debug("Task handle={} returned", handle);
  return res;
}

bool TaskSucceeded(const struct cjail_result& res) {
  if (res.timekill || res.oomkill) return false;
  return res.info.si_code == CLD_EXITED && res.info.si_status == 0;
}

std::string DescribeResult(const struct cjail_result& res) {
  if (res.timekill == -1) return fmt::format("sandbox error: {}", strerror(res.oomkill));
  if (res.timekill) return "killed by wall time limit";
  if (res.oomkill) return "killed by memory limit";
  if (res.info.si_code == CLD_EXITED) return fmt::format("exited with status {}", res.info.si_status);
  return fmt::format("killed by signal {}", res.info.si_status);
}
