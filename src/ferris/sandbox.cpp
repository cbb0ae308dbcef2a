#include "sandbox.h"

#include <unistd.h>
#include <cstring>

namespace {

// Fixed-width native-endian encoding; both ends are built from the same sources.
class Writer {
  std::vector<uint8_t>& buf_;
 public:
  explicit Writer(std::vector<uint8_t>& buf) : buf_(buf) {}
  Writer& operator<<(long val) {
    size_t off = buf_.size();
    buf_.resize(off + sizeof(val));
    memcpy(buf_.data() + off, &val, sizeof(val));
    return *this;
  }
  Writer& operator<<(const std::string& str) {
    *this << (long)str.size();
    buf_.insert(buf_.end(), str.begin(), str.end());
    return *this;
  }
  Writer& operator<<(const std::pair<std::string, std::string>& val) {
    return *this << val.first << val.second;
  }
  template <class T> Writer& operator<<(const std::vector<T>& vec) {
    *this << (long)vec.size();
    for (auto& i : vec) *this << i;
    return *this;
  }
};

class Reader {
  const std::vector<uint8_t>& buf_;
  size_t off_;
 public:
  explicit Reader(const std::vector<uint8_t>& buf) : buf_(buf), off_(0) {}
  long Long() {
    long val = 0;
    if (off_ + sizeof(val) > buf_.size()) return val;
    memcpy(&val, buf_.data() + off_, sizeof(val));
    off_ += sizeof(val);
    return val;
  }
  Reader& operator>>(long& val) {
    val = Long();
    return *this;
  }
  Reader& operator>>(int& val) {
    val = Long();
    return *this;
  }
  Reader& operator>>(bool& val) {
    val = Long();
    return *this;
  }
  Reader& operator>>(std::string& str) {
    size_t size = Long();
    if (off_ + size > buf_.size()) size = buf_.size() - off_;
    str.assign(buf_.begin() + off_, buf_.begin() + off_ + size);
    off_ += size;
    return *this;
  }
  Reader& operator>>(std::pair<std::string, std::string>& val) {
    return *this >> val.first >> val.second;
  }
  template <class T> Reader& operator>>(std::vector<T>& vec) {
    vec.resize(Long());
    for (auto& i : vec) *this >> i;
    return *this;
  }
};

} // namespace

SandboxOptions::SandboxOptions(const std::vector<uint8_t>& vec) {
  Reader(vec) >> boxdir >> command >> envs >> workdir >> fd_output >> fd_error >> cpu_set
      >> uid >> gid >> wall_time >> rss >> proc_num >> fsize >> share_net >> mounts;
}

std::vector<uint8_t> SandboxOptions::Serialize() const {
  std::vector<uint8_t> ret;
  Writer(ret) << boxdir << command << envs << workdir << (long)fd_output << (long)fd_error
      << std::vector<long>(cpu_set.begin(), cpu_set.end()) << (long)uid << (long)gid
      << wall_time << rss << (long)proc_num << fsize << (long)share_net << mounts;
  return ret;
}

void SandboxOptions::ToCJailCtx(CJailCtxClass& jail) const {
  struct cjail_ctx& ctx = jail.ctx_;
  cjail_ctx_init(&ctx);
  if (fd_output != -1) ctx.fd_output = fd_output;
  if (fd_error != -1) ctx.fd_error = fd_error;
  ctx.redir_input = const_cast<char*>("/dev/null");

  for (auto& i : command) jail.argv_buf_.push_back(i.c_str());
  jail.argv_buf_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(jail.argv_buf_.data());
  for (auto& i : envs) jail.env_buf_.push_back(i.c_str());
  jail.env_buf_.push_back(nullptr);
  ctx.environ = const_cast<char* const*>(jail.env_buf_.data());

  ctx.chroot = const_cast<char*>(boxdir.c_str());
  ctx.working_dir = const_cast<char*>(workdir.c_str());
  ctx.sharenet = share_net;
  ctx.cpuset = nullptr;
  if (cpu_set.size()) {
    CPU_ZERO(&jail.cpu_set_);
    for (int cpu : cpu_set) CPU_SET(cpu, &jail.cpu_set_);
    ctx.cpuset = &jail.cpu_set_;
  }

  ctx.uid = uid;
  ctx.gid = gid;
  ctx.rlim_core = 0;
  ctx.rlim_fsize = fsize;
  ctx.rlim_proc = proc_num;
  ctx.cg_rss = rss;
  ctx.lim_time.tv_sec = wall_time / 1'000'000;
  ctx.lim_time.tv_usec = wall_time % 1'000'000;

  // mnt_buf_ entries are linked into mnt_list_ by address; no reallocation allowed
  jail.mnt_buf_.reserve(mounts.size());
  for (auto& [source, target] : mounts) {
    struct jail_mount_ctx& mnt = jail.mnt_buf_.emplace_back();
    mnt.type = const_cast<char*>(kBindMount);
    mnt.source = const_cast<char*>(source.c_str());
    mnt.target = const_cast<char*>(target.c_str());
    mnt.fstype = nullptr;
    mnt.data = nullptr;
    mnt.flags = 0;
    mnt_list_add(jail.mnt_list_, &mnt);
  }
  ctx.mount_cfg = jail.mnt_list_;
}
