#ifndef FERRIS_SANDBOX_H_
#define FERRIS_SANDBOX_H_

#include <string>
#include <vector>
#include <utility>
#include <cstdint>

#include <cjail/cjail.h>

class SandboxOptions;
class CJailCtxClass {
 private:
  std::vector<const char*> argv_buf_;
  std::vector<const char*> env_buf_;
  std::vector<struct jail_mount_ctx> mnt_buf_;
  struct jail_mount_list* mnt_list_;
  cpu_set_t cpu_set_;
  struct cjail_ctx ctx_;
 public:
  CJailCtxClass() : mnt_list_(mnt_list_new()) {}
  ~CJailCtxClass() {
    mnt_list_free(mnt_list_);
  }
  CJailCtxClass(const CJailCtxClass&) = delete;
  CJailCtxClass& operator=(const CJailCtxClass&) = delete;
  struct cjail_ctx& GetCtx() { return ctx_; }
  const struct cjail_ctx& GetCtx() const { return ctx_; }

  friend class SandboxOptions;
};

class SandboxOptions {
  static constexpr char kBindMount[] = "bind";
 public:
  // root filesystem of the jail
  std::string boxdir;
  std::vector<std::string> command;
  std::vector<std::string> envs;
  // inside box
  std::string workdir;
  int fd_output, fd_error; // -1 for not dup
  std::vector<int> cpu_set;
  int uid, gid;
  long wall_time; // us
  long rss; // KiB
  int proc_num;
  long fsize; // KiB
  bool share_net;
  // read-write bind mounts: (source outside box, target inside box)
  std::vector<std::pair<std::string, std::string>> mounts;

  SandboxOptions() :
      fd_output(-1), fd_error(-1),
      uid(65534), gid(65534),
      wall_time(0),
      rss(0),
      proc_num(0),
      fsize(0),
      share_net(false) {}
  SandboxOptions(const std::vector<uint8_t>& serial);

  // platform dependent, only intended for same machine
  std::vector<uint8_t> Serialize() const;
  // the context points into this object; keep it unchanged until cjail_exec returns
  void ToCJailCtx(CJailCtxClass&) const;
};

#endif  // FERRIS_SANDBOX_H_
