#include <ferris/workspace.h>

#include <unistd.h>
#include <fnmatch.h>
#include <cstring>
#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"

namespace {

// build artifacts, image descriptors and placeholders stay out of the workspace
const char* kTemplateIgnores[] = {"*target*", "Dockerfile", ".gitkeep"};

bool IsIgnored(const fs::path& path) {
  std::string name = path.filename().string();
  for (const char* pattern : kTemplateIgnores) {
    if (fnmatch(pattern, name.c_str(), 0) == 0) return true;
  }
  return false;
}

// the sandbox runs as an unprivileged uid and needs to write build artifacts
constexpr fs::perms kDirPerm = fs::perms::all;

bool CopyTemplate(const fs::path& from, const fs::path& to) {
  std::error_code ec;
  if (!fs::is_directory(from, ec)) {
    spdlog::warn("Runner template {} is not a directory", from.c_str());
    return false;
  }
  if (!CreateDirs(to, kDirPerm)) return false;
  fs::recursive_directory_iterator it(from, ec), end;
  for (; !ec && it != end; it.increment(ec)) {
    const fs::path& src = it->path();
    if (IsIgnored(src)) {
      if (it->is_directory(ec)) it.disable_recursion_pending();
      continue;
    }
    fs::path dst = to / src.lexically_relative(from);
    if (it->is_directory(ec)) {
      if (!CreateDirs(dst, kDirPerm)) return false;
    } else if (it->is_regular_file(ec)) {
      fs::perms perms = fs::status(src, ec).permissions() | kPerm666;
      if (!Copy(src, dst, perms)) return false;
    }
  }
  if (ec) {
    spdlog::warn("Failed copying runner template {}: {}", from.c_str(), strerror(ec.value()));
    return false;
  }
  return true;
}

// The sandboxed code owns app/ and may have replaced dir with a symlink or a
// file; never follow it, only remove the entry itself.
bool ResetDir(const fs::path& dir) {
  std::error_code ec;
  fs::file_status st = fs::symlink_status(dir, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) goto err;
  if (st.type() == fs::file_type::directory) return ClearDir(dir);
  if (fs::exists(st)) {
    spdlog::warn("{} is no longer a directory; replacing it", dir.c_str());
    fs::remove(dir, ec);
    if (ec) goto err;
  }
  return CreateDirs(dir, kDirPerm);
err:
  spdlog::warn("Failed resetting {}: {}", dir.c_str(), strerror(ec.value()));
  return false;
}

} // namespace

Workspace::~Workspace() {
  if (created_) RemoveAll(root_);
}

fs::path Workspace::AppDir() const {
  return ::AppDir(root_);
}
fs::path Workspace::SourceFile() const {
  return AppDir() / kSourceRelative;
}
fs::path Workspace::InputsDir() const {
  return ::InputsDir(root_);
}
fs::path Workspace::BuildLog() const {
  return BuildLogPath(root_);
}
fs::path Workspace::RunLog() const {
  return RunLogPath(root_);
}

bool Workspace::Prepare(const std::string& code) {
  spdlog::info("Building workspace {}", root_.c_str());
  std::error_code ec;
  if (fs::exists(root_, ec)) {
    spdlog::warn("Workspace {} already exists", root_.c_str());
    return false;
  }
  if (!CreateDirs(root_)) return false;
  created_ = true;
  if (!CopyTemplate(kRunnerTemplate, AppDir())) return false;
  if (!CreateDirs(SourceFile().parent_path(), kDirPerm)) return false;
  if (!WriteFile(SourceFile(), code, kPerm666)) return false;
  return CreateDirs(InputsDir(), kDirPerm);
}

bool Workspace::StageInput(int day, const std::string& name) {
  spdlog::info("Staging input: workspace={} day={} input={}", root_.c_str(), day, name);
  fs::path src = InputFile(day, name);
  std::error_code ec;
  if (!fs::is_regular_file(src, ec)) {
    spdlog::warn("Input {} does not exist", src.c_str());
    return false;
  }
  if (!ResetDir(InputsDir())) return false;
  return Copy(src, InputsDir() / name, kPerm666);
}

fs::path WorkspacePath(long benchmark_id, int64_t user_id) {
  return kWorkspaceRoot / fmt::format("{}-{:06d}-ferris-{}", getpid(), benchmark_id, user_id);
}

std::vector<std::string> ListInputs(int day) {
  std::vector<std::string> ret;
  fs::path dir = InputDir(day);
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file(ec)) ret.push_back(it->path().filename().string());
  }
  if (ec) spdlog::warn("Failed listing inputs in {}: {}", dir.c_str(), strerror(ec.value()));
  std::sort(ret.begin(), ret.end());
  return ret;
}
