#include "utils.h"

#include <ctime>
#include <cerrno>
#include <cstring>
#include <atomic>
#include <charconv>
#include <fstream>
#include <sstream>
#include <vector>
#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

AnswerKeyMode kAnswerKeyMode = AnswerKeyMode::NAME;

namespace {

std::atomic_long benchmark_id_seq = 0;

// Advent of Code unlocks puzzles at midnight EST
// Puzzles unlock at midnight America/New_York. December is EST all month, so
// a fixed UTC-5 offset is exact for the whole event.
constexpr long kEasternOffset = -5 * 3600;
constexpr int kLastDay = 25;

} // namespace

long GetUniqueBenchmarkId() {
  return ++benchmark_id_seq;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG3(BenchmarkStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* StatusToDesc, BenchmarkStatus, ENUM_BENCHMARK_STATUS_)
#undef X

#define X(...) X_RETURN_ARG2(BenchmarkStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* StatusToAbr, BenchmarkStatus, ENUM_BENCHMARK_STATUS_)
#undef X

#define X(...) X_RETURN_ARG1(TaskType, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* TaskTypeName, TaskType, ENUM_TASK_TYPE_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3

static const char* kAnswerKeyModeTable[] = {
#define X(name, str) str,
  ENUM_ANSWER_KEY_MODE_
#undef X
};

const char* AnswerKeyModeName(AnswerKeyMode mode) {
  return kAnswerKeyModeTable[(int)mode];
}

bool GetAnswerKeyMode(const std::string& str, AnswerKeyMode& mode) {
  for (size_t i = 0; i < sizeof(kAnswerKeyModeTable) / sizeof(kAnswerKeyModeTable[0]); i++) {
    if (str == kAnswerKeyModeTable[i]) {
      mode = (AnswerKeyMode)i;
      return true;
    }
  }
  return false;
}

std::string AnswerKey(const std::string& input) {
  switch (kAnswerKeyMode) {
    case AnswerKeyMode::NAME: return input;
    case AnswerKeyMode::STEM: return fs::path(input).stem().string();
  }
  __builtin_unreachable();
}

std::optional<int64_t> ParseIntegerAnswer(const std::string& str) {
  if (str.empty() || !std::all_of(str.begin(), str.end(), [](char c) { return c >= '0' && c <= '9'; })) {
    return std::nullopt;
  }
  int64_t val = 0;
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), val);
  if (ec != std::errc() || ptr != str.data() + str.size()) return std::nullopt;
  return val;
}

std::string FormatNanoseconds(double ns) {
  if (ns >= 1e9) return fmt::format("{:.2f}s", ns / 1e9);
  if (ns >= 1e6) return fmt::format("{:.2f}ms", ns / 1e6);
  if (ns >= 1e3) return fmt::format("{:.2f}µs", ns / 1e3);
  return fmt::format("{:.0f}ns", ns);
}

int AdventDay(time_t utc) {
  time_t now = utc + kEasternOffset;
  struct tm stamp{};
  gmtime_r(&now, &stamp);
  return std::min(stamp.tm_mday, kLastDay);
}

int CurrentDay() {
  return AdventDay(time(nullptr));
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool ClearDir(const fs::path& path) {
  spdlog::debug("Clear directory {}", path.c_str());
  std::error_code ec;
  // collect first; removing while iterating invalidates the iterator
  std::vector<fs::path> entries;
  for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
    entries.push_back(it->path());
  }
  if (ec) goto err;
  for (auto& i : entries) {
    fs::remove_all(i, ec);
    if (ec) goto err;
  }
  return true;
err:
  spdlog::warn("Failed clearing directory {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool Copy(const fs::path& from, const fs::path& to, fs::perms perms) {
  spdlog::debug("Copy file {} -> {}", from.c_str(), to.c_str());
  std::error_code ec;
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(to, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed copying {} -> {}: {}", from.c_str(), to.c_str(), strerror(ec.value()));
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write file {}, size {}", path.c_str(), content.size());
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout || !fout.write(content.data(), content.size())) {
      spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
      return false;
    }
  }
  if (perms == fs::perms::unknown) return true;
  std::error_code ec;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permissions of {}: {}", path.c_str(), strerror(ec.value()));
    return false;
  }
  return true;
}

std::optional<std::string> ReadFile(const fs::path& path) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) {
    spdlog::warn("Failed reading {}: {}", path.c_str(), strerror(errno));
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}
