#ifndef FERRIS_UTILS_H_
#define FERRIS_UTILS_H_

#include <string>
#include <optional>
#include <filesystem>

#include <ferris/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm666 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::group_write |
    fs::perms::others_read | fs::perms::others_write;

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
// remove everything inside a directory, keeping the directory itself
bool ClearDir(const fs::path&);

// This function resolves symlinks
bool Copy(const fs::path& from, const fs::path& to, fs::perms = fs::perms::unknown);
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);
std::optional<std::string> ReadFile(const fs::path&);

#endif  // FERRIS_UTILS_H_
