#include "paths.h"

fs::path kWorkspaceRoot = "/tmp/ferris_workspaces";
fs::path kRunnerTemplate = fs::path(FERRIS_DATA_DIR) / "runner";
fs::path kInputsRoot = fs::path(FERRIS_DATA_DIR) / "inputs";
fs::path kDatabasePath = fs::path(FERRIS_DATA_DIR) / "ferris.sqlite";
fs::path kSandboxImage = fs::path(FERRIS_DATA_DIR) / "rootfs";
fs::path kMountPoint = "/app";
fs::path kSourceRelative = fs::path("src") / "code.rs";

namespace internal {
fs::path kDataDir = fs::path(FERRIS_DATA_DIR);
} // internal

const char kAppRelative[] = "app";
const char kInputsRelative[] = "inputs";

fs::path InputDir(int day) {
  return fs::absolute(kInputsRoot / std::to_string(day));
}
fs::path InputFile(int day, const std::string& name) {
  return InputDir(day) / name;
}

fs::path AppDir(const fs::path& workspace) {
  return workspace / kAppRelative;
}
fs::path InputsDir(const fs::path& workspace) {
  return AppDir(workspace) / kInputsRelative;
}
fs::path BuildLogPath(const fs::path& workspace) {
  return workspace / "build.log";
}
fs::path RunLogPath(const fs::path& workspace) {
  return workspace / "run.log";
}

fs::path MountedInput(const std::string& name) {
  return kMountPoint / kInputsRelative / name;
}
fs::path SandboxExecPath() {
  return internal::kDataDir / "ferris-sandbox-exec";
}
