#ifndef FERRIS_PATHS_H_
#define FERRIS_PATHS_H_

#include <ferris/paths.h>

extern const char kAppRelative[];
extern const char kInputsRelative[];

// for workspace layout
fs::path AppDir(const fs::path& workspace);
fs::path InputsDir(const fs::path& workspace);
fs::path BuildLogPath(const fs::path& workspace);
fs::path RunLogPath(const fs::path& workspace);

// for sandbox
// absolute path of a staged input as seen by the sandboxed process
fs::path MountedInput(const std::string& name);
fs::path SandboxExecPath();

#endif  // FERRIS_PATHS_H_
