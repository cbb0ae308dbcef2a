#ifndef INCLUDE_FERRIS_PATHS_H_
#define INCLUDE_FERRIS_PATHS_H_

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

extern fs::path kWorkspaceRoot;
extern fs::path kRunnerTemplate;
extern fs::path kInputsRoot;
extern fs::path kDatabasePath;
// root filesystem the jail chroots into
extern fs::path kSandboxImage;
// inside box
extern fs::path kMountPoint;
// relative to the runner template
extern fs::path kSourceRelative;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

// for input corpus
fs::path InputDir(int day);
fs::path InputFile(int day, const std::string& name);

#endif  // INCLUDE_FERRIS_PATHS_H_
