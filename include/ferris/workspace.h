#ifndef INCLUDE_FERRIS_WORKSPACE_H_
#define INCLUDE_FERRIS_WORKSPACE_H_

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

// Ephemeral directory owned by one benchmark invocation:
//   <root>/app        mounted into the sandbox (runner, code, inputs/)
//   <root>/build.log  captured build output
//   <root>/run.log    captured run output
// The whole directory is removed when the Workspace goes out of scope.
class Workspace {
  std::filesystem::path root_;
  bool created_; // only a directory created by Prepare is removed
 public:
  explicit Workspace(std::filesystem::path root) : root_(std::move(root)), created_(false) {}
  ~Workspace();
  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;

  // copy the runner template and write the submitted source
  bool Prepare(const std::string& code);
  // leave exactly one file (the requested input) in the inputs area
  bool StageInput(int day, const std::string& name);

  const std::filesystem::path& Root() const { return root_; }
  std::filesystem::path AppDir() const;
  std::filesystem::path SourceFile() const;
  std::filesystem::path InputsDir() const;
  std::filesystem::path BuildLog() const;
  std::filesystem::path RunLog() const;
};

std::filesystem::path WorkspacePath(long benchmark_id, int64_t user_id);

// regular files of the day's input directory, sorted by name
std::vector<std::string> ListInputs(int day);

#endif  // INCLUDE_FERRIS_WORKSPACE_H_
