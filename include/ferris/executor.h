#ifndef INCLUDE_FERRIS_EXECUTOR_H_
#define INCLUDE_FERRIS_EXECUTOR_H_

#include <string>
#include <optional>

class Benchmark;
class Workspace;

class Executor {
 public:
  virtual ~Executor() = default;
  // true if the build command exited successfully
  virtual bool Build(const Benchmark&, const Workspace&) = 0;
  // combined output, or std::nullopt if the sandboxed process failed
  virtual std::optional<std::string> Run(const Benchmark&, const Workspace&, const std::string& input) = 0;
};

// Drives cjail through the sandbox-exec helper. Calls may come from any
// thread; at most kMaxParallel sandboxes run at the same time.
class SandboxExecutor : public Executor {
 public:
  bool Build(const Benchmark&, const Workspace&) override;
  std::optional<std::string> Run(const Benchmark&, const Workspace&, const std::string& input) override;
};

#endif  // INCLUDE_FERRIS_EXECUTOR_H_
