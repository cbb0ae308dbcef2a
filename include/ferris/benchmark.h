#ifndef INCLUDE_FERRIS_BENCHMARK_H_
#define INCLUDE_FERRIS_BENCHMARK_H_

#include <sched.h>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <functional>

#include "scoring.h"

extern int kMaxParallel;
extern cpu_set_t kPinnedCpus;
// KiB
extern long kMemoryLimit;
extern long kMaxOutput;
// seconds
extern long kBuildTimeout;
extern long kRunTimeout;
extern long kKillAfter;
extern int kProcessLimit;
extern std::string kBuildCommand;
extern std::string kRunCommand;
// KEY=VALUE entries passed to every sandboxed command
extern std::vector<std::string> kSandboxEnv;

#define ENUM_BENCHMARK_STATUS_ \
  X(OK, "OK", "Benchmark complete") \
  X(BF, "BF", "Build failed") \
  X(WE, "WE", "Workspace error") \
  X(NI, "NI", "No inputs for this day") \
  X(PE, "PE", "Persistence error") \
  X(IE, "IE", "Unhandled exception")
enum class BenchmarkStatus {
#define X(name, abr, desc) name,
  ENUM_BENCHMARK_STATUS_
#undef X
};

class BenchmarkOutcome;

class Benchmark {
 public:
  // used for workspace naming; must be unique in a run
  long benchmark_id;
  // submitter
  int64_t user_id;
  std::string user_name;
  // problem
  int day, part;
  std::string code;

  struct Reporter {
    // these functions should not block
    std::function<void(const Benchmark&)> ReportBuildStarted;
    std::function<void(const Benchmark&, const InputResult&, size_t index, size_t total)> ReportInputResult;
    std::function<void(const Benchmark&, const BenchmarkOutcome&)> ReportFinished;
  };
  Reporter reporter;

  Benchmark() : benchmark_id(0), user_id(0), day(0), part(0) {}
};

class BenchmarkOutcome {
 public:
  BenchmarkStatus status;
  std::optional<BenchmarkSummary> summary;
  std::vector<InputResult> results;
  // diagnostic detail for IE/PE, truncated to kMaxMessageLength
  std::string message;

  static constexpr size_t kMaxMessageLength = 2000;

  BenchmarkOutcome() : status(BenchmarkStatus::OK) {}
};

class Executor;
class Database;

// Runs the whole pipeline on the calling thread; blocks while the sandbox
// builds and runs the code. Safe to call from several threads at once as long
// as each call gets its own Database.
BenchmarkOutcome RunBenchmark(const Benchmark&, Executor&, Database&);

// Reply text for the chat layer
std::string OutcomeMessage(const Benchmark&, const BenchmarkOutcome&);

#endif  // INCLUDE_FERRIS_BENCHMARK_H_
