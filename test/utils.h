#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <unordered_map>

#include <gtest/gtest.h>
#include <ferris/executor.h>
#include <ferris/benchmark.h>

// per-process scratch directory, removed when the test program exits
extern std::filesystem::path kTestRoot;

// event lines as printed by the runner
std::string AnswerLine(const std::string& answer);
std::string StatisticsLine(double typical, double mean, double median, double high, double low);
inline std::string StatisticsLine(double median, double mean) {
  return StatisticsLine(median, mean, median, median * 1.1, median * 0.9);
}

void WriteText(const std::filesystem::path& path, const std::string& content);
std::string ReadText(const std::filesystem::path& path);

// rows of the runs table for (day, part), read through a separate connection
int CountRuns(const std::filesystem::path& db, int day, int part);
// make every insert into runs abort
void FailRunInserts(const std::filesystem::path& db);

// Scripted executor; inputs missing from outputs behave like a failed run.
class FakeExecutor : public Executor {
 public:
  bool build_ok = true;
  std::unordered_map<std::string, std::string> outputs;

  int builds = 0;
  std::vector<std::string> runs;
  // source seen at build time
  std::string built_code;
  // content of the inputs area for every run
  std::vector<std::vector<std::string>> staged;
  std::filesystem::path workspace;

  bool Build(const Benchmark&, const Workspace&) override;
  std::optional<std::string> Run(const Benchmark&, const Workspace&, const std::string& input) override;
};

#endif // TEST_UTILS_H_
