#include "utils.h"

#include <fstream>
#include <sstream>
#include <algorithm>

#include <sqlite3.h>
#include <fmt/format.h>
#include <ferris/database.h>
#include <ferris/workspace.h>

namespace fs = std::filesystem;

std::string AnswerLine(const std::string& answer) {
  return fmt::format(R"({{"reason":"ferris-answer","answer":"{}"}})", answer);
}

std::string StatisticsLine(double typical, double mean, double median, double high, double low) {
  auto Est = [](double val, double upper, double lower) {
    return fmt::format(R"({{"estimate":{},"upper_bound":{},"lower_bound":{},"unit":"ns"}})", val, upper, lower);
  };
  return fmt::format(R"({{"reason":"benchmark-complete","id":"bench","typical":{},"mean":{},"median":{},)"
                     R"("median_abs_dev":{},"slope":null,"change":null}})",
                     Est(typical, high, low), Est(mean, mean, mean), Est(median, median, median),
                     Est(0, 0, 0));
}

void WriteText(const fs::path& path, const std::string& content) {
  fs::create_directories(path.parent_path());
  std::ofstream fout(path);
  fout << content;
}

std::string ReadText(const fs::path& path) {
  std::ifstream fin(path);
  std::stringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

int CountRuns(const fs::path& db, int day, int part) {
  using namespace sqlite_orm;
  auto storage = InitStorage(db.string());
  return storage.count<Run>(where(c(&Run::day) == day and c(&Run::part) == part));
}

void FailRunInserts(const fs::path& db) {
  InitStorage(db.string());
  sqlite3* conn = nullptr;
  ASSERT_EQ(sqlite3_open(db.c_str(), &conn), SQLITE_OK);
  char* err = nullptr;
  int rc = sqlite3_exec(conn,
      "CREATE TRIGGER runs_read_only BEFORE INSERT ON runs "
      "BEGIN SELECT RAISE(ABORT, 'runs is read-only'); END;",
      nullptr, nullptr, &err);
  EXPECT_EQ(rc, SQLITE_OK) << (err ? err : "");
  sqlite3_free(err);
  sqlite3_close(conn);
}

bool FakeExecutor::Build(const Benchmark&, const Workspace& ws) {
  builds++;
  workspace = ws.Root();
  built_code = ReadText(ws.SourceFile());
  return build_ok;
}

std::optional<std::string> FakeExecutor::Run(const Benchmark&, const Workspace& ws, const std::string& input) {
  runs.push_back(input);
  std::vector<std::string> files;
  for (auto& i : fs::recursive_directory_iterator(ws.InputsDir())) {
    files.push_back(i.path().lexically_relative(ws.InputsDir()).string());
  }
  std::sort(files.begin(), files.end());
  staged.push_back(std::move(files));
  auto it = outputs.find(input);
  if (it == outputs.end()) return std::nullopt;
  return it->second;
}
