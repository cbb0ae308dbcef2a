#ifndef INCLUDE_FERRIS_DATABASE_H_
#define INCLUDE_FERRIS_DATABASE_H_

#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <utility>

#include <sqlite_orm/sqlite_orm.h>
#include "scoring.h"

// one row per benchmarked input
struct Run {
  long id;
  std::optional<int64_t> user;
  std::string code;
  int day;
  int part;
  std::optional<double> time; // median, ns
  std::optional<int64_t> answer;
  std::optional<std::string> answer2; // raw answer
};

// known answers
struct Solution {
  std::string key;
  int day;
  int part;
  std::string answer2;
};

using RunRecord = Run;

namespace {

inline auto InitStorage(const std::string& path) {
  using namespace sqlite_orm;
  auto storage = make_storage(path,
      make_index("idx_runs_day_part", &Run::day, &Run::part),
      make_table("runs",
                 make_column("id", &Run::id, primary_key().autoincrement()),
                 make_column("user", &Run::user),
                 make_column("code", &Run::code),
                 make_column("day", &Run::day),
                 make_column("part", &Run::part),
                 make_column("time", &Run::time),
                 make_column("answer", &Run::answer),
                 make_column("answer2", &Run::answer2)),
      make_table("solutions",
                 make_column("key", &Solution::key),
                 make_column("day", &Solution::day),
                 make_column("part", &Solution::part),
                 make_column("answer2", &Solution::answer2),
                 primary_key(&Solution::key, &Solution::day, &Solution::part)));
  storage.sync_schema(true);
  return storage;
}

} // namespace

// Not thread-safe; use one Database per benchmark invocation.
// All operations throw std::system_error on store failures.
class Database {
 public:
  using Storage = decltype(InitStorage(std::string()));
  // (user id, formatted time), fastest first
  using BestTimeList = std::vector<std::pair<int64_t, std::string>>;

 private:
  std::string path_;
  std::unique_ptr<Storage> db_;
  bool in_transaction_;

 public:
  Database();
  explicit Database(std::string path) : path_(std::move(path)), in_transaction_(false) {}
  ~Database();

  void Init();

  AnswerTable LoadAnswers(int day, int part);
  void AddAnswer(const std::string& key, int day, int part, const std::string& answer);

  // begins a transaction; Commit or Rollback must follow
  void SaveRuns(const std::vector<RunRecord>& records);
  void Commit();
  void Rollback();

  BestTimeList BestTimes(int day, int part);
  // part 1, part 2
  std::pair<BestTimeList, BestTimeList> Leaderboard(int day);
};

RunRecord MakeRunRecord(int64_t user_id, const std::string& code, int day, int part, const InputResult&);

#endif  // INCLUDE_FERRIS_DATABASE_H_
