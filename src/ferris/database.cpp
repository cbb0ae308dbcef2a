#include <ferris/database.h>

#include <memory>

#include <spdlog/spdlog.h>
#include <ferris/paths.h>
#include <ferris/utils.h>

Database::Database() : path_(kDatabasePath), in_transaction_(false) {}

Database::~Database() {
  if (!in_transaction_) return;
  spdlog::warn("Database {} closed with an open transaction; rolling back", path_);
  try {
    db_->rollback();
  } catch (const std::system_error& err) {
    spdlog::error("Rollback failed: {}", err.what());
  }
}

void Database::Init() {
  if (!db_) db_ = std::make_unique<Storage>(InitStorage(path_));
}

AnswerTable Database::LoadAnswers(int day, int part) {
  using namespace sqlite_orm;
  Init();
  AnswerTable ret;
  auto rows = db_->select(columns(&Solution::key, &Solution::answer2),
                          where(c(&Solution::day) == day and c(&Solution::part) == part));
  for (auto& [key, answer] : rows) ret[key] = answer;
  spdlog::info("Loaded {} answers: day={} part={}", ret.size(), day, part);
  return ret;
}

void Database::AddAnswer(const std::string& key, int day, int part, const std::string& answer) {
  Init();
  db_->replace(Solution{key, day, part, answer});
}

void Database::SaveRuns(const std::vector<RunRecord>& records) {
  Init();
  db_->begin_transaction();
  in_transaction_ = true;
  for (auto& i : records) db_->insert(i);
  spdlog::debug("Inserted {} runs into {}", records.size(), path_);
}

void Database::Commit() {
  if (!in_transaction_) return;
  in_transaction_ = false;
  db_->commit();
}

void Database::Rollback() {
  if (!in_transaction_) return;
  in_transaction_ = false;
  db_->rollback();
}

namespace {

// min() over a nullable column comes back wrapped once more
std::optional<double> TimeValue(double val) { return val; }
std::optional<double> TimeValue(const std::optional<double>& val) { return val; }
template <class T> std::optional<double> TimeValue(const std::unique_ptr<T>& val) {
  if (!val) return std::nullopt;
  return TimeValue(*val);
}

} // namespace

Database::BestTimeList Database::BestTimes(int day, int part) {
  using namespace sqlite_orm;
  Init();
  auto rows = db_->select(columns(&Run::user, min(&Run::time)),
                          where(c(&Run::day) == day and c(&Run::part) == part and
                                is_not_null(&Run::user) and is_not_null(&Run::time)),
                          group_by(&Run::user),
                          multi_order_by(order_by(min(&Run::time)), order_by(&Run::user)));
  // NULL users and times are filtered out above
  BestTimeList ret;
  for (auto& [user, time] : rows) ret.emplace_back(*user, FormatNanoseconds(*TimeValue(time)));
  return ret;
}

std::pair<Database::BestTimeList, Database::BestTimeList> Database::Leaderboard(int day) {
  return {BestTimes(day, 1), BestTimes(day, 2)};
}

RunRecord MakeRunRecord(int64_t user_id, const std::string& code, int day, int part, const InputResult& result) {
  RunRecord ret{};
  ret.user = user_id;
  ret.code = code;
  ret.day = day;
  ret.part = part;
  ret.time = result.median;
  if (result.answer) ret.answer = ParseIntegerAnswer(*result.answer);
  ret.answer2 = result.answer;
  return ret;
}
