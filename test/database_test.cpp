#include <ferris/paths.h>
#include <ferris/utils.h>
#include <ferris/database.h>

#include "example_day.h"

namespace {

InputResult Timed(const std::string& input, const std::string& answer, double median) {
  InputResult ret(input);
  ret.answer = answer;
  ret.median = median;
  ret.average = median;
  return ret;
}

} // namespace

class DatabaseTest : public ExampleDay {};

TEST_F(DatabaseTest, Answers) {
  Database db;
  db.AddAnswer("a.txt", 1, 1, "42");
  db.AddAnswer("b.txt", 1, 1, "43");
  db.AddAnswer("a.txt", 1, 2, "100");
  db.AddAnswer("a.txt", 2, 1, "7");
  db.AddAnswer("b.txt", 1, 1, "44");

  AnswerTable answers = db.LoadAnswers(1, 1);
  EXPECT_EQ(answers, (AnswerTable{{"a.txt", "42"}, {"b.txt", "44"}}));
  EXPECT_EQ(db.LoadAnswers(1, 2), (AnswerTable{{"a.txt", "100"}}));
  EXPECT_TRUE(db.LoadAnswers(3, 1).empty());
}

TEST_F(DatabaseTest, RunRecord) {
  RunRecord rec = MakeRunRecord(10, "code", 1, 2, Timed("a.txt", "12345", 1500));
  EXPECT_EQ(rec.user, 10);
  EXPECT_EQ(rec.code, "code");
  EXPECT_EQ(rec.day, 1);
  EXPECT_EQ(rec.part, 2);
  EXPECT_EQ(rec.time, 1500);
  EXPECT_EQ(rec.answer, 12345);
  EXPECT_EQ(rec.answer2, "12345");

  rec = MakeRunRecord(10, "code", 1, 2, Timed("a.txt", "abc", 1500));
  EXPECT_FALSE(rec.answer);
  EXPECT_EQ(rec.answer2, "abc");

  rec = MakeRunRecord(10, "code", 1, 2, InputResult("a.txt"));
  EXPECT_FALSE(rec.time);
  EXPECT_FALSE(rec.answer);
  EXPECT_FALSE(rec.answer2);
}

TEST_F(DatabaseTest, SaveAndCommit) {
  {
    Database db;
    db.SaveRuns({
      MakeRunRecord(10, "x", 1, 1, Timed("a.txt", "1", 3000)),
      MakeRunRecord(10, "x", 1, 1, Timed("b.txt", "1", 1000)),
      MakeRunRecord(20, "y", 1, 1, Timed("a.txt", "1", 2000)),
      MakeRunRecord(30, "z", 1, 1, InputResult("a.txt")),
      MakeRunRecord(40, "w", 1, 2, Timed("a.txt", "1", 2'500'000)),
      MakeRunRecord(50, "v", 2, 1, Timed("a.txt", "1", 10)),
    });
    db.Commit();
  }
  Database db;
  EXPECT_EQ(db.BestTimes(1, 1), (Database::BestTimeList{{10, "1.00µs"}, {20, "2.00µs"}}));
  auto [part1, part2] = db.Leaderboard(1);
  EXPECT_EQ(part1, db.BestTimes(1, 1));
  EXPECT_EQ(part2, (Database::BestTimeList{{40, "2.50ms"}}));
  EXPECT_TRUE(db.BestTimes(3, 1).empty());
}

TEST_F(DatabaseTest, BestTimesOnePerUser) {
  Database db;
  db.SaveRuns({
    MakeRunRecord(30, "x", 1, 1, Timed("a.txt", "1", 5000)),
    MakeRunRecord(20, "x", 1, 1, Timed("a.txt", "1", 900)),
    MakeRunRecord(20, "y", 1, 1, Timed("b.txt", "1", 700)),
    MakeRunRecord(10, "z", 1, 1, Timed("a.txt", "1", 5000)),
    MakeRunRecord(10, "z", 1, 1, InputResult("b.txt")),
    MakeRunRecord(40, "w", 1, 1, InputResult("a.txt")),
  });
  db.Commit();
  // fastest run of every user that has one; equal times by user id
  EXPECT_EQ(db.BestTimes(1, 1), (Database::BestTimeList{{20, "700ns"}, {10, "5.00µs"}, {30, "5.00µs"}}));
}

TEST_F(DatabaseTest, Rollback) {
  {
    Database db;
    db.SaveRuns({MakeRunRecord(10, "x", 1, 1, Timed("a.txt", "1", 3000))});
    db.Rollback();
    db.SaveRuns({MakeRunRecord(20, "x", 1, 1, Timed("a.txt", "1", 3000))});
    // closed without commit
  }
  Database db;
  EXPECT_TRUE(db.BestTimes(1, 1).empty());
}

TEST_F(DatabaseTest, ExplicitPath) {
  Database db((root / "other.sqlite").string());
  db.AddAnswer("a.txt", 1, 1, "42");
  EXPECT_EQ(db.LoadAnswers(1, 1).size(), 1);
  EXPECT_TRUE(Database().LoadAnswers(1, 1).empty());
}
