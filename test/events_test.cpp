#include <gtest/gtest.h>
#include <ferris/events.h>

#include "utils.h"

TEST(Events, AnswerAndStatistics) {
  std::string output =
      "   Compiling runner v0.1.0 (/app)\n"
      "    Finished bench [optimized] target(s) in 4.20s\n" +
      AnswerLine("42") + "\n"
      "Benchmarking part1: Warming up for 3.0000 s\n" +
      StatisticsLine(1500000, 1600000, 1550000, 1700000, 1400000) + "\n";
  auto events = ParseRunEvents(output);
  ASSERT_EQ(events.size(), 2);
  ASSERT_TRUE(std::holds_alternative<AnswerEvent>(events[0]));
  EXPECT_EQ(std::get<AnswerEvent>(events[0]).answer, "42");
  ASSERT_TRUE(std::holds_alternative<StatisticsEvent>(events[1]));
  auto& stats = std::get<StatisticsEvent>(events[1]);
  EXPECT_DOUBLE_EQ(stats.typical.estimate, 1500000);
  EXPECT_DOUBLE_EQ(stats.typical.upper_bound, 1700000);
  EXPECT_DOUBLE_EQ(stats.typical.lower_bound, 1400000);
  EXPECT_DOUBLE_EQ(stats.mean.estimate, 1600000);
  EXPECT_DOUBLE_EQ(stats.median.estimate, 1550000);
}

TEST(Events, DropsUnknownAndMalformedLines) {
  std::string output =
      R"({"reason":"compiler-artifact","package_id":"runner"})" "\n"
      R"({"reason":"ferris-answer")" "\n"
      R"({"reason":"ferris-answer","answer":[1,2]})" "\n"
      R"({"reason":"benchmark-complete","typical":{"estimate":1}})" "\n"
      R"({"answer":"7"})" "\n"
      R"(["reason","ferris-answer"])" "\n"
      " {\"reason\":\"ferris-answer\",\"answer\":\"indented\"}\n"
      "\n"
      "thread 'main' panicked at src/code.rs:3:5\n";
  EXPECT_TRUE(ParseRunEvents(output).empty());
}

TEST(Events, IntegerAnswer) {
  auto event = ParseRunEventLine(R"({"reason":"ferris-answer","answer":123456789012})");
  ASSERT_TRUE(event);
  EXPECT_EQ(std::get<AnswerEvent>(*event).answer, "123456789012");
}

TEST(Events, CarriageReturnAndMissingTrailingNewline) {
  std::string output = "noise\r\n" + AnswerLine("a") + "\r\n" + AnswerLine("b");
  auto events = ParseRunEvents(output);
  ASSERT_EQ(events.size(), 2);
  EXPECT_EQ(std::get<AnswerEvent>(events[0]).answer, "a");
  EXPECT_EQ(std::get<AnswerEvent>(events[1]).answer, "b");
}

TEST(Events, ReaderKeepsArrivalOrder) {
  std::string output = StatisticsLine(10, 20) + "\nx\n" + AnswerLine("1") + "\n" + StatisticsLine(30, 40) + "\n";
  RunEventReader reader(output);
  auto first = reader.Next();
  ASSERT_TRUE(first && std::holds_alternative<StatisticsEvent>(*first));
  EXPECT_DOUBLE_EQ(std::get<StatisticsEvent>(*first).median.estimate, 10);
  auto second = reader.Next();
  ASSERT_TRUE(second && std::holds_alternative<AnswerEvent>(*second));
  auto third = reader.Next();
  ASSERT_TRUE(third && std::holds_alternative<StatisticsEvent>(*third));
  EXPECT_DOUBLE_EQ(std::get<StatisticsEvent>(*third).median.estimate, 30);
  EXPECT_FALSE(reader.Next());
  EXPECT_FALSE(reader.Next());
}
