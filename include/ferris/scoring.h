#ifndef INCLUDE_FERRIS_SCORING_H_
#define INCLUDE_FERRIS_SCORING_H_

#include <string>
#include <vector>
#include <optional>
#include <unordered_map>

#include "events.h"

// input key (see AnswerKey) -> expected answer
using AnswerTable = std::unordered_map<std::string, std::string>;

struct InputResult {
  std::string input;
  std::optional<std::string> answer;
  bool verified;
  // ns; absent if the run produced no statistics
  std::optional<double> typical, average, median, high_bound, low_bound;

  InputResult() : verified(false) {}
  explicit InputResult(const std::string& input) : input(input), verified(false) {}

  bool HasTiming() const { return median.has_value() && average.has_value(); }
};

struct BenchmarkSummary {
  bool verified; // computed over verified results only
  size_t counted; // number of results the means are taken over
  // ns; absent if no result carries timing data
  std::optional<double> median, average;

  BenchmarkSummary() : verified(false), counted(0) {}
};

InputResult ApplyEvent(InputResult result, const RunEvent& event, const AnswerTable& answers);
InputResult ScoreInput(const std::string& input, const AnswerTable& answers,
                       const std::vector<RunEvent>& events);

// std::nullopt iff results is empty
std::optional<BenchmarkSummary> Summarize(const std::vector<InputResult>& results);

#endif  // INCLUDE_FERRIS_SCORING_H_
