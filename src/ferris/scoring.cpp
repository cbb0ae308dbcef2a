#include <ferris/scoring.h>

#include <type_traits>

#include <spdlog/spdlog.h>
#include <ferris/utils.h>

InputResult ApplyEvent(InputResult result, const RunEvent& event, const AnswerTable& answers) {
  std::visit([&](const auto& ev) {
    using T = std::decay_t<decltype(ev)>;
    if constexpr (std::is_same_v<T, AnswerEvent>) {
      result.answer = ev.answer;
      auto it = answers.find(AnswerKey(result.input));
      result.verified = it != answers.end() && it->second == ev.answer;
    } else {
      result.typical = ev.typical.estimate;
      result.average = ev.mean.estimate;
      result.median = ev.median.estimate;
      result.high_bound = ev.typical.upper_bound;
      result.low_bound = ev.typical.lower_bound;
    }
  }, event);
  return result;
}

InputResult ScoreInput(const std::string& input, const AnswerTable& answers,
                       const std::vector<RunEvent>& events) {
  InputResult result(input);
  for (auto& event : events) result = ApplyEvent(std::move(result), event, answers);
  spdlog::info("Computed run result: input={} answer={} verified={} median={} average={}",
               input, result.answer.value_or("<none>"), result.verified,
               result.median.value_or(-1), result.average.value_or(-1));
  return result;
}

std::optional<BenchmarkSummary> Summarize(const std::vector<InputResult>& results) {
  if (results.empty()) return std::nullopt;
  // runs without statistics have nothing to average
  double verified_median = 0, verified_average = 0, all_median = 0, all_average = 0;
  size_t verified_count = 0, all_count = 0;
  for (auto& i : results) {
    if (!i.HasTiming()) continue;
    all_median += *i.median;
    all_average += *i.average;
    all_count++;
    if (i.verified) {
      verified_median += *i.median;
      verified_average += *i.average;
      verified_count++;
    }
  }
  BenchmarkSummary summary;
  if (verified_count) {
    summary.verified = true;
    summary.counted = verified_count;
    summary.median = verified_median / verified_count;
    summary.average = verified_average / verified_count;
  } else if (all_count) {
    summary.counted = all_count;
    summary.median = all_median / all_count;
    summary.average = all_average / all_count;
  }
  return summary;
}
