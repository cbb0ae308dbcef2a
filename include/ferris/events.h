#ifndef INCLUDE_FERRIS_EVENTS_H_
#define INCLUDE_FERRIS_EVENTS_H_

#include <string>
#include <vector>
#include <variant>
#include <optional>

// Events emitted by the sandboxed run step, one JSON object per line:
//   {"reason":"ferris-answer","answer":"42"}
//   {"reason":"benchmark-complete","typical":{...},"mean":{...},"median":{...}}
// Everything else in the output is diagnostic text and is ignored.

extern const char kAnswerReason[];
extern const char kStatisticsReason[];

struct AnswerEvent {
  std::string answer;
};

// all values in nanoseconds
struct Estimate {
  double estimate, upper_bound, lower_bound;
};

struct StatisticsEvent {
  Estimate typical, mean, median;
};

using RunEvent = std::variant<AnswerEvent, StatisticsEvent>;

// Single pass over the raw output; lines that do not decode into a known event
// are skipped.
class RunEventReader {
  const std::string& output_;
  size_t pos_;
 public:
  explicit RunEventReader(const std::string& output) : output_(output), pos_(0) {}
  RunEventReader(const RunEventReader&) = delete;
  RunEventReader& operator=(const RunEventReader&) = delete;

  // std::nullopt after the last line
  std::optional<RunEvent> Next();
};

// Decode a single line; std::nullopt if it is not an event
std::optional<RunEvent> ParseRunEventLine(const std::string& line);

std::vector<RunEvent> ParseRunEvents(const std::string& output);

#endif  // INCLUDE_FERRIS_EVENTS_H_
