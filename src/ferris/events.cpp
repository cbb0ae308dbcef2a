#include <ferris/events.h>

#include <nlohmann/json.hpp>

const char kAnswerReason[] = "ferris-answer";
const char kStatisticsReason[] = "benchmark-complete";

namespace {

using nlohmann::json;

bool ReadEstimate(const json& event, const char* name, Estimate& est) {
  auto it = event.find(name);
  if (it == event.end() || !it->is_object()) return false;
  auto ReadNumber = [&](const char* attr, double& target) {
    auto val = it->find(attr);
    if (val == it->end() || !val->is_number()) return false;
    target = val->get<double>();
    return true;
  };
  return ReadNumber("estimate", est.estimate) &&
         ReadNumber("upper_bound", est.upper_bound) &&
         ReadNumber("lower_bound", est.lower_bound);
}

} // namespace

std::optional<RunEvent> ParseRunEventLine(const std::string& line) {
  if (line.empty() || line[0] != '{') return std::nullopt;
  json event = json::parse(line, nullptr, false);
  if (event.is_discarded() || !event.is_object()) return std::nullopt;
  auto reason = event.find("reason");
  if (reason == event.end() || !reason->is_string()) return std::nullopt;

  if (*reason == kAnswerReason) {
    auto it = event.find("answer");
    if (it == event.end()) return std::nullopt;
    if (it->is_string()) return AnswerEvent{it->get<std::string>()};
    if (it->is_number_integer()) return AnswerEvent{it->dump()};
    return std::nullopt;
  }
  if (*reason == kStatisticsReason) {
    StatisticsEvent stats{};
    if (!ReadEstimate(event, "typical", stats.typical) ||
        !ReadEstimate(event, "mean", stats.mean) ||
        !ReadEstimate(event, "median", stats.median)) {
      return std::nullopt;
    }
    return stats;
  }
  return std::nullopt;
}

std::optional<RunEvent> RunEventReader::Next() {
  while (pos_ < output_.size()) {
    size_t end = output_.find('\n', pos_);
    if (end == std::string::npos) end = output_.size();
    std::string line = output_.substr(pos_, end - pos_);
    pos_ = end + 1;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (auto event = ParseRunEventLine(line)) return event;
  }
  return std::nullopt;
}

std::vector<RunEvent> ParseRunEvents(const std::string& output) {
  std::vector<RunEvent> ret;
  RunEventReader reader(output);
  while (auto event = reader.Next()) ret.push_back(std::move(*event));
  return ret;
}
