#ifndef INCLUDE_FERRIS_UTILS_H_
#define INCLUDE_FERRIS_UTILS_H_

#include <string>
#include <cstdint>
#include <ctime>
#include <optional>

#include "tasks.h"
#include "benchmark.h"

#define ENUM_ANSWER_KEY_MODE_ \
  X(NAME, "name") \
  X(STEM, "stem")
enum class AnswerKeyMode {
#define X(name, str) name,
  ENUM_ANSWER_KEY_MODE_
#undef X
};

extern AnswerKeyMode kAnswerKeyMode;

long GetUniqueBenchmarkId();

const char* StatusToDesc(BenchmarkStatus);
const char* StatusToAbr(BenchmarkStatus);

const char* AnswerKeyModeName(AnswerKeyMode);
// false if str is not a known mode
bool GetAnswerKeyMode(const std::string& str, AnswerKeyMode& mode);

// key of an input file in the answer table
std::string AnswerKey(const std::string& input);

// digits-only answers fitting in int64
std::optional<int64_t> ParseIntegerAnswer(const std::string&);

// 2.50s / 2.50ms / 2.50µs / 250ns
std::string FormatNanoseconds(double ns);

// day of month of a UTC timestamp in US Eastern (standard) time, at most 25
int AdventDay(time_t utc);
int CurrentDay();

// logging
const char* TaskTypeName(TaskType);

#endif  // INCLUDE_FERRIS_UTILS_H_
