#include <ferris/benchmark.h>

#include <exception>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <ferris/database.h>
#include <ferris/executor.h>
#include <ferris/workspace.h>
#include "utils.h"

int kMaxParallel = 1;
cpu_set_t kPinnedCpus = {};
long kMemoryLimit = 8L * 1024 * 1024; // 8G
long kMaxOutput = 1L * 1024 * 1024; // 1G
long kBuildTimeout = 30;
long kRunTimeout = 60;
long kKillAfter = 5;
int kProcessLimit = 256;
std::string kBuildCommand = "cargo build";
std::string kRunCommand = "cargo criterion --message-format=json";

namespace {

std::string Truncate(std::string str) {
  if (str.size() > BenchmarkOutcome::kMaxMessageLength) str.resize(BenchmarkOutcome::kMaxMessageLength);
  return str;
}

// Everything except the workspace lifetime; returns early on the first fatal step
void RunPipeline(const Benchmark& bench, Executor& executor, Database& db,
                 Workspace& ws, BenchmarkOutcome& outcome) {
  long id = bench.benchmark_id;
  if (!ws.Prepare(bench.code)) {
    spdlog::error("Failed preparing workspace: id={}", id);
    outcome.status = BenchmarkStatus::WE;
    return;
  }
  if (bench.reporter.ReportBuildStarted) bench.reporter.ReportBuildStarted(bench);
  if (!executor.Build(bench, ws)) {
    outcome.status = BenchmarkStatus::BF;
    return;
  }

  AnswerTable answers;
  try {
    answers = db.LoadAnswers(bench.day, bench.part);
  } catch (const std::system_error& err) {
    spdlog::error("Failed loading answers: id={} day={} part={}: {}", id, bench.day, bench.part, err.what());
    outcome.status = BenchmarkStatus::PE;
    outcome.message = Truncate(err.what());
    return;
  }

  std::vector<std::string> inputs = ListInputs(bench.day);
  for (size_t i = 0; i < inputs.size(); i++) {
    const std::string& input = inputs[i];
    spdlog::info("Processing file: id={} input={}", id, input);
    if (!ws.StageInput(bench.day, input)) {
      spdlog::error("Failed staging input: id={} input={}", id, input);
      outcome.status = BenchmarkStatus::WE;
      return;
    }
    std::vector<RunEvent> events;
    if (auto output = executor.Run(bench, ws, input)) {
      events = ParseRunEvents(*output);
    }
    spdlog::debug("Events from container run: id={} input={} count={}", id, input, events.size());
    outcome.results.push_back(ScoreInput(input, answers, events));
    if (bench.reporter.ReportInputResult) {
      bench.reporter.ReportInputResult(bench, outcome.results.back(), i, inputs.size());
    }
  }

  outcome.summary = Summarize(outcome.results);
  if (!outcome.summary) {
    spdlog::error("No inputs to benchmark: id={} day={}", id, bench.day);
    outcome.status = BenchmarkStatus::NI;
    return;
  }

  std::vector<RunRecord> records;
  for (auto& i : outcome.results) {
    records.push_back(MakeRunRecord(bench.user_id, bench.code, bench.day, bench.part, i));
  }
  try {
    db.SaveRuns(records);
    db.Commit();
  } catch (const std::system_error& err) {
    spdlog::error("Failed saving results: id={}: {}", id, err.what());
    outcome.status = BenchmarkStatus::PE;
    outcome.message = Truncate(err.what());
    try {
      db.Rollback();
    } catch (const std::system_error& err) {
      spdlog::error("Rollback failed: id={}: {}", id, err.what());
    }
  }
}

} // namespace

BenchmarkOutcome RunBenchmark(const Benchmark& bench, Executor& executor, Database& db) {
  spdlog::info("Benchmark started: id={} user={} ({}) day={} part={}",
               bench.benchmark_id, bench.user_id, bench.user_name, bench.day, bench.part);
  BenchmarkOutcome outcome;
  try {
    Workspace ws(WorkspacePath(bench.benchmark_id, bench.user_id));
    RunPipeline(bench, executor, db, ws, outcome);
  } catch (const std::exception& err) {
    spdlog::error("Unhandled exception while benchmarking day {}, part {}: id={}: {}",
                  bench.day, bench.part, bench.benchmark_id, err.what());
    outcome.status = BenchmarkStatus::IE;
    outcome.message = Truncate(err.what());
  }
  spdlog::info("Benchmark finished: id={} status={} results={}",
               bench.benchmark_id, StatusToAbr(outcome.status), outcome.results.size());
  if (bench.reporter.ReportFinished) bench.reporter.ReportFinished(bench, outcome);
  return outcome;
}

std::string OutcomeMessage(const Benchmark& bench, const BenchmarkOutcome& outcome) {
  switch (outcome.status) {
    case BenchmarkStatus::OK: [[fallthrough]];
    case BenchmarkStatus::PE: {
      if (!outcome.summary) break;
      const BenchmarkSummary& summary = *outcome.summary;
      auto Show = [](const std::optional<double>& v) { return v ? FormatNanoseconds(*v) : std::string("n/a"); };
      std::string ret = fmt::format("Benchmark complete ({})\nMedian: {}\nAverage: {}",
                                    summary.verified ? "Verified" : "Unverified",
                                    Show(summary.median), Show(summary.average));
      if (outcome.status == BenchmarkStatus::PE) ret += "\nResults could not be saved.";
      return ret;
    }
    case BenchmarkStatus::BF: return "Build failed.";
    case BenchmarkStatus::NI:
      return fmt::format("No inputs available for day {}, part {}.", bench.day, bench.part);
    case BenchmarkStatus::WE: [[fallthrough]];
    case BenchmarkStatus::IE: break;
  }
  return fmt::format("Unhandled exception while benchmarking day {}, part {}.", bench.day, bench.part);
}
