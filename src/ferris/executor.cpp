#include <ferris/executor.h>

#include <spdlog/spdlog.h>
#include <ferris/benchmark.h>
#include <ferris/workspace.h>
#include "tasks.h"
#include "utils.h"

bool SandboxExecutor::Build(const Benchmark& bench, const Workspace& ws) {
  spdlog::info("Running container to build code: id={} user={}", bench.benchmark_id, bench.user_id);
  int handle = RunTask(ws, {TaskType::BUILD, ""});
  if (handle < 0) return false;
  struct cjail_result res = WaitResult(handle);
  auto output = ReadFile(ws.BuildLog());
  spdlog::debug("Build container output: id={}\n{}", bench.benchmark_id, output.value_or(""));
  if (!TaskSucceeded(res)) {
    spdlog::warn("Build failed: id={} {}", bench.benchmark_id, DescribeResult(res));
    return false;
  }
  return true;
}

std::optional<std::string> SandboxExecutor::Run(
    const Benchmark& bench, const Workspace& ws, const std::string& input) {
  spdlog::info("Running container to run code: id={} user={} input={}",
               bench.benchmark_id, bench.user_id, input);
  int handle = RunTask(ws, {TaskType::RUN, input});
  if (handle < 0) return std::nullopt;
  struct cjail_result res = WaitResult(handle);
  auto output = ReadFile(ws.RunLog());
  spdlog::debug("Run container output: id={} input={}\n{}", bench.benchmark_id, input, output.value_or(""));
  if (!TaskSucceeded(res)) {
    spdlog::warn("Run failed: id={} input={} {}", bench.benchmark_id, input, DescribeResult(res));
    return std::nullopt;
  }
  return output;
}
