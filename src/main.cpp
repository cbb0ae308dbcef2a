#include <unistd.h>
#include <sys/sysinfo.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <filesystem>
#include <system_error>

#include <tortellini.hh>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <ferris/paths.h>
#include <ferris/utils.h>
#include <ferris/logger.h>
#include <ferris/database.h>
#include <ferris/executor.h>
#include <ferris/benchmark.h>
#include <ferris/cpuset.h>

namespace {

bool SetPinnedCpus(const std::string& str) {
  if (!CpusetParse(str.c_str(), &kPinnedCpus, get_nprocs())) {
    spdlog::error("Invalid CPU list \"{}\"", str);
    return false;
  }
  return true;
}

void SetPath(fs::path& target, const std::string& val) {
  if (val.size()) target = val;
}

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  SetPath(kWorkspaceRoot, ini[""]["workspace_root"] | "");
  SetPath(kRunnerTemplate, ini[""]["runner_template"] | "");
  SetPath(kInputsRoot, ini[""]["inputs_dir"] | "");
  SetPath(kDatabasePath, ini[""]["database"] | "");
  SetPath(kSandboxImage, ini[""]["sandbox_image"] | "");
  SetPath(kMountPoint, ini[""]["mount_point"] | "");
  SetPath(kSourceRelative, ini[""]["source_path"] | "");
  kBuildCommand = ini[""]["build_command"] | kBuildCommand;
  kRunCommand = ini[""]["run_command"] | kRunCommand;
  kBuildTimeout = ini[""]["build_timeout"] | kBuildTimeout;
  kRunTimeout = ini[""]["run_timeout"] | kRunTimeout;
  kKillAfter = ini[""]["kill_after"] | kKillAfter;
  kMemoryLimit = (ini[""]["memory_limit_mb"] | (kMemoryLimit / 1024)) * 1024;
  kProcessLimit = ini[""]["process_limit"] | kProcessLimit;
  kMaxParallel = ini[""]["parallel"] | kMaxParallel;
  if (std::string cpus = ini[""]["pinned_cpus"] | ""; cpus.size() && !SetPinnedCpus(cpus)) return false;
  if (std::string mode = ini[""]["answer_key"] | ""; mode.size() && !GetAnswerKeyMode(mode, kAnswerKeyMode)) {
    spdlog::error("Unknown answer_key \"{}\"", mode);
    return false;
  }
  return true;
}

void PrintLeaderboard(const char* title, const Database::BestTimeList& list) {
  std::cout << title << '\n';
  if (list.empty()) std::cout << "  (no runs)\n";
  for (size_t i = 0; i < list.size(); i++) {
    std::cout << fmt::format("  {}. <@{}> {}\n", i + 1, list[i].first, list[i].second);
  }
}

int DoRun(const argparse::ArgumentParser& cmd) {
  if (geteuid() != 0) {
    spdlog::error("Must be run as root.");
    return 1;
  }
  fs::path source = cmd.get<std::string>("source");
  std::ifstream fin(source);
  if (!fin) {
    spdlog::error("Cannot open source file {}", source.c_str());
    return 1;
  }
  std::stringstream ss;
  ss << fin.rdbuf();

  Benchmark bench;
  bench.benchmark_id = GetUniqueBenchmarkId();
  bench.user_id = cmd.get<int64_t>("--user-id");
  bench.user_name = cmd.get<std::string>("--user-name");
  bench.day = cmd.present<int>("--day").value_or(CurrentDay());
  bench.part = cmd.get<int>("--part");
  bench.code = ss.str();
  bench.reporter.ReportBuildStarted = [](const Benchmark& b) {
    std::cout << fmt::format("Building day {} part {}...", b.day, b.part) << std::endl;
  };
  bench.reporter.ReportInputResult = [](const Benchmark&, const InputResult& res, size_t index, size_t total) {
    std::cout << fmt::format("[{}/{}] {}: {}{}", index + 1, total, res.input,
                             res.median ? FormatNanoseconds(*res.median) : std::string("no timing"),
                             res.verified ? " (verified)" : "") << std::endl;
  };

  SandboxExecutor executor;
  Database db;
  BenchmarkOutcome outcome = RunBenchmark(bench, executor, db);
  std::cout << OutcomeMessage(bench, outcome) << std::endl;
  return outcome.status == BenchmarkStatus::OK ? 0 : 2;
}

int DoLeaderboard(const argparse::ArgumentParser& cmd) {
  int day = cmd.present<int>("--day").value_or(CurrentDay());
  Database db;
  try {
    auto [part1, part2] = db.Leaderboard(day);
    std::cout << fmt::format("Day {}", day) << '\n';
    PrintLeaderboard("Part 1", part1);
    PrintLeaderboard("Part 2", part2);
  } catch (const std::system_error& err) {
    spdlog::error("Failed reading leaderboard from {}: {}", kDatabasePath.c_str(), err.what());
    return 1;
  }
  return 0;
}

int DoAddAnswer(const argparse::ArgumentParser& cmd) {
  Database db;
  try {
    db.AddAnswer(cmd.get<std::string>("--key"), cmd.get<int>("--day"), cmd.get<int>("--part"),
                 cmd.get<std::string>("--answer"));
  } catch (const std::system_error& err) {
    spdlog::error("Failed saving answer to {}: {}", kDatabasePath.c_str(), err.what());
    return 1;
  }
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();

  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "ferris-bench");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/ferris-bench.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of maximum parallel sandbox tasks");
  parser.add_argument("--pinned-cpus")
    .default_value(std::string(""))
    .help("Comma-separated list of CPUs to pin or simply \"all\"");

  argparse::ArgumentParser run_cmd("run");
  run_cmd.add_description("Build and benchmark a solution");
  run_cmd.add_argument("--user-id").required().scan<'d', int64_t>().help("Submitter id");
  run_cmd.add_argument("--user-name").default_value(std::string("")).help("Submitter display name");
  run_cmd.add_argument("--day").scan<'d', int>().help("Puzzle day (default: today)");
  run_cmd.add_argument("--part").required().scan<'d', int>().help("Puzzle part (1 or 2)");
  run_cmd.add_argument("source").help("Path of the solution source file");

  argparse::ArgumentParser leaderboard_cmd("leaderboard");
  leaderboard_cmd.add_description("Show best times per user");
  leaderboard_cmd.add_argument("--day").scan<'d', int>().help("Puzzle day (default: today)");

  argparse::ArgumentParser answer_cmd("add-answer");
  answer_cmd.add_description("Record the known answer of an input");
  answer_cmd.add_argument("--day").required().scan<'d', int>().help("Puzzle day");
  answer_cmd.add_argument("--part").required().scan<'d', int>().help("Puzzle part (1 or 2)");
  answer_cmd.add_argument("--key").required().help("Input key (see answer_key)");
  answer_cmd.add_argument("--answer").required().help("Expected answer");

  parser.add_subparser(run_cmd);
  parser.add_subparser(leaderboard_cmd);
  parser.add_subparser(answer_cmd);

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return 1;
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", config_file.c_str());
    return 1;
  }
  if (auto val = parser.present<int>("--parallel")) {
    kMaxParallel = val.value();
  }
  if (auto pinned_cpus = parser.get<std::string>("--pinned-cpus"); pinned_cpus.size()) {
    if (!SetPinnedCpus(pinned_cpus)) return 1;
  }

  if (parser.is_subcommand_used(run_cmd)) return DoRun(run_cmd);
  if (parser.is_subcommand_used(leaderboard_cmd)) return DoLeaderboard(leaderboard_cmd);
  if (parser.is_subcommand_used(answer_cmd)) return DoAddAnswer(answer_cmd);
  std::cerr << parser;
  return 1;
}
