#include <unistd.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <memory>
#include <optional>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <argparse/argparse.hpp>
#include <codebox/paths.h>
#include <codebox/filter.h>
#include <codebox/execution.h>

namespace {

constexpr char kDefaultConfig[] = "/etc/codebox.conf";

ExecutionLimits limits;
size_t max_queue = 0;
fs::path deny_rules_path;
bool pretty = false;
std::vector<std::string> sources;

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string box_root = ini[""]["box_root"] | "";
  std::string interpreter = ini[""]["interpreter"] | "";
  std::string deny_rules = ini[""]["deny_rules"] | "";
  if (box_root.size()) kBoxRoot = box_root;
  if (interpreter.size()) kInterpreter = interpreter;
  if (deny_rules.size()) deny_rules_path = deny_rules;
  kMaxParallel = ini[""]["parallel"] | kMaxParallel;
  limits.wall_time = (ini[""]["timeout_seconds"] | (limits.wall_time / 1e6)) * 1'000'000;
  limits.memory = (ini[""]["memory_limit_mb"] | (limits.memory / 1024)) * 1024;
  limits.output = (ini[""]["max_output_mb"] | (limits.output / 1024)) * 1024;
  kMaxCollectedFileSize = (ini[""]["max_file_kb"] | (kMaxCollectedFileSize / 1024)) * 1024;
  max_queue = ini[""]["max_queue"] | max_queue;
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "codebox");
  parser.add_argument("files")
    .remaining()
    .help("Python sources to execute; - for standard input");
  parser.add_argument("-c", "--config")
    .default_value(std::string(kDefaultConfig))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of maximum parallel executions");
  parser.add_argument("-t", "--timeout")
    .scan<'g', double>()
    .help("Wall-clock limit in seconds");
  parser.add_argument("-m", "--memory")
    .scan<'d', long>()
    .help("Memory limit in MB");
  parser.add_argument("--deny-rules")
    .help("JSON file of deny rules replacing the built-in ones");
  parser.add_argument("--interpreter")
    .help("Program used to run the scripts");
  parser.add_argument("--pretty")
    .default_value(false)
    .implicit_value(true)
    .help("Indent JSON output");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(2);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    // the default file is optional; an explicitly given one is not
    if (config_file != kDefaultConfig) {
      spdlog::error("Failed to parse configuration file {}", std::string(config_file));
      exit(2);
    }
    spdlog::info("No configuration file at {}, using defaults", std::string(config_file));
  }
  if (auto val = parser.present<int>("--parallel")) {
    kMaxParallel = val.value();
  }
  if (auto val = parser.present<double>("--timeout")) {
    limits.wall_time = val.value() * 1'000'000;
  }
  if (auto val = parser.present<long>("--memory")) {
    limits.memory = val.value() * 1024;
  }
  if (auto val = parser.present("--deny-rules")) {
    deny_rules_path = val.value();
  }
  if (auto val = parser.present("--interpreter")) {
    kInterpreter = val.value();
  }
  pretty = parser.get<bool>("--pretty");
  if (auto files = parser.present<std::vector<std::string>>("files")) {
    sources = std::move(files.value());
  }
  if (sources.empty()) {
    std::cerr << "No source given" << std::endl;
    std::cerr << parser;
    exit(2);
  }
}

std::optional<std::string> ReadSource(const std::string& name) {
  if (name == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }
  std::ifstream fin(name, std::ios::binary);
  if (!fin) return std::nullopt;
  return std::string(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
}

std::shared_ptr<const DenyRuleSet> BuildDenyRules() {
  std::vector<DenyRule> rules;
  if (deny_rules_path.empty()) {
    rules = DefaultDenyRules();
  } else if (auto loaded = LoadDenyRules(deny_rules_path)) {
    rules = std::move(loaded.value());
  } else {
    return nullptr;
  }
  return std::make_shared<const DenyRuleSet>(rules);
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  ParseArgs(argc, argv);
  if (geteuid() != 0) {
    spdlog::error("Must be run as root.");
    return 2;
  }
  auto rules = BuildDenyRules();
  if (!rules) {
    spdlog::error("Failed to load deny rules from {}", deny_rules_path.c_str());
    return 2;
  }
  Executor executor(rules, limits);

  std::vector<std::optional<nlohmann::json>> results(sources.size());
  std::mutex results_mtx;
  for (size_t i = 0; i < sources.size(); i++) {
    auto code = ReadSource(sources[i]);
    if (!code) {
      spdlog::error("Cannot read source {}", sources[i]);
      return 2;
    }
    if (code->empty()) {
      spdlog::error("Source {} is empty", sources[i]);
      return 2;
    }
    ExecutionRequest req(std::move(*code));
    req.report_result = [&results, &results_mtx, i](const ExecutionRequest&, const ExecutionResult& res) {
      std::lock_guard lck(results_mtx);
      results[i] = ResultToJson(res);
    };
    if (!PushRequest(std::move(req), max_queue)) {
      spdlog::error("Request queue is full ({} entries)", max_queue);
      return 2;
    }
  }
  WorkLoop(executor, false);

  bool all_success = true;
  for (auto& res : results) {
    if (!res) {
      all_success = false;
      continue;
    }
    all_success &= res->at("success").get<bool>();
    std::cout << res->dump(pretty ? 2 : -1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  }
  return all_success ? 0 : 1;
}
