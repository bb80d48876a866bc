#include "execai/cli/commands.hpp"

#include "execai/common/fs.hpp"
#include "execai/common/time.hpp"
#include "execai/config/config.hpp"
#include "execai/domain/serialize.hpp"
#include "execai/runtime/runtime.hpp"
#include "execai/scheduler/cron.hpp"
#include "execai/security/policy.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace execai::cli {

namespace {

std::atomic<bool> g_interrupted{false};

void handle_interrupt(int) { g_interrupted.store(true); }

std::string version_string() {
#ifdef EXECAI_VERSION
  std::string version = EXECAI_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "execai " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--") {
      return false;
    }
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--") {
      return false;
    }
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--") {
      break;
    }
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  bool first = true;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (first && args[i] == "--") {
      continue;
    }
    if (!first) {
      out << ' ';
    }
    out << args[i];
    first = false;
  }
  return out.str();
}

bool parse_int64(const std::string &raw, std::int64_t &out) {
  const std::string value = common::trim(raw);
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
  return !value.empty() && ec == std::errc() && ptr == value.data() + value.size();
}

common::Result<std::unique_ptr<runtime::Runtime>> open_runtime() {
  auto runtime = runtime::Runtime::from_disk();
  if (runtime.ok()) {
    runtime.value()->install_observer();
  }
  return runtime;
}

void print_execution(const domain::ExecutionResult &result) {
  if (!result.stdout_text.empty()) {
    std::cout << result.stdout_text;
    if (result.stdout_text.back() != '\n') {
      std::cout << "\n";
    }
  }
  if (!result.stderr_text.empty()) {
    std::cerr << result.stderr_text;
    if (result.stderr_text.back() != '\n') {
      std::cerr << "\n";
    }
  }
}

int run_run(std::vector<std::string> args) {
  std::string timeout_raw;
  std::string cwd;
  const bool unsafe = take_flag(args, "--unsafe");
  const bool json = take_flag(args, "--json");
  const bool has_timeout = take_option(args, "--timeout", "-t", timeout_raw);
  const bool has_cwd = take_option(args, "--cwd", "-C", cwd);

  std::map<std::string, std::string> environment;
  std::string assignment;
  while (take_option(args, "--env", "-e", assignment)) {
    const auto eq = assignment.find('=');
    if (eq == std::string::npos || eq == 0) {
      std::cerr << "invalid --env value (expected KEY=VALUE): " << assignment << "\n";
      return 1;
    }
    environment[assignment.substr(0, eq)] = assignment.substr(eq + 1);
  }

  const std::string command_line = join_tokens(args);
  if (common::trim(command_line).empty()) {
    std::cerr << "usage: execai run [--timeout N] [--cwd DIR] [--env K=V]... [--unsafe] [--json] "
                 "<command...>\n";
    return 1;
  }

  auto runtime = open_runtime();
  if (!runtime.ok()) {
    std::cerr << runtime.error() << "\n";
    return 1;
  }
  auto &rt = *runtime.value();

  domain::CommandSpec spec = rt.command_spec(command_line);
  if (has_timeout && !parse_int64(timeout_raw, spec.timeout_secs)) {
    std::cerr << "invalid timeout: " << timeout_raw << "\n";
    return 1;
  }
  if (has_cwd) {
    spec.working_directory = common::expand_path(cwd);
  }
  spec.environment = std::move(environment);
  if (unsafe) {
    spec.safe_mode = false;
  }

  auto command = domain::Command::create(std::move(spec));
  if (!command.ok()) {
    std::cerr << command.error() << "\n";
    return 1;
  }

  auto result = rt.executor().execute(command.value());
  if (!result.ok()) {
    std::cerr << result.error() << "\n";
    return 2;
  }

  if (json) {
    std::cout << domain::to_json(result.value()) << "\n";
  } else {
    print_execution(result.value());
  }

  const auto &outcome = result.value();
  if (outcome.timed_out) {
    return 124;
  }
  if (!outcome.exit_code.has_value()) {
    return 1;
  }
  return *outcome.exit_code < 0 ? 1 : *outcome.exit_code;
}

int run_schedule(std::vector<std::string> args) {
  std::string cron_raw;
  std::string at_raw;
  std::string end_raw;
  std::string name;
  std::string max_exec_raw;
  std::string max_retries_raw;
  std::string duration_raw;
  const bool json = take_flag(args, "--json");
  const bool has_cron = take_option(args, "--cron", "", cron_raw);
  const bool has_at = take_option(args, "--at", "", at_raw);
  const bool has_end = take_option(args, "--end", "", end_raw);
  (void)take_option(args, "--name", "-n", name);
  const bool has_max_exec = take_option(args, "--max-executions", "", max_exec_raw);
  const bool has_max_retries = take_option(args, "--max-retries", "", max_retries_raw);
  const bool has_duration = take_option(args, "--duration-secs", "", duration_raw);

  const std::string command_line = join_tokens(args);
  if (has_cron == has_at || common::trim(command_line).empty()) {
    std::cerr << "usage: execai schedule (--cron EXPR | --at ISO8601) [--name NAME] "
                 "[--max-executions N] [--max-retries N] [--end ISO8601] [--duration-secs N] "
                 "[--json] <command...>\n";
    return 1;
  }

  auto runtime = open_runtime();
  if (!runtime.ok()) {
    std::cerr << runtime.error() << "\n";
    return 1;
  }
  auto &rt = *runtime.value();

  domain::ScheduleSpec spec;
  spec.name = name.empty() ? command_line : name;
  spec.max_retries = rt.config().scheduler.default_max_retries;
  spec.command_template.original_request = command_line;
  spec.command_template.parsed_commands = {command_line};

  if (has_cron) {
    spec.schedule_type = domain::ScheduleType::Cron;
    spec.cron_expression = cron_raw;
  } else {
    auto at = common::parse_iso8601(at_raw);
    if (!at.ok()) {
      std::cerr << at.error() << "\n";
      return 1;
    }
    spec.schedule_type = domain::ScheduleType::Once;
    spec.start_time = at.value();
  }
  if (has_end) {
    auto end = common::parse_iso8601(end_raw);
    if (!end.ok()) {
      std::cerr << end.error() << "\n";
      return 1;
    }
    spec.end_time = end.value();
  }
  if (has_max_exec) {
    std::int64_t value = 0;
    if (!parse_int64(max_exec_raw, value)) {
      std::cerr << "invalid --max-executions: " << max_exec_raw << "\n";
      return 1;
    }
    spec.max_executions = value;
  }
  if (has_max_retries && !parse_int64(max_retries_raw, spec.max_retries)) {
    std::cerr << "invalid --max-retries: " << max_retries_raw << "\n";
    return 1;
  }
  std::int64_t duration_secs = 0;
  if (has_duration && (!parse_int64(duration_raw, duration_secs) || duration_secs <= 0)) {
    std::cerr << "invalid --duration-secs: " << duration_raw << "\n";
    return 1;
  }

  auto schedule = domain::Schedule::create(std::move(spec));
  if (!schedule.ok()) {
    std::cerr << schedule.error() << "\n";
    return 1;
  }
  const std::string schedule_id = schedule.value().id();
  std::cout << schedule.value().describe() << "\n";

  std::atomic<std::size_t> runs{0};
  std::atomic<std::size_t> failures{0};
  rt.scheduler().set_result_callback(
      [json, &runs, &failures](const domain::Schedule &, const domain::ExecutionResult &result) {
        runs.fetch_add(1);
        if (!result.is_successful()) {
          failures.fetch_add(1);
        }
        if (json) {
          std::cout << domain::to_json(result) << "\n";
        } else {
          print_execution(result);
        }
        std::cout.flush();
      });

  if (auto added = rt.scheduler().add_schedule(std::move(schedule.value())); !added.ok()) {
    std::cerr << added.error() << "\n";
    return 1;
  }

  if (!rt.start()) {
    std::cerr << "scheduler is disabled in configuration\n";
    return 1;
  }

  g_interrupted.store(false);
  auto previous = std::signal(SIGINT, handle_interrupt);
  const auto started = std::chrono::steady_clock::now();
  // Stays true only while the schedule is still registered when the loop ends.
  bool still_active = false;
  while (!g_interrupted.load()) {
    still_active = rt.scheduler().get_schedule(schedule_id).has_value();
    if (!still_active) {
      break;
    }
    if (has_duration &&
        std::chrono::steady_clock::now() - started >= std::chrono::seconds(duration_secs)) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  std::signal(SIGINT, previous);

  rt.shutdown();
  std::cout << "Schedule " << schedule_id << (still_active ? " stopped after " : " finished after ")
            << runs.load() << " command run(s)\n";
  return failures.load() == 0 ? 0 : 1;
}

int run_cron(std::vector<std::string> args) {
  if (args.empty() || args[0] != "next") {
    std::cerr << "usage: execai cron next <expression> [--count N]\n";
    return 1;
  }
  args.erase(args.begin());

  std::string count_raw;
  std::int64_t count = 5;
  if (take_option(args, "--count", "-c", count_raw) &&
      (!parse_int64(count_raw, count) || count <= 0)) {
    std::cerr << "invalid --count: " << count_raw << "\n";
    return 1;
  }
  if (args.empty()) {
    std::cerr << "usage: execai cron next <expression> [--count N]\n";
    return 1;
  }

  auto expression = scheduler::CronExpression::parse(join_tokens(args));
  if (!expression.ok()) {
    std::cerr << expression.error() << "\n";
    return 1;
  }

  auto cursor = common::utc_now();
  for (std::int64_t i = 0; i < count; ++i) {
    auto next = expression.value().next_occurrence(cursor);
    if (!next.has_value()) {
      std::cout << "(no further occurrences)\n";
      break;
    }
    std::cout << common::format_iso8601(*next) << "\n";
    cursor = *next;
  }
  return 0;
}

int run_check(std::vector<std::string> args) {
  const std::string command_line = join_tokens(args);
  if (common::trim(command_line).empty()) {
    std::cerr << "usage: execai check <command...>\n";
    return 1;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  const auto pattern = security::find_dangerous_pattern(command_line);
  if (pattern.has_value()) {
    std::cout << "dangerous (matches '" << *pattern << "')\n";
  } else {
    std::cout << "safe\n";
  }
  std::cout << "allowlisted: "
            << (security::is_command_allowlisted(command_line, cfg.value().safety.allowed_commands)
                    ? "yes"
                    : "no")
            << "\n";
  std::cout << "safe mode: " << (cfg.value().safety.safe_mode ? "on" : "off") << "\n";
  return pattern.has_value() ? 3 : 0;
}

int run_config(std::vector<std::string> args) {
  const std::string action = args.empty() ? "show" : args[0];

  if (action == "path") {
    auto path = config::config_path();
    if (!path.ok()) {
      std::cerr << path.error() << "\n";
      return 1;
    }
    std::cout << path.value().string() << "\n";
    return 0;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  if (action == "show") {
    std::cout << config::render_config(cfg.value());
    return 0;
  }
  if (action == "validate") {
    auto validated = config::validate_config(cfg.value());
    if (!validated.ok()) {
      std::cerr << "invalid: " << validated.error() << "\n";
      return 1;
    }
    for (const auto &warning : validated.value()) {
      std::cout << "warning: " << warning << "\n";
    }
    std::cout << "ok\n";
    return 0;
  }

  std::cerr << "unknown config subcommand: " << action << "\n";
  return 1;
}

} // namespace

void print_help() {
  std::cout << version_string() << " - run and schedule shell commands\n\n";
  std::cout << "USAGE\n";
  std::cout << "  execai [--config PATH] <command> [options]\n\n";
  std::cout << "COMMANDS\n";
  std::cout << "  run [--timeout N] [--cwd DIR] [--env K=V]... [--unsafe] [--json] <command...>\n";
  std::cout << "                 Execute a command once\n";
  std::cout << "  schedule (--cron EXPR | --at ISO8601) [--name NAME] [--max-executions N]\n";
  std::cout << "           [--max-retries N] [--end ISO8601] [--duration-secs N] [--json] "
               "<command...>\n";
  std::cout << "                 Run the scheduler in the foreground for one schedule\n";
  std::cout << "  cron next <EXPR> [--count N]\n";
  std::cout << "                 Print upcoming trigger times (UTC)\n";
  std::cout << "  check <command...>\n";
  std::cout << "                 Show the safety classification of a command\n";
  std::cout << "  config show|path|validate\n";
  std::cout << "  version\n";
  std::cout << "  help\n";
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "run") {
    return run_run(std::move(args));
  }
  if (subcommand == "schedule") {
    return run_schedule(std::move(args));
  }
  if (subcommand == "cron") {
    return run_cron(std::move(args));
  }
  if (subcommand == "check") {
    return run_check(std::move(args));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace execai::cli
