#include "execai/config/config.hpp"

#include "execai/common/fs.hpp"
#include "execai/common/toml.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace execai::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".execai";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr std::int64_t MAX_TIMEOUT_SECS = 7 * 24 * 3600;

std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("EXECAI_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string strip_env_quotes(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](const char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
  });
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }
    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (!is_valid_env_name(key)) {
      continue;
    }
    // Variables already present in the process environment win.
    setenv(key.c_str(), strip_env_quotes(trimmed.substr(eq + 1)).c_str(), 0);
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("EXECAI_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }
  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

std::optional<bool> parse_bool_env(const char *raw) {
  const std::string value = common::to_lower(common::trim(raw));
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off") {
    return false;
  }
  return std::nullopt;
}

std::optional<std::int64_t> parse_int_env(const char *raw) {
  const std::string value = common::trim(raw);
  std::int64_t parsed = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc() || ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return parsed;
}

bool is_known_level(const std::string &level) {
  const std::string normalized = common::to_lower(common::trim(level));
  return normalized == "debug" || normalized == "info" || normalized == "warn" ||
         normalized == "warning" || normalized == "error";
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::ensure_dir(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            common::ErrorCode::Io, "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.code(), home.error());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.code(), parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.executor.default_timeout_secs =
      doc.get_int("executor.default_timeout_secs", config.executor.default_timeout_secs);
  const auto max_output = doc.get_int("executor.max_output_bytes", 0);
  config.executor.max_output_bytes = max_output > 0 ? static_cast<std::uint64_t>(max_output) : 0;
  config.executor.shell =
      common::expand_path(doc.get_string("executor.shell", config.executor.shell));

  config.safety.safe_mode = doc.get_bool("safety.safe_mode", config.safety.safe_mode);
  config.safety.confirmation_required =
      doc.get_bool("safety.confirmation_required", config.safety.confirmation_required);
  config.safety.allowed_commands =
      doc.get_string_array("safety.allowed_commands", config.safety.allowed_commands);

  config.scheduler.enabled = doc.get_bool("scheduler.enabled", config.scheduler.enabled);
  const auto poll = doc.get_int("scheduler.poll_interval_ms",
                                static_cast<std::int64_t>(config.scheduler.poll_interval_ms));
  config.scheduler.poll_interval_ms = poll > 0 ? static_cast<std::uint64_t>(poll) : 0;
  const auto backoff = doc.get_int("scheduler.error_backoff_ms",
                                   static_cast<std::int64_t>(config.scheduler.error_backoff_ms));
  config.scheduler.error_backoff_ms = backoff > 0 ? static_cast<std::uint64_t>(backoff) : 0;
  config.scheduler.default_max_retries =
      doc.get_int("scheduler.default_max_retries", config.scheduler.default_max_retries);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.level = doc.get_string("observability.level", config.observability.level);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto path_result = config_path();
  if (!path_result.ok()) {
    return common::Result<Config>::failure(path_result.code(), path_result.error());
  }

  const auto &path = path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure(common::ErrorCode::Io,
                                           "Unable to open config file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.code(),
                                           path.string() + ": " + parsed.error());
  }
  apply_env_overrides(parsed.value());
  return parsed;
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  out << "[executor]\n";
  out << "default_timeout_secs = " << config.executor.default_timeout_secs << "\n";
  out << "max_output_bytes = " << config.executor.max_output_bytes << "\n";
  out << "shell = " << common::quote_toml_string(config.executor.shell) << "\n\n";

  out << "[safety]\n";
  out << "safe_mode = " << (config.safety.safe_mode ? "true" : "false") << "\n";
  out << "confirmation_required = " << (config.safety.confirmation_required ? "true" : "false")
      << "\n";
  out << "allowed_commands = " << common::toml_string_array(config.safety.allowed_commands)
      << "\n\n";

  out << "[scheduler]\n";
  out << "enabled = " << (config.scheduler.enabled ? "true" : "false") << "\n";
  out << "poll_interval_ms = " << config.scheduler.poll_interval_ms << "\n";
  out << "error_backoff_ms = " << config.scheduler.error_backoff_ms << "\n";
  out << "default_max_retries = " << config.scheduler.default_max_retries << "\n\n";

  out << "[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  out << "level = " << common::quote_toml_string(config.observability.level) << "\n";
  return out.str();
}

common::Status save_config(const Config &config) {
  const auto path_result = config_path();
  if (!path_result.ok()) {
    return path_result.status();
  }
  const auto &path = path_result.value();
  if (const auto dir = common::ensure_dir(path.parent_path()); !dir.ok()) {
    return dir.status();
  }

  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    return common::Status::error(common::ErrorCode::Io,
                                 "Unable to write config file: " + path.string());
  }
  out << render_config(config);
  if (!out) {
    return common::Status::error(common::ErrorCode::Io,
                                 "Failed writing config file: " + path.string());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using ValidationResult = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.executor.default_timeout_secs <= 0) {
    return ValidationResult::failure(common::ErrorCode::Validation,
                                     "executor.default_timeout_secs must be positive");
  }
  if (config.executor.default_timeout_secs > MAX_TIMEOUT_SECS) {
    warnings.push_back("executor.default_timeout_secs exceeds one week");
  }
  if (common::trim(config.executor.shell).empty()) {
    return ValidationResult::failure(common::ErrorCode::Validation,
                                     "executor.shell must not be empty");
  }
  std::error_code ec;
  if (!std::filesystem::exists(config.executor.shell, ec)) {
    warnings.push_back("executor.shell does not exist: " + config.executor.shell);
  }

  if (config.scheduler.poll_interval_ms == 0) {
    return ValidationResult::failure(common::ErrorCode::Validation,
                                     "scheduler.poll_interval_ms must be positive");
  }
  if (config.scheduler.error_backoff_ms < config.scheduler.poll_interval_ms) {
    warnings.push_back("scheduler.error_backoff_ms is shorter than the poll interval");
  }
  if (config.scheduler.default_max_retries < 0) {
    return ValidationResult::failure(common::ErrorCode::Validation,
                                     "scheduler.default_max_retries must be non-negative");
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend != "log" && backend != "none" && backend != "noop") {
    return ValidationResult::failure(common::ErrorCode::Validation,
                                     "Invalid observability.backend: " +
                                         config.observability.backend);
  }
  if (!is_known_level(config.observability.level)) {
    return ValidationResult::failure(common::ErrorCode::Validation,
                                     "Invalid observability.level: " + config.observability.level);
  }

  if (!config.safety.safe_mode) {
    warnings.push_back("safety.safe_mode is disabled; dangerous commands will run");
  }

  return ValidationResult::success(std::move(warnings));
}

void apply_env_overrides(Config &config) {
  if (const char *raw = std::getenv("EXECAI_SAFE_MODE"); raw != nullptr && *raw != '\0') {
    if (const auto value = parse_bool_env(raw); value.has_value()) {
      config.safety.safe_mode = *value;
    }
  }
  if (const char *raw = std::getenv("EXECAI_SCHEDULER_ENABLED"); raw != nullptr && *raw != '\0') {
    if (const auto value = parse_bool_env(raw); value.has_value()) {
      config.scheduler.enabled = *value;
    }
  }
  if (const char *raw = std::getenv("EXECAI_DEFAULT_TIMEOUT"); raw != nullptr && *raw != '\0') {
    if (const auto value = parse_int_env(raw); value.has_value()) {
      config.executor.default_timeout_secs = *value;
    }
  }
  if (const char *raw = std::getenv("EXECAI_LOG_LEVEL"); raw != nullptr && *raw != '\0') {
    config.observability.level = common::to_lower(common::trim(raw));
  }
}

} // namespace execai::config
