#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace execai::config {

struct ExecutorConfig {
  std::int64_t default_timeout_secs = 300;
  std::uint64_t max_output_bytes = 0;
  std::string shell = "/bin/sh";
};

struct SafetyConfig {
  bool safe_mode = true;
  bool confirmation_required = true;
  std::vector<std::string> allowed_commands = {"ls", "pwd", "echo", "date", "whoami", "uname"};
};

struct SchedulerConfig {
  bool enabled = true;
  std::uint64_t poll_interval_ms = 1000;
  std::uint64_t error_backoff_ms = 5000;
  std::int64_t default_max_retries = 3;
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string level = "info";
};

struct Config {
  ExecutorConfig executor;
  SafetyConfig safety;
  SchedulerConfig scheduler;
  ObservabilityConfig observability;
};

} // namespace execai::config
