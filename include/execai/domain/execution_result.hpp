#pragma once

#include "execai/common/time.hpp"

#include <map>
#include <optional>
#include <string>

namespace execai::domain {

class Command;

/// Outcome of one execution attempt. Retries produce new results.
struct ExecutionResult {
  std::string id;
  std::string command_id;
  std::optional<std::string> schedule_id;

  common::Timestamp started_at{};
  std::optional<common::Timestamp> completed_at;

  bool success = false;
  std::optional<int> exit_code;
  std::string stdout_text;
  std::string stderr_text;

  std::map<std::string, std::string> environment;
  std::optional<std::string> working_directory;

  /// Peak resident set of the child, in megabytes.
  std::optional<double> memory_usage_mb;
  /// User plus system CPU time as a percentage of wall time.
  std::optional<double> cpu_usage_percent;

  bool timed_out = false;
  bool cancelled = false;

  /// New attempt for `command`, stamped with the current instant.
  [[nodiscard]] static ExecutionResult begin(const Command &command);

  [[nodiscard]] std::optional<double> duration() const;
  [[nodiscard]] bool is_successful() const;
  [[nodiscard]] bool has_output() const { return !stdout_text.empty(); }
  [[nodiscard]] bool has_errors() const { return !stderr_text.empty(); }
  [[nodiscard]] std::string describe() const;
};

} // namespace execai::domain
