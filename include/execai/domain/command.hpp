#pragma once

#include "execai/common/result.hpp"
#include "execai/common/time.hpp"
#include "execai/domain/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace execai::domain {

constexpr std::int64_t DEFAULT_COMMAND_TIMEOUT_SECS = 300;

struct CommandSpec {
  std::string original_request;
  std::string parsed_command;
  CommandType command_type = CommandType::System;
  std::optional<std::string> working_directory;
  std::map<std::string, std::string> environment;
  std::int64_t timeout_secs = DEFAULT_COMMAND_TIMEOUT_SECS;
  bool requires_confirmation = true;
  bool safe_mode = true;
  bool allowed_in_safe_mode = false;
  std::optional<std::string> schedule_id;
  std::optional<std::string> parent_command_id;
};

/// One shell invocation plus its lifecycle state.
///
/// PENDING -> RUNNING -> {COMPLETED, FAILED}; PENDING or RUNNING -> CANCELLED.
/// Terminal states are final; a retry is a new Command sharing the schedule id.
class Command {
public:
  [[nodiscard]] static common::Result<Command> create(CommandSpec spec);

  [[nodiscard]] const std::string &id() const { return id_; }
  [[nodiscard]] const std::string &original_request() const { return original_request_; }
  [[nodiscard]] const std::string &parsed_command() const { return parsed_command_; }
  [[nodiscard]] CommandType command_type() const { return command_type_; }
  [[nodiscard]] CommandStatus status() const { return status_; }
  [[nodiscard]] const std::optional<std::string> &working_directory() const {
    return working_directory_;
  }
  [[nodiscard]] const std::map<std::string, std::string> &environment() const {
    return environment_;
  }
  [[nodiscard]] std::int64_t timeout_secs() const { return timeout_secs_; }
  [[nodiscard]] bool requires_confirmation() const { return requires_confirmation_; }
  [[nodiscard]] bool safe_mode() const { return safe_mode_; }
  [[nodiscard]] bool allowed_in_safe_mode() const { return allowed_in_safe_mode_; }
  [[nodiscard]] const std::optional<std::string> &schedule_id() const { return schedule_id_; }
  [[nodiscard]] const std::optional<std::string> &parent_command_id() const {
    return parent_command_id_;
  }

  [[nodiscard]] common::Timestamp created_at() const { return created_at_; }
  [[nodiscard]] common::Timestamp updated_at() const { return updated_at_; }
  [[nodiscard]] const std::optional<common::Timestamp> &executed_at() const {
    return executed_at_;
  }
  [[nodiscard]] const std::optional<common::Timestamp> &completed_at() const {
    return completed_at_;
  }

  [[nodiscard]] const std::optional<int> &exit_code() const { return exit_code_; }
  [[nodiscard]] const std::string &stdout_text() const { return stdout_; }
  [[nodiscard]] const std::string &stderr_text() const { return stderr_; }
  [[nodiscard]] const std::optional<double> &execution_time() const { return execution_time_; }

  /// Recomputed from the command line; the advisory flags are not consulted.
  [[nodiscard]] bool is_safe_command() const;
  [[nodiscard]] bool can_execute() const;

  [[nodiscard]] common::Status start_execution();
  [[nodiscard]] common::Status complete_execution(int exit_code, std::string stdout_text,
                                                  std::string stderr_text,
                                                  double execution_time_secs);
  [[nodiscard]] common::Status cancel_execution();

  void set_safe_mode(bool enabled);

  /// Command(id=<id>, cmd='<parsed>', status=PENDING)
  [[nodiscard]] std::string describe() const;

private:
  Command() = default;
  void touch();

  std::string id_;
  std::string original_request_;
  std::string parsed_command_;
  CommandType command_type_ = CommandType::System;
  CommandStatus status_ = CommandStatus::Pending;
  std::optional<std::string> working_directory_;
  std::map<std::string, std::string> environment_;
  std::int64_t timeout_secs_ = DEFAULT_COMMAND_TIMEOUT_SECS;
  bool requires_confirmation_ = true;
  bool safe_mode_ = true;
  bool allowed_in_safe_mode_ = false;
  std::optional<std::string> schedule_id_;
  std::optional<std::string> parent_command_id_;

  common::Timestamp created_at_{};
  common::Timestamp updated_at_{};
  std::optional<common::Timestamp> executed_at_;
  std::optional<common::Timestamp> completed_at_;

  std::optional<int> exit_code_;
  std::string stdout_;
  std::string stderr_;
  std::optional<double> execution_time_;
};

} // namespace execai::domain
