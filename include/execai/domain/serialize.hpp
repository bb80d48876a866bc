#pragma once

#include "execai/domain/command.hpp"
#include "execai/domain/execution_result.hpp"
#include "execai/domain/schedule.hpp"

#include <string>

namespace execai::domain {

// Flat JSON objects: ISO-8601 UTC timestamps, UUID strings, lower-case enum tags and
// `null` for anything unset.
[[nodiscard]] std::string to_json(const Command &command);
[[nodiscard]] std::string to_json(const ExecutionResult &result);
[[nodiscard]] std::string to_json(const CommandTemplate &command_template);
[[nodiscard]] std::string to_json(const Schedule &schedule);

} // namespace execai::domain
