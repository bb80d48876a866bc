#pragma once

#include "execai/common/result.hpp"
#include "execai/domain/command.hpp"
#include "execai/domain/schedule.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace execai::scheduler {

/// Turns a schedule's command template into fresh commands for one firing.
using CommandMaterializer =
    std::function<common::Result<std::vector<domain::Command>>(const domain::Schedule &)>;

struct MaterializerOptions {
  std::int64_t default_timeout_secs = domain::DEFAULT_COMMAND_TIMEOUT_SECS;
  bool safe_mode = true;
  std::vector<std::string> allowed_commands;
};

[[nodiscard]] common::Result<std::vector<domain::Command>>
materialize_commands(const domain::Schedule &schedule, const MaterializerOptions &options);

[[nodiscard]] CommandMaterializer make_default_materializer(MaterializerOptions options = {});

} // namespace execai::scheduler
