#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace execai::security {

/// Lower-case fragments that mark a command line as destructive or administrative.
[[nodiscard]] const std::vector<std::string_view> &dangerous_command_patterns();

/// First deny-list entry contained in the lower-cased command line, if any.
[[nodiscard]] std::optional<std::string> find_dangerous_pattern(const std::string &command);

/// Case-insensitive substring match against the deny-list, so multi-word phrases are caught too.
[[nodiscard]] bool is_safe_command(const std::string &command);

/// Program name of the first token, path stripped and lower-cased.
[[nodiscard]] std::string base_command(const std::string &command);

[[nodiscard]] bool is_command_allowlisted(const std::string &command,
                                          const std::vector<std::string> &allowed_commands);

} // namespace execai::security
