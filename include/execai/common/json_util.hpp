#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace execai::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Quoted JSON string literal.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Quoted literal, or `null` when unset.
[[nodiscard]] std::string json_optional(const std::optional<std::string> &value);

[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

/// Object with string values; keys are emitted in sorted order.
[[nodiscard]] std::string json_string_map(const std::map<std::string, std::string> &values);

} // namespace execai::common
