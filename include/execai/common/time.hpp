#pragma once

#include "execai/common/result.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace execai::common {

/// All instants are UTC; naive wall-clock values never enter the core.
using Timestamp = std::chrono::system_clock::time_point;

[[nodiscard]] Timestamp utc_now();

/// "2026-10-19T08:30:00.000000+00:00"
[[nodiscard]] std::string format_iso8601(Timestamp instant);
[[nodiscard]] std::string format_iso8601(const std::optional<Timestamp> &instant,
                                         const std::string &fallback);

/// Accepts "Z" or "+HH:MM"/"-HH:MM" offsets; timestamps without an offset are rejected.
[[nodiscard]] Result<Timestamp> parse_iso8601(const std::string &text);

[[nodiscard]] double seconds_between(Timestamp start, Timestamp end);

} // namespace execai::common
