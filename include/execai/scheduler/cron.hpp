#pragma once

#include "execai/common/result.hpp"
#include "execai/common/time.hpp"

#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace execai::scheduler {

/// Five-field cron rule (minute hour day-of-month month day-of-week), evaluated in UTC.
class CronExpression {
public:
  [[nodiscard]] static common::Result<CronExpression> parse(std::string_view expression);

  /// First minute-aligned instant strictly after `after`; nullopt when nothing matches
  /// within the search horizon (e.g. "0 0 30 2 *").
  [[nodiscard]] std::optional<common::Timestamp> next_occurrence(common::Timestamp after) const;

  /// First minute-aligned instant at or after `at`.
  [[nodiscard]] std::optional<common::Timestamp> next_occurrence_from(common::Timestamp at) const;

  [[nodiscard]] bool matches(const std::tm &time) const;
  [[nodiscard]] const std::string &source() const { return source_; }

private:
  [[nodiscard]] static common::Result<std::vector<int>>
  parse_field(std::string_view field, int min, int max, const std::vector<std::string> &names);

  [[nodiscard]] bool matches_day(const std::tm &time) const;

  std::string source_;
  std::vector<int> minutes_;
  std::vector<int> hours_;
  std::vector<int> days_;
  std::vector<int> months_;
  std::vector<int> weekdays_;
  bool days_restricted_ = false;
  bool weekdays_restricted_ = false;
};

[[nodiscard]] bool is_valid_cron_expression(std::string_view expression);

} // namespace execai::scheduler
