#include "execai/scheduler/cron.hpp"

#include "execai/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <set>
#include <sstream>

namespace execai::scheduler {

namespace {

constexpr int SEARCH_HORIZON_YEARS = 8;

const std::vector<std::string> MONTH_NAMES = {"jan", "feb", "mar", "apr", "may", "jun",
                                              "jul", "aug", "sep", "oct", "nov", "dec"};
const std::vector<std::string> WEEKDAY_NAMES = {"sun", "mon", "tue", "wed", "thu", "fri", "sat"};

bool contains_value(const std::vector<int> &values, const int value) {
  return std::binary_search(values.begin(), values.end(), value);
}

std::string normalize_expression(std::string expression) {
  expression = common::to_lower(common::trim(expression));
  if (expression == "@yearly" || expression == "@annually") {
    return "0 0 1 1 *";
  }
  if (expression == "@monthly") {
    return "0 0 1 * *";
  }
  if (expression == "@weekly") {
    return "0 0 * * 0";
  }
  if (expression == "@daily" || expression == "@midnight") {
    return "0 0 * * *";
  }
  if (expression == "@hourly") {
    return "0 * * * *";
  }
  return expression;
}

common::Result<int> parse_int(const std::string &value) {
  int parsed = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
    return common::Result<int>::failure(common::ErrorCode::Validation,
                                        "invalid integer: '" + value + "'");
  }
  return common::Result<int>::success(parsed);
}

// Numeric value, or a three-letter name mapped to its position (offset by `min`).
common::Result<int> parse_value(const std::string &token, const int min,
                                const std::vector<std::string> &names) {
  if (!token.empty() && std::isalpha(static_cast<unsigned char>(token.front())) != 0) {
    const auto it = std::find(names.begin(), names.end(), token);
    if (it == names.end()) {
      return common::Result<int>::failure(common::ErrorCode::Validation,
                                          "unknown name: '" + token + "'");
    }
    return common::Result<int>::success(min + static_cast<int>(it - names.begin()));
  }
  return parse_int(token);
}

std::tm to_utc_tm(const common::Timestamp instant) {
  const auto time = std::chrono::system_clock::to_time_t(instant);
  std::tm tm{};
  gmtime_r(&time, &tm);
  return tm;
}

common::Timestamp from_utc_tm(std::tm tm) {
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}

common::Timestamp floor_minute(const common::Timestamp instant) {
  return std::chrono::floor<std::chrono::minutes>(instant);
}

} // namespace

common::Result<CronExpression> CronExpression::parse(std::string_view expression_view) {
  const std::string normalized = normalize_expression(std::string(expression_view));

  std::istringstream stream(normalized);
  std::string minute_field;
  std::string hour_field;
  std::string day_field;
  std::string month_field;
  std::string weekday_field;
  std::string extra;
  if (!(stream >> minute_field >> hour_field >> day_field >> month_field >> weekday_field) ||
      (stream >> extra)) {
    return common::Result<CronExpression>::failure(common::ErrorCode::Validation,
                                                   "cron expression must have 5 fields");
  }

  auto minutes = parse_field(minute_field, 0, 59, {});
  if (!minutes.ok()) {
    return common::Result<CronExpression>::failure(minutes.code(), "minute: " + minutes.error());
  }
  auto hours = parse_field(hour_field, 0, 23, {});
  if (!hours.ok()) {
    return common::Result<CronExpression>::failure(hours.code(), "hour: " + hours.error());
  }
  auto days = parse_field(day_field, 1, 31, {});
  if (!days.ok()) {
    return common::Result<CronExpression>::failure(days.code(), "day-of-month: " + days.error());
  }
  auto months = parse_field(month_field, 1, 12, MONTH_NAMES);
  if (!months.ok()) {
    return common::Result<CronExpression>::failure(months.code(), "month: " + months.error());
  }
  auto weekdays = parse_field(weekday_field, 0, 7, WEEKDAY_NAMES);
  if (!weekdays.ok()) {
    return common::Result<CronExpression>::failure(weekdays.code(),
                                                   "day-of-week: " + weekdays.error());
  }

  // 7 is an alias for Sunday.
  std::set<int> weekday_set(weekdays.value().begin(), weekdays.value().end());
  if (weekday_set.erase(7) > 0) {
    weekday_set.insert(0);
  }

  CronExpression expression;
  expression.source_ = common::trim(std::string(expression_view));
  expression.minutes_ = std::move(minutes.value());
  expression.hours_ = std::move(hours.value());
  expression.days_ = std::move(days.value());
  expression.months_ = std::move(months.value());
  expression.weekdays_ = std::vector<int>(weekday_set.begin(), weekday_set.end());
  expression.days_restricted_ = day_field.front() != '*';
  expression.weekdays_restricted_ = weekday_field.front() != '*';
  return common::Result<CronExpression>::success(std::move(expression));
}

common::Result<std::vector<int>>
CronExpression::parse_field(std::string_view field_view, const int min, const int max,
                            const std::vector<std::string> &names) {
  using FieldResult = common::Result<std::vector<int>>;
  const std::string field = common::trim(std::string(field_view));
  if (field.empty()) {
    return FieldResult::failure(common::ErrorCode::Validation, "empty cron field");
  }

  std::set<int> values;

  auto add_range = [&](int start, int end, int step) -> common::Status {
    if (step <= 0) {
      return common::Status::error(common::ErrorCode::Validation, "step must be positive");
    }
    if (start > end || start < min || end > max) {
      return common::Status::error(common::ErrorCode::Validation, "field range out of bounds");
    }
    for (int value = start;; value += step) {
      values.insert(value);
      if (end - value < step) {
        break;
      }
    }
    return common::Status::success();
  };

  std::stringstream parts(field);
  std::string segment;
  while (std::getline(parts, segment, ',')) {
    segment = common::trim(segment);
    if (segment.empty()) {
      return FieldResult::failure(common::ErrorCode::Validation, "empty list element");
    }

    int step = 1;
    std::string base = segment;
    const auto slash = segment.find('/');
    if (slash != std::string::npos) {
      base = common::trim(segment.substr(0, slash));
      auto parsed_step = parse_int(common::trim(segment.substr(slash + 1)));
      if (!parsed_step.ok()) {
        return FieldResult::failure(parsed_step.code(), parsed_step.error());
      }
      step = parsed_step.value();
    }

    int range_start = min;
    int range_end = max;
    if (base == "*") {
      // full range
    } else if (const auto dash = base.find('-'); dash != std::string::npos) {
      auto left = parse_value(common::trim(base.substr(0, dash)), min, names);
      auto right = parse_value(common::trim(base.substr(dash + 1)), min, names);
      if (!left.ok() || !right.ok()) {
        return FieldResult::failure(common::ErrorCode::Validation,
                                    "invalid range: '" + base + "'");
      }
      range_start = left.value();
      range_end = right.value();
    } else {
      auto value = parse_value(base, min, names);
      if (!value.ok()) {
        return FieldResult::failure(value.code(), value.error());
      }
      range_start = value.value();
      // "a/n" runs from a to the end of the field.
      range_end = slash != std::string::npos ? max : value.value();
    }

    auto status = add_range(range_start, range_end, step);
    if (!status.ok()) {
      return FieldResult::failure(status.code(), status.error() + ": '" + segment + "'");
    }
  }

  if (values.empty()) {
    return FieldResult::failure(common::ErrorCode::Validation, "no values in field");
  }

  return FieldResult::success(std::vector<int>(values.begin(), values.end()));
}

bool CronExpression::matches_day(const std::tm &time) const {
  const bool day_match = contains_value(days_, time.tm_mday);
  const bool weekday_match = contains_value(weekdays_, time.tm_wday);
  if (days_restricted_ && weekdays_restricted_) {
    return day_match || weekday_match;
  }
  return day_match && weekday_match;
}

bool CronExpression::matches(const std::tm &time) const {
  return contains_value(minutes_, time.tm_min) && contains_value(hours_, time.tm_hour) &&
         contains_value(months_, time.tm_mon + 1) && matches_day(time);
}

std::optional<common::Timestamp> CronExpression::next_occurrence(common::Timestamp after) const {
  return next_occurrence_from(floor_minute(after) + std::chrono::minutes(1));
}

std::optional<common::Timestamp> CronExpression::next_occurrence_from(common::Timestamp at) const {
  auto candidate = floor_minute(at);
  if (candidate < at) {
    candidate += std::chrono::minutes(1);
  }

  const auto limit = candidate + std::chrono::hours(24 * 366 * SEARCH_HORIZON_YEARS);
  while (candidate < limit) {
    std::tm tm = to_utc_tm(candidate);

    // Skip whole months, days and hours that cannot match.
    if (!contains_value(months_, tm.tm_mon + 1)) {
      tm.tm_mon += 1;
      tm.tm_mday = 1;
      tm.tm_hour = 0;
      tm.tm_min = 0;
      tm.tm_sec = 0;
      candidate = from_utc_tm(tm);
      continue;
    }
    if (!matches_day(tm)) {
      tm.tm_mday += 1;
      tm.tm_hour = 0;
      tm.tm_min = 0;
      tm.tm_sec = 0;
      candidate = from_utc_tm(tm);
      continue;
    }
    if (!contains_value(hours_, tm.tm_hour)) {
      tm.tm_hour += 1;
      tm.tm_min = 0;
      tm.tm_sec = 0;
      candidate = from_utc_tm(tm);
      continue;
    }
    if (!contains_value(minutes_, tm.tm_min)) {
      candidate += std::chrono::minutes(1);
      continue;
    }
    return candidate;
  }

  return std::nullopt;
}

bool is_valid_cron_expression(std::string_view expression) {
  return CronExpression::parse(expression).ok();
}

} // namespace execai::scheduler
