#include "execai/common/time.hpp"

#include "execai/common/fs.hpp"

#include <cstdio>
#include <ctime>
#include <regex>

namespace execai::common {

namespace {

int digits_to_int(const std::string &digits) {
  int value = 0;
  for (const char ch : digits) {
    value = value * 10 + (ch - '0');
  }
  return value;
}

} // namespace

Timestamp utc_now() { return std::chrono::system_clock::now(); }

std::string format_iso8601(const Timestamp instant) {
  const auto seconds = std::chrono::floor<std::chrono::seconds>(instant);
  const auto micros =
      std::chrono::duration_cast<std::chrono::microseconds>(instant - seconds).count();
  const std::time_t raw = std::chrono::system_clock::to_time_t(seconds);
  std::tm tm{};
  gmtime_r(&raw, &tm);

  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld+00:00",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                static_cast<long long>(micros));
  return buffer;
}

std::string format_iso8601(const std::optional<Timestamp> &instant, const std::string &fallback) {
  return instant.has_value() ? format_iso8601(*instant) : fallback;
}

Result<Timestamp> parse_iso8601(const std::string &text) {
  static const std::regex pattern(
      R"(^(\d{4})-(\d{2})-(\d{2})[Tt ](\d{2}):(\d{2})(?::(\d{2})(?:\.(\d{1,9}))?)?\s*(Z|z|[+-]\d{2}:?\d{2})?$)");

  const std::string value = trim(text);
  std::smatch match;
  if (!std::regex_match(value, match, pattern)) {
    return Result<Timestamp>::failure(ErrorCode::Validation, "invalid ISO-8601 timestamp: " + text);
  }
  if (!match[8].matched) {
    return Result<Timestamp>::failure(ErrorCode::Validation,
                                      "timestamp must carry a UTC offset: " + text);
  }

  std::tm tm{};
  tm.tm_year = digits_to_int(match[1].str()) - 1900;
  tm.tm_mon = digits_to_int(match[2].str()) - 1;
  tm.tm_mday = digits_to_int(match[3].str());
  tm.tm_hour = digits_to_int(match[4].str());
  tm.tm_min = digits_to_int(match[5].str());
  tm.tm_sec = match[6].matched ? digits_to_int(match[6].str()) : 0;

  const std::tm requested = tm;
  const std::time_t raw = timegm(&tm);
  if (raw == static_cast<std::time_t>(-1) || tm.tm_mday != requested.tm_mday ||
      tm.tm_mon != requested.tm_mon || tm.tm_hour != requested.tm_hour ||
      tm.tm_min != requested.tm_min || tm.tm_sec != requested.tm_sec) {
    return Result<Timestamp>::failure(ErrorCode::Validation, "timestamp out of range: " + text);
  }

  auto instant = std::chrono::system_clock::from_time_t(raw);
  if (match[7].matched) {
    std::string fraction = match[7].str();
    fraction.resize(6, '0');
    instant += std::chrono::microseconds(digits_to_int(fraction));
  }

  const std::string offset = match[8].str();
  if (offset != "Z" && offset != "z") {
    const int sign = offset[0] == '-' ? -1 : 1;
    std::string digits;
    for (std::size_t i = 1; i < offset.size(); ++i) {
      if (offset[i] != ':') {
        digits.push_back(offset[i]);
      }
    }
    const int hours = digits_to_int(digits.substr(0, 2));
    const int minutes = digits_to_int(digits.substr(2, 2));
    if (hours > 23 || minutes > 59) {
      return Result<Timestamp>::failure(ErrorCode::Validation, "invalid UTC offset: " + offset);
    }
    instant -= sign * (std::chrono::hours(hours) + std::chrono::minutes(minutes));
  }

  return Result<Timestamp>::success(instant);
}

double seconds_between(const Timestamp start, const Timestamp end) {
  return std::chrono::duration<double>(end - start).count();
}

} // namespace execai::common
