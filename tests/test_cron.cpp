#include "test_framework.hpp"

#include "execai/scheduler/cron.hpp"

namespace {

execai::common::Timestamp at(const std::string &iso) {
  auto parsed = execai::common::parse_iso8601(iso);
  if (!parsed.ok()) {
    throw std::runtime_error(parsed.error());
  }
  return parsed.value();
}

execai::scheduler::CronExpression cron(const std::string &expression) {
  auto parsed = execai::scheduler::CronExpression::parse(expression);
  if (!parsed.ok()) {
    throw std::runtime_error(expression + ": " + parsed.error());
  }
  return std::move(parsed.value());
}

std::string show(const std::optional<execai::common::Timestamp> &instant) {
  return execai::common::format_iso8601(instant, "none");
}

} // namespace

void register_cron_tests(std::vector<execai::tests::TestCase> &tests) {
  using execai::tests::require;
  namespace s = execai::scheduler;

  tests.push_back({"cron_every_minute_is_strictly_after", [] {
                     const auto expr = cron("* * * * *");
                     const auto next = expr.next_occurrence(at("2026-01-01T10:00:00Z"));
                     require(next == at("2026-01-01T10:01:00Z"), show(next));
                     const auto same = expr.next_occurrence_from(at("2026-01-01T10:00:00Z"));
                     require(same == at("2026-01-01T10:00:00Z"), "aligned instant matches itself");
                     const auto rounded = expr.next_occurrence_from(at("2026-01-01T10:00:01Z"));
                     require(rounded == at("2026-01-01T10:01:00Z"), "seconds round up");
                   }});

  tests.push_back({"cron_steps_ranges_and_lists", [] {
                     const auto steps = cron("5/20 * * * *");
                     require(steps.next_occurrence(at("2026-01-01T10:06:00Z")) ==
                                 at("2026-01-01T10:25:00Z"),
                             "a/n runs from a");
                     const auto list = cron("0 8,17 * * *");
                     require(list.next_occurrence(at("2026-01-01T09:00:00Z")) ==
                                 at("2026-01-01T17:00:00Z"),
                             "hour list");
                     const auto range = cron("*/30 9-10 * * *");
                     require(range.next_occurrence(at("2026-01-01T10:30:00Z")) ==
                                 at("2026-01-02T09:00:00Z"),
                             "range wraps to the next day");
                     const auto huge_step = cron("59/2147483647 * * * *");
                     require(huge_step.next_occurrence(at("2026-01-01T10:06:00Z")) ==
                                 at("2026-01-01T10:59:00Z"),
                             "a step past the field end keeps only the start");
                     const auto huge_wildcard = cron("*/2147483647 3 * * *");
                     require(huge_wildcard.next_occurrence(at("2026-01-01T10:06:00Z")) ==
                                 at("2026-01-02T03:00:00Z"),
                             "*/n with n past the field end keeps only the minimum");
                   }});

  tests.push_back({"cron_weekday_names_skip_weekend", [] {
                     // 2026-01-01 is a Thursday.
                     const auto expr = cron("0 9 * * mon-fri");
                     const auto friday = expr.next_occurrence(at("2026-01-01T10:00:00Z"));
                     require(friday == at("2026-01-02T09:00:00Z"), show(friday));
                     const auto monday = expr.next_occurrence(*friday);
                     require(monday == at("2026-01-05T09:00:00Z"), show(monday));
                   }});

  tests.push_back({"cron_seven_is_sunday", [] {
                     const auto expr = cron("0 12 * * 7");
                     const auto next = expr.next_occurrence(at("2026-01-01T00:00:00Z"));
                     require(next == at("2026-01-04T12:00:00Z"), show(next));
                     require(cron("0 12 * * sun").next_occurrence(at("2026-01-01T00:00:00Z")) == next,
                             "name and number agree");
                   }});

  tests.push_back({"cron_month_names", [] {
                     const auto expr = cron("30 6 1 JAN,jul *");
                     const auto next = expr.next_occurrence(at("2026-02-01T00:00:00Z"));
                     require(next == at("2026-07-01T06:30:00Z"), show(next));
                   }});

  tests.push_back({"cron_macros", [] {
                     require(cron("@daily").next_occurrence(at("2026-01-01T00:00:00Z")) ==
                                 at("2026-01-02T00:00:00Z"),
                             "@daily");
                     require(cron("@hourly").next_occurrence(at("2026-01-01T00:59:59Z")) ==
                                 at("2026-01-01T01:00:00Z"),
                             "@hourly");
                     require(cron("@weekly").next_occurrence(at("2026-01-01T00:00:00Z")) ==
                                 at("2026-01-04T00:00:00Z"),
                             "@weekly fires on Sunday");
                     require(cron("@yearly").next_occurrence(at("2026-01-01T00:00:00Z")) ==
                                 at("2027-01-01T00:00:00Z"),
                             "@yearly");
                     require(cron("@daily").source() == "@daily", "source kept verbatim");
                   }});

  tests.push_back({"cron_day_of_month_or_day_of_week", [] {
                     // Either the 13th or any Friday.
                     const auto expr = cron("0 0 13 * 5");
                     auto cursor = at("2026-01-01T00:00:00Z");
                     std::vector<std::string> seen;
                     for (int i = 0; i < 4; ++i) {
                       const auto next = expr.next_occurrence(cursor);
                       require(next.has_value(), "occurrence expected");
                       seen.push_back(show(next).substr(0, 10));
                       cursor = *next;
                     }
                     require(seen == std::vector<std::string>{"2026-01-02", "2026-01-09",
                                                              "2026-01-13", "2026-01-16"},
                             "unexpected sequence starting " + seen.front());
                   }});

  tests.push_back({"cron_leap_day_and_impossible_dates", [] {
                     const auto leap = cron("0 0 29 2 *").next_occurrence(at("2026-01-01T00:00:00Z"));
                     require(leap == at("2028-02-29T00:00:00Z"), show(leap));
                     const auto never = cron("0 0 30 2 *").next_occurrence(at("2026-01-01T00:00:00Z"));
                     require(!never.has_value(), "February 30th never occurs");
                   }});

  tests.push_back({"cron_matches_broken_down_time", [] {
                     const auto expr = cron("15 14 * * *");
                     std::tm tm{};
                     tm.tm_year = 126;
                     tm.tm_mon = 0;
                     tm.tm_mday = 1;
                     tm.tm_hour = 14;
                     tm.tm_min = 15;
                     tm.tm_wday = 4;
                     require(expr.matches(tm), "14:15 matches");
                     tm.tm_min = 16;
                     require(!expr.matches(tm), "14:16 does not");
                   }});

  tests.push_back({"cron_rejects_invalid_expressions", [] {
                     for (const std::string bad :
                          {"", "* * * *", "* * * * * *", "60 * * * *", "* 24 * * *",
                           "* * 0 * *", "* * * 13 *", "* * * * 8", "*/0 * * * *", "5-1 * * * *",
                           "* * * foo *", "a b c d e", "1,,2 * * * *", "@sometimes"}) {
                       require(!s::is_valid_cron_expression(bad), "should be invalid: '" + bad + "'");
                       auto parsed = s::CronExpression::parse(bad);
                       require(parsed.code() == execai::common::ErrorCode::Validation,
                               "validation error for '" + bad + "'");
                     }
                     require(s::is_valid_cron_expression(" 0 0 * * 0 "), "surrounding space is ok");
                   }});
}
