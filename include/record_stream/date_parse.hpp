#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rs {

struct CalendarDate {
  int year  = 1970;
  int month = 1;
  int day   = 1;

  bool operator==(const CalendarDate& o) const noexcept {
    return year == o.year && month == o.month && day == o.day;
  }
  bool operator!=(const CalendarDate& o) const noexcept { return !(*this == o); }
};

// Accepts YYYY-MM-DD and M/D/YYYY (month/day may be one or two digits).
// Month and day are range-checked against the calendar, leap years included.
std::optional<CalendarDate> parse_calendar_date(std::string_view s);

bool is_leap_year(int y) noexcept;
int  days_in_month(int y, int m) noexcept;

// Always YYYY-MM-DD.
std::string format_date(const CalendarDate& d);

}
