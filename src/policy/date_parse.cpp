#include "record_stream/date_parse.hpp"
#include <cstdio>
#include <string_view>

// Small calendar-date parser. Only the two layouts the people files use are
// accepted; times and offsets are not part of a birth date and are rejected.

namespace rs {

static bool is_digit(char c){ return c>='0' && c<='9'; }

static bool parse_int(std::string_view s, int& out) {
  if (s.empty()) return false;
  int v = 0;
  for (char c : s) { if (!is_digit(c)) return false; v = v*10 + (c - '0'); }
  out = v; return true;
}

bool is_leap_year(int y) noexcept {
  return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

int days_in_month(int y, int m) noexcept {
  static constexpr int days[] = {31,28,31,30,31,30,31,31,30,31,30,31};
  if (m < 1 || m > 12) return 0;
  return (m == 2 && is_leap_year(y)) ? 29 : days[m - 1];
}

static std::optional<CalendarDate> checked(int Y, int M, int D) {
  if (Y < 1 || Y > 9999) return std::nullopt;
  if (M < 1 || M > 12) return std::nullopt;
  if (D < 1 || D > days_in_month(Y, M)) return std::nullopt;
  return CalendarDate{Y, M, D};
}

std::optional<CalendarDate> parse_calendar_date(std::string_view s) {
  int Y,M,D;

  // YYYY-MM-DD
  if (s.size() == 10 && s[4]=='-' && s[7]=='-') {
    if (!(parse_int(s.substr(0,4), Y) && parse_int(s.substr(5,2), M) && parse_int(s.substr(8,2), D)))
      return std::nullopt;
    return checked(Y, M, D);
  }

  // M/D/YYYY
  const size_t a = s.find('/');
  if (a == std::string_view::npos || a == 0 || a > 2) return std::nullopt;
  const size_t b = s.find('/', a + 1);
  if (b == std::string_view::npos || b == a + 1 || b - a - 1 > 2) return std::nullopt;
  if (s.size() - b - 1 != 4) return std::nullopt;
  if (!(parse_int(s.substr(0,a), M) && parse_int(s.substr(a+1, b-a-1), D) && parse_int(s.substr(b+1), Y)))
    return std::nullopt;
  return checked(Y, M, D);
}

std::string format_date(const CalendarDate& d) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", d.year, d.month, d.day);
  return std::string(buf);
}

}
