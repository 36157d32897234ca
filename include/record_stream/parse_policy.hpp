#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
#include <string>
#include <vector>

#include "record_stream/date_parse.hpp"

namespace rs {

struct BoolPolicy;

// Field-level conversions used by the record parsers. Every conversion takes
// an already-trimmed view and requires the whole field to match.
struct ParsePolicy {
  const BoolPolicy* bool_policy = nullptr;   // nullptr -> default tokens

  // Numeric parse via fast_float.
  std::optional<double> parse_number(std::string_view s) const;

  // Integer parse via from_chars; a leading '+' is accepted.
  std::optional<std::int64_t> parse_int(std::string_view s) const;

  std::optional<CalendarDate> parse_date(std::string_view s) const { return parse_calendar_date(s); }

  // Boolean parse from a configured token set.
  std::optional<bool> parse_bool(std::string_view s) const;
};

struct BoolPolicy {
  std::vector<std::string> true_tokens  = {"true","1","yes"};
  std::vector<std::string> false_tokens = {"false","0","no"};
  bool case_sensitive = false;
};

}
