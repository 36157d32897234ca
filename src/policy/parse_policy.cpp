#include "record_stream/parse_policy.hpp"
#include <charconv>
#include <cctype>
#include <string_view>
#include <fast_float/fast_float.h>

namespace rs {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

std::optional<double> ParsePolicy::parse_number(std::string_view s) const {
  if (s.empty()) return std::nullopt;
  double out;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<std::int64_t> ParsePolicy::parse_int(std::string_view s) const {
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return std::nullopt;
  std::int64_t out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<bool> ParsePolicy::parse_bool(std::string_view s) const {
  static const BoolPolicy defaults{};
  const BoolPolicy& bp = bool_policy ? *bool_policy : defaults;
  for (const auto& t : bp.true_tokens) {
    if (bp.case_sensitive ? (s == t) : ieq(s, t)) return true;
  }
  for (const auto& f : bp.false_tokens) {
    if (bp.case_sensitive ? (s == f) : ieq(s, f)) return false;
  }
  return std::nullopt;
}

}
