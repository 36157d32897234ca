#include "record_stream/field_split.hpp"

namespace rs {

static inline bool is_ws(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

bool next_field(std::string_view& line, char delim, std::string_view& field) noexcept {
  if (line.empty()) { field = {}; return false; }

  const std::size_t pos = line.find(delim);
  if (pos == std::string_view::npos) {
    field = line;
    line = {};
    return true;
  }
  field = line.substr(0, pos);
  line.remove_prefix(pos + 1);
  return true;
}

std::string_view trim(std::string_view s) noexcept {
  std::size_t b = 0, e = s.size();
  while (b < e && is_ws(s[b])) ++b;
  while (e > b && is_ws(s[e - 1])) --e;
  return s.substr(b, e - b);
}

std::size_t split_fields(std::string_view line, char delim,
                         std::vector<std::string_view>& out) {
  out.clear();
  std::string_view f;
  while (next_field(line, delim, f)) out.push_back(f);
  return out.size();
}

}
