#include "record_stream/field_split.hpp"
#include "../support/test_support.hpp"

#include <string_view>
#include <vector>

int main(){
  rs_test::Checker check("field_split");

  // fields advance past each delimiter; the tail is the last field
  std::string_view line = "Ann,Lee,1990-01-01";
  std::string_view f;
  check(rs::next_field(line, ',', f) && f == "Ann", "first field");
  check(line == "Lee,1990-01-01", "line advanced past delimiter");
  check(rs::next_field(line, ',', f) && f == "Lee", "second field");
  check(rs::next_field(line, ',', f) && f == "1990-01-01", "last field without delimiter");
  check(line.empty(), "line emptied after last field");
  check(!rs::next_field(line, ',', f) && f.empty(), "no field from empty line");

  // adjacent delimiters give an empty field, not a failure
  line = ",x";
  check(rs::next_field(line, ',', f) && f.empty() && line == "x", "leading empty field");

  // views point into the original buffer
  const char buf[] = "a\tb";
  line = std::string_view(buf, 3);
  check(rs::next_field(line, '\t', f) && f.data() == buf, "zero-copy slice");

  check(rs::trim("  Ann \t") == "Ann", "trim spaces and tabs");
  check(rs::trim("\r\nLee\r\n") == "Lee", "trim CR/LF");
  check(rs::trim(" \t \r\n").empty(), "all-whitespace trims to empty");
  check(rs::trim("").empty(), "empty stays empty");
  check(rs::trim("a b") == "a b", "inner whitespace kept");
  const std::string_view padded = "  mid  ";
  check(rs::trim(padded).data() == padded.data() + 2, "trim does not copy");

  std::vector<std::string_view> out;
  check(rs::split_fields("x;y;;z", ';', out) == 4, "split count");
  check(out.size() == 4 && out[2].empty() && out[3] == "z", "split keeps empty middle field");
  check(rs::split_fields("", ';', out) == 0 && out.empty(), "split empty");

  return check.finish();
}
