#pragma once
#include <cstdint>
#include <string>
#include <string_view>

#include "record_stream/date_parse.hpp"
#include "record_stream/parse_policy.hpp"
#include "record_stream/record_parser.hpp"

namespace rs {

struct Person {
  std::string  first_name;
  std::string  last_name;
  CalendarDate birth_date;

  // Age in whole years at `today`.
  int age_on(const CalendarDate& today) const noexcept;
};

// "First,Last,BirthDate": exactly three fields, each trimmed and non-empty.
class PersonParser {
public:
  using record_type = Person;

  explicit PersonParser(char delimiter = ',') : delim_(delimiter) {}

  ParseOutcome<Person> try_parse(std::string_view line, std::uint64_t line_number) const;

private:
  char delim_;
  ParsePolicy policy_;
};

}
