#include "record_stream/person.hpp"
#include "record_stream/field_split.hpp"

namespace rs {

int Person::age_on(const CalendarDate& today) const noexcept {
  int age = today.year - birth_date.year;
  if (today.month < birth_date.month ||
      (today.month == birth_date.month && today.day < birth_date.day)) --age;
  return age;
}

ParseOutcome<Person> PersonParser::try_parse(std::string_view line, std::uint64_t line_number) const {
  using Out = ParseOutcome<Person>;
  auto fail = [&](ErrorCause c, std::string_view detail) {
    return Out::failure(line_error(line_number, c, detail));
  };

  std::string_view rest = line;
  std::string_view first, last, birth;
  if (!next_field(rest, delim_, first)) return fail(ErrorCause::FieldCount, "Missing first name field");
  if (!next_field(rest, delim_, last))  return fail(ErrorCause::FieldCount, "Missing last name field");
  if (!next_field(rest, delim_, birth)) return fail(ErrorCause::FieldCount, "Missing birth date field");
  if (!trim(rest).empty())              return fail(ErrorCause::FieldCount, "Too many fields");

  first = trim(first);
  last  = trim(last);
  birth = trim(birth);

  if (first.empty()) return fail(ErrorCause::EmptyField, "First name cannot be empty");
  if (last.empty())  return fail(ErrorCause::EmptyField, "Last name cannot be empty");
  if (birth.empty()) return fail(ErrorCause::EmptyField, "Birth date cannot be empty");

  auto date = policy_.parse_date(birth);
  if (!date) return fail(ErrorCause::InvalidValue, "Invalid birth date format: " + std::string(birth));

  // Copy out of the read buffer before the record leaves this call.
  Person p;
  p.first_name.assign(first.data(), first.size());
  p.last_name.assign(last.data(), last.size());
  p.birth_date = *date;
  return Out::success(std::move(p));
}

}
