#include "record_stream/record_parser.hpp"

namespace rs {

const char* cause_name(ErrorCause c) noexcept {
  switch (c) {
    case ErrorCause::FieldCount:   return "field_count";
    case ErrorCause::EmptyField:   return "empty_field";
    case ErrorCause::InvalidValue: return "invalid_value";
    case ErrorCause::FileNotFound: return "file_not_found";
    case ErrorCause::Io:           return "io";
  }
  return "unknown";
}

ParseError line_error(std::uint64_t line_number, ErrorCause cause, std::string_view detail) {
  ParseError e;
  e.message = "Failed to parse line " + std::to_string(line_number) + ": " + std::string(detail);
  e.line_number = line_number;
  e.cause = cause;
  return e;
}

}
