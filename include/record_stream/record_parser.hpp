#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace rs {

enum class ErrorCause { FieldCount, EmptyField, InvalidValue, FileNotFound, Io };

const char* cause_name(ErrorCause c) noexcept;

struct ParseError {
  std::string   message;
  std::uint64_t line_number = 0;
  ErrorCause    cause = ErrorCause::InvalidValue;
};

// Either a record or the error that identifies the failing line.
template <class T>
class ParseOutcome {
public:
  static ParseOutcome success(T rec) { ParseOutcome o; o.record_.emplace(std::move(rec)); return o; }
  static ParseOutcome failure(ParseError err) { ParseOutcome o; o.error_ = std::move(err); return o; }

  bool ok() const noexcept { return record_.has_value(); }
  explicit operator bool() const noexcept { return ok(); }

  T&       record()       { return *record_; }
  const T& record() const { return *record_; }
  const ParseError& error() const noexcept { return error_; }

private:
  ParseOutcome() = default;
  std::optional<T> record_;
  ParseError error_;
};

// Builds the "Failed to parse line N: detail" error every parser reports.
ParseError line_error(std::uint64_t line_number, ErrorCause cause, std::string_view detail);

// A record parser is any type shaped like:
//
//   struct P {
//     using record_type = T;
//     ParseOutcome<T> try_parse(std::string_view line, std::uint64_t line_number) const;
//   };
//
// try_parse must not throw; the engine treats the outcome as data.
template <class P, class = void>
struct is_record_parser : std::false_type {};

template <class P>
struct is_record_parser<P, std::void_t<
    typename P::record_type,
    decltype(std::declval<const P&>().try_parse(std::string_view{}, std::uint64_t{}))>>
  : std::is_same<decltype(std::declval<const P&>().try_parse(std::string_view{}, std::uint64_t{})),
                 ParseOutcome<typename P::record_type>> {};

}
