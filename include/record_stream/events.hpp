#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "record_stream/record_parser.hpp"

namespace rs {

using Clock     = std::chrono::system_clock;
using Millis    = std::chrono::milliseconds;
using Timestamp = Clock::time_point;

template <class T>
struct BatchParsed {
  std::vector<T> records;          // owned snapshot
  std::uint64_t  total_so_far = 0;
  Timestamp      timestamp = Clock::now();
};

struct Progress {
  std::uint64_t records_processed = 0;
  double        percent_complete = 0.0;
  Millis        elapsed{0};
  Timestamp     timestamp = Clock::now();
};

struct Completion {
  std::uint64_t total_records = 0;
  Millis        duration{0};
  std::uint64_t error_count = 0;
  Timestamp     timestamp = Clock::now();
};

struct ErrorEvent {
  std::string   message;
  std::uint64_t line_number = 0;
  ErrorCause    cause = ErrorCause::InvalidValue;
  Timestamp     timestamp = Clock::now();

  static ErrorEvent from(const ParseError& e) { return ErrorEvent{e.message, e.line_number, e.cause, Clock::now()}; }
};

struct Cancellation {
  std::uint64_t records_processed_before_cancel = 0;
  Millis        duration{0};
  Timestamp     timestamp = Clock::now();
};

template <class T>
using ParserEvent = std::variant<BatchParsed<T>, Progress, Completion, ErrorEvent, Cancellation>;

// Completion and Cancellation end a run. A fatal ErrorEvent (not found, I/O)
// also ends it but is not a terminal event in the protocol sense.
template <class T>
bool is_terminal(const ParserEvent<T>& ev) noexcept {
  return std::holds_alternative<Completion>(ev) || std::holds_alternative<Cancellation>(ev);
}

// Names used by the live-connection broadcaster for each event kind.
template <class T>
const char* event_name(const ParserEvent<T>& ev) noexcept {
  switch (ev.index()) {
    case 0: return "ReceiveBatch";
    case 1: return "Progress";
    case 2: return "StreamCompleted";
    case 3: return "ParseError";
    case 4: return "StreamCancelled";
  }
  return "Unknown";
}

}
