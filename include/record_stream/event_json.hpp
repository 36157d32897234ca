#pragma once
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include "record_stream/events.hpp"
#include "record_stream/order_line.hpp"
#include "record_stream/person.hpp"

namespace rs {

namespace json {
void esc(std::ostream& o, std::string_view s);
double safe_num(double v);
long long epoch_ms(Timestamp t);
}

// Record writers; add an overload per record type.
void write_json(std::ostream& o, const Person& p);
void write_json(std::ostream& o, const OrderLine& l);

void write_json(std::ostream& o, const Progress& e);
void write_json(std::ostream& o, const Completion& e);
void write_json(std::ostream& o, const ErrorEvent& e);
void write_json(std::ostream& o, const Cancellation& e);

template <class T>
void write_json(std::ostream& o, const BatchParsed<T>& b) {
  o << "{\"type\":\"ReceiveBatch\",\"total_so_far\":" << b.total_so_far
    << ",\"count\":" << b.records.size()
    << ",\"timestamp_ms\":" << json::epoch_ms(b.timestamp)
    << ",\"records\":[";
  for (size_t i = 0; i < b.records.size(); ++i) {
    if (i) o << ",";
    write_json(o, b.records[i]);
  }
  o << "]}";
}

class EventJsonWriter {
public:
  // One event as a single-line JSON object (NDJSON friendly).
  template <class T>
  static std::string to_json(const ParserEvent<T>& ev) {
    std::ostringstream o;
    std::visit([&](const auto& e){ write_json(o, e); }, ev);
    return o.str();
  }
};

}
