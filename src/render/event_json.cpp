#include "record_stream/event_json.hpp"
#include "record_stream/date_parse.hpp"
#include <chrono>
#include <cmath>
#include <cstdio>

namespace rs {

namespace json {

void esc(std::ostream& o, std::string_view s) {
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o << buf;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

long long epoch_ms(Timestamp t) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

}

void write_json(std::ostream& o, const Person& p) {
  o << "{\"first_name\":"; json::esc(o, p.first_name);
  o << ",\"last_name\":";  json::esc(o, p.last_name);
  o << ",\"birth_date\":"; json::esc(o, format_date(p.birth_date));
  o << "}";
}

void write_json(std::ostream& o, const OrderLine& l) {
  o << "{\"product_name\":"; json::esc(o, l.product_name);
  o << ",\"quantity\":" << l.quantity;
  o << ",\"price\":" << json::safe_num(l.price);
  o << "}";
}

void write_json(std::ostream& o, const Progress& e) {
  o << "{\"type\":\"Progress\""
    << ",\"records_processed\":" << e.records_processed
    << ",\"percent_complete\":" << json::safe_num(e.percent_complete)
    << ",\"elapsed_ms\":" << e.elapsed.count()
    << ",\"timestamp_ms\":" << json::epoch_ms(e.timestamp)
    << "}";
}

void write_json(std::ostream& o, const Completion& e) {
  o << "{\"type\":\"StreamCompleted\""
    << ",\"total_records\":" << e.total_records
    << ",\"duration_ms\":" << e.duration.count()
    << ",\"error_count\":" << e.error_count
    << ",\"timestamp_ms\":" << json::epoch_ms(e.timestamp)
    << "}";
}

void write_json(std::ostream& o, const ErrorEvent& e) {
  o << "{\"type\":\"ParseError\",\"message\":"; json::esc(o, e.message);
  o << ",\"line_number\":" << e.line_number;
  o << ",\"cause\":"; json::esc(o, cause_name(e.cause));
  o << ",\"timestamp_ms\":" << json::epoch_ms(e.timestamp);
  o << "}";
}

void write_json(std::ostream& o, const Cancellation& e) {
  o << "{\"type\":\"StreamCancelled\""
    << ",\"records_processed_before_cancel\":" << e.records_processed_before_cancel
    << ",\"duration_ms\":" << e.duration.count()
    << ",\"timestamp_ms\":" << json::epoch_ms(e.timestamp)
    << "}";
}

}
