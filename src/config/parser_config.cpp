#include "record_stream/parser_config.hpp"

#include <simdjson.h>
#include <string_view>
#include <utility>

namespace rs {

std::optional<std::string> ParserConfig::validate() const {
  if (batch_size < kMinBatch || batch_size > kMaxBatch)
    return std::string("Batch size must be between 1 and 10000");
  if (buffer_size_bytes < kMinBuffer || buffer_size_bytes > kMaxBuffer)
    return std::string("Buffer size must be between 1024 and 65536");
  if (progress_record_interval == 0)
    return std::string("Progress record interval must be positive");
  if (progress_interval_ms > kMaxProgressIntervalMs)
    return std::string("Progress interval must be at most 86400000 ms");
  if (max_line_bytes == 0)
    return std::string("Max line bytes must be positive");
  return std::nullopt;
}

bool load_config_file(const std::string& path, ConfigFile& inout, std::string* err) {
  auto fail = [&](std::string m){ if (err) *err = std::move(m); return false; };

  simdjson::padded_string json;
  if (auto e = simdjson::padded_string::load(path).get(json))
    return fail("cannot read " + path + ": " + simdjson::error_message(e));

  thread_local simdjson::ondemand::parser parser;
  ConfigFile next = inout;
  auto& pc = next.parser;

  try {
    simdjson::ondemand::document doc = parser.iterate(json);
    simdjson::ondemand::object obj = doc.get_object();
    for (auto field : obj) {
      std::string key(std::string_view(field.unescaped_key().value()));
      simdjson::ondemand::value v = field.value();

      if      (key == "buffer_size_bytes")        pc.buffer_size_bytes = static_cast<std::size_t>(v.get_uint64().value());
      else if (key == "batch_size")               pc.batch_size = static_cast<std::size_t>(v.get_uint64().value());
      else if (key == "progress_record_interval") pc.progress_record_interval = v.get_uint64().value();
      else if (key == "progress_interval_ms")     pc.progress_interval_ms = v.get_uint64().value();
      else if (key == "emit_batch_events")        pc.emit_batch_events = v.get_bool().value();
      else if (key == "emit_progress_events")     pc.emit_progress_events = v.get_bool().value();
      else if (key == "max_line_bytes")           pc.max_line_bytes = static_cast<std::size_t>(v.get_uint64().value());
      else if (key == "log_line_errors")          pc.log_line_errors = v.get_bool().value();
      else if (key == "input_file")               next.input_file = std::string(std::string_view(v.get_string().value()));
      else return fail("unknown config key: " + key);
    }
  } catch (const simdjson::simdjson_error& ex) {
    return fail("bad config " + path + ": " + ex.what());
  }

  inout = std::move(next);
  return true;
}

}
