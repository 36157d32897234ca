#include "record_stream/parser_config.hpp"
#include "../support/test_support.hpp"

#include <cstdint>
#include <optional>
#include <string>

int main(){
  rs_test::Checker check("config_file");

  // defaults
  {
    rs::ParserConfig c;
    check(c.buffer_size_bytes == 8192 && c.batch_size == 100, "default sizes");
    check(c.progress_record_interval == 5000 && c.progress_interval_ms == 1000, "default progress cadence");
    check(c.emit_batch_events && c.emit_progress_events, "default emission");
    check(!c.validate(), "defaults are valid");
  }

  // validation bounds
  {
    rs::ParserConfig c;
    c.batch_size = 0;
    check(c.validate() == std::optional<std::string>("Batch size must be between 1 and 10000"), "batch 0");
    c.batch_size = 10001;
    check(c.validate().has_value(), "batch 10001");
    c.batch_size = 10000;
    check(!c.validate(), "batch 10000");
    c.buffer_size_bytes = 1023;
    check(c.validate() == std::optional<std::string>("Buffer size must be between 1024 and 65536"), "buffer 1023");
    c.buffer_size_bytes = 65536;
    check(!c.validate(), "buffer 65536");
    c.buffer_size_bytes = 65537;
    check(c.validate().has_value(), "buffer 65537");
    c.buffer_size_bytes = 8192;
    c.progress_interval_ms = rs::ParserConfig::kMaxProgressIntervalMs;
    check(!c.validate(), "progress interval one day");
    c.progress_interval_ms = ~std::uint64_t{0};
    check(c.validate() == std::optional<std::string>("Progress interval must be at most 86400000 ms"),
          "progress interval from a negative flag");
  }

  // partial file keeps other values
  {
    auto p = rs_test::write_temp("cfg_partial.json",
      "{\"batch_size\": 250, \"emit_progress_events\": false, \"input_file\": \"people.csv\"}");
    rs::ConfigFile f;
    std::string err;
    check(rs::load_config_file(p, f, &err), "partial loads: " + err);
    check(f.parser.batch_size == 250, "batch from file");
    check(!f.parser.emit_progress_events, "progress flag from file");
    check(f.parser.buffer_size_bytes == 8192, "buffer untouched");
    check(f.input_file == "people.csv", "input file");
  }

  // every key
  {
    auto p = rs_test::write_temp("cfg_full.json",
      "{\"buffer_size_bytes\":4096,\"batch_size\":10,\"progress_record_interval\":7,"
      "\"progress_interval_ms\":50,\"emit_batch_events\":false,\"emit_progress_events\":true,"
      "\"max_line_bytes\":2048,\"log_line_errors\":true}");
    rs::ConfigFile f;
    check(rs::load_config_file(p, f), "full loads");
    const auto& c = f.parser;
    check(c.buffer_size_bytes == 4096 && c.batch_size == 10, "sizes");
    check(c.progress_record_interval == 7 && c.progress_interval_ms == 50, "cadence");
    check(!c.emit_batch_events && c.emit_progress_events, "emission");
    check(c.max_line_bytes == 2048 && c.log_line_errors, "line guard and logging");
  }

  // failures leave the target alone
  {
    rs::ConfigFile f;
    f.parser.batch_size = 33;
    std::string err;

    auto unknown = rs_test::write_temp("cfg_unknown.json", "{\"batch\": 5}");
    check(!rs::load_config_file(unknown, f, &err), "unknown key rejected");
    check(err.find("unknown config key: batch") != std::string::npos, "unknown key named");

    auto typed = rs_test::write_temp("cfg_typed.json", "{\"batch_size\": 5, \"emit_batch_events\": \"yes\"}");
    check(!rs::load_config_file(typed, f, &err), "wrong type rejected");

    auto broken = rs_test::write_temp("cfg_broken.json", "{\"batch_size\": ");
    check(!rs::load_config_file(broken, f, &err), "truncated json rejected");

    check(!rs::load_config_file("/definitely/not/here.json", f, &err), "missing file rejected");
    check(err.find("cannot read") == 0, "missing file message");

    check(f.parser.batch_size == 33, "target untouched after failures");
  }

  return check.finish();
}
