#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace rs {

// One per parse run; the engine never mutates it.
struct ParserConfig {
  std::size_t   buffer_size_bytes        = 8192;            // 8 KiB read buffer
  std::size_t   batch_size               = 100;
  std::uint64_t progress_record_interval = 5000;            // records between progress events
  std::uint64_t progress_interval_ms     = 1000;            // or this much time
  bool          emit_batch_events        = true;
  bool          emit_progress_events     = true;
  std::size_t   max_line_bytes           = 8 * 1024 * 1024; // 8 MiB guard per line
  bool          log_line_errors          = false;           // per-line warnings on stderr

  static constexpr std::size_t kMinBatch  = 1;
  static constexpr std::size_t kMaxBatch  = 10000;
  static constexpr std::size_t kMinBuffer = 1024;
  static constexpr std::size_t kMaxBuffer = 65536;
  static constexpr std::uint64_t kMaxProgressIntervalMs = 24ull * 60 * 60 * 1000; // one day

  // First violated constraint, or nullopt when the config is usable.
  std::optional<std::string> validate() const;
};

// Settings file: one JSON object whose keys are the ParserConfig field names,
// plus an optional "input_file". Keys not present keep their current values.
struct ConfigFile {
  ParserConfig parser;
  std::string  input_file;
};

// Loads `path` over `inout`. On failure `inout` is untouched and `err` says why.
// Range checks are left to ParserConfig::validate().
bool load_config_file(const std::string& path, ConfigFile& inout, std::string* err = nullptr);

}
