#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "record_stream/cancellation.hpp"
#include "record_stream/events.hpp"
#include "record_stream/file_source.hpp"
#include "record_stream/line_assembler.hpp"
#include "record_stream/parser_config.hpp"
#include "record_stream/record_parser.hpp"

namespace rs {

enum class RunOutcome { Completed, Cancelled, NotFound, IoFailed };

const char* outcome_name(RunOutcome o) noexcept;

// Counters for one run; never shared between runs.
struct ProcessingState {
  std::uint64_t line_number = 0;             // last physical line seen (1-based)
  std::uint64_t total_records = 0;
  std::uint64_t error_count = 0;
  std::uint64_t records_since_progress = 0;
  std::uint64_t bytes_consumed = 0;          // through the end of the last line
  std::chrono::steady_clock::time_point last_progress{};
};

struct RunSummary {
  RunOutcome    outcome = RunOutcome::Completed;
  std::uint64_t total_records = 0;
  std::uint64_t error_count = 0;
  std::uint64_t lines = 0;
  std::uint64_t bytes_consumed = 0;
  std::uint64_t file_size = 0;
  Millis        duration{0};
};

// Reads a file chunk by chunk and pushes ParserEvents to a callback.
//
// Event order per run: any interleaving of BatchParsed / Progress / ErrorEvent,
// then exactly one of
//   - Completion     (end of file; final partial batch flushed first)
//   - Cancellation   (token observed; nothing else follows)
//   - ErrorEvent     (file not found at line 0, or an I/O fault mid-read)
//
// Exceptions thrown by the callback are not caught here.
template <class Parser>
class StreamEngine {
  static_assert(is_record_parser<Parser>::value,
                "Parser needs record_type and try_parse(string_view, uint64_t) const -> ParseOutcome");
public:
  using record_type   = typename Parser::record_type;
  using Event         = ParserEvent<record_type>;
  using EventCallback = std::function<void(Event&&)>;

  explicit StreamEngine(Parser parser = Parser{},
                        const FileSystem& fs = LocalFileSystem::instance())
    : parser_(std::move(parser)), fs_(&fs) {}

  RunSummary parse(const std::string& path, CancellationToken token,
                   const ParserConfig& cfg, const EventCallback& on_event) const;

  // Runs to the end and returns every event in order.
  std::vector<Event> parse_all(const std::string& path, CancellationToken token,
                               const ParserConfig& cfg) const {
    std::vector<Event> out;
    parse(path, std::move(token), cfg, [&](Event&& ev){ out.push_back(std::move(ev)); });
    return out;
  }

  const Parser& parser() const noexcept { return parser_; }

private:
  Parser parser_;
  const FileSystem* fs_;
};

template <class Parser>
RunSummary StreamEngine<Parser>::parse(const std::string& path, CancellationToken token,
                                       const ParserConfig& cfg, const EventCallback& on_event) const {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();
  auto since_start = [&]{ return ch::duration_cast<Millis>(ch::steady_clock::now() - t0); };

  RunSummary sum;
  std::cerr << "[parser] start: " << path
            << " buffer=" << cfg.buffer_size_bytes
            << " batch=" << cfg.batch_size << "\n";

  if (!fs_->exists(path)) {
    std::cerr << "[parser] file not found: " << path << "\n";
    ErrorEvent e;
    e.message = "File not found";
    e.line_number = 0;
    e.cause = ErrorCause::FileNotFound;
    on_event(Event(std::move(e)));
    sum.outcome = RunOutcome::NotFound;
    sum.duration = since_start();
    return sum;
  }

  const std::size_t batch_size = std::max<std::size_t>(1, cfg.batch_size);
  const std::size_t batch_reserve = std::min<std::size_t>(batch_size, 4096);

  ProcessingState st;
  st.last_progress = t0;
  std::vector<record_type> batch;
  if (cfg.emit_batch_events) batch.reserve(batch_reserve);

  bool cancelled = false;
  bool io_failed = false;
  std::string io_what;

  auto flush_batch = [&]{
    BatchParsed<record_type> b;
    b.records = std::move(batch);
    b.total_so_far = st.total_records;
    batch = std::vector<record_type>();
    batch.reserve(batch_reserve);
    on_event(Event(std::move(b)));
    // let other runs onto the scheduler between deliveries
    std::this_thread::yield();
  };

  auto maybe_progress = [&]{
    if (!cfg.emit_progress_events) return;
    const auto now = ch::steady_clock::now();
    const auto interval = ch::milliseconds(static_cast<Millis::rep>(
        std::min<std::uint64_t>(cfg.progress_interval_ms, ParserConfig::kMaxProgressIntervalMs)));
    if (st.records_since_progress < cfg.progress_record_interval &&
        now - st.last_progress < interval) return;

    Progress p;
    p.records_processed = st.total_records;
    p.percent_complete = sum.file_size > 0
        ? std::min(100.0, 100.0 * static_cast<double>(st.bytes_consumed) / static_cast<double>(sum.file_size))
        : 0.0;
    p.elapsed = ch::duration_cast<Millis>(now - t0);
    on_event(Event(std::move(p)));
    st.last_progress = now;
    st.records_since_progress = 0;
  };

  auto on_line = [&](const LineAssembler::Line& ln) -> bool {
    if (token.is_cancellation_requested()) { cancelled = true; return false; }

    st.bytes_consumed += ln.consumed;
    ++st.line_number;
    if (ln.text.empty() && !ln.oversize) { // blank: counted, not parsed
      maybe_progress();
      return true;
    }

    if (ln.oversize) {
      ++st.error_count;
      auto err = line_error(st.line_number, ErrorCause::InvalidValue,
                            "Line exceeds " + std::to_string(cfg.max_line_bytes) + " bytes");
      if (cfg.log_line_errors) std::cerr << "[parser] " << err.message << "\n";
      on_event(Event(ErrorEvent::from(err)));
    } else {
      auto out = parser_.try_parse(ln.text, st.line_number);
      if (out) {
        ++st.total_records;
        ++st.records_since_progress;
        if (cfg.emit_batch_events) {
          batch.push_back(std::move(out.record()));
          if (batch.size() >= batch_size) flush_batch();
        }
      } else {
        ++st.error_count;
        if (cfg.log_line_errors) std::cerr << "[parser] " << out.error().message << "\n";
        on_event(Event(ErrorEvent::from(out.error())));
      }
    }

    maybe_progress();
    return true;
  };

  {
    // Stream and read buffer live only for the read loop; both are released
    // before any terminal event goes out.
    std::unique_ptr<ByteStream> in;
    try {
      in = fs_->open(path);
    } catch (const IoError& ex) {
      io_failed = true;
      io_what = ex.what();
    }

    if (in) {
      sum.file_size = in->size();
      std::cerr << "[parser] file size: " << sum.file_size << " bytes\n";

      LineAssembler::Config acfg;
      acfg.max_line_bytes = cfg.max_line_bytes;
      LineAssembler assembler(acfg);
      std::vector<char> buf(std::max<std::size_t>(1, cfg.buffer_size_bytes));

      try {
        while (true) {
          if (token.is_cancellation_requested()) { cancelled = true; break; }
          const std::size_t n = in->read(buf.data(), buf.size());
          if (n == 0) break;
          if (!assembler.feed(std::string_view(buf.data(), n), on_line)) break;
        }
        if (!cancelled) assembler.finish(on_line);
        // a stop raised while the last line was delivered
        if (!cancelled && token.is_cancellation_requested()) cancelled = true;
      } catch (const IoError& ex) {
        io_failed = true;
        io_what = ex.what();
      }
    }
  }

  sum.total_records  = st.total_records;
  sum.error_count    = st.error_count;
  sum.lines          = st.line_number;
  sum.bytes_consumed = st.bytes_consumed;
  sum.duration       = since_start();

  if (io_failed) {
    std::cerr << "[parser] I/O failure after line " << st.line_number << ": " << io_what << "\n";
    ErrorEvent e;
    e.message = "I/O error: " + io_what;
    e.line_number = st.line_number;
    e.cause = ErrorCause::Io;
    on_event(Event(std::move(e)));
    sum.outcome = RunOutcome::IoFailed;
    return sum;
  }

  if (!cancelled && cfg.emit_batch_events && !batch.empty()) {
    flush_batch();
    if (token.is_cancellation_requested()) cancelled = true;
  }

  if (cancelled) {
    std::cerr << "[parser] cancelled: records=" << st.total_records
              << " duration_ms=" << sum.duration.count() << "\n";
    Cancellation c;
    c.records_processed_before_cancel = st.total_records;
    c.duration = sum.duration;
    on_event(Event(std::move(c)));
    sum.outcome = RunOutcome::Cancelled;
    return sum;
  }

  std::cerr << "[parser] done: records=" << st.total_records
            << " errors=" << st.error_count
            << " duration_ms=" << sum.duration.count() << "\n";
  Completion done;
  done.total_records = st.total_records;
  done.duration = sum.duration;
  done.error_count = st.error_count;
  on_event(Event(std::move(done)));
  sum.outcome = RunOutcome::Completed;
  return sum;
}

}
