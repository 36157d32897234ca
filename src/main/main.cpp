#include "record_stream/cancellation.hpp"
#include "record_stream/event_json.hpp"
#include "record_stream/fixed_width.hpp"
#include "record_stream/order_line.hpp"
#include "record_stream/parser_config.hpp"
#include "record_stream/people_gen.hpp"
#include "record_stream/person.hpp"
#include "record_stream/stream_engine.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace {

struct Cli {
  rs::ParserConfig cfg;
  std::string kind = "person";       // person|order
  std::string export_fixed;          // fixed-width output file (optional)
  std::uint64_t generate = 0;        // lines to generate (0 = off)
  std::uint64_t seed = 42;
  std::string out;                   // generator output
  std::string config;                // JSON settings file, applied before flags
  std::string config_input;          // its input_file, used when no files are given
  std::vector<std::string> files;
  bool bad = false;
};

void usage() {
  std::cout <<
    "Usage: record-stream [--config=FILE] [--buffer=N] [--batch=N] [--progress-records=N] [--progress-ms=N]\n"
    "                     [--no-batches] [--no-progress] [--log-line-errors]\n"
    "                     [--kind=person|order] [--export-fixed=FILE] [<file>...]\n"
    "       record-stream --generate=N --out=FILE [--seed=N]\n";
}

Cli parse_cli(int argc, char** argv) {
  Cli c;

  // settings file first so flags can override it
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    if (a.rfind("--config=", 0) != 0) continue;
    c.config = a.substr(9);
    rs::ConfigFile file;
    std::string err;
    if (!rs::load_config_file(c.config, file, &err)) {
      std::cerr << "[cli] " << err << "\n";
      c.bad = true;
      return c;
    }
    c.cfg = file.parser;
    c.config_input = file.input_file;
  }

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_u = [&](const char* pfx, auto* out){
      if (a.rfind(pfx, 0) != 0) return false;
      try {
        *out = static_cast<std::remove_pointer_t<decltype(out)>>(std::stoull(a.substr(std::string(pfx).size())));
      } catch (const std::exception&) {
        std::cerr << "[cli] bad number: " << a << "\n";
        c.bad = true;
      }
      return true;
    };
    if (eat_u("--buffer=", &c.cfg.buffer_size_bytes)) continue;
    if (eat_u("--batch=", &c.cfg.batch_size)) continue;
    if (eat_u("--progress-records=", &c.cfg.progress_record_interval)) continue;
    if (eat_u("--progress-ms=", &c.cfg.progress_interval_ms)) continue;
    if (eat_u("--generate=", &c.generate)) continue;
    if (eat_u("--seed=", &c.seed)) continue;
    if (a.rfind("--config=", 0) == 0) continue;
    if (eat("--kind=", &c.kind)) continue;
    if (eat("--export-fixed=", &c.export_fixed)) continue;
    if (eat("--out=", &c.out)) continue;
    if (a == "--no-batches")      { c.cfg.emit_batch_events = false; continue; }
    if (a == "--no-progress")     { c.cfg.emit_progress_events = false; continue; }
    if (a == "--log-line-errors") { c.cfg.log_line_errors = true; continue; }
    if (a == "-h" || a == "--help") { usage(); std::exit(0); }
    if (a.rfind("--", 0) == 0) { std::cerr << "[cli] unknown flag: " << a << "\n"; c.bad = true; continue; }
    c.files.push_back(a);
  }
  if (c.files.empty() && !c.config_input.empty()) c.files.push_back(c.config_input);
  if (c.kind != "person" && c.kind != "order") {
    std::cerr << "[cli] unknown kind: " << c.kind << "\n";
    c.bad = true;
  }
  return c;
}

// SIGINT cancels whatever run is active.
std::atomic<rs::CancellationSource*> g_active{nullptr};
void on_sigint(int) { if (auto* s = g_active.load()) s->cancel(); }

template <class Parser, class Layout>
int scan_one_file(const std::string& path, const Cli& cli, const Layout& layout) {
  using Engine = rs::StreamEngine<Parser>;

  std::ofstream fixed;
  if (!cli.export_fixed.empty()) {
    fixed.open(cli.export_fixed, std::ios::binary | std::ios::app);
    if (!fixed) { std::cerr << "[scan] cannot open " << cli.export_fixed << "\n"; return 1; }
  }

  rs::CancellationSource src;
  g_active.store(&src);

  Engine engine;
  rs::RunSummary sum = engine.parse(path, src.token(), cli.cfg, [&](typename Engine::Event&& ev){
    if (fixed.is_open()) {
      if (auto* b = std::get_if<rs::BatchParsed<typename Parser::record_type>>(&ev))
        layout.write_lines(b->records, fixed);
    }
    std::cout << rs::EventJsonWriter::to_json(ev) << "\n";
  });
  std::cout.flush();
  g_active.store(nullptr);

  std::cerr << "[scan] " << path << ": " << rs::outcome_name(sum.outcome)
            << " records=" << sum.total_records << " errors=" << sum.error_count << "\n";
  switch (sum.outcome) {
    case rs::RunOutcome::Completed: return 0;
    case rs::RunOutcome::Cancelled: return 2;
    default:                        return 1;
  }
}

}

int main(int argc, char** argv) {
  auto cli = parse_cli(argc, argv);
  if (cli.bad) { usage(); return 3; }

  if (cli.generate > 0) {
    if (cli.out.empty()) { std::cerr << "[gen] --out=FILE is required\n"; return 3; }
    rs::PeopleGenConfig g;
    g.lines = cli.generate;
    g.seed = cli.seed;
    std::string err;
    if (!rs::generate_people_file(cli.out, g, &err)) { std::cerr << "[gen] " << err << "\n"; return 1; }
    std::cerr << "[gen] wrote " << g.lines << " lines to " << cli.out << "\n";
    if (cli.files.empty()) return 0;
  }

  if (cli.files.empty()) { usage(); return 3; }
  if (auto bad = cli.cfg.validate()) { std::cerr << "[cli] " << *bad << "\n"; return 3; }

  std::signal(SIGINT, on_sigint);

  int rc = 0;
  for (const auto& f : cli.files) {
    int r = (cli.kind == "order")
        ? scan_one_file<rs::OrderLineParser>(f, cli, rs::order_line_layout())
        : scan_one_file<rs::PersonParser>(f, cli, rs::person_layout());
    if (r > rc) rc = r;
    if (r == 2) break;
  }
  return rc;
}
