#include "record_stream/parse_service.hpp"
#include "record_stream/people_gen.hpp"
#include "record_stream/person.hpp"
#include "../support/test_support.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using Event = rs::ParserEvent<rs::Person>;

class RecordingSink : public rs::EventSink<rs::Person> {
public:
  void send(const std::string& session, const Event& ev) override {
    if (delay.count() > 0) std::this_thread::sleep_for(delay);
    if (throw_on_batch && std::holds_alternative<rs::BatchParsed<rs::Person>>(ev))
      throw std::runtime_error("client disconnected");
    std::lock_guard<std::mutex> lk(mu);
    by_session[session].push_back(ev);
  }

  std::vector<Event> events(const std::string& session) {
    std::lock_guard<std::mutex> lk(mu);
    return by_session[session];
  }

  std::size_t count(const std::string& session) {
    std::lock_guard<std::mutex> lk(mu);
    return by_session[session].size();
  }

  std::chrono::microseconds delay{0};
  bool throw_on_batch = false;

private:
  std::mutex mu;
  std::map<std::string, std::vector<Event>> by_session;
};

// Stops its own session when an event of kind `Stop` arrives.
template <class Stop>
class StoppingSink : public RecordingSink {
public:
  void send(const std::string& session, const Event& ev) override {
    RecordingSink::send(session, ev);
    if (svc && std::holds_alternative<Stop>(ev)) svc->stop(session);
  }
  rs::ParseService<rs::PersonParser>* svc = nullptr;
};

int main(){
  rs_test::Checker check("parse_service");

  rs::PeopleGenConfig g;
  g.lines = 20000;
  const std::string big = (rs_test::fs::temp_directory_path() / "rs_test_service_people.csv").string();
  std::string err;
  if (!rs::generate_people_file(big, g, &err)) { std::cerr << "[ERR] " << err << "\n"; return 2; }
  const std::string small = rs_test::write_temp("service_small.csv", "Ann,Lee,1990-01-01\nBad,Line\nBob,Kim,1985-05-05\n");

  rs::ParserConfig cfg;
  cfg.batch_size = 10;
  cfg.buffer_size_bytes = 1024;
  cfg.emit_progress_events = false;

  // plain run delivers everything and frees the session
  {
    RecordingSink sink;
    rs::ParseService<rs::PersonParser> svc(sink);
    check(svc.start("c1", small, cfg) == rs::StartResult::Started, "start");
    svc.wait_idle();
    auto t = rs_test::tally(sink.events("c1"));
    check(t.records.size() == 2 && t.errors.size() == 1 && t.completions.size() == 1, "events delivered");
    check(!svc.active("c1") && svc.active_count() == 0, "session released after completion");
  }

  // invalid configuration never starts a run
  {
    RecordingSink sink;
    rs::ParseService<rs::PersonParser> svc(sink);
    auto bad = cfg;
    bad.batch_size = 0;
    check(svc.start("c2", small, bad) == rs::StartResult::Rejected, "rejected");
    auto evs = sink.events("c2");
    auto* e = evs.size() == 1 ? std::get_if<rs::ErrorEvent>(&evs[0]) : nullptr;
    check(e && e->message == "Batch size must be between 1 and 10000", "rejection reported to sink");
    bad = cfg;
    bad.buffer_size_bytes = 512;
    check(svc.start("c2", small, bad) == rs::StartResult::Rejected, "small buffer rejected");
    check(!svc.active("c2"), "nothing registered");
  }

  // a failing sink does not stop the run
  {
    RecordingSink sink;
    sink.throw_on_batch = true;
    rs::ParseService<rs::PersonParser> svc(sink);
    svc.start("c3", small, cfg);
    svc.wait_idle();
    auto t = rs_test::tally(sink.events("c3"));
    check(t.batch_sizes.empty(), "failed deliveries dropped");
    check(t.completions.size() == 1 && t.completions[0].total_records == 2, "run still completes");
  }

  // restarting a session cancels the previous run
  {
    RecordingSink sink;
    sink.delay = std::chrono::microseconds(500);
    rs::ParseService<rs::PersonParser> svc(sink);
    check(svc.start("c4", big, cfg) == rs::StartResult::Started, "first run");
    while (sink.count("c4") < 3) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    check(svc.start("c4", small, cfg) == rs::StartResult::Replaced, "second run replaces");
    svc.wait_idle();
    auto t = rs_test::tally(sink.events("c4"));
    check(t.cancellations.size() == 1, "old run cancelled");
    check(t.completions.size() == 1 && t.completions[0].total_records == 2, "new run completes");
    check(!svc.active("c4"), "session released");
  }

  // stop request
  {
    RecordingSink sink;
    sink.delay = std::chrono::microseconds(500);
    rs::ParseService<rs::PersonParser> svc(sink);
    svc.start("c5", big, cfg);
    while (sink.count("c5") < 3) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    check(svc.stop("c5"), "stop active run");
    svc.wait_idle();
    auto evs = sink.events("c5");
    auto t = rs_test::tally(evs);
    check(t.cancellations.size() == 1 && t.completions.empty(), "stopped run ends in cancellation");
    check(!evs.empty() && std::holds_alternative<rs::Cancellation>(evs.back()), "nothing after cancellation");
    check(!svc.stop("c5"), "stop with no run");
  }

  // stop raised while the unterminated last line is delivered
  {
    auto path = rs_test::write_temp("service_stop_last.csv",
                                    "Ann,Lee,1990-01-01\nBob,Kim,1985-05-05\nBad,Line");
    StoppingSink<rs::ErrorEvent> sink;
    rs::ParseService<rs::PersonParser> svc(sink);
    sink.svc = &svc;
    svc.start("c8", path, cfg);
    svc.wait_idle();
    auto evs = sink.events("c8");
    auto t = rs_test::tally(evs);
    check(t.completions.empty(), "stop on last line: no completion");
    check(t.cancellations.size() == 1 && t.cancellations[0].records_processed_before_cancel == 2,
          "stop on last line: cancellation counts parsed records");
    check(!evs.empty() && std::holds_alternative<rs::Cancellation>(evs.back()), "stop on last line: cancellation last");
    check(t.batch_sizes.empty(), "stop on last line: pending batch not sent");
  }

  // stop raised while the final partial batch is delivered
  {
    StoppingSink<rs::BatchParsed<rs::Person>> sink;
    rs::ParseService<rs::PersonParser> svc(sink);
    sink.svc = &svc;
    svc.start("c9", small, cfg);
    svc.wait_idle();
    auto evs = sink.events("c9");
    auto t = rs_test::tally(evs);
    check(t.completions.empty() && t.cancellations.size() == 1, "stop on final batch: ends cancelled");
    std::uint64_t batched = 0;
    for (auto n : t.batch_sizes) batched += n;
    check(t.cancellations.size() == 1 && batched == t.cancellations[0].records_processed_before_cancel,
          "stop on final batch: delivered records match cancellation count");
  }

  // finished workers are joined as new runs start
  {
    RecordingSink sink;
    rs::ParseService<rs::PersonParser> svc(sink);
    const int runs = 40;
    for (int i = 0; i < runs; ++i) {
      const std::string id = "w" + std::to_string(i);
      svc.start(id, small, cfg);
      while (rs_test::tally(sink.events(id)).completions.empty() || svc.active(id))
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    check(svc.worker_count() <= 3, "worker handles stay bounded: " + std::to_string(svc.worker_count()));
    svc.wait_idle();
    check(svc.worker_count() == 0, "wait_idle joins the rest");
  }

  // disconnect and shutdown with a run in flight
  {
    RecordingSink sink;
    sink.delay = std::chrono::microseconds(500);
    {
      rs::ParseService<rs::PersonParser> svc(sink);
      svc.start("c6", big, cfg);
      svc.start("c7", big, cfg);
      svc.disconnect("c6");
      check(!svc.active("c6"), "disconnect forgets session");
    }
    auto t6 = rs_test::tally(sink.events("c6"));
    auto t7 = rs_test::tally(sink.events("c7"));
    check(t6.completions.empty() && t6.cancellations.size() == 1, "disconnected run cancelled");
    check(t7.completions.empty() && t7.cancellations.size() == 1, "destructor cancels remaining runs");
  }

  return check.finish();
}
