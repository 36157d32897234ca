#pragma once
#include <atomic>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include "record_stream/cancellation.hpp"
#include "record_stream/events.hpp"
#include "record_stream/parser_config.hpp"
#include "record_stream/session_registry.hpp"
#include "record_stream/stream_engine.hpp"

namespace rs {

// Push side of a live connection. Called from worker threads, possibly for
// several sessions at once, so implementations must be thread-safe.
template <class T>
class EventSink {
public:
  virtual ~EventSink() = default;
  virtual void send(const std::string& session, const ParserEvent<T>& ev) = 0;
};

enum class StartResult { Started, Replaced, Rejected };

// Runs one parse per session on its own thread and forwards every event to
// the sink. Delivery failures are logged and dropped; they never reach the
// engine.
template <class Parser>
class ParseService {
public:
  using record_type = typename Parser::record_type;
  using Event       = ParserEvent<record_type>;
  using Sink        = EventSink<record_type>;

  explicit ParseService(Sink& sink, Parser parser = Parser{},
                        const FileSystem& fs = LocalFileSystem::instance())
    : engine_(std::move(parser), fs), sink_(&sink) {}

  ~ParseService() {
    registry_.cancel_all();
    wait_idle();
  }

  ParseService(const ParseService&) = delete;
  ParseService& operator=(const ParseService&) = delete;

  StartResult start(const std::string& session, const std::string& path, const ParserConfig& cfg) {
    if (auto bad = cfg.validate()) {
      std::cerr << "[session] " << session << " rejected: " << *bad << "\n";
      ErrorEvent e;
      e.message = *bad;
      e.line_number = 0;
      e.cause = ErrorCause::InvalidValue;
      deliver(session, nullptr, Event(std::move(e)));
      return StartResult::Rejected;
    }

    CancellationSource src;
    const bool replaced = registry_.register_session(session, src);
    if (replaced) std::cerr << "[session] " << session << " cancelled previous run\n";

    std::lock_guard<std::mutex> lk(workers_mu_);
    reap_finished();
    auto done = std::make_shared<std::atomic<bool>>(false);
    workers_.push_back(Worker{
      std::thread([this, session, path, cfg, src, done]{
        run(session, path, cfg, src);
        done->store(true, std::memory_order_release);
      }),
      done});
    return replaced ? StartResult::Replaced : StartResult::Started;
  }

  // Never throws; false if the session had no active run.
  bool stop(const std::string& session) {
    if (registry_.cancel(session)) {
      std::cerr << "[session] " << session << " stop requested\n";
      return true;
    }
    std::cerr << "[session] " << session << " has no active run\n";
    return false;
  }

  // Connection went away: cancel and forget.
  void disconnect(const std::string& session) {
    registry_.cancel(session);
    registry_.remove(session);
    std::cerr << "[session] " << session << " disconnected\n";
  }

  bool active(const std::string& session) const { return registry_.contains(session); }
  std::size_t active_count() const { return registry_.size(); }

  // Joins every worker started so far.
  void wait_idle() {
    std::vector<Worker> ws;
    {
      std::lock_guard<std::mutex> lk(workers_mu_);
      ws.swap(workers_);
    }
    for (auto& w : ws) if (w.thread.joinable()) w.thread.join();
  }

  // Threads not yet joined; finished ones are reaped on the next start().
  std::size_t worker_count() const {
    std::lock_guard<std::mutex> lk(workers_mu_);
    return workers_.size();
  }

private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  // Caller holds workers_mu_.
  void reap_finished() {
    for (auto it = workers_.begin(); it != workers_.end();) {
      if (it->done->load(std::memory_order_acquire)) {
        if (it->thread.joinable()) it->thread.join();
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }
  }

  void run(const std::string& session, const std::string& path,
           const ParserConfig& cfg, const CancellationSource& src) {
    try {
      engine_.parse(path, src.token(), cfg, [&](Event&& ev){ deliver(session, &src, std::move(ev)); });
    } catch (const std::exception& ex) {
      std::cerr << "[session] " << session << " run failed: " << ex.what() << "\n";
    }
    registry_.remove_if_same(session, src);
  }

  void deliver(const std::string& session, const CancellationSource* src, Event&& ev) {
    // once a stop is requested only the terminal event may still go out
    if (src && src->is_cancellation_requested() && !is_terminal(ev)) return;
    try {
      sink_->send(session, ev);
    } catch (const std::exception& ex) {
      std::cerr << "[session] " << session << " delivery of " << event_name(ev)
                << " failed: " << ex.what() << "\n";
    }
  }

  StreamEngine<Parser> engine_;
  Sink* sink_;
  SessionRegistry registry_;
  mutable std::mutex workers_mu_;
  std::vector<Worker> workers_;
};

}
