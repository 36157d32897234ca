#pragma once
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "record_stream/cancellation.hpp"

namespace rs {

// Tracks (session -> cancellation source) so each session has at most one
// active parse run. Engines only ever see tokens, never this map.
class SessionRegistry {
public:
  // Installs `src` for `session`. A run already registered under the same
  // session is cancelled first. Returns true if one was cancelled.
  bool register_session(std::string session, CancellationSource src);

  // Requests cancellation; false if the session has no run.
  bool cancel(std::string_view session);

  // Drops the entry without cancelling it.
  bool remove(std::string_view session);

  // Drops the entry only while it still belongs to `src`, so a finished run
  // cannot evict the run that replaced it.
  bool remove_if_same(std::string_view session, const CancellationSource& src);

  // Cancels every run and clears the map.
  void cancel_all();

  bool contains(std::string_view session) const;
  std::size_t size() const;

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, CancellationSource> map_;
};

}
