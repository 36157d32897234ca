#include "record_stream/session_registry.hpp"

namespace rs {

bool SessionRegistry::register_session(std::string session, CancellationSource src) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = map_.find(session);
  if (it != map_.end()) {
    it->second.cancel();
    it->second = std::move(src);
    return true;
  }
  map_.emplace(std::move(session), std::move(src));
  return false;
}

bool SessionRegistry::cancel(std::string_view session) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = map_.find(std::string(session));
  if (it == map_.end()) return false;
  it->second.cancel();
  return true;
}

bool SessionRegistry::remove(std::string_view session) {
  std::lock_guard<std::mutex> lk(mu_);
  return map_.erase(std::string(session)) > 0;
}

bool SessionRegistry::remove_if_same(std::string_view session, const CancellationSource& src) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = map_.find(std::string(session));
  if (it == map_.end() || !it->second.same_as(src)) return false;
  map_.erase(it);
  return true;
}

void SessionRegistry::cancel_all() {
  std::lock_guard<std::mutex> lk(mu_);
  for (auto& kv : map_) kv.second.cancel();
  map_.clear();
}

bool SessionRegistry::contains(std::string_view session) const {
  std::lock_guard<std::mutex> lk(mu_);
  return map_.find(std::string(session)) != map_.end();
}

std::size_t SessionRegistry::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return map_.size();
}

}
