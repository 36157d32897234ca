#pragma once
#include <atomic>
#include <memory>
#include <utility>

namespace rs {

// Read-only view of a cancellation flag. Cheap to copy; pass by value.
// A default-constructed token can never be cancelled.
class CancellationToken {
public:
  CancellationToken() = default;

  bool is_cancellation_requested() const noexcept {
    return flag_ && flag_->load(std::memory_order_acquire);
  }
  bool can_be_cancelled() const noexcept { return static_cast<bool>(flag_); }

private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> f) : flag_(std::move(f)) {}
  std::shared_ptr<const std::atomic<bool>> flag_;
};

// Owner side of the flag; held by whoever may request a stop.
class CancellationSource {
public:
  CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() noexcept { flag_->store(true, std::memory_order_release); }
  bool is_cancellation_requested() const noexcept { return flag_->load(std::memory_order_acquire); }

  CancellationToken token() const { return CancellationToken(flag_); }

  // Two sources are the same if they share the flag.
  bool same_as(const CancellationSource& o) const noexcept { return flag_ == o.flag_; }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

}
