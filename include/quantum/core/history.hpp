#pragma once
#include <atomic>
#include <cstddef>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace quantum {

// Every state produced by a reducer, in order, including states that were
// never published (several reducers in one cycle, no-op reducers).
// Debugging aid only: do not diff published states against it.
//
// Written by the store's engine only; readable from any thread.
// Disabled by default, and push() is free while disabled.
template <class T>
class history {
public:
  history() = default;
  history(const history&) = delete;
  history& operator=(const history&) = delete;

  void enable(bool on = true) noexcept { enabled_.store(on, std::memory_order_release); }
  void disable() noexcept { enable(false); }
  bool enabled() const noexcept { return enabled_.load(std::memory_order_acquire); }

  void push(const T& state) {
    if (!enabled()) return;
    std::unique_lock<std::shared_mutex> lock(m_);
    entries_.push_back(state);
  }

  // Snapshot copy, oldest first.
  std::vector<T> read() const {
    std::shared_lock<std::shared_mutex> lock(m_);
    return entries_;
  }

  std::size_t size() const {
    std::shared_lock<std::shared_mutex> lock(m_);
    return entries_.size();
  }

  void clear() {
    std::unique_lock<std::shared_mutex> lock(m_);
    entries_.clear();
  }

private:
  mutable std::shared_mutex m_;
  std::vector<T> entries_;
  std::atomic<bool> enabled_{false};
};

} // namespace quantum
