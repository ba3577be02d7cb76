#pragma once
#include <quantum/core/signal.hpp>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <utility>

namespace quantum {

enum class cycle_status {
  pending,    // queued, not executed yet
  completed,  // the reducer/action ran to completion
  discarded   // it will never run (quit, rejected submission, fault)
};

// Returned for every submitted reducer or action.
// Copyable: all copies observe the same job.
class cycle_future {
public:
  using state_ptr = std::shared_ptr<detail::signal_state<cycle_status>>;

  // An empty future behaves like a discarded one.
  cycle_future() = default;
  explicit cycle_future(state_ptr st) noexcept : st_(std::move(st)) {}

  cycle_status status() const {
    return st_ ? st_->status() : cycle_status::discarded;
  }

  bool done() const { return status() != cycle_status::pending; }
  bool completed() const { return status() == cycle_status::completed; }
  bool discarded() const { return status() == cycle_status::discarded; }

  // Blocks until the job ran or was dropped.
  cycle_status wait() const {
    return st_ ? st_->wait() : cycle_status::discarded;
  }

  // Returns cycle_status::pending on timeout.
  template <class Rep, class Period>
  cycle_status wait_for(std::chrono::duration<Rep, Period> d) const {
    return st_ ? st_->wait_for(d) : cycle_status::discarded;
  }

  // Set when the job was dropped because user code faulted.
  std::exception_ptr error() const {
    return st_ ? st_->error() : nullptr;
  }

  // Asynchronous join: fn runs on the thread that resolves the job
  // (usually the store's worker), or immediately if already resolved.
  void then(std::function<void(cycle_status)> fn) const {
    if (!st_) { if (fn) fn(cycle_status::discarded); return; }
    st_->on_resolved([fn = std::move(fn)](cycle_status s, std::exception_ptr) {
      if (fn) fn(s);
    });
  }

private:
  state_ptr st_{};
};

// Producer side, owned by the job queue entry.
class cycle_promise {
public:
  cycle_promise() : st_(std::make_shared<detail::signal_state<cycle_status>>()) {}

  cycle_future future() const { return cycle_future(st_); }

  void complete() { st_->resolve(cycle_status::completed); }
  void discard(std::exception_ptr e = nullptr) { st_->resolve(cycle_status::discarded, e); }

private:
  cycle_future::state_ptr st_;
};

inline cycle_future discarded_future() {
  cycle_promise p;
  p.discard();
  return p.future();
}

} // namespace quantum
