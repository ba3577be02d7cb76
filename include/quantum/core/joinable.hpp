#pragma once
#include <quantum/core/signal.hpp>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <utility>

namespace quantum {

namespace detail {
enum class join_status { pending, ready };
}

// Handle returned by quit()/quit_safely() and by executors that can be shut down.
// Becomes ready once the resource behind it is fully torn down.
class joinable {
public:
  using state_ptr = std::shared_ptr<detail::signal_state<detail::join_status>>;

  joinable() : st_(std::make_shared<detail::signal_state<detail::join_status>>()) {}
  explicit joinable(state_ptr st) noexcept : st_(std::move(st)) {}

  static joinable ready_now() {
    joinable j;
    j.st_->resolve(detail::join_status::ready);
    return j;
  }

  static joinable failed(std::exception_ptr e) {
    joinable j;
    j.st_->resolve(detail::join_status::ready, e);
    return j;
  }

  bool ready() const { return st_->status() == detail::join_status::ready; }

  // Blocks; rethrows a teardown (or fault) error if one was recorded.
  void join() const {
    st_->wait();
    if (auto e = st_->error()) std::rethrow_exception(e);
  }

  // Returns false on timeout. Does not throw.
  template <class Rep, class Period>
  bool join_for(std::chrono::duration<Rep, Period> d) const {
    return st_->wait_for(d) == detail::join_status::ready;
  }

  std::exception_ptr error() const { return st_->error(); }

  // fn(error) runs on the thread that completes the teardown, or right away.
  void then(std::function<void(std::exception_ptr)> fn) const {
    st_->on_resolved([fn = std::move(fn)](detail::join_status, std::exception_ptr e) {
      if (fn) fn(e);
    });
  }

private:
  state_ptr st_;
};

// Producer side of a joinable.
class join_signal {
public:
  joinable handle() const { return joinable(st_); }

  // Returns false when already completed.
  bool complete(std::exception_ptr e = nullptr) {
    return st_->resolve(detail::join_status::ready, e);
  }

private:
  joinable::state_ptr st_ = std::make_shared<detail::signal_state<detail::join_status>>();
};

} // namespace quantum
