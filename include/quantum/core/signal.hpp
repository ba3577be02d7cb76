#pragma once
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace quantum {
namespace detail {

// One-shot signal shared between a producer (the engine, a backend) and the
// handles given to callers. Starts in Status::pending and is resolved at most once.
template <class Status>
class signal_state {
public:
  using callback = std::function<void(Status, std::exception_ptr)>;

  // Returns false if the signal was already resolved.
  bool resolve(Status s, std::exception_ptr e = nullptr) {
    std::vector<callback> local;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (status_ != Status::pending) return false;
      status_ = s;
      error_ = e;
      local.swap(callbacks_);
    }
    cv_.notify_all();
    for (auto& cb : local) if (cb) cb(s, e);
    return true;
  }

  Status status() const {
    std::lock_guard<std::mutex> lock(m_);
    return status_;
  }

  std::exception_ptr error() const {
    std::lock_guard<std::mutex> lock(m_);
    return error_;
  }

  Status wait() const {
    std::unique_lock<std::mutex> lock(m_);
    cv_.wait(lock, [&]{ return status_ != Status::pending; });
    return status_;
  }

  template <class Rep, class Period>
  Status wait_for(std::chrono::duration<Rep, Period> d) const {
    std::unique_lock<std::mutex> lock(m_);
    cv_.wait_for(lock, d, [&]{ return status_ != Status::pending; });
    return status_;
  }

  // Runs cb on the resolving thread, or right away if already resolved.
  void on_resolved(callback cb) {
    Status s;
    std::exception_ptr e;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (status_ == Status::pending) {
        callbacks_.push_back(std::move(cb));
        return;
      }
      s = status_;
      e = error_;
    }
    if (cb) cb(s, e);
  }

private:
  mutable std::mutex m_;
  mutable std::condition_variable cv_;
  Status status_{Status::pending};
  std::exception_ptr error_{};
  std::vector<callback> callbacks_;
};

} // namespace detail
} // namespace quantum
