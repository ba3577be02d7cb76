#pragma once
#include <cstddef>
#include <functional>
#include <queue>
#include <mutex>

namespace quantum {

// Basic executor interface
struct executor {
  virtual ~executor() = default;
  virtual void post(std::function<void()> f) = 0;
};

// Synchronous: executes immediately on the posting thread
struct inline_executor final : executor {
  void post(std::function<void()> f) override { f(); }
};

// Sequential queue (no separate thread, executed by drain())
// This is the host loop of a cooperative store: the owner calls drain()
// from the one thread that is allowed to touch the state.
class strand final : public executor {
public:
  void post(std::function<void()> f) override {
    std::lock_guard<std::mutex> lock(m_);
    q_.push(std::move(f));
  }

  // Explicit task drainage (call from the required thread, for example, the UI thread).
  // Tasks posted while draining are run in the same call. Returns the number of tasks run.
  std::size_t drain() {
    std::size_t ran = 0;
    for (;;) {
      std::function<void()> f;
      {
        std::lock_guard<std::mutex> lock(m_);
        if (q_.empty()) break;
        f = std::move(q_.front()); q_.pop();
      }
      f();
      ++ran;
    }
    return ran;
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(m_);
    return q_.empty();
  }

private:
  mutable std::mutex m_;
  std::queue<std::function<void()>> q_;
};

} // namespace quantum
