#pragma once
#include <quantum/core/config.hpp>
#include <quantum/core/joinable.hpp>
#include <quantum/core/scheduler.hpp>
#include <quantum/core/thread_pool.hpp>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

namespace quantum {

// What a backend drives. Implemented by engine<T>.
class cycle_host {
public:
  virtual ~cycle_host() = default;

  // Runs one cycle. Returns false once the host has stopped for good:
  // the backend must not schedule it again.
  virtual bool step() = 0;

  // Queued work, or a quit request the host has not acted on yet.
  virtual bool has_pending() const = 0;

  // User code threw out of step(). Stops the host.
  virtual void fail(std::exception_ptr e) = 0;
};

namespace detail {
// The backend's execution context: a fault ends this host, not the thread or pool.
inline bool run_cycle(cycle_host& host) {
  try {
    return host.step();
  } catch (...) {
    host.fail(std::current_exception());
    return false;
  }
}
} // namespace detail

// Execution strategy of a store. Decides where and when cycles run;
// never runs two cycles of the same host at once.
class backend {
public:
  virtual ~backend() = default;

  // Called once, after the initial state was published.
  virtual void start(std::shared_ptr<cycle_host> host) = 0;

  // New work was queued or a quit was requested. Any thread.
  virtual void wake() = 0;

  // Called once from the host's final step. Releases resources the backend
  // owns exclusively; the handle is ready when they are gone.
  virtual joinable teardown() = 0;

  virtual const char* name() const noexcept = 0;
};

// ------------------------------------------------------------------------------------
// Dedicated worker thread: cycle, then sleep until woken (drain-on-signal).
// ------------------------------------------------------------------------------------
class thread_backend final : public backend {
public:
  thread_backend() = default;
  thread_backend(const thread_backend&) = delete;
  thread_backend& operator=(const thread_backend&) = delete;

  // The worker holds its host, so the last owner may be released on the
  // worker itself; it cannot join itself then.
  ~thread_backend() override {
    if (!worker_.joinable()) return;
    if (worker_.get_id() == std::this_thread::get_id()) worker_.detach();
    else worker_.join();
  }

  void start(std::shared_ptr<cycle_host> host) override {
    worker_ = std::thread([this, host = std::move(host)]{
      while (detail::run_cycle(*host)) {
        std::unique_lock<std::mutex> lock(m_);
        cv_.wait(lock, [&]{ return signaled_; });
        signaled_ = false;
      }
      exited_.complete();
    });
  }

  void wake() override {
    {
      std::lock_guard<std::mutex> lock(m_);
      signaled_ = true;
    }
    cv_.notify_one();
  }

  joinable teardown() override { return exited_.handle(); }

  const char* name() const noexcept override { return "thread"; }

private:
  std::mutex m_;
  std::condition_variable cv_;
  bool signaled_{false};
  join_signal exited_;
  std::thread worker_;
};

// ------------------------------------------------------------------------------------
// Shared executor: at most one cycle scheduled at a time, rescheduled while work remains.
// ------------------------------------------------------------------------------------
class executor_backend final : public backend {
public:
  // Borrowed executor (shared pool, caller-supplied): never shut down here.
  // runs_inline: ex runs tasks on the posting thread, so follow-up cycles
  // loop in place instead of recursing through post().
  explicit executor_backend(std::shared_ptr<executor> ex, bool runs_inline = false)
    : ex_(std::move(ex)), inline_(runs_inline) {
    if (!ex_) throw std::invalid_argument("quantum::executor_backend: null executor");
  }

  // Dedicated pool: quit together with the store.
  explicit executor_backend(std::unique_ptr<thread_pool> owned)
    : owned_(std::move(owned)) {
    if (!owned_) throw std::invalid_argument("quantum::executor_backend: null pool");
    ex_ = threading::borrow(*owned_);
  }

  void start(std::shared_ptr<cycle_host> host) override {
    host_ = host;
    // cycles queued before start() found no host
    if (host->has_pending()) wake();
  }

  void wake() override {
    auto host = host_.lock();
    if (!host) return;
    if (!try_schedule()) return;
    ex_->post([this, host]{ drive(host); });
  }

  joinable teardown() override {
    if (!owned_) return joinable::ready_now();
    return owned_->quit();
  }

  const char* name() const noexcept override {
    if (owned_) return "owned-pool";
    return inline_ ? "sync" : "executor";
  }

private:
  bool try_schedule() {
    bool expected = false;
    return scheduled_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
  }

  void drive(const std::shared_ptr<cycle_host>& host) {
    for (;;) {
      bool alive = false;
      {
        // single permit: even a multi-worker pool runs one cycle at a time
        std::lock_guard<std::mutex> permit(permit_);
        alive = detail::run_cycle(*host);
      }
      scheduled_.store(false, std::memory_order_release);
      // a submission that raced the cycle saw scheduled_ == true and did not post
      if (!alive || !host->has_pending()) return;
      if (!try_schedule()) return;
      if (!inline_) {
        ex_->post([this, host]{ drive(host); });
        return;
      }
    }
  }

  std::unique_ptr<thread_pool> owned_;
  std::shared_ptr<executor> ex_;
  bool inline_{false};
  std::weak_ptr<cycle_host> host_;
  std::atomic<bool> scheduled_{false};
  std::mutex permit_;
};

// ------------------------------------------------------------------------------------
// Cooperative: every wake posts one cycle to a host executor that already
// serializes its tasks (a strand drained by the owner, a Qt event loop).
// ------------------------------------------------------------------------------------
class cooperative_backend final : public backend {
public:
  explicit cooperative_backend(std::shared_ptr<executor> host_exec)
    : ex_(std::move(host_exec)) {
    if (!ex_) throw std::invalid_argument("quantum::cooperative_backend: null executor");
  }

  void start(std::shared_ptr<cycle_host> host) override {
    host_ = host;
    if (host->has_pending()) wake();
  }

  void wake() override {
    auto host = host_.lock();
    if (!host) return;
    ex_->post([host]{ detail::run_cycle(*host); });
  }

  // the host loop belongs to the caller
  joinable teardown() override { return joinable::ready_now(); }

  const char* name() const noexcept override { return "cooperative"; }

private:
  std::shared_ptr<executor> ex_;
  std::weak_ptr<cycle_host> host_;
};

// Picks the backend for a threading option.
inline std::unique_ptr<backend> make_backend(const threading& th) {
  switch (th.kind) {
    case threading_kind::thread:
      return std::make_unique<thread_backend>();
    case threading_kind::pool:
      if (th.pool_threads > 0)
        return std::make_unique<executor_backend>(std::make_unique<thread_pool>(th.pool_threads));
      return std::make_unique<executor_backend>(threading::borrow(shared_pool()));
    case threading_kind::custom:
      if (!th.exec) throw std::invalid_argument("quantum: custom threading without an executor");
      return std::make_unique<executor_backend>(th.exec);
    case threading_kind::sync:
      return std::make_unique<executor_backend>(std::make_shared<inline_executor>(), true);
    case threading_kind::cooperative:
      if (!th.exec) throw std::invalid_argument("quantum: cooperative threading without an executor");
      return std::make_unique<cooperative_backend>(th.exec);
  }
  throw std::invalid_argument("quantum: unknown threading kind");
}

} // namespace quantum
