#pragma once
#include <quantum/core/scheduler.hpp>
#include <quantum/core/thread_pool.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

namespace quantum {

enum class threading_kind {
  thread,       // dedicated worker thread with a wait/notify loop
  pool,         // shared process-wide pool, or a pool owned by the store
  custom,       // caller-supplied executor, never torn down by the store
  sync,         // cycles run inline on the submitting thread
  cooperative   // one posted cycle per submission on a serializing host executor
};

// How a store runs its cycles and where it delivers state to listeners.
// Copy it from store::threading_option() to build sibling stores the same way.
struct threading {
  threading_kind kind{threading_kind::pool};

  // custom / cooperative: where cycles are posted
  std::shared_ptr<executor> exec{};

  // pool: 0 -> shared pool, otherwise a dedicated pool of that many workers
  std::size_t pool_threads{0};

  // listener delivery; empty -> default_callback_executor()
  std::shared_ptr<executor> callback{};

  static threading thread() { return with_kind(threading_kind::thread); }

  static threading pool(std::size_t dedicated_threads = 0) {
    auto t = with_kind(threading_kind::pool);
    t.pool_threads = dedicated_threads;
    return t;
  }

  // IMPORTANT: ex must outlive the store!
  static threading custom(executor& ex) {
    auto t = with_kind(threading_kind::custom);
    t.exec = borrow(ex);
    return t;
  }

  static threading custom(std::shared_ptr<executor> ex) {
    if (!ex) throw std::invalid_argument("quantum::threading::custom: null executor");
    auto t = with_kind(threading_kind::custom);
    t.exec = std::move(ex);
    return t;
  }

  static threading sync() { return with_kind(threading_kind::sync); }

  // ex must not run posted tasks inline (use a strand or an event loop).
  // IMPORTANT: ex must outlive the store!
  static threading cooperative(executor& ex) {
    auto t = with_kind(threading_kind::cooperative);
    t.exec = borrow(ex);
    return t;
  }

  static threading cooperative(std::shared_ptr<executor> ex) {
    if (!ex) throw std::invalid_argument("quantum::threading::cooperative: null executor");
    auto t = with_kind(threading_kind::cooperative);
    t.exec = std::move(ex);
    return t;
  }

  // IMPORTANT: ex must outlive the store!
  threading& deliver_on(executor& ex) {
    callback = borrow(ex);
    return *this;
  }

  threading& deliver_on(std::shared_ptr<executor> ex) {
    callback = std::move(ex);
    return *this;
  }

  // Non-owning shared_ptr (aliasing an empty control block).
  static std::shared_ptr<executor> borrow(executor& ex) {
    return std::shared_ptr<executor>(std::shared_ptr<executor>{}, &ex);
  }

private:
  static threading with_kind(threading_kind k) {
    threading t;
    t.kind = k;
    return t;
  }
};

// Process-wide defaults, read when a store is constructed.
struct settings {
  threading default_threading{};

  // Size of shared_pool(); only honoured before its first use.
  std::size_t shared_pool_threads{std::thread::hardware_concurrency()};
};

namespace detail {
inline std::mutex& settings_mutex() {
  static std::mutex m;
  return m;
}

inline settings& settings_instance() {
  static settings s;
  return s;
}
} // namespace detail

inline void configure(const std::function<void(settings&)>& fn) {
  std::lock_guard<std::mutex> lock(detail::settings_mutex());
  if (fn) fn(detail::settings_instance());
}

inline settings current_settings() {
  std::lock_guard<std::mutex> lock(detail::settings_mutex());
  return detail::settings_instance();
}

inline threading default_threading() {
  return current_settings().default_threading;
}

// Pool behind threading::pool() without dedicated threads. Stores never tear it down.
inline executor& shared_pool() {
  static thread_pool pool{current_settings().shared_pool_threads};
  return pool;
}

// Single worker, so listeners see states in publish order, off the store's own thread.
inline executor& default_callback_executor() {
  static thread_pool callbacks{1};
  return callbacks;
}

} // namespace quantum
