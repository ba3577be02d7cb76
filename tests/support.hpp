#pragma once
#include <quantum/quantum.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Shared bits of the store tests.
namespace test {

struct test_state {
  int revision{0};
  int payload{0};

  bool operator==(const test_state& o) const {
    return revision == o.revision && payload == o.payload;
  }
};

// Collects published states; readable from the test thread at any time.
template <class T>
class recorder {
public:
  void push(const T& v) {
    {
      std::lock_guard<std::mutex> lock(m_);
      states_.push_back(v);
    }
    cv_.notify_all();
  }

  auto listener() {
    return [this](const T& v){ push(v); };
  }

  std::vector<T> states() const {
    std::lock_guard<std::mutex> lock(m_);
    return states_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(m_);
    return states_.size();
  }

  bool wait_for_size(std::size_t n, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    std::unique_lock<std::mutex> lock(m_);
    return cv_.wait_for(lock, timeout, [&]{ return states_.size() >= n; });
  }

private:
  mutable std::mutex m_;
  std::condition_variable cv_;
  std::vector<T> states_;
};

// A cooperative host loop: a strand drained by its own thread.
class strand_host {
public:
  strand_host() : worker_([this]{
    while (running_.load(std::memory_order_acquire)) {
      if (loop_.drain() == 0) std::this_thread::sleep_for(std::chrono::microseconds(100));
    }
    loop_.drain();
  }) {}

  ~strand_host() {
    running_.store(false, std::memory_order_release);
    worker_.join();
  }

  quantum::executor& exec() { return loop_; }

private:
  quantum::strand loop_;
  std::atomic<bool> running_{true};
  std::thread worker_;
};

inline quantum::threading delivered_on(quantum::threading th, quantum::executor& ex) {
  th.deliver_on(ex);
  return th;
}

// Runs fn(name, threading) once per backend. Borrowed executors live for the call.
template <class Fn>
void for_each_backend(Fn&& fn, bool include_sync = true) {
  fn(std::string("thread"), quantum::threading::thread());
  fn(std::string("shared-pool"), quantum::threading::pool());
  fn(std::string("owned-pool"), quantum::threading::pool(3));
  {
    quantum::thread_pool custom{4};
    fn(std::string("custom"), quantum::threading::custom(custom));
  }
  if (include_sync) fn(std::string("sync"), quantum::threading::sync());
  {
    strand_host host;
    fn(std::string("cooperative"), quantum::threading::cooperative(host.exec()));
  }
}

} // namespace test
