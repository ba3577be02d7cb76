#pragma once
#include <quantum/core/scheduler.hpp>
#include <quantum/core/joinable.hpp>
#include <condition_variable>
#include <queue>
#include <thread>
#include <vector>
#include <memory>
#include <mutex>
#include <functional>
#include <atomic>

namespace quantum {

class thread_pool final : public executor {
public:
  explicit thread_pool(std::size_t threads = std::thread::hardware_concurrency())
  : st_(std::make_shared<state>()) {
    if (threads == 0) threads = 1;
    st_->alive = threads;
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
      // workers share the queue by shared_ptr: a detached worker may outlive the pool object
      workers_.emplace_back([st = st_]{
        for (;;) {
          std::function<void()> task;
          {
            std::unique_lock<std::mutex> lock(st->m);
            st->cv.wait(lock, [&]{ return st->stop || !st->q.empty(); });
            if (st->stop && st->q.empty()) break;
            task = std::move(st->q.front());
            st->q.pop();
          }
          task();
        }
        // the last worker out reports the teardown
        if (st->alive.fetch_sub(1, std::memory_order_acq_rel) == 1) st->exited.complete();
      });
    }
  }

  // Drains the queue and joins the workers. A pool destroyed from one of its
  // own workers (its last owner released there) detaches that worker instead.
  ~thread_pool() override {
    quit();
    const auto self = std::this_thread::get_id();
    for (auto& t : workers_) {
      if (!t.joinable()) continue;
      if (t.get_id() == self) t.detach();
      else t.join();
    }
  }

  void post(std::function<void()> f) override {
    {
      std::lock_guard<std::mutex> lock(st_->m);
      st_->q.push(std::move(f));
    }
    st_->cv.notify_one();
  }

  // Asks the workers to finish the queued tasks and exit. Idempotent.
  // The handle is ready once every worker has left its loop.
  joinable quit() {
    {
      std::lock_guard<std::mutex> lock(st_->m);
      st_->stop = true;
    }
    st_->cv.notify_all();
    return st_->exited.handle();
  }

  thread_pool(const thread_pool&) = delete;
  thread_pool& operator=(const thread_pool&) = delete;

private:
  struct state {
    std::mutex m;
    std::condition_variable cv;
    std::queue<std::function<void()>> q;
    bool stop{false};
    std::atomic<std::size_t> alive{0};
    join_signal exited;
  };

  std::shared_ptr<state> st_;
  std::vector<std::thread> workers_;
};

} // namespace quantum
