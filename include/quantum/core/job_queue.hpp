#pragma once
#include <quantum/core/cycle_future.hpp>
#include <cstddef>
#include <exception>
#include <functional>
#include <utility>
#include <vector>

namespace quantum {

// Pending reducers and actions of one store, FIFO each.
// NOT thread-safe: the owning engine calls every member with its lock held
// and takes whole batches out, so user code never runs under that lock.
template <class T>
class job_queue {
public:
  using reducer = std::function<T(const T&)>;
  using action  = std::function<void(const T&)>;

  template <class Fn>
  struct job {
    Fn fn;
    cycle_promise done;
  };

  using reducer_job = job<reducer>;
  using action_job  = job<action>;

  cycle_future push_reducer(reducer f) {
    reducers_.push_back(reducer_job{std::move(f), cycle_promise{}});
    return reducers_.back().done.future();
  }

  cycle_future push_action(action f) {
    actions_.push_back(action_job{std::move(f), cycle_promise{}});
    return actions_.back().done.future();
  }

  // Detach and clear.
  std::vector<reducer_job> take_reducers() { return std::exchange(reducers_, {}); }
  std::vector<action_job>  take_actions()  { return std::exchange(actions_, {}); }

  bool empty() const noexcept { return reducers_.empty() && actions_.empty(); }

private:
  std::vector<reducer_job> reducers_;
  std::vector<action_job>  actions_;
};

// Resolves every job from `first` on as discarded. Jobs already completed stay completed.
template <class Job>
void discard_from(std::vector<Job>& jobs, std::size_t first, std::exception_ptr e = nullptr) {
  for (std::size_t i = first; i < jobs.size(); ++i) jobs[i].done.discard(e);
}

} // namespace quantum
