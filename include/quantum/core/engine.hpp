#pragma once
#include <quantum/core/backend.hpp>
#include <quantum/core/config.hpp>
#include <quantum/core/cycle_future.hpp>
#include <quantum/core/history.hpp>
#include <quantum/core/job_queue.hpp>
#include <quantum/core/joinable.hpp>
#include <quantum/core/log.hpp>
#include <quantum/core/state_subject.hpp>
#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

namespace quantum {

enum class lifecycle_phase {
  active,          // accepting reducers and actions
  force_stopping,  // quit(): queued work is dropped
  draining,        // quit_safely(): one last cycle runs everything queued
  stopped          // terminal
};

inline const char* to_string(lifecycle_phase p) noexcept {
  switch (p) {
    case lifecycle_phase::active:         return "active";
    case lifecycle_phase::force_stopping: return "force_stopping";
    case lifecycle_phase::draining:       return "draining";
    case lifecycle_phase::stopped:        return "stopped";
  }
  return "unknown";
}

// The state actor. Owns the state and applies queued reducers and actions
// one cycle at a time, on whatever context its backend runs step() in.
//
// One cycle:
//   snapshot -> take the queued reducers and actions -> apply reducers (history)
//   -> run actions on the result -> publish if the state changed -> complete actions
//
// T must be copyable and equality comparable.
template <class T>
class engine final : public cycle_host, public std::enable_shared_from_this<engine<T>> {
public:
  using reducer = typename job_queue<T>::reducer;
  using action  = typename job_queue<T>::action;

  engine(T initial, threading th)
    : engine(std::move(initial), th, make_backend(th)) {}

  // Runs on the given backend instead of the one `th` selects; `th` still
  // decides listener delivery.
  engine(T initial, threading th, std::unique_ptr<backend> b)
    : threading_(std::move(th))
    , state_(std::move(initial))
    , subject_(threading_.callback ? threading_.callback
                                   : threading::borrow(default_callback_executor()))
    , backend_(std::move(b)) {
    if (!backend_) throw std::invalid_argument("quantum: null backend");
  }

  // Pending futures never hang, even if the backend never ran the final step.
  ~engine() override {
    std::lock_guard<std::mutex> lock(m_);
    auto reducers = queue_.take_reducers();
    auto actions = queue_.take_actions();
    discard_from(reducers, 0);
    discard_from(actions, 0);
  }

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  // Publishes the initial state, then hands the engine to its backend.
  // Must be called once, on an engine owned by a shared_ptr.
  void start() {
    subject_.publish(state_);
    logger()->debug("quantum: store started on {} backend", backend_->name());
    backend_->start(this->shared_from_this());
  }

  cycle_future set_state(reducer f) {
    if (!f) throw std::invalid_argument("quantum: empty reducer");
    cycle_future fut;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (phase_ != lifecycle_phase::active) return reject("reducer");
      fut = queue_.push_reducer(std::move(f));
    }
    backend_->wake();
    return fut;
  }

  cycle_future with_state(action f) {
    if (!f) throw std::invalid_argument("quantum: empty action");
    cycle_future fut;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (phase_ != lifecycle_phase::active) return reject("action");
      fut = queue_.push_action(std::move(f));
    }
    backend_->wake();
    return fut;
  }

  // Stop now. Queued reducers and actions are discarded; the one being
  // applied finishes. Also upgrades a pending quit_safely().
  joinable quit() {
    bool changed = false;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (phase_ == lifecycle_phase::active || phase_ == lifecycle_phase::draining) {
        phase_ = lifecycle_phase::force_stopping;
        changed = true;
      }
    }
    if (changed) {
      running_.store(false, std::memory_order_release);
      logger()->debug("quantum: quit requested, pending work is discarded");
      backend_->wake();
    }
    return quit_.handle();
  }

  // Stop after exactly one more cycle, which runs everything queued so far.
  // Submissions made after this call are rejected.
  joinable quit_safely() {
    bool changed = false;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (phase_ == lifecycle_phase::active) {
        phase_ = lifecycle_phase::draining;
        stopping_.store(true, std::memory_order_release);
        changed = true;
      }
    }
    if (changed) {
      logger()->debug("quantum: quit_safely requested, draining");
      backend_->wake();
    }
    return quit_.handle();
  }

  // cycle_host

  bool step() override {
    std::unique_lock<std::mutex> permit(cycle_m_, std::try_to_lock);
    // re-entered from user code through an inline executor: the running cycle
    // (or the next one its backend schedules) picks the work up
    if (!permit.owns_lock()) return !finished_.load(std::memory_order_acquire);
    if (finished_.load(std::memory_order_acquire)) return false;

    if (running_.load(std::memory_order_acquire)) {
      const bool last = stopping_.load(std::memory_order_acquire);
      cycle();
      if (last) running_.store(false, std::memory_order_release);
    }
    if (running_.load(std::memory_order_acquire)) return true;

    finish(nullptr);
    return false;
  }

  bool has_pending() const override {
    if (finished_.load(std::memory_order_acquire)) return false;
    if (!running_.load(std::memory_order_acquire) || stopping_.load(std::memory_order_acquire))
      return true;
    std::lock_guard<std::mutex> lock(m_);
    return !queue_.empty();
  }

  void fail(std::exception_ptr e) override {
    std::lock_guard<std::mutex> permit(cycle_m_);
    if (finished_.load(std::memory_order_acquire)) return;
    logger()->error("quantum: user code threw inside a cycle, store stopped: {}", describe(e));
    {
      std::lock_guard<std::mutex> lock(m_);
      fault_ = e;
      phase_ = lifecycle_phase::force_stopping;
    }
    running_.store(false, std::memory_order_release);
    if (current_) {
      current_->discard(e);
      current_ = nullptr;
    }
    // actions that ran before the fault did complete
    for (std::size_t i = 0; i < invoked_ && i < actions_.size(); ++i) actions_[i].done.complete();
    invoked_ = 0;
    finish(e);
  }

  // observers

  state_subject<T>& subject() noexcept { return subject_; }

  ::quantum::history<T>& history() noexcept { return history_; }

  lifecycle_phase phase() const {
    std::lock_guard<std::mutex> lock(m_);
    return phase_;
  }

  bool is_running() const noexcept { return running_.load(std::memory_order_acquire); }

  std::exception_ptr fault() const {
    std::lock_guard<std::mutex> lock(m_);
    return fault_;
  }

  const threading& threading_option() const noexcept { return threading_; }

  joinable quit_handle() const { return quit_.handle(); }

private:
  cycle_future reject(const char* what) {
    logger()->trace("quantum: {} rejected, store is {}", what, to_string(phase_));
    return discarded_future();
  }

  // Called with the cycle permit held.
  void cycle() {
    const T previous = state_;
    {
      // one critical section: actions see every reducer queued before them,
      // and anything queued from now on waits for the next cycle
      std::lock_guard<std::mutex> lock(m_);
      reducers_ = queue_.take_reducers();
      actions_ = queue_.take_actions();
    }

    std::size_t applied = 0;
    for (; applied < reducers_.size(); ++applied) {
      if (!running_.load(std::memory_order_acquire)) break;
      auto& job = reducers_[applied];
      current_ = &job.done;
      state_ = job.fn(state_);
      current_ = nullptr;
      history_.push(state_);
      job.done.complete();
    }
    discard_from(reducers_, applied);
    reducers_.clear();

    invoked_ = 0;
    for (; invoked_ < actions_.size(); ++invoked_) {
      if (!running_.load(std::memory_order_acquire)) break;
      auto& job = actions_[invoked_];
      current_ = &job.done;
      job.fn(state_);
      current_ = nullptr;
    }
    discard_from(actions_, invoked_);

    // reducers may return their input unchanged to signal a no-op
    if (!(state_ == previous)) subject_.publish(state_);

    for (std::size_t i = 0; i < invoked_; ++i) actions_[i].done.complete();
    actions_.clear();
    invoked_ = 0;
  }

  // Terminal transition, once, with the cycle permit held.
  void finish(std::exception_ptr e) {
    finished_.store(true, std::memory_order_release);
    std::vector<typename job_queue<T>::reducer_job> reducers;
    std::vector<typename job_queue<T>::action_job> actions;
    {
      std::lock_guard<std::mutex> lock(m_);
      phase_ = lifecycle_phase::stopped;
      reducers = queue_.take_reducers();
      actions = queue_.take_actions();
    }
    // leftovers of an interrupted cycle, then everything still queued
    discard_from(reducers_, 0);
    discard_from(actions_, 0);
    reducers_.clear();
    actions_.clear();
    discard_from(reducers, 0);
    discard_from(actions, 0);
    if (!reducers.empty() || !actions.empty())
      logger()->debug("quantum: discarded {} reducers and {} actions at quit",
                      reducers.size(), actions.size());

    subject_.publish_quitted();

    joinable torn_down;
    try {
      torn_down = backend_->teardown();
    } catch (const std::exception& ex) {
      logger()->error("quantum: {} backend teardown failed: {}", backend_->name(), ex.what());
      torn_down = joinable::failed(std::current_exception());
    }
    auto done = quit_;
    torn_down.then([done, e](std::exception_ptr teardown_error) mutable {
      done.complete(e ? e : teardown_error);
    });
    logger()->debug("quantum: store stopped");
  }

  const threading threading_;

  // owned by the cycle: touched only with cycle_m_ held
  T state_;
  std::vector<typename job_queue<T>::reducer_job> reducers_;
  std::vector<typename job_queue<T>::action_job> actions_;
  cycle_promise* current_{nullptr};
  std::size_t invoked_{0};
  std::mutex cycle_m_;

  // shared with submitters: guarded by m_
  mutable std::mutex m_;
  job_queue<T> queue_;
  lifecycle_phase phase_{lifecycle_phase::active};
  std::exception_ptr fault_{};

  std::atomic<bool> running_{true};
  std::atomic<bool> stopping_{false};
  std::atomic<bool> finished_{false};

  ::quantum::history<T> history_;
  state_subject<T> subject_;
  join_signal quit_;
  std::unique_ptr<backend> backend_;
};

} // namespace quantum
