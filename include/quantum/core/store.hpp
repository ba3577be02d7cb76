#pragma once
#include <quantum/core/config.hpp>
#include <quantum/core/cycle_future.hpp>
#include <quantum/core/engine.hpp>
#include <quantum/core/history.hpp>
#include <quantum/core/joinable.hpp>
#include <quantum/core/subscription.hpp>
#include <exception>
#include <functional>
#include <memory>
#include <utility>

namespace quantum {

// store<T>: single-writer state container.
//
// Any thread may queue reducers (T -> T) and actions (read-only T callbacks).
// They run one at a time, FIFO, on the store's backend; listeners receive
// every changed state in order, starting with the initial one.
//
// Move-only handle. Destroying a store that is still running quits it
// (forced, like quit()); call quit_safely() first to run the queued work.
template <class T>
class store {
public:
  using reducer  = typename engine<T>::reducer;
  using action   = typename engine<T>::action;
  using listener = typename state_subject<T>::listener;

  explicit store(T initial, threading th = default_threading())
    : engine_(std::make_shared<engine<T>>(std::move(initial), std::move(th))) {
    engine_->start();
  }

  store(const store&) = delete;
  store& operator=(const store&) = delete;

  store(store&& other) noexcept = default;

  store& operator=(store&& other) {
    if (this != &other) {
      if (engine_) engine_->quit();
      engine_ = std::move(other.engine_);
    }
    return *this;
  }

  ~store() {
    if (engine_) engine_->quit();
  }

  // Queues a reducer. It may return its argument unchanged to signal a no-op
  // (nothing is published then). Keep it short: it runs on the store's context.
  cycle_future set_state(reducer f) { return engine_->set_state(std::move(f)); }

  // Queues an action. It runs after every reducer queued before it, against
  // the state those produced.
  cycle_future with_state(action f) { return engine_->with_state(std::move(f)); }

  joinable quit() { return engine_->quit(); }
  joinable quit_safely() { return engine_->quit_safely(); }

  // fn first receives the latest state, then each published one, on the
  // threading option's callback executor.
  subscription add_listener(listener fn) {
    const auto id = engine_->subject().add_listener(std::move(fn));
    std::weak_ptr<engine<T>> weak = engine_;
    return subscription([weak, id]{
      if (auto e = weak.lock()) e->subject().remove_listener(id);
    });
  }

  // fn runs once when the store reaches lifecycle_phase::stopped.
  subscription add_quitted_listener(std::function<void()> fn) {
    const auto id = engine_->subject().add_quitted_listener(std::move(fn));
    std::weak_ptr<engine<T>> weak = engine_;
    return subscription([weak, id]{
      if (auto e = weak.lock()) e->subject().remove_quitted_listener(id);
    });
  }

  // Every intermediate state, when enabled. For debugging only.
  ::quantum::history<T>& history() noexcept { return engine_->history(); }

  lifecycle_phase phase() const { return engine_->phase(); }
  bool is_running() const noexcept { return engine_->is_running(); }

  // The exception that stopped the store, if user code threw.
  std::exception_ptr fault() const { return engine_->fault(); }

  // The option this store was built with; reusable for sibling stores.
  const threading& threading_option() const noexcept { return engine_->threading_option(); }

private:
  std::shared_ptr<engine<T>> engine_;
};

} // namespace quantum
