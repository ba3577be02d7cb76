#pragma once
#include <quantum/core/scheduler.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace quantum {

// state_subject<T>: fan-out of published states to listeners.
// Thread-safe. Deliveries go through the callback executor, one post per
// listener per state, in publish order. A new listener first receives the
// latest published state. Also carries the one-shot "quitted" notification.
template <class T>
class state_subject {
public:
  using listener = std::function<void(const T&)>;
  using quitted_listener = std::function<void()>;

  explicit state_subject(std::shared_ptr<executor> callback)
    : callback_(std::move(callback)) {
    if (!callback_) throw std::invalid_argument("quantum::state_subject: null callback executor");
  }

  state_subject(const state_subject&) = delete;
  state_subject& operator=(const state_subject&) = delete;

  void publish(const T& v) {
    // publish_m_ keeps replay and publishes of concurrent callers in one order;
    // recursive because an inline executor may call back into the subject
    std::lock_guard<std::recursive_mutex> order(publish_m_);
    std::vector<std::shared_ptr<slot>> local;
    {
      std::lock_guard<std::mutex> lock(m_);
      latest_ = v;
      local = slots_;
    }
    for (auto& s : local) deliver(s, v);
  }

  std::uint64_t add_listener(listener fn) {
    std::lock_guard<std::recursive_mutex> order(publish_m_);
    auto s = std::make_shared<slot>();
    s->fn = std::move(fn);
    std::optional<T> replay;
    {
      std::lock_guard<std::mutex> lock(m_);
      s->id = next_id_++;
      slots_.push_back(s);
      replay = latest_;
    }
    if (replay) deliver(s, *replay);
    return s->id;
  }

  // Deliveries already posted for this listener are dropped as well.
  bool remove_listener(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(m_);
    for (auto it = slots_.begin(); it != slots_.end(); ++it) {
      if ((*it)->id == id) {
        (*it)->alive.store(false, std::memory_order_release);
        slots_.erase(it);
        return true;
      }
    }
    return false;
  }

  std::size_t listener_count() const {
    std::lock_guard<std::mutex> lock(m_);
    return slots_.size();
  }

  std::optional<T> latest() const {
    std::lock_guard<std::mutex> lock(m_);
    return latest_;
  }

  // Runs fn once the store has stopped; immediately if it already has.
  std::uint64_t add_quitted_listener(quitted_listener fn) {
    std::uint64_t id = 0;
    {
      std::lock_guard<std::mutex> lock(m_);
      id = next_id_++;
      if (!quitted_) {
        quitted_slots_.emplace_back(id, std::move(fn));
        return id;
      }
    }
    if (fn) callback_->post(std::move(fn));
    return id;
  }

  bool remove_quitted_listener(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(m_);
    for (auto it = quitted_slots_.begin(); it != quitted_slots_.end(); ++it) {
      if (it->first == id) { quitted_slots_.erase(it); return true; }
    }
    return false;
  }

  void publish_quitted() {
    std::vector<std::pair<std::uint64_t, quitted_listener>> local;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (quitted_) return;
      quitted_ = true;
      local.swap(quitted_slots_);
    }
    for (auto& q : local) if (q.second) callback_->post(std::move(q.second));
  }

private:
  struct slot {
    std::uint64_t id{};
    listener fn;
    std::atomic<bool> alive{true};
  };

  void deliver(const std::shared_ptr<slot>& s, const T& v) {
    callback_->post([s, v]{
      if (!s->alive.load(std::memory_order_acquire)) return;
      if (s->fn) s->fn(v);
    });
  }

  std::shared_ptr<executor> callback_;
  std::recursive_mutex publish_m_;
  mutable std::mutex m_;
  std::vector<std::shared_ptr<slot>> slots_;
  std::vector<std::pair<std::uint64_t, quitted_listener>> quitted_slots_;
  std::optional<T> latest_;
  std::uint64_t next_id_{1};
  bool quitted_{false};
};

} // namespace quantum
