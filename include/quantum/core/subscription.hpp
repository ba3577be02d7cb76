#pragma once
#include <quantum/core/log.hpp>
#include <exception>
#include <functional>
#include <utility>
#include <type_traits>

namespace quantum {

// RAII handle of a registered listener.
// - Copying is PROHIBITED (one registration - one owner).
// - Moving transfers the registration, the source becomes empty.
// - The destructor removes the listener unless release() was called.
class subscription {
public:
  using cancel_fn = std::function<void()>;

  subscription() noexcept = default;

  explicit subscription(cancel_fn fn) noexcept : cancel_(std::move(fn)) {}

  subscription(const subscription&) = delete;
  subscription& operator=(const subscription&) = delete;

  subscription(subscription&& other) noexcept
    : cancel_(std::exchange(other.cancel_, nullptr)) {}

  subscription& operator=(subscription&& other) noexcept {
    if (this != &other) {
      reset();
      cancel_ = std::exchange(other.cancel_, nullptr);
    }
    return *this;
  }

  ~subscription() { reset(); }

  // Removes the listener once. Repeated calls are no-op.
  void reset() noexcept {
    auto fn = std::exchange(cancel_, nullptr);
    if (!fn) return;
    try {
      fn();
    } catch (const std::exception& e) {
      // a destructor must not throw: report and go on
      logger()->warn("quantum: listener removal failed: {}", e.what());
    } catch (...) {
      logger()->warn("quantum: listener removal failed: unknown exception");
    }
  }

  // Keep the listener registered for the lifetime of its store.
  void release() noexcept { cancel_ = nullptr; }

  explicit operator bool() const noexcept { return static_cast<bool>(cancel_); }

  void swap(subscription& other) noexcept {
    using std::swap;
    swap(cancel_, other.cancel_);
  }

private:
  cancel_fn cancel_{};
};

} // namespace quantum
