#pragma once
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace quantum {

namespace detail {
inline std::mutex& logger_mutex() {
  static std::mutex m;
  return m;
}

inline std::shared_ptr<spdlog::logger>& logger_slot() {
  static std::shared_ptr<spdlog::logger> slot;
  return slot;
}
} // namespace detail

// Replaces the logger used by every store. nullptr restores the default one.
inline void set_logger(std::shared_ptr<spdlog::logger> l) {
  std::lock_guard<std::mutex> lock(detail::logger_mutex());
  detail::logger_slot() = std::move(l);
}

// The library logger: whatever set_logger() installed, otherwise a
// "quantum" stdout logger (level warn) registered with spdlog on first use.
inline std::shared_ptr<spdlog::logger> logger() {
  std::lock_guard<std::mutex> lock(detail::logger_mutex());
  auto& slot = detail::logger_slot();
  if (!slot) {
    slot = spdlog::get("quantum");
    if (!slot) {
      slot = spdlog::stdout_color_mt("quantum");
      slot->set_level(spdlog::level::warn);
    }
  }
  return slot;
}

// Message of a captured fault, for log lines.
inline std::string describe(std::exception_ptr e) {
  if (!e) return "no error";
  try {
    std::rethrow_exception(e);
  } catch (const std::exception& ex) {
    return ex.what();
  } catch (...) {
    return "non-standard exception";
  }
}

} // namespace quantum
