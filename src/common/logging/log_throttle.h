#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace tvlink::logging {

// Rate limiter for log records emitted by retry loops.
// Allows at most max_per_window records per window; the rest are counted
// so the next allowed record can report how many were suppressed.
class LogThrottle {
 public:
  using Clock = std::chrono::steady_clock;

  LogThrottle(std::uint32_t max_per_window, std::chrono::milliseconds window,
              std::function<Clock::time_point()> now_fn = Clock::now);

  // Check if a record should be written now.
  bool allow();

  // Number of records dropped since the last call; resets the counter.
  std::uint64_t take_suppressed();

  // Total number of dropped records.
  std::uint64_t dropped_count() const { return dropped_total_; }

  // Start a fresh window (e.g. after the condition being logged cleared).
  void reset();

 private:
  std::uint32_t max_per_window_;
  std::chrono::milliseconds window_;
  std::function<Clock::time_point()> now_fn_;
  Clock::time_point window_start_;
  std::uint32_t count_in_window_{0};
  std::uint64_t suppressed_{0};
  std::uint64_t dropped_total_{0};
};

}  // namespace tvlink::logging
