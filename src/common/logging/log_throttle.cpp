#include "common/logging/log_throttle.h"

#include <utility>

namespace tvlink::logging {

LogThrottle::LogThrottle(std::uint32_t max_per_window, std::chrono::milliseconds window,
                         std::function<Clock::time_point()> now_fn)
    : max_per_window_(max_per_window),
      window_(window),
      now_fn_(std::move(now_fn)),
      window_start_(now_fn_()) {}

bool LogThrottle::allow() {
  if (max_per_window_ == 0) {
    return true;  // Unlimited.
  }

  const auto now = now_fn_();
  if (now - window_start_ >= window_) {
    window_start_ = now;
    count_in_window_ = 0;
  }

  if (count_in_window_ >= max_per_window_) {
    ++suppressed_;
    ++dropped_total_;
    return false;
  }

  ++count_in_window_;
  return true;
}

std::uint64_t LogThrottle::take_suppressed() {
  const auto value = suppressed_;
  suppressed_ = 0;
  return value;
}

void LogThrottle::reset() {
  window_start_ = now_fn_();
  count_in_window_ = 0;
  suppressed_ = 0;
}

}  // namespace tvlink::logging
