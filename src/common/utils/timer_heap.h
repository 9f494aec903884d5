#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <queue>
#include <unordered_map>
#include <vector>

namespace tvlink::utils {

// Timer identifier type.
using TimerId = std::uint64_t;

// Invalid timer ID constant.
constexpr TimerId kInvalidTimerId = std::numeric_limits<TimerId>::max();

// Timer callback type.
using TimerCallback = std::function<void(TimerId)>;

// Timer heap for scheduling and managing timed events on a single thread.
// Uses a min-heap of deadlines; cancelled and rescheduled entries are left
// in the heap and skipped lazily.
class TimerHeap {
 public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;
  using Duration = Clock::duration;

  explicit TimerHeap(std::function<TimePoint()> now_fn = Clock::now);

  TimerHeap(const TimerHeap&) = delete;
  TimerHeap& operator=(const TimerHeap&) = delete;

  // Schedule a timer to fire at absolute deadline.
  // Returns timer ID for cancellation.
  TimerId schedule_at(TimePoint deadline, TimerCallback callback);

  // Schedule a timer to fire after duration from now.
  TimerId schedule_after(Duration duration, TimerCallback callback);

  // Cancel a timer by ID. Returns true if timer was found and cancelled.
  bool cancel(TimerId id);

  // Move an existing timer to a new deadline.
  // Returns true if timer was found and rescheduled.
  bool reschedule_after(TimerId id, Duration duration);

  // Fire every timer whose deadline has passed. Timers scheduled by the
  // callbacks themselves are left for the next call, even if already due.
  // Returns number of timers fired.
  std::size_t process_expired();

  // Time until the next live timer fires (nullopt if no timers).
  std::optional<Duration> time_until_next();

  // Check whether a timer is still pending.
  bool is_pending(TimerId id) const { return active_.count(id) != 0; }

  // Get number of pending timers.
  std::size_t size() const { return active_.size(); }

  // Check if there are any pending timers.
  bool empty() const { return active_.empty(); }

  // Current time as seen by this heap.
  TimePoint now() const { return now_fn_(); }

  // Drop all timers without firing them.
  void clear();

 private:
  struct Entry {
    TimePoint deadline;
    TimerId id{0};

    // Min-heap ordering; ties fire in scheduling order.
    bool operator>(const Entry& other) const {
      if (deadline != other.deadline) {
        return deadline > other.deadline;
      }
      return id > other.id;
    }
  };

  struct Pending {
    TimerCallback callback;
    TimePoint deadline;  // Heap entries with another deadline are stale.
  };

  // Pop cancelled and stale entries off the top of the heap.
  void prune();

  TimerId next_id_{0};
  std::function<TimePoint()> now_fn_;
  std::priority_queue<Entry, std::vector<Entry>, std::greater<>> heap_;
  std::unordered_map<TimerId, Pending> active_;
};

// A single reusable timer bound to a TimerHeap.
// Arming it cancels whatever instance is still pending, so at most one
// callback of a slot is ever scheduled. Destruction cancels it as well.
class TimerSlot {
 public:
  explicit TimerSlot(TimerHeap& heap) : heap_(heap) {}
  ~TimerSlot() { cancel(); }

  TimerSlot(const TimerSlot&) = delete;
  TimerSlot& operator=(const TimerSlot&) = delete;

  void arm(TimerHeap::Duration delay, std::function<void()> callback);

  // Returns true if a pending instance was cancelled.
  bool cancel();

  bool armed() const { return id_ != kInvalidTimerId; }

 private:
  TimerHeap& heap_;
  TimerId id_{kInvalidTimerId};
};

}  // namespace tvlink::utils
