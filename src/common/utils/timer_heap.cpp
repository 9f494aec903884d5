#include "common/utils/timer_heap.h"

#include <utility>

namespace tvlink::utils {

TimerHeap::TimerHeap(std::function<TimePoint()> now_fn) : now_fn_(std::move(now_fn)) {}

TimerId TimerHeap::schedule_at(TimePoint deadline, TimerCallback callback) {
  const TimerId id = next_id_++;
  active_[id] = Pending{std::move(callback), deadline};
  heap_.push(Entry{deadline, id});
  return id;
}

TimerId TimerHeap::schedule_after(Duration duration, TimerCallback callback) {
  return schedule_at(now_fn_() + duration, std::move(callback));
}

bool TimerHeap::cancel(TimerId id) {
  // The heap entry stays behind and is skipped when it reaches the top.
  return active_.erase(id) != 0;
}

bool TimerHeap::reschedule_after(TimerId id, Duration duration) {
  auto it = active_.find(id);
  if (it == active_.end()) {
    return false;
  }
  it->second.deadline = now_fn_() + duration;
  heap_.push(Entry{it->second.deadline, id});
  return true;
}

void TimerHeap::prune() {
  while (!heap_.empty()) {
    const auto& top = heap_.top();
    auto it = active_.find(top.id);
    if (it != active_.end() && it->second.deadline == top.deadline) {
      return;
    }
    heap_.pop();
  }
}

std::size_t TimerHeap::process_expired() {
  const auto now = now_fn_();
  const TimerId watermark = next_id_;
  std::vector<Entry> deferred;
  std::size_t fired = 0;

  for (prune(); !heap_.empty() && heap_.top().deadline <= now; prune()) {
    const Entry entry = heap_.top();
    heap_.pop();

    if (entry.id >= watermark) {
      deferred.push_back(entry);
      continue;
    }

    auto it = active_.find(entry.id);
    TimerCallback callback = std::move(it->second.callback);
    active_.erase(it);

    if (callback) {
      callback(entry.id);
    }
    ++fired;
  }

  for (const auto& entry : deferred) {
    heap_.push(entry);
  }
  return fired;
}

std::optional<TimerHeap::Duration> TimerHeap::time_until_next() {
  prune();
  if (heap_.empty()) {
    return std::nullopt;
  }
  const auto now = now_fn_();
  const auto deadline = heap_.top().deadline;
  if (deadline <= now) {
    return Duration::zero();
  }
  return deadline - now;
}

void TimerHeap::clear() {
  heap_ = {};
  active_.clear();
}

void TimerSlot::arm(TimerHeap::Duration delay, std::function<void()> callback) {
  cancel();
  id_ = heap_.schedule_after(delay, [this, cb = std::move(callback)](TimerId) {
    id_ = kInvalidTimerId;
    cb();
  });
}

bool TimerSlot::cancel() {
  if (id_ == kInvalidTimerId) {
    return false;
  }
  const bool cancelled = heap_.cancel(id_);
  id_ = kInvalidTimerId;
  return cancelled;
}

}  // namespace tvlink::utils
