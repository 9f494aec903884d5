#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "common/utils/subscriber_list.h"
#include "common/utils/timer_heap.h"

namespace tvlink::remote {

using NoticeId = std::uint64_t;

enum class NoticeSeverity : std::uint8_t {
  kInfo,
  kError,
};

const char* notice_severity_to_string(NoticeSeverity severity);

struct Notice {
  NoticeId id{0};
  NoticeSeverity severity{NoticeSeverity::kError};
  std::string message;
};

enum class NoticeEvent : std::uint8_t {
  kPosted,
  kDismissed,
};

// Transient user-facing messages. Each notice dismisses itself after the
// configured lifetime unless dismissed earlier.
class NoticeBoard {
 public:
  using Listener = std::function<void(NoticeEvent, const Notice&)>;

  explicit NoticeBoard(utils::TimerHeap& timers,
                       std::chrono::milliseconds lifetime = std::chrono::milliseconds(5000));
  ~NoticeBoard();

  NoticeBoard(const NoticeBoard&) = delete;
  NoticeBoard& operator=(const NoticeBoard&) = delete;

  NoticeId post(NoticeSeverity severity, std::string message);
  NoticeId error(std::string message) { return post(NoticeSeverity::kError, std::move(message)); }
  NoticeId info(std::string message) { return post(NoticeSeverity::kInfo, std::move(message)); }

  bool dismiss(NoticeId id);

  // Dismiss everything and cancel all dismissal timers.
  void clear();

  // Active notices, oldest first.
  std::vector<Notice> active() const;
  std::size_t size() const { return entries_.size(); }

  // Most recent message, or empty if there is none.
  std::string latest_message() const;

  utils::SubscriptionId subscribe(Listener listener);
  bool unsubscribe(utils::SubscriptionId id);

 private:
  struct Entry {
    Notice notice;
    std::unique_ptr<utils::TimerSlot> expiry;
  };

  utils::TimerHeap& timers_;
  std::chrono::milliseconds lifetime_;
  NoticeId next_id_{1};
  std::map<NoticeId, Entry> entries_;
  utils::SubscriberList<NoticeEvent, const Notice&> listeners_;
};

}  // namespace tvlink::remote
