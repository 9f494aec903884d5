#include "remote/notice_board.h"

#include <utility>

#include "common/logging/logger.h"

namespace tvlink::remote {

const char* notice_severity_to_string(NoticeSeverity severity) {
  switch (severity) {
    case NoticeSeverity::kInfo:
      return "info";
    case NoticeSeverity::kError:
      return "error";
    default:
      return "unknown";
  }
}

NoticeBoard::NoticeBoard(utils::TimerHeap& timers, std::chrono::milliseconds lifetime)
    : timers_(timers), lifetime_(lifetime) {}

NoticeBoard::~NoticeBoard() {
  // Timers go first so none fires into a half-destroyed board.
  for (auto& [id, entry] : entries_) {
    entry.expiry->cancel();
  }
}

NoticeId NoticeBoard::post(NoticeSeverity severity, std::string message) {
  const NoticeId id = next_id_++;
  Entry entry;
  entry.notice = Notice{id, severity, std::move(message)};
  entry.expiry = std::make_unique<utils::TimerSlot>(timers_);
  entry.expiry->arm(lifetime_, [this, id]() { dismiss(id); });

  LOG_DEBUG("Notice #{} ({}): {}", id, notice_severity_to_string(severity), entry.notice.message);

  auto [it, inserted] = entries_.emplace(id, std::move(entry));
  listeners_.notify(NoticeEvent::kPosted, it->second.notice);
  return id;
}

bool NoticeBoard::dismiss(NoticeId id) {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return false;
  }
  Entry entry = std::move(it->second);
  entries_.erase(it);
  entry.expiry->cancel();
  listeners_.notify(NoticeEvent::kDismissed, entry.notice);
  return true;
}

void NoticeBoard::clear() {
  while (!entries_.empty()) {
    dismiss(entries_.begin()->first);
  }
}

std::vector<Notice> NoticeBoard::active() const {
  std::vector<Notice> notices;
  notices.reserve(entries_.size());
  for (const auto& [id, entry] : entries_) {
    notices.push_back(entry.notice);
  }
  return notices;
}

std::string NoticeBoard::latest_message() const {
  if (entries_.empty()) {
    return {};
  }
  return entries_.rbegin()->second.notice.message;
}

utils::SubscriptionId NoticeBoard::subscribe(Listener listener) {
  return listeners_.add(std::move(listener));
}

bool NoticeBoard::unsubscribe(utils::SubscriptionId id) { return listeners_.remove(id); }

}  // namespace tvlink::remote
