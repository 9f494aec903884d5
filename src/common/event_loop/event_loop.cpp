#include "common/event_loop/event_loop.h"

#include <sys/epoll.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <utility>

#include "common/logging/logger.h"

namespace tvlink::event {

namespace {
std::error_code last_error() { return {errno, std::generic_category()}; }

constexpr std::chrono::milliseconds kRunSlice{1000};
}  // namespace

EventLoop::EventLoop(std::function<TimePoint()> now_fn) : timers_(std::move(now_fn)) {}

EventLoop::~EventLoop() { close(); }

bool EventLoop::open(std::error_code& ec) {
  if (epoll_fd_ >= 0) {
    return true;
  }
  epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
  if (epoll_fd_ < 0) {
    ec = last_error();
    return false;
  }
  return true;
}

void EventLoop::close() {
  if (epoll_fd_ >= 0) {
    ::close(epoll_fd_);
    epoll_fd_ = -1;
  }
  by_token_.clear();
  by_fd_.clear();
}

bool EventLoop::watch(int fd, std::uint32_t events, IoHandler handler, std::error_code& ec) {
  if (epoll_fd_ < 0) {
    ec = std::make_error_code(std::errc::bad_file_descriptor);
    return false;
  }
  if (by_fd_.count(fd) != 0) {
    ec = std::make_error_code(std::errc::file_exists);
    return false;
  }

  const std::uint64_t token = next_token_++;
  epoll_event ev{};
  ev.events = events;
  ev.data.u64 = token;
  if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
    ec = last_error();
    return false;
  }

  by_token_[token] = Watch{fd, std::make_shared<IoHandler>(std::move(handler))};
  by_fd_[fd] = token;
  return true;
}

bool EventLoop::modify(int fd, std::uint32_t events, std::error_code& ec) {
  auto it = by_fd_.find(fd);
  if (it == by_fd_.end()) {
    ec = std::make_error_code(std::errc::no_such_file_or_directory);
    return false;
  }
  epoll_event ev{};
  ev.events = events;
  ev.data.u64 = it->second;
  if (::epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev) != 0) {
    ec = last_error();
    return false;
  }
  return true;
}

void EventLoop::unwatch(int fd) {
  auto it = by_fd_.find(fd);
  if (it == by_fd_.end()) {
    return;
  }
  if (epoll_fd_ >= 0) {
    // Ignore failures: the descriptor may already be closed by its owner.
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
  }
  by_token_.erase(it->second);
  by_fd_.erase(it);
}

bool EventLoop::run_once(std::chrono::milliseconds max_wait, std::error_code& ec) {
  if (epoll_fd_ < 0) {
    ec = std::make_error_code(std::errc::bad_file_descriptor);
    return false;
  }

  auto wait = max_wait;
  if (auto next = timers_.time_until_next()) {
    // Round up so a timer is never polled a hair before its deadline.
    const auto until = std::chrono::ceil<std::chrono::milliseconds>(*next);
    wait = std::min(wait, until);
  }

  std::array<epoll_event, 32> events{};
  const int n = ::epoll_wait(epoll_fd_, events.data(), static_cast<int>(events.size()),
                             static_cast<int>(wait.count()));
  if (n < 0) {
    if (errno != EINTR) {
      ec = last_error();
      return false;
    }
  }

  for (int i = 0; i < n; ++i) {
    const auto& ev = events[static_cast<std::size_t>(i)];
    auto it = by_token_.find(ev.data.u64);
    if (it == by_token_.end()) {
      continue;  // Unwatched by an earlier handler in this batch.
    }
    auto handler = it->second.handler;
    (*handler)(ev.events);
  }

  timers_.process_expired();
  return true;
}

bool EventLoop::run(std::error_code& ec) {
  running_ = true;
  while (running_) {
    if (!run_once(kRunSlice, ec)) {
      LOG_ERROR("Event loop wait failed: {}", ec.message());
      running_ = false;
      return false;
    }
  }
  return true;
}

}  // namespace tvlink::event
