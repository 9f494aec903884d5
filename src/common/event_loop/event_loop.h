#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <system_error>
#include <unordered_map>

#include "common/utils/timer_heap.h"

namespace tvlink::event {

// Single-threaded cooperative event loop: epoll readiness for descriptors
// plus a TimerHeap for deadlines. Every handler and timer callback runs on
// the thread that calls run()/run_once(), so components driven by the
// loop need no locking.
class EventLoop {
 public:
  using Clock = utils::TimerHeap::Clock;
  using TimePoint = utils::TimerHeap::TimePoint;
  // Receives the epoll event mask (EPOLLIN, EPOLLOUT, EPOLLERR, ...).
  using IoHandler = std::function<void(std::uint32_t events)>;

  explicit EventLoop(std::function<TimePoint()> now_fn = Clock::now);
  ~EventLoop();

  EventLoop(const EventLoop&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  // Create the epoll instance.
  bool open(std::error_code& ec);
  void close();
  bool is_open() const { return epoll_fd_ >= 0; }

  // Register a descriptor. The loop does not own it.
  bool watch(int fd, std::uint32_t events, IoHandler handler, std::error_code& ec);

  // Change the event mask of a registered descriptor.
  bool modify(int fd, std::uint32_t events, std::error_code& ec);

  // Remove a descriptor. Safe to call from within its own handler; events
  // already collected for it in the current iteration are dropped.
  void unwatch(int fd);

  bool is_watching(int fd) const { return by_fd_.count(fd) != 0; }
  std::size_t watch_count() const { return by_fd_.size(); }

  utils::TimerHeap& timers() { return timers_; }

  // Wait for at most max_wait (less if a timer is due sooner), dispatch
  // ready descriptors, then fire expired timers.
  bool run_once(std::chrono::milliseconds max_wait, std::error_code& ec);

  // Loop until stop() is called or the epoll wait fails.
  bool run(std::error_code& ec);

  void stop() { running_ = false; }
  bool running() const { return running_; }

 private:
  struct Watch {
    int fd{-1};
    std::shared_ptr<IoHandler> handler;
  };

  int epoll_fd_{-1};
  bool running_{false};
  std::uint64_t next_token_{1};
  utils::TimerHeap timers_;
  std::unordered_map<std::uint64_t, Watch> by_token_;
  std::unordered_map<int, std::uint64_t> by_fd_;
};

}  // namespace tvlink::event
