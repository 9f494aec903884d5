#pragma once

#include <chrono>
#include <cstdint>
#include <system_error>

#include "common/logging/log_throttle.h"
#include "common/utils/timer_heap.h"
#include "gateway/gateway_client.h"
#include "remote/notice_board.h"
#include "remote/session_state.h"

namespace tvlink::remote {

struct StatusPollerConfig {
  std::chrono::milliseconds base_interval{2000};
  // Used while a connect or pairing submission awaits its outcome.
  std::chrono::milliseconds fast_interval{500};
};

enum class PollCadence : std::uint8_t {
  kBase,
  kFast,
};

const char* poll_cadence_to_string(PollCadence cadence);

// Keeps SessionState in step with the gateway by polling its status.
// At most one status request is in flight and at most one poll timer is
// pending. Failed polls leave the state untouched and are retried on the
// next tick.
class StatusPoller {
 public:
  StatusPoller(gateway::GatewayClient& gateway, SessionState& state, utils::TimerHeap& timers,
               NoticeBoard& notices, StatusPollerConfig config = {});

  StatusPoller(const StatusPoller&) = delete;
  StatusPoller& operator=(const StatusPoller&) = delete;

  // Poll now and keep polling at the current cadence.
  void start();
  void stop();
  bool running() const { return running_; }

  // Issue one status request unless one is already in flight.
  // Returns false if the request was skipped.
  bool poll();

  // Ask the gateway to (re)connect to the device and watch it closely.
  void connect();

  // Poll at the fast interval until the pending operation settles.
  void enter_fast_mode();

  // The gateway dropped every outstanding request without answering.
  void forget_in_flight();

  PollCadence cadence() const { return cadence_; }
  bool in_flight() const { return in_flight_; }
  bool timer_armed() const { return timer_.armed(); }

  // Statistics.
  struct Stats {
    std::uint64_t polls_sent{0};
    std::uint64_t polls_failed{0};
    std::uint64_t ticks_skipped{0};
  };
  const Stats& stats() const { return stats_; }

 private:
  void on_tick();
  void on_status(std::uint64_t fast_epoch, const std::error_code& ec, gateway::StatusReport status);
  void arm_timer();
  std::chrono::milliseconds interval() const;

  gateway::GatewayClient& gateway_;
  SessionState& state_;
  NoticeBoard& notices_;
  StatusPollerConfig config_;
  utils::TimerSlot timer_;
  logging::LogThrottle failure_log_;

  bool running_{false};
  bool in_flight_{false};
  bool connect_in_flight_{false};
  PollCadence cadence_{PollCadence::kBase};
  // Bumped on every switch to fast mode; polls issued before the switch
  // cannot end it.
  std::uint64_t fast_epoch_{0};
  Stats stats_;
};

}  // namespace tvlink::remote
