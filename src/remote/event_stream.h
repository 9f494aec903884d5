#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <system_error>

#include "common/logging/log_throttle.h"
#include "common/utils/subscriber_list.h"
#include "common/utils/timer_heap.h"
#include "gateway/gateway_client.h"
#include "remote/session_state.h"

namespace tvlink::remote {

struct EventStreamConfig {
  // Pause after a failed long-poll.
  std::chrono::milliseconds error_backoff{2000};
  // Extra pause between requests while nobody is looking.
  std::chrono::milliseconds background_delay{1000};
  // How often to look at the connection flag while disconnected.
  std::chrono::milliseconds disconnected_recheck{3000};
};

// Whether the user can currently see the client.
using VisibilityFn = std::function<bool()>;

// Long-poll loop receiving device-initiated events (e.g. a text field got
// focus). Never terminates on errors; only stop() ends it. At most one
// request is outstanding.
class EventStream {
 public:
  using Listener = std::function<void(const gateway::DeviceEvent&)>;

  EventStream(gateway::GatewayClient& gateway, const SessionState& state, utils::TimerHeap& timers,
              VisibilityFn visible = {}, EventStreamConfig config = {});

  EventStream(const EventStream&) = delete;
  EventStream& operator=(const EventStream&) = delete;

  void start();
  void stop();
  bool running() const { return running_; }

  // The gateway dropped the outstanding long-poll without answering.
  void forget_in_flight() { in_flight_ = false; }
  bool in_flight() const { return in_flight_; }
  bool timer_armed() const { return timer_.armed(); }

  utils::SubscriptionId subscribe(Listener listener);
  bool unsubscribe(utils::SubscriptionId id);

  // Statistics.
  struct Stats {
    std::uint64_t requests{0};
    std::uint64_t events{0};
    std::uint64_t errors{0};
  };
  const Stats& stats() const { return stats_; }

 private:
  void step();
  void on_response(const std::error_code& ec, std::optional<gateway::DeviceEvent> event);
  void continue_after(std::chrono::milliseconds delay);
  bool visible() const;

  gateway::GatewayClient& gateway_;
  const SessionState& state_;
  VisibilityFn visible_;
  EventStreamConfig config_;
  utils::TimerSlot timer_;
  logging::LogThrottle error_log_;
  utils::SubscriberList<const gateway::DeviceEvent&> listeners_;

  bool running_{false};
  bool in_flight_{false};
  Stats stats_;
};

}  // namespace tvlink::remote
