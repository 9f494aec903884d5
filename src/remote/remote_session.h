#pragma once

#include <chrono>
#include <string>

#include "common/utils/subscriber_list.h"
#include "common/utils/timer_heap.h"
#include "gateway/gateway_client.h"
#include "remote/event_stream.h"
#include "remote/feedback.h"
#include "remote/key_dispatcher.h"
#include "remote/mute_store.h"
#include "remote/notice_board.h"
#include "remote/pairing_coordinator.h"
#include "remote/session_state.h"
#include "remote/status_poller.h"
#include "remote/text_input.h"

namespace tvlink::remote {

struct RemoteSessionConfig {
  StatusPollerConfig polling;
  EventStreamConfig events;
  KeyDispatcherConfig keys;
  std::chrono::milliseconds notice_lifetime{5000};
  bool auto_enter{true};
  // Where the mute state is kept; empty keeps it in memory.
  std::string state_file;
};

// Owns one remote-control session: the shared state and every component
// operating on it, wired together and started and stopped as a unit.
class RemoteSession {
 public:
  RemoteSession(gateway::GatewayClient& gateway, utils::TimerHeap& timers,
                RemoteSessionConfig config = {}, VisibilityFn visible = {},
                FeedbackSink feedback = {});
  ~RemoteSession();

  RemoteSession(const RemoteSession&) = delete;
  RemoteSession& operator=(const RemoteSession&) = delete;

  void start();

  // Stop all periodic activity, pending timers and outstanding requests.
  void stop();

  bool running() const { return running_; }

  SessionState& state() { return state_; }
  NoticeBoard& notices() { return notices_; }
  MuteStore& mute() { return mute_; }
  StatusPoller& poller() { return poller_; }
  PairingCoordinator& pairing() { return pairing_; }
  EventStream& events() { return events_; }
  KeyDispatcher& keys() { return keys_; }
  TextInputSync& text() { return text_; }

 private:
  void on_device_event(const gateway::DeviceEvent& event);

  gateway::GatewayClient& gateway_;
  RemoteSessionConfig config_;

  // Declaration order is construction order; each component only refers to
  // members declared before it.
  NoticeBoard notices_;
  SessionState state_;
  MuteStore mute_;
  StatusPoller poller_;
  PairingCoordinator pairing_;
  EventStream events_;
  KeyDispatcher keys_;
  TextInputSync text_;

  utils::SubscriptionId event_subscription_{utils::kInvalidSubscriptionId};
  bool running_{false};
};

}  // namespace tvlink::remote
