#pragma once

#include <chrono>
#include <string>
#include <system_error>

#include "common/utils/timer_heap.h"
#include "gateway/gateway_client.h"
#include "remote/feedback.h"
#include "remote/mute_store.h"
#include "remote/notice_board.h"
#include "remote/session_state.h"

namespace tvlink::remote {

struct KeyDispatcherConfig {
  // Delay between an accepted HOME and the mute that restores silence.
  std::chrono::milliseconds remute_delay{400};
};

// Sends single keys and app launches. Refuses to act while disconnected,
// reports rejections through the notice board, and keeps the device muted
// across HOME, which unmutes it as a side effect.
class KeyDispatcher {
 public:
  KeyDispatcher(gateway::GatewayClient& gateway, const SessionState& state, MuteStore& mute,
                NoticeBoard& notices, utils::TimerHeap& timers, FeedbackSink feedback = {},
                KeyDispatcherConfig config = {});

  KeyDispatcher(const KeyDispatcher&) = delete;
  KeyDispatcher& operator=(const KeyDispatcher&) = delete;

  // Send a device key code. Returns an error without contacting the gateway
  // if the session is not connected; otherwise done (if set) receives the
  // gateway's answer for the key itself.
  std::error_code send(const std::string& key, gateway::CommandHandler done = {});

  std::error_code launch_app(const std::string& app_id, gateway::CommandHandler done = {});

  bool muted() const { return mute_.muted(); }
  bool remute_pending() const { return remute_timer_.armed(); }

  // Drop a scheduled re-mute.
  void cancel_pending();

 private:
  std::error_code check_ready(const std::string& what);
  void on_key_result(const std::string& key, bool restore_mute, const gateway::CommandResult& result,
                     const gateway::CommandHandler& done);
  void send_remute();
  void pulse(FeedbackPattern pattern);

  gateway::GatewayClient& gateway_;
  const SessionState& state_;
  MuteStore& mute_;
  NoticeBoard& notices_;
  FeedbackSink feedback_;
  KeyDispatcherConfig config_;
  utils::TimerSlot remute_timer_;
};

}  // namespace tvlink::remote
