#include "remote/remote_session.h"

#include <utility>

#include "common/logging/logger.h"

namespace tvlink::remote {

RemoteSession::RemoteSession(gateway::GatewayClient& gateway, utils::TimerHeap& timers,
                             RemoteSessionConfig config, VisibilityFn visible,
                             FeedbackSink feedback)
    : gateway_(gateway),
      config_(std::move(config)),
      notices_(timers, config_.notice_lifetime),
      mute_(config_.state_file),
      poller_(gateway_, state_, timers, notices_, config_.polling),
      pairing_(gateway_, state_, poller_, notices_),
      events_(gateway_, state_, timers, std::move(visible), config_.events),
      keys_(gateway_, state_, mute_, notices_, timers, feedback, config_.keys),
      text_(gateway_, state_, keys_, notices_, feedback, config_.auto_enter) {
  mute_.load();
  event_subscription_ = events_.subscribe(
      [this](const gateway::DeviceEvent& event) { on_device_event(event); });
}

RemoteSession::~RemoteSession() {
  stop();
  events_.unsubscribe(event_subscription_);
}

void RemoteSession::on_device_event(const gateway::DeviceEvent& event) {
  if (event.type != gateway::DeviceEventType::kImeShow) {
    LOG_DEBUG("Ignoring device event {}", event.type_name);
    return;
  }
  if (auto value = gateway::ime_value(event)) {
    text_.apply_remote_value(std::move(*value));
  }
}

void RemoteSession::start() {
  if (running_) {
    return;
  }
  running_ = true;
  LOG_INFO("Remote session started");
  poller_.start();
  events_.start();
}

void RemoteSession::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  poller_.stop();
  events_.stop();
  keys_.cancel_pending();
  text_.cancel_pending();
  notices_.clear();
  gateway_.cancel_all();
  poller_.forget_in_flight();
  pairing_.reset();
  events_.forget_in_flight();
  text_.forget_in_flight();
  LOG_INFO("Remote session stopped");
}

}  // namespace tvlink::remote
