#include "remote/event_stream.h"

#include <utility>

#include "common/logging/logger.h"

namespace tvlink::remote {

EventStream::EventStream(gateway::GatewayClient& gateway, const SessionState& state,
                         utils::TimerHeap& timers, VisibilityFn visible, EventStreamConfig config)
    : gateway_(gateway),
      state_(state),
      visible_(std::move(visible)),
      config_(config),
      timer_(timers),
      error_log_(3, std::chrono::seconds(60), [&timers]() { return timers.now(); }) {}

bool EventStream::visible() const { return !visible_ || visible_(); }

void EventStream::start() {
  if (running_) {
    return;
  }
  running_ = true;
  LOG_DEBUG("Event stream started");
  // A request left over from before stop() resumes the loop when it ends.
  if (!in_flight_) {
    step();
  }
}

void EventStream::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  timer_.cancel();
  LOG_DEBUG("Event stream stopped");
}

void EventStream::continue_after(std::chrono::milliseconds delay) {
  if (delay.count() <= 0) {
    step();
    return;
  }
  timer_.arm(delay, [this]() { step(); });
}

void EventStream::step() {
  if (!running_ || in_flight_) {
    return;
  }
  if (!state_.connected()) {
    timer_.arm(config_.disconnected_recheck, [this]() { step(); });
    return;
  }

  in_flight_ = true;
  ++stats_.requests;
  gateway_.poll_event(
      [this](const std::error_code& ec, std::optional<gateway::DeviceEvent> event) {
        on_response(ec, std::move(event));
      });
}

void EventStream::on_response(const std::error_code& ec,
                              std::optional<gateway::DeviceEvent> event) {
  in_flight_ = false;
  if (!running_) {
    return;
  }

  const auto idle_delay = visible() ? std::chrono::milliseconds(0) : config_.background_delay;

  if (ec) {
    ++stats_.errors;
    if (error_log_.allow()) {
      const auto suppressed = error_log_.take_suppressed();
      LOG_WARN("Event long-poll failed: {} ({} similar suppressed)", ec.message(), suppressed);
    }
    continue_after(config_.error_backoff + idle_delay);
    return;
  }
  error_log_.reset();

  if (event) {
    ++stats_.events;
    LOG_DEBUG("Device event: {}", event->type_name);
    listeners_.notify(*event);
    // A listener may have stopped the stream.
    if (!running_) {
      return;
    }
  }
  continue_after(idle_delay);
}

utils::SubscriptionId EventStream::subscribe(Listener listener) {
  return listeners_.add(std::move(listener));
}

bool EventStream::unsubscribe(utils::SubscriptionId id) { return listeners_.remove(id); }

}  // namespace tvlink::remote
