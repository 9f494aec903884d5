#include "remote/status_poller.h"

#include <utility>

#include "common/logging/logger.h"

namespace tvlink::remote {

const char* poll_cadence_to_string(PollCadence cadence) {
  switch (cadence) {
    case PollCadence::kBase:
      return "base";
    case PollCadence::kFast:
      return "fast";
    default:
      return "unknown";
  }
}

StatusPoller::StatusPoller(gateway::GatewayClient& gateway, SessionState& state,
                           utils::TimerHeap& timers, NoticeBoard& notices,
                           StatusPollerConfig config)
    : gateway_(gateway),
      state_(state),
      notices_(notices),
      config_(config),
      timer_(timers),
      failure_log_(3, std::chrono::seconds(60), [&timers]() { return timers.now(); }) {}

void StatusPoller::start() {
  if (running_) {
    return;
  }
  running_ = true;
  LOG_DEBUG("Status polling started ({} ms)", interval().count());
  poll();
  arm_timer();
}

void StatusPoller::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  timer_.cancel();
  LOG_DEBUG("Status polling stopped");
}

std::chrono::milliseconds StatusPoller::interval() const {
  return cadence_ == PollCadence::kFast ? config_.fast_interval : config_.base_interval;
}

void StatusPoller::arm_timer() {
  if (!running_) {
    return;
  }
  timer_.arm(interval(), [this]() { on_tick(); });
}

void StatusPoller::on_tick() {
  if (!poll()) {
    ++stats_.ticks_skipped;
  }
  arm_timer();
}

bool StatusPoller::poll() {
  if (in_flight_) {
    return false;
  }
  in_flight_ = true;
  ++stats_.polls_sent;
  const auto epoch = fast_epoch_;
  gateway_.fetch_status([this, epoch](const std::error_code& ec, gateway::StatusReport status) {
    on_status(epoch, ec, std::move(status));
  });
  return true;
}

void StatusPoller::on_status(std::uint64_t fast_epoch, const std::error_code& ec,
                             gateway::StatusReport status) {
  in_flight_ = false;

  if (ec) {
    ++stats_.polls_failed;
    if (failure_log_.allow()) {
      const auto suppressed = failure_log_.take_suppressed();
      LOG_WARN("Status poll failed: {} ({} similar suppressed)", ec.message(), suppressed);
    }
    return;
  }
  failure_log_.reset();

  const bool connected = status.connected;
  const bool settled = connected || (!status.connecting && !status.pairing_in_progress);
  state_.replace(snapshot_from_status(status), ChangeSource::kStatusPoll);

  if (cadence_ == PollCadence::kFast && fast_epoch == fast_epoch_ && settled) {
    cadence_ = PollCadence::kBase;
    LOG_DEBUG("Status settled ({}), back to {} ms polling",
              connected ? "connected" : "aborted", config_.base_interval.count());
    arm_timer();
  }
}

void StatusPoller::enter_fast_mode() {
  ++fast_epoch_;
  cadence_ = PollCadence::kFast;
  LOG_DEBUG("Polling status every {} ms", config_.fast_interval.count());
  arm_timer();
}

void StatusPoller::forget_in_flight() {
  in_flight_ = false;
  connect_in_flight_ = false;
}

void StatusPoller::connect() {
  if (connect_in_flight_) {
    LOG_DEBUG("Connect request already pending");
    return;
  }
  connect_in_flight_ = true;
  LOG_INFO("Requesting connection to device");
  gateway_.connect([this](const gateway::CommandResult& result) {
    connect_in_flight_ = false;
    if (!result.ok()) {
      LOG_WARN("Connect request failed: {}", result.message);
      notices_.error(result.message);
      return;
    }
    enter_fast_mode();
  });
}

}  // namespace tvlink::remote
