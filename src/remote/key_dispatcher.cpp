#include "remote/key_dispatcher.h"

#include <utility>

#include "common/error/remote_error.h"
#include "common/logging/logger.h"
#include "remote/key_map.h"

namespace tvlink::remote {

namespace {
constexpr const char* kNotConnectedMessage = "Not connected to TV";
}  // namespace

KeyDispatcher::KeyDispatcher(gateway::GatewayClient& gateway, const SessionState& state,
                             MuteStore& mute, NoticeBoard& notices, utils::TimerHeap& timers,
                             FeedbackSink feedback, KeyDispatcherConfig config)
    : gateway_(gateway),
      state_(state),
      mute_(mute),
      notices_(notices),
      feedback_(std::move(feedback)),
      config_(config),
      remute_timer_(timers) {}

void KeyDispatcher::pulse(FeedbackPattern pattern) {
  if (feedback_) {
    feedback_(pattern);
  }
}

std::error_code KeyDispatcher::check_ready(const std::string& what) {
  if (what.empty()) {
    return error::make_error_code(error::Errc::kValidation);
  }
  if (!state_.connected()) {
    notices_.error(kNotConnectedMessage);
    return error::make_error_code(error::Errc::kNotConnected);
  }
  return {};
}

std::error_code KeyDispatcher::send(const std::string& key, gateway::CommandHandler done) {
  if (auto ec = check_ready(key)) {
    return ec;
  }

  // HOME unmutes the device; remember to put the mute back.
  const bool restore_mute = key == keycode::kHome && mute_.muted();
  LOG_DEBUG("Sending {}{}", key, restore_mute ? " with mute restoration" : "");

  gateway_.send_key(key, [this, key, restore_mute, done = std::move(done)](
                             const gateway::CommandResult& result) {
    on_key_result(key, restore_mute, result, done);
  });
  return {};
}

void KeyDispatcher::on_key_result(const std::string& key, bool restore_mute,
                                  const gateway::CommandResult& result,
                                  const gateway::CommandHandler& done) {
  if (!result.ok()) {
    LOG_WARN("Key {} failed: {}", key, result.message);
    notices_.error(result.message);
  } else {
    if (key == keycode::kVolumeMute) {
      mute_.toggle();
      // An explicit mute supersedes a pending HOME compensation.
      remute_timer_.cancel();
      LOG_DEBUG("Mute state: {}", mute_.muted());
    }
    if (restore_mute) {
      remute_timer_.arm(config_.remute_delay, [this]() { send_remute(); });
    }
    pulse(FeedbackPattern::kKeyPress);
  }
  if (done) {
    done(result);
  }
}

void KeyDispatcher::send_remute() {
  gateway_.send_key(keycode::kVolumeMute, [](const gateway::CommandResult& result) {
    if (result.ok()) {
      LOG_DEBUG("Mute restored after HOME");
    } else {
      LOG_WARN("Failed to restore mute after HOME: {}", result.message);
    }
  });
}

std::error_code KeyDispatcher::launch_app(const std::string& app_id,
                                          gateway::CommandHandler done) {
  if (auto ec = check_ready(app_id)) {
    return ec;
  }

  LOG_DEBUG("Launching app {}", app_id);
  gateway_.launch_app(app_id, [this, app_id, done = std::move(done)](
                                  const gateway::CommandResult& result) {
    if (!result.ok()) {
      LOG_WARN("Launching {} failed: {}", app_id, result.message);
      notices_.error(result.message);
    } else {
      pulse(FeedbackPattern::kAppLaunch);
    }
    if (done) {
      done(result);
    }
  });
  return {};
}

void KeyDispatcher::cancel_pending() { remute_timer_.cancel(); }

}  // namespace tvlink::remote
