#include "remote/pairing_coordinator.h"

#include <utility>

#include "common/error/remote_error.h"
#include "common/logging/logger.h"

namespace tvlink::remote {

const char* pairing_phase_to_string(PairingPhase phase) {
  switch (phase) {
    case PairingPhase::kIdle:
      return "idle";
    case PairingPhase::kCodeEntry:
      return "code-entry";
    case PairingPhase::kSubmitting:
      return "submitting";
    default:
      return "unknown";
  }
}

PairingCoordinator::PairingCoordinator(gateway::GatewayClient& gateway, SessionState& state,
                                       StatusPoller& poller, NoticeBoard& notices)
    : gateway_(gateway), state_(state), poller_(poller), notices_(notices) {
  state_subscription_ = state_.subscribe(
      [this](const SessionChange& change, const SessionSnapshot& snapshot) {
        on_session_change(change, snapshot);
      });
}

PairingCoordinator::~PairingCoordinator() { state_.unsubscribe(state_subscription_); }

void PairingCoordinator::enter(PairingPhase phase) {
  if (phase == phase_) {
    return;
  }
  LOG_DEBUG("Pairing {} -> {}", pairing_phase_to_string(phase_), pairing_phase_to_string(phase));
  phase_ = phase;
  listeners_.notify(phase_);
}

void PairingCoordinator::on_session_change(const SessionChange& change,
                                           const SessionSnapshot& snapshot) {
  if (change.source != ChangeSource::kStatusPoll) {
    return;
  }

  if (answered_ && (!snapshot.pairing_in_progress || snapshot.connected)) {
    answered_ = false;
  }

  if (snapshot.connected) {
    if (phase_ != PairingPhase::kIdle) {
      LOG_INFO("Pairing complete");
      code_.clear();
      enter(PairingPhase::kIdle);
    }
    return;
  }

  if (snapshot.pairing_in_progress && phase_ == PairingPhase::kIdle && !answered_) {
    LOG_INFO("Device requests pairing, enter the code shown on screen");
    code_.clear();
    enter(PairingPhase::kCodeEntry);
  }
}

bool PairingCoordinator::set_code(std::string code) {
  if (phase_ != PairingPhase::kCodeEntry) {
    return false;
  }
  code_ = std::move(code);
  return true;
}

std::error_code PairingCoordinator::reject(const char* message) {
  notices_.error(message);
  return error::make_error_code(error::Errc::kValidation);
}

std::error_code PairingCoordinator::submit(std::string code) {
  if (phase_ == PairingPhase::kCodeEntry) {
    code_ = std::move(code);
  }
  return submit();
}

std::error_code PairingCoordinator::submit() {
  if (phase_ == PairingPhase::kSubmitting) {
    return reject("Pairing code already submitted");
  }
  if (phase_ != PairingPhase::kCodeEntry) {
    return reject("No pairing request in progress");
  }
  if (code_.size() < kMinPairingCodeLength) {
    return reject("Please enter a valid pairing code");
  }

  const auto attempt = ++attempt_;
  LOG_INFO("Submitting pairing code");
  enter(PairingPhase::kSubmitting);
  state_.set_pairing_in_progress(true, ChangeSource::kPairing);

  gateway_.submit_pairing_code(code_, [this, attempt](const gateway::CommandResult& result) {
    on_submit_result(attempt, result);
  });
  return {};
}

void PairingCoordinator::on_submit_result(std::uint64_t attempt,
                                          const gateway::CommandResult& result) {
  // The flow may have been closed by a status poll in the meantime.
  if (attempt != attempt_ || phase_ != PairingPhase::kSubmitting) {
    LOG_DEBUG("Ignoring result of superseded pairing attempt #{}", attempt);
    return;
  }

  if (!result.ok()) {
    LOG_WARN("Pairing code rejected: {}", result.message);
    notices_.error(result.message);
    enter(PairingPhase::kCodeEntry);
    return;
  }

  LOG_INFO("Pairing code accepted, waiting for the device");
  code_.clear();
  answered_ = true;
  enter(PairingPhase::kIdle);
  poller_.enter_fast_mode();
}

bool PairingCoordinator::cancel() {
  if (phase_ == PairingPhase::kSubmitting) {
    return false;
  }
  code_.clear();
  enter(PairingPhase::kIdle);
  return true;
}

void PairingCoordinator::reset() {
  ++attempt_;
  answered_ = false;
  code_.clear();
  enter(PairingPhase::kIdle);
}

utils::SubscriptionId PairingCoordinator::subscribe(PhaseListener listener) {
  return listeners_.add(std::move(listener));
}

bool PairingCoordinator::unsubscribe(utils::SubscriptionId id) { return listeners_.remove(id); }

}  // namespace tvlink::remote
