#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

#include "common/utils/subscriber_list.h"
#include "gateway/gateway_client.h"
#include "remote/notice_board.h"
#include "remote/session_state.h"
#include "remote/status_poller.h"

namespace tvlink::remote {

enum class PairingPhase : std::uint8_t {
  kIdle,        // No pairing flow shown.
  kCodeEntry,   // Waiting for the user to enter the code shown on the device.
  kSubmitting,  // Code sent, waiting for the gateway's answer.
};

const char* pairing_phase_to_string(PairingPhase phase);

// Minimum length of a pairing code accepted for submission.
inline constexpr std::size_t kMinPairingCodeLength = 4;

// Drives the pairing flow the gateway starts when the device asks for a
// code. Opens on a status poll reporting pairing in progress, closes once
// the device is connected.
class PairingCoordinator {
 public:
  using PhaseListener = std::function<void(PairingPhase)>;

  PairingCoordinator(gateway::GatewayClient& gateway, SessionState& state, StatusPoller& poller,
                     NoticeBoard& notices);
  ~PairingCoordinator();

  PairingCoordinator(const PairingCoordinator&) = delete;
  PairingCoordinator& operator=(const PairingCoordinator&) = delete;

  PairingPhase phase() const { return phase_; }
  const std::string& code() const { return code_; }
  bool submitting() const { return phase_ == PairingPhase::kSubmitting; }

  // Edit the code being entered. Ignored outside CodeEntry.
  bool set_code(std::string code);

  // Submit the entered code. Returns a validation error, without contacting
  // the gateway, if the code is too short or no code is expected.
  std::error_code submit();
  std::error_code submit(std::string code);

  // Close the flow and forget the code. Not possible while submitting.
  bool cancel();

  // Return to Idle from any phase; a pending submission is disregarded.
  void reset();

  utils::SubscriptionId subscribe(PhaseListener listener);
  bool unsubscribe(utils::SubscriptionId id);

 private:
  void on_session_change(const SessionChange& change, const SessionSnapshot& snapshot);
  void on_submit_result(std::uint64_t attempt, const gateway::CommandResult& result);
  void enter(PairingPhase phase);
  std::error_code reject(const char* message);

  gateway::GatewayClient& gateway_;
  SessionState& state_;
  StatusPoller& poller_;
  NoticeBoard& notices_;
  utils::SubscriptionId state_subscription_{utils::kInvalidSubscriptionId};
  utils::SubscriberList<PairingPhase> listeners_;

  PairingPhase phase_{PairingPhase::kIdle};
  std::string code_;
  std::uint64_t attempt_{0};
  // Set once a code was accepted; the gateway keeps reporting the old
  // request until it finishes, which must not reopen the flow.
  bool answered_{false};
};

}  // namespace tvlink::remote
