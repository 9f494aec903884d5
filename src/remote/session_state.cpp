#include "remote/session_state.h"

#include <utility>

#include "common/logging/logger.h"

namespace tvlink::remote {

namespace {
std::uint8_t diff_fields(const SessionSnapshot& a, const SessionSnapshot& b) {
  std::uint8_t fields = 0;
  if (a.connected != b.connected) fields |= static_cast<std::uint8_t>(SessionField::kConnected);
  if (a.device_name != b.device_name) fields |= static_cast<std::uint8_t>(SessionField::kDeviceName);
  if (a.apps != b.apps) fields |= static_cast<std::uint8_t>(SessionField::kApps);
  if (a.pairing_in_progress != b.pairing_in_progress) {
    fields |= static_cast<std::uint8_t>(SessionField::kPairingInProgress);
  }
  if (a.connecting != b.connecting) fields |= static_cast<std::uint8_t>(SessionField::kConnecting);
  return fields;
}
}  // namespace

SessionSnapshot snapshot_from_status(const gateway::StatusReport& status) {
  SessionSnapshot snapshot;
  snapshot.connected = status.connected;
  snapshot.device_name = status.tv_name;
  snapshot.apps = status.apps;
  snapshot.pairing_in_progress = status.pairing_in_progress;
  snapshot.connecting = status.connecting;
  return snapshot;
}

const char* change_source_to_string(ChangeSource source) {
  switch (source) {
    case ChangeSource::kStatusPoll:
      return "status-poll";
    case ChangeSource::kPairing:
      return "pairing";
    default:
      return "unknown";
  }
}

SessionChange SessionState::replace(SessionSnapshot next, ChangeSource source) {
  SessionChange change{source, diff_fields(snapshot_, next)};
  if (change.has(SessionField::kConnected)) {
    LOG_INFO("Device {} {}", next.device_name, next.connected ? "connected" : "disconnected");
  }
  snapshot_ = std::move(next);
  listeners_.notify(change, snapshot_);
  return change;
}

SessionChange SessionState::set_pairing_in_progress(bool value, ChangeSource source) {
  SessionChange change{source, 0};
  if (snapshot_.pairing_in_progress == value) {
    return change;
  }
  SessionSnapshot next = snapshot_;
  next.pairing_in_progress = value;
  change.fields = static_cast<std::uint8_t>(SessionField::kPairingInProgress);
  snapshot_ = std::move(next);
  listeners_.notify(change, snapshot_);
  return change;
}

utils::SubscriptionId SessionState::subscribe(Listener listener) {
  return listeners_.add(std::move(listener));
}

bool SessionState::unsubscribe(utils::SubscriptionId id) { return listeners_.remove(id); }

}  // namespace tvlink::remote
