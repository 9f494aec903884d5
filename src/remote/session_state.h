#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "common/utils/subscriber_list.h"
#include "gateway/gateway_protocol.h"

namespace tvlink::remote {

// Everything the client knows about the gateway's link to the device.
// Always replaced as a whole so observers never see a mix of two polls.
struct SessionSnapshot {
  bool connected{false};
  std::string device_name{gateway::kDefaultDeviceName};
  std::vector<gateway::AppEntry> apps;
  bool pairing_in_progress{false};
  bool connecting{false};

  bool operator==(const SessionSnapshot&) const = default;
};

SessionSnapshot snapshot_from_status(const gateway::StatusReport& status);

// Component that caused a change.
enum class ChangeSource : std::uint8_t {
  kStatusPoll,
  kPairing,
};

const char* change_source_to_string(ChangeSource source);

// Bit flags naming the snapshot fields a change touched.
enum class SessionField : std::uint8_t {
  kConnected = 1 << 0,
  kDeviceName = 1 << 1,
  kApps = 1 << 2,
  kPairingInProgress = 1 << 3,
  kConnecting = 1 << 4,
};

struct SessionChange {
  ChangeSource source{ChangeSource::kStatusPoll};
  std::uint8_t fields{0};

  bool has(SessionField field) const {
    return (fields & static_cast<std::uint8_t>(field)) != 0;
  }
  bool empty() const { return fields == 0; }
};

// Single source of truth for connection, pairing and app-list status.
// Written by the status poller and the pairing coordinator only; everyone
// else reads it and subscribes to changes.
class SessionState {
 public:
  using Listener = std::function<void(const SessionChange&, const SessionSnapshot&)>;

  const SessionSnapshot& snapshot() const { return snapshot_; }
  bool connected() const { return snapshot_.connected; }

  // Replace the whole snapshot with one assignment. Always publishes, even
  // when nothing differs, so observers see every status refresh.
  SessionChange replace(SessionSnapshot next, ChangeSource source);

  // Publishes only if the value actually changes.
  SessionChange set_pairing_in_progress(bool value, ChangeSource source);

  utils::SubscriptionId subscribe(Listener listener);
  bool unsubscribe(utils::SubscriptionId id);

 private:
  SessionSnapshot snapshot_;
  utils::SubscriberList<const SessionChange&, const SessionSnapshot&> listeners_;
};

}  // namespace tvlink::remote
