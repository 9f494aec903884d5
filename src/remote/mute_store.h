#pragma once

#include <string>

namespace tvlink::remote {

// Locally tracked mute state of the device, kept in a small state file so it
// survives restarts. The device itself never reports it.
class MuteStore {
 public:
  // An empty path keeps the state in memory only.
  explicit MuteStore(std::string path = {});

  // Read the state file. A missing or unreadable file means "not muted".
  bool load();

  bool muted() const { return muted_; }

  // Update and persist. Write failures are logged, the in-memory value
  // is updated regardless.
  void set_muted(bool muted);

  bool toggle();

  const std::string& path() const { return path_; }

 private:
  bool save() const;

  std::string path_;
  bool muted_{false};
};

}  // namespace tvlink::remote
