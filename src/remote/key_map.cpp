#include "remote/key_map.h"

#include <algorithm>
#include <cctype>

namespace tvlink::remote {

namespace {
struct Shortcut {
  const char* name;
  const char* key;
};

constexpr Shortcut kShortcuts[] = {
    {"up", keycode::kDpadUp},
    {"down", keycode::kDpadDown},
    {"left", keycode::kDpadLeft},
    {"right", keycode::kDpadRight},
    {"ok", keycode::kDpadCenter},
    {"enter", keycode::kDpadCenter},
    {"back", keycode::kBack},
    {"esc", keycode::kBack},
    {"home", keycode::kHome},
    {"h", keycode::kHome},
    {"play", keycode::kPlayPause},
    {"space", keycode::kPlayPause},
    {"mute", keycode::kVolumeMute},
    {"vol+", keycode::kVolumeUp},
    {"vol-", keycode::kVolumeDown},
    {"power", keycode::kPower},
    {"menu", keycode::kMenu},
};

constexpr std::string_view kKeycodePrefix = "keycode_";

std::string to_lower(std::string_view str) {
  std::string result(str);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

std::string to_upper(std::string_view str) {
  std::string result(str);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return result;
}
}  // namespace

std::optional<std::string> resolve_key(std::string_view name) {
  const auto lowered = to_lower(name);
  if (lowered.size() > kKeycodePrefix.size() && lowered.compare(0, kKeycodePrefix.size(), kKeycodePrefix) == 0) {
    return to_upper(name);
  }
  for (const auto& shortcut : kShortcuts) {
    if (lowered == shortcut.name) {
      return std::string(shortcut.key);
    }
  }
  return std::nullopt;
}

std::vector<std::pair<std::string, std::string>> shortcut_table() {
  std::vector<std::pair<std::string, std::string>> table;
  for (const auto& shortcut : kShortcuts) {
    auto it = std::find_if(table.begin(), table.end(),
                           [&](const auto& row) { return row.second == shortcut.key; });
    if (it == table.end()) {
      table.emplace_back(shortcut.name, shortcut.key);
    } else {
      it->first += "|";
      it->first += shortcut.name;
    }
  }
  return table;
}

}  // namespace tvlink::remote
