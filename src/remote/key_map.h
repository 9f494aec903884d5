#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tvlink::remote {

namespace keycode {
inline constexpr const char* kDpadUp = "KEYCODE_DPAD_UP";
inline constexpr const char* kDpadDown = "KEYCODE_DPAD_DOWN";
inline constexpr const char* kDpadLeft = "KEYCODE_DPAD_LEFT";
inline constexpr const char* kDpadRight = "KEYCODE_DPAD_RIGHT";
inline constexpr const char* kDpadCenter = "KEYCODE_DPAD_CENTER";
inline constexpr const char* kBack = "KEYCODE_BACK";
inline constexpr const char* kHome = "KEYCODE_HOME";
inline constexpr const char* kMenu = "KEYCODE_MENU";
inline constexpr const char* kPower = "KEYCODE_POWER";
inline constexpr const char* kPlayPause = "KEYCODE_MEDIA_PLAY_PAUSE";
inline constexpr const char* kVolumeUp = "KEYCODE_VOLUME_UP";
inline constexpr const char* kVolumeDown = "KEYCODE_VOLUME_DOWN";
inline constexpr const char* kVolumeMute = "KEYCODE_VOLUME_MUTE";
inline constexpr const char* kEnter = "KEYCODE_ENTER";
inline constexpr const char* kDel = "KEYCODE_DEL";
}  // namespace keycode

// Translate a shortcut name ("up", "home", "vol+") to a device key code.
// Names are case-insensitive; anything already of the form KEYCODE_* is
// passed through in upper case. Returns std::nullopt for unknown names.
std::optional<std::string> resolve_key(std::string_view name);

// All shortcuts as (names, key code) for help output.
std::vector<std::pair<std::string, std::string>> shortcut_table();

}  // namespace tvlink::remote
