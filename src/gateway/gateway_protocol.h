#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace tvlink::gateway {

// Device name shown until the gateway reports one.
inline constexpr const char* kDefaultDeviceName = "Android TV";

// ============================================================================
// Status
// ============================================================================

struct AppEntry {
  std::string name;
  std::string id;
  std::string icon;

  bool operator==(const AppEntry&) const = default;
};

// Body of GET api/status.
struct StatusReport {
  bool connected{false};
  std::string tv_name{kDefaultDeviceName};
  std::vector<AppEntry> apps;
  bool pairing_in_progress{false};
  bool connecting{false};
};

// ============================================================================
// Device events
// ============================================================================

enum class DeviceEventType : std::uint8_t {
  kImeShow,  // The device opened a text-entry surface.
  kOther,    // Any event type this client does not interpret.
};

const char* device_event_type_to_string(DeviceEventType type);
DeviceEventType device_event_type_from_string(std::string_view name);

// One event delivered by GET api/events.
struct DeviceEvent {
  DeviceEventType type{DeviceEventType::kOther};
  std::string type_name;  // As sent by the gateway.
  nlohmann::json data;
};

// Current text of the device's text field carried by an IME show event.
std::optional<std::string> ime_value(const DeviceEvent& event);

// ============================================================================
// JSON conversion
// ============================================================================

void to_json(nlohmann::json& j, const AppEntry& app);
void from_json(const nlohmann::json& j, AppEntry& app);
void to_json(nlohmann::json& j, const StatusReport& status);
void from_json(const nlohmann::json& j, StatusReport& status);

// Decode a status body. Missing fields take their defaults; returns
// std::nullopt if the body is not a JSON object.
std::optional<StatusReport> parse_status(std::string_view body);

// Decode an event body. Returns std::nullopt if it is not an object with a
// string "type".
std::optional<DeviceEvent> parse_event(std::string_view body);

// The "error" field of a rejection body, or an empty string.
std::string parse_error_message(std::string_view body);

// ============================================================================
// Request bodies
// ============================================================================

std::string make_key_body(const std::string& key);
std::string make_launch_app_body(const std::string& app_id);
std::string make_pairing_code_body(const std::string& code);
std::string make_text_body(const std::string& text, bool enter);

}  // namespace tvlink::gateway
