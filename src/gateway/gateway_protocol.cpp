#include "gateway/gateway_protocol.h"

using json = nlohmann::json;

namespace tvlink::gateway {

namespace {
std::string string_field(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

bool bool_field(const json& j, const char* key) {
  auto it = j.find(key);
  return it != j.end() && it->is_boolean() && it->get<bool>();
}

std::optional<json> parse_object(std::string_view body) {
  auto j = json::parse(body.begin(), body.end(), nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return std::nullopt;
  }
  return j;
}

// Bytes that are not valid UTF-8 go out as U+FFFD.
std::string dump_body(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}
}  // namespace

// ============================================================================
// Device events
// ============================================================================

const char* device_event_type_to_string(DeviceEventType type) {
  switch (type) {
    case DeviceEventType::kImeShow: return "ime_show";
    case DeviceEventType::kOther: return "other";
  }
  return "other";
}

DeviceEventType device_event_type_from_string(std::string_view name) {
  if (name == "ime_show") return DeviceEventType::kImeShow;
  return DeviceEventType::kOther;
}

std::optional<std::string> ime_value(const DeviceEvent& event) {
  if (event.type != DeviceEventType::kImeShow || !event.data.is_object()) {
    return std::nullopt;
  }
  auto it = event.data.find("value");
  if (it == event.data.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

// ============================================================================
// JSON conversion
// ============================================================================

void to_json(json& j, const AppEntry& app) {
  j = json{
    {"name", app.name},
    {"id", app.id},
    {"icon", app.icon}
  };
}

void from_json(const json& j, AppEntry& app) {
  app.name = string_field(j, "name");
  app.id = string_field(j, "id");
  app.icon = string_field(j, "icon");
}

void to_json(json& j, const StatusReport& status) {
  j = json{
    {"connected", status.connected},
    {"tv_name", status.tv_name},
    {"apps", status.apps},
    {"pairing_in_progress", status.pairing_in_progress},
    {"connecting", status.connecting}
  };
}

// Lenient: the gateway omits fields it has no value for.
void from_json(const json& j, StatusReport& status) {
  status.connected = bool_field(j, "connected");
  status.pairing_in_progress = bool_field(j, "pairing_in_progress");
  status.connecting = bool_field(j, "connecting");

  status.tv_name = string_field(j, "tv_name");
  if (status.tv_name.empty()) {
    status.tv_name = kDefaultDeviceName;
  }

  status.apps.clear();
  auto apps = j.find("apps");
  if (apps != j.end() && apps->is_array()) {
    for (const auto& entry : *apps) {
      if (entry.is_object()) {
        status.apps.push_back(entry.get<AppEntry>());
      }
    }
  }
}

std::optional<StatusReport> parse_status(std::string_view body) {
  auto j = parse_object(body);
  if (!j) {
    return std::nullopt;
  }
  return j->get<StatusReport>();
}

std::optional<DeviceEvent> parse_event(std::string_view body) {
  auto j = parse_object(body);
  if (!j) {
    return std::nullopt;
  }
  auto type = j->find("type");
  if (type == j->end() || !type->is_string()) {
    return std::nullopt;
  }

  DeviceEvent event;
  event.type_name = type->get<std::string>();
  event.type = device_event_type_from_string(event.type_name);
  auto data = j->find("data");
  if (data != j->end()) {
    event.data = *data;
  }
  return event;
}

std::string parse_error_message(std::string_view body) {
  auto j = parse_object(body);
  if (!j) {
    return {};
  }
  return string_field(*j, "error");
}

// ============================================================================
// Request bodies
// ============================================================================

std::string make_key_body(const std::string& key) { return dump_body(json{{"key", key}}); }

std::string make_launch_app_body(const std::string& app_id) {
  return dump_body(json{{"app_id", app_id}});
}

std::string make_pairing_code_body(const std::string& code) {
  return dump_body(json{{"code", code}});
}

std::string make_text_body(const std::string& text, bool enter) {
  json j{{"text", text}};
  if (enter) {
    j["enter"] = true;
  }
  return dump_body(j);
}

}  // namespace tvlink::gateway
