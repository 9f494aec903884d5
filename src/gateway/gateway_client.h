#pragma once

#include <functional>
#include <optional>
#include <string>
#include <system_error>

#include "gateway/gateway_protocol.h"

namespace tvlink::gateway {

// Outcome of a user-initiated gateway command.
struct CommandResult {
  std::error_code ec;   // Empty on success; otherwise in the tvlink.remote category.
  std::string message;  // User-facing text when ec is set.

  bool ok() const { return !ec; }
};

using StatusHandler = std::function<void(const std::error_code& ec, StatusReport status)>;
using CommandHandler = std::function<void(const CommandResult& result)>;
// event is std::nullopt when the long-poll ended without an event.
using EventHandler =
    std::function<void(const std::error_code& ec, std::optional<DeviceEvent> event)>;

// Asynchronous access to the remote-control gateway.
// Handlers are invoked on the event loop thread, never from within the
// call that started the request, and never after cancel_all().
class GatewayClient {
 public:
  virtual ~GatewayClient() = default;

  virtual void fetch_status(StatusHandler handler) = 0;
  virtual void connect(CommandHandler handler) = 0;
  virtual void send_key(const std::string& key, CommandHandler handler) = 0;
  virtual void launch_app(const std::string& app_id, CommandHandler handler) = 0;
  virtual void submit_pairing_code(const std::string& code, CommandHandler handler) = 0;
  virtual void send_text(const std::string& text, bool enter, CommandHandler handler) = 0;

  // Long-poll for the next device-initiated event.
  virtual void poll_event(EventHandler handler) = 0;

  virtual void cancel_all() = 0;
};

}  // namespace tvlink::gateway
