#pragma once

#include <chrono>
#include <string>

#include "common/event_loop/event_loop.h"
#include "gateway/gateway_client.h"
#include "transport/http/http_client.h"
#include "transport/http/http_message.h"

namespace tvlink::gateway {

struct HttpGatewayOptions {
  std::chrono::milliseconds request_timeout{10000};
  // Must exceed the gateway's own long-poll hold time.
  std::chrono::milliseconds long_poll_timeout{65000};
};

// GatewayClient speaking the gateway's JSON-over-HTTP API.
// Paths are resolved against the base URL, so a gateway mounted under a
// prefix ("http://host:7503/remote/") works unchanged.
class HttpGatewayClient : public GatewayClient {
 public:
  HttpGatewayClient(event::EventLoop& loop, http::Url base, HttpGatewayOptions options = {});

  void fetch_status(StatusHandler handler) override;
  void connect(CommandHandler handler) override;
  void send_key(const std::string& key, CommandHandler handler) override;
  void launch_app(const std::string& app_id, CommandHandler handler) override;
  void submit_pairing_code(const std::string& code, CommandHandler handler) override;
  void send_text(const std::string& text, bool enter, CommandHandler handler) override;
  void poll_event(EventHandler handler) override;
  void cancel_all() override;

  std::size_t in_flight() const { return http_.in_flight(); }

 private:
  http::HttpRequest make_request(http::Method method, const char* path, std::string body) const;

  // POST a command and translate the response into a CommandResult.
  // failure_message is used when the gateway gives no reason.
  void post_command(const char* path, std::string body, const char* failure_message,
                    CommandHandler handler);

  http::HttpClient http_;
  HttpGatewayOptions options_;
};

}  // namespace tvlink::gateway
