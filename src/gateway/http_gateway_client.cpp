#include "gateway/http_gateway_client.h"

#include <utility>

#include "common/error/remote_error.h"
#include "common/logging/logger.h"

namespace tvlink::gateway {

namespace {
constexpr const char* kStatusPath = "api/status";
constexpr const char* kConnectPath = "api/connect";
constexpr const char* kSendKeyPath = "api/send_key";
constexpr const char* kLaunchAppPath = "api/launch_app";
constexpr const char* kPairingCodePath = "api/pairing_code";
constexpr const char* kSendTextPath = "api/send_text";
constexpr const char* kEventsPath = "api/events";
}  // namespace

HttpGatewayClient::HttpGatewayClient(event::EventLoop& loop, http::Url base,
                                     HttpGatewayOptions options)
    : http_(loop, std::move(base)), options_(options) {}

http::HttpRequest HttpGatewayClient::make_request(http::Method method, const char* path,
                                                  std::string body) const {
  http::HttpRequest request;
  request.method = method;
  request.target = http::join_path(http_.endpoint(), path);
  request.host = http::host_header(http_.endpoint());
  request.headers.emplace_back("Accept", "application/json");
  if (method == http::Method::kPost) {
    request.headers.emplace_back("Content-Type", "application/json");
  }
  request.body = std::move(body);
  return request;
}

void HttpGatewayClient::fetch_status(StatusHandler handler) {
  http_.send(make_request(http::Method::kGet, kStatusPath, {}), options_.request_timeout,
             [handler = std::move(handler)](const std::error_code& ec,
                                            http::HttpResponse response) {
               if (ec) {
                 handler(error::classify(ec), StatusReport{});
                 return;
               }
               if (!response.ok()) {
                 LOG_DEBUG("Status request answered with HTTP {}", response.status);
                 handler(error::make_error_code(error::Errc::kGatewayRejected), StatusReport{});
                 return;
               }
               auto status = parse_status(response.body);
               if (!status) {
                 LOG_DEBUG("Status body is not a JSON object");
                 handler(error::make_error_code(error::Errc::kTransport), StatusReport{});
                 return;
               }
               handler({}, std::move(*status));
             });
}

void HttpGatewayClient::post_command(const char* path, std::string body,
                                     const char* failure_message, CommandHandler handler) {
  http_.send(make_request(http::Method::kPost, path, std::move(body)), options_.request_timeout,
             [path, failure_message, handler = std::move(handler)](
                 const std::error_code& ec, http::HttpResponse response) {
               CommandResult result;
               if (ec) {
                 LOG_DEBUG("{} failed: {}", path, ec.message());
                 result.ec = error::classify(ec);
                 result.message = failure_message;
               } else if (!response.ok()) {
                 result.ec = error::make_error_code(error::Errc::kGatewayRejected);
                 result.message = parse_error_message(response.body);
                 if (result.message.empty()) {
                   result.message = failure_message;
                 }
                 LOG_DEBUG("{} rejected with HTTP {}: {}", path, response.status, result.message);
               }
               handler(result);
             });
}

void HttpGatewayClient::connect(CommandHandler handler) {
  post_command(kConnectPath, {}, "Failed to connect to server", std::move(handler));
}

void HttpGatewayClient::send_key(const std::string& key, CommandHandler handler) {
  post_command(kSendKeyPath, make_key_body(key), "Failed to send key", std::move(handler));
}

void HttpGatewayClient::launch_app(const std::string& app_id, CommandHandler handler) {
  post_command(kLaunchAppPath, make_launch_app_body(app_id), "Failed to launch app",
               std::move(handler));
}

void HttpGatewayClient::submit_pairing_code(const std::string& code, CommandHandler handler) {
  post_command(kPairingCodePath, make_pairing_code_body(code), "Failed to submit pairing code",
               std::move(handler));
}

void HttpGatewayClient::send_text(const std::string& text, bool enter, CommandHandler handler) {
  post_command(kSendTextPath, make_text_body(text, enter), "Failed to send text",
               std::move(handler));
}

void HttpGatewayClient::poll_event(EventHandler handler) {
  http_.send(make_request(http::Method::kGet, kEventsPath, {}), options_.long_poll_timeout,
             [handler = std::move(handler)](const std::error_code& ec,
                                            http::HttpResponse response) {
               if (ec) {
                 handler(error::classify(ec), std::nullopt);
                 return;
               }
               if (!response.ok()) {
                 handler(error::make_error_code(error::Errc::kGatewayRejected), std::nullopt);
                 return;
               }
               if (response.status == 204 || response.body.empty()) {
                 handler({}, std::nullopt);
                 return;
               }
               auto event = parse_event(response.body);
               if (!event) {
                 handler(error::make_error_code(error::Errc::kTransport), std::nullopt);
                 return;
               }
               handler({}, std::move(event));
             });
}

void HttpGatewayClient::cancel_all() { http_.cancel_all(); }

}  // namespace tvlink::gateway
