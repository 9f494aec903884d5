#pragma once

#include <deque>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/error/remote_error.h"
#include "gateway/gateway_client.h"

namespace tvlink::test_support {

// Scripted GatewayClient: records every call and keeps its handler until the
// test completes it.
class FakeGateway : public gateway::GatewayClient {
 public:
  struct Call {
    std::string kind;  // "status", "connect", "send_key", "launch_app", ...
    std::string arg;
    bool enter{false};
  };

  void fetch_status(gateway::StatusHandler handler) override {
    calls.push_back({"status", {}, false});
    status_handlers.push_back(std::move(handler));
  }

  void connect(gateway::CommandHandler handler) override {
    add_command({"connect", {}, false}, std::move(handler));
  }

  void send_key(const std::string& key, gateway::CommandHandler handler) override {
    add_command({"send_key", key, false}, std::move(handler));
  }

  void launch_app(const std::string& app_id, gateway::CommandHandler handler) override {
    add_command({"launch_app", app_id, false}, std::move(handler));
  }

  void submit_pairing_code(const std::string& code, gateway::CommandHandler handler) override {
    add_command({"pairing_code", code, false}, std::move(handler));
  }

  void send_text(const std::string& text, bool enter, gateway::CommandHandler handler) override {
    add_command({"send_text", text, enter}, std::move(handler));
  }

  void poll_event(gateway::EventHandler handler) override {
    calls.push_back({"events", {}, false});
    event_handlers.push_back(std::move(handler));
  }

  void cancel_all() override {
    ++cancel_all_count;
    status_handlers.clear();
    commands.clear();
    event_handlers.clear();
  }

  // Completion helpers; each answers the oldest pending request.

  void complete_status(gateway::StatusReport status) {
    auto handler = pop(status_handlers);
    handler({}, std::move(status));
  }

  void fail_status() {
    auto handler = pop(status_handlers);
    handler(error::make_error_code(error::Errc::kTransport), gateway::StatusReport{});
  }

  void complete_command() {
    auto entry = pop(commands);
    entry.second(gateway::CommandResult{});
  }

  void reject_command(const std::string& message) {
    auto entry = pop(commands);
    entry.second(gateway::CommandResult{error::make_error_code(error::Errc::kGatewayRejected), message});
  }

  void complete_event(std::optional<gateway::DeviceEvent> event) {
    auto handler = pop(event_handlers);
    handler({}, std::move(event));
  }

  void fail_event() {
    auto handler = pop(event_handlers);
    handler(error::make_error_code(error::Errc::kTransport), std::nullopt);
  }

  std::size_t count(const std::string& kind) const {
    std::size_t n = 0;
    for (const auto& call : calls) {
      if (call.kind == kind) {
        ++n;
      }
    }
    return n;
  }

  // Arguments of every call of one kind, in call order.
  std::vector<std::string> args(const std::string& kind) const {
    std::vector<std::string> result;
    for (const auto& call : calls) {
      if (call.kind == kind) {
        result.push_back(call.arg);
      }
    }
    return result;
  }

  const Call& pending_command() const { return commands.front().first; }

  std::vector<Call> calls;
  std::deque<gateway::StatusHandler> status_handlers;
  std::deque<std::pair<Call, gateway::CommandHandler>> commands;
  std::deque<gateway::EventHandler> event_handlers;
  int cancel_all_count{0};

 private:
  void add_command(Call call, gateway::CommandHandler handler) {
    calls.push_back(call);
    commands.emplace_back(std::move(call), std::move(handler));
  }

  template <typename T>
  static T pop(std::deque<T>& queue) {
    T front = std::move(queue.front());
    queue.pop_front();
    return front;
  }
};

// Status report with the given connection flags.
inline gateway::StatusReport make_status(bool connected, bool pairing = false,
                                         bool connecting = false) {
  gateway::StatusReport status;
  status.connected = connected;
  status.pairing_in_progress = pairing;
  status.connecting = connecting;
  return status;
}

}  // namespace tvlink::test_support
