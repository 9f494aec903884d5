#pragma once

#include <chrono>
#include <string>
#include <system_error>

#include "gateway/http_gateway_client.h"
#include "remote/remote_session.h"

namespace tvlink::client {

inline constexpr const char* kVersion = "1.0.0";

// Client-specific configuration.
struct ClientConfig {
  // General settings.
  std::string config_file;
  bool verbose{false};

  // Gateway connection.
  std::string gateway_url{"http://127.0.0.1:7503/"};
  gateway::HttpGatewayOptions gateway;

  // Session behaviour (polling cadence, long-poll pacing, text input).
  remote::RemoteSessionConfig session;

  // Ring the terminal bell after successful actions.
  bool feedback{false};

  // Logging.
  std::string log_level{"info"};
  std::string log_file;
};

// Default location of the mute state file ($XDG_STATE_HOME or ~/.local/state).
std::string default_state_file();

// Parse command-line arguments into configuration. Values given on the
// command line take precedence over the configuration file.
// ec is std::errc::operation_canceled when help or version was printed.
bool parse_args(int argc, char* argv[], ClientConfig& config, std::error_code& ec);

// Load configuration from INI file.
bool load_config_file(const std::string& path, ClientConfig& config, std::error_code& ec);

// Validate configuration.
bool validate_config(const ClientConfig& config, std::string& error);

}  // namespace tvlink::client
