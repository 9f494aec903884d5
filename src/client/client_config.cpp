#include "client/client_config.h"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <CLI/CLI.hpp>

#include "common/logging/logger.h"
#include "transport/http/http_message.h"

namespace tvlink::client {

namespace {
// Simple INI parser for configuration files.
bool parse_ini_value(const std::string& line, std::string& key, std::string& value) {
  // Skip comments and empty lines.
  if (line.empty() || line[0] == '#' || line[0] == ';') {
    return false;
  }

  // Skip section headers.
  if (line[0] == '[') {
    return false;
  }

  // Find '=' delimiter.
  auto pos = line.find('=');
  if (pos == std::string::npos) {
    return false;
  }

  key = line.substr(0, pos);
  value = line.substr(pos + 1);

  // Trim whitespace.
  while (!key.empty() && (key.back() == ' ' || key.back() == '\t')) {
    key.pop_back();
  }
  while (!key.empty() && (key.front() == ' ' || key.front() == '\t')) {
    key.erase(0, 1);
  }
  while (!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\r')) {
    value.pop_back();
  }
  while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
    value.erase(0, 1);
  }

  return !key.empty();
}

std::string get_current_section(const std::string& line) {
  std::string trimmed = line;
  while (!trimmed.empty() && (trimmed.back() == '\r' || trimmed.back() == ' ')) {
    trimmed.pop_back();
  }
  if (trimmed.size() >= 2 && trimmed.front() == '[' && trimmed.back() == ']') {
    return trimmed.substr(1, trimmed.size() - 2);
  }
  return "";
}

bool parse_bool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes" || value == "on";
}

std::chrono::milliseconds parse_ms(const std::string& value) {
  return std::chrono::milliseconds(std::stol(value));
}

// Applies one key of the file; returns false for unknown keys.
bool apply_value(const std::string& section, const std::string& key, const std::string& value,
                 ClientConfig& config) {
  auto& session = config.session;
  if (section == "gateway") {
    if (key == "url") {
      config.gateway_url = value;
    } else if (key == "request_timeout_ms") {
      config.gateway.request_timeout = parse_ms(value);
    } else if (key == "long_poll_timeout_ms") {
      config.gateway.long_poll_timeout = parse_ms(value);
    } else {
      return false;
    }
  } else if (section == "polling") {
    if (key == "base_interval_ms") {
      session.polling.base_interval = parse_ms(value);
    } else if (key == "fast_interval_ms") {
      session.polling.fast_interval = parse_ms(value);
    } else {
      return false;
    }
  } else if (section == "events") {
    if (key == "error_backoff_ms") {
      session.events.error_backoff = parse_ms(value);
    } else if (key == "background_delay_ms") {
      session.events.background_delay = parse_ms(value);
    } else if (key == "disconnected_recheck_ms") {
      session.events.disconnected_recheck = parse_ms(value);
    } else {
      return false;
    }
  } else if (section == "input") {
    if (key == "auto_enter") {
      session.auto_enter = parse_bool(value);
    } else if (key == "feedback") {
      config.feedback = parse_bool(value);
    } else {
      return false;
    }
  } else if (section == "state") {
    if (key == "file") {
      session.state_file = value;
    } else {
      return false;
    }
  } else if (section == "log") {
    if (key == "level") {
      config.log_level = value;
    } else if (key == "file") {
      config.log_file = value;
    } else {
      return false;
    }
  } else {
    return false;
  }
  return true;
}
}  // namespace

std::string default_state_file() {
  if (const char* state_home = std::getenv("XDG_STATE_HOME"); state_home != nullptr && *state_home != '\0') {
    return std::string(state_home) + "/tvlink/state";
  }
  if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return std::string(home) + "/.local/state/tvlink/state";
  }
  return {};
}

bool parse_args(int argc, char* argv[], ClientConfig& config, std::error_code& ec) {
  // The configuration file is read first so that command-line values can
  // override it.
  {
    CLI::App pre;
    pre.allow_extras();
    pre.set_help_flag();
    pre.add_option("-c,--config", config.config_file);
    try {
      pre.parse(argc, argv);
    } catch (const CLI::ParseError&) {
      // Reported by the full parse below.
    }
  }
  if (!config.config_file.empty() && !load_config_file(config.config_file, config, ec)) {
    return false;
  }

  CLI::App app{"tvlink remote control client"};
  app.set_version_flag("--version", std::string("tvlink-client ") + kVersion);

  // General options.
  app.add_option("-c,--config", config.config_file, "Configuration file path");
  app.add_flag("-v,--verbose", config.verbose, "Enable verbose logging");

  // Gateway.
  app.add_option("-g,--gateway", config.gateway_url, "Gateway base URL (http://host:port/prefix/)")
      ->capture_default_str();
  std::int64_t request_timeout_ms = config.gateway.request_timeout.count();
  auto* request_timeout_opt =
      app.add_option("--request-timeout-ms", request_timeout_ms, "Timeout of gateway commands")
          ->check(CLI::PositiveNumber);
  std::int64_t long_poll_timeout_ms = config.gateway.long_poll_timeout.count();
  auto* long_poll_timeout_opt =
      app.add_option("--long-poll-timeout-ms", long_poll_timeout_ms, "Timeout of event long-polls")
          ->check(CLI::PositiveNumber);

  // Polling.
  std::int64_t base_interval_ms = config.session.polling.base_interval.count();
  auto* base_interval_opt =
      app.add_option("--poll-interval-ms", base_interval_ms, "Status poll interval")
          ->check(CLI::PositiveNumber);
  std::int64_t fast_interval_ms = config.session.polling.fast_interval.count();
  auto* fast_interval_opt =
      app.add_option("--fast-poll-interval-ms", fast_interval_ms,
                     "Status poll interval while connecting or pairing")
          ->check(CLI::PositiveNumber);

  // Input.
  app.add_flag("--auto-enter,!--no-auto-enter", config.session.auto_enter,
               "Press Enter after submitting text");
  app.add_flag("--feedback", config.feedback, "Ring the terminal bell after successful actions");
  app.add_option("--state-file", config.session.state_file, "File keeping the mute state");

  // Logging.
  app.add_option("--log-level", config.log_level, "trace, debug, info, warn, error, off")
      ->check(CLI::IsMember({"trace", "debug", "info", "warn", "warning", "error", "critical", "off"}));
  app.add_option("--log-file", config.log_file, "Log file path");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    const int code = app.exit(e);
    ec = code == 0 ? std::make_error_code(std::errc::operation_canceled)
                   : std::make_error_code(std::errc::invalid_argument);
    return false;
  }

  if (request_timeout_opt->count() > 0) {
    config.gateway.request_timeout = std::chrono::milliseconds(request_timeout_ms);
  }
  if (long_poll_timeout_opt->count() > 0) {
    config.gateway.long_poll_timeout = std::chrono::milliseconds(long_poll_timeout_ms);
  }
  if (base_interval_opt->count() > 0) {
    config.session.polling.base_interval = std::chrono::milliseconds(base_interval_ms);
  }
  if (fast_interval_opt->count() > 0) {
    config.session.polling.fast_interval = std::chrono::milliseconds(fast_interval_ms);
  }

  if (config.verbose) {
    config.log_level = "debug";
  }
  if (config.session.state_file.empty()) {
    config.session.state_file = default_state_file();
  }

  return true;
}

bool load_config_file(const std::string& path, ClientConfig& config, std::error_code& ec) {
  std::ifstream file(path);
  if (!file) {
    ec = std::error_code(errno, std::generic_category());
    LOG_ERROR("Failed to open config file: {}", path);
    return false;
  }

  std::string line;
  std::string section;
  int line_number = 0;

  while (std::getline(file, line)) {
    ++line_number;

    // Check for section header.
    std::string new_section = get_current_section(line);
    if (!new_section.empty()) {
      section = new_section;
      continue;
    }

    // Parse key-value pair.
    std::string key;
    std::string value;
    if (!parse_ini_value(line, key, value)) {
      continue;
    }

    try {
      if (!apply_value(section, key, value, config)) {
        LOG_WARN("{}:{}: unknown setting [{}] {}", path, line_number, section, key);
      }
    } catch (const std::invalid_argument&) {
      ec = std::make_error_code(std::errc::invalid_argument);
      LOG_ERROR("{}:{}: invalid value for {}: {}", path, line_number, key, value);
      return false;
    } catch (const std::out_of_range&) {
      ec = std::make_error_code(std::errc::result_out_of_range);
      LOG_ERROR("{}:{}: value out of range for {}: {}", path, line_number, key, value);
      return false;
    }
  }

  LOG_DEBUG("Loaded configuration from {}", path);
  return true;
}

bool validate_config(const ClientConfig& config, std::string& error) {
  if (config.gateway_url.empty()) {
    error = "Gateway URL is required";
    return false;
  }

  if (!http::parse_url(config.gateway_url)) {
    error = "Gateway URL must be of the form http://host[:port][/path]";
    return false;
  }

  const auto& session = config.session;
  const std::chrono::milliseconds intervals[] = {
      config.gateway.request_timeout,   config.gateway.long_poll_timeout,
      session.polling.base_interval,    session.polling.fast_interval,
      session.events.error_backoff,     session.events.disconnected_recheck,
  };
  for (const auto interval : intervals) {
    if (interval.count() <= 0) {
      error = "Timeouts and intervals must be positive";
      return false;
    }
  }

  try {
    (void)logging::parse_log_level(config.log_level);
  } catch (const std::invalid_argument& e) {
    error = e.what();
    return false;
  }

  if (session.events.background_delay.count() < 0) {
    error = "Background delay must not be negative";
    return false;
  }

  return true;
}

}  // namespace tvlink::client
