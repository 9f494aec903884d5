#include <sys/epoll.h>
#include <unistd.h>

#include <cstdlib>
#include <iostream>
#include <utility>

#include "client/client_config.h"
#include "client/console.h"
#include "common/cli/cli_utils.h"
#include "common/event_loop/event_loop.h"
#include "common/logging/logger.h"
#include "common/signal/signal_handler.h"
#include "gateway/http_gateway_client.h"
#include "remote/remote_session.h"
#include "transport/http/http_message.h"

using namespace tvlink;

namespace {
// Helper functions to avoid LOG_* macros in lambdas (clang-tidy bugprone-lambda-function-name).
void log_signal(signal::Signal sig) {
  switch (sig) {
    case signal::Signal::kInterrupt:
      LOG_INFO("Received SIGINT, shutting down...");
      break;
    case signal::Signal::kTerminate:
      LOG_INFO("Received SIGTERM, shutting down...");
      break;
    case signal::Signal::kHangup:
      LOG_INFO("Received SIGHUP, shutting down...");
      break;
  }
}

// The surface counts as visible while this process owns the terminal.
bool in_foreground() {
  const pid_t foreground = ::tcgetpgrp(STDIN_FILENO);
  return foreground < 0 || foreground == ::getpgrp();
}

void ring_bell(remote::FeedbackPattern) { std::cout << '\a' << std::flush; }
}  // namespace

int main(int argc, char* argv[]) {
  // Parse configuration.
  client::ClientConfig config;
  std::error_code ec;

  if (!client::parse_args(argc, argv, config, ec)) {
    if (ec == std::errc::operation_canceled) {
      return EXIT_SUCCESS;
    }
    std::cerr << "Failed to parse arguments: " << ec.message() << '\n';
    return EXIT_FAILURE;
  }

  // Validate configuration.
  std::string validation_error;
  if (!client::validate_config(config, validation_error)) {
    std::cerr << "Configuration error: " << validation_error << '\n';
    return EXIT_FAILURE;
  }

  // Initialize logging. Records go to stderr, the console owns stdout.
  logging::configure_logging(logging::parse_log_level(config.log_level), false, config.log_file);
  LOG_INFO("tvlink client starting...");

  const auto url = http::parse_url(config.gateway_url);

  event::EventLoop loop;
  if (!loop.open(ec)) {
    LOG_ERROR("Failed to create event loop: {}", ec.message());
    return EXIT_FAILURE;
  }

  // Setup signal handlers.
  auto& sig_handler = signal::SignalHandler::instance();
  if (!sig_handler.setup_defaults()) {
    return EXIT_FAILURE;
  }
  if (!loop.watch(sig_handler.wake_fd(), EPOLLIN,
                  [&sig_handler](std::uint32_t) { sig_handler.dispatch_pending(); }, ec)) {
    LOG_ERROR("Failed to watch signal pipe: {}", ec.message());
    return EXIT_FAILURE;
  }
  for (auto sig : {signal::Signal::kInterrupt, signal::Signal::kTerminate, signal::Signal::kHangup}) {
    sig_handler.on(sig, [&loop](signal::Signal received) {
      log_signal(received);
      loop.stop();
    });
  }

  gateway::HttpGatewayClient gateway(loop, *url, config.gateway);
  remote::FeedbackSink feedback;
  if (config.feedback) {
    feedback = ring_bell;
  }
  remote::RemoteSession session(gateway, loop.timers(), config.session, in_foreground,
                                std::move(feedback));

  client::Console console(loop, session);
  console.on_quit([&loop]() { loop.stop(); });
  if (!console.open(STDIN_FILENO, ec)) {
    LOG_ERROR("Cannot read commands from stdin: {}", ec.message());
    return EXIT_FAILURE;
  }

  cli::print_banner("tvlink remote", client::kVersion);
  cli::print_info("Gateway " + config.gateway_url + ", type 'help' for commands");
  console.print_prompt();

  session.start();
  const bool clean = loop.run(ec);
  if (!clean) {
    LOG_ERROR("Event loop failed: {}", ec.message());
  }

  console.close();
  session.stop();
  loop.unwatch(sig_handler.wake_fd());
  sig_handler.restore();

  LOG_INFO("tvlink client stopped");
  return clean ? EXIT_SUCCESS : EXIT_FAILURE;
}
