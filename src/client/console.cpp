#include "client/console.h"

#include <sys/epoll.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>

#include "common/cli/cli_utils.h"
#include "common/logging/logger.h"
#include "remote/key_map.h"

namespace tvlink::client {

namespace {
std::string trim(const std::string& str) {
  const auto start = str.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  const auto end = str.find_last_not_of(" \t\r\n");
  return str.substr(start, end - start + 1);
}

std::string to_lower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return str;
}

void print_session_change(const remote::SessionChange& change,
                          const remote::SessionSnapshot& snapshot) {
  if (change.has(remote::SessionField::kConnected)) {
    if (snapshot.connected) {
      cli::print_success("Connected to " + snapshot.device_name);
    } else {
      cli::print_warning("Disconnected from " + snapshot.device_name);
    }
  } else if (change.has(remote::SessionField::kConnecting) && snapshot.connecting) {
    cli::print_info("Connecting to " + snapshot.device_name + "...");
  }
  if (change.has(remote::SessionField::kApps) && !snapshot.apps.empty()) {
    cli::print_info(std::to_string(snapshot.apps.size()) + " app(s) available, type 'apps'");
  }
}

void print_notice(remote::NoticeEvent event, const remote::Notice& notice) {
  if (event != remote::NoticeEvent::kPosted) {
    return;
  }
  if (notice.severity == remote::NoticeSeverity::kError) {
    cli::print_error(notice.message);
  } else {
    cli::print_info(notice.message);
  }
}

void print_pairing_phase(remote::PairingPhase phase) {
  switch (phase) {
    case remote::PairingPhase::kCodeEntry:
      cli::print_warning("The TV shows a pairing code. Enter it with: pair <code>");
      break;
    case remote::PairingPhase::kSubmitting:
      cli::print_info("Submitting pairing code...");
      break;
    case remote::PairingPhase::kIdle:
      break;
  }
}
}  // namespace

std::pair<std::string, std::string> split_command(const std::string& line) {
  const auto trimmed = trim(line);
  const auto space = trimmed.find_first_of(" \t");
  if (space == std::string::npos) {
    return {to_lower(trimmed), ""};
  }
  return {to_lower(trimmed.substr(0, space)), trim(trimmed.substr(space + 1))};
}

Console::Console(event::EventLoop& loop, remote::RemoteSession& session)
    : loop_(loop), session_(session) {
  state_subscription_ = session_.state().subscribe(print_session_change);
  notice_subscription_ = session_.notices().subscribe(print_notice);
  pairing_subscription_ = session_.pairing().subscribe(print_pairing_phase);
}

Console::~Console() {
  close();
  session_.state().unsubscribe(state_subscription_);
  session_.notices().unsubscribe(notice_subscription_);
  session_.pairing().unsubscribe(pairing_subscription_);
}

bool Console::open(int fd, std::error_code& ec) {
  if (!loop_.watch(fd, EPOLLIN | EPOLLRDHUP, [this](std::uint32_t) { on_readable(); }, ec)) {
    return false;
  }
  fd_ = fd;
  return true;
}

void Console::close() {
  if (fd_ >= 0) {
    loop_.unwatch(fd_);
    fd_ = -1;
  }
}

void Console::quit() {
  close();
  if (on_quit_) {
    on_quit_();
  }
}

void Console::print_prompt() const {
  std::cout << cli::colorize("tvlink> ", cli::colors::kBold) << std::flush;
}

void Console::on_readable() {
  std::array<char, 1024> chunk{};
  const auto n = ::read(fd_, chunk.data(), chunk.size());
  if (n < 0) {
    if (errno == EINTR || errno == EAGAIN) {
      return;
    }
    LOG_ERROR("Failed to read commands: {}", std::strerror(errno));
    quit();
    return;
  }
  if (n == 0) {
    LOG_DEBUG("End of input");
    quit();
    return;
  }

  buffer_.append(chunk.data(), static_cast<std::size_t>(n));
  std::size_t newline = 0;
  while ((newline = buffer_.find('\n')) != std::string::npos) {
    const std::string line = buffer_.substr(0, newline);
    buffer_.erase(0, newline + 1);
    if (!execute(line)) {
      quit();
      return;
    }
  }
  print_prompt();
}

bool Console::execute(const std::string& line) {
  const auto [command, args] = split_command(line);
  auto& text = session_.text();

  if (command.empty()) {
    return true;
  }
  if (command == "quit" || command == "exit") {
    return false;
  }
  if (command == "help" || command == "?") {
    print_help();
  } else if (command == "shortcuts") {
    print_shortcuts();
  } else if (command == "connect") {
    session_.poller().connect();
  } else if (command == "status") {
    session_.poller().poll();
    print_status();
  } else if (command == "apps") {
    print_apps();
  } else if (command == "app") {
    launch(args);
  } else if (command == "key") {
    send_key(args);
  } else if (command == "pair") {
    session_.pairing().submit(args);
  } else if (command == "cancel") {
    if (!session_.pairing().cancel()) {
      cli::print_warning("Pairing code already submitted");
    }
  } else if (command == "type") {
    text.on_edit(args);
  } else if (command == "append") {
    text.on_edit(text.current() + args);
  } else if (command == "backspace") {
    int count = 1;
    if (!args.empty()) {
      try {
        count = std::stoi(args);
      } catch (const std::exception&) {
        cli::print_error("Usage: backspace [count]");
        return true;
      }
    }
    for (int i = 0; i < count; ++i) {
      text.backspace();
    }
  } else if (command == "enter") {
    text.press_enter();
  } else if (command == "submit") {
    if (!text.submit_all()) {
      cli::print_warning("Nothing to submit");
    }
  } else if (command == "clear") {
    text.clear();
  } else if (command == "autoenter") {
    if (args == "on") {
      text.set_auto_enter(true);
    } else if (args == "off") {
      text.set_auto_enter(false);
    } else {
      cli::print_error("Usage: autoenter on|off");
      return true;
    }
    cli::print_info(std::string("Auto enter ") + (text.auto_enter() ? "on" : "off"));
  } else if (remote::resolve_key(command)) {
    send_key(command);
  } else {
    cli::print_error("Unknown command '" + command + "', type 'help'");
  }
  return true;
}

void Console::send_key(const std::string& name) {
  auto key = remote::resolve_key(name);
  if (!key) {
    cli::print_error("Unknown key '" + name + "', type 'shortcuts'");
    return;
  }
  session_.keys().send(*key);
}

void Console::launch(const std::string& target) {
  if (target.empty()) {
    cli::print_error("Usage: app <id|name>");
    return;
  }
  const auto& apps = session_.state().snapshot().apps;
  const auto wanted = to_lower(target);
  auto it = std::find_if(apps.begin(), apps.end(), [&](const gateway::AppEntry& app) {
    return app.id == target || to_lower(app.name) == wanted;
  });
  session_.keys().launch_app(it != apps.end() ? it->id : target);
}

void Console::print_status() const {
  const auto& snapshot = session_.state().snapshot();
  cli::print_section("Status");
  cli::print_row_colored("Device", snapshot.device_name, cli::colors::kBrightWhite);
  cli::print_row_colored("Connected", snapshot.connected ? "yes" : "no",
                         snapshot.connected ? cli::colors::kBrightGreen : cli::colors::kBrightRed);
  cli::print_row("Connecting", snapshot.connecting ? "yes" : "no");
  cli::print_row("Pairing", remote::pairing_phase_to_string(session_.pairing().phase()));
  cli::print_row("Muted", session_.mute().muted() ? "yes" : "no");
  cli::print_row("Polling", remote::poll_cadence_to_string(session_.poller().cadence()));
  cli::print_row("Auto enter", session_.text().auto_enter() ? "on" : "off");
  cli::print_row("Text", "\"" + session_.text().current() + "\"");
}

void Console::print_apps() const {
  const auto& apps = session_.state().snapshot().apps;
  if (apps.empty()) {
    cli::print_info("No apps reported by the gateway");
    return;
  }
  cli::print_section("Apps");
  for (const auto& app : apps) {
    cli::print_row(app.name, app.id);
  }
}

void Console::print_shortcuts() const {
  cli::print_section("Shortcuts");
  for (const auto& [names, key] : remote::shortcut_table()) {
    cli::print_row(names, key);
  }
  std::cout << "  Any KEYCODE_* name is sent as is.\n";
}

void Console::print_help() const {
  cli::print_section("Commands");
  cli::print_row("connect", "Ask the gateway to connect to the TV");
  cli::print_row("status", "Refresh and show the session status");
  cli::print_row("apps", "List launchable apps");
  cli::print_row("app <id|name>", "Launch an app");
  cli::print_row("key <name>", "Send a key (shortcut or KEYCODE_*)");
  cli::print_row("<shortcut>", "Send a shortcut key directly, see 'shortcuts'");
  cli::print_row("pair <code>", "Submit the pairing code shown on the TV");
  cli::print_row("cancel", "Dismiss the pairing prompt");
  cli::print_row("type <text>", "Replace the text buffer and sync it");
  cli::print_row("append <text>", "Append to the text buffer");
  cli::print_row("backspace [n]", "Delete characters (DEL on the TV if empty)");
  cli::print_row("enter", "Press Enter in the TV's text field");
  cli::print_row("submit", "Send the whole buffer at once");
  cli::print_row("clear", "Forget the text buffer");
  cli::print_row("autoenter on|off", "Press Enter after submit");
  cli::print_row("quit", "Exit");
}

}  // namespace tvlink::client
