#pragma once

#include <functional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "common/event_loop/event_loop.h"
#include "common/utils/subscriber_list.h"
#include "remote/remote_session.h"

namespace tvlink::client {

// Line-oriented command console on a terminal or pipe, driven by the event
// loop. Prints session changes, pairing prompts and notices as they happen.
class Console {
 public:
  Console(event::EventLoop& loop, remote::RemoteSession& session);
  ~Console();

  Console(const Console&) = delete;
  Console& operator=(const Console&) = delete;

  // Start reading commands from fd.
  bool open(int fd, std::error_code& ec);
  void close();

  // Run one command line. Returns false once the user asked to quit.
  bool execute(const std::string& line);

  // Called when the user quits or input ends.
  void on_quit(std::function<void()> callback) { on_quit_ = std::move(callback); }

  void print_prompt() const;

 private:
  void on_readable();
  void quit();

  void print_help() const;
  void print_shortcuts() const;
  void print_status() const;
  void print_apps() const;
  void launch(const std::string& target);
  void send_key(const std::string& name);

  event::EventLoop& loop_;
  remote::RemoteSession& session_;
  int fd_{-1};
  std::string buffer_;
  std::function<void()> on_quit_;

  utils::SubscriptionId state_subscription_{utils::kInvalidSubscriptionId};
  utils::SubscriptionId notice_subscription_{utils::kInvalidSubscriptionId};
  utils::SubscriptionId pairing_subscription_{utils::kInvalidSubscriptionId};
};

// Split a command line into the command word and the rest of the line.
std::pair<std::string, std::string> split_command(const std::string& line);

}  // namespace tvlink::client
