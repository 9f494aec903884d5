#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <unordered_map>
#include <vector>

namespace tvlink::signal {

// Supported signals.
enum class Signal {
  kInterrupt = SIGINT,   // Ctrl+C.
  kTerminate = SIGTERM,  // kill command.
  kHangup = SIGHUP,      // Controlling terminal went away.
};

// Signal handler callback type.
using SignalCallback = std::function<void(Signal)>;

// Process-wide signal handler manager.
// The async-signal handler only records the signal and writes one byte to
// a self-pipe; callbacks run later from dispatch_pending(), normally
// called by an event loop watching wake_fd().
class SignalHandler {
 public:
  // Get singleton instance.
  static SignalHandler& instance();

  // Register a callback for a specific signal.
  // Multiple callbacks can be registered for the same signal.
  void on(Signal sig, SignalCallback callback);

  // Check if a signal was received and not yet dispatched.
  bool is_signaled(Signal sig) const;

  // Check if any termination signal was received.
  bool should_terminate() const;

  // Read end of the self-pipe; readable whenever a signal is pending.
  // Returns -1 before setup_defaults().
  int wake_fd() const { return wake_pipe_[0]; }

  // Drain the self-pipe and run callbacks for every recorded signal.
  void dispatch_pending();

  // Ignore SIGPIPE, create the self-pipe and handle SIGINT/SIGTERM/SIGHUP.
  bool setup_defaults();

  // Restore original signal handlers and close the self-pipe.
  void restore();

  SignalHandler(const SignalHandler&) = delete;
  SignalHandler& operator=(const SignalHandler&) = delete;
  SignalHandler(SignalHandler&&) = delete;
  SignalHandler& operator=(SignalHandler&&) = delete;

 private:
  SignalHandler() = default;
  ~SignalHandler();

  void install_handler(Signal sig);
  static void signal_handler(int signum);
  static std::atomic<bool>* flag_for(int signum);

  std::unordered_map<int, std::vector<SignalCallback>> callbacks_;
  std::unordered_map<int, struct sigaction> original_handlers_;
  struct sigaction original_sigpipe_ {};
  bool sigpipe_saved_{false};

  static std::atomic<bool> interrupt_flag_;
  static std::atomic<bool> terminate_flag_;
  static std::atomic<bool> hangup_flag_;
  static int wake_write_fd_;

  int wake_pipe_[2]{-1, -1};
};

}  // namespace tvlink::signal
