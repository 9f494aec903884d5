#include "common/signal/signal_handler.h"

#include <fcntl.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <utility>

#include "common/logging/logger.h"

namespace tvlink::signal {

// Static flag definitions.
std::atomic<bool> SignalHandler::interrupt_flag_{false};
std::atomic<bool> SignalHandler::terminate_flag_{false};
std::atomic<bool> SignalHandler::hangup_flag_{false};
int SignalHandler::wake_write_fd_{-1};

SignalHandler& SignalHandler::instance() {
  static SignalHandler handler;
  return handler;
}

SignalHandler::~SignalHandler() { restore(); }

std::atomic<bool>* SignalHandler::flag_for(int signum) {
  switch (signum) {
    case SIGINT:
      return &interrupt_flag_;
    case SIGTERM:
      return &terminate_flag_;
    case SIGHUP:
      return &hangup_flag_;
    default:
      return nullptr;
  }
}

void SignalHandler::signal_handler(int signum) {
  const int saved_errno = errno;
  if (auto* flag = flag_for(signum)) {
    flag->store(true, std::memory_order_release);
  }
  if (wake_write_fd_ >= 0) {
    const char byte = 1;
    // Pipe full means a wakeup is already pending.
    [[maybe_unused]] const auto n = ::write(wake_write_fd_, &byte, 1);
  }
  errno = saved_errno;
}

void SignalHandler::install_handler(Signal sig) {
  const int signum = static_cast<int>(sig);

  if (original_handlers_.find(signum) == original_handlers_.end()) {
    struct sigaction old_action {};
    if (sigaction(signum, nullptr, &old_action) == 0) {
      original_handlers_[signum] = old_action;
    }
  }

  struct sigaction action {};
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = SA_RESTART;

  if (sigaction(signum, &action, nullptr) != 0) {
    LOG_ERROR("Failed to install signal handler for signal {}", signum);
  }
}

void SignalHandler::on(Signal sig, SignalCallback callback) {
  const int signum = static_cast<int>(sig);
  if (original_handlers_.find(signum) == original_handlers_.end()) {
    install_handler(sig);
  }
  callbacks_[signum].push_back(std::move(callback));
  LOG_DEBUG("Registered callback for signal {}", signum);
}

bool SignalHandler::is_signaled(Signal sig) const {
  const auto* flag = flag_for(static_cast<int>(sig));
  return flag != nullptr && flag->load(std::memory_order_acquire);
}

bool SignalHandler::should_terminate() const {
  return interrupt_flag_.load(std::memory_order_acquire) ||
         terminate_flag_.load(std::memory_order_acquire) ||
         hangup_flag_.load(std::memory_order_acquire);
}

void SignalHandler::dispatch_pending() {
  if (wake_pipe_[0] >= 0) {
    std::array<char, 64> sink{};
    while (::read(wake_pipe_[0], sink.data(), sink.size()) > 0) {
    }
  }

  for (auto sig : {Signal::kInterrupt, Signal::kTerminate, Signal::kHangup}) {
    auto* flag = flag_for(static_cast<int>(sig));
    if (!flag->exchange(false, std::memory_order_acq_rel)) {
      continue;
    }
    auto it = callbacks_.find(static_cast<int>(sig));
    if (it == callbacks_.end()) {
      continue;
    }
    for (const auto& callback : it->second) {
      callback(sig);
    }
  }
}

bool SignalHandler::setup_defaults() {
  struct sigaction ignore_action {};
  ignore_action.sa_handler = SIG_IGN;
  sigemptyset(&ignore_action.sa_mask);
  if (!sigpipe_saved_ && sigaction(SIGPIPE, &ignore_action, &original_sigpipe_) == 0) {
    sigpipe_saved_ = true;
  }

  if (wake_pipe_[0] < 0) {
    if (::pipe2(wake_pipe_, O_NONBLOCK | O_CLOEXEC) != 0) {
      LOG_ERROR("Failed to create signal wake pipe: {}", std::strerror(errno));
      wake_pipe_[0] = wake_pipe_[1] = -1;
      return false;
    }
    wake_write_fd_ = wake_pipe_[1];
  }

  install_handler(Signal::kInterrupt);
  install_handler(Signal::kTerminate);
  install_handler(Signal::kHangup);

  LOG_DEBUG("Default signal handlers installed");
  return true;
}

void SignalHandler::restore() {
  for (const auto& [signum, action] : original_handlers_) {
    sigaction(signum, &action, nullptr);
  }
  original_handlers_.clear();
  callbacks_.clear();

  if (sigpipe_saved_) {
    sigaction(SIGPIPE, &original_sigpipe_, nullptr);
    sigpipe_saved_ = false;
  }

  wake_write_fd_ = -1;
  for (auto& fd : wake_pipe_) {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }
}

}  // namespace tvlink::signal
