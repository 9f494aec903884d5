#include "transport/http/http_client.h"

#include <netdb.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <utility>

#include "common/logging/logger.h"

namespace tvlink::http {

namespace {
std::error_code last_error() { return {errno, std::generic_category()}; }

constexpr std::uint32_t kWriteEvents = EPOLLOUT;
constexpr std::uint32_t kReadEvents = EPOLLIN | EPOLLRDHUP;
}  // namespace

HttpClient::HttpClient(event::EventLoop& loop, Url endpoint)
    : loop_(loop), endpoint_(std::move(endpoint)) {}

HttpClient::~HttpClient() { cancel_all(); }

RequestId HttpClient::send(HttpRequest request, std::chrono::milliseconds timeout,
                           ResponseHandler handler) {
  const RequestId id = next_id_++;
  auto exchange = std::make_unique<Exchange>(loop_.timers());
  if (request.host.empty()) {
    request.host = host_header(endpoint_);
  }
  exchange->outbound = serialize_request(request);
  exchange->handler = std::move(handler);

  LOG_TRACE("HTTP #{} {} {}", id, method_to_string(request.method), request.target);

  auto& ref = *exchange;
  exchanges_.emplace(id, std::move(exchange));

  std::error_code ec;
  if (!open_connection(ref, ec)) {
    fail_later(id, ec);
    return id;
  }

  if (!loop_.watch(ref.fd, kWriteEvents,
                   [this, id](std::uint32_t events) { on_io(id, events); }, ec)) {
    fail_later(id, ec);
    return id;
  }

  ref.deadline.arm(timeout, [this, id]() {
    complete(id, std::make_error_code(std::errc::timed_out));
  });
  return id;
}

bool HttpClient::open_connection(Exchange& exchange, std::error_code& ec) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* result = nullptr;
  const auto port = std::to_string(endpoint_.port);
  const int rc = ::getaddrinfo(endpoint_.host.c_str(), port.c_str(), &hints, &result);
  if (rc != 0) {
    LOG_DEBUG("Cannot resolve {}: {}", endpoint_.host, ::gai_strerror(rc));
    ec = std::make_error_code(std::errc::host_unreachable);
    return false;
  }

  ec = std::make_error_code(std::errc::address_not_available);
  for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
    const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                            ai->ai_protocol);
    if (fd < 0) {
      ec = last_error();
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0 || errno == EINPROGRESS) {
      exchange.fd = fd;
      ec.clear();
      break;
    }
    ec = last_error();
    ::close(fd);
  }
  ::freeaddrinfo(result);
  return exchange.fd >= 0;
}

void HttpClient::on_io(RequestId id, std::uint32_t events) {
  auto it = exchanges_.find(id);
  if (it == exchanges_.end()) {
    return;
  }
  auto& exchange = *it->second;

  if (exchange.phase != Phase::kReceiving) {
    if ((events & (EPOLLOUT | EPOLLERR | EPOLLHUP)) != 0U) {
      on_writable(id, exchange);
    }
    return;
  }

  if ((events & (EPOLLIN | EPOLLRDHUP | EPOLLERR | EPOLLHUP)) != 0U) {
    on_readable(id, exchange);
  }
}

void HttpClient::on_writable(RequestId id, Exchange& exchange) {
  if (exchange.phase == Phase::kConnecting) {
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(exchange.fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) {
      complete(id, last_error());
      return;
    }
    if (so_error != 0) {
      complete(id, std::error_code(so_error, std::generic_category()));
      return;
    }
    exchange.phase = Phase::kSending;
  }

  while (exchange.sent < exchange.outbound.size()) {
    const auto n = ::send(exchange.fd, exchange.outbound.data() + exchange.sent,
                          exchange.outbound.size() - exchange.sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return;
      }
      if (errno == EINTR) {
        continue;
      }
      complete(id, last_error());
      return;
    }
    exchange.sent += static_cast<std::size_t>(n);
  }

  exchange.phase = Phase::kReceiving;
  std::error_code ec;
  if (!loop_.modify(exchange.fd, kReadEvents, ec)) {
    complete(id, ec);
  }
}

void HttpClient::on_readable(RequestId id, Exchange& exchange) {
  std::array<char, 4096> chunk{};
  while (true) {
    const auto n = ::recv(exchange.fd, chunk.data(), chunk.size(), 0);
    if (n > 0) {
      if (!exchange.parser.feed(std::string_view(chunk.data(), static_cast<std::size_t>(n)))) {
        LOG_DEBUG("HTTP #{} malformed response: {}", id, exchange.parser.error());
        complete(id, std::make_error_code(std::errc::protocol_error));
        return;
      }
      if (exchange.parser.complete()) {
        complete(id, {});
        return;
      }
      continue;
    }
    if (n == 0) {
      if (!exchange.parser.finish()) {
        complete(id, std::make_error_code(std::errc::connection_reset));
        return;
      }
      complete(id, {});
      return;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return;
    }
    if (errno == EINTR) {
      continue;
    }
    complete(id, last_error());
    return;
  }
}

void HttpClient::fail_later(RequestId id, std::error_code ec) {
  auto it = exchanges_.find(id);
  if (it == exchanges_.end()) {
    return;
  }
  release(*it->second);
  it->second->deadline.arm(std::chrono::milliseconds(0),
                           [this, id, ec]() { complete(id, ec); });
}

void HttpClient::release(Exchange& exchange) {
  exchange.deadline.cancel();
  if (exchange.fd >= 0) {
    loop_.unwatch(exchange.fd);
    ::close(exchange.fd);
    exchange.fd = -1;
  }
}

void HttpClient::complete(RequestId id, std::error_code ec) {
  auto it = exchanges_.find(id);
  if (it == exchanges_.end()) {
    return;
  }
  // Detach first: the handler may start new requests.
  std::unique_ptr<Exchange> exchange = std::move(it->second);
  exchanges_.erase(it);
  release(*exchange);

  auto handler = std::move(exchange->handler);
  HttpResponse response;
  if (!ec) {
    response = exchange->parser.take_response();
  } else {
    LOG_TRACE("HTTP #{} failed: {}", id, ec.message());
  }
  exchange.reset();

  if (handler) {
    handler(ec, std::move(response));
  }
}

bool HttpClient::cancel(RequestId id) {
  auto it = exchanges_.find(id);
  if (it == exchanges_.end()) {
    return false;
  }
  release(*it->second);
  exchanges_.erase(it);
  return true;
}

void HttpClient::cancel_all() {
  for (auto& [id, exchange] : exchanges_) {
    release(*exchange);
  }
  exchanges_.clear();
}

}  // namespace tvlink::http
