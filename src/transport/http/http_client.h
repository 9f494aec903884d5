#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <unordered_map>

#include "common/event_loop/event_loop.h"
#include "common/utils/timer_heap.h"
#include "transport/http/http_message.h"

namespace tvlink::http {

using RequestId = std::uint64_t;

// Called exactly once per request unless the request was cancelled.
// On failure ec is set and the response is empty; HTTP error statuses are
// not failures at this level.
using ResponseHandler = std::function<void(const std::error_code& ec, HttpResponse response)>;

// Asynchronous HTTP/1.1 client driven by an EventLoop.
// Every request uses its own non-blocking TCP connection ("Connection:
// close"), so requests never queue behind a held long-poll.
class HttpClient {
 public:
  HttpClient(event::EventLoop& loop, Url endpoint);
  ~HttpClient();

  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  // Start a request. The handler is never invoked from within send().
  RequestId send(HttpRequest request, std::chrono::milliseconds timeout,
                 ResponseHandler handler);

  // Abort a request; its handler will not be called.
  bool cancel(RequestId id);

  // Abort every outstanding request.
  void cancel_all();

  std::size_t in_flight() const { return exchanges_.size(); }
  const Url& endpoint() const { return endpoint_; }

 private:
  enum class Phase : std::uint8_t { kConnecting, kSending, kReceiving };

  struct Exchange {
    explicit Exchange(utils::TimerHeap& timers) : deadline(timers) {}

    int fd{-1};
    Phase phase{Phase::kConnecting};
    std::string outbound;
    std::size_t sent{0};
    HttpResponseParser parser;
    ResponseHandler handler;
    utils::TimerSlot deadline;
  };

  bool open_connection(Exchange& exchange, std::error_code& ec);
  void on_io(RequestId id, std::uint32_t events);
  void on_writable(RequestId id, Exchange& exchange);
  void on_readable(RequestId id, Exchange& exchange);
  void fail_later(RequestId id, std::error_code ec);
  void complete(RequestId id, std::error_code ec);
  void release(Exchange& exchange);

  event::EventLoop& loop_;
  Url endpoint_;
  RequestId next_id_{1};
  std::unordered_map<RequestId, std::unique_ptr<Exchange>> exchanges_;
};

}  // namespace tvlink::http
