#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "common/error/remote_error.h"
#include "common/event_loop/event_loop.h"
#include "gateway/http_gateway_client.h"
#include "transport/http/http_message.h"

namespace tvlink::integration_tests {

using namespace std::chrono_literals;

namespace {
struct ReceivedRequest {
  std::string method;
  std::string target;
  std::string body;
};

// Minimal blocking HTTP server on 127.0.0.1 answering one request per
// connection from a route table. Runs on its own thread.
class LoopbackGateway {
 public:
  using Route = std::function<std::string(const ReceivedRequest&)>;

  explicit LoopbackGateway(Route route) : route_(std::move(route)) {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    const int one = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ok_ = listen_fd_ >= 0 &&
          ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
          ::listen(listen_fd_, 16) == 0;
    socklen_t len = sizeof(addr);
    if (ok_ && ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
      port_ = ntohs(addr.sin_port);
    }
    thread_ = std::thread([this]() { serve(); });
  }

  ~LoopbackGateway() {
    stop_.store(true);
    thread_.join();
    if (listen_fd_ >= 0) {
      ::close(listen_fd_);
    }
  }

  bool ok() const { return ok_ && port_ != 0; }
  std::uint16_t port() const { return port_; }

  std::vector<ReceivedRequest> requests() {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

 private:
  void serve() {
    while (!stop_.load()) {
      pollfd pfd{listen_fd_, POLLIN, 0};
      if (::poll(&pfd, 1, 20) <= 0) {
        continue;
      }
      const int fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
      if (fd < 0) {
        continue;
      }
      handle(fd);
      ::close(fd);
    }
  }

  void handle(int fd) {
    std::string data;
    char buf[4096];
    std::size_t header_end = std::string::npos;
    std::size_t content_length = 0;
    while (true) {
      if (header_end == std::string::npos) {
        header_end = data.find("\r\n\r\n");
        if (header_end != std::string::npos) {
          const auto pos = data.find("Content-Length: ");
          if (pos != std::string::npos && pos < header_end) {
            content_length = std::stoul(data.substr(pos + 16));
          }
        }
      }
      if (header_end != std::string::npos && data.size() >= header_end + 4 + content_length) {
        break;
      }
      const auto n = ::recv(fd, buf, sizeof(buf), 0);
      if (n <= 0) {
        return;
      }
      data.append(buf, static_cast<std::size_t>(n));
    }

    ReceivedRequest request;
    const auto first_space = data.find(' ');
    const auto second_space = data.find(' ', first_space + 1);
    request.method = data.substr(0, first_space);
    request.target = data.substr(first_space + 1, second_space - first_space - 1);
    request.body = data.substr(header_end + 4, content_length);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(request);
    }

    const std::string reply = route_(request);
    std::size_t sent = 0;
    while (sent < reply.size()) {
      const auto n = ::send(fd, reply.data() + sent, reply.size() - sent, MSG_NOSIGNAL);
      if (n <= 0) {
        return;
      }
      sent += static_cast<std::size_t>(n);
    }
  }

  Route route_;
  int listen_fd_{-1};
  bool ok_{false};
  std::uint16_t port_{0};
  std::atomic<bool> stop_{false};
  std::thread thread_;
  std::mutex mutex_;
  std::vector<ReceivedRequest> requests_;
};

// Number of event polls answered so far; the first one gets 204.
std::atomic<int> g_event_polls{0};

std::string json_response(int status, const std::string& reason, const std::string& body) {
  return "HTTP/1.1 " + std::to_string(status) + " " + reason +
         "\r\nContent-Type: application/json\r\nContent-Length: " + std::to_string(body.size()) +
         "\r\n\r\n" + body;
}

std::string route_request(const ReceivedRequest& request) {
  if (request.target == "/tv/api/status") {
    return json_response(200, "OK",
                         R"({"connected":true,"tv_name":"Living Room",)"
                         R"("apps":[{"name":"YouTube","id":"com.google.android.youtube.tv"}]})");
  }
  if (request.target == "/tv/api/send_key") {
    if (request.body.find("KEYCODE_BOGUS") != std::string::npos) {
      return json_response(400, "Bad Request", R"({"error":"Unknown key"})");
    }
    return json_response(200, "OK", R"({"status":"ok"})");
  }
  if (request.target == "/tv/api/connect") {
    return "HTTP/1.1 502 Bad Gateway\r\nContent-Length: 5\r\n\r\noops!";
  }
  if (request.target == "/tv/api/send_text") {
    // Close-delimited body.
    return "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\n\r\n{}";
  }
  if (request.target == "/tv/api/events") {
    if (g_event_polls.fetch_add(1) == 0) {
      return "HTTP/1.1 204 No Content\r\n\r\n";
    }
    const std::string body = R"({"type":"ime_show","data":{"value":"hello"}})";
    char size[16];
    std::snprintf(size, sizeof(size), "%zx", body.size());
    return "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n" + std::string(size) +
           "\r\n" + body + "\r\n0\r\n\r\n";
  }
  return json_response(404, "Not Found", R"({"error":"no route"})");
}
}  // namespace

class HttpGatewayIntegrationTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(server_.ok());
    std::error_code ec;
    ASSERT_TRUE(loop_.open(ec)) << ec.message();
    auto url = http::parse_url("http://127.0.0.1:" + std::to_string(server_.port()) + "/tv/");
    ASSERT_TRUE(url.has_value());
    gateway::HttpGatewayOptions options;
    options.request_timeout = 2000ms;
    options.long_poll_timeout = 2000ms;
    client_.emplace(loop_, *url, options);
  }

  // Run the loop until done() holds or the deadline passes.
  bool run_until(const std::function<bool()>& done, std::chrono::milliseconds limit = 5s) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    std::error_code ec;
    while (!done() && std::chrono::steady_clock::now() < deadline) {
      if (!loop_.run_once(20ms, ec)) {
        return false;
      }
    }
    return done();
  }

  LoopbackGateway server_{route_request};
  event::EventLoop loop_;
  std::optional<gateway::HttpGatewayClient> client_;
};

TEST_F(HttpGatewayIntegrationTest, FetchesStatus) {
  bool done = false;
  gateway::StatusReport status;
  std::error_code result;
  client_->fetch_status([&](const std::error_code& ec, gateway::StatusReport report) {
    done = true;
    result = ec;
    status = std::move(report);
  });
  EXPECT_FALSE(done);

  ASSERT_TRUE(run_until([&] { return done; }));
  EXPECT_FALSE(result) << result.message();
  EXPECT_TRUE(status.connected);
  EXPECT_EQ(status.tv_name, "Living Room");
  ASSERT_EQ(status.apps.size(), 1U);
  EXPECT_EQ(status.apps[0].name, "YouTube");

  const auto requests = server_.requests();
  ASSERT_EQ(requests.size(), 1U);
  EXPECT_EQ(requests[0].method, "GET");
  EXPECT_EQ(requests[0].target, "/tv/api/status");
  EXPECT_EQ(client_->in_flight(), 0U);
}

TEST_F(HttpGatewayIntegrationTest, SendsKeyAsJson) {
  std::optional<gateway::CommandResult> result;
  client_->send_key("KEYCODE_HOME", [&](const gateway::CommandResult& r) { result = r; });

  ASSERT_TRUE(run_until([&] { return result.has_value(); }));
  EXPECT_TRUE(result->ok());
  const auto requests = server_.requests();
  ASSERT_EQ(requests.size(), 1U);
  EXPECT_EQ(requests[0].method, "POST");
  EXPECT_EQ(requests[0].body, R"({"key":"KEYCODE_HOME"})");
}

TEST_F(HttpGatewayIntegrationTest, RejectionCarriesGatewayMessage) {
  std::optional<gateway::CommandResult> result;
  client_->send_key("KEYCODE_BOGUS", [&](const gateway::CommandResult& r) { result = r; });

  ASSERT_TRUE(run_until([&] { return result.has_value(); }));
  EXPECT_EQ(result->ec, error::Errc::kGatewayRejected);
  EXPECT_EQ(result->message, "Unknown key");
}

TEST_F(HttpGatewayIntegrationTest, RejectionWithoutReasonUsesDefaultMessage) {
  std::optional<gateway::CommandResult> result;
  client_->connect([&](const gateway::CommandResult& r) { result = r; });

  ASSERT_TRUE(run_until([&] { return result.has_value(); }));
  EXPECT_EQ(result->ec, error::Errc::kGatewayRejected);
  EXPECT_EQ(result->message, "Failed to connect to server");
}

TEST_F(HttpGatewayIntegrationTest, CloseDelimitedResponse) {
  std::optional<gateway::CommandResult> result;
  client_->send_text("héllo", true, [&](const gateway::CommandResult& r) { result = r; });

  ASSERT_TRUE(run_until([&] { return result.has_value(); }));
  EXPECT_TRUE(result->ok());
  const auto requests = server_.requests();
  ASSERT_EQ(requests.size(), 1U);
  EXPECT_EQ(requests[0].body, R"({"enter":true,"text":"héllo"})");
}

TEST_F(HttpGatewayIntegrationTest, EventPollHandlesEmptyAndChunkedReplies) {
  g_event_polls.store(0);
  int answers = 0;
  std::optional<gateway::DeviceEvent> event;
  std::error_code first_ec;
  client_->poll_event([&](const std::error_code& ec, std::optional<gateway::DeviceEvent> e) {
    ++answers;
    first_ec = ec;
    EXPECT_FALSE(e.has_value());
  });
  ASSERT_TRUE(run_until([&] { return answers == 1; }));
  EXPECT_FALSE(first_ec);

  client_->poll_event([&](const std::error_code& ec, std::optional<gateway::DeviceEvent> e) {
    ++answers;
    EXPECT_FALSE(ec);
    event = std::move(e);
  });
  ASSERT_TRUE(run_until([&] { return answers == 2; }));
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->type, gateway::DeviceEventType::kImeShow);
  EXPECT_EQ(gateway::ime_value(*event), "hello");
}

TEST_F(HttpGatewayIntegrationTest, CancelAllSuppressesHandlers) {
  bool called = false;
  client_->fetch_status([&](const std::error_code&, gateway::StatusReport) { called = true; });
  client_->cancel_all();
  EXPECT_EQ(client_->in_flight(), 0U);

  run_until([] { return false; }, 300ms);
  EXPECT_FALSE(called);
}

TEST(HttpGatewayUnreachableTest, ConnectionRefusedIsTransportError) {
  // Grab a free port, then close it so nothing listens there.
  const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  ASSERT_GE(fd, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  ASSERT_EQ(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
  socklen_t len = sizeof(addr);
  ASSERT_EQ(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len), 0);
  const auto port = ntohs(addr.sin_port);
  ::close(fd);

  event::EventLoop loop;
  std::error_code ec;
  ASSERT_TRUE(loop.open(ec));
  auto url = http::parse_url("http://127.0.0.1:" + std::to_string(port) + "/");
  ASSERT_TRUE(url.has_value());
  gateway::HttpGatewayClient client(loop, *url);

  std::optional<gateway::CommandResult> result;
  client.launch_app("com.netflix.ninja", [&](const gateway::CommandResult& r) { result = r; });

  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (!result && std::chrono::steady_clock::now() < deadline) {
    ASSERT_TRUE(loop.run_once(20ms, ec));
  }
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->ec, error::Errc::kTransport);
  EXPECT_EQ(result->message, "Failed to launch app");
}

}  // namespace tvlink::integration_tests
