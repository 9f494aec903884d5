#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tvlink::http {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Base address of an HTTP service: "http://host[:port][/prefix/]".
struct Url {
  std::string host;
  std::uint16_t port{80};
  // Always starts and ends with '/'.
  std::string base_path{"/"};
};

// Parse an absolute http:// URL. Returns std::nullopt for other schemes,
// an empty host, or a bad port.
std::optional<Url> parse_url(std::string_view text);

// Resolve a relative path ("api/status") against the base path.
std::string join_path(const Url& base, std::string_view relative);

// Value for the Host header (port omitted when it is 80).
std::string host_header(const Url& url);

enum class Method : std::uint8_t { kGet, kPost };

const char* method_to_string(Method method);

struct HttpRequest {
  Method method{Method::kGet};
  std::string target{"/"};  // Origin-form request target.
  std::string host;
  HeaderList headers;
  std::string body;
};

// Serialize as an HTTP/1.1 message with Content-Length and
// "Connection: close".
std::string serialize_request(const HttpRequest& request);

struct HttpResponse {
  int status{0};
  std::string reason;
  HeaderList headers;
  std::string body;

  // Case-insensitive header lookup.
  std::optional<std::string> header(std::string_view name) const;

  bool ok() const { return status >= 200 && status < 300; }
};

// Incremental HTTP/1.1 response parser.
// Supports Content-Length, chunked and close-delimited bodies.
class HttpResponseParser {
 public:
  static constexpr std::size_t kMaxLineLength = 8 * 1024;
  static constexpr std::size_t kMaxBodySize = 1024 * 1024;

  // Feed received bytes. Returns false once the input is malformed.
  bool feed(std::string_view data);

  // The peer closed the connection. Completes a close-delimited body.
  // Returns false if the message is incomplete.
  bool finish();

  bool complete() const { return state_ == State::kComplete; }
  bool failed() const { return state_ == State::kError; }
  const std::string& error() const { return error_; }

  const HttpResponse& response() const { return response_; }
  HttpResponse take_response() { return std::move(response_); }

 private:
  enum class State : std::uint8_t {
    kStatusLine,
    kHeaders,
    kBody,
    kChunkSize,
    kChunkData,
    kChunkDataEnd,
    kTrailers,
    kUntilClose,
    kComplete,
    kError
  };

  // Extract one CRLF-terminated line from the buffer.
  std::optional<std::string> next_line();
  bool parse_status_line(const std::string& line);
  bool parse_header_line(const std::string& line);
  bool start_body();
  bool append_body(std::string_view data);
  bool fail(std::string message);

  State state_{State::kStatusLine};
  std::string buffer_;
  std::size_t remaining_{0};
  HttpResponse response_;
  std::string error_;
};

}  // namespace tvlink::http
