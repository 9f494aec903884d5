#include "transport/http/http_message.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace tvlink::http {

namespace {
std::string to_lower(std::string_view value) {
  std::string lowered(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

std::string_view trim(std::string_view value) {
  while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
    value.remove_prefix(1);
  }
  while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
    value.remove_suffix(1);
  }
  return value;
}

bool iequals(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
           return std::tolower(x) == std::tolower(y);
         });
}

bool has_header(const HeaderList& headers, std::string_view name) {
  return std::any_of(headers.begin(), headers.end(),
                     [name](const auto& h) { return iequals(h.first, name); });
}
}  // namespace

std::optional<Url> parse_url(std::string_view text) {
  constexpr std::string_view kScheme = "http://";
  if (text.size() <= kScheme.size() || to_lower(text.substr(0, kScheme.size())) != kScheme) {
    return std::nullopt;
  }
  text.remove_prefix(kScheme.size());

  const auto slash = text.find('/');
  const auto authority = text.substr(0, slash);
  const auto path = slash == std::string_view::npos ? std::string_view{} : text.substr(slash);

  Url url;
  const auto colon = authority.rfind(':');
  if (colon != std::string_view::npos) {
    url.host = std::string(authority.substr(0, colon));
    const auto port_text = authority.substr(colon + 1);
    unsigned int port = 0;
    const auto [ptr, ec] =
        std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (ec != std::errc{} || ptr != port_text.data() + port_text.size() || port == 0 ||
        port > 65535) {
      return std::nullopt;
    }
    url.port = static_cast<std::uint16_t>(port);
  } else {
    url.host = std::string(authority);
  }
  if (url.host.empty()) {
    return std::nullopt;
  }

  // Query strings and fragments are not part of a base address.
  const auto path_end = path.find_first_of("?#");
  url.base_path = std::string(path.substr(0, path_end));
  if (url.base_path.empty() || url.base_path.front() != '/') {
    url.base_path.insert(url.base_path.begin(), '/');
  }
  if (url.base_path.back() != '/') {
    url.base_path.push_back('/');
  }
  return url;
}

std::string join_path(const Url& base, std::string_view relative) {
  while (!relative.empty() && relative.front() == '/') {
    relative.remove_prefix(1);
  }
  return base.base_path + std::string(relative);
}

std::string host_header(const Url& url) {
  if (url.port == 80) {
    return url.host;
  }
  return url.host + ":" + std::to_string(url.port);
}

const char* method_to_string(Method method) {
  switch (method) {
    case Method::kGet:
      return "GET";
    case Method::kPost:
      return "POST";
  }
  return "GET";
}

std::string serialize_request(const HttpRequest& request) {
  std::ostringstream out;
  out << method_to_string(request.method) << ' ' << request.target << " HTTP/1.1\r\n";
  out << "Host: " << request.host << "\r\n";
  for (const auto& [name, value] : request.headers) {
    out << name << ": " << value << "\r\n";
  }
  if (!has_header(request.headers, "Connection")) {
    out << "Connection: close\r\n";
  }
  if (request.method == Method::kPost || !request.body.empty()) {
    out << "Content-Length: " << request.body.size() << "\r\n";
  }
  out << "\r\n";
  out << request.body;
  return out.str();
}

std::optional<std::string> HttpResponse::header(std::string_view name) const {
  for (const auto& [key, value] : headers) {
    if (iequals(key, name)) {
      return value;
    }
  }
  return std::nullopt;
}

bool HttpResponseParser::fail(std::string message) {
  state_ = State::kError;
  error_ = std::move(message);
  buffer_.clear();
  return false;
}

std::optional<std::string> HttpResponseParser::next_line() {
  const auto pos = buffer_.find("\r\n");
  if (pos == std::string::npos) {
    if (buffer_.size() > kMaxLineLength) {
      fail("Line too long");
    }
    return std::nullopt;
  }
  std::string line = buffer_.substr(0, pos);
  buffer_.erase(0, pos + 2);
  return line;
}

bool HttpResponseParser::parse_status_line(const std::string& line) {
  // HTTP/1.1 200 OK
  std::string_view view(line);
  if (view.size() < 12 || view.substr(0, 7) != "HTTP/1.") {
    return fail("Malformed status line");
  }
  const auto code_text = view.substr(9, 3);
  int code = 0;
  const auto [ptr, ec] = std::from_chars(code_text.data(), code_text.data() + 3, code);
  if (ec != std::errc{} || ptr != code_text.data() + 3 || code < 100 || code > 599) {
    return fail("Malformed status code");
  }
  response_.status = code;
  response_.reason = view.size() > 13 ? std::string(view.substr(13)) : std::string{};
  return true;
}

bool HttpResponseParser::parse_header_line(const std::string& line) {
  const auto colon = line.find(':');
  if (colon == std::string::npos || colon == 0) {
    return fail("Malformed header line");
  }
  std::string_view view(line);
  response_.headers.emplace_back(std::string(trim(view.substr(0, colon))),
                                 std::string(trim(view.substr(colon + 1))));
  return true;
}

bool HttpResponseParser::start_body() {
  if (response_.status < 200) {
    // Interim response; the real one follows.
    response_ = HttpResponse{};
    state_ = State::kStatusLine;
    return true;
  }
  if (response_.status == 204 || response_.status == 304) {
    state_ = State::kComplete;
    return true;
  }

  if (auto encoding = response_.header("Transfer-Encoding")) {
    if (to_lower(*encoding).find("chunked") != std::string::npos) {
      state_ = State::kChunkSize;
      return true;
    }
  }

  if (auto length = response_.header("Content-Length")) {
    std::size_t size = 0;
    const auto [ptr, ec] = std::from_chars(length->data(), length->data() + length->size(), size);
    if (ec != std::errc{} || ptr != length->data() + length->size()) {
      return fail("Malformed Content-Length");
    }
    if (size > kMaxBodySize) {
      return fail("Response body too large");
    }
    remaining_ = size;
    state_ = size == 0 ? State::kComplete : State::kBody;
    return true;
  }

  state_ = State::kUntilClose;
  return true;
}

bool HttpResponseParser::append_body(std::string_view data) {
  if (response_.body.size() + data.size() > kMaxBodySize) {
    return fail("Response body too large");
  }
  response_.body.append(data);
  return true;
}

bool HttpResponseParser::feed(std::string_view data) {
  if (state_ == State::kError) {
    return false;
  }
  if (state_ == State::kComplete) {
    return true;  // Anything after the message is ignored.
  }
  buffer_.append(data);

  while (true) {
    switch (state_) {
      case State::kStatusLine: {
        auto line = next_line();
        if (!line) {
          return !failed();
        }
        if (!parse_status_line(*line)) {
          return false;
        }
        state_ = State::kHeaders;
        break;
      }
      case State::kHeaders: {
        auto line = next_line();
        if (!line) {
          return !failed();
        }
        if (line->empty()) {
          if (!start_body()) {
            return false;
          }
        } else if (!parse_header_line(*line)) {
          return false;
        }
        break;
      }
      case State::kBody: {
        const auto take = std::min(remaining_, buffer_.size());
        if (!append_body(std::string_view(buffer_).substr(0, take))) {
          return false;
        }
        buffer_.erase(0, take);
        remaining_ -= take;
        if (remaining_ != 0) {
          return true;
        }
        state_ = State::kComplete;
        break;
      }
      case State::kChunkSize: {
        auto line = next_line();
        if (!line) {
          return !failed();
        }
        std::string_view size_text = trim(std::string_view(*line).substr(0, line->find(';')));
        std::size_t size = 0;
        const auto [ptr, ec] =
            std::from_chars(size_text.data(), size_text.data() + size_text.size(), size, 16);
        if (size_text.empty() || ec != std::errc{} ||
            ptr != size_text.data() + size_text.size()) {
          return fail("Malformed chunk size");
        }
        if (size == 0) {
          state_ = State::kTrailers;
        } else {
          remaining_ = size;
          state_ = State::kChunkData;
        }
        break;
      }
      case State::kChunkData: {
        const auto take = std::min(remaining_, buffer_.size());
        if (!append_body(std::string_view(buffer_).substr(0, take))) {
          return false;
        }
        buffer_.erase(0, take);
        remaining_ -= take;
        if (remaining_ != 0) {
          return true;
        }
        state_ = State::kChunkDataEnd;
        break;
      }
      case State::kChunkDataEnd: {
        if (buffer_.size() < 2) {
          return true;
        }
        if (buffer_.compare(0, 2, "\r\n") != 0) {
          return fail("Missing chunk terminator");
        }
        buffer_.erase(0, 2);
        state_ = State::kChunkSize;
        break;
      }
      case State::kTrailers: {
        auto line = next_line();
        if (!line) {
          return !failed();
        }
        if (line->empty()) {
          state_ = State::kComplete;
        }
        break;
      }
      case State::kUntilClose: {
        if (!append_body(buffer_)) {
          return false;
        }
        buffer_.clear();
        return true;
      }
      case State::kComplete:
        buffer_.clear();
        return true;
      case State::kError:
        return false;
    }
  }
}

bool HttpResponseParser::finish() {
  if (state_ == State::kUntilClose) {
    state_ = State::kComplete;
    return true;
  }
  if (state_ == State::kComplete) {
    return true;
  }
  if (state_ != State::kError) {
    fail("Connection closed before response was complete");
  }
  return false;
}

}  // namespace tvlink::http
