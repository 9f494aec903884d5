#pragma once

#include <system_error>
#include <type_traits>

namespace tvlink::error {

// Failure classes of user-facing remote operations.
enum class Errc {
  kValidation = 1,    // Local precondition failed; nothing was sent.
  kNotConnected = 2,  // Action attempted while the session is disconnected.
  kGatewayRejected = 3,  // Gateway answered with a non-2xx status.
  kTransport = 4,     // No usable response was obtained.
};

const std::error_category& remote_category();

std::error_code make_error_code(Errc e);

// Map any lower-level failure (socket errno, timeout, parse error) onto the
// taxonomy. Codes already in the remote category are returned unchanged.
std::error_code classify(const std::error_code& ec);

}  // namespace tvlink::error

template <>
struct std::is_error_code_enum<tvlink::error::Errc> : std::true_type {};
