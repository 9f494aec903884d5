#include "common/error/remote_error.h"

#include <string>

namespace tvlink::error {

namespace {
class RemoteCategory : public std::error_category {
 public:
  const char* name() const noexcept override { return "tvlink.remote"; }

  std::string message(int value) const override {
    switch (static_cast<Errc>(value)) {
      case Errc::kValidation:
        return "validation error";
      case Errc::kNotConnected:
        return "not connected to TV";
      case Errc::kGatewayRejected:
        return "rejected by gateway";
      case Errc::kTransport:
        return "transport error";
    }
    return "unknown remote error";
  }
};
}  // namespace

const std::error_category& remote_category() {
  static const RemoteCategory category;
  return category;
}

std::error_code make_error_code(Errc e) { return {static_cast<int>(e), remote_category()}; }

std::error_code classify(const std::error_code& ec) {
  if (!ec || ec.category() == remote_category()) {
    return ec;
  }
  return make_error_code(Errc::kTransport);
}

}  // namespace tvlink::error
