#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <utility>
#include <vector>

namespace tvlink::utils {

using SubscriptionId = std::uint64_t;

constexpr SubscriptionId kInvalidSubscriptionId = 0;

// Ordered set of callbacks notified synchronously on the owning thread.
// Callbacks may subscribe or unsubscribe (themselves included) while a
// notification is running: removed callbacks are skipped, added ones are
// first called on the next notification.
template <typename... Args>
class SubscriberList {
 public:
  using Callback = std::function<void(Args...)>;

  SubscriptionId add(Callback callback) {
    const auto id = next_id_++;
    callbacks_.emplace(id, std::move(callback));
    return id;
  }

  bool remove(SubscriptionId id) { return callbacks_.erase(id) != 0; }

  void clear() { callbacks_.clear(); }

  std::size_t size() const { return callbacks_.size(); }
  bool empty() const { return callbacks_.empty(); }

  void notify(Args... args) {
    std::vector<SubscriptionId> ids;
    ids.reserve(callbacks_.size());
    for (const auto& entry : callbacks_) {
      ids.push_back(entry.first);
    }
    for (const auto id : ids) {
      auto it = callbacks_.find(id);
      if (it == callbacks_.end()) {
        continue;
      }
      // Copy so the callback survives its own removal.
      auto callback = it->second;
      callback(args...);
    }
  }

 private:
  SubscriptionId next_id_{1};
  std::map<SubscriptionId, Callback> callbacks_;
};

}  // namespace tvlink::utils
