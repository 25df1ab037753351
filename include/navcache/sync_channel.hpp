#pragma once

#include "navcache/types.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace navcache {

enum class SyncMessageType : std::uint8_t {
  CacheSet,
  CacheInvalidate,
  CacheWarm,
  CacheUpdated
};

std::string to_string(SyncMessageType type);

struct SyncMessage {
  SyncMessageType type{SyncMessageType::CacheSet};
  std::vector<std::string> keys;
  std::vector<std::string> tags;
  Payload data;
  TimePoint at{};
};

using SubscriptionId = std::uint64_t;
using SyncHandler = std::function<void(const SyncMessage &)>;

// In-process publish/subscribe. Handlers run synchronously inside publish()
// in subscription order.
class SyncChannel {
public:
  SubscriptionId subscribe(SyncHandler handler);
  bool unsubscribe(SubscriptionId id);
  void publish(const SyncMessage &msg);

  std::size_t subscriber_count() const { return handlers_.size(); }
  std::uint64_t published() const { return published_; }
  std::uint64_t delivered() const { return delivered_; }

private:
  std::map<SubscriptionId, SyncHandler> handlers_;
  SubscriptionId next_id_{1};
  std::uint64_t published_{0};
  std::uint64_t delivered_{0};
};

} // namespace navcache
