#include "navcache/sync_channel.hpp"

namespace navcache {

std::string to_string(SyncMessageType type) {
  switch (type) {
  case SyncMessageType::CacheSet:
    return "CACHE_SET";
  case SyncMessageType::CacheInvalidate:
    return "CACHE_INVALIDATE";
  case SyncMessageType::CacheWarm:
    return "CACHE_WARM";
  case SyncMessageType::CacheUpdated:
    return "CACHE_UPDATED";
  }
  return "UNKNOWN";
}

SubscriptionId SyncChannel::subscribe(SyncHandler handler) {
  const auto id = next_id_++;
  handlers_[id] = std::move(handler);
  return id;
}

bool SyncChannel::unsubscribe(SubscriptionId id) {
  return handlers_.erase(id) > 0;
}

void SyncChannel::publish(const SyncMessage &msg) {
  ++published_;
  // Handlers may subscribe or unsubscribe while being notified.
  std::vector<SyncHandler> snapshot;
  snapshot.reserve(handlers_.size());
  for (const auto &[_, h] : handlers_)
    snapshot.push_back(h);
  for (const auto &h : snapshot) {
    h(msg);
    ++delivered_;
  }
}

} // namespace navcache
