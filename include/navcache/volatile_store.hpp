#pragma once

#include "navcache/config.hpp"
#include "navcache/context.hpp"
#include "navcache/policy.hpp"
#include "navcache/types.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace navcache {

// Returns true for entries that must survive eviction.
using PinPredicate =
    std::function<bool(const std::string &key, const CacheEntry &entry)>;

// Size-bounded in-memory tier. Eviction is priority ordered and never removes
// critical entries (priority above kCriticalPriority), entries with unsaved
// changes, or entries matched by the pin predicate.
class VolatileStore {
public:
  explicit VolatileStore(Context &ctx);

  std::optional<CacheEntry> get(const std::string &key,
                                bool ignore_expiry = false);
  void set(const std::string &key, CacheEntry entry);
  bool del(const std::string &key);
  void clear();
  std::size_t invalidate_by_tags(const std::vector<std::string> &tags);

  // Evicts down to 80% of max_volatile_bytes.
  void cleanup();
  std::size_t evict_to(std::size_t target_bytes,
                       const PinPredicate &extra_protect = {});
  std::vector<std::string> mark_stale_entries();
  std::size_t cleanup_expired();
  bool mark_unsaved(const std::string &key, bool unsaved);
  bool rescore(const std::string &key, double priority);

  bool contains(const std::string &key) const {
    return entries_.contains(key);
  }
  std::vector<std::string> keys() const;
  std::vector<std::string> keys_for_tag(const std::string &tag) const;
  const std::unordered_map<std::string, CacheEntry> &entries() const {
    return entries_;
  }

  void set_pin_predicate(PinPredicate pin) { pin_ = std::move(pin); }
  void update_config(const CacheConfig &cfg);
  const CacheConfig &config() const { return cfg_; }
  void set_weights(const PriorityWeights &weights);

  CacheStats stats() const;
  std::size_t memory_bytes() const { return memory_bytes_; }
  std::size_t size() const { return entries_.size(); }

private:
  void erase_internal(const std::string &key, bool eviction);
  bool is_protected(const std::string &key, const CacheEntry &e) const;
  void record_eviction(TimePoint now);

  Context &ctx_;
  CacheConfig cfg_;
  std::unordered_map<std::string, CacheEntry> entries_;
  std::unordered_map<std::string, std::uint64_t> sequence_;
  std::unordered_map<std::string, std::set<std::string>> tag_index_;
  PinPredicate pin_;
  std::deque<TimePoint> recent_evictions_;
  std::size_t memory_bytes_{0};
  std::uint64_t next_sequence_{0};
  std::uint64_t hits_{0};
  std::uint64_t misses_{0};
  std::uint64_t sets_{0};
  std::uint64_t evictions_{0};
  std::uint64_t thrashing_count_{0};
};

} // namespace navcache
