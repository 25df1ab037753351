#pragma once

#include "navcache/config.hpp"
#include "navcache/context.hpp"
#include "navcache/storage.hpp"
#include "navcache/types.hpp"

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace navcache {

struct DurableStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t sets{0};
  std::uint64_t evictions{0};
  std::uint64_t decode_errors{0};
  std::size_t bytes{0};
  std::size_t entries{0};
};

// Persistent tier. Entries are encoded with the codec and stored in an
// IPersistentStorage engine; a small in-memory index is rebuilt on init.
// Expired entries are kept for offline serving until cleanup_expired().
class DurableStore {
public:
  DurableStore(Context &ctx, std::unique_ptr<IPersistentStorage> storage);

  bool init(std::string *err = nullptr);
  bool ready() const { return ready_; }

  std::optional<CacheEntry> get(const std::string &key,
                                bool ignore_expiry = false,
                                std::string *err = nullptr);
  // Reads an entry without recording an access.
  std::optional<CacheEntry> peek(const std::string &key,
                                 std::string *err = nullptr);
  bool set(const std::string &key, const CacheEntry &entry,
           std::string *err = nullptr);
  bool del(const std::string &key, std::string *err = nullptr);
  bool clear(std::string *err = nullptr);
  std::size_t invalidate_by_tags(const std::vector<std::string> &tags,
                                 std::string *err = nullptr);
  // Evicts in priority order down to max_durable_bytes.
  std::size_t cleanup(std::string *err = nullptr);
  std::size_t cleanup_expired(std::string *err = nullptr);
  std::vector<std::string> mark_stale_entries(std::string *err = nullptr);
  bool mark_unsaved(const std::string &key, bool unsaved,
                    std::string *err = nullptr);

  bool contains(const std::string &key) const { return index_.contains(key); }
  std::vector<std::string> keys() const;
  std::vector<std::string> keys_for_tag(const std::string &tag) const;
  void compact();
  std::size_t size_bytes() const { return bytes_; }
  std::size_t size() const { return index_.size(); }
  // Whether an entry of `bytes` could be stored without exceeding the budget.
  bool fits(std::size_t bytes) const;

  DurableStats stats() const;
  IPersistentStorage &storage() { return *storage_; }

private:
  struct IndexEntry {
    std::size_t size_bytes{0};
    double priority{0.0};
    TimePoint last_accessed_at{};
    TimePoint expires_at{};
    TimePoint timestamp{};
    std::set<std::string> tags;
    bool stale{false};
    bool unsaved{false};
    std::uint64_t sequence{0};
  };

  std::optional<CacheEntry> load(const std::string &key, std::string *err);
  bool store(const std::string &key, const CacheEntry &entry,
             std::string *err);
  bool erase_internal(const std::string &key, std::string *err);
  std::size_t evict_to(std::size_t target_bytes, const std::string &skip_key,
                       std::string *err);
  bool require_ready(std::string *err) const;

  Context &ctx_;
  std::unique_ptr<IPersistentStorage> storage_;
  std::unordered_map<std::string, IndexEntry> index_;
  std::size_t bytes_{0};
  std::uint64_t next_sequence_{0};
  bool ready_{false};
  DurableStats stats_;
};

} // namespace navcache
