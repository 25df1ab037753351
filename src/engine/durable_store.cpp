#include "navcache/durable_store.hpp"

#include "navcache/codec.hpp"
#include "navcache/log.hpp"
#include "navcache/policy.hpp"

#include <algorithm>

namespace navcache {

DurableStore::DurableStore(Context &ctx,
                           std::unique_ptr<IPersistentStorage> storage)
    : ctx_(ctx), storage_(std::move(storage)) {}

bool DurableStore::init(std::string *err) {
  if (!storage_) {
    if (err)
      *err = "no storage engine";
    return false;
  }
  std::string e;
  if (!storage_->init(&e)) {
    log::storage()->error("durable tier init failed on {}: {}",
                          storage_->name(), e);
    if (err)
      *err = e;
    return false;
  }
  index_.clear();
  bytes_ = 0;
  for (const auto &k : storage_->keys()) {
    auto blob = storage_->get(k, &e);
    CacheEntry entry;
    if (!blob || !decode_entry(*blob, &entry, &e)) {
      ++stats_.decode_errors;
      log::storage()->warn("dropping unreadable durable entry {}: {}", k, e);
      if (!storage_->del(k, &e))
        log::storage()->warn("could not remove {}: {}", k, e);
      continue;
    }
    IndexEntry ie;
    ie.size_bytes = entry.size_bytes;
    ie.priority = entry.priority;
    ie.last_accessed_at = entry.metadata.last_accessed_at;
    ie.expires_at = entry.expires_at;
    ie.timestamp = entry.timestamp;
    ie.tags = entry.tags;
    ie.stale = entry.stale;
    ie.unsaved = entry.metadata.has_unsaved_changes;
    ie.sequence = ++next_sequence_;
    bytes_ += ie.size_bytes;
    index_[k] = std::move(ie);
  }
  ready_ = true;
  log::storage()->info("durable tier ready on {}: {} entries, {} bytes",
                       storage_->name(), index_.size(), bytes_);
  return true;
}

std::optional<CacheEntry> DurableStore::get(const std::string &key,
                                            bool ignore_expiry,
                                            std::string *err) {
  if (!require_ready(err))
    return std::nullopt;
  auto it = index_.find(key);
  const auto now = ctx_.now();
  if (it == index_.end() || (!ignore_expiry && it->second.expires_at <= now)) {
    ++stats_.misses;
    return std::nullopt;
  }
  auto entry = load(key, err);
  if (!entry) {
    ++stats_.misses;
    return std::nullopt;
  }
  const auto &cfg = ctx_.config().cache;
  entry->metadata.last_accessed_at = now;
  ++entry->metadata.access_count;
  entry->priority = calculate_priority(entry->metadata.access_count, now,
                                       cfg.priority_weights, now);
  entry->stale = is_stale(*entry, cfg.stale_ttl, now);
  std::string werr;
  if (!store(key, *entry, &werr))
    log::storage()->warn("access write-back failed for {}: {}", key, werr);
  ++stats_.hits;
  return entry;
}

std::optional<CacheEntry> DurableStore::peek(const std::string &key,
                                             std::string *err) {
  if (!require_ready(err) || !index_.contains(key))
    return std::nullopt;
  return load(key, err);
}

bool DurableStore::set(const std::string &key, const CacheEntry &entry,
                       std::string *err) {
  if (!require_ready(err))
    return false;
  CacheEntry copy = entry;
  if (copy.size_bytes == 0)
    copy.size_bytes = approximate_size(copy.data);
  const auto budget = ctx_.config().cache.max_durable_bytes;
  if (copy.size_bytes > budget) {
    if (err)
      *err = "entry exceeds durable budget";
    return false;
  }
  std::size_t existing = 0;
  if (auto it = index_.find(key); it != index_.end())
    existing = it->second.size_bytes;
  if (bytes_ - existing + copy.size_bytes > budget)
    evict_to(budget - copy.size_bytes, key, err);
  if (!store(key, copy, err))
    return false;
  ++stats_.sets;
  return true;
}

bool DurableStore::del(const std::string &key, std::string *err) {
  if (!require_ready(err))
    return false;
  return erase_internal(key, err);
}

bool DurableStore::clear(std::string *err) {
  if (!require_ready(err))
    return false;
  if (!storage_->clear(err))
    return false;
  index_.clear();
  bytes_ = 0;
  return true;
}

std::size_t DurableStore::invalidate_by_tags(const std::vector<std::string> &tags,
                                             std::string *err) {
  if (!require_ready(err))
    return 0;
  std::vector<std::string> doomed;
  for (const auto &[k, ie] : index_)
    for (const auto &t : tags)
      if (ie.tags.contains(t)) {
        doomed.push_back(k);
        break;
      }
  std::size_t removed = 0;
  for (const auto &k : doomed)
    if (erase_internal(k, err))
      ++removed;
  return removed;
}

std::size_t DurableStore::cleanup(std::string *err) {
  if (!require_ready(err))
    return 0;
  const auto budget = ctx_.config().cache.max_durable_bytes;
  if (bytes_ <= budget)
    return 0;
  return evict_to(budget, {}, err);
}

std::size_t DurableStore::cleanup_expired(std::string *err) {
  if (!require_ready(err))
    return 0;
  const auto now = ctx_.now();
  std::vector<std::string> expired;
  for (const auto &[k, ie] : index_)
    if (ie.expires_at <= now && !ie.unsaved)
      expired.push_back(k);
  std::size_t removed = 0;
  for (const auto &k : expired)
    if (erase_internal(k, err))
      ++removed;
  return removed;
}

std::vector<std::string> DurableStore::mark_stale_entries(std::string *err) {
  std::vector<std::string> out;
  if (!require_ready(err))
    return out;
  const auto now = ctx_.now();
  const auto stale_ttl = ctx_.config().cache.stale_ttl;
  std::vector<std::string> pending;
  for (const auto &[k, ie] : index_) {
    if (ie.stale)
      out.push_back(k);
    else if (now - ie.last_accessed_at > stale_ttl)
      pending.push_back(k);
  }
  for (const auto &k : pending) {
    auto entry = load(k, err);
    if (!entry)
      continue;
    entry->stale = true;
    if (store(k, *entry, err))
      out.push_back(k);
  }
  std::sort(out.begin(), out.end());
  return out;
}

bool DurableStore::mark_unsaved(const std::string &key, bool unsaved,
                                std::string *err) {
  if (!require_ready(err) || !index_.contains(key))
    return false;
  auto entry = load(key, err);
  if (!entry)
    return false;
  entry->metadata.has_unsaved_changes = unsaved;
  return store(key, *entry, err);
}

std::vector<std::string> DurableStore::keys() const {
  std::vector<std::string> out;
  out.reserve(index_.size());
  for (const auto &[k, _] : index_)
    out.push_back(k);
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<std::string>
DurableStore::keys_for_tag(const std::string &tag) const {
  std::vector<std::string> out;
  for (const auto &[k, ie] : index_)
    if (ie.tags.contains(tag))
      out.push_back(k);
  std::sort(out.begin(), out.end());
  return out;
}

void DurableStore::compact() {
  if (ready_)
    storage_->maybe_compact();
}

bool DurableStore::fits(std::size_t bytes) const {
  return bytes <= ctx_.config().cache.max_durable_bytes;
}

DurableStats DurableStore::stats() const {
  DurableStats s = stats_;
  s.bytes = bytes_;
  s.entries = index_.size();
  return s;
}

std::optional<CacheEntry> DurableStore::load(const std::string &key,
                                             std::string *err) {
  std::string e;
  auto blob = storage_->get(key, &e);
  if (!blob) {
    if (err)
      *err = e.empty() ? "missing blob for " + key : e;
    return std::nullopt;
  }
  CacheEntry entry;
  if (!decode_entry(*blob, &entry, &e)) {
    ++stats_.decode_errors;
    log::storage()->warn("undecodable durable entry {}: {}", key, e);
    if (err)
      *err = "decode failed for " + key + ": " + e;
    return std::nullopt;
  }
  return entry;
}

bool DurableStore::store(const std::string &key, const CacheEntry &entry,
                         std::string *err) {
  if (!storage_->put(key, encode_entry(entry), err))
    return false;
  auto &ie = index_[key];
  bytes_ -= ie.size_bytes;
  ie.size_bytes = entry.size_bytes;
  ie.priority = entry.priority;
  ie.last_accessed_at = entry.metadata.last_accessed_at;
  ie.expires_at = entry.expires_at;
  ie.timestamp = entry.timestamp;
  ie.tags = entry.tags;
  ie.stale = entry.stale;
  ie.unsaved = entry.metadata.has_unsaved_changes;
  ie.sequence = ++next_sequence_;
  bytes_ += ie.size_bytes;
  return true;
}

bool DurableStore::erase_internal(const std::string &key, std::string *err) {
  auto it = index_.find(key);
  if (it == index_.end())
    return false;
  if (!storage_->del(key, err))
    return false;
  bytes_ -= it->second.size_bytes;
  index_.erase(it);
  return true;
}

std::size_t DurableStore::evict_to(std::size_t target_bytes,
                                   const std::string &skip_key,
                                   std::string *err) {
  std::vector<EvictionCandidate> candidates;
  candidates.reserve(index_.size());
  std::size_t current = bytes_;
  for (const auto &[k, ie] : index_) {
    if (k == skip_key) {
      current -= ie.size_bytes;
      continue;
    }
    EvictionCandidate c;
    c.key = k;
    c.priority = ie.priority;
    c.last_accessed_at = ie.last_accessed_at;
    c.sequence = ie.sequence;
    c.size_bytes = ie.size_bytes;
    c.protected_entry = ie.unsaved;
    candidates.push_back(std::move(c));
  }
  std::size_t evicted = 0;
  for (const auto &k : pick_victims(std::move(candidates), current, target_bytes)) {
    if (!erase_internal(k, err)) {
      log::storage()->warn("durable eviction of {} failed", k);
      continue;
    }
    ++evicted;
    ++stats_.evictions;
  }
  return evicted;
}

bool DurableStore::require_ready(std::string *err) const {
  if (ready_)
    return true;
  if (err)
    *err = "durable tier not initialized";
  return false;
}

} // namespace navcache
