#include "navcache/volatile_store.hpp"

#include "navcache/log.hpp"

#include <algorithm>
#include <chrono>

namespace navcache {

VolatileStore::VolatileStore(Context &ctx)
    : ctx_(ctx), cfg_(ctx.config().cache) {}

std::optional<CacheEntry> VolatileStore::get(const std::string &key,
                                             bool ignore_expiry) {
  const auto now = ctx_.now();
  auto it = entries_.find(key);
  if (it == entries_.end() || (!ignore_expiry && is_expired(it->second, now))) {
    ++misses_;
    return std::nullopt;
  }
  auto &e = it->second;
  e.metadata.last_accessed_at = now;
  ++e.metadata.access_count;
  e.priority = calculate_priority(e.metadata.access_count, now,
                                  cfg_.priority_weights, now);
  e.stale = is_stale(e, cfg_.stale_ttl, now);
  sequence_[key] = ++next_sequence_;
  ++hits_;
  return e;
}

void VolatileStore::set(const std::string &key, CacheEntry entry) {
  if (entries_.contains(key))
    erase_internal(key, false);
  if (entry.size_bytes == 0)
    entry.size_bytes = approximate_size(entry.data);
  for (const auto &t : entry.tags)
    tag_index_[t].insert(key);
  memory_bytes_ += entry.size_bytes;
  entries_[key] = std::move(entry);
  sequence_[key] = ++next_sequence_;
  ++sets_;
  if (memory_bytes_ > cfg_.max_volatile_bytes)
    cleanup();
}

bool VolatileStore::del(const std::string &key) {
  if (!entries_.contains(key))
    return false;
  erase_internal(key, false);
  return true;
}

void VolatileStore::clear() {
  entries_.clear();
  sequence_.clear();
  tag_index_.clear();
  memory_bytes_ = 0;
}

std::size_t
VolatileStore::invalidate_by_tags(const std::vector<std::string> &tags) {
  std::set<std::string> doomed;
  for (const auto &t : tags) {
    auto it = tag_index_.find(t);
    if (it != tag_index_.end())
      doomed.insert(it->second.begin(), it->second.end());
  }
  for (const auto &k : doomed)
    erase_internal(k, false);
  return doomed.size();
}

void VolatileStore::cleanup() {
  const auto target = cfg_.max_volatile_bytes / 10 * 8;
  if (memory_bytes_ <= target)
    return;
  const auto evicted = evict_to(target);
  if (memory_bytes_ > target)
    log::cache()->debug("volatile cleanup stopped at {} bytes (target {}), "
                        "remaining entries are protected",
                        memory_bytes_, target);
  else if (evicted > 0)
    log::cache()->debug("volatile cleanup evicted {} entries", evicted);
}

std::size_t VolatileStore::evict_to(std::size_t target_bytes,
                                    const PinPredicate &extra_protect) {
  std::vector<EvictionCandidate> candidates;
  candidates.reserve(entries_.size());
  for (const auto &[k, e] : entries_) {
    EvictionCandidate c;
    c.key = k;
    c.priority = e.priority;
    c.last_accessed_at = e.metadata.last_accessed_at;
    c.sequence = sequence_[k];
    c.size_bytes = e.size_bytes;
    c.protected_entry =
        is_protected(k, e) || (extra_protect && extra_protect(k, e));
    candidates.push_back(std::move(c));
  }
  const auto victims =
      pick_victims(std::move(candidates), memory_bytes_, target_bytes);
  const auto now = ctx_.now();
  for (const auto &k : victims) {
    erase_internal(k, true);
    record_eviction(now);
  }
  return victims.size();
}

std::vector<std::string> VolatileStore::mark_stale_entries() {
  const auto now = ctx_.now();
  std::vector<std::string> out;
  for (auto &[k, e] : entries_) {
    if (e.stale || now - e.metadata.last_accessed_at > cfg_.stale_ttl) {
      e.stale = true;
      out.push_back(k);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::size_t VolatileStore::cleanup_expired() {
  const auto now = ctx_.now();
  std::vector<std::string> expired;
  for (const auto &[k, e] : entries_)
    if (is_expired(e, now) && !e.metadata.has_unsaved_changes)
      expired.push_back(k);
  for (const auto &k : expired)
    erase_internal(k, false);
  return expired.size();
}

bool VolatileStore::mark_unsaved(const std::string &key, bool unsaved) {
  auto it = entries_.find(key);
  if (it == entries_.end())
    return false;
  it->second.metadata.has_unsaved_changes = unsaved;
  return true;
}

bool VolatileStore::rescore(const std::string &key, double priority) {
  auto it = entries_.find(key);
  if (it == entries_.end())
    return false;
  it->second.priority = std::min(100.0, std::max(0.0, priority));
  return true;
}

std::vector<std::string> VolatileStore::keys() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto &[k, _] : entries_)
    out.push_back(k);
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<std::string>
VolatileStore::keys_for_tag(const std::string &tag) const {
  auto it = tag_index_.find(tag);
  if (it == tag_index_.end())
    return {};
  return {it->second.begin(), it->second.end()};
}

void VolatileStore::update_config(const CacheConfig &cfg) {
  cfg_ = cfg;
  sanitize(cfg_);
  if (memory_bytes_ > cfg_.max_volatile_bytes)
    cleanup();
}

void VolatileStore::set_weights(const PriorityWeights &weights) {
  cfg_.priority_weights = weights;
  sanitize(cfg_);
}

CacheStats VolatileStore::stats() const {
  CacheStats s;
  s.hits = hits_;
  s.misses = misses_;
  s.sets = sets_;
  s.evictions = evictions_;
  const auto lookups = hits_ + misses_;
  s.hit_rate = lookups == 0 ? 0.0
                            : static_cast<double>(hits_) /
                                  static_cast<double>(lookups);
  s.memory_bytes = memory_bytes_;
  s.entries = entries_.size();
  s.stale_entries = static_cast<std::size_t>(
      std::count_if(entries_.begin(), entries_.end(),
                    [](const auto &kv) { return kv.second.stale; }));
  s.thrashing_count = thrashing_count_;
  return s;
}

void VolatileStore::erase_internal(const std::string &key, bool eviction) {
  auto it = entries_.find(key);
  if (it == entries_.end())
    return;
  for (const auto &t : it->second.tags) {
    auto ti = tag_index_.find(t);
    if (ti == tag_index_.end())
      continue;
    ti->second.erase(key);
    if (ti->second.empty())
      tag_index_.erase(ti);
  }
  memory_bytes_ -= it->second.size_bytes;
  entries_.erase(it);
  sequence_.erase(key);
  if (eviction)
    ++evictions_;
}

bool VolatileStore::is_protected(const std::string &key,
                                 const CacheEntry &e) const {
  if (e.priority > kCriticalPriority || e.metadata.has_unsaved_changes)
    return true;
  return pin_ && pin_(key, e);
}

void VolatileStore::record_eviction(TimePoint now) {
  recent_evictions_.push_back(now);
  while (!recent_evictions_.empty() &&
         now - recent_evictions_.front() > std::chrono::minutes(1))
    recent_evictions_.pop_front();
  if (recent_evictions_.size() > cfg_.thrashing_threshold) {
    ++thrashing_count_;
    if (recent_evictions_.size() == cfg_.thrashing_threshold + 1)
      log::cache()->warn("eviction thrashing: more than {} evictions in the "
                         "last minute",
                         cfg_.thrashing_threshold);
  }
}

} // namespace navcache
