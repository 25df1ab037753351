#include "navcache/orchestrator.hpp"

#include "navcache/log.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <sstream>

namespace navcache {
namespace {
void rescore(CacheEntry &e, const ExtendedWeights &w, TimePoint now) {
  const auto &m = e.metadata;
  if (!m.page_kind || !m.content_kind)
    return;
  e.priority = calculate_extended_priority(*m.page_kind, *m.content_kind,
                                           m.access_count, m.last_accessed_at,
                                           w, now);
}
} // namespace

Orchestrator::Orchestrator(Context &ctx,
                           std::unique_ptr<IPersistentStorage> durable,
                           std::unique_ptr<IQuotaEstimator> quota)
    : ctx_(ctx), volatile_(ctx), quota_(std::move(quota)) {
  if (durable)
    durable_ = std::make_unique<DurableStore>(ctx, std::move(durable));
  volatile_.set_pin_predicate(
      [this](const std::string &, const CacheEntry &e) {
        return is_recent_route_entry(e);
      });
}

bool Orchestrator::init(std::string *err) {
  if (!durable_ || !ctx_.config().cache.enable_persistence)
    return true;
  std::string e;
  bool ok = false;
  try {
    ok = durable_->init(&e);
  } catch (const std::exception &ex) {
    e = ex.what();
  }
  if (!ok) {
    record_error("init", e);
    if (err)
      *err = e;
    return false;
  }
  return true;
}

bool Orchestrator::durable_enabled() const {
  return durable_ && durable_->ready() && ctx_.config().cache.enable_persistence;
}

std::optional<CacheEntry> Orchestrator::get(const std::string &key) {
  const auto now = ctx_.now();
  if (auto hit = volatile_.get(key, offline_)) {
    rescore(*hit, weights_, now);
    volatile_.rescore(key, hit->priority);
    log::cache()->debug("volatile hit {}", key);
    return hit;
  }
  if (!durable_enabled()) {
    log::cache()->debug("miss {}", key);
    return std::nullopt;
  }

  std::string err;
  std::optional<CacheEntry> found;
  try {
    found = durable_->get(key, offline_, &err);
  } catch (const std::exception &e) {
    record_error("get " + key, e.what());
    return std::nullopt;
  }
  if (!found) {
    if (!err.empty())
      record_error("get " + key, err);
    log::cache()->debug("miss {}", key);
    return std::nullopt;
  }
  found->metadata.source = EntrySource::Durable;
  rescore(*found, weights_, now);
  promote(key, *found);
  log::cache()->debug("durable hit {}, promoted", key);
  return found;
}

std::optional<CacheEntry> Orchestrator::get_volatile(const std::string &key) {
  auto hit = volatile_.get(key, offline_);
  if (hit) {
    rescore(*hit, weights_, ctx_.now());
    volatile_.rescore(key, hit->priority);
  }
  return hit;
}

std::optional<CacheEntry> Orchestrator::peek(const std::string &key) {
  const auto &entries = volatile_.entries();
  if (auto it = entries.find(key); it != entries.end())
    return it->second;
  if (!durable_enabled())
    return std::nullopt;
  std::string err;
  try {
    auto found = durable_->peek(key, &err);
    if (!found && !err.empty())
      record_error("peek " + key, err);
    return found;
  } catch (const std::exception &e) {
    record_error("peek " + key, e.what());
  }
  return std::nullopt;
}

bool Orchestrator::set(const std::string &key, const Payload &data,
                       const SetOptions &opts) {
  const auto now = ctx_.now();
  const auto &cfg = ctx_.config().cache;
  const Millis ttl = opts.ttl.value_or(cfg.default_ttl);
  const std::string route =
      opts.route.empty() ? route_of_key(key) : opts.route;

  CacheEntry entry;
  entry.data = data;
  entry.timestamp = now;
  entry.expires_at = now + ttl;
  entry.size_bytes = approximate_size(data);
  entry.priority = calculate_extended_priority(opts.page_kind,
                                               opts.content_kind, 1, now,
                                               weights_, now);
  entry.tags.insert("page:" + to_string(opts.page_kind));
  entry.tags.insert("content:" + to_string(opts.content_kind));
  if (!route.empty())
    entry.tags.insert("route:" + route);
  entry.tags.insert(opts.tags.begin(), opts.tags.end());
  entry.metadata.created_at = now;
  entry.metadata.last_accessed_at = now;
  entry.metadata.access_count = 1;
  entry.metadata.source = EntrySource::Network;
  entry.metadata.page_kind = opts.page_kind;
  entry.metadata.content_kind = opts.content_kind;
  entry.metadata.has_unsaved_changes = opts.has_unsaved_changes;

  if (!route.empty())
    remember_route(route);

  bool stored = false;
  if (durable_enabled() && ttl > Millis{0} &&
      durable_->fits(entry.size_bytes)) {
    std::string err;
    try {
      if (durable_->set(key, entry, &err))
        stored = true;
      else
        record_error("set " + key, err);
    } catch (const std::exception &e) {
      record_error("set " + key, e.what());
    }
  }
  if (entry.size_bytes <= cfg.max_volatile_bytes) {
    volatile_.set(key, entry);
    stored = true;
  } else {
    log::cache()->debug("{} ({} bytes) exceeds the volatile budget", key,
                        entry.size_bytes);
  }

  SyncMessage msg;
  msg.type = SyncMessageType::CacheSet;
  msg.keys = {key};
  msg.tags.assign(entry.tags.begin(), entry.tags.end());
  msg.data = data;
  msg.at = now;
  ctx_.channel().publish(msg);
  return stored;
}

bool Orchestrator::mark_unsaved(const std::string &key, bool unsaved) {
  bool found = volatile_.mark_unsaved(key, unsaved);
  if (durable_enabled() && durable_->contains(key)) {
    std::string err;
    try {
      if (durable_->mark_unsaved(key, unsaved, &err))
        found = true;
      else
        record_error("mark_unsaved " + key, err);
    } catch (const std::exception &e) {
      record_error("mark_unsaved " + key, e.what());
    }
  }
  return found;
}

std::size_t Orchestrator::invalidate(const std::string &key) {
  bool removed = volatile_.del(key);
  if (durable_enabled() && durable_->contains(key)) {
    std::string err;
    try {
      if (durable_->del(key, &err))
        removed = true;
      else
        record_error("invalidate " + key, err);
    } catch (const std::exception &e) {
      record_error("invalidate " + key, e.what());
    }
  }
  if (!removed)
    return 0;
  SyncMessage msg;
  msg.type = SyncMessageType::CacheInvalidate;
  msg.keys = {key};
  msg.at = ctx_.now();
  ctx_.channel().publish(msg);
  return 1;
}

std::size_t Orchestrator::invalidate_tags(const std::vector<std::string> &tags) {
  std::set<std::string> keys;
  for (const auto &t : tags) {
    for (auto &k : volatile_.keys_for_tag(t))
      keys.insert(std::move(k));
    if (durable_enabled())
      for (auto &k : durable_->keys_for_tag(t))
        keys.insert(std::move(k));
  }
  if (keys.empty())
    return 0;

  volatile_.invalidate_by_tags(tags);
  if (durable_enabled()) {
    std::string err;
    try {
      durable_->invalidate_by_tags(tags, &err);
      if (!err.empty())
        record_error("invalidate_tags", err);
    } catch (const std::exception &e) {
      record_error("invalidate_tags", e.what());
    }
  }
  SyncMessage msg;
  msg.type = SyncMessageType::CacheInvalidate;
  msg.keys.assign(keys.begin(), keys.end());
  msg.tags = tags;
  msg.at = ctx_.now();
  ctx_.channel().publish(msg);
  return keys.size();
}

void Orchestrator::cleanup(bool under_pressure) {
  if (under_pressure) {
    const auto target = ctx_.config().cache.max_volatile_bytes / 2;
    const auto evicted = volatile_.evict_to(target);
    log::cache()->info("pressure cleanup evicted {} entries, {} bytes remain",
                       evicted, volatile_.memory_bytes());
  } else if (!offline_) {
    volatile_.cleanup();
    adapt_weights();
  }
  if (durable_enabled()) {
    std::string err;
    try {
      durable_->cleanup(&err);
      if (!err.empty())
        record_error("cleanup", err);
      durable_->compact();
    } catch (const std::exception &e) {
      record_error("cleanup", e.what());
    }
  }
  mark_stale_entries();
}

std::vector<std::string> Orchestrator::mark_stale_entries() {
  std::set<std::string> keys;
  for (auto &k : volatile_.mark_stale_entries())
    keys.insert(std::move(k));
  if (durable_enabled()) {
    std::string err;
    try {
      for (auto &k : durable_->mark_stale_entries(&err))
        keys.insert(std::move(k));
      if (!err.empty())
        record_error("mark_stale_entries", err);
    } catch (const std::exception &e) {
      record_error("mark_stale_entries", e.what());
    }
  }
  return {keys.begin(), keys.end()};
}

std::size_t Orchestrator::cleanup_expired() {
  std::size_t removed = volatile_.cleanup_expired();
  if (durable_enabled()) {
    std::string err;
    try {
      removed += durable_->cleanup_expired(&err);
      if (!err.empty())
        record_error("cleanup_expired", err);
    } catch (const std::exception &e) {
      record_error("cleanup_expired", e.what());
    }
  }
  return removed;
}

void Orchestrator::set_offline_mode(bool offline) {
  if (offline_ == offline)
    return;
  offline_ = offline;
  log::cache()->info("offline mode {}", offline ? "on" : "off");
}

std::optional<StorageQuota> Orchestrator::check_storage_quota() {
  if (!quota_)
    return std::nullopt;
  std::optional<StorageQuota> q;
  try {
    q = quota_->estimate();
  } catch (const std::exception &e) {
    record_error("check_storage_quota", e.what());
    return std::nullopt;
  }
  if (q && q->percentage >= 90.0)
    log::cache()->warn("storage quota at {:.1f}% ({} of {} bytes)",
                       q->percentage, q->usage, q->quota);
  return q;
}

std::size_t Orchestrator::warm(const std::vector<std::string> &routes) {
  std::size_t promoted = 0;
  SyncMessage msg;
  msg.type = SyncMessageType::CacheWarm;
  msg.at = ctx_.now();
  for (const auto &route : routes) {
    const auto key = page_key(route);
    msg.keys.push_back(key);
    if (volatile_.contains(key) || !durable_enabled() ||
        !durable_->contains(key))
      continue;
    std::string err;
    try {
      auto entry = durable_->get(key, true, &err);
      if (!entry) {
        if (!err.empty())
          record_error("warm " + key, err);
        continue;
      }
      entry->metadata.source = EntrySource::Durable;
      promote(key, std::move(*entry));
      ++promoted;
    } catch (const std::exception &e) {
      record_error("warm " + key, e.what());
    }
  }
  ctx_.channel().publish(msg);
  return promoted;
}

void Orchestrator::clear() {
  volatile_.clear();
  recent_routes_.clear();
  if (durable_enabled()) {
    std::string err;
    try {
      if (!durable_->clear(&err))
        record_error("clear", err);
    } catch (const std::exception &e) {
      record_error("clear", e.what());
    }
  }
}

OrchestratorStats Orchestrator::stats() const {
  OrchestratorStats s;
  s.volatile_tier = volatile_.stats();
  if (durable_)
    s.durable_tier = durable_->stats();
  s.durable_enabled = durable_enabled();
  s.offline = offline_;
  s.weights = weights_;
  s.weight_adaptations = weight_adaptations_;
  s.durable_errors = durable_errors_;
  return s;
}

std::string Orchestrator::info() const {
  const auto s = stats();
  std::ostringstream os;
  os << "volatile_entries:" << s.volatile_tier.entries << "\n";
  os << "volatile_bytes:" << s.volatile_tier.memory_bytes << "\n";
  os << "hits:" << s.volatile_tier.hits << "\n";
  os << "misses:" << s.volatile_tier.misses << "\n";
  os << "sets:" << s.volatile_tier.sets << "\n";
  os << "evictions:" << s.volatile_tier.evictions << "\n";
  os << "hit_rate:" << s.volatile_tier.hit_rate << "\n";
  os << "stale_entries:" << s.volatile_tier.stale_entries << "\n";
  os << "thrashing_count:" << s.volatile_tier.thrashing_count << "\n";
  os << "durable_enabled:" << (s.durable_enabled ? 1 : 0) << "\n";
  os << "durable_entries:" << s.durable_tier.entries << "\n";
  os << "durable_bytes:" << s.durable_tier.bytes << "\n";
  os << "durable_hits:" << s.durable_tier.hits << "\n";
  os << "durable_misses:" << s.durable_tier.misses << "\n";
  os << "durable_evictions:" << s.durable_tier.evictions << "\n";
  os << "durable_decode_errors:" << s.durable_tier.decode_errors << "\n";
  os << "durable_errors:" << s.durable_errors << "\n";
  os << "offline:" << (s.offline ? 1 : 0) << "\n";
  os << "weight_frequency:" << s.weights.frequency << "\n";
  os << "weight_recency:" << s.weights.recency << "\n";
  os << "weight_adaptations:" << s.weight_adaptations << "\n";
  os << "recent_routes:";
  for (std::size_t i = 0; i < recent_routes_.size(); ++i)
    os << (i ? "," : "") << recent_routes_[i];
  os << "\n";
  return os.str();
}

bool Orchestrator::is_recent_route_entry(const CacheEntry &entry) const {
  for (const auto &r : recent_routes_)
    if (entry.tags.contains("route:" + r))
      return true;
  return false;
}

void Orchestrator::remember_route(const std::string &route) {
  auto it = std::find(recent_routes_.begin(), recent_routes_.end(), route);
  if (it != recent_routes_.end())
    recent_routes_.erase(it);
  recent_routes_.push_front(route);
  while (recent_routes_.size() > kRecentRouteCount)
    recent_routes_.pop_back();
}

void Orchestrator::adapt_weights() {
  const auto s = volatile_.stats();
  if (s.hits + s.misses == 0 || s.entries <= 10 ||
      s.hit_rate >= ctx_.config().cache.min_hit_rate_for_adaptation)
    return;
  const double before = weights_.frequency;
  weights_.frequency = std::min(0.9, weights_.frequency + 0.1);
  weights_.recency = std::max(
      0.1, 1.0 - weights_.frequency - weights_.page - weights_.content);
  if (weights_.frequency != before) {
    ++weight_adaptations_;
    log::cache()->info("hit rate {:.2f} below target, frequency weight now "
                       "{:.2f}, recency {:.2f}",
                       s.hit_rate, weights_.frequency, weights_.recency);
  }
}

void Orchestrator::record_error(const std::string &op, const std::string &what) {
  ++durable_errors_;
  last_error_ = op + ": " + what;
  log::storage()->error("durable tier {} failed: {}", op, what);
}

void Orchestrator::promote(const std::string &key, CacheEntry entry) {
  if (entry.size_bytes > ctx_.config().cache.max_volatile_bytes)
    return;
  volatile_.set(key, std::move(entry));
}

} // namespace navcache
