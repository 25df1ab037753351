#pragma once

#include "navcache/context.hpp"
#include "navcache/durable_store.hpp"
#include "navcache/policy.hpp"
#include "navcache/storage.hpp"
#include "navcache/types.hpp"
#include "navcache/volatile_store.hpp"

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace navcache {

struct SetOptions {
  PageKind page_kind{PageKind::Other};
  ContentKind content_kind{ContentKind::Generic};
  std::string route;
  std::optional<Millis> ttl;
  bool has_unsaved_changes{false};
  std::vector<std::string> tags;
};

struct OrchestratorStats {
  CacheStats volatile_tier;
  DurableStats durable_tier;
  bool durable_enabled{false};
  bool offline{false};
  ExtendedWeights weights;
  std::uint64_t weight_adaptations{0};
  std::uint64_t durable_errors{0};
};

constexpr std::size_t kRecentRouteCount = 3;

// Front door for both tiers. The volatile tier answers first; the durable
// tier is consulted on a miss and hits are promoted back. Durable failures
// never propagate: they are logged and kept in last_error().
class Orchestrator {
public:
  // `durable` may be null, in which case the cache runs volatile only.
  Orchestrator(Context &ctx, std::unique_ptr<IPersistentStorage> durable,
               std::unique_ptr<IQuotaEstimator> quota = nullptr);

  Orchestrator(const Orchestrator &) = delete;
  Orchestrator &operator=(const Orchestrator &) = delete;

  bool init(std::string *err = nullptr);

  std::optional<CacheEntry> get(const std::string &key);
  std::optional<CacheEntry> get_volatile(const std::string &key);
  // Current entry from either tier, expired or not, with no access recorded.
  std::optional<CacheEntry> peek(const std::string &key);
  bool set(const std::string &key, const Payload &data,
           const SetOptions &opts = {});
  bool mark_unsaved(const std::string &key, bool unsaved);

  std::size_t invalidate(const std::string &key);
  std::size_t invalidate_tags(const std::vector<std::string> &tags);

  std::vector<std::string> get_recent_routes() const {
    return {recent_routes_.begin(), recent_routes_.end()};
  }

  void cleanup(bool under_pressure = false);
  std::vector<std::string> mark_stale_entries();
  std::size_t cleanup_expired();

  void set_offline_mode(bool offline);
  bool offline() const { return offline_; }

  std::optional<StorageQuota> check_storage_quota();

  // Promotes durable entries of `routes` into the volatile tier. Returns the
  // number promoted.
  std::size_t warm(const std::vector<std::string> &routes);
  void clear();

  OrchestratorStats stats() const;
  std::string info() const;

  const std::string &last_error() const { return last_error_; }
  void clear_error() { last_error_.clear(); }

  bool durable_enabled() const;
  VolatileStore &volatile_store() { return volatile_; }
  DurableStore *durable_store() { return durable_.get(); }
  const ExtendedWeights &weights() const { return weights_; }

private:
  bool is_recent_route_entry(const CacheEntry &entry) const;
  void remember_route(const std::string &route);
  void adapt_weights();
  void record_error(const std::string &op, const std::string &what);
  void promote(const std::string &key, CacheEntry entry);

  Context &ctx_;
  VolatileStore volatile_;
  std::unique_ptr<DurableStore> durable_;
  std::unique_ptr<IQuotaEstimator> quota_;
  std::deque<std::string> recent_routes_;
  ExtendedWeights weights_{};
  bool offline_{false};
  std::string last_error_;
  std::uint64_t weight_adaptations_{0};
  std::uint64_t durable_errors_{0};
};

} // namespace navcache
