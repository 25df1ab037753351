#pragma once

#include "navcache/context.hpp"
#include "navcache/orchestrator.hpp"
#include "navcache/refresh_manager.hpp"
#include "navcache/state_manager.hpp"
#include "navcache/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace navcache {

struct NavigationResult {
  bool used_cache{false};
  std::optional<Payload> page_data;
  std::optional<PageState> page_state;
  // Wall time spent inside handle_navigation.
  std::chrono::microseconds display_time{0};
  bool within_budget{true};
  bool stale{false};
  bool background_refresh_scheduled{false};
  EntrySource source{EntrySource::Network};
};

struct WarmTarget {
  std::string route;
  PageKind page{PageKind::Other};
  ContentKind content{ContentKind::Generic};
};

// Cache-first route change protocol. A hit is served immediately with its
// saved page state; a stale hit additionally queues a background refresh
// when a callback is registered for the route.
class NavigationGuard {
public:
  NavigationGuard(Context &ctx, Orchestrator &cache, StateManager &states,
                  RefreshManager &refresh);

  NavigationGuard(const NavigationGuard &) = delete;
  NavigationGuard &operator=(const NavigationGuard &) = delete;

  NavigationResult handle_navigation(const std::string &to,
                                     const std::string &from = {},
                                     PageKind page = PageKind::Other,
                                     ContentKind content = ContentKind::Generic);

  void register_refresh_callback(const std::string &route,
                                 RefreshCallback callback,
                                 UpdateCallback on_update = {});
  bool unregister_refresh_callback(const std::string &route);
  bool has_refresh_callback(const std::string &route) const {
    return callbacks_.contains(route);
  }

  bool cache_fresh_data(const std::string &route, const Payload &data,
                        PageKind page = PageKind::Other,
                        ContentKind content = ContentKind::Generic);
  void invalidate_route(const std::string &route);
  bool has_cached_data(const std::string &route);

  void set_offline_mode(bool offline);
  bool offline() const { return cache_.offline(); }
  const std::string &current_route() const { return current_route_; }

  // Promotes durable copies of the targets, then schedules refreshes for
  // the ones still uncached, highest priority first. Returns the number of
  // refreshes scheduled.
  std::size_t warm_routes(std::vector<WarmTarget> targets);
  void clear();

private:
  struct Registration {
    RefreshCallback fetch;
    UpdateCallback on_update;
  };

  Context &ctx_;
  Orchestrator &cache_;
  StateManager &states_;
  RefreshManager &refresh_;
  std::unordered_map<std::string, Registration> callbacks_;
  std::string current_route_;
};

} // namespace navcache
