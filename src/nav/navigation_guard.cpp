#include "navcache/navigation_guard.hpp"

#include "navcache/log.hpp"
#include "navcache/policy.hpp"

#include <algorithm>
#include <chrono>

namespace navcache {

NavigationGuard::NavigationGuard(Context &ctx, Orchestrator &cache,
                                 StateManager &states, RefreshManager &refresh)
    : ctx_(ctx), cache_(cache), states_(states), refresh_(refresh) {}

NavigationResult NavigationGuard::handle_navigation(const std::string &to,
                                                    const std::string &from,
                                                    PageKind page,
                                                    ContentKind content) {
  const auto start = std::chrono::steady_clock::now();
  const auto &nav = ctx_.config().navigation;
  NavigationResult result;

  if (nav.capture_on_leave && !from.empty() && from != to)
    states_.capture_state(from);
  current_route_ = to;

  auto entry = cache_.get(page_key(to));
  if (entry) {
    result.used_cache = true;
    result.source = entry->metadata.source;
    result.page_data = std::move(entry->data);
    result.page_state = states_.get_state(to);
    if (result.page_state)
      states_.restore_state(to, *result.page_state);

    result.stale = ctx_.now() - entry->timestamp > nav.stale_threshold;
    if (result.stale && nav.enable_background_refresh && !cache_.offline()) {
      auto it = callbacks_.find(to);
      if (it != callbacks_.end()) {
        refresh_.schedule_refresh(to, it->second.fetch, page, content,
                                  it->second.on_update);
        result.background_refresh_scheduled = refresh_.is_refresh_scheduled(to);
      }
    }
  }

  result.display_time = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start);
  result.within_budget = result.display_time <= nav.max_cache_lookup_time;
  if (!result.within_budget)
    log::nav()->warn("lookup for {} took {} us, over the {} ms budget", to,
                     result.display_time.count(),
                     nav.max_cache_lookup_time.count());
  log::nav()->debug("navigate {} -> {}: {}{}", from, to,
                    result.used_cache ? "cache" : "miss",
                    result.background_refresh_scheduled ? ", refreshing" : "");
  return result;
}

void NavigationGuard::register_refresh_callback(const std::string &route,
                                                RefreshCallback callback,
                                                UpdateCallback on_update) {
  callbacks_[route] = {std::move(callback), std::move(on_update)};
}

bool NavigationGuard::unregister_refresh_callback(const std::string &route) {
  return callbacks_.erase(route) > 0;
}

bool NavigationGuard::cache_fresh_data(const std::string &route,
                                       const Payload &data, PageKind page,
                                       ContentKind content) {
  SetOptions opts;
  opts.page_kind = page;
  opts.content_kind = content;
  opts.route = route;
  return cache_.set(page_key(route), data, opts);
}

void NavigationGuard::invalidate_route(const std::string &route) {
  cache_.invalidate(page_key(route));
  states_.clear_state(route);
  refresh_.cancel_refresh(route);
}

bool NavigationGuard::has_cached_data(const std::string &route) {
  return cache_.get(page_key(route)).has_value();
}

void NavigationGuard::set_offline_mode(bool offline) {
  cache_.set_offline_mode(offline);
}

std::size_t NavigationGuard::warm_routes(std::vector<WarmTarget> targets) {
  const auto now = ctx_.now();
  const auto &weights = cache_.weights();
  std::stable_sort(targets.begin(), targets.end(),
                   [&](const WarmTarget &a, const WarmTarget &b) {
                     return calculate_extended_priority(a.page, a.content, 1,
                                                        now, weights, now) >
                            calculate_extended_priority(b.page, b.content, 1,
                                                        now, weights, now);
                   });
  std::vector<std::string> routes;
  routes.reserve(targets.size());
  for (const auto &t : targets)
    routes.push_back(t.route);
  cache_.warm(routes);

  std::size_t scheduled = 0;
  for (const auto &t : targets) {
    if (cache_.volatile_store().contains(page_key(t.route)))
      continue;
    auto it = callbacks_.find(t.route);
    if (it == callbacks_.end())
      continue;
    refresh_.schedule_refresh(t.route, it->second.fetch, t.page, t.content,
                              it->second.on_update);
    if (refresh_.is_refresh_scheduled(t.route))
      ++scheduled;
  }
  return scheduled;
}

void NavigationGuard::clear() {
  refresh_.clear();
  callbacks_.clear();
  current_route_.clear();
}

} // namespace navcache
