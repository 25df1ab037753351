#include "navcache/navigation_guard.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace navcache;
using navcache::testing::bytes;
using navcache::testing::ManualClock;
using navcache::testing::RecordingSurface;

namespace {
// Cache, state manager, refresh manager and guard wired to one context.
struct Harness {
  ManualClock clock;
  Context ctx;
  RecordingSurface surface;
  Orchestrator cache;
  StateManager states;
  RefreshManager refresh;
  NavigationGuard guard;

  explicit Harness(NavcacheConfig cfg = {},
                   std::unique_ptr<IPersistentStorage> durable = nullptr)
      : ctx(std::move(cfg)), cache(ctx, std::move(durable)),
        states(ctx, surface), refresh(ctx, cache),
        guard(ctx, cache, states, refresh) {
    ctx.set_clock(clock.fn());
    std::string err;
    REQUIRE(cache.init(&err));
  }
};

NavcacheConfig long_ttl() {
  NavcacheConfig cfg;
  cfg.cache.default_ttl = std::chrono::minutes(30);
  return cfg;
}
} // namespace

TEST_CASE("A miss returns nothing and leaves the caller to fetch",
          "[navigation][miss]") {
  Harness h;
  auto r = h.guard.handle_navigation("/grades", "/home");
  CHECK_FALSE(r.used_cache);
  CHECK_FALSE(r.page_data.has_value());
  CHECK_FALSE(r.page_state.has_value());
  CHECK_FALSE(r.background_refresh_scheduled);
  CHECK(h.guard.current_route() == "/grades");
}

TEST_CASE("A hit serves cached data and restores page state",
          "[navigation][hit]") {
  Harness h;
  REQUIRE(h.guard.cache_fresh_data("/grades", bytes("grades-v1"),
                                   PageKind::Dashboard,
                                   ContentKind::Personalized));
  PageState saved;
  saved.search_term = "math";
  saved.scroll = {0, 420};
  h.states.set_state("/grades", saved);

  auto r = h.guard.handle_navigation("/grades", "/home");
  REQUIRE(r.used_cache);
  CHECK(r.page_data == bytes("grades-v1"));
  REQUIRE(r.page_state.has_value());
  CHECK(r.page_state->search_term == "math");
  CHECK(r.source == EntrySource::Network);
  CHECK_FALSE(r.stale);
  CHECK_FALSE(r.background_refresh_scheduled);
  CHECK(r.display_time.count() >= 0);

  CHECK(h.surface.applied.search_term == "math");
  h.clock.advance(Millis{50});
  h.ctx.timers().run_due();
  CHECK(h.surface.applied.scroll == ScrollPosition{0, 420});
}

TEST_CASE("A stale hit is served as-is and refreshed in the background",
          "[navigation][stale]") {
  Harness h(long_ttl());
  int fetches = 0;
  Payload pushed;
  h.guard.register_refresh_callback(
      "/timetable",
      [&](const std::string &route, std::string *) -> std::optional<Payload> {
        ++fetches;
        CHECK(route == "/timetable");
        return bytes("timetable-v2");
      },
      [&](const Payload &data) { pushed = data; });
  REQUIRE(h.guard.cache_fresh_data("/timetable", bytes("timetable-v1"),
                                   PageKind::Timetable));

  h.clock.advance(std::chrono::minutes(6));
  auto first = h.guard.handle_navigation("/timetable", "/home",
                                         PageKind::Timetable);
  REQUIRE(first.used_cache);
  CHECK(first.stale);
  CHECK(first.background_refresh_scheduled);
  CHECK(first.page_data == bytes("timetable-v1"));
  CHECK(fetches == 0);

  auto again = h.guard.handle_navigation("/timetable", "/home",
                                         PageKind::Timetable);
  CHECK(again.background_refresh_scheduled);
  CHECK(h.refresh.stats().scheduled == 1);

  h.ctx.timers().run_due();
  CHECK(fetches == 1);
  CHECK(pushed == bytes("timetable-v2"));

  auto fresh = h.guard.handle_navigation("/timetable", "/home",
                                         PageKind::Timetable);
  CHECK(fresh.page_data == bytes("timetable-v2"));
  CHECK_FALSE(fresh.stale);
  CHECK_FALSE(fresh.background_refresh_scheduled);
}

TEST_CASE("Stale hits without a registered callback are not refreshed",
          "[navigation][stale]") {
  Harness h(long_ttl());
  REQUIRE(h.guard.cache_fresh_data("/me", bytes("me")));
  h.clock.advance(std::chrono::minutes(10));
  auto r = h.guard.handle_navigation("/me");
  CHECK(r.used_cache);
  CHECK(r.stale);
  CHECK_FALSE(r.background_refresh_scheduled);

  h.guard.register_refresh_callback(
      "/me", [](const std::string &, std::string *) -> std::optional<Payload> {
        return bytes("me2");
      });
  CHECK(h.guard.has_refresh_callback("/me"));
  CHECK(h.guard.unregister_refresh_callback("/me"));
  CHECK_FALSE(h.guard.unregister_refresh_callback("/me"));
}

TEST_CASE("Offline navigation serves expired pages without refreshing",
          "[navigation][offline]") {
  Harness h;
  h.guard.register_refresh_callback(
      "/grades",
      [](const std::string &, std::string *) -> std::optional<Payload> {
        return bytes("new");
      });
  REQUIRE(h.guard.cache_fresh_data("/grades", bytes("old")));
  h.clock.advance(std::chrono::minutes(10));

  CHECK_FALSE(h.guard.handle_navigation("/grades").used_cache);
  h.guard.set_offline_mode(true);
  CHECK(h.guard.offline());
  auto r = h.guard.handle_navigation("/grades");
  REQUIRE(r.used_cache);
  CHECK(r.page_data == bytes("old"));
  CHECK(r.stale);
  CHECK_FALSE(r.background_refresh_scheduled);
  CHECK(h.ctx.timers().pending() == 0);
}

TEST_CASE("Invalidating a route drops data, state and pending refresh",
          "[navigation][invalidate]") {
  Harness h(long_ttl());
  h.guard.register_refresh_callback(
      "/grades",
      [](const std::string &, std::string *) -> std::optional<Payload> {
        return bytes("new");
      });
  REQUIRE(h.guard.cache_fresh_data("/grades", bytes("old")));
  h.states.set_state("/grades", {});
  h.clock.advance(std::chrono::minutes(6));
  REQUIRE(h.guard.handle_navigation("/grades").background_refresh_scheduled);

  h.guard.invalidate_route("/grades");
  CHECK_FALSE(h.guard.has_cached_data("/grades"));
  CHECK_FALSE(h.states.get_state("/grades").has_value());
  CHECK_FALSE(h.refresh.is_refresh_scheduled("/grades"));
  h.ctx.timers().run_due();
  CHECK_FALSE(h.guard.has_cached_data("/grades"));
}

TEST_CASE("Leaving a route captures its state when configured",
          "[navigation][capture]") {
  NavcacheConfig cfg;
  cfg.navigation.capture_on_leave = true;
  Harness h(cfg);
  h.surface.captured.search_term = "left behind";
  h.guard.handle_navigation("/b", "/a");
  auto saved = h.states.get_state("/a");
  REQUIRE(saved.has_value());
  CHECK(saved->search_term == "left behind");
  CHECK_FALSE(h.states.get_state("/b").has_value());
}

TEST_CASE("Warming promotes stored pages and fetches the rest by priority",
          "[navigation][warm]") {
  Harness h({}, std::make_unique<MemoryStorage>());
  REQUIRE(h.guard.cache_fresh_data("/a", bytes("a")));
  h.cache.volatile_store().clear();

  std::vector<std::string> fetched;
  auto fetch = [&](const std::string &route,
                   std::string *) -> std::optional<Payload> {
    fetched.push_back(route);
    return bytes(route);
  };
  h.guard.register_refresh_callback("/a", fetch);
  h.guard.register_refresh_callback("/b", fetch);
  h.guard.register_refresh_callback("/c", fetch);

  const auto scheduled = h.guard.warm_routes(
      {{"/c", PageKind::Other, ContentKind::Generic},
       {"/a", PageKind::Other, ContentKind::Generic},
       {"/b", PageKind::Dashboard, ContentKind::UserGenerated}});
  CHECK(scheduled == 2);
  CHECK(h.cache.volatile_store().contains("page:/a"));

  h.ctx.timers().run_due();
  CHECK(fetched == std::vector<std::string>{"/b", "/c"});
  CHECK(h.guard.has_cached_data("/c"));
}

TEST_CASE("Clear cancels refreshes and forgets callbacks",
          "[navigation][clear]") {
  Harness h(long_ttl());
  int fetches = 0;
  h.guard.register_refresh_callback(
      "/x", [&](const std::string &, std::string *) -> std::optional<Payload> {
        ++fetches;
        return bytes("x");
      });
  REQUIRE(h.guard.cache_fresh_data("/x", bytes("x0")));
  h.clock.advance(std::chrono::minutes(6));
  REQUIRE(h.guard.handle_navigation("/x").background_refresh_scheduled);

  h.guard.clear();
  h.ctx.timers().run_due();
  CHECK(fetches == 0);
  CHECK_FALSE(h.guard.has_refresh_callback("/x"));
  CHECK(h.guard.current_route().empty());
  CHECK(h.guard.has_cached_data("/x"));
}
