#include "navcache/refresh_manager.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace navcache;
using navcache::testing::bytes;
using navcache::testing::ManualClock;

namespace {
NavcacheConfig refresh_config() {
  NavcacheConfig cfg;
  cfg.refresh.max_retries = 3;
  cfg.refresh.initial_retry_delay = Millis{100};
  cfg.refresh.max_retry_delay = Millis{1000};
  cfg.refresh.interaction_defer_delay = Millis{200};
  return cfg;
}
} // namespace

TEST_CASE("A successful refresh updates the cache and notifies",
          "[refresh]") {
  ManualClock clock;
  Context ctx(refresh_config(), clock.fn());
  Orchestrator cache(ctx, nullptr);
  RefreshManager refresh(ctx, cache);
  std::vector<SyncMessage> seen;
  ctx.channel().subscribe([&](const SyncMessage &m) {
    if (m.type == SyncMessageType::CacheUpdated)
      seen.push_back(m);
  });

  Payload delivered;
  refresh.schedule_refresh(
      "/grades",
      [](const std::string &, std::string *) -> std::optional<Payload> {
        return bytes("fresh");
      },
      PageKind::Dashboard, ContentKind::Personalized,
      [&](const Payload &data) { delivered = data; });
  CHECK(refresh.is_refresh_scheduled("/grades"));

  CHECK(ctx.timers().run_due() == 1);
  CHECK(delivered == bytes("fresh"));
  CHECK_FALSE(refresh.is_refresh_scheduled("/grades"));
  auto cached = cache.get("page:/grades");
  REQUIRE(cached.has_value());
  CHECK(cached->data == bytes("fresh"));
  CHECK(cached->metadata.page_kind == PageKind::Dashboard);
  REQUIRE(seen.size() == 1);
  CHECK(seen[0].keys == std::vector<std::string>{"page:/grades"});
  CHECK(refresh.stats().completed == 1);
}

TEST_CASE("A refresh keeps unsaved changes and extra tags of the page",
          "[refresh][unsaved]") {
  ManualClock clock;
  Context ctx(refresh_config(), clock.fn());
  Orchestrator cache(ctx, std::make_unique<MemoryStorage>());
  REQUIRE(cache.init());
  RefreshManager refresh(ctx, cache);

  SetOptions opts;
  opts.route = "/essay";
  opts.has_unsaved_changes = true;
  opts.tags = {"user:7"};
  REQUIRE(cache.set("page:/essay", bytes("draft"), opts));
  cache.volatile_store().clear();

  refresh.schedule_refresh(
      "/essay",
      [](const std::string &, std::string *) -> std::optional<Payload> {
        return bytes("server copy");
      },
      PageKind::Other, ContentKind::UserGenerated);
  REQUIRE(ctx.timers().run_due() == 1);

  const auto &stored = cache.volatile_store().entries().at("page:/essay");
  CHECK(stored.data == bytes("server copy"));
  CHECK(stored.metadata.has_unsaved_changes);
  CHECK(stored.tags.contains("user:7"));
  CHECK(stored.tags.contains("content:user-generated"));
  CHECK_FALSE(stored.tags.contains("content:generic"));
  auto on_disk = cache.durable_store()->peek("page:/essay");
  REQUIRE(on_disk.has_value());
  CHECK(on_disk->metadata.has_unsaved_changes);
}

TEST_CASE("Failures retry with doubling delays up to max_retries",
          "[refresh][backoff]") {
  ManualClock clock;
  Context ctx(refresh_config(), clock.fn());
  Orchestrator cache(ctx, nullptr);
  RefreshManager refresh(ctx, cache);
  int attempts = 0;
  refresh.schedule_refresh(
      "/flaky", [&](const std::string &, std::string *err)
                    -> std::optional<Payload> {
        ++attempts;
        *err = "HTTP 503";
        return std::nullopt;
      });

  ctx.timers().run_due();
  CHECK(attempts == 1);
  CHECK(refresh.get_retry_count("/flaky") == 1);

  clock.advance(Millis{99});
  ctx.timers().run_due();
  CHECK(attempts == 1);
  clock.advance(Millis{1});
  ctx.timers().run_due();
  CHECK(attempts == 2);
  CHECK(refresh.get_retry_count("/flaky") == 2);

  clock.advance(Millis{199});
  ctx.timers().run_due();
  CHECK(attempts == 2);
  clock.advance(Millis{1});
  ctx.timers().run_due();
  CHECK(attempts == 3);

  CHECK_FALSE(refresh.is_refresh_scheduled("/flaky"));
  clock.advance(std::chrono::minutes(5));
  ctx.timers().run_due();
  CHECK(attempts == 3);
  CHECK(refresh.stats().failed == 1);
  CHECK(refresh.stats().retries == 2);
  CHECK_FALSE(cache.get("page:/flaky").has_value());
}

TEST_CASE("Thrown exceptions count as failed attempts", "[refresh][backoff]") {
  ManualClock clock;
  auto cfg = refresh_config();
  cfg.refresh.max_retries = 1;
  Context ctx(cfg, clock.fn());
  Orchestrator cache(ctx, nullptr);
  RefreshManager refresh(ctx, cache);
  refresh.schedule_refresh(
      "/boom", [](const std::string &, std::string *) -> std::optional<Payload> {
        throw std::runtime_error("connection reset");
      });
  ctx.timers().run_due();
  CHECK_FALSE(refresh.is_refresh_scheduled("/boom"));
  CHECK(refresh.stats().failed == 1);
}

TEST_CASE("Refreshes wait while the user interacts", "[refresh][interaction]") {
  ManualClock clock;
  Context ctx(refresh_config(), clock.fn());
  Orchestrator cache(ctx, nullptr);
  RefreshManager refresh(ctx, cache);
  int runs = 0;
  auto cb = [&](const std::string &, std::string *) -> std::optional<Payload> {
    ++runs;
    return bytes("ok");
  };

  refresh.set_user_interacting(true);
  refresh.schedule_refresh("/a", cb);
  refresh.schedule_refresh("/b", cb);
  CHECK(refresh.get_deferred_refreshes() ==
        std::vector<std::string>{"/a", "/b"});
  ctx.timers().run_due();
  CHECK(runs == 0);

  refresh.set_user_interacting(false);
  clock.advance(Millis{199});
  ctx.timers().run_due();
  CHECK(runs == 0);
  clock.advance(Millis{1});
  ctx.timers().run_due();
  CHECK(runs == 2);
  CHECK(refresh.get_deferred_refreshes().empty());
  CHECK(refresh.stats().scheduled == 0);
}

TEST_CASE("Resuming interaction before the release keeps tasks deferred",
          "[refresh][interaction]") {
  ManualClock clock;
  Context ctx(refresh_config(), clock.fn());
  Orchestrator cache(ctx, nullptr);
  RefreshManager refresh(ctx, cache);
  int runs = 0;
  refresh.set_user_interacting(true);
  refresh.schedule_refresh(
      "/a", [&](const std::string &, std::string *) -> std::optional<Payload> {
        ++runs;
        return bytes("ok");
      });
  refresh.set_user_interacting(false);
  clock.advance(Millis{100});
  refresh.set_user_interacting(true);
  clock.advance(Millis{500});
  ctx.timers().run_due();
  CHECK(runs == 0);
  CHECK(refresh.is_user_currently_interacting());
  CHECK(refresh.stats().deferred == 1);
}

TEST_CASE("Rescheduling a route supersedes the earlier task",
          "[refresh][supersede]") {
  ManualClock clock;
  Context ctx(refresh_config(), clock.fn());
  Orchestrator cache(ctx, nullptr);
  RefreshManager refresh(ctx, cache);

  std::vector<std::string> ran;
  refresh.schedule_refresh(
      "/a", [&](const std::string &, std::string *) -> std::optional<Payload> {
        ran.push_back("first");
        return bytes("first");
      });
  refresh.schedule_refresh(
      "/a", [&](const std::string &, std::string *) -> std::optional<Payload> {
        ran.push_back("second");
        return bytes("second");
      });
  ctx.timers().run_due();
  CHECK(ran == std::vector<std::string>{"second"});
  CHECK(cache.get("page:/a")->data == bytes("second"));
}

TEST_CASE("A result is discarded when the route was rescheduled mid-flight",
          "[refresh][supersede]") {
  ManualClock clock;
  Context ctx(refresh_config(), clock.fn());
  Orchestrator cache(ctx, nullptr);
  RefreshManager refresh(ctx, cache);

  refresh.schedule_refresh(
      "/a", [&](const std::string &, std::string *) -> std::optional<Payload> {
        CHECK(refresh.is_refresh_executing("/a"));
        refresh.schedule_refresh(
            "/a",
            [](const std::string &, std::string *) -> std::optional<Payload> {
              return bytes("newer");
            });
        return bytes("older");
      });
  ctx.timers().run_due();
  CHECK(refresh.stats().superseded == 1);
  CHECK_FALSE(cache.get("page:/a").has_value());

  ctx.timers().run_due();
  CHECK(cache.get("page:/a")->data == bytes("newer"));
}

TEST_CASE("Nothing is scheduled when auto refresh is off", "[refresh]") {
  ManualClock clock;
  auto cfg = refresh_config();
  cfg.refresh.enable_auto_refresh = false;
  Context ctx(cfg, clock.fn());
  Orchestrator cache(ctx, nullptr);
  RefreshManager refresh(ctx, cache);
  refresh.schedule_refresh(
      "/a", [](const std::string &, std::string *) -> std::optional<Payload> {
        return bytes("x");
      });
  CHECK_FALSE(refresh.is_refresh_scheduled("/a"));
  CHECK(ctx.timers().pending() == 0);
}

TEST_CASE("Cancel and clear drop pending work", "[refresh][cancel]") {
  ManualClock clock;
  Context ctx(refresh_config(), clock.fn());
  Orchestrator cache(ctx, nullptr);
  RefreshManager refresh(ctx, cache);
  int runs = 0;
  auto cb = [&](const std::string &, std::string *) -> std::optional<Payload> {
    ++runs;
    return bytes("x");
  };
  refresh.schedule_refresh("/a", cb);
  refresh.schedule_refresh("/b", cb);
  CHECK(refresh.cancel_refresh("/a"));
  CHECK_FALSE(refresh.cancel_refresh("/a"));
  refresh.set_user_interacting(true);
  refresh.schedule_refresh("/c", cb);
  refresh.clear();

  CHECK_FALSE(refresh.is_user_currently_interacting());
  CHECK(refresh.stats().scheduled == 0);
  clock.advance(Millis{1000});
  CHECK(ctx.timers().run_due() == 0);
  CHECK(runs == 0);
}
